#include "store.hpp"
#include "log.hpp"
#include "serialize.hpp"
#include "text.hpp"
#include <sqlite3.h>
#include <stdexcept>

using json = nlohmann::json;

struct ChunkStore::Impl {
  sqlite3* db = nullptr;
};

namespace {

// Finalizes on every exit path.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() { if (st) sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const char* sql, Statement& s) {
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
    throw std::runtime_error(std::string("store: prepare failed: ") + sqlite3_errmsg(db));
}

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw std::runtime_error("store: " + e);
  }
}

void bind_text(sqlite3_stmt* st, int i, const std::string& s) {
  sqlite3_bind_text(st, i, s.c_str(), (int)s.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int i) {
  const unsigned char* p = sqlite3_column_text(st, i);
  return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, i)) : std::string();
}

const char* CHUNK_COLUMNS = "id, document_id, idx, start, \"end\", strategy, content, quality, completeness, props";

DocumentChunk read_chunk(sqlite3_stmt* st) {
  DocumentChunk c;
  c.id = column_text(st, 0);
  c.index = sqlite3_column_int(st, 2);
  c.start = (size_t)sqlite3_column_int64(st, 3);
  c.end = (size_t)sqlite3_column_int64(st, 4);
  c.strategy = column_text(st, 5);
  c.content = column_text(st, 6);
  c.quality_score = sqlite3_column_double(st, 7);
  c.completeness = sqlite3_column_double(st, 8);
  std::string props = column_text(st, 9);
  if (!props.empty()) {
    try {
      c.props = json::parse(props).get<ChunkProps>();
    } catch (const json::exception& e) {
      throw std::runtime_error("store: bad props for chunk " + c.id + ": " + e.what());
    }
  }
  return c;
}

}  // namespace

StoredDocument document_record(const RefinedContent& refined, const std::vector<DocumentChunk>& chunks) {
  StoredDocument d;
  d.file = !refined.metadata.file_path.empty() ? refined.metadata.file_path : refined.metadata.file_name;
  d.id = hash_id(d.file.empty() ? refined.raw_id : d.file);
  d.title = refined.metadata.title;
  d.file_type = refined.metadata.file_type;
  d.refined_chars = refined.text.size();
  d.chunk_count = (int)chunks.size();
  if (!chunks.empty()) d.strategy = chunks.front().strategy;
  return d;
}

ChunkStore::ChunkStore(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
    throw std::runtime_error("store: open failed for " + path + ": " + e);
  }
  try {
    ensure_schema();
  } catch (...) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw;
  }
}

ChunkStore::~ChunkStore() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void ChunkStore::ensure_schema() {
  exec(impl_->db,
    "CREATE TABLE IF NOT EXISTS documents ("
    " id TEXT PRIMARY KEY,"
    " file TEXT NOT NULL,"
    " title TEXT,"
    " file_type TEXT,"
    " refined_chars INTEGER NOT NULL,"
    " chunk_count INTEGER NOT NULL,"
    " strategy TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS chunks ("
    " id TEXT PRIMARY KEY,"
    " document_id TEXT NOT NULL REFERENCES documents(id),"
    " idx INTEGER NOT NULL,"
    " start INTEGER NOT NULL,"
    " \"end\" INTEGER NOT NULL,"
    " strategy TEXT,"
    " content TEXT NOT NULL,"
    " quality REAL,"
    " completeness REAL,"
    " props TEXT"
    ");"
    "CREATE INDEX IF NOT EXISTS chunks_by_document ON chunks(document_id, idx);");
}

void ChunkStore::upsert_document(const StoredDocument& d) {
  Statement s;
  prepare(impl_->db,
    "INSERT INTO documents (id, file, title, file_type, refined_chars, chunk_count, strategy) "
    "VALUES (?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(id) DO UPDATE SET "
    " file=excluded.file, title=excluded.title, file_type=excluded.file_type, "
    " refined_chars=excluded.refined_chars, chunk_count=excluded.chunk_count, strategy=excluded.strategy;",
    s);
  bind_text(s.st, 1, d.id);
  bind_text(s.st, 2, d.file);
  bind_text(s.st, 3, d.title);
  bind_text(s.st, 4, d.file_type);
  sqlite3_bind_int64(s.st, 5, (sqlite3_int64)d.refined_chars);
  sqlite3_bind_int(s.st, 6, d.chunk_count);
  bind_text(s.st, 7, d.strategy);
  if (sqlite3_step(s.st) != SQLITE_DONE)
    throw std::runtime_error(std::string("store: document insert failed: ") + sqlite3_errmsg(impl_->db));
}

void ChunkStore::upsert_chunks(const std::string& document_id, const std::vector<DocumentChunk>& chunks) {
  exec(impl_->db, "BEGIN");
  try {
    // The new set replaces whatever an earlier run stored for this document.
    Statement del;
    prepare(impl_->db, "DELETE FROM chunks WHERE document_id = ?;", del);
    bind_text(del.st, 1, document_id);
    if (sqlite3_step(del.st) != SQLITE_DONE)
      throw std::runtime_error(std::string("store: chunk delete failed: ") + sqlite3_errmsg(impl_->db));

    Statement s;
    prepare(impl_->db,
      "INSERT INTO chunks (id, document_id, idx, start, \"end\", strategy, content, quality, completeness, props) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
      "ON CONFLICT(id) DO UPDATE SET "
      " document_id=excluded.document_id, idx=excluded.idx, start=excluded.start, \"end\"=excluded.\"end\", "
      " strategy=excluded.strategy, content=excluded.content, quality=excluded.quality, "
      " completeness=excluded.completeness, props=excluded.props;",
      s);
    for (auto& c : chunks) {
      sqlite3_reset(s.st);
      sqlite3_clear_bindings(s.st);
      bind_text(s.st, 1, c.id);
      bind_text(s.st, 2, document_id);
      sqlite3_bind_int(s.st, 3, c.index);
      sqlite3_bind_int64(s.st, 4, (sqlite3_int64)c.start);
      sqlite3_bind_int64(s.st, 5, (sqlite3_int64)c.end);
      bind_text(s.st, 6, c.strategy);
      bind_text(s.st, 7, c.content);
      sqlite3_bind_double(s.st, 8, c.quality_score);
      sqlite3_bind_double(s.st, 9, c.completeness);
      bind_text(s.st, 10, json(c.props).dump());
      if (sqlite3_step(s.st) != SQLITE_DONE)
        throw std::runtime_error(std::string("store: chunk insert failed: ") + sqlite3_errmsg(impl_->db));
    }
  } catch (...) {
    sqlite3_exec(impl_->db, "ROLLBACK", nullptr, nullptr, nullptr);
    throw;
  }
  exec(impl_->db, "COMMIT");
  log_debug("store", "stored " + std::to_string(chunks.size()) + " chunks for " + document_id);
}

DocumentChunk ChunkStore::get_chunk(const std::string& id) const {
  Statement s;
  std::string sql = std::string("SELECT ") + CHUNK_COLUMNS + " FROM chunks WHERE id=?";
  prepare(impl_->db, sql.c_str(), s);
  bind_text(s.st, 1, id);
  if (sqlite3_step(s.st) != SQLITE_ROW) throw std::runtime_error("store: chunk id not found");
  return read_chunk(s.st);
}

std::vector<DocumentChunk> ChunkStore::chunks_for(const std::string& document_id) const {
  Statement s;
  std::string sql = std::string("SELECT ") + CHUNK_COLUMNS + " FROM chunks WHERE document_id=? ORDER BY idx";
  prepare(impl_->db, sql.c_str(), s);
  bind_text(s.st, 1, document_id);
  std::vector<DocumentChunk> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(read_chunk(s.st));
  if (rc != SQLITE_DONE)
    throw std::runtime_error(std::string("store: query failed: ") + sqlite3_errmsg(impl_->db));
  return out;
}

int ChunkStore::chunk_count() const {
  Statement s;
  prepare(impl_->db, "SELECT COUNT(*) FROM chunks", s);
  if (sqlite3_step(s.st) != SQLITE_ROW)
    throw std::runtime_error(std::string("store: count failed: ") + sqlite3_errmsg(impl_->db));
  return sqlite3_column_int(s.st, 0);
}
