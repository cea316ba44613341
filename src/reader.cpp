#include "reader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "serialize.hpp"
#include "text.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using std::string;
namespace fs = std::filesystem;
using json = nlohmann::json;

static string lower_ext(const string& path) {
  return to_lower(fs::path(path).extension().string());
}

static bool is_text_ext(const string& ext) {
  static const char* ok[] = {".txt", ".md", ".markdown", ".text", ".log", ".csv", ".rst"};
  for (auto* e : ok) if (ext == e) return true;
  return false;
}

static string read_file(const string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ProcessingError(path, "read", "cannot open file");
  std::ostringstream ss;
  ss << in.rdbuf();
  string data = ss.str();
  if (starts_with(data, "\xEF\xBB\xBF")) data.erase(0, 3);
  return data;
}

static FileMetadata file_metadata(const string& path) {
  FileMetadata f;
  fs::path p(path);
  f.name = p.filename().string();
  f.extension = lower_ext(path);
  f.path = path;
  std::error_code ec;
  auto size = fs::file_size(p, ec);
  if (!ec) f.size = (uint64_t)size;
  return f;
}

bool is_supported_input(const string& path) {
  auto ext = lower_ext(path);
  return is_text_ext(ext) || ext == ".json";
}

RawContent read_raw(const string& path) {
  if (path.empty()) throw std::invalid_argument("reader: empty path");
  auto ext = lower_ext(path);

  if (is_text_ext(ext)) {
    RawContent raw;
    raw.text = read_file(path);
    raw.file = file_metadata(path);
    raw.id = hash_id(path);
    return raw;
  }

  if (ext == ".json") {
    string data = read_file(path);
    RawContent raw;
    try {
      raw = json::parse(data).get<RawContent>();
    } catch (const json::exception& e) {
      throw ProcessingError(path, "read", string("bad extraction result: ") + e.what());
    }
    // the extraction result names the source document; fall back to the json file
    if (raw.file.name.empty()) raw.file = file_metadata(path);
    if (raw.file.path.empty()) raw.file.path = path;
    if (raw.id.empty()) raw.id = hash_id(raw.file.path);
    log_debug("reader", path + ": " + std::to_string(raw.tables.size()) + " tables, " +
                        std::to_string(raw.blocks.size()) + " blocks, " +
                        std::to_string(raw.images.size()) + " images");
    return raw;
  }

  throw UnsupportedFormatError(path, ext.empty() ? "(none)" : ext);
}

std::vector<string> list_input_files(const string& root) {
  std::vector<string> out;
  std::error_code ec;
  if (fs::is_regular_file(root, ec)) {
    out.push_back(root);
    return out;
  }
  if (!fs::is_directory(root, ec)) throw ProcessingError(root, "read", "no such file or directory");
  for (auto& p : fs::recursive_directory_iterator(root)) {
    if (!p.is_regular_file()) continue;
    if (!is_supported_input(p.path().string())) continue;
    out.push_back(p.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}
