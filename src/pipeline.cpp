#include "pipeline.hpp"
#include "enricher.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "reader.hpp"
#include "writer.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

MarkdownConverter* pick_converter(MarkdownConverter* given, const Config& config, CompletionService* completion,
                                  HeuristicMarkdownConverter* heuristic, std::unique_ptr<LlmMarkdownConverter>& llm) {
  if (given) return given;
  if (config.refine.use_llm && completion) {
    llm.reset(new LlmMarkdownConverter(completion));
    return llm.get();
  }
  return heuristic;
}

}  // namespace

Pipeline::Pipeline(const Config& config, CompletionService* completion, ImageTextService* images,
                   ChunkStore* store, MarkdownConverter* converter)
  : config_(config), completion_(completion), store_(store),
    refiner_(pick_converter(converter, config, completion, &heuristic_, llm_), images) {}

std::string Pipeline::output_dir_for(const std::string& path) const {
  if (config_.output.dir.empty()) return "";
  return (fs::path(config_.output.dir) / fs::path(path).stem()).string();
}

PipelineResult Pipeline::process_file(const std::string& path, PipelineMode mode, const CancelToken& cancel) const {
  PipelineResult r;
  r.file = path;

  RawContent raw;
  try {
    raw = read_raw(path);
  } catch (const ProcessingError&) {
    throw;
  } catch (const UnsupportedFormatError&) {
    throw;
  } catch (const std::exception& e) {
    throw ProcessingError(path, "read", e.what());
  }
  cancel.check();

  r.refined = refiner_.refine(raw, config_.refine, cancel);
  for (auto& w : r.refined.info.warnings) log_warn("refiner", path + ": " + w);
  const std::string out_dir = output_dir_for(path);

  if (mode == PipelineMode::Refine) {
    if (!out_dir.empty()) r.written = write_refined(r.refined, out_dir, config_.output.format);
    log_info("pipeline", path + ": refined " + std::to_string(r.refined.quality.original_chars) + " -> " +
                         std::to_string(r.refined.quality.refined_chars) + " chars");
    return r;
  }

  r.chunks = chunker_.chunk(r.refined, config_.chunk, cancel);
  r.refined.structures = link_structures(r.refined.structures, r.chunks);

  if (config_.enrich.enabled) {
    Enricher enricher(completion_, config_.enrich);
    r.chunks = enricher.enrich(r.chunks, r.refined, cancel).chunks;
  }

  if (mode == PipelineMode::Analyze || config_.output.include_report) {
    r.report = QualityAnalyzer().analyze(r.chunks, r.refined.text);
  }

  if (mode == PipelineMode::Chunk && !out_dir.empty()) {
    r.written = write_chunks(r.chunks, out_dir, config_.output.format, r.report ? &*r.report : nullptr);
  }

  if (store_) {
    auto doc = document_record(r.refined, r.chunks);
    store_->upsert_document(doc);
    store_->upsert_chunks(doc.id, r.chunks);
  }

  log_info("pipeline", path + ": " + std::to_string(r.chunks.size()) + " chunks" +
                       (r.chunks.empty() ? "" : " (" + r.chunks.front().strategy + ")"));
  return r;
}

std::vector<PipelineResult> Pipeline::process_folder(const std::string& root, PipelineMode mode,
                                                     const CancelToken& cancel) const {
  std::vector<PipelineResult> out;
  auto files = list_input_files(root);
  if (files.empty()) log_warn("pipeline", "no supported files under " + root);
  for (auto& f : files) {
    cancel.check();
    try {
      out.push_back(process_file(f, mode, cancel));
    } catch (const Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      log_warn("pipeline", e.what());
      PipelineResult failed;
      failed.file = f;
      failed.error = e.what();
      out.push_back(std::move(failed));
    }
  }
  return out;
}

std::string analysis_output(const std::vector<PipelineResult>& results) {
  auto report_of = [](const PipelineResult& r) {
    if (!r.ok()) return json{{"error", r.error}};
    if (!r.report) return json::object();
    return json::parse(report_to_json(*r.report));
  };
  if (results.size() == 1) return report_of(results.front()).dump(2);
  json out = json::object();
  for (auto& r : results) out[r.file] = report_of(r);
  return out.dump(2);
}
