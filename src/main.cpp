#include "cli.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "llama_completion.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "store.hpp"

#include <cstdio>
#include <iostream>
#include <memory>

static void apply_overrides(const Args& a, Config& c) {
  if (!a.out_dir.empty()) c.output.dir = a.out_dir;
  if (!a.format.empty()) c.output.format = a.format;
  if (!a.strategy.empty()) c.chunk.strategy = a.strategy;
  if (!a.sqlite_path.empty()) c.output.sqlite_path = a.sqlite_path;
  if (!a.model_path.empty()) c.enrich.model_path = a.model_path;
  if (a.max_chunk >= 0) c.chunk.max_chunk_size = a.max_chunk;
  if (a.min_chunk >= 0) c.chunk.min_chunk_size = a.min_chunk;
  if (a.overlap >= 0) c.chunk.overlap_size = a.overlap;
  if (a.enrich) c.enrich.enabled = true;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  if (args.quiet) set_log_level(LogLevel::Quiet);
  if (args.verbose) set_log_level(LogLevel::Debug);

  Config config;
  try {
    if (!args.config_path.empty()) config = load_config(args.config_path);
    apply_overrides(args, config);
    parse_strategy(config.chunk.strategy);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  PipelineMode mode = PipelineMode::Chunk;
  if (args.mode == "refine") mode = PipelineMode::Refine;
  if (args.mode == "analyze") {
    mode = PipelineMode::Analyze;
    config.output.dir.clear();
  }

  // A model that fails to load only disables enrichment.
  std::unique_ptr<LlamaCompletionService> completion;
  if (config.enrich.enabled || config.refine.use_llm) {
    try {
      completion.reset(new LlamaCompletionService(config.enrich.model_path, config.enrich.max_tokens,
                                                  config.enrich.context_size));
    } catch (const std::exception& e) {
      log_warn("docrefine", std::string(e.what()) + "; continuing without completion service");
    }
  }

  try {
    std::unique_ptr<ChunkStore> store;
    if (!config.output.sqlite_path.empty() && mode != PipelineMode::Refine)
      store.reset(new ChunkStore(config.output.sqlite_path));

    Pipeline pipeline(config, completion.get(), nullptr, store.get());
    auto results = pipeline.process_folder(args.input_path, mode);

    int failed = 0;
    for (auto& r : results) {
      if (!r.ok()) { failed++; continue; }
      if (mode == PipelineMode::Analyze) continue;
      if (mode == PipelineMode::Refine) {
        std::printf("%s\t%zu chars\t%zu sections\t%.2f\n", r.file.c_str(), r.refined.text.size(),
                    r.refined.sections.size(), r.refined.quality.overall());
      } else {
        std::printf("%s\t%zu chunks\t%s\t%.2f\n", r.file.c_str(), r.chunks.size(),
                    r.chunks.empty() ? "-" : r.chunks.front().strategy.c_str(),
                    r.report ? r.report->composite_score : 0.0);
      }
    }
    if (mode == PipelineMode::Analyze && !results.empty()) std::cout << analysis_output(results) << "\n";
    if (store) log_info("docrefine", std::to_string(store->chunk_count()) + " chunks in " + config.output.sqlite_path);
    if (failed > 0) {
      log_warn("docrefine", std::to_string(failed) + " of " + std::to_string(results.size()) + " files failed");
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
