#pragma once
#include "cancel.hpp"
#include "chunker.hpp"
#include "completion.hpp"
#include "config.hpp"
#include "document.hpp"
#include "markdown.hpp"
#include "quality.hpp"
#include "refiner.hpp"
#include "store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class PipelineMode { Refine, Chunk, Analyze };

struct PipelineResult {
  std::string file;
  RefinedContent refined;
  std::vector<DocumentChunk> chunks;
  std::optional<RagQualityReport> report;
  std::vector<std::string> written;
  std::string error;   // set by process_folder when this file failed

  bool ok() const { return error.empty(); }
};

// Analyze-mode output. One processed file prints its bare report; several are
// keyed by file, and a failed file maps to {"error": ...}.
std::string analysis_output(const std::vector<PipelineResult>& results);

// read -> refine -> chunk -> (enrich) -> (analyze) -> (write, store) for one
// file at a time. Collaborators are borrowed and may be null.
class Pipeline {
public:
  explicit Pipeline(const Config& config, CompletionService* completion = nullptr,
                    ImageTextService* images = nullptr, ChunkStore* store = nullptr,
                    MarkdownConverter* converter = nullptr);
  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Throws ProcessingError / UnsupportedFormatError / Cancelled.
  PipelineResult process_file(const std::string& path, PipelineMode mode,
                              const CancelToken& cancel = CancelToken()) const;

  // Every supported file under root, independently; a failing file is logged
  // and reported in its result. Only cancellation stops the run.
  std::vector<PipelineResult> process_folder(const std::string& root, PipelineMode mode,
                                             const CancelToken& cancel = CancelToken()) const;

private:
  std::string output_dir_for(const std::string& path) const;

  Config config_;
  CompletionService* completion_;
  ChunkStore* store_;
  HeuristicMarkdownConverter heuristic_;
  std::unique_ptr<LlmMarkdownConverter> llm_;
  Refiner refiner_;
  Chunker chunker_;
};
