#pragma once
#include "cancel.hpp"
#include "completion.hpp"
#include "config.hpp"
#include "document.hpp"
#include <vector>

struct EnrichResult {
  std::vector<DocumentChunk> chunks;
  int failures = 0;   // collaborator calls that failed and were skipped
};

// Annotates chunk props through a CompletionService. Content and offsets are
// never touched; a failed call is logged and skipped. enrich() keeps no state,
// so one Enricher may serve several threads if the service allows it.
class Enricher {
public:
  Enricher(CompletionService* completion, const EnrichOptions& options)
    : completion_(completion), options_(options) {}

  // Chunks come back unchanged when no service is available.
  EnrichResult enrich(const std::vector<DocumentChunk>& chunks, const RefinedContent& refined,
                      const CancelToken& cancel = CancelToken()) const;

private:
  CompletionService* completion_;
  EnrichOptions options_;
};
