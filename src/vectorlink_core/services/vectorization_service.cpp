#include "vectorlink_core/services/vectorization_service.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

#include "vectorlink_core/async/ordered_scheduler.hpp"
#include "vectorlink_core/chunking/chunker.hpp"
#include "vectorlink_core/errors.hpp"
#include "vectorlink_core/source/text_item_source.hpp"

namespace vectorlink_core {

StagingPaths StagingPaths::for_domain(const std::filesystem::path &root, const std::string &domain) {
  const std::filesystem::path domain_path(domain);
  if (domain.empty() || domain == "." || domain == ".." || domain_path.has_parent_path() ||
      domain_path.is_absolute()) {
    throw std::invalid_argument("Invalid domain name: '" + domain + "'");
  }

  StagingPaths paths;
  paths.directory = root / ".staging" / domain_path;
  paths.vectors = paths.directory / "vectors";
  paths.progress = paths.directory / "progress";
  return paths;
}

VectorizationService::VectorizationService(std::shared_ptr<EmbeddingClient> embedding_client,
                                           std::shared_ptr<Tokenizer> tokenizer,
                                           VectorizationOptions options)
    : embedding_client_(std::move(embedding_client)),
      tokenizer_(std::move(tokenizer)),
      options_(options) {
  if (!embedding_client_ || !tokenizer_) {
    throw std::invalid_argument("VectorizationService needs an embedding client and a tokenizer.");
  }
}

VectorizationResult VectorizationService::vectorize_from_operations(
    const std::string &credential,
    VectorStore &store,
    TextItemStream &items,
    Checkpoint &checkpoint,
    const ProgressUpdater &on_progress) {
  const uint64_t start_cursor = checkpoint.cursor();
  std::cout << "[Vectorizer] Starting indexing at " << start_cursor << std::endl;

  SkipItems remaining(items, start_cursor);
  Chunker chunker(remaining, *tokenizer_, options_.token_limit);
  chunker.set_verbose(options_.verbose);
  async::OrderedScheduler scheduler(chunker, *embedding_client_, credential, options_.concurrency);

  size_t failures = 0;
  while (auto result = scheduler.next()) {
    const auto &embeddings = result->batch.embeddings;
    // Offsets are positional, so a short or long batch would shift every later record.
    if (embeddings.size() != result->item_count) {
      throw EmbeddingError(EmbeddingErrorKind::Service,
                           "Chunk " + std::to_string(result->sequence) + " sent " +
                               std::to_string(result->item_count) + " texts but got " +
                               std::to_string(embeddings.size()) + " embeddings back");
    }

    store.write(checkpoint.cursor(), embeddings);
    failures += result->batch.failures;
    checkpoint.advance(result->item_count);

    if (options_.verbose) {
      std::cout << "[Vectorizer] indexed " << checkpoint.cursor() << std::endl;
    }
    if (on_progress) {
      on_progress(checkpoint.cursor(), result->item_count);
    }
  }

  if (remaining.skipped() < start_cursor) {
    std::cerr << "[Vectorizer] Warning: checkpoint is at " << start_cursor
              << " but the operation log only has " << remaining.skipped() << " text items."
              << std::endl;
  }

  VectorizationResult summary{
      .failures = failures, .start_cursor = start_cursor, .final_cursor = checkpoint.cursor()};
  std::cout << "[Vectorizer] Finished at " << summary.final_cursor << " ("
            << summary.records_written() << " new, " << failures << " failures)" << std::endl;
  return summary;
}

VectorizationResult VectorizationService::index_from_operations_file(
    const std::string &credential,
    const std::filesystem::path &operations_path,
    const std::filesystem::path &staging_root,
    const std::string &domain,
    const ProgressUpdater &on_progress) {
  const StagingPaths paths = StagingPaths::for_domain(staging_root, domain);

  std::error_code ec;
  std::filesystem::create_directories(paths.directory, ec);
  if (ec) {
    throw IoError(format_io_error("create staging directory", paths.directory.string(), ec.value()));
  }

  VectorStore store(paths.vectors, embedding_client_->dimension());
  Checkpoint checkpoint(paths.progress);
  if (checkpoint.was_reset()) {
    std::cout << "[Vectorizer] No valid checkpoint at " << paths.progress
              << ", starting from scratch." << std::endl;
  }

  TextItemSource source(operations_path);
  return vectorize_from_operations(credential, store, source, checkpoint, on_progress);
}

}  // namespace vectorlink_core
