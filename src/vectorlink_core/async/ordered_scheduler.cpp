#include "vectorlink_core/async/ordered_scheduler.hpp"

#include <stdexcept>
#include <system_error>

#include "vectorlink_core/errors.hpp"

namespace vectorlink_core::async {

OrderedScheduler::OrderedScheduler(Chunker &chunks,
                                   EmbeddingClient &client,
                                   std::string credential,
                                   size_t width)
    : chunks_(chunks), client_(client), credential_(std::move(credential)), width_(width) {
  if (width_ == 0) {
    throw std::invalid_argument("OrderedScheduler must allow at least one chunk in flight.");
  }
}

std::optional<ChunkResult> OrderedScheduler::next() {
  fill_window();
  if (in_flight_.empty()) {
    return std::nullopt;
  }

  std::future<ChunkResult> oldest = std::move(in_flight_.front());
  in_flight_.pop_front();
  try {
    return oldest.get();
  } catch (const VectorizationError &) {
    throw;
  } catch (const std::exception &e) {
    throw ExecutionFault("Embedding unit failed to complete: " + std::string(e.what()));
  } catch (...) {
    throw ExecutionFault("Embedding unit failed to complete: unknown exception");
  }
}

void OrderedScheduler::fill_window() {
  while (!chunks_exhausted_ && in_flight_.size() < width_) {
    std::optional<Chunk> chunk;
    try {
      chunk = chunks_.next();
    } catch (...) {
      // Upstream failures wait behind the chunks already in flight.
      chunks_exhausted_ = true;
      push_failure(std::current_exception());
      return;
    }

    if (!chunk) {
      chunks_exhausted_ = true;
      return;
    }
    dispatch(std::move(*chunk));
  }
}

void OrderedScheduler::dispatch(Chunk chunk) {
  EmbeddingClient &client = client_;
  const std::string credential = credential_;
  try {
    in_flight_.push_back(std::async(std::launch::async,
                                    [&client, credential, chunk = std::move(chunk)]() {
                                      return ChunkResult{
                                          .sequence = chunk.sequence,
                                          .item_count = chunk.items.size(),
                                          .batch = client.get_embeddings(credential, chunk.items)};
                                    }));
  } catch (const std::system_error &e) {
    chunks_exhausted_ = true;
    push_failure(std::make_exception_ptr(
        ExecutionFault("Could not start embedding unit: " + std::string(e.what()))));
  }
}

void OrderedScheduler::push_failure(std::exception_ptr error) {
  std::promise<ChunkResult> failed;
  failed.set_exception(error);
  in_flight_.push_back(failed.get_future());
}

}  // namespace vectorlink_core::async
