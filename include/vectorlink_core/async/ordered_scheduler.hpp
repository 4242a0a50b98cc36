#pragma once

#include <deque>
#include <future>
#include <optional>
#include <string>

#include "vectorlink_core/chunking/chunker.hpp"
#include "vectorlink_core/llm/embedding_client.hpp"
#include "vectorlink_core/types/chunk.hpp"

namespace vectorlink_core::async {

/**
 * @class OrderedScheduler
 * @brief Runs embedding requests for up to `width` chunks at once and hands the
 *        results back in the order the chunks were dispatched.
 *
 * The in-flight window is a FIFO of futures. next() first tops the window up
 * from the chunker, then blocks on the oldest future only, so a chunk that
 * finishes early waits for every chunk dispatched before it.
 *
 * Errors keep their place in line as well: a failed request, or a failure to
 * read the next chunk, is stored in the window and rethrown when its turn
 * comes. Pipeline errors (EmbeddingError, ParseError, ...) are rethrown as-is;
 * anything else is wrapped in ExecutionFault.
 *
 * Destroying the scheduler with requests still in flight waits for them to
 * return and throws their results away.
 */
class OrderedScheduler {
 public:
  OrderedScheduler(Chunker &chunks,
                   EmbeddingClient &client,
                   std::string credential,
                   size_t width);

  ~OrderedScheduler() = default;

  // --- Rule of Five: Make the class non-copyable and non-movable ---
  OrderedScheduler(const OrderedScheduler &) = delete;
  OrderedScheduler &operator=(const OrderedScheduler &) = delete;
  OrderedScheduler(OrderedScheduler &&) = delete;
  OrderedScheduler &operator=(OrderedScheduler &&) = delete;

  // Next result in dispatch order; std::nullopt when every chunk has been yielded.
  std::optional<ChunkResult> next();

  size_t in_flight() const {
    return in_flight_.size();
  }

  size_t width() const {
    return width_;
  }

  static constexpr size_t DEFAULT_WIDTH = 10;

 private:
  void fill_window();
  void dispatch(Chunk chunk);
  void push_failure(std::exception_ptr error);

  Chunker &chunks_;
  EmbeddingClient &client_;
  std::string credential_;
  size_t width_;

  std::deque<std::future<ChunkResult>> in_flight_;
  bool chunks_exhausted_ = false;
};

}  // namespace vectorlink_core::async
