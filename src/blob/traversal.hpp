#pragma once

#include <cstddef>
#include <exception>
#include <optional>

#include "blob/blob.hpp"
#include "io/cursor.hpp"

namespace osmpbf_reader {

enum class TraversalState { NotStarted, InProgress, Exhausted, Failed, Disposed };

const char *traversal_state_name(TraversalState state);

/**
 * @brief Restartable, forward-only pull over the blobs of one mapped file.
 *
 * Each Traversal owns its own Cursor, so several traversals over the same
 * source never observe each other. next() returns a fresh Blob per call.
 *
 * State machine:
 *   NotStarted --next()--> InProgress --end of stream--> Exhausted
 *   NotStarted/InProgress/Exhausted --reset()--> NotStarted
 *   any read error --> Failed (next()/reset() rethrow the same error)
 *   any --dispose()--> Disposed (next()/reset() throw UseAfterDispose)
 */
class Traversal {
public:
  explicit Traversal(pbf_io::Cursor cursor);
  ~Traversal();

  Traversal(Traversal &&other) noexcept;
  Traversal &operator=(Traversal &&other) noexcept;

  Traversal(const Traversal &) = delete;
  Traversal &operator=(const Traversal &) = delete;

  /**
   * @brief Pull the next blob.
   *
   * @return The next Blob, or nullopt once the stream is exhausted
   * @throws ReaderError on a framing/decode failure, or UseAfterDispose
   */
  std::optional<Blob> next();

  // Rewind to the first record.
  void reset();

  // Release the cursor's claim on the mapping. Never throws; idempotent.
  void dispose() noexcept;

  TraversalState state() const { return state_; }
  size_t position() const { return cursor_.position(); }
  size_t blobs_read() const { return blobs_read_; }

private:
  void check_not_disposed(const char *operation) const;

  pbf_io::Cursor cursor_;
  TraversalState state_ = TraversalState::NotStarted;
  std::exception_ptr failure_;
  size_t blobs_read_ = 0;
};

} // namespace osmpbf_reader
