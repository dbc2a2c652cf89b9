#include "traversal.hpp"

#include <string>
#include <utility>

#include "core/errors.hpp"
#include "framing/blob_framing.hpp"

namespace osmpbf_reader {

const char *traversal_state_name(TraversalState state) {
  switch (state) {
  case TraversalState::NotStarted:
    return "not_started";
  case TraversalState::InProgress:
    return "in_progress";
  case TraversalState::Exhausted:
    return "exhausted";
  case TraversalState::Failed:
    return "failed";
  case TraversalState::Disposed:
    return "disposed";
  }
  return "unknown";
}

Traversal::Traversal(pbf_io::Cursor cursor) : cursor_(std::move(cursor)) {
  cursor_.seek(0);
}

Traversal::~Traversal() { dispose(); }

Traversal::Traversal(Traversal &&other) noexcept
    : cursor_(std::move(other.cursor_)), state_(other.state_),
      failure_(std::move(other.failure_)), blobs_read_(other.blobs_read_) {
  other.cursor_.release();
  other.state_ = TraversalState::Disposed;
  other.blobs_read_ = 0;
}

Traversal &Traversal::operator=(Traversal &&other) noexcept {
  if (this != &other) {
    dispose();
    cursor_ = std::move(other.cursor_);
    state_ = other.state_;
    failure_ = std::move(other.failure_);
    blobs_read_ = other.blobs_read_;

    other.cursor_.release();
    other.state_ = TraversalState::Disposed;
    other.blobs_read_ = 0;
  }
  return *this;
}

void Traversal::check_not_disposed(const char *operation) const {
  if (state_ == TraversalState::Disposed) {
    throw ReaderError(ErrorKind::UseAfterDispose,
                      std::string(operation) + "() on a disposed traversal");
  }
}

std::optional<Blob> Traversal::next() {
  check_not_disposed("next");

  switch (state_) {
  case TraversalState::Failed:
    std::rethrow_exception(failure_);
  case TraversalState::Exhausted:
    return std::nullopt;
  default:
    break;
  }

  state_ = TraversalState::InProgress;
  try {
    std::optional<Blob> blob = pbf_framing::read_next(cursor_);
    if (!blob) {
      state_ = TraversalState::Exhausted;
      return std::nullopt;
    }
    ++blobs_read_;
    return blob;
  } catch (...) {
    // The cursor may already be past part of the record, and no
    // resynchronization point exists, so any failure is terminal.
    state_ = TraversalState::Failed;
    failure_ = std::current_exception();
    throw;
  }
}

void Traversal::reset() {
  check_not_disposed("reset");
  if (state_ == TraversalState::Failed) {
    std::rethrow_exception(failure_);
  }

  cursor_.seek(0);
  state_ = TraversalState::NotStarted;
  blobs_read_ = 0;
}

void Traversal::dispose() noexcept {
  cursor_.release();
  failure_ = nullptr;
  state_ = TraversalState::Disposed;
}

} // namespace osmpbf_reader
