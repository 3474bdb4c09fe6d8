#include "stream-capture.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "hexflow.hpp"
#include "stream_capture_sys.hpp"
#include "utf8.hpp"

namespace sc {

namespace detail {
struct StreamSlot {
  StreamId id;
  FILE* file;
  std::mutex mutex;
  // Read without the mutex so a thread holding the stream can still query it.
  std::atomic<bool> poisoned{false};
};
} // namespace detail

namespace {

detail::StreamSlot& slot_for(StreamId id) {
  static detail::StreamSlot slots[2] = {
      {StreamId::Stdout, stdout},
      {StreamId::Stderr, stderr},
  };
  return slots[id == StreamId::Stdout ? 0 : 1];
}

std::string describe(StreamId id, const std::string& what, int os_error) {
  std::string msg = std::string(to_string(id)) + ": " + what;
  if (os_error != 0) {
    msg += ": " + std::error_code(os_error, std::generic_category()).message();
  }
  return msg;
}

const char* stage_name(Stage stage) {
  return stage == Stage::BeforeCallback ? "before capture" : "after capture";
}

void warn(StreamId id, const std::string& what, int os_error) {
  std::cerr << "stream-capture: warning: " << describe(id, what, os_error) << "\n";
}

// Throw away callback bytes that could not be flushed into the capture
// target, so they never reach the original target after the swap-back.
void discard_pending(FILE* file) {
  sys::purge(file);
  ::clearerr(file);
}

// The original target, held while a capture target is installed.
class InstalledTarget {
public:
  InstalledTarget(detail::StreamSlot& slot, UniqueFd previous)
      : slot_(slot), previous_(std::move(previous)) {}

  InstalledTarget(const InstalledTarget&) = delete;
  InstalledTarget& operator=(const InstalledTarget&) = delete;

  // Still armed here only when the callback threw.
  ~InstalledTarget() {
    if (!previous_) return;
    slot_.poisoned = true;
    if (sys::flush(slot_.file) != 0) {
      warn(slot_.id, "flush failed while unwinding a capture", errno);
      discard_pending(slot_.file);
    }
    const int active = sys::swap_fd(slot_.file, previous_.get());
    if (active < 0) {
      warn(slot_.id, "could not restore the original target while unwinding a capture", errno);
      return;
    }
    previous_.release();
    UniqueFd closing(active);
  }

  void restore() {
    UniqueFd previous = std::move(previous_);

    int flush_error = 0;
    if (sys::flush(slot_.file) != 0) {
      flush_error = errno;
      discard_pending(slot_.file);
    }

    const int active = sys::swap_fd(slot_.file, previous.get());
    if (active < 0) {
      const int swap_error = errno;
      slot_.poisoned = true;
      if (flush_error != 0) {
        warn(slot_.id, "flush failed after capture", flush_error);
      }
      throw SwapFailure(slot_.id, Stage::AfterCallback, swap_error);
    }
    previous.release();
    // Closing the capture target here is what lets a pipe reader see EOF.
    UniqueFd closing(active);

    if (flush_error != 0) {
      throw FlushFailure(slot_.id, Stage::AfterCallback, flush_error);
    }
  }

private:
  detail::StreamSlot& slot_;
  UniqueFd previous_;
};

} // namespace

const char* to_string(StreamId id) {
  switch (id) {
    case StreamId::Stdout: return "stdout";
    case StreamId::Stderr: return "stderr";
  }
  return "unknown";
}

CaptureError::CaptureError(ErrorKind kind, StreamId stream, int os_error, const std::string& what)
    : std::runtime_error(describe(stream, what, os_error)),
      kind_(kind),
      stream_(stream),
      os_error_(os_error) {}

LockPoisoned::LockPoisoned(StreamId stream)
    : CaptureError(ErrorKind::LockPoisoned, stream, 0,
                   "stream is poisoned by an earlier failed capture") {}

FlushFailure::FlushFailure(StreamId stream, Stage stage, int os_error)
    : CaptureError(ErrorKind::FlushFailure, stream, os_error,
                   std::string("flush failed ") + stage_name(stage)),
      stage_(stage) {}

SwapFailure::SwapFailure(StreamId stream, Stage stage, int os_error)
    : CaptureError(ErrorKind::SwapFailure, stream, os_error,
                   std::string("descriptor swap failed ") + stage_name(stage)),
      stage_(stage) {}

DecodeFailure::DecodeFailure(StreamId stream, std::string bytes, size_t offset)
    : CaptureError(ErrorKind::DecodeFailure, stream, 0,
                   "captured output is not valid UTF-8 at offset " + std::to_string(offset) + ":" +
                       hexflow(bytes.data() + offset, std::min<size_t>(16, bytes.size() - offset))),
      bytes_(std::move(bytes)),
      offset_(offset) {}

LentStream::LentStream(detail::StreamSlot& slot, std::unique_lock<std::mutex> guard)
    : slot_(slot), guard_(std::move(guard)), uncaught_at_lend_(std::uncaught_exceptions()) {
  ::flockfile(slot_.file);
}

LentStream::~LentStream() {
  // An exception leaving the holder's scope poisons the stream, unless it is
  // one the capture calls raised themselves: those either left the stream
  // intact or poisoned it already.
  const int unwinding = std::uncaught_exceptions();
  if (unwinding > uncaught_at_lend_ && unwinding != capture_unwind_depth_) {
    slot_.poisoned = true;
  }
  ::funlockfile(slot_.file);
  // guard_ unlocks the mutex after this body.
}

void LentStream::note_capture_unwind() {
  // Called from a catch block, so the exception being rethrown is not counted yet.
  capture_unwind_depth_ = std::uncaught_exceptions() + 1;
}

StreamId LentStream::id() const {
  return slot_.id;
}

FILE* LentStream::file() const {
  return slot_.file;
}

void LentStream::capture_into(UniqueFd target, const std::function<void()>& callback) {
  try {
    if (!callback) {
      throw std::invalid_argument("capture_into: empty callback");
    }

    if (sys::flush(slot_.file) != 0) {
      const int err = errno;
      throw FlushFailure(slot_.id, Stage::BeforeCallback, err);
    }

    const int previous = sys::swap_fd(slot_.file, target.get());
    if (previous < 0) {
      const int err = errno;
      throw SwapFailure(slot_.id, Stage::BeforeCallback, err);
    }
    target.release();

    InstalledTarget installed(slot_, UniqueFd(previous));
    callback();
    installed.restore();
  } catch (...) {
    note_capture_unwind();
    throw;
  }
}

UniqueFd LentStream::capture(const std::function<void()>& callback) {
  try {
    Pipe channel = make_pipe();
    capture_into(std::move(channel.write_end), callback);
    return std::move(channel.read_end);
  } catch (...) {
    note_capture_unwind();
    throw;
  }
}

std::string LentStream::capture_to_text(const std::function<void()>& callback) {
  try {
    Pipe channel = make_pipe();
    Pipe stop = make_pipe();

    // Drain while the callback runs, so output larger than the pipe buffer
    // never blocks the writer.
    std::future<std::string> drained = std::async(std::launch::async, [&channel, &stop] {
      return read_to_end(channel.read_end, stop.read_end);
    });
    try {
      capture_into(std::move(channel.write_end), callback);
    } catch (...) {
      // The write end may still be installed if the swap-back failed.
      stop.write_end.reset();
      drained.wait();
      throw;
    }

    std::string bytes = drained.get();
    const size_t bad = find_invalid_utf8(bytes);
    if (bad != std::string::npos) {
      throw DecodeFailure(slot_.id, std::move(bytes), bad);
    }
    return bytes;
  } catch (...) {
    note_capture_unwind();
    throw;
  }
}

LentStream lend(StreamId id) {
  detail::StreamSlot& slot = slot_for(id);
  std::unique_lock<std::mutex> guard(slot.mutex);
  if (slot.poisoned.load()) {
    throw LockPoisoned(id);
  }
  return LentStream(slot, std::move(guard));
}

LentStream lend_stdout() {
  return lend(StreamId::Stdout);
}

LentStream lend_stderr() {
  return lend(StreamId::Stderr);
}

bool is_poisoned(StreamId id) {
  return slot_for(id).poisoned.load();
}

void clear_poison(StreamId id) {
  slot_for(id).poisoned.store(false);
}

std::string capture_text(StreamId id, const std::function<void()>& callback) {
  return lend(id).capture_to_text(callback);
}

} // namespace sc
