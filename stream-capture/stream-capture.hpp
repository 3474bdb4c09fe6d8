#ifndef STREAM_CAPTURE_HPP
#define STREAM_CAPTURE_HPP

#include <cstdio>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>

#include "unique_fd.hpp"

namespace sc {

// The two process streams that can be captured.
enum class StreamId { Stdout, Stderr };

const char* to_string(StreamId id);

enum class ErrorKind { LockPoisoned, FlushFailure, SwapFailure, DecodeFailure };

// Where in a capture session a flush or swap failed.
// BeforeCallback: the stream was left untouched.
// AfterCallback: the callback already ran; see the individual error types.
enum class Stage { BeforeCallback, AfterCallback };

/**
 * Base for every failure reported by the capture API.
 * os_error() is the errno value behind the failure, 0 when there is none.
 * Pipe setup and drain errors are reported as plain std::system_error.
 */
class CaptureError : public std::runtime_error {
public:
  CaptureError(ErrorKind kind, StreamId stream, int os_error, const std::string& what);

  ErrorKind kind() const noexcept { return kind_; }
  StreamId stream() const noexcept { return stream_; }
  int os_error() const noexcept { return os_error_; }
  std::error_code code() const noexcept { return std::error_code(os_error_, std::generic_category()); }

private:
  ErrorKind kind_;
  StreamId stream_;
  int os_error_;
};

// An earlier holder failed mid-session. Cleared only by clear_poison().
class LockPoisoned : public CaptureError {
public:
  explicit LockPoisoned(StreamId stream);
};

/**
 * fflush() on the stream failed.
 * Before the callback nothing changed. After the callback the unflushed
 * callback bytes were discarded and the original target was put back.
 */
class FlushFailure : public CaptureError {
public:
  FlushFailure(StreamId stream, Stage stage, int os_error);
  Stage stage() const noexcept { return stage_; }

private:
  Stage stage_;
};

/**
 * The descriptor exchange failed.
 * Before the callback the stream is unchanged. After the callback the stream
 * may still point at the capture target; the stream is poisoned.
 */
class SwapFailure : public CaptureError {
public:
  SwapFailure(StreamId stream, Stage stage, int os_error);
  Stage stage() const noexcept { return stage_; }

private:
  Stage stage_;
};

// Captured bytes are not valid UTF-8.
class DecodeFailure : public CaptureError {
public:
  DecodeFailure(StreamId stream, std::string bytes, size_t offset);

  size_t offset() const noexcept { return offset_; }
  const std::string& bytes() const noexcept { return bytes_; }

private:
  std::string bytes_;
  size_t offset_;
};

namespace detail {
struct StreamSlot;
} // namespace detail

/**
 * Exclusive, lock-held access to one process stream.
 *
 * While a LentStream is alive its thread holds both the per-stream mutex and
 * the stdio lock of the FILE (flockfile), so no other capture and no other
 * stdio writer can touch the stream. Destruction releases the stdio lock and
 * then the mutex.
 *
 * The handle is bound to the scope that called lend(): it can be neither
 * copied nor moved.
 */
class LentStream {
public:
  LentStream(const LentStream&) = delete;
  LentStream& operator=(const LentStream&) = delete;
  LentStream(LentStream&&) = delete;
  LentStream& operator=(LentStream&&) = delete;
  ~LentStream();

  StreamId id() const;
  FILE* file() const;

  /**
   * Send everything the stream receives while `callback` runs to `target`.
   *
   * The stream is flushed before the swap and again before the swap-back, so
   * no byte written before the call is redirected and no callback byte is
   * left behind. `target` is closed once the original descriptor is back.
   *
   * If `callback` throws, the original target is restored, the stream is
   * poisoned and the exception propagates unchanged.
   *
   * `callback` must write to the stream from this thread: the stdio lock is
   * held for the whole call. An empty `callback` throws std::invalid_argument
   * before the stream is touched.
   */
  void capture_into(UniqueFd target, const std::function<void()>& callback);

  // Capture into a fresh pipe and return its read end, ready to be drained.
  // The pipe is not read during the callback, so the output must fit in the
  // OS pipe buffer.
  UniqueFd capture(const std::function<void()>& callback);

  // Capture into a pipe drained on a helper thread and return the bytes as
  // UTF-8 text. Output size is not bounded by the pipe buffer.
  std::string capture_to_text(const std::function<void()>& callback);

private:
  friend LentStream lend(StreamId id);
  LentStream(detail::StreamSlot& slot, std::unique_lock<std::mutex> guard);

  void note_capture_unwind();

  detail::StreamSlot& slot_;
  std::unique_lock<std::mutex> guard_;
  int uncaught_at_lend_;
  int capture_unwind_depth_ = -1;
};

/**
 * Block until `id` is free and lend it to the caller.
 * Throws LockPoisoned if the stream is poisoned.
 *
 * The stream is poisoned when an exception leaves the holder's scope, except
 * for exceptions raised by the capture calls themselves, which poison only
 * when the stream could not be restored or the callback threw.
 */
LentStream lend(StreamId id);
LentStream lend_stdout();
LentStream lend_stderr();

// Neither call takes the stream's lock; both are safe from inside a callback.
bool is_poisoned(StreamId id);
void clear_poison(StreamId id);

// lend(id).capture_to_text(callback)
std::string capture_text(StreamId id, const std::function<void()>& callback);

} // namespace sc

#endif // STREAM_CAPTURE_HPP
