#ifndef STREAM_CAPTURE_UNIQUE_FD_HPP
#define STREAM_CAPTURE_UNIQUE_FD_HPP

#include <string>

namespace sc {

// Owns one OS descriptor and closes it on destruction.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  // Give up ownership without closing.
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  // Close the held descriptor (if any) and adopt `fd`.
  void reset(int fd = -1) noexcept;

private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

/**
 * Create a unidirectional byte channel. Both ends are close-on-exec.
 * Throws std::system_error if the OS refuses.
 */
Pipe make_pipe();

/**
 * Read `fd` until EOF, retrying on EINTR.
 * Blocks until every write end of the channel is closed.
 * Throws std::system_error on a read error.
 */
std::string read_to_end(const UniqueFd& fd);

// As above, but also stops, returning what was read so far, once `cancel`
// becomes readable or its write end is closed.
std::string read_to_end(const UniqueFd& fd, const UniqueFd& cancel);

} // namespace sc

#endif // STREAM_CAPTURE_UNIQUE_FD_HPP
