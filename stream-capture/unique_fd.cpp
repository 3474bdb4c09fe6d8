#include "unique_fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace sc {

void UniqueFd::reset(int fd) noexcept {
  if (fd_ >= 0 && fd_ != fd) {
    // Linux releases the descriptor even when close reports EINTR.
    if (::close(fd_) != 0 && errno != EINTR) {
      std::cerr << "stream-capture: warning: close(" << fd_ << ") failed: "
                << std::strerror(errno) << "\n";
    }
  }
  fd_ = fd;
}

Pipe make_pipe() {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2 failed");
  }
  Pipe p;
  p.read_end.reset(fds[0]);
  p.write_end.reset(fds[1]);
  return p;
}

std::string read_to_end(const UniqueFd& fd) {
  std::string out;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno == EINTR) {
      continue;
    } else {
      throw std::system_error(errno, std::generic_category(), "read from capture channel failed");
    }
  }
  return out;
}

std::string read_to_end(const UniqueFd& fd, const UniqueFd& cancel) {
  std::string out;
  char buf[4096];
  for (;;) {
    struct pollfd fds[2] = {{fd.get(), POLLIN, 0}, {cancel.get(), POLLIN, 0}};
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "poll on capture channel failed");
    }
    if (fds[1].revents != 0) break;
    if (fds[0].revents == 0) continue;

    ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "read from capture channel failed");
    }
  }
  return out;
}

} // namespace sc
