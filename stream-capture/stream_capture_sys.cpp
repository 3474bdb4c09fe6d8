#include "stream_capture_sys.hpp"

#include <cerrno>
#include <fcntl.h>
#include <stdio_ext.h>
#include <unistd.h>

namespace sc {
namespace sys {
flush_fn flush_impl = ::fflush;
swap_fd_fn swap_fd_impl = default_swap_fd;
purge_fn purge_impl = ::__fpurge;

int flush(FILE* file) {
  return flush_impl(file);
}

int swap_fd(FILE* file, int fd) {
  return swap_fd_impl(file, fd);
}

void purge(FILE* file) {
  purge_impl(file);
}

int default_swap_fd(FILE* file, int fd) {
  const int target = ::fileno(file);
  if (target < 0) return -1;
  if (fd < 0 || fd == target) {
    errno = EINVAL;
    return -1;
  }

  // Keep the current target alive under a fresh number before replacing it.
  const int previous = ::fcntl(target, F_DUPFD_CLOEXEC, 0);
  if (previous < 0) return -1;

  int rc;
  do {
    rc = ::dup2(fd, target);
  } while (rc < 0 && (errno == EINTR || errno == EBUSY));
  if (rc < 0) {
    const int saved = errno;
    ::close(previous);
    errno = saved;
    return -1;
  }

  // `target` now refers to the same open file; the extra number is ours to drop.
  ::close(fd);
  return previous;
}

void reset_to_defaults() {
  flush_impl = ::fflush;
  swap_fd_impl = default_swap_fd;
  purge_impl = ::__fpurge;
}
} // namespace sys
} // namespace sc
