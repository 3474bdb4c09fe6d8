#ifndef STREAM_CAPTURE_SYS_HPP
#define STREAM_CAPTURE_SYS_HPP

#include <cstdio>

namespace sc {
namespace sys {
using flush_fn = int (*)(FILE*);
using swap_fd_fn = int (*)(FILE*, int);
using purge_fn = void (*)(FILE*);

extern flush_fn flush_impl;
extern swap_fd_fn swap_fd_impl;
extern purge_fn purge_impl;

// Returns 0 on success, EOF with errno set on failure.
int flush(FILE* file);

/**
 * Point `file` at descriptor `fd` and return the previous target as a new
 * descriptor the caller owns.
 * - On success `fd` is consumed (closed after being installed).
 * - On failure returns -1 with errno set; `fd` still belongs to the caller and
 *   `file` is unchanged.
 * The caller must hold the lent handle for `file`.
 */
int swap_fd(FILE* file, int fd);

// Drop whatever is sitting in the stdio buffer without writing it.
void purge(FILE* file);

int default_swap_fd(FILE* file, int fd);

void reset_to_defaults();
} // namespace sys
} // namespace sc

#endif // STREAM_CAPTURE_SYS_HPP
