#ifndef STREAM_CAPTURE_HEXFLOW_HPP
#define STREAM_CAPTURE_HEXFLOW_HPP

#include <cstddef>
#include <ostream>
#include <string>

namespace sc {

// Write one byte in hexflow notation: printable bytes as-is, \n \r \t escaped,
// anything else as two hex digits. Every non-printable token gets a leading
// space, and the first printable byte after one gets a separating space.
void print_byte(unsigned char c, std::ostream& out, bool& last_was_nonprint);

// Render `len` bytes of `data` as a single hexflow string.
std::string hexflow(const char* data, size_t len);

} // namespace sc

#endif // STREAM_CAPTURE_HEXFLOW_HPP
