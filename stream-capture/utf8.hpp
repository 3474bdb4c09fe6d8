#ifndef STREAM_CAPTURE_UTF8_HPP
#define STREAM_CAPTURE_UTF8_HPP

#include <string>

namespace sc {

// Offset where the first ill-formed UTF-8 sequence starts, or
// std::string::npos if `bytes` is valid UTF-8. Overlong forms,
// surrogates and code points above U+10FFFF are rejected, as is a sequence cut
// short by the end of input.
size_t find_invalid_utf8(const std::string& bytes);

} // namespace sc

#endif // STREAM_CAPTURE_UTF8_HPP
