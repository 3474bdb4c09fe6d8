#include "utf8.hpp"

namespace sc {

size_t find_invalid_utf8(const std::string& bytes) {
  const size_t n = bytes.size();
  size_t i = 0;
  while (i < n) {
    const unsigned char lead = static_cast<unsigned char>(bytes[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t len;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      len = 3;
      if (lead == 0xE0) lo = 0xA0;      // overlong
      else if (lead == 0xED) hi = 0x9F; // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      len = 4;
      if (lead == 0xF0) lo = 0x90;      // overlong
      else if (lead == 0xF4) hi = 0x8F; // > U+10FFFF
    } else {
      return i;
    }

    if (i + len > n) return i;
    const unsigned char second = static_cast<unsigned char>(bytes[i + 1]);
    if (second < lo || second > hi) return i;
    for (size_t k = 2; k < len; ++k) {
      const unsigned char cont = static_cast<unsigned char>(bytes[i + k]);
      if (cont < 0x80 || cont > 0xBF) return i;
    }
    i += len;
  }
  return std::string::npos;
}

} // namespace sc
