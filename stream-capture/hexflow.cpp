#include "hexflow.hpp"

#include <cctype>
#include <sstream>

namespace sc {

void print_byte(unsigned char c, std::ostream& out, bool& last_was_nonprint) {
  const bool printable = std::isprint(c) != 0;
  if (printable) {
    if (last_was_nonprint) out << ' ';
    out << static_cast<char>(c);
  } else {
    switch (c) {
      case '\n': out << " \\n"; break;
      case '\r': out << " \\r"; break;
      case '\t': out << " \\t"; break;
      default: {
        static const char digits[] = "0123456789abcdef";
        out << ' ' << digits[c >> 4] << digits[c & 0x0f];
        break;
      }
    }
  }
  last_was_nonprint = !printable;
}

std::string hexflow(const char* data, size_t len) {
  std::ostringstream out;
  bool last_was_nonprint = false;
  for (size_t i = 0; i < len; ++i) {
    print_byte(static_cast<unsigned char>(data[i]), out, last_was_nonprint);
  }
  return out.str();
}

} // namespace sc
