#include "file_desc.hh"
#include <unistd.h>
#include "error.hh"

namespace lexcmp {

size_t file_desc::read(char* buffer, size_t size) const {
  for (;;) {
    const auto n = ::read(fd, buffer, size);
    if (n >= 0) return n;
    if (errno != EINTR) THROW_ERRNO("read(fd=",std::to_string(fd),")");
  }
}

void file_desc::write(std::string_view s) const {
  while (!s.empty()) {
    const auto n = ::write(fd, s.data(), s.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      THROW_ERRNO("write(fd=",std::to_string(fd),")");
    }
    s.remove_prefix(n);
  }
}

} // end namespace lexcmp
