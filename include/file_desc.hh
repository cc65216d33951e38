#ifndef LEXCMP_FILE_DESC_HH
#define LEXCMP_FILE_DESC_HH

#include <cstddef>
#include <string_view>

namespace lexcmp {

// Non-owning descriptor
class file_desc {
  int fd;

public:
  file_desc(int fd) noexcept: fd(fd) { }

  void write(std::string_view) const;
  void operator<<(std::string_view buffer) const { write(buffer); }

  size_t read(char* buffer, size_t size) const;
};

} // end namespace lexcmp

#endif
