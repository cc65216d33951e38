#ifndef LEXCMP_LOCAL_FD_HH
#define LEXCMP_LOCAL_FD_HH

#include <unistd.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <sys/types.h>

#include "error.hh"

namespace lexcmp {

struct local_fd {
  int fd;
  local_fd(const char* name, int flags = O_RDONLY, mode_t mode = 0644)
  : fd(::open([](const char* name){
      if (name && *name) return name;
      throw error("empty file name");
    }(name), flags, mode))
  {
    if (fd < 0) THROW_ERRNO("open(",name,")");
  }
  ~local_fd() { ::close(fd); }
  local_fd(const local_fd&) = delete;
  local_fd& operator=(const local_fd&) = delete;
  operator int() const noexcept { return fd; }
};

}

#endif
