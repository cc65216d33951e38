#include "whole_file.hh"
#include "local_fd.hh"
#include "file_desc.hh"
#include "error.hh"

namespace lexcmp {

std::string whole_file(const char* name) {
  local_fd fd(name);
  struct stat sb;
  if (::fstat(fd,&sb) < 0)
    THROW_ERRNO("fstat(",name,")");
  if (!S_ISREG(sb.st_mode))
    ERROR('\"',name,"\" is not a regular file");
  const file_desc f(fd);
  std::string m(sb.st_size,'\0');
  for (size_t n=0; n<m.size(); ) {
    const size_t r = f.read(m.data()+n,m.size()-n);
    if (r == 0) { m.resize(n); break; }
    n += r;
  }
  return m;
}

std::string whole_fd(int fd) {
  const file_desc f(fd);
  std::string m;
  size_t n = 0;
  for (;;) {
    m.resize(n + (1<<16));
    const size_t r = f.read(m.data()+n,m.size()-n);
    if (r == 0) break;
    n += r;
  }
  m.resize(n);
  return m;
}

} // end namespace lexcmp
