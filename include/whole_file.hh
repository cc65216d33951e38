#ifndef LEXCMP_WHOLE_FILE_HH
#define LEXCMP_WHOLE_FILE_HH

#include <string>

namespace lexcmp {

std::string whole_file(const char* name);

// reads until end of file; works on pipes
std::string whole_fd(int fd);

}

#endif
