#include "zlib.hh"

#define ZLIB_CONST
#include <zlib.h>

#include <algorithm>
#include <bit>

#include "scope_guard.hh"
#include "error.hh"

namespace lexcmp::zlib {
namespace {

const char* zerrmsg(int code) noexcept {
  switch (code) {
    case Z_STREAM_END   : return "Z_STREAM_END";
    case Z_NEED_DICT    : return "Z_NEED_DICT";
    case Z_ERRNO        : return "Z_ERRNO";
    case Z_STREAM_ERROR : return "Z_STREAM_ERROR";
    case Z_DATA_ERROR   : return "Z_DATA_ERROR";
    case Z_MEM_ERROR    : return "Z_MEM_ERROR";
    case Z_BUF_ERROR    : return "Z_BUF_ERROR";
    case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
    default             : return "Z_OK";
  }
}

}

std::string deflate(std::string_view in, bool gz) {
  z_stream zs { };

  int ret;
  if ((ret = ::deflateInit2(
    &zs,
    Z_BEST_COMPRESSION,
    Z_DEFLATED,
    gz ? 15|16 : 15,
    8,
    Z_DEFAULT_STRATEGY
  )) != Z_OK) ERROR("deflateInit2(): ",zerrmsg(ret));

  scope_guard deflate_end([&]{ (void)::deflateEnd(&zs); });

  zs.next_in = reinterpret_cast<const unsigned char*>(in.data());
  zs.avail_in = in.size();

  // the bound lets a single Z_FINISH call complete the stream
  std::string out(::deflateBound(&zs,in.size()),'\0');
  zs.next_out = reinterpret_cast<unsigned char*>(out.data());
  zs.avail_out = out.size();

  if ((ret = ::deflate(&zs, Z_FINISH)) != Z_STREAM_END)
    ERROR("deflate(): ",zerrmsg(ret));

  out.resize(zs.total_out);
  return out;
}

std::string inflate(std::string_view in) {
  const size_t chunk = std::clamp(
    std::bit_ceil(in.size()*4), (size_t)1<<12, (size_t)1<<20);

  z_stream zs { };

  int ret;
  if ((ret = ::inflateInit2(&zs, 15|32)) != Z_OK)
    ERROR("inflateInit2(): ",zerrmsg(ret));

  scope_guard inflate_end([&]{ (void)::inflateEnd(&zs); });

  zs.next_in = reinterpret_cast<const unsigned char*>(in.data());
  zs.avail_in = in.size();

  std::string out;
  for (;;) {
    const size_t used = out.size();
    out.resize(used + chunk);
    zs.next_out = reinterpret_cast<unsigned char*>(out.data() + used);
    zs.avail_out = chunk;
    ret = ::inflate(&zs, Z_NO_FLUSH);
    out.resize(used + chunk - zs.avail_out);
    if (ret == Z_STREAM_END) break;
    if (ret != Z_OK) ERROR("inflate(): ",zerrmsg(ret));
  }
  return out;
}

} // end namespace lexcmp::zlib
