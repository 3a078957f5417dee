#ifndef RNNG_COMPRESSED_FSTREAM_H_
#define RNNG_COMPRESSED_FSTREAM_H_

#include <fstream>
#include <string>

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

namespace rnng {

// reads like std::ifstream, decompressing files that end in .gz
class compressed_ifstream : public boost::iostreams::filtering_istream {
public:
  explicit compressed_ifstream(const std::string& fname)
      : file(fname.c_str(), std::ios_base::in | std::ios_base::binary) {
    if (fname.size() > 3 && fname.compare(fname.size() - 3, 3, ".gz") == 0)
      push(boost::iostreams::gzip_decompressor());
    push(file);
    if (!file)
      setstate(std::ios_base::failbit);
  }

  // the chain refers to `file`, so it has to go first
  ~compressed_ifstream() { reset(); }

private:
  std::ifstream file;
};

} // namespace rnng

#endif
