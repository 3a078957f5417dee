#ifndef RNNG_UTILS_H_
#define RNNG_UTILS_H_

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "rnng/errors.h"

namespace utils {

// [start, stop) of block `block_num` when `n` items are divided into
// `block_count` contiguous blocks; the first n % block_count blocks get one
// extra item. block_count == 0 selects everything.
inline std::pair<unsigned, unsigned> block_range(unsigned n, unsigned block_count, unsigned block_num) {
  if (block_count == 0)
    return std::make_pair(0u, n);
  if (block_num >= block_count)
    BOOST_THROW_EXCEPTION(rnng::Error("block_num must be less than block_count"));
  unsigned q = n / block_count;
  unsigned r = n % block_count;
  unsigned start = q * block_num + std::min(block_num, r);
  unsigned stop = q * (block_num + 1) + std::min(block_num + 1, r);
  return std::make_pair(start, stop);
}

// log(sum(exp(xs))) with the maximum subtracted first
inline double logsumexp(const std::vector<double>& xs) {
  if (xs.empty())
    return -std::numeric_limits<double>::infinity();
  double m = *std::max_element(xs.begin(), xs.end());
  if (std::isinf(m))
    return m;
  double total = 0;
  for (double x : xs)
    total += std::exp(x - m);
  return m + std::log(total);
}

inline std::string to_string_precision(double value, unsigned precision) {
  std::stringstream stream;
  stream << std::fixed << std::setprecision(precision) << value;
  return stream.str();
}

} // namespace utils

#endif
