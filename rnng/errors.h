#ifndef RNNG_ERRORS_H_
#define RNNG_ERRORS_H_

#include <stdexcept>
#include <string>

#include <boost/exception/exception.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace rnng {

typedef boost::error_info<struct tag_action, std::string> action_info;
typedef boost::error_info<struct tag_file_name, std::string> file_name_info;
typedef boost::error_info<struct tag_line_number, unsigned> line_number_info;

// base of everything the parser throws; use BOOST_THROW_EXCEPTION so the
// throw site and any attached error_info show up in diagnostic_information
struct Error : virtual boost::exception, std::runtime_error {
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// an action was applied that the legality predicate forbids
struct IllegalActionError : Error {
  explicit IllegalActionError(const std::string& what) : Error(what) {}
};

// pop or top past the guard sentinel of a stack, buffer or history
struct EmptyStructureError : Error {
  explicit EmptyStructureError(const std::string& what) : Error(what) {}
};

// an oracle action sequence does not replay to a finished parse of its sentence
struct MalformedOracleError : Error {
  MalformedOracleError(const std::string& what, unsigned sentence_index)
      : Error(what + " (sentence " + std::to_string(sentence_index) + ")"),
        sentence_index(sentence_index) {}

  unsigned sentence_index;
};

// fewer proposal samples than requested were available for a sentence
struct SampleCountMismatchError : Error {
  SampleCountMismatchError(unsigned sentence_index, unsigned requested, unsigned available)
      : Error("sentence " + std::to_string(sentence_index) + ": requested " + std::to_string(requested) +
              " proposal samples but only " + std::to_string(available) + " are available"),
        sentence_index(sentence_index), requested(requested), available(available) {}

  unsigned sentence_index;
  unsigned requested;
  unsigned available;
};

} // namespace rnng

#endif
