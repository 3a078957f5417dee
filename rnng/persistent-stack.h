#ifndef RNNG_PERSISTENT_STACK_H_
#define RNNG_PERSISTENT_STACK_H_

#include <algorithm>
#include <memory>
#include <vector>

#include "rnng/errors.h"

namespace rnng {

// Immutable singly linked stack. push_back and pop_back return new stacks that
// share their tail with the original, so copies are O(1) and a fork can never
// observe changes made through another copy.
template <class T>
class PersistentStack {
public:
  PersistentStack() {}

  explicit PersistentStack(const std::vector<T>& values) {
    for (const T& value : values)
      data = std::make_shared<Data>(value, data);
  }

  bool empty() const {
    return !((bool) data);
  }

  const T& back() const {
    if (empty())
      BOOST_THROW_EXCEPTION(EmptyStructureError("cannot call back() on an empty stack"));
    return data->value;
  }

  PersistentStack push_back(const T& value) const {
    return PersistentStack(std::make_shared<Data>(value, data));
  }

  PersistentStack pop_back() const {
    if (empty())
      BOOST_THROW_EXCEPTION(EmptyStructureError("cannot call pop_back() on an empty stack"));
    return PersistentStack(data->previous);
  }

  unsigned size() const {
    return data ? data->size : 0;
  }

  // the top `limit` values (all when negative), bottom first
  std::vector<T> values(int limit = -1) const {
    unsigned to_take = (limit >= 0) ? (unsigned) limit : size();
    std::vector<T> values;
    std::shared_ptr<const Data> node(data);
    while (node && to_take > 0) {
      to_take--;
      values.push_back(node->value);
      node = node->previous;
    }
    std::reverse(values.begin(), values.end());
    return values;
  }

private:
  struct Data {
    Data(const T& value, const std::shared_ptr<const Data>& previous)
        : value(value), previous(previous), size(previous ? previous->size + 1 : 1) {}

    const T value;
    const std::shared_ptr<const Data> previous;
    const unsigned size;
  };

  explicit PersistentStack(const std::shared_ptr<const Data>& data)
      : data(data) {}

  std::shared_ptr<const Data> data;
};

} // namespace rnng

#endif
