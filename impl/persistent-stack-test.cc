#include <assert.h>
#include <iostream>
#include <vector>

#include "rnng/errors.h"
#include "rnng/persistent-stack.h"

using namespace std;
using namespace rnng;

int main() {
  PersistentStack<int> empty;
  assert(empty.empty());
  assert(empty.size() == 0);

  PersistentStack<int> a = empty.push_back(1).push_back(2);
  PersistentStack<int> b = a.push_back(3);
  PersistentStack<int> c = a.pop_back().push_back(4);

  // forks share their prefix and never see each other's pushes
  assert(a.size() == 2 && a.back() == 2);
  assert(b.size() == 3 && b.back() == 3);
  assert(c.size() == 2 && c.back() == 4);
  assert(b.values() == vector<int>({1, 2, 3}));
  assert(c.values() == vector<int>({1, 4}));
  assert(b.values(2) == vector<int>({2, 3}));
  assert(b.values(0).empty());

  PersistentStack<int> d(vector<int>{5, 6, 7});
  assert(d.back() == 7);
  assert(d.values() == vector<int>({5, 6, 7}));

  bool thrown = false;
  try {
    empty.back();
  } catch (EmptyStructureError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    empty.pop_back();
  } catch (EmptyStructureError&) {
    thrown = true;
  }
  assert(thrown);

  cerr << "persistent-stack-test passed" << endl;
  return 0;
}
