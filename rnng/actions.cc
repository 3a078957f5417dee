#include "rnng/actions.h"

#include "rnng/errors.h"

using namespace std;

namespace rnng {

unsigned Action::index() const {
  switch (type) {
    case ActionType::kShift:
      return kShiftIndex;
    case ActionType::kGen:
      return kGenIndex;
    case ActionType::kReduce:
      return kReduceIndex;
    case ActionType::kOpen:
      return kOpenIndex;
    default:
      BOOST_THROW_EXCEPTION(IllegalActionError("the sentinel action has no index"));
  }
}

int Action::code() const {
  switch (type) {
    case ActionType::kNone:
      return -1;
    case ActionType::kOpen:
      return 2 + id;
    default:
      return (int) index();
  }
}

string Action::to_string() const {
  switch (type) {
    case ActionType::kShift:
      return "SHIFT";
    case ActionType::kReduce:
      return "REDUCE";
    case ActionType::kOpen:
      return "NT(" + symbol + ")";
    case ActionType::kGen:
      return "GEN(" + symbol + ")";
    default:
      return "EMPTY";
  }
}

ostream& operator<<(ostream& os, const Action& action) {
  return os << action.to_string();
}

bool parse_action_token(const string& token, ActionType* type, string* symbol) {
  symbol->clear();
  if (token == "SHIFT") {
    *type = ActionType::kShift;
    return true;
  }
  if (token == "REDUCE") {
    *type = ActionType::kReduce;
    return true;
  }
  // NT(X) or GEN(w); the symbol itself may contain parentheses
  if (token.size() < 4 || token.back() != ')') return false;
  if (token.compare(0, 3, "NT(") == 0) {
    *type = ActionType::kOpen;
    *symbol = token.substr(3, token.size() - 4);
  } else if (token.compare(0, 4, "GEN(") == 0) {
    *type = ActionType::kGen;
    *symbol = token.substr(4, token.size() - 5);
  } else {
    return false;
  }
  return !symbol->empty();
}

vector<int> action_codes(const vector<Action>& actions) {
  vector<int> codes;
  codes.reserve(actions.size());
  for (const Action& action : actions)
    codes.push_back(action.code());
  return codes;
}

} // namespace rnng
