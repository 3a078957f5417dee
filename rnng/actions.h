#ifndef RNNG_ACTIONS_H_
#define RNNG_ACTIONS_H_

#include <iostream>
#include <string>
#include <vector>

namespace rnng {

enum class ActionType { kNone, kShift, kReduce, kOpen, kGen };

// positions in the scorer's three-way action distribution; SHIFT and GEN
// share a slot since a parser is either discriminative or generative
const unsigned kShiftIndex = 0;
const unsigned kGenIndex = 0;
const unsigned kReduceIndex = 1;
const unsigned kOpenIndex = 2;
const unsigned kNumActionIndices = 3;

// SHIFT, REDUCE, NT(label) or GEN(word). id is the nonterminal id for OPEN and
// the terminal id for GEN, -1 otherwise; symbol holds the matching string.
struct Action {
  Action() : type(ActionType::kNone), id(-1) {}

  Action(ActionType type, int id, const std::string& symbol)
      : type(type), id(id), symbol(symbol) {}

  static Action shift() { return Action(ActionType::kShift, -1, ""); }
  static Action reduce() { return Action(ActionType::kReduce, -1, ""); }
  static Action open(int label, const std::string& symbol) { return Action(ActionType::kOpen, label, symbol); }
  static Action gen(int word, const std::string& symbol) { return Action(ActionType::kGen, word, symbol); }

  bool is_none() const { return type == ActionType::kNone; }

  // slot in the three-way action distribution
  unsigned index() const;

  // dense code over {SHIFT/GEN, REDUCE, NT(0), NT(1), ...}, used to embed
  // the action history and as a hash key for derivations
  int code() const;

  std::string to_string() const;

  bool operator==(const Action& other) const {
    return type == other.type && id == other.id && symbol == other.symbol;
  }

  bool operator!=(const Action& other) const {
    return !(*this == other);
  }

  ActionType type;
  int id;
  std::string symbol;
};

std::ostream& operator<<(std::ostream& os, const Action& action);

// splits an oracle token into its type and symbol without resolving ids:
// "SHIFT", "REDUCE", "NT(X)" or "GEN(w)". returns false if malformed.
bool parse_action_token(const std::string& token, ActionType* type, std::string* symbol);

std::vector<int> action_codes(const std::vector<Action>& actions);

} // namespace rnng

#endif
