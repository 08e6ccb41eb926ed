#ifndef ELEMENT_H
#define ELEMENT_H

#include <iostream>
#include <string>
#include <boost/variant.hpp>

struct RootUnit {};

struct TokenUnit {
  unsigned wid;
  std::string form;
};

struct NonterminalUnit {
  unsigned nid;
  std::string label;
};

// A constituent closed by a reduce action.
struct SubtreeUnit {
  unsigned nid;
  std::string label;
};

bool operator==(const RootUnit& x, const RootUnit& y);
bool operator==(const TokenUnit& x, const TokenUnit& y);
bool operator==(const NonterminalUnit& x, const NonterminalUnit& y);
bool operator==(const SubtreeUnit& x, const SubtreeUnit& y);

class Element {
public:
  // Order matches the bounded types of payload_t.
  enum Kind { kRoot, kToken, kNonterminal, kSubtree };

  typedef boost::variant<RootUnit, TokenUnit, NonterminalUnit, SubtreeUnit> payload_t;

  Element() : payload(RootUnit()) {}

  static Element root();
  static Element token(unsigned wid, const std::string& form);
  static Element nonterminal(unsigned nid, const std::string& label);
  static Element subtree(unsigned nid, const std::string& label);

  Kind kind() const { return static_cast<Kind>(payload.which()); }
  bool is_root() const { return kind() == kRoot; }
  bool is_token() const { return kind() == kToken; }
  bool is_nonterminal() const { return kind() == kNonterminal; }
  bool is_subtree() const { return kind() == kSubtree; }

  // Throw boost::bad_get when the element is of another kind.
  const TokenUnit& as_token() const;
  const NonterminalUnit& as_nonterminal() const;
  const SubtreeUnit& as_subtree() const;

  std::string str() const;

  friend bool operator==(const Element& x, const Element& y) { return x.payload == y.payload; }
  friend bool operator!=(const Element& x, const Element& y) { return !(x.payload == y.payload); }

private:
  template <typename Unit>
  explicit Element(const Unit& unit) : payload(unit) {}

  payload_t payload;
};

std::ostream& operator<<(std::ostream& os, const Element& element);

#endif  //  end for ELEMENT_H
