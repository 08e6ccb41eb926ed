#include "element.h"

namespace {

struct ElementPrinter : public boost::static_visitor<std::string> {
  std::string operator()(const RootUnit&) const { return "Root"; }
  std::string operator()(const TokenUnit& u) const { return u.form; }
  std::string operator()(const NonterminalUnit& u) const { return "(" + u.label; }
  std::string operator()(const SubtreeUnit& u) const { return "(" + u.label + ")"; }
};

}

bool operator==(const RootUnit& x, const RootUnit& y) {
  return true;
}

bool operator==(const TokenUnit& x, const TokenUnit& y) {
  return x.wid == y.wid && x.form == y.form;
}

bool operator==(const NonterminalUnit& x, const NonterminalUnit& y) {
  return x.nid == y.nid && x.label == y.label;
}

bool operator==(const SubtreeUnit& x, const SubtreeUnit& y) {
  return x.nid == y.nid && x.label == y.label;
}

Element Element::root() {
  return Element(RootUnit());
}

Element Element::token(unsigned wid, const std::string& form) {
  TokenUnit unit;
  unit.wid = wid;
  unit.form = form;
  return Element(unit);
}

Element Element::nonterminal(unsigned nid, const std::string& label) {
  NonterminalUnit unit;
  unit.nid = nid;
  unit.label = label;
  return Element(unit);
}

Element Element::subtree(unsigned nid, const std::string& label) {
  SubtreeUnit unit;
  unit.nid = nid;
  unit.label = label;
  return Element(unit);
}

const TokenUnit& Element::as_token() const {
  return boost::get<TokenUnit>(payload);
}

const NonterminalUnit& Element::as_nonterminal() const {
  return boost::get<NonterminalUnit>(payload);
}

const SubtreeUnit& Element::as_subtree() const {
  return boost::get<SubtreeUnit>(payload);
}

std::string Element::str() const {
  return boost::apply_visitor(ElementPrinter(), payload);
}

std::ostream& operator<<(std::ostream& os, const Element& element) {
  return os << element.str();
}
