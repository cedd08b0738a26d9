#include "visibility.hpp"

#include <cctype>
#include <utility>

#include "boost/container_hash/hash.hpp"

#include "utils/assert.hpp"

namespace cardex {

Authorizations::Authorizations(std::initializer_list<std::string> labels) : _labels(labels) {}

Authorizations::Authorizations(std::set<std::string> labels) : _labels(std::move(labels)) {}

bool Authorizations::contains(const std::string& label) const { return _labels.count(label) > 0; }

bool Authorizations::empty() const { return _labels.empty(); }

const std::set<std::string>& Authorizations::labels() const { return _labels; }

bool Authorizations::operator==(const Authorizations& rhs) const { return _labels == rhs._labels; }

bool Authorizations::operator!=(const Authorizations& rhs) const { return !operator==(rhs); }

size_t Authorizations::hash() const { return boost::hash_range(_labels.begin(), _labels.end()); }

std::ostream& operator<<(std::ostream& stream, const Authorizations& authorizations) {
  stream << "{";
  auto first = true;
  for (const auto& label : authorizations.labels()) {
    if (!first) stream << ",";
    stream << label;
    first = false;
  }
  return stream << "}";
}

class ColumnVisibility::Parser {
 public:
  explicit Parser(const std::string& expression) : _expression(expression) {}

  Node parse() {
    auto node = _parse_expression();
    AssertInput(_position == _expression.size(), "Unexpected '" + std::string(1, _expression[_position]) +
                                                     "' in visibility expression '" + _expression + "'");
    return node;
  }

 private:
  Node _parse_expression() {
    auto first = _parse_term();
    if (_at_end() || _peek() == ')') return first;

    const auto op = _peek();
    AssertInput(op == '&' || op == '|', "Expected '&' or '|' in visibility expression '" + _expression + "'");

    Node node;
    node.type = op == '&' ? Node::Type::And : Node::Type::Or;
    node.children.emplace_back(std::move(first));

    while (!_at_end() && _peek() != ')') {
      AssertInput(_peek() == op, "Cannot mix '&' and '|' without parentheses in visibility expression '" +
                                     _expression + "'");
      ++_position;
      node.children.emplace_back(_parse_term());
    }

    return node;
  }

  Node _parse_term() {
    AssertInput(!_at_end(), "Unexpected end of visibility expression '" + _expression + "'");

    if (_peek() == '(') {
      ++_position;
      auto node = _parse_expression();
      AssertInput(!_at_end() && _peek() == ')', "Missing ')' in visibility expression '" + _expression + "'");
      ++_position;
      return node;
    }

    const auto begin = _position;
    while (!_at_end() && _is_label_char(_peek())) ++_position;
    AssertInput(_position > begin, "Expected label in visibility expression '" + _expression + "'");

    Node node;
    node.label = _expression.substr(begin, _position - begin);
    return node;
  }

  static bool _is_label_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':' || c == '.' || c == '/';
  }

  bool _at_end() const { return _position >= _expression.size(); }
  char _peek() const { return _expression[_position]; }

  const std::string& _expression;
  size_t _position{0};
};

ColumnVisibility::ColumnVisibility(const std::string& expression) : _expression(expression) {
  if (!_expression.empty()) {
    _root.emplace_back(Parser{_expression}.parse());
  }
}

bool ColumnVisibility::evaluate(const Authorizations& authorizations) const {
  if (_root.empty()) return true;
  return _evaluate(_root.front(), authorizations);
}

bool ColumnVisibility::empty() const { return _root.empty(); }

const std::string& ColumnVisibility::expression() const { return _expression; }

bool ColumnVisibility::operator==(const ColumnVisibility& rhs) const { return _expression == rhs._expression; }

bool ColumnVisibility::_evaluate(const Node& node, const Authorizations& authorizations) {
  switch (node.type) {
    case Node::Type::Label:
      return authorizations.contains(node.label);
    case Node::Type::And:
      for (const auto& child : node.children) {
        if (!_evaluate(child, authorizations)) return false;
      }
      return true;
    case Node::Type::Or:
      for (const auto& child : node.children) {
        if (_evaluate(child, authorizations)) return true;
      }
      return false;
  }
  Fail("Unhandled visibility node type");
}

}  // namespace cardex
