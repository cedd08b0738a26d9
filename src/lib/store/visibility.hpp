#pragma once

#include <initializer_list>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace cardex {

/**
 * The set of visibility labels a reader is entitled to see
 */
class Authorizations {
 public:
  Authorizations() = default;
  Authorizations(std::initializer_list<std::string> labels);
  explicit Authorizations(std::set<std::string> labels);

  bool contains(const std::string& label) const;
  bool empty() const;

  const std::set<std::string>& labels() const;

  bool operator==(const Authorizations& rhs) const;
  bool operator!=(const Authorizations& rhs) const;

  size_t hash() const;

 private:
  std::set<std::string> _labels;
};

std::ostream& operator<<(std::ostream& stream, const Authorizations& authorizations);

/**
 * Access-control tag attached to a stored increment. Either empty (visible to everyone), a single label, or a boolean
 * expression over labels using '&', '|' and parentheses, e.g., "admin|(audit&eu)". '&' and '|' may not be mixed on
 * the same nesting level.
 */
class ColumnVisibility {
 public:
  ColumnVisibility() = default;
  explicit ColumnVisibility(const std::string& expression);

  bool evaluate(const Authorizations& authorizations) const;

  bool empty() const;
  const std::string& expression() const;

  bool operator==(const ColumnVisibility& rhs) const;

 private:
  struct Node {
    enum class Type { Label, And, Or };

    Type type{Type::Label};
    std::string label;
    std::vector<Node> children;
  };

  class Parser;

  static bool _evaluate(const Node& node, const Authorizations& authorizations);

  std::string _expression;
  std::vector<Node> _root;  // Empty for the empty expression, exactly one node otherwise
};

}  // namespace cardex
