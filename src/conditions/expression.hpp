#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gridrun::conditions {

using Value = core::json::Value;

// Parsed expression tree. Children layout per kind:
// - kLiteral: `literal` holds the value, no children;
// - kContext: `name` is the root context (`matrix`, `steps`, ...);
// - kProperty: children[0] is the object, `name` the member;
// - kIndex: children[0] is the object, children[1] the index expression;
// - kNot: children[0];
// - kAnd/kOr: children[0] and children[1];
// - kCompare: `name` is the operator, children[0] and children[1];
// - kCall: `name` is the function, children are the arguments.
struct ExpressionNode {
  enum class Kind {
    kLiteral,
    kContext,
    kProperty,
    kIndex,
    kNot,
    kAnd,
    kOr,
    kCompare,
    kCall,
  };

  Kind kind = Kind::kLiteral;
  Value literal;
  std::string name;
  std::vector<ExpressionNode> children;
};

// Parses one expression. A surrounding `${{ ... }}` wrapper is accepted.
// Errors carry the column of the offending token.
bool ParseExpression(std::string_view text, ExpressionNode& root, std::string& error);

// True when the tree calls success(), failure(), always() or cancelled().
// Such conditions replace the implicit success() guard.
bool UsesStatusFunction(const ExpressionNode& root);

// Falsy: null, false, 0, NaN and the empty string.
bool IsTruthy(const Value& value);

// Loose numeric coercion used by mixed-type comparisons.
double ToNumber(const Value& value);

// Text form used by interpolation and string functions.
std::string ToText(const Value& value);

} // namespace gridrun::conditions
