#include "conditions/condition_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <limits>
#include <system_error>
#include <utility>

namespace gridrun::conditions {

namespace {

using Kind = ExpressionNode::Kind;

constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool LooseEquals(const Value& lhs, const Value& rhs) {
  if (lhs.type == rhs.type) {
    switch (lhs.type) {
    case Value::Type::kString:
      return ToLower(lhs.string_value) == ToLower(rhs.string_value);
    case Value::Type::kNumber:
      return lhs.number_value == rhs.number_value;
    default:
      return core::json::Equals(lhs, rhs);
    }
  }
  const double left = ToNumber(lhs);
  const double right = ToNumber(rhs);
  return !std::isnan(left) && !std::isnan(right) && left == right;
}

// Ordering for <, <=, >, >=. Returns false when the operands are not
// comparable (NaN on either side).
bool Order(const Value& lhs, const Value& rhs, int& sign) {
  if (lhs.type == Value::Type::kString && rhs.type == Value::Type::kString) {
    const std::string left = ToLower(lhs.string_value);
    const std::string right = ToLower(rhs.string_value);
    sign = left < right ? -1 : (left == right ? 0 : 1);
    return true;
  }
  const double left = ToNumber(lhs);
  const double right = ToNumber(rhs);
  if (std::isnan(left) || std::isnan(right)) {
    return false;
  }
  sign = left < right ? -1 : (left == right ? 0 : 1);
  return true;
}

std::string DescribePath(const ExpressionNode& node) {
  switch (node.kind) {
  case Kind::kContext:
    return node.name;
  case Kind::kProperty:
    return DescribePath(node.children[0]) + "." + node.name;
  case Kind::kIndex:
    return DescribePath(node.children[0]) + "[...]";
  default:
    return "<expression>";
  }
}

class Evaluator {
public:
  explicit Evaluator(const EvaluationContext& context) : context_(context) {}

  bool Evaluate(const ExpressionNode& node, Value& result, std::string& error) {
    switch (node.kind) {
    case Kind::kLiteral:
      result = node.literal;
      return true;
    case Kind::kContext:
      return ResolveContext(node.name, result, error);
    case Kind::kProperty:
      return EvaluateProperty(node, result, error);
    case Kind::kIndex:
      return EvaluateIndex(node, result, error);
    case Kind::kNot: {
      Value operand;
      if (!Evaluate(node.children[0], operand, error)) {
        return false;
      }
      result = core::json::MakeBool(!IsTruthy(operand));
      return true;
    }
    case Kind::kAnd:
    case Kind::kOr: {
      Value lhs;
      if (!Evaluate(node.children[0], lhs, error)) {
        return false;
      }
      const bool decided = node.kind == Kind::kAnd ? !IsTruthy(lhs) : IsTruthy(lhs);
      if (decided) {
        result = std::move(lhs);
        return true;
      }
      return Evaluate(node.children[1], result, error);
    }
    case Kind::kCompare:
      return EvaluateCompare(node, result, error);
    case Kind::kCall:
      return EvaluateCall(node, result, error);
    }
    error = "unsupported expression node";
    return false;
  }

private:
  bool ResolveContext(const std::string& name, Value& result, std::string& error) const {
    if (name == "matrix") {
      result = context_.matrix;
      return true;
    }
    if (name == "inputs") {
      result = context_.inputs;
      return true;
    }
    if (name == "env") {
      result = core::json::MakeObject();
      for (const auto& [key, value] : context_.env) {
        result.Set(key, core::json::MakeString(value));
      }
      return true;
    }
    if (name == "steps") {
      result = core::json::MakeObject();
      for (const auto& [id, record] : context_.steps) {
        Value step = core::json::MakeObject();
        step.Set("outcome", core::json::MakeString(record.outcome));
        step.Set("conclusion", core::json::MakeString(record.conclusion));
        result.Set(id, std::move(step));
      }
      return true;
    }
    if (name == "runner") {
      result = core::json::MakeObject();
      result.Set("os", core::json::MakeString(context_.runner_os));
      result.Set("arch", core::json::MakeString(context_.runner_arch));
      result.Set("name", core::json::MakeString(context_.runner_name));
      return true;
    }
    if (name == "job") {
      result = core::json::MakeObject();
      result.Set("status", core::json::MakeString(JobStatusText(context_)));
      return true;
    }
    error = "unknown context '" + name +
            "' (expected matrix, steps, runner, env, job or inputs)";
    return false;
  }

  bool Missing(const ExpressionNode& node, Value& result, std::string& error) const {
    if (context_.strict) {
      error = "undefined reference '" + DescribePath(node) + "'";
      return false;
    }
    result = Value{};
    return true;
  }

  bool EvaluateProperty(const ExpressionNode& node, Value& result, std::string& error) {
    Value object;
    if (!Evaluate(node.children[0], object, error)) {
      return false;
    }
    const Value* member = object.Find(node.name);
    if (member == nullptr) {
      return Missing(node, result, error);
    }
    result = *member;
    return true;
  }

  bool EvaluateIndex(const ExpressionNode& node, Value& result, std::string& error) {
    Value object;
    if (!Evaluate(node.children[0], object, error)) {
      return false;
    }
    Value index;
    if (!Evaluate(node.children[1], index, error)) {
      return false;
    }

    if (object.IsArray() && index.IsNumber() && index.number_value >= 0.0 &&
        std::floor(index.number_value) == index.number_value &&
        index.number_value < static_cast<double>(object.array_value.size())) {
      result = object.array_value[static_cast<std::size_t>(index.number_value)];
      return true;
    }
    if (object.IsObject()) {
      if (const Value* member = object.Find(ToText(index)); member != nullptr) {
        result = *member;
        return true;
      }
    }
    return Missing(node, result, error);
  }

  bool EvaluateCompare(const ExpressionNode& node, Value& result, std::string& error) {
    Value lhs;
    Value rhs;
    if (!Evaluate(node.children[0], lhs, error) || !Evaluate(node.children[1], rhs, error)) {
      return false;
    }

    const std::string& op = node.name;
    if (op == "==" || op == "!=") {
      const bool equal = LooseEquals(lhs, rhs);
      result = core::json::MakeBool(op == "==" ? equal : !equal);
      return true;
    }

    int sign = 0;
    if (!Order(lhs, rhs, sign)) {
      result = core::json::MakeBool(false);
      return true;
    }
    bool holds = false;
    if (op == "<") {
      holds = sign < 0;
    } else if (op == "<=") {
      holds = sign <= 0;
    } else if (op == ">") {
      holds = sign > 0;
    } else if (op == ">=") {
      holds = sign >= 0;
    } else {
      error = "unknown comparison operator '" + op + "'";
      return false;
    }
    result = core::json::MakeBool(holds);
    return true;
  }

  bool RequireArity(const ExpressionNode& node, std::size_t min_args, std::size_t max_args,
                    std::string& error) const {
    const std::size_t count = node.children.size();
    if (count >= min_args && count <= max_args) {
      return true;
    }
    std::string expected;
    if (max_args == kUnbounded) {
      expected = "at least " + std::to_string(min_args);
    } else if (min_args == max_args) {
      expected = std::to_string(min_args);
    } else {
      expected = std::to_string(min_args) + ".." + std::to_string(max_args);
    }
    error = node.name + "() expects " + expected + " argument(s), got " + std::to_string(count);
    return false;
  }

  bool EvaluateArguments(const ExpressionNode& node, std::vector<Value>& args,
                         std::string& error) {
    args.clear();
    for (const auto& child : node.children) {
      Value arg;
      if (!Evaluate(child, arg, error)) {
        return false;
      }
      args.push_back(std::move(arg));
    }
    return true;
  }

  bool EvaluateCall(const ExpressionNode& node, Value& result, std::string& error) {
    const std::string& name = node.name;

    if (name == "success" || name == "failure" || name == "always" || name == "cancelled") {
      if (!RequireArity(node, 0, 0, error)) {
        return false;
      }
      bool status = true;
      if (name == "success") {
        status = !context_.job_failed && !context_.cancelled;
      } else if (name == "failure") {
        status = context_.job_failed;
      } else if (name == "cancelled") {
        status = context_.cancelled;
      }
      result = core::json::MakeBool(status);
      return true;
    }

    std::vector<Value> args;
    if (name == "contains" || name == "startsWith" || name == "endsWith") {
      if (!RequireArity(node, 2, 2, error) || !EvaluateArguments(node, args, error)) {
        return false;
      }
      if (name == "contains" && args[0].IsArray()) {
        const bool found = std::any_of(args[0].array_value.begin(), args[0].array_value.end(),
                                       [&args](const Value& item) {
                                         return LooseEquals(item, args[1]);
                                       });
        result = core::json::MakeBool(found);
        return true;
      }
      const std::string haystack = ToLower(ToText(args[0]));
      const std::string needle = ToLower(ToText(args[1]));
      bool holds = false;
      if (name == "contains") {
        holds = haystack.find(needle) != std::string::npos;
      } else if (name == "startsWith") {
        holds = haystack.compare(0, needle.size(), needle) == 0 && haystack.size() >= needle.size();
      } else {
        holds = haystack.size() >= needle.size() &&
                haystack.compare(haystack.size() - needle.size(), needle.size(), needle) == 0;
      }
      result = core::json::MakeBool(holds);
      return true;
    }

    if (name == "format") {
      if (!RequireArity(node, 1, kUnbounded, error) || !EvaluateArguments(node, args, error)) {
        return false;
      }
      std::string formatted;
      if (!Format(ToText(args[0]), args, formatted, error)) {
        return false;
      }
      result = core::json::MakeString(std::move(formatted));
      return true;
    }

    if (name == "toJSON") {
      if (!RequireArity(node, 1, 1, error) || !EvaluateArguments(node, args, error)) {
        return false;
      }
      result = core::json::MakeString(core::json::Serialize(args[0]));
      return true;
    }

    error = "unknown function '" + name + "()'";
    return false;
  }

  // `{N}` placeholders refer to args[N + 1]; `{{` and `}}` are literal braces.
  static bool Format(const std::string& pattern, const std::vector<Value>& args,
                     std::string& output, std::string& error) {
    output.clear();
    for (std::size_t i = 0; i < pattern.size(); ++i) {
      const char c = pattern[i];
      if (c == '{' && i + 1 < pattern.size() && pattern[i + 1] == '{') {
        output.push_back('{');
        ++i;
        continue;
      }
      if (c == '}' && i + 1 < pattern.size() && pattern[i + 1] == '}') {
        output.push_back('}');
        ++i;
        continue;
      }
      if (c != '{') {
        output.push_back(c);
        continue;
      }
      const std::size_t close = pattern.find('}', i);
      if (close == std::string::npos || close == i + 1) {
        error = "format() pattern has an unterminated placeholder";
        return false;
      }
      const std::string digits = pattern.substr(i + 1, close - i - 1);
      if (!std::all_of(digits.begin(), digits.end(),
                       [](unsigned char d) { return std::isdigit(d) != 0; })) {
        error = "format() placeholder '{" + digits + "}' is not an index";
        return false;
      }
      // args[0] is the pattern itself; placeholder N reads args[N + 1].
      std::size_t index = 0;
      const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
      if (ec != std::errc() || end != digits.data() + digits.size() || index >= args.size() - 1U) {
        error = "format() placeholder '{" + digits + "}' has no matching argument";
        return false;
      }
      output += ToText(args[index + 1U]);
      i = close;
    }
    return true;
  }

  const EvaluationContext& context_;
};

} // namespace

std::string JobStatusText(const EvaluationContext& context) {
  if (context.cancelled) {
    return "cancelled";
  }
  return context.job_failed ? "failure" : "success";
}

bool EvaluateExpression(const ExpressionNode& root, const EvaluationContext& context,
                        Value& result, std::string& error) {
  Evaluator evaluator(context);
  return evaluator.Evaluate(root, result, error);
}

bool EvaluateCondition(std::string_view condition, const EvaluationContext& context,
                       bool& result, std::string& error) {
  ExpressionNode root;
  if (!ParseExpression(condition, root, error)) {
    return false;
  }
  Value value;
  if (!EvaluateExpression(root, context, value, error)) {
    return false;
  }
  result = IsTruthy(value);
  return true;
}

namespace {

// Position of the `}}` closing an expression that starts at `from`. Braces
// inside '...' literals (with '' as an escaped quote) do not close it.
std::size_t FindExpressionEnd(std::string_view text, std::size_t from) {
  bool in_literal = false;
  for (std::size_t i = from; i < text.size(); ++i) {
    if (text[i] == '\'') {
      if (in_literal && i + 1 < text.size() && text[i + 1] == '\'') {
        ++i;
      } else {
        in_literal = !in_literal;
      }
      continue;
    }
    if (!in_literal && text[i] == '}' && i + 1 < text.size() && text[i + 1] == '}') {
      return i;
    }
  }
  return std::string_view::npos;
}

} // namespace

bool Interpolate(std::string_view text, const EvaluationContext& context, std::string& output,
                 std::string& error) {
  output.clear();
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find("${{", pos);
    if (open == std::string_view::npos) {
      output.append(text.substr(pos));
      break;
    }
    output.append(text.substr(pos, open - pos));

    const std::size_t close = FindExpressionEnd(text, open + 3);
    if (close == std::string_view::npos) {
      error = "unterminated '${{' in '" + std::string(text) + "'";
      return false;
    }

    ExpressionNode root;
    if (!ParseExpression(text.substr(open + 3, close - open - 3), root, error)) {
      return false;
    }
    Value value;
    if (!EvaluateExpression(root, context, value, error)) {
      return false;
    }
    output += ToText(value);
    pos = close + 2;
  }
  return true;
}

const char* ToString(GateReason reason) {
  switch (reason) {
  case GateReason::kRun:
    return "run";
  case GateReason::kConditionFalse:
    return "condition";
  case GateReason::kPriorFailure:
    return "prior_failure";
  case GateReason::kCancelled:
    return "cancelled";
  case GateReason::kConditionError:
    return "condition_error";
  }
  return "unknown";
}

StepGate EvaluateStepGate(const std::optional<std::string>& condition,
                          const EvaluationContext& context) {
  StepGate gate;
  const bool healthy = !context.job_failed && !context.cancelled;
  const GateReason unhealthy_reason =
      context.cancelled ? GateReason::kCancelled : GateReason::kPriorFailure;

  const bool has_condition =
      condition.has_value() &&
      std::any_of(condition->begin(), condition->end(),
                  [](unsigned char c) { return std::isspace(c) == 0; });
  if (!has_condition) {
    gate.run = healthy;
    gate.reason = healthy ? GateReason::kRun : unhealthy_reason;
    return gate;
  }

  ExpressionNode root;
  std::string error;
  if (!ParseExpression(condition.value(), root, error)) {
    gate.reason = GateReason::kConditionError;
    gate.diagnostic = error;
    return gate;
  }

  // Implicit success() guard unless the condition opts out by calling a
  // status function itself.
  if (!UsesStatusFunction(root) && !healthy) {
    gate.reason = unhealthy_reason;
    return gate;
  }

  Value value;
  if (!EvaluateExpression(root, context, value, error)) {
    gate.reason = GateReason::kConditionError;
    gate.diagnostic = error;
    return gate;
  }

  gate.run = IsTruthy(value);
  gate.reason = gate.run ? GateReason::kRun : GateReason::kConditionFalse;
  return gate;
}

} // namespace gridrun::conditions
