#include "conditions/expression.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

namespace gridrun::conditions {

namespace {

enum class TokenType {
  kEnd,
  kIdentifier,
  kString,
  kNumber,
  kLeftParen,
  kRightParen,
  kLeftBracket,
  kRightBracket,
  kDot,
  kComma,
  kNot,
  kAnd,
  kOr,
  kCompare,
};

struct Token {
  TokenType type = TokenType::kEnd;
  std::string text;
  double number = 0.0;
  std::size_t column = 0;
};

bool IsIdentifierStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

std::string_view TrimView(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return raw.substr(begin, end - begin);
}

class Lexer {
public:
  explicit Lexer(std::string_view input) : input_(input) {}

  bool Tokenize(std::vector<Token>& tokens, std::string& error) {
    tokens.clear();
    while (true) {
      SkipWhitespace();
      Token token;
      token.column = pos_ + 1;
      if (AtEnd()) {
        token.type = TokenType::kEnd;
        tokens.push_back(token);
        return true;
      }

      const char c = input_[pos_];
      if (c == '\'') {
        if (!LexString(token, error)) {
          return false;
        }
      } else if (std::isdigit(static_cast<unsigned char>(c)) != 0 ||
                 (c == '-' && pos_ + 1 < input_.size() &&
                  std::isdigit(static_cast<unsigned char>(input_[pos_ + 1])) != 0)) {
        if (!LexNumber(token, error)) {
          return false;
        }
      } else if (IsIdentifierStart(c)) {
        const std::size_t start = pos_;
        while (!AtEnd() && IsIdentifierChar(input_[pos_])) {
          ++pos_;
        }
        token.type = TokenType::kIdentifier;
        token.text = std::string(input_.substr(start, pos_ - start));
      } else if (!LexOperator(token, error)) {
        return false;
      }
      tokens.push_back(std::move(token));
    }
  }

private:
  bool LexString(Token& token, std::string& error) {
    ++pos_;
    token.type = TokenType::kString;
    while (!AtEnd()) {
      const char c = input_[pos_++];
      if (c != '\'') {
        token.text.push_back(c);
        continue;
      }
      // '' inside a literal is an escaped quote.
      if (!AtEnd() && input_[pos_] == '\'') {
        token.text.push_back('\'');
        ++pos_;
        continue;
      }
      return true;
    }
    return Fail(token.column, "unterminated string literal", error);
  }

  bool LexNumber(Token& token, std::string& error) {
    const std::size_t start = pos_;
    if (input_[pos_] == '-') {
      ++pos_;
    }
    while (!AtEnd() && (std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0 ||
                        input_[pos_] == '.')) {
      ++pos_;
    }
    if (!AtEnd() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
      ++pos_;
      if (!AtEnd() && (input_[pos_] == '+' || input_[pos_] == '-')) {
        ++pos_;
      }
      while (!AtEnd() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
        ++pos_;
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    try {
      std::size_t parsed = 0;
      token.number = std::stod(text, &parsed);
      if (parsed != text.size()) {
        return Fail(token.column, "invalid number '" + text + "'", error);
      }
    } catch (const std::exception&) {
      return Fail(token.column, "invalid number '" + text + "'", error);
    }
    token.type = TokenType::kNumber;
    token.text = text;
    return true;
  }

  bool LexOperator(Token& token, std::string& error) {
    const char c = input_[pos_];
    const char next = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
    auto emit = [&](TokenType type, std::size_t width) {
      token.type = type;
      token.text = std::string(input_.substr(pos_, width));
      pos_ += width;
      return true;
    };

    switch (c) {
    case '(':
      return emit(TokenType::kLeftParen, 1);
    case ')':
      return emit(TokenType::kRightParen, 1);
    case '[':
      return emit(TokenType::kLeftBracket, 1);
    case ']':
      return emit(TokenType::kRightBracket, 1);
    case '.':
      return emit(TokenType::kDot, 1);
    case ',':
      return emit(TokenType::kComma, 1);
    case '!':
      if (next == '=') {
        return emit(TokenType::kCompare, 2);
      }
      return emit(TokenType::kNot, 1);
    case '=':
      if (next == '=') {
        return emit(TokenType::kCompare, 2);
      }
      return Fail(token.column, "unexpected '=' (use '==' for comparison)", error);
    case '<':
    case '>':
      return emit(TokenType::kCompare, next == '=' ? 2 : 1);
    case '&':
      if (next == '&') {
        return emit(TokenType::kAnd, 2);
      }
      break;
    case '|':
      if (next == '|') {
        return emit(TokenType::kOr, 2);
      }
      break;
    default:
      break;
    }
    return Fail(token.column, std::string("unexpected character '") + c + "'", error);
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  static bool Fail(std::size_t column, const std::string& message, std::string& error) {
    error = "expression error at col " + std::to_string(column) + ": " + message;
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
};

// Recursive-descent parser. Precedence, lowest first: ||, &&, comparison,
// unary !, postfix property/index access.
class ExpressionParser {
public:
  explicit ExpressionParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  bool Parse(ExpressionNode& root, std::string& error) {
    if (Peek().type == TokenType::kEnd) {
      return Fail(Peek(), "expression is empty", error);
    }
    if (!ParseOr(root, error)) {
      return false;
    }
    if (Peek().type != TokenType::kEnd) {
      return Fail(Peek(), "unexpected token '" + Peek().text + "'", error);
    }
    return true;
  }

private:
  bool ParseOr(ExpressionNode& node, std::string& error) {
    if (!ParseAnd(node, error)) {
      return false;
    }
    while (Peek().type == TokenType::kOr) {
      Next();
      ExpressionNode rhs;
      if (!ParseAnd(rhs, error)) {
        return false;
      }
      node = MakeBinary(ExpressionNode::Kind::kOr, "||", std::move(node), std::move(rhs));
    }
    return true;
  }

  bool ParseAnd(ExpressionNode& node, std::string& error) {
    if (!ParseComparison(node, error)) {
      return false;
    }
    while (Peek().type == TokenType::kAnd) {
      Next();
      ExpressionNode rhs;
      if (!ParseComparison(rhs, error)) {
        return false;
      }
      node = MakeBinary(ExpressionNode::Kind::kAnd, "&&", std::move(node), std::move(rhs));
    }
    return true;
  }

  bool ParseComparison(ExpressionNode& node, std::string& error) {
    if (!ParseUnary(node, error)) {
      return false;
    }
    while (Peek().type == TokenType::kCompare) {
      const std::string op = Next().text;
      ExpressionNode rhs;
      if (!ParseUnary(rhs, error)) {
        return false;
      }
      node = MakeBinary(ExpressionNode::Kind::kCompare, op, std::move(node), std::move(rhs));
    }
    return true;
  }

  bool ParseUnary(ExpressionNode& node, std::string& error) {
    if (Peek().type == TokenType::kNot) {
      Next();
      ExpressionNode operand;
      if (!ParseUnary(operand, error)) {
        return false;
      }
      node = ExpressionNode{};
      node.kind = ExpressionNode::Kind::kNot;
      node.children.push_back(std::move(operand));
      return true;
    }
    return ParsePostfix(node, error);
  }

  bool ParsePostfix(ExpressionNode& node, std::string& error) {
    if (!ParsePrimary(node, error)) {
      return false;
    }
    while (true) {
      if (Peek().type == TokenType::kDot) {
        Next();
        if (Peek().type != TokenType::kIdentifier) {
          return Fail(Peek(), "expected property name after '.'", error);
        }
        ExpressionNode property;
        property.kind = ExpressionNode::Kind::kProperty;
        property.name = Next().text;
        property.children.push_back(std::move(node));
        node = std::move(property);
        continue;
      }
      if (Peek().type == TokenType::kLeftBracket) {
        Next();
        ExpressionNode index;
        if (!ParseOr(index, error)) {
          return false;
        }
        if (Peek().type != TokenType::kRightBracket) {
          return Fail(Peek(), "expected ']'", error);
        }
        Next();
        ExpressionNode access;
        access.kind = ExpressionNode::Kind::kIndex;
        access.children.push_back(std::move(node));
        access.children.push_back(std::move(index));
        node = std::move(access);
        continue;
      }
      return true;
    }
  }

  bool ParsePrimary(ExpressionNode& node, std::string& error) {
    node = ExpressionNode{};
    const Token& token = Peek();
    switch (token.type) {
    case TokenType::kString:
      node.literal = core::json::MakeString(Next().text);
      return true;
    case TokenType::kNumber:
      node.literal = core::json::MakeNumber(Next().number);
      return true;
    case TokenType::kLeftParen: {
      Next();
      if (!ParseOr(node, error)) {
        return false;
      }
      if (Peek().type != TokenType::kRightParen) {
        return Fail(Peek(), "expected ')'", error);
      }
      Next();
      return true;
    }
    case TokenType::kIdentifier:
      return ParseIdentifier(node, error);
    default:
      break;
    }
    if (token.type == TokenType::kEnd) {
      return Fail(token, "unexpected end of expression", error);
    }
    return Fail(token, "unexpected token '" + token.text + "'", error);
  }

  bool ParseIdentifier(ExpressionNode& node, std::string& error) {
    const std::string name = Next().text;
    if (name == "true" || name == "false") {
      node.literal = core::json::MakeBool(name == "true");
      return true;
    }
    if (name == "null") {
      return true;
    }

    if (Peek().type != TokenType::kLeftParen) {
      node.kind = ExpressionNode::Kind::kContext;
      node.name = name;
      return true;
    }

    Next();
    node.kind = ExpressionNode::Kind::kCall;
    node.name = name;
    if (Peek().type == TokenType::kRightParen) {
      Next();
      return true;
    }
    while (true) {
      ExpressionNode argument;
      if (!ParseOr(argument, error)) {
        return false;
      }
      node.children.push_back(std::move(argument));
      if (Peek().type == TokenType::kComma) {
        Next();
        continue;
      }
      if (Peek().type == TokenType::kRightParen) {
        Next();
        return true;
      }
      return Fail(Peek(), "expected ',' or ')' in call to " + name + "()", error);
    }
  }

  static ExpressionNode MakeBinary(ExpressionNode::Kind kind, std::string op, ExpressionNode lhs,
                                   ExpressionNode rhs) {
    ExpressionNode node;
    node.kind = kind;
    node.name = std::move(op);
    node.children.push_back(std::move(lhs));
    node.children.push_back(std::move(rhs));
    return node;
  }

  const Token& Peek() const {
    return tokens_[pos_];
  }

  const Token& Next() {
    const Token& token = tokens_[pos_];
    if (token.type != TokenType::kEnd) {
      ++pos_;
    }
    return token;
  }

  static bool Fail(const Token& token, const std::string& message, std::string& error) {
    error = "expression error at col " + std::to_string(token.column) + ": " + message;
    return false;
  }

  std::vector<Token> tokens_;
  std::size_t pos_ = 0;
};

} // namespace

bool ParseExpression(std::string_view text, ExpressionNode& root, std::string& error) {
  std::string_view body = TrimView(text);
  if (body.size() >= 5U && body.substr(0, 3) == "${{" && body.substr(body.size() - 2) == "}}") {
    body = TrimView(body.substr(3, body.size() - 5));
  }

  std::vector<Token> tokens;
  Lexer lexer(body);
  if (!lexer.Tokenize(tokens, error)) {
    return false;
  }

  root = ExpressionNode{};
  ExpressionParser parser(std::move(tokens));
  return parser.Parse(root, error);
}

bool UsesStatusFunction(const ExpressionNode& root) {
  if (root.kind == ExpressionNode::Kind::kCall &&
      (root.name == "success" || root.name == "failure" || root.name == "always" ||
       root.name == "cancelled")) {
    return true;
  }
  for (const auto& child : root.children) {
    if (UsesStatusFunction(child)) {
      return true;
    }
  }
  return false;
}

bool IsTruthy(const Value& value) {
  switch (value.type) {
  case Value::Type::kNull:
    return false;
  case Value::Type::kBool:
    return value.bool_value;
  case Value::Type::kNumber:
    return value.number_value != 0.0 && !std::isnan(value.number_value);
  case Value::Type::kString:
    return !value.string_value.empty();
  case Value::Type::kArray:
  case Value::Type::kObject:
    return true;
  }
  return false;
}

double ToNumber(const Value& value) {
  switch (value.type) {
  case Value::Type::kNull:
    return 0.0;
  case Value::Type::kBool:
    return value.bool_value ? 1.0 : 0.0;
  case Value::Type::kNumber:
    return value.number_value;
  case Value::Type::kString: {
    const std::string_view trimmed = TrimView(value.string_value);
    if (trimmed.empty()) {
      return 0.0;
    }
    try {
      std::size_t parsed = 0;
      const std::string text(trimmed);
      const double number = std::stod(text, &parsed);
      if (parsed == text.size()) {
        return number;
      }
    } catch (const std::exception&) {
      // not numeric
    }
    return std::numeric_limits<double>::quiet_NaN();
  }
  case Value::Type::kArray:
  case Value::Type::kObject:
    return std::numeric_limits<double>::quiet_NaN();
  }
  return std::numeric_limits<double>::quiet_NaN();
}

std::string ToText(const Value& value) {
  if (value.type == Value::Type::kNull) {
    return "";
  }
  return core::json::ToDisplayString(value);
}

} // namespace gridrun::conditions
