#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gridrun::matrix {

using Value = core::json::Value;

// One named axis of variation. Values keep declaration order.
struct Dimension {
  std::string name;
  std::vector<Value> values;
};

// One `key: value` pair of a rule or combination.
struct MatrixField {
  std::string key;
  Value value;
};

// Partial assignment. A candidate is removed when it equals the rule on every
// key the rule names; unnamed dimensions are wildcards.
struct ExcludeRule {
  std::vector<MatrixField> fields;
};

// Partial assignment plus extra fields. Keys naming a declared dimension are
// match criteria; every other key is an extra field merged into matches.
struct IncludeRule {
  std::vector<MatrixField> fields;
};

struct MatrixSpec {
  std::vector<Dimension> dimensions;
  std::vector<ExcludeRule> excludes;
  std::vector<IncludeRule> includes;
};

// One resolved job configuration: dimension values in declaration order, then
// extra fields in first-merge order. `synthesized` marks combinations added by
// an include rule that matched nothing; those may lack some dimensions.
struct Combination {
  std::vector<MatrixField> entries;
  bool synthesized = false;

  const Value* Find(std::string_view key) const;

  // Overwrites an existing entry in place or appends a new one.
  void Set(const std::string& key, Value value);

  // Object view used as the `matrix` expression context.
  Value ToObject() const;
};

enum class DiagnosticKind {
  kUnresolvableDimensionValue,
  kDuplicateDimensionValue,
  kEmptyDimension,
};

// Non-fatal resolution finding. Resolution never fails; unknown references
// degrade to "no match" and are reported here.
struct ResolutionDiagnostic {
  DiagnosticKind kind = DiagnosticKind::kUnresolvableDimensionValue;
  std::string source;
  std::string message;
};

struct ResolvedMatrix {
  std::vector<Combination> combinations;
  std::vector<ResolutionDiagnostic> diagnostics;
};

const char* ToString(DiagnosticKind kind);

// Expands the cross-product, applies every exclude rule, then every include
// rule in declaration order.
//
// Contract:
// - enumeration is outer-to-inner by dimension order, innermost fastest;
// - zero dimensions yield one empty combination, an empty dimension yields none;
// - include rules match only cross-product survivors, never combinations
//   synthesized by earlier include rules;
// - a later include overrides fields merged by an earlier one.
ResolvedMatrix ResolveMatrix(const std::vector<Dimension>& dimensions,
                             const std::vector<ExcludeRule>& excludes,
                             const std::vector<IncludeRule>& includes);

ResolvedMatrix ResolveMatrix(const MatrixSpec& spec);

// `ubuntu, 3.12` style rendering used in job display names.
std::string DescribeCombination(const Combination& combination);

} // namespace gridrun::matrix
