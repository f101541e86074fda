#include "matrix/matrix_resolver.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace gridrun::matrix {

namespace {

const Dimension* FindDimension(const std::vector<Dimension>& dimensions, std::string_view name) {
  for (const auto& dimension : dimensions) {
    if (dimension.name == name) {
      return &dimension;
    }
  }
  return nullptr;
}

bool ContainsValue(const std::vector<Value>& values, const Value& needle) {
  return std::any_of(values.begin(), values.end(),
                     [&needle](const Value& value) { return core::json::Equals(value, needle); });
}

// Wildcard match: every listed field must be present on the candidate with an
// equal value.
bool MatchesAll(const std::vector<const MatrixField*>& criteria, const Combination& candidate) {
  for (const MatrixField* field : criteria) {
    const Value* actual = candidate.Find(field->key);
    if (actual == nullptr || !core::json::Equals(*actual, field->value)) {
      return false;
    }
  }
  return true;
}

void AddDiagnostic(ResolvedMatrix& resolved, DiagnosticKind kind, std::string source,
                   std::string message) {
  resolved.diagnostics.push_back(
      {.kind = kind, .source = std::move(source), .message = std::move(message)});
}

// Reports rule fields that cannot match any cross-product value. Matching
// still runs; such fields simply never compare equal.
void ReportUnresolvableFields(const std::vector<Dimension>& dimensions,
                              const std::vector<MatrixField>& fields, const std::string& source,
                              bool extra_keys_allowed, ResolvedMatrix& resolved) {
  for (const auto& field : fields) {
    const Dimension* dimension = FindDimension(dimensions, field.key);
    if (dimension == nullptr) {
      if (!extra_keys_allowed) {
        AddDiagnostic(resolved, DiagnosticKind::kUnresolvableDimensionValue, source,
                      "'" + field.key + "' is not a declared dimension");
      }
      continue;
    }
    if (!ContainsValue(dimension->values, field.value)) {
      AddDiagnostic(resolved, DiagnosticKind::kUnresolvableDimensionValue, source,
                    "value " + core::json::Serialize(field.value) +
                        " is not declared for dimension '" + field.key + "'");
    }
  }
}

std::vector<Dimension> DeduplicateDimensions(const std::vector<Dimension>& dimensions,
                                             ResolvedMatrix& resolved) {
  std::vector<Dimension> unique;
  unique.reserve(dimensions.size());
  for (const auto& dimension : dimensions) {
    Dimension cleaned;
    cleaned.name = dimension.name;
    for (const auto& value : dimension.values) {
      if (ContainsValue(cleaned.values, value)) {
        AddDiagnostic(resolved, DiagnosticKind::kDuplicateDimensionValue, dimension.name,
                      "duplicate value " + core::json::Serialize(value) + " ignored");
        continue;
      }
      cleaned.values.push_back(value);
    }
    if (cleaned.values.empty()) {
      AddDiagnostic(resolved, DiagnosticKind::kEmptyDimension, dimension.name,
                    "dimension has no values; matrix expands to zero combinations");
    }
    unique.push_back(std::move(cleaned));
  }
  return unique;
}

std::vector<Combination> CrossProduct(const std::vector<Dimension>& dimensions) {
  std::vector<Combination> product;
  for (const auto& dimension : dimensions) {
    if (dimension.values.empty()) {
      return product;
    }
  }

  // Odometer over value indices; the last dimension turns fastest.
  std::vector<std::size_t> cursor(dimensions.size(), 0U);
  while (true) {
    Combination combination;
    combination.entries.reserve(dimensions.size());
    for (std::size_t d = 0; d < dimensions.size(); ++d) {
      combination.entries.push_back({dimensions[d].name, dimensions[d].values[cursor[d]]});
    }
    product.push_back(std::move(combination));

    std::size_t d = dimensions.size();
    while (d > 0U) {
      --d;
      if (++cursor[d] < dimensions[d].values.size()) {
        break;
      }
      cursor[d] = 0U;
      if (d == 0U) {
        return product;
      }
    }
    if (dimensions.empty()) {
      return product;
    }
  }
}

} // namespace

const Value* Combination::Find(std::string_view key) const {
  for (const auto& entry : entries) {
    if (entry.key == key) {
      return &entry.value;
    }
  }
  return nullptr;
}

void Combination::Set(const std::string& key, Value value) {
  for (auto& entry : entries) {
    if (entry.key == key) {
      entry.value = std::move(value);
      return;
    }
  }
  entries.push_back({key, std::move(value)});
}

Value Combination::ToObject() const {
  Value object = core::json::MakeObject();
  for (const auto& entry : entries) {
    object.Set(entry.key, entry.value);
  }
  return object;
}

const char* ToString(DiagnosticKind kind) {
  switch (kind) {
  case DiagnosticKind::kUnresolvableDimensionValue:
    return "unresolvable_dimension_value";
  case DiagnosticKind::kDuplicateDimensionValue:
    return "duplicate_dimension_value";
  case DiagnosticKind::kEmptyDimension:
    return "empty_dimension";
  }
  return "unknown";
}

ResolvedMatrix ResolveMatrix(const std::vector<Dimension>& dimensions,
                             const std::vector<ExcludeRule>& excludes,
                             const std::vector<IncludeRule>& includes) {
  ResolvedMatrix resolved;
  const std::vector<Dimension> unique_dimensions = DeduplicateDimensions(dimensions, resolved);

  // Pass 1: exclude rules. Always before includes, whatever the declaration
  // order in the document.
  std::vector<std::vector<const MatrixField*>> exclude_criteria;
  exclude_criteria.reserve(excludes.size());
  for (std::size_t i = 0; i < excludes.size(); ++i) {
    ReportUnresolvableFields(unique_dimensions, excludes[i].fields,
                             "exclude[" + std::to_string(i) + "]",
                             /*extra_keys_allowed=*/false, resolved);
    std::vector<const MatrixField*> criteria;
    for (const auto& field : excludes[i].fields) {
      criteria.push_back(&field);
    }
    exclude_criteria.push_back(std::move(criteria));
  }

  for (auto& candidate : CrossProduct(unique_dimensions)) {
    const bool excluded =
        std::any_of(exclude_criteria.begin(), exclude_criteria.end(),
                    [&candidate](const std::vector<const MatrixField*>& criteria) {
                      return MatchesAll(criteria, candidate);
                    });
    if (!excluded) {
      resolved.combinations.push_back(std::move(candidate));
    }
  }

  // Pass 2: include rules against the survivors only.
  const std::size_t survivor_count = resolved.combinations.size();
  for (std::size_t i = 0; i < includes.size(); ++i) {
    const IncludeRule& rule = includes[i];
    const std::string source = "include[" + std::to_string(i) + "]";

    std::vector<const MatrixField*> criteria;
    std::vector<const MatrixField*> extras;
    for (const auto& field : rule.fields) {
      if (FindDimension(unique_dimensions, field.key) != nullptr) {
        criteria.push_back(&field);
      } else {
        extras.push_back(&field);
      }
    }

    bool matched = false;
    for (std::size_t c = 0; c < survivor_count; ++c) {
      Combination& combination = resolved.combinations[c];
      if (!MatchesAll(criteria, combination)) {
        continue;
      }
      matched = true;
      for (const MatrixField* extra : extras) {
        combination.Set(extra->key, extra->value);
      }
    }

    if (matched) {
      continue;
    }

    ReportUnresolvableFields(unique_dimensions, rule.fields, source,
                             /*extra_keys_allowed=*/true, resolved);
    Combination added;
    added.synthesized = true;
    for (const auto& field : rule.fields) {
      added.Set(field.key, field.value);
    }
    resolved.combinations.push_back(std::move(added));
  }

  return resolved;
}

ResolvedMatrix ResolveMatrix(const MatrixSpec& spec) {
  return ResolveMatrix(spec.dimensions, spec.excludes, spec.includes);
}

std::string DescribeCombination(const Combination& combination) {
  std::string text;
  for (const auto& entry : combination.entries) {
    if (!text.empty()) {
      text += ", ";
    }
    text += core::json::ToDisplayString(entry.value);
  }
  return text;
}

} // namespace gridrun::matrix
