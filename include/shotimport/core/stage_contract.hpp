#pragma once

#include <shotimport/core/record.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shotimport::core {

enum class FieldType : std::uint8_t { Boolean, Integer, Number, String, Image, Object, List };

[[nodiscard]] std::string_view to_string(FieldType type) noexcept;

/// Rule for one field of a contract.
/// min/max bound the value for Integer/Number, the length for String and the size for List.
/// Object fields and List elements are checked against `nested`, another contract by name.
struct FieldRule {
  std::string name;
  FieldType type{FieldType::String};
  bool required{true};
  std::optional<double> min;
  std::optional<double> max;
  bool exclusive_min{false};
  std::vector<std::string> allowed;  // String enum membership; empty = any
  std::string nested;
};

/// Turns a record that passed a stage contract into its typed payload.
using PayloadDecoder = std::function<StagePayload(const Record&)>;

/// A problem found by a whole-record check.
struct FieldIssue {
  std::string field;
  std::string reason;
};

/// Cross-field rule run after every field rule passed; nullopt when the record is consistent.
using RecordCheck = std::function<std::optional<FieldIssue>(const Record&)>;

/// Named, versioned schema. Stage contracts (those with a decoder) require a top-level
/// schema_version field equal to `version`; nested contracts are only used through FieldRule::nested.
struct StageContract {
  std::string name;
  std::uint32_t version{1};
  std::vector<FieldRule> fields;
  PayloadDecoder decoder;
  RecordCheck check;
};

/// The contracts exchanged by the import pipeline, built once at start-up.
[[nodiscard]] std::vector<StageContract> default_contracts();

}  // namespace shotimport::core
