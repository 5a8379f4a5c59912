#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/record.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace shotimport::core {

/// A stage payload that passed its contract. Only ContractValidator can create one, so anything
/// stored in ImportSession stage data has been through the gate.
class ValidatedPayload {
 public:
  [[nodiscard]] const std::string& contract() const noexcept { return contract_; }
  [[nodiscard]] std::uint32_t version() const noexcept { return version_; }
  [[nodiscard]] const StagePayload& value() const noexcept { return value_; }

  template <typename T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&value_);
  }

 private:
  friend class ContractValidator;

  ValidatedPayload(std::string contract, std::uint32_t version, StagePayload value)
      : contract_(std::move(contract)), version_(version), value_(std::move(value)) {}

  std::string contract_;
  std::uint32_t version_;
  StagePayload value_;
};

/// Structural, total validation of records against an injected, immutable contract list.
/// validate() is pure: no logging, no state; the first violation found is reported.
/// Thread-safety: const after construction; safe to share between threads.
class ContractValidator {
 public:
  explicit ContractValidator(std::vector<StageContract> contracts);

  /// Checks `record` against the stage contract `contract_name` and decodes it.
  /// Fails with ErrorCode::ContractViolation (contract, field path, reason) on unknown contract,
  /// non-stage contract, missing/mismatched schema_version, missing required field, unknown field,
  /// wrong type, enum miss, out-of-range or non-finite value.
  [[nodiscard]] std::expected<ValidatedPayload, ImportError> validate(
      std::string_view contract_name,
      const Record& record) const;

  [[nodiscard]] const StageContract* find(std::string_view contract_name) const noexcept;

  [[nodiscard]] const std::vector<StageContract>& contracts() const noexcept {
    return contracts_;
  }

 private:
  [[nodiscard]] std::expected<void, ImportError> check_record(const StageContract& contract,
                                                              const Record& record,
                                                              const std::string& root,
                                                              const std::string& path,
                                                              int depth) const;

  [[nodiscard]] std::expected<void, ImportError> check_field(const FieldRule& rule,
                                                             const Record::Value& value,
                                                             const std::string& root,
                                                             const std::string& path,
                                                             int depth) const;

  std::vector<StageContract> contracts_;
};

}  // namespace shotimport::core
