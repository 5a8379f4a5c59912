#include <shotimport/core/contract_validator.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace shotimport::core {

namespace {

constexpr int kMaxDepth = 8;

std::unexpected<ImportError> violation(const std::string& contract,
                                       const std::string& field,
                                       std::string reason) {
  return std::unexpected(ImportError{ErrorCode::ContractViolation, std::move(reason), contract, field});
}

std::string join(const std::string& path, std::string_view name) {
  if (path.empty()) return std::string(name);
  std::string out = path;
  out += '.';
  out += name;
  return out;
}

std::string format_bound(double v) {
  if (v == std::floor(v) && std::fabs(v) < 1e15) {
    return std::to_string(static_cast<long long>(v));
  }
  return std::to_string(v);
}

/// Range check shared by numbers, string lengths and list sizes.
std::expected<void, std::string> check_range(const FieldRule& rule, double v, std::string_view what) {
  if (rule.min) {
    const bool below = rule.exclusive_min ? v <= *rule.min : v < *rule.min;
    if (below) {
      return std::unexpected(std::string(what) + " below minimum " +
                             (rule.exclusive_min ? "(exclusive) " : "") + format_bound(*rule.min));
    }
  }
  if (rule.max && v > *rule.max) {
    return std::unexpected(std::string(what) + " above maximum " + format_bound(*rule.max));
  }
  return {};
}

}  // namespace

ContractValidator::ContractValidator(std::vector<StageContract> contracts)
    : contracts_(std::move(contracts)) {}

const StageContract* ContractValidator::find(std::string_view contract_name) const noexcept {
  auto it = std::find_if(contracts_.begin(), contracts_.end(),
                         [contract_name](const StageContract& c) { return c.name == contract_name; });
  return it == contracts_.end() ? nullptr : &*it;
}

std::expected<ValidatedPayload, ImportError> ContractValidator::validate(
    std::string_view contract_name,
    const Record& record) const {
  const std::string name(contract_name);
  const StageContract* contract = find(contract_name);
  if (!contract) {
    return violation(name, "", "unknown contract");
  }
  if (!contract->decoder) {
    return violation(name, "", "not a stage contract");
  }

  const Record::Value* version = record.find(kSchemaVersionField);
  if (!version) {
    return violation(name, std::string(kSchemaVersionField), "missing required field");
  }
  const auto* v = std::get_if<std::int64_t>(version);
  if (!v) {
    return violation(name, std::string(kSchemaVersionField),
                     "expected integer, got " + std::string(value_type_name(*version)));
  }
  if (*v != static_cast<std::int64_t>(contract->version)) {
    return violation(name, std::string(kSchemaVersionField),
                     "version mismatch: expected " + std::to_string(contract->version) + ", got " +
                         std::to_string(*v));
  }

  auto checked = check_record(*contract, record, name, "", 0);
  if (!checked) {
    return std::unexpected(std::move(checked.error()));
  }
  if (contract->check) {
    if (auto issue = contract->check(record)) {
      return violation(name, issue->field, std::move(issue->reason));
    }
  }
  return ValidatedPayload(name, contract->version, contract->decoder(record));
}

std::expected<void, ImportError> ContractValidator::check_record(const StageContract& contract,
                                                                 const Record& record,
                                                                 const std::string& root,
                                                                 const std::string& path,
                                                                 int depth) const {
  if (depth > kMaxDepth) {
    return violation(root, path, "nesting too deep");
  }

  for (const auto& rule : contract.fields) {
    const Record::Value* value = record.find(rule.name);
    const std::string field_path = join(path, rule.name);
    if (!value) {
      if (rule.required) return violation(root, field_path, "missing required field");
      continue;
    }
    auto ok = check_field(rule, *value, root, field_path, depth);
    if (!ok) return ok;
  }

  // Allow-list: anything the contract does not name is rejected.
  for (const auto& [key, value] : record) {
    const bool known = std::any_of(contract.fields.begin(), contract.fields.end(),
                                   [&key](const FieldRule& r) { return r.name == key; });
    if (!known) {
      return violation(root, join(path, key), "unexpected field");
    }
  }
  return {};
}

std::expected<void, ImportError> ContractValidator::check_field(const FieldRule& rule,
                                                                const Record::Value& value,
                                                                const std::string& root,
                                                                const std::string& path,
                                                                int depth) const {
  const auto wrong_type = [&]() {
    return violation(root, path,
                     "expected " + std::string(to_string(rule.type)) + ", got " +
                         std::string(value_type_name(value)));
  };

  switch (rule.type) {
    case FieldType::Boolean:
      if (!std::holds_alternative<bool>(value)) return wrong_type();
      return {};

    case FieldType::Integer: {
      const auto* v = std::get_if<std::int64_t>(&value);
      if (!v) return wrong_type();
      auto range = check_range(rule, static_cast<double>(*v), "value");
      if (!range) return violation(root, path, std::move(range.error()));
      return {};
    }

    case FieldType::Number: {
      const auto* v = std::get_if<double>(&value);
      if (!v) return wrong_type();
      if (!std::isfinite(*v)) return violation(root, path, "value is not finite");
      auto range = check_range(rule, *v, "value");
      if (!range) return violation(root, path, std::move(range.error()));
      return {};
    }

    case FieldType::String: {
      const auto* v = std::get_if<std::string>(&value);
      if (!v) return wrong_type();
      auto range = check_range(rule, static_cast<double>(v->size()), "length");
      if (!range) return violation(root, path, std::move(range.error()));
      if (!rule.allowed.empty() &&
          std::find(rule.allowed.begin(), rule.allowed.end(), *v) == rule.allowed.end()) {
        return violation(root, path, "value '" + *v + "' not in allowed set");
      }
      return {};
    }

    case FieldType::Image: {
      const auto* v = std::get_if<ImageHandle>(&value);
      if (!v) return wrong_type();
      if (!*v) return violation(root, path, "null image handle");
      if (!(*v)->consistent()) return violation(root, path, "image buffer inconsistent with dimensions");
      return {};
    }

    case FieldType::Object: {
      const auto* v = std::get_if<Record::Object>(&value);
      if (!v) return wrong_type();
      if (!*v) return violation(root, path, "null object");
      const StageContract* nested = find(rule.nested);
      if (!nested) return violation(root, path, "unknown nested contract '" + rule.nested + "'");
      return check_record(*nested, **v, root, path, depth + 1);
    }

    case FieldType::List: {
      const auto* v = std::get_if<Record::List>(&value);
      if (!v) return wrong_type();
      auto range = check_range(rule, static_cast<double>(v->size()), "size");
      if (!range) return violation(root, path, std::move(range.error()));
      const StageContract* nested = find(rule.nested);
      if (!nested) return violation(root, path, "unknown nested contract '" + rule.nested + "'");
      for (std::size_t i = 0; i < v->size(); ++i) {
        auto ok = check_record(*nested, (*v)[i], root, path + "[" + std::to_string(i) + "]", depth + 1);
        if (!ok) return ok;
      }
      return {};
    }
  }
  return wrong_type();
}

}  // namespace shotimport::core
