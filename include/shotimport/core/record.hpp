#pragma once

#include <shotimport/core/image.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shotimport::core {

/// Untyped payload as produced by heuristics and UI collaborators.
/// Nothing built from a Record reaches the session until ContractValidator accepted it.
/// Numbers are strict: integers are std::int64_t, reals are double; the validator does not
/// convert between them.
class Record {
 public:
  using Object = std::shared_ptr<const Record>;
  using List = std::vector<Record>;
  using Value = std::variant<bool, std::int64_t, double, std::string, ImageHandle, Object, List>;

  Record() = default;

  Record& set(std::string key, Value value);
  /// Nests a record (stored as an immutable Object).
  Record& set(std::string key, Record nested);

  bool erase(std::string_view key);

  [[nodiscard]] bool contains(std::string_view key) const;
  [[nodiscard]] const Value* find(std::string_view key) const;

  template <typename T>
  [[nodiscard]] const T* get_if(std::string_view key) const {
    const Value* v = find(key);
    return v ? std::get_if<T>(v) : nullptr;
  }

  /// Nested record at key, or nullptr.
  [[nodiscard]] const Record* object(std::string_view key) const;

  [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
  [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

  [[nodiscard]] auto begin() const noexcept { return fields_.begin(); }
  [[nodiscard]] auto end() const noexcept { return fields_.end(); }

 private:
  std::map<std::string, Value, std::less<>> fields_;
};

/// Name of the value alternative held, for error messages ("integer", "list", ...).
[[nodiscard]] std::string_view value_type_name(const Record::Value& value) noexcept;

}  // namespace shotimport::core
