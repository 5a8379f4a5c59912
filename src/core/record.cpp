#include <shotimport/core/record.hpp>

namespace shotimport::core {

Record& Record::set(std::string key, Value value) {
  fields_.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

Record& Record::set(std::string key, Record nested) {
  return set(std::move(key), Value{std::make_shared<const Record>(std::move(nested))});
}

bool Record::erase(std::string_view key) {
  auto it = fields_.find(key);
  if (it == fields_.end()) return false;
  fields_.erase(it);
  return true;
}

bool Record::contains(std::string_view key) const {
  return fields_.find(key) != fields_.end();
}

const Record::Value* Record::find(std::string_view key) const {
  auto it = fields_.find(key);
  return it == fields_.end() ? nullptr : &it->second;
}

const Record* Record::object(std::string_view key) const {
  const Object* obj = get_if<Object>(key);
  return obj ? obj->get() : nullptr;
}

std::string_view value_type_name(const Record::Value& value) noexcept {
  switch (value.index()) {
    case 0:
      return "boolean";
    case 1:
      return "integer";
    case 2:
      return "number";
    case 3:
      return "string";
    case 4:
      return "image";
    case 5:
      return "object";
    case 6:
      return "list";
    default:
      return "unknown";
  }
}

}  // namespace shotimport::core
