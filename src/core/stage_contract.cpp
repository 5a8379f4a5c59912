#include <shotimport/core/stage_contract.hpp>
#include <shotimport/core/image.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace shotimport::core {

namespace {

FieldRule number(std::string name, double min, double max, bool required = true) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Number;
  r.required = required;
  r.min = min;
  r.max = max;
  return r;
}

FieldRule positive(std::string name) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Number;
  r.min = 0.0;
  r.exclusive_min = true;
  return r;
}

FieldRule unbounded_number(std::string name) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Number;
  return r;
}

FieldRule integer(std::string name,
                  std::optional<double> min,
                  std::optional<double> max = std::nullopt) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Integer;
  r.min = min;
  r.max = max;
  return r;
}

/// Integer decoded into std::uint32_t.
FieldRule count(std::string name, double min) {
  return integer(std::move(name), min,
                 static_cast<double>(std::numeric_limits<std::uint32_t>::max()));
}

FieldRule text(std::string name, bool required, std::optional<double> min_length = std::nullopt) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::String;
  r.required = required;
  r.min = min_length;
  return r;
}

FieldRule one_of(std::string name, std::vector<std::string> allowed, bool required = true) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::String;
  r.required = required;
  r.allowed = std::move(allowed);
  return r;
}

FieldRule flag(std::string name, bool required) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Boolean;
  r.required = required;
  return r;
}

FieldRule image(std::string name) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Image;
  return r;
}

FieldRule object(std::string name, std::string nested, bool required = true) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::Object;
  r.required = required;
  r.nested = std::move(nested);
  return r;
}

FieldRule list(std::string name,
               std::string nested,
               std::optional<double> min_size,
               bool required = true) {
  FieldRule r;
  r.name = std::move(name);
  r.type = FieldType::List;
  r.required = required;
  r.min = min_size;
  r.nested = std::move(nested);
  return r;
}

FieldRule schema_version() {
  return integer(std::string(kSchemaVersionField), 0.0);
}

StageContract nested(std::string name, std::vector<FieldRule> fields) {
  return StageContract{std::move(name), 1, std::move(fields), nullptr};
}

StageContract stage(std::string_view name,
                    std::vector<FieldRule> fields,
                    PayloadDecoder decoder,
                    RecordCheck check = nullptr) {
  fields.insert(fields.begin(), schema_version());
  return StageContract{std::string(name), 1, std::move(fields), std::move(decoder),
                       std::move(check)};
}

/// The declared width/height must be the image's own.
std::optional<FieldIssue> raw_input_matches_image(const Record& r) {
  const auto* handle = r.get_if<ImageHandle>("image");
  const auto* width = r.get_if<std::int64_t>("width");
  const auto* height = r.get_if<std::int64_t>("height");
  if (!handle || !*handle || !width || !height) return std::nullopt;
  const Image& img = **handle;
  if (*width != static_cast<std::int64_t>(img.width())) {
    return FieldIssue{"width", "declared " + std::to_string(*width) + " but image is " +
                                   std::to_string(img.width()) + " wide"};
  }
  if (*height != static_cast<std::int64_t>(img.height())) {
    return FieldIssue{"height", "declared " + std::to_string(*height) + " but image is " +
                                    std::to_string(img.height()) + " high"};
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(FieldType type) noexcept {
  switch (type) {
    case FieldType::Boolean:
      return "boolean";
    case FieldType::Integer:
      return "integer";
    case FieldType::Number:
      return "number";
    case FieldType::String:
      return "string";
    case FieldType::Image:
      return "image";
    case FieldType::Object:
      return "object";
    case FieldType::List:
      return "list";
  }
  return "unknown";
}

std::vector<StageContract> default_contracts() {
  using namespace contract_names;
  std::vector<StageContract> contracts;

  contracts.push_back(nested("bounds", {number("x", 0.0, 1e9), number("y", 0.0, 1e9),
                                        positive("width"), positive("height")}));
  contracts.push_back(nested("point", {unbounded_number("x"), unbounded_number("y")}));
  contracts.push_back(nested("grid-cell", {text("region_id", true, 1.0), count("row", 0.0),
                                           count("col", 0.0), object("bounds", "bounds"),
                                           one_of("zone", {"core", "regular"}, false)}));
  contracts.push_back(nested("extracted-region",
                             {text("region_id", true, 1.0), count("row", 0.0),
                              count("col", 0.0), object("bounds", "bounds"), image("image"),
                              number("quality", 0.0, 1.0)}));
  contracts.push_back(nested("candidate", {text("name", true, 1.0), number("score", 0.0, 1.0)}));
  contracts.push_back(nested("detected-item",
                             {text("name", true, 1.0), number("confidence", 0.0, 1.0),
                              object("position", "point"), text("region_id", false),
                              flag("needs_review", false),
                              list("candidates", "candidate", std::nullopt, false)}));
  contracts.push_back(nested("recognition-stats", {integer("total_analyzed", 0.0),
                                                   number("average_confidence", 0.0, 1.0)}));

  contracts.push_back(stage(kRawInput,
                            {image("image"), integer("width", 1.0, 16384.0),
                             integer("height", 1.0, 16384.0), text("source", false)},
                            [](const Record& r) { return StagePayload{decode_raw_input(r)}; },
                            raw_input_matches_image));
  contracts.push_back(stage(kRoiResult,
                            {object("bounds", "bounds"), number("confidence", 0.0, 1.0),
                             one_of("method", {"edge", "color", "template", "corner", "manual",
                                               "fallback"}),
                             text("note", false)},
                            [](const Record& r) { return StagePayload{decode_roi_result(r)}; }));
  contracts.push_back(stage(kGridMap,
                            {count("rows", 1.0), count("cols", 1.0),
                             list("cells", "grid-cell", 1.0)},
                            [](const Record& r) { return StagePayload{decode_grid_map(r)}; }));
  contracts.push_back(stage(kRegionMap, {list("regions", "extracted-region", 1.0)},
                            [](const Record& r) { return StagePayload{decode_region_map(r)}; }));
  contracts.push_back(stage(kRecognitionResult,
                            {list("items", "detected-item", std::nullopt),
                             object("stats", "recognition-stats")},
                            [](const Record& r) {
                              return StagePayload{decode_recognition_result(r)};
                            }));
  contracts.push_back(stage(kReviewResult,
                            {list("items", "detected-item", std::nullopt),
                             number("confidence", 0.0, 1.0), flag("reviewed_by_user", true)},
                            [](const Record& r) { return StagePayload{decode_review_result(r)}; }));
  return contracts;
}

}  // namespace shotimport::core
