#include <shotimport/core/stage_payload.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace shotimport::core {

namespace {

constexpr std::int64_t kPayloadVersion = 1;

std::int64_t int_or(const Record& r, std::string_view key, std::int64_t fallback = 0) {
  const auto* v = r.get_if<std::int64_t>(key);
  return v ? *v : fallback;
}

double number_or(const Record& r, std::string_view key, double fallback = 0.0) {
  const auto* v = r.get_if<double>(key);
  return v ? *v : fallback;
}

std::string string_or(const Record& r, std::string_view key) {
  const auto* v = r.get_if<std::string>(key);
  return v ? *v : std::string{};
}

bool bool_or(const Record& r, std::string_view key, bool fallback = false) {
  const auto* v = r.get_if<bool>(key);
  return v ? *v : fallback;
}

ImageHandle image_or_null(const Record& r, std::string_view key) {
  const auto* v = r.get_if<ImageHandle>(key);
  return v ? *v : ImageHandle{};
}

const Record::List& list_or_empty(const Record& r, std::string_view key) {
  static const Record::List empty;
  const auto* v = r.get_if<Record::List>(key);
  return v ? *v : empty;
}

// Contracts bound these fields to the uint32 range; saturate rather than wrap regardless.
std::uint32_t u32(std::int64_t v) {
  return static_cast<std::uint32_t>(
      std::clamp<std::int64_t>(v, 0, std::numeric_limits<std::uint32_t>::max()));
}

Bounds decode_bounds(const Record* r) {
  if (!r) return {};
  return Bounds{number_or(*r, "x"), number_or(*r, "y"), number_or(*r, "width"),
                number_or(*r, "height")};
}

Point decode_point(const Record* r) {
  if (!r) return {};
  return Point{number_or(*r, "x"), number_or(*r, "y")};
}

Record point_record(const Point& p) {
  Record r;
  r.set("x", p.x).set("y", p.y);
  return r;
}

Record item_record(const DetectedItem& item) {
  Record r;
  r.set("name", item.name)
      .set("confidence", item.confidence)
      .set("position", point_record(item.position))
      .set("needs_review", item.needs_review);
  if (!item.region_id.empty()) r.set("region_id", item.region_id);
  if (!item.candidates.empty()) {
    Record::List candidates;
    candidates.reserve(item.candidates.size());
    for (const auto& c : item.candidates) {
      Record cr;
      cr.set("name", c.name).set("score", c.score);
      candidates.push_back(std::move(cr));
    }
    r.set("candidates", std::move(candidates));
  }
  return r;
}

DetectedItem decode_item(const Record& r) {
  DetectedItem item;
  item.name = string_or(r, "name");
  item.confidence = number_or(r, "confidence");
  item.position = decode_point(r.object("position"));
  item.region_id = string_or(r, "region_id");
  item.needs_review = bool_or(r, "needs_review");
  for (const auto& cr : list_or_empty(r, "candidates")) {
    item.candidates.push_back(Candidate{string_or(cr, "name"), number_or(cr, "score")});
  }
  return item;
}

Record::List item_list(const std::vector<DetectedItem>& items) {
  Record::List list;
  list.reserve(items.size());
  for (const auto& item : items) list.push_back(item_record(item));
  return list;
}

std::vector<DetectedItem> decode_items(const Record& r) {
  std::vector<DetectedItem> items;
  const auto& list = list_or_empty(r, "items");
  items.reserve(list.size());
  for (const auto& ir : list) items.push_back(decode_item(ir));
  return items;
}

Record versioned() {
  Record r;
  r.set(std::string(kSchemaVersionField), kPayloadVersion);
  return r;
}

}  // namespace

std::string_view to_string(RoiMethod method) noexcept {
  switch (method) {
    case RoiMethod::Edge:
      return "edge";
    case RoiMethod::Color:
      return "color";
    case RoiMethod::Template:
      return "template";
    case RoiMethod::Corner:
      return "corner";
    case RoiMethod::Manual:
      return "manual";
    case RoiMethod::Fallback:
      return "fallback";
  }
  return "edge";
}

std::optional<RoiMethod> parse_roi_method(std::string_view text) noexcept {
  if (text == "edge") return RoiMethod::Edge;
  if (text == "color") return RoiMethod::Color;
  if (text == "template") return RoiMethod::Template;
  if (text == "corner") return RoiMethod::Corner;
  if (text == "manual") return RoiMethod::Manual;
  if (text == "fallback") return RoiMethod::Fallback;
  return std::nullopt;
}

Record to_record(const Bounds& bounds) {
  Record r;
  r.set("x", bounds.x).set("y", bounds.y).set("width", bounds.width).set("height", bounds.height);
  return r;
}

Record to_record(const RawInput& input) {
  Record r = versioned();
  r.set("image", input.image)
      .set("width", static_cast<std::int64_t>(input.width))
      .set("height", static_cast<std::int64_t>(input.height));
  if (!input.source.empty()) r.set("source", input.source);
  return r;
}

Record to_record(const RoiResult& roi) {
  Record r = versioned();
  r.set("bounds", to_record(roi.bounds))
      .set("confidence", roi.confidence)
      .set("method", std::string(to_string(roi.method)));
  if (!roi.note.empty()) r.set("note", roi.note);
  return r;
}

Record to_record(const GridMap& grid) {
  Record r = versioned();
  Record::List cells;
  cells.reserve(grid.cells.size());
  for (const auto& cell : grid.cells) {
    Record cr;
    cr.set("region_id", cell.region_id)
        .set("row", static_cast<std::int64_t>(cell.row))
        .set("col", static_cast<std::int64_t>(cell.col))
        .set("bounds", to_record(cell.bounds))
        .set("zone", std::string(cell.zone == GridZone::Core ? "core" : "regular"));
    cells.push_back(std::move(cr));
  }
  r.set("rows", static_cast<std::int64_t>(grid.rows))
      .set("cols", static_cast<std::int64_t>(grid.cols))
      .set("cells", std::move(cells));
  return r;
}

Record to_record(const RegionMap& regions) {
  Record r = versioned();
  Record::List list;
  list.reserve(regions.regions.size());
  for (const auto& region : regions.regions) {
    Record rr;
    rr.set("region_id", region.region_id)
        .set("row", static_cast<std::int64_t>(region.row))
        .set("col", static_cast<std::int64_t>(region.col))
        .set("bounds", to_record(region.bounds))
        .set("image", region.image)
        .set("quality", region.quality);
    list.push_back(std::move(rr));
  }
  r.set("regions", std::move(list));
  return r;
}

Record to_record(const RecognitionResult& result) {
  Record r = versioned();
  Record stats;
  stats.set("total_analyzed", result.stats.total_analyzed)
      .set("average_confidence", result.stats.average_confidence);
  r.set("items", item_list(result.items)).set("stats", std::move(stats));
  return r;
}

Record to_record(const ReviewResult& review) {
  Record r = versioned();
  r.set("items", item_list(review.items))
      .set("confidence", review.confidence)
      .set("reviewed_by_user", review.reviewed_by_user);
  return r;
}

RawInput decode_raw_input(const Record& record) {
  RawInput input;
  input.image = image_or_null(record, "image");
  input.width = u32(int_or(record, "width"));
  input.height = u32(int_or(record, "height"));
  input.source = string_or(record, "source");
  return input;
}

RoiResult decode_roi_result(const Record& record) {
  RoiResult roi;
  roi.bounds = decode_bounds(record.object("bounds"));
  roi.confidence = number_or(record, "confidence");
  roi.method = parse_roi_method(string_or(record, "method")).value_or(RoiMethod::Fallback);
  roi.note = string_or(record, "note");
  return roi;
}

GridMap decode_grid_map(const Record& record) {
  GridMap grid;
  grid.rows = u32(int_or(record, "rows"));
  grid.cols = u32(int_or(record, "cols"));
  for (const auto& cr : list_or_empty(record, "cells")) {
    GridCell cell;
    cell.region_id = string_or(cr, "region_id");
    cell.row = u32(int_or(cr, "row"));
    cell.col = u32(int_or(cr, "col"));
    cell.bounds = decode_bounds(cr.object("bounds"));
    cell.zone = string_or(cr, "zone") == "core" ? GridZone::Core : GridZone::Regular;
    grid.cells.push_back(std::move(cell));
  }
  return grid;
}

RegionMap decode_region_map(const Record& record) {
  RegionMap map;
  for (const auto& rr : list_or_empty(record, "regions")) {
    ExtractedRegion region;
    region.region_id = string_or(rr, "region_id");
    region.row = u32(int_or(rr, "row"));
    region.col = u32(int_or(rr, "col"));
    region.bounds = decode_bounds(rr.object("bounds"));
    region.image = image_or_null(rr, "image");
    region.quality = number_or(rr, "quality");
    map.regions.push_back(std::move(region));
  }
  return map;
}

RecognitionResult decode_recognition_result(const Record& record) {
  RecognitionResult result;
  result.items = decode_items(record);
  if (const Record* stats = record.object("stats")) {
    result.stats.total_analyzed = int_or(*stats, "total_analyzed");
    result.stats.average_confidence = number_or(*stats, "average_confidence");
  }
  return result;
}

ReviewResult decode_review_result(const Record& record) {
  ReviewResult review;
  review.items = decode_items(record);
  review.confidence = number_or(record, "confidence");
  review.reviewed_by_user = bool_or(record, "reviewed_by_user");
  return review;
}

}  // namespace shotimport::core
