#pragma once

#include <shotimport/core/image.hpp>
#include <shotimport/core/record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shotimport::core {

/// Contract names; also the keys of ImportSession stage data.
namespace contract_names {
inline constexpr std::string_view kRawInput = "raw-input";
inline constexpr std::string_view kRoiResult = "roi-result";
inline constexpr std::string_view kGridMap = "grid-map";
inline constexpr std::string_view kRegionMap = "region-map";
inline constexpr std::string_view kRecognitionResult = "recognition-result";
inline constexpr std::string_view kReviewResult = "review-result";
}  // namespace contract_names

/// Every stage payload carries this integer field; it must equal the contract version.
inline constexpr std::string_view kSchemaVersionField = "schema_version";

/// Pixel rectangle in screenshot coordinates.
struct Bounds {
  double x{0.0};
  double y{0.0};
  double width{0.0};
  double height{0.0};

  bool operator==(const Bounds&) const = default;
};

struct Point {
  double x{0.0};
  double y{0.0};

  bool operator==(const Point&) const = default;
};

enum class RoiMethod : std::uint8_t { Edge, Color, Template, Corner, Manual, Fallback };

[[nodiscard]] std::string_view to_string(RoiMethod method) noexcept;
[[nodiscard]] std::optional<RoiMethod> parse_roi_method(std::string_view text) noexcept;

struct RawInput {
  ImageHandle image;
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string source;
};

struct RoiResult {
  Bounds bounds;
  double confidence{0.0};
  RoiMethod method{RoiMethod::Edge};
  std::string note;
};

enum class GridZone : std::uint8_t { Core, Regular };

struct GridCell {
  std::string region_id;
  std::uint32_t row{0};
  std::uint32_t col{0};
  Bounds bounds;
  GridZone zone{GridZone::Regular};
};

struct GridMap {
  std::uint32_t rows{0};
  std::uint32_t cols{0};
  std::vector<GridCell> cells;
};

struct ExtractedRegion {
  std::string region_id;
  std::uint32_t row{0};
  std::uint32_t col{0};
  Bounds bounds;
  ImageHandle image;
  double quality{0.0};  // 0-1, contrast based
};

struct RegionMap {
  std::vector<ExtractedRegion> regions;
};

struct Candidate {
  std::string name;
  double score{0.0};

  bool operator==(const Candidate&) const = default;
};

/// One recognized selection on the build screen.
struct DetectedItem {
  std::string name;
  double confidence{0.0};
  Point position;
  std::string region_id;
  bool needs_review{false};
  std::vector<Candidate> candidates;

  bool operator==(const DetectedItem&) const = default;
};

struct RecognitionStats {
  std::int64_t total_analyzed{0};
  double average_confidence{0.0};
};

struct RecognitionResult {
  std::vector<DetectedItem> items;
  RecognitionStats stats;
};

/// Final, user-confirmed (or auto-accepted) selection.
struct ReviewResult {
  std::vector<DetectedItem> items;
  double confidence{0.0};
  bool reviewed_by_user{false};
};

/// Typed payload per stage contract.
using StagePayload =
    std::variant<RawInput, RoiResult, GridMap, RegionMap, RecognitionResult, ReviewResult>;

// Encoders: typed -> Record (with schema_version set to 1). Used by heuristics and UI code.
[[nodiscard]] Record to_record(const RawInput& input);
[[nodiscard]] Record to_record(const RoiResult& roi);
[[nodiscard]] Record to_record(const GridMap& grid);
[[nodiscard]] Record to_record(const RegionMap& regions);
[[nodiscard]] Record to_record(const RecognitionResult& result);
[[nodiscard]] Record to_record(const ReviewResult& review);
[[nodiscard]] Record to_record(const Bounds& bounds);

// Decoders: Record -> typed. Only valid on records that passed validation for that contract.
[[nodiscard]] RawInput decode_raw_input(const Record& record);
[[nodiscard]] RoiResult decode_roi_result(const Record& record);
[[nodiscard]] GridMap decode_grid_map(const Record& record);
[[nodiscard]] RegionMap decode_region_map(const Record& record);
[[nodiscard]] RecognitionResult decode_recognition_result(const Record& record);
[[nodiscard]] ReviewResult decode_review_result(const Record& record);

}  // namespace shotimport::core
