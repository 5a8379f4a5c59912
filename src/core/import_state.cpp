#include <shotimport/core/import_state.hpp>
#include <algorithm>
#include <array>

namespace shotimport::core {

namespace {

using S = ImportState;

constexpr std::array kFromIdle{S::AnalyzingRoi, S::AwaitingManualCrop, S::Error};
constexpr std::array kFromAnalyzingRoi{S::MappingGrid, S::AwaitingManualCrop, S::Error};
constexpr std::array kFromAwaitingManualCrop{S::MappingGrid, S::Error};
constexpr std::array kFromMappingGrid{S::ExtractingRegions, S::AwaitingManualCrop, S::Error};
constexpr std::array kFromExtractingRegions{S::Recognizing, S::AwaitingManualCrop, S::Error};
constexpr std::array kFromRecognizing{S::Reviewing, S::Complete, S::Error};
constexpr std::array kFromReviewing{S::Complete, S::AwaitingManualCrop, S::Error};
constexpr std::array kFromComplete{S::Idle};
constexpr std::array kFromError{S::Idle};

}  // namespace

std::string_view to_string(ImportState state) noexcept {
  switch (state) {
    case S::Idle:
      return "idle";
    case S::AnalyzingRoi:
      return "analyzing-roi";
    case S::AwaitingManualCrop:
      return "awaiting-manual-crop";
    case S::MappingGrid:
      return "mapping-grid";
    case S::ExtractingRegions:
      return "extracting-regions";
    case S::Recognizing:
      return "recognizing";
    case S::Reviewing:
      return "reviewing";
    case S::Complete:
      return "complete";
    case S::Error:
      return "error";
  }
  return "unknown";
}

std::string_view to_string(PipelineStage stage) noexcept {
  switch (stage) {
    case PipelineStage::RoiDetection:
      return "roi-detection";
    case PipelineStage::GridMapping:
      return "grid-mapping";
    case PipelineStage::RegionExtraction:
      return "region-extraction";
    case PipelineStage::Recognition:
      return "recognition";
  }
  return "unknown";
}

std::span<const ImportState> allowed_successors(ImportState from) noexcept {
  switch (from) {
    case S::Idle:
      return kFromIdle;
    case S::AnalyzingRoi:
      return kFromAnalyzingRoi;
    case S::AwaitingManualCrop:
      return kFromAwaitingManualCrop;
    case S::MappingGrid:
      return kFromMappingGrid;
    case S::ExtractingRegions:
      return kFromExtractingRegions;
    case S::Recognizing:
      return kFromRecognizing;
    case S::Reviewing:
      return kFromReviewing;
    case S::Complete:
      return kFromComplete;
    case S::Error:
      return kFromError;
  }
  return {};
}

bool is_allowed_transition(ImportState from, ImportState to) noexcept {
  const auto next = allowed_successors(from);
  return std::find(next.begin(), next.end(), to) != next.end();
}

ImportState state_for(PipelineStage stage) noexcept {
  switch (stage) {
    case PipelineStage::RoiDetection:
      return S::AnalyzingRoi;
    case PipelineStage::GridMapping:
      return S::MappingGrid;
    case PipelineStage::RegionExtraction:
      return S::ExtractingRegions;
    case PipelineStage::Recognition:
      return S::Recognizing;
  }
  return S::Error;
}

}  // namespace shotimport::core
