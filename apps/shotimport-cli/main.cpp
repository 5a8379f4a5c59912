/**
 * shotimport-cli: import a build screenshot; print every state change and the final selection.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/shotimport_cli [--config path] [--input path] [--crop x,y,w,h] [--accept-review]
 * With --input: also writes the selection to output/<basename>.txt (same content as terminal).
 */

#include <shotimport/app/config.hpp>
#include <shotimport/app/import_runner.hpp>
#include <shotimport/app/logging.hpp>
#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/image.hpp>
#include <shotimport/core/import_orchestrator.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <shotimport/core/task_scheduler.hpp>
#include <shotimport/vision/brightness_recognizer.hpp>
#include <shotimport/vision/cell_region_extractor.hpp>
#include <shotimport/vision/edge_roi_detector.hpp>
#include <shotimport/vision/load_image.hpp>
#include <shotimport/vision/uniform_grid_mapper.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace nc = shotimport::core;

/// Dark frame with a framed grid of cells, every other cell lit.
nc::RawInput make_demo_input(int w, int h) {
  cv::Mat mat(h, w, CV_8UC3, cv::Scalar(20, 20, 24));
  const cv::Rect area(w / 8, h / 8, w * 3 / 4, h * 3 / 4);
  cv::rectangle(mat, area, cv::Scalar(200, 200, 200), 3);
  const int rows = 6;
  const int cols = 8;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if ((r + c) % 2 != 0) continue;
      const cv::Rect cell(area.x + c * area.width / cols + 4, area.y + r * area.height / rows + 4,
                          area.width / cols - 8, area.height / rows - 8);
      cv::rectangle(mat, cell, cv::Scalar(230, 220, 210), cv::FILLED);
    }
  }
  std::vector<std::byte> buffer(mat.total() * mat.elemSize());
  std::memcpy(buffer.data(), mat.ptr(), buffer.size());

  nc::RawInput input;
  input.width = static_cast<std::uint32_t>(w);
  input.height = static_cast<std::uint32_t>(h);
  input.image = std::make_shared<const nc::Image>(input.width, input.height, nc::PixelFormat::BGR8,
                                                  std::move(buffer));
  input.source = "demo";
  return input;
}

std::optional<nc::Bounds> parse_crop(const std::string& text) {
  nc::Bounds b;
  char trailing = 0;
  if (std::sscanf(text.c_str(), "%lf,%lf,%lf,%lf%c", &b.x, &b.y, &b.width, &b.height, &trailing) !=
      4) {
    return std::nullopt;
  }
  if (b.width <= 0.0 || b.height <= 0.0) return std::nullopt;
  return b;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string log_level;
  std::optional<nc::Bounds> crop;
  bool accept_review = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--crop" && i + 1 < argc) {
      crop = parse_crop(argv[++i]);
      if (!crop) {
        std::cerr << "Invalid --crop (expected x,y,w,h with positive size)\n";
        return 1;
      }
    } else if (arg == "--accept-review") {
      accept_review = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: shotimport_cli [options]\n"
                << "  --config <path>     Import config (key=value file); default: built-in\n"
                << "  --input <path>      Screenshot path (optional; demo uses a synthetic image)\n"
                << "  --crop x,y,w,h      Answer a manual-crop request with this rectangle\n"
                << "  --accept-review     Accept recognized items as-is when review is requested\n"
                << "  --log-level <lvl>   trace | debug | info | warn | error | off\n";
      return 0;
    }
  }

  std::expected<shotimport::app::ImportConfig, nc::ImportError> cfg =
      shotimport::app::default_config();
  if (!config_path.empty()) cfg = shotimport::app::load_config(config_path);
  if (!cfg) {
    std::cerr << "Config error: " << nc::describe(cfg.error()) << "\n";
    return 1;
  }
  if (!log_level.empty()) cfg->log_level = log_level;
  if (auto logging = shotimport::app::configure_logging(cfg->log_level); !logging) {
    std::cerr << "Config error: " << nc::describe(logging.error()) << "\n";
    return 1;
  }

  nc::RawInput input;
  if (!input_path.empty()) {
    auto loaded = shotimport::vision::load_raw_input(input_path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << nc::describe(loaded.error()) << "\n";
      return 1;
    }
    input = std::move(*loaded);
  } else {
    input = make_demo_input(640, 480);
  }

  auto scheduler = std::make_shared<nc::TaskScheduler>(shotimport::app::to_scheduler_options(*cfg));
  nc::StageHeuristics heuristics;
  heuristics.roi_detector = std::make_shared<shotimport::vision::EdgeRoiDetector>();
  heuristics.grid_mapper = std::make_shared<shotimport::vision::UniformGridMapper>(
      cfg->grid_rows, cfg->grid_cols, cfg->grid_hex_offset);
  heuristics.region_extractor = std::make_shared<shotimport::vision::CellRegionExtractor>();
  heuristics.recognizer =
      std::make_shared<shotimport::vision::BrightnessRecognizer>(cfg->brightness_threshold);

  nc::ImportOrchestrator orchestrator(
      scheduler, nc::ContractValidator(nc::default_contracts()),
      nc::FallbackResolver(nc::default_fallback_strategies(shotimport::app::to_fallback_policy(*cfg))),
      heuristics, shotimport::app::to_orchestrator_options(*cfg));

  orchestrator.subscribe([](const nc::TransitionEvent& e) {
    std::cout << nc::to_string(e.from) << " -> " << nc::to_string(e.to);
    if (e.payload) std::cout << " [" << e.payload->stage << "]";
    if (e.hint) {
      std::cout << " hint: " << e.hint->note;
      if (e.hint->bounds) {
        std::cout << " (" << e.hint->bounds->x << "," << e.hint->bounds->y << ","
                  << e.hint->bounds->width << "," << e.hint->bounds->height << ")";
      }
    }
    if (e.error) std::cout << " error: " << nc::describe(*e.error);
    std::cout << "\n";
  });

  shotimport::app::ManualResponder responder;
  if (crop) {
    responder.on_manual_crop = [b = *crop](const nc::SessionSnapshot&) -> std::optional<nc::Record> {
      return nc::to_record(nc::RoiResult{b, 1.0, nc::RoiMethod::Manual, "cli --crop"});
    };
  }
  if (accept_review) {
    responder.on_review = [](const nc::SessionSnapshot& s) -> std::optional<nc::Record> {
      const auto* payload = s.find(nc::contract_names::kRecognitionResult);
      const auto* result = payload ? payload->get_if<nc::RecognitionResult>() : nullptr;
      if (!result) return std::nullopt;
      return nc::build_review_record(*result, {});
    };
  }

  auto report = shotimport::app::run_import(orchestrator, nc::to_record(input), responder);
  scheduler->shutdown();
  if (!report) {
    std::cerr << "Import error: " << nc::describe(report.error()) << "\n";
    return 1;
  }

  std::ostringstream out;
  out << "state=" << nc::to_string(report->final_state)
      << " manual_rounds=" << report->manual_rounds;
  if (report->error) out << " error=\"" << nc::describe(*report->error) << "\"";
  out << "\n";
  if (report->selection) {
    out << "selection confidence=" << report->selection->confidence
        << " reviewed=" << (report->selection->reviewed_by_user ? "yes" : "no")
        << " items=" << report->selection->items.size() << "\n";
    for (const auto& item : report->selection->items) {
      out << "  " << item.name << " confidence=" << item.confidence << " at=(" << item.position.x
          << "," << item.position.y << ")\n";
    }
  }
  std::string text = out.str();
  std::cout << text;

  if (!input_path.empty()) {
    std::filesystem::path p(input_path);
    std::filesystem::path out_dir("output");
    std::filesystem::create_directories(out_dir);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return report->final_state == nc::ImportState::Error ? 2 : 0;
}
