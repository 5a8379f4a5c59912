#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace shotimport::core {

/// Memory: Image owns one contiguous, tightly packed buffer (rows are width * channels bytes).
/// Images travel between stages as ImageHandle (shared, immutable), so a worker that is
/// discarded mid-task can still finish reading its input safely.

enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Screenshot or cropped region pixels.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> pixels)
      : width_(width), height_(height), format_(format), pixels_(std::move(pixels)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<const std::byte> pixels() const noexcept {
    return std::span<const std::byte>(pixels_.data(), pixels_.size());
  }
  [[nodiscard]] std::span<std::byte> pixels() noexcept {
    return std::span<std::byte>(pixels_.data(), pixels_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }

  /// True when the buffer holds at least width * height * channels bytes of a known format.
  [[nodiscard]] bool consistent() const noexcept;

  [[nodiscard]] static std::uint32_t channels(PixelFormat format) noexcept;
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
};

using ImageHandle = std::shared_ptr<const Image>;

}  // namespace shotimport::core
