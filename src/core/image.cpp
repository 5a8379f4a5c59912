#include <shotimport/core/image.hpp>

namespace shotimport::core {

std::uint32_t Image::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Image::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * channels(format);
}

bool Image::consistent() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) return false;
  return pixels_.size() >= min_bytes(width_, height_, format_);
}

}  // namespace shotimport::core
