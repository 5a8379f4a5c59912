#pragma once

#include <shotimport/core/image.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>
#include <optional>

namespace shotimport::vision::detail {

/// Wrap an Image as a cv::Mat (shared view, no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> image_to_mat(const shotimport::core::Image& image);

/// Convert cv::Mat to Image (copy).
shotimport::core::Image mat_to_image(const cv::Mat& mat, shotimport::core::PixelFormat format);

/// Single-channel 8-bit copy of any supported image.
std::optional<cv::Mat> to_gray(const shotimport::core::Image& image);

/// Bounds clipped to a width x height canvas, rounded to whole pixels; empty when outside.
cv::Rect clip_to(const shotimport::core::Bounds& bounds, int width, int height);

}  // namespace shotimport::vision::detail
