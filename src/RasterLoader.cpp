#include "scanpdf/RasterLoader.hpp"

#include <stdexcept>

#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace scanpdf {

RasterResult loadImage(const std::string &imagePath, double dpi) {
  RasterResult result;

  try {
    cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (image.empty()) {
      result.errorMessage = "Failed to load image: " + imagePath;
      return result;
    }
    result.page.image = image;
    result.page.dpi = dpi;
    result.success = true;
  } catch (const cv::Exception &e) {
    result.errorMessage =
        "Failed to decode image " + imagePath + ": " + e.what();
  }

  return result;
}

RasterResult renderPdfPage(const poppler::page &page, double dpi) {
  RasterResult result;

  if (dpi <= 0) {
    result.errorMessage = "Render DPI must be positive";
    return result;
  }

  // Create page renderer with antialiasing
  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  poppler::image popplerImage = renderer.render_page(&page, dpi, dpi);
  if (!popplerImage.is_valid()) {
    result.errorMessage = "Poppler failed to render page";
    return result;
  }

  cv::Mat mat = matFromPopplerImage(popplerImage);
  if (mat.empty()) {
    result.errorMessage = "Unsupported Poppler image format";
    return result;
  }

  result.page.image = mat;
  result.page.dpi = dpi;
  result.success = true;
  return result;
}

cv::Mat matFromPopplerImage(const poppler::image &image) {
  int width = image.width();
  int height = image.height();
  auto *data = const_cast<char *>(image.const_data());
  size_t stride = static_cast<size_t>(image.bytes_per_row());

  cv::Mat mat;
  switch (image.format()) {
  case poppler::image::format_argb32:
    // Native-endian ARGB is BGRA in memory on little-endian hosts
    cv::cvtColor(cv::Mat(height, width, CV_8UC4, data, stride), mat,
                 cv::COLOR_BGRA2BGR);
    break;
  case poppler::image::format_rgb24:
    cv::cvtColor(cv::Mat(height, width, CV_8UC3, data, stride), mat,
                 cv::COLOR_RGB2BGR);
    break;
  case poppler::image::format_bgr24:
    mat = cv::Mat(height, width, CV_8UC3, data, stride).clone();
    break;
  case poppler::image::format_gray8:
    mat = cv::Mat(height, width, CV_8UC1, data, stride).clone();
    break;
  default:
    break;
  }
  return mat;
}

RasterPage rotateRaster(const RasterPage &raster, int degrees) {
  RasterPage rotated;
  rotated.dpi = raster.dpi;

  switch (((degrees % 360) + 360) % 360) {
  case 0:
    rotated.image = raster.image.clone();
    break;
  case 90:
    cv::rotate(raster.image, rotated.image, cv::ROTATE_90_CLOCKWISE);
    break;
  case 180:
    cv::rotate(raster.image, rotated.image, cv::ROTATE_180);
    break;
  case 270:
    cv::rotate(raster.image, rotated.image, cv::ROTATE_90_COUNTERCLOCKWISE);
    break;
  default:
    throw std::invalid_argument("Rotation must be a multiple of 90 degrees: " +
                                std::to_string(degrees));
  }

  return rotated;
}

RasterPage cropRaster(const RasterPage &raster, const cv::Rect &crop) {
  cv::Rect validRoi = crop & cv::Rect(0, 0, raster.width(), raster.height());
  if (validRoi.empty()) {
    return raster;
  }

  RasterPage cropped;
  cropped.image = raster.image(validRoi).clone();
  cropped.dpi = raster.dpi;
  return cropped;
}

RasterPage prepareRaster(const RasterPage &raster, int rotation,
                         const std::optional<cv::Rect> &crop) {
  RasterPage prepared = rotateRaster(raster, rotation);
  if (crop) {
    prepared = cropRaster(prepared, *crop);
  }
  return prepared;
}

} // namespace scanpdf
