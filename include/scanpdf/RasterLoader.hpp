#ifndef SCANPDF_RASTER_LOADER_HPP
#define SCANPDF_RASTER_LOADER_HPP

#include "scanpdf/Types.hpp"

#include <optional>
#include <string>

namespace poppler {
class image;
class page;
} // namespace poppler

namespace scanpdf {

/**
 * @brief Result of materializing a page as pixels
 */
struct RasterResult {
  bool success = false;
  std::string errorMessage;
  RasterPage page;
};

/**
 * @brief Decode an image file with OpenCV
 *
 * Image files carry no reliable physical size, so the returned page is
 * tagged with the requested DPI.
 *
 * @param imagePath Path to the image file
 * @param dpi Resolution to assume for the pixels
 */
RasterResult loadImage(const std::string &imagePath, double dpi);

/**
 * @brief Render one PDF page with Poppler at the given DPI
 * @return BGR raster, or an error when Poppler cannot render the page
 */
RasterResult renderPdfPage(const poppler::page &page, double dpi);

/**
 * @brief Convert a Poppler image to an OpenCV BGR (or gray) Mat
 * @return Empty Mat for formats that cannot be converted
 */
cv::Mat matFromPopplerImage(const poppler::image &image);

/**
 * @brief Rotate a raster clockwise by a multiple of 90 degrees
 *
 * Angles other than 0/90/180/270 are rejected with std::invalid_argument.
 */
RasterPage rotateRaster(const RasterPage &raster, int degrees);

/**
 * @brief Restrict a raster to a crop rectangle
 *
 * The rectangle is clamped to the raster bounds. An empty intersection
 * leaves the raster as it was.
 */
RasterPage cropRaster(const RasterPage &raster, const cv::Rect &crop);

/**
 * @brief Apply rotation, then the optional crop, to a freshly loaded page
 */
RasterPage prepareRaster(const RasterPage &raster, int rotation,
                         const std::optional<cv::Rect> &crop);

} // namespace scanpdf

#endif // SCANPDF_RASTER_LOADER_HPP
