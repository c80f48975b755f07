#ifndef SCANPDF_COORDINATE_MAPPER_HPP
#define SCANPDF_COORDINATE_MAPPER_HPP

#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/Types.hpp"

#include <vector>

namespace scanpdf {

/**
 * @brief Converts recognizer boxes from raster pixels to PDF points
 *
 * Both spaces share a top-left origin. A box in a w_px x h_px raster is
 * scaled by (w_pt / w_px, h_pt / h_px) and clamped to the page, and gets a
 * font size of height * heightRatio clamped to [minPt, maxPt].
 */
class CoordinateMapper {
public:
  CoordinateMapper() = default;
  explicit CoordinateMapper(const FontSizeConfig &config);

  /**
   * @brief Point size of a raster at a given resolution (72 points per inch)
   */
  static PageSize pageSizeForRaster(int widthPx, int heightPx, double dpi);

  /**
   * @brief Clamp a font size derived from a box height
   */
  double fontSizeForHeight(double heightPt) const;

  /**
   * @brief Map every line, keeping the recognizer's order
   * @param lines Lines in the recognized raster's pixel space
   * @param rasterSize Pixel size of the raster given to the recognizer
   * @param pageSize Destination page size in points
   * @return One MappedLine per input line, or nothing for an empty raster
   */
  std::vector<MappedLine> mapLines(const std::vector<RecognizedLine> &lines,
                                   const cv::Size &rasterSize,
                                   const PageSize &pageSize) const;

private:
  FontSizeConfig m_config;
};

} // namespace scanpdf

#endif // SCANPDF_COORDINATE_MAPPER_HPP
