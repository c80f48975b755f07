#ifndef SCANPDF_PERSPECTIVE_RECTIFIER_HPP
#define SCANPDF_PERSPECTIVE_RECTIFIER_HPP

#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/Types.hpp"

#include <vector>

namespace scanpdf {

/**
 * @brief Canonical TL, TR, BR, BL ordering of four points
 *
 * Top-left has the smallest x+y, bottom-right the largest; top-right has
 * the smallest y-x, bottom-left the largest. The result does not depend on
 * the order the points are listed in.
 *
 * @throws std::invalid_argument unless exactly four points are given
 */
Quadrilateral orderCorners(const std::vector<cv::Point2f> &points);

/// Convenience overload for integer contour points
Quadrilateral orderCorners(const std::vector<cv::Point> &points);

/**
 * @brief Quadrilateral covering a whole width x height raster
 */
Quadrilateral fullFrameQuad(int width, int height);

/**
 * @brief Warps a photographed page onto an axis-aligned rectangle
 */
class PerspectiveRectifier {
public:
  PerspectiveRectifier() = default;
  explicit PerspectiveRectifier(const RectificationConfig &config);

  /**
   * @brief Output size for a quadrilateral
   *
   * Width is the longer of the top and bottom edges, height the longer of
   * the left and right edges.
   */
  static cv::Size targetSize(const Quadrilateral &quad);

  /**
   * @brief Rectify a raster
   *
   * Corners are re-ordered from geometry before use. A degenerate,
   * collinear or otherwise singular quadrilateral returns the input
   * unchanged with applied=false. This method does not throw.
   */
  RectifiedPage rectify(const RasterPage &raster,
                        const Quadrilateral &quad) const;

private:
  RectificationConfig m_config;
};

} // namespace scanpdf

#endif // SCANPDF_PERSPECTIVE_RECTIFIER_HPP
