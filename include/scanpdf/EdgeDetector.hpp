#ifndef SCANPDF_EDGE_DETECTOR_HPP
#define SCANPDF_EDGE_DETECTOR_HPP

#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/Types.hpp"

#include <optional>
#include <vector>

namespace scanpdf {

/**
 * @brief Finds the dominant document boundary in a raster
 *
 * Blur, Canny, external contours, then the largest contour is simplified
 * with a perimeter-proportional tolerance. Four vertices give a proper
 * quadrilateral; anything else gives the contour's bounding rectangle,
 * flagged as degenerate.
 *
 * Example usage:
 * @code
 * scanpdf::EdgeDetector detector;
 * if (auto quad = detector.detect(page.image)) {
 *     auto rectified = rectifier.rectify(page, *quad);
 * }
 * @endcode
 */
class EdgeDetector {
public:
  EdgeDetector() = default;
  explicit EdgeDetector(const EdgeDetectionConfig &config);

  /**
   * @brief Detect the document quadrilateral
   * @param image Gray, BGR or BGRA raster
   * @return Canonically ordered quadrilateral, or std::nullopt when the
   * image has no contours at all
   */
  std::optional<Quadrilateral> detect(const cv::Mat &image) const;

  /**
   * @brief Edge map used for contour extraction (exposed for inspection)
   */
  cv::Mat edgeMap(const cv::Mat &image) const;

  const EdgeDetectionConfig &getConfig() const { return m_config; }

private:
  EdgeDetectionConfig m_config;
};

} // namespace scanpdf

#endif // SCANPDF_EDGE_DETECTOR_HPP
