#ifndef SCANPDF_IMAGE_ENHANCER_HPP
#define SCANPDF_IMAGE_ENHANCER_HPP

#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/Types.hpp"

namespace scanpdf {

/**
 * @brief Turns a rectified photo into a print-like page
 *
 * Stages run in a fixed order: brightness, contrast, sharpness, grayscale,
 * bilateral denoise, adaptive threshold. The tone stages are skipped when
 * their factor is 1.0.
 */
class ImageEnhancer {
public:
  ImageEnhancer() = default;
  explicit ImageEnhancer(const EnhancementConfig &config);

  /**
   * @brief Run every configured stage
   * @return 3-channel BGR page, whatever the input depth was
   */
  EnhancedPage enhance(const RasterPage &raster) const;

  /// Scale intensities toward black (factor < 1) or up (factor > 1)
  static cv::Mat adjustBrightness(const cv::Mat &image, double factor);

  /// Scale intensities around the mean gray level
  static cv::Mat adjustContrast(const cv::Mat &image, double factor);

  /// Blend with a smoothed copy; factor > 1 sharpens, < 1 blurs
  static cv::Mat adjustSharpness(const cv::Mat &image, double factor);

  /// Single-channel 8-bit copy of any BGR, BGRA or gray input
  static cv::Mat toGray(const cv::Mat &image);

  /// Expand a gray or BGRA image to BGR
  static cv::Mat toBgr(const cv::Mat &image);

  const EnhancementConfig &getConfig() const { return m_config; }

private:
  EnhancementConfig m_config;
};

} // namespace scanpdf

#endif // SCANPDF_IMAGE_ENHANCER_HPP
