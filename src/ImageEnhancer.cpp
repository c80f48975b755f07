#include "scanpdf/ImageEnhancer.hpp"

#include <algorithm>

namespace scanpdf {

namespace {

bool isIdentity(double factor) { return factor == 1.0; }

} // namespace

ImageEnhancer::ImageEnhancer(const EnhancementConfig &config)
    : m_config(config) {}

cv::Mat ImageEnhancer::adjustBrightness(const cv::Mat &image, double factor) {
  cv::Mat result;
  image.convertTo(result, -1, factor, 0.0);
  return result;
}

cv::Mat ImageEnhancer::adjustContrast(const cv::Mat &image, double factor) {
  double mean = cv::mean(toGray(image))[0];
  cv::Mat result;
  image.convertTo(result, -1, factor, mean * (1.0 - factor));
  return result;
}

cv::Mat ImageEnhancer::adjustSharpness(const cv::Mat &image, double factor) {
  // 3x3 smoothing kernel with a heavier center weight
  cv::Mat kernel = (cv::Mat_<float>(3, 3) << 1, 1, 1, 1, 5, 1, 1, 1, 1) / 13.0f;
  cv::Mat smoothed;
  cv::filter2D(image, smoothed, -1, kernel, cv::Point(-1, -1), 0,
               cv::BORDER_REPLICATE);

  cv::Mat result;
  cv::addWeighted(image, factor, smoothed, 1.0 - factor, 0.0, result);
  return result;
}

cv::Mat ImageEnhancer::toGray(const cv::Mat &image) {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }
  if (gray.depth() != CV_8U) {
    gray.convertTo(gray, CV_8U);
  }
  return gray;
}

cv::Mat ImageEnhancer::toBgr(const cv::Mat &image) {
  cv::Mat bgr;
  if (image.channels() == 1) {
    cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = image.clone();
  }
  if (bgr.depth() != CV_8U) {
    bgr.convertTo(bgr, CV_8U);
  }
  return bgr;
}

EnhancedPage ImageEnhancer::enhance(const RasterPage &raster) const {
  EnhancedPage page;
  page.raster.dpi = raster.dpi;

  if (raster.empty()) {
    return page;
  }

  cv::Mat working = raster.image;

  if (!isIdentity(m_config.brightness)) {
    working = adjustBrightness(working, m_config.brightness);
  }
  if (!isIdentity(m_config.contrast)) {
    working = adjustContrast(working, m_config.contrast);
  }
  if (!isIdentity(m_config.sharpness)) {
    working = adjustSharpness(working, m_config.sharpness);
  }

  cv::Mat gray = toGray(working);

  if (m_config.denoise) {
    cv::Mat denoised;
    cv::bilateralFilter(gray, denoised, m_config.bilateralDiameter,
                        m_config.bilateralSigmaColor,
                        m_config.bilateralSigmaSpace);
    gray = denoised;
  }

  if (m_config.binarize) {
    int blockSize = std::max(3, m_config.thresholdBlockSize);
    if (blockSize % 2 == 0) {
      ++blockSize;
    }
    cv::adaptiveThreshold(gray, gray, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY, blockSize,
                          m_config.thresholdOffset);
  }

  page.raster.image = toBgr(gray);
  return page;
}

} // namespace scanpdf
