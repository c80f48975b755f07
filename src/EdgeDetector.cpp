#include "scanpdf/EdgeDetector.hpp"

#include "scanpdf/PerspectiveRectifier.hpp"

#include <algorithm>

namespace scanpdf {

EdgeDetector::EdgeDetector(const EdgeDetectionConfig &config)
    : m_config(config) {}

cv::Mat EdgeDetector::edgeMap(const cv::Mat &image) const {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image;
  }

  int kernel = std::max(1, m_config.blurKernelSize);
  if (kernel % 2 == 0) {
    ++kernel;
  }

  cv::Mat blurred;
  cv::GaussianBlur(gray, blurred, cv::Size(kernel, kernel), 0);

  cv::Mat edges;
  cv::Canny(blurred, edges, m_config.cannyLowThreshold,
            m_config.cannyHighThreshold);
  return edges;
}

std::optional<Quadrilateral> EdgeDetector::detect(const cv::Mat &image) const {
  if (image.empty()) {
    return std::nullopt;
  }

  cv::Mat edges = edgeMap(image);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) {
    return std::nullopt;
  }

  auto largest = std::max_element(
      contours.begin(), contours.end(),
      [](const std::vector<cv::Point> &a, const std::vector<cv::Point> &b) {
        return cv::contourArea(a) < cv::contourArea(b);
      });

  double peri = cv::arcLength(*largest, true);
  std::vector<cv::Point> approx;
  cv::approxPolyDP(*largest, approx, m_config.approxTolerance * peri, true);

  if (approx.size() == 4) {
    return orderCorners(approx);
  }

  // Not a clean quadrilateral: fall back to the bounding rectangle
  cv::Rect bound = cv::boundingRect(*largest);
  Quadrilateral quad;
  quad.corners = {cv::Point2f(static_cast<float>(bound.x),
                              static_cast<float>(bound.y)),
                  cv::Point2f(static_cast<float>(bound.x + bound.width),
                              static_cast<float>(bound.y)),
                  cv::Point2f(static_cast<float>(bound.x + bound.width),
                              static_cast<float>(bound.y + bound.height)),
                  cv::Point2f(static_cast<float>(bound.x),
                              static_cast<float>(bound.y + bound.height))};
  quad.degenerate = true;
  return quad;
}

} // namespace scanpdf
