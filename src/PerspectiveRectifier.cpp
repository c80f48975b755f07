#include "scanpdf/PerspectiveRectifier.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace scanpdf {

namespace {

// Ties on the ordering key are broken by x then y so that the chosen
// corner never depends on the order the points were listed in.
template <typename Key>
const cv::Point2f &pickCorner(const std::vector<cv::Point2f> &pts, Key key,
                              bool largest) {
  auto less = [&key](const cv::Point2f &a, const cv::Point2f &b) {
    float ka = key(a);
    float kb = key(b);
    if (ka != kb)
      return ka < kb;
    if (a.x != b.x)
      return a.x < b.x;
    return a.y < b.y;
  };
  return largest ? *std::max_element(pts.begin(), pts.end(), less)
                 : *std::min_element(pts.begin(), pts.end(), less);
}

bool cornersDistinct(const Quadrilateral &quad) {
  for (size_t i = 0; i < quad.corners.size(); ++i) {
    for (size_t j = i + 1; j < quad.corners.size(); ++j) {
      if (cv::norm(quad.corners[i] - quad.corners[j]) < 1e-3) {
        return false;
      }
    }
  }
  return true;
}

} // namespace

Quadrilateral orderCorners(const std::vector<cv::Point2f> &points) {
  if (points.size() != 4) {
    throw std::invalid_argument("A quadrilateral needs exactly 4 points, got " +
                                std::to_string(points.size()));
  }

  auto sum = [](const cv::Point2f &p) { return p.x + p.y; };
  auto diff = [](const cv::Point2f &p) { return p.y - p.x; };

  Quadrilateral quad;
  quad.corners[0] = pickCorner(points, sum, false);  // top-left
  quad.corners[1] = pickCorner(points, diff, false); // top-right
  quad.corners[2] = pickCorner(points, sum, true);   // bottom-right
  quad.corners[3] = pickCorner(points, diff, true);  // bottom-left
  return quad;
}

Quadrilateral orderCorners(const std::vector<cv::Point> &points) {
  std::vector<cv::Point2f> pts;
  pts.reserve(points.size());
  for (const auto &p : points) {
    pts.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
  }
  return orderCorners(pts);
}

Quadrilateral fullFrameQuad(int width, int height) {
  auto w = static_cast<float>(width);
  auto h = static_cast<float>(height);
  Quadrilateral quad;
  quad.corners = {cv::Point2f(0.0f, 0.0f), cv::Point2f(w, 0.0f),
                  cv::Point2f(w, h), cv::Point2f(0.0f, h)};
  return quad;
}

PerspectiveRectifier::PerspectiveRectifier(const RectificationConfig &config)
    : m_config(config) {}

cv::Size PerspectiveRectifier::targetSize(const Quadrilateral &quad) {
  double widthTop = cv::norm(quad.topRight() - quad.topLeft());
  double widthBottom = cv::norm(quad.bottomRight() - quad.bottomLeft());
  double heightLeft = cv::norm(quad.bottomLeft() - quad.topLeft());
  double heightRight = cv::norm(quad.bottomRight() - quad.topRight());

  return cv::Size(static_cast<int>(std::lround(std::max(widthTop, widthBottom))),
                  static_cast<int>(std::lround(std::max(heightLeft, heightRight))));
}

RectifiedPage PerspectiveRectifier::rectify(const RasterPage &raster,
                                            const Quadrilateral &quad) const {
  RectifiedPage result;
  result.raster = raster;

  if (raster.empty()) {
    result.skipReason = "empty raster";
    return result;
  }

  try {
    Quadrilateral ordered = orderCorners(
        std::vector<cv::Point2f>(quad.corners.begin(), quad.corners.end()));

    if (!cornersDistinct(ordered)) {
      result.skipReason = "corners collapse under canonical ordering";
      return result;
    }

    std::vector<cv::Point2f> src(ordered.corners.begin(),
                                 ordered.corners.end());
    if (std::abs(cv::contourArea(src)) < m_config.minQuadArea) {
      result.skipReason = "collinear quadrilateral";
      return result;
    }

    cv::Size size = targetSize(ordered);
    if (size.width < 1 || size.height < 1) {
      result.skipReason = "zero-sized target rectangle";
      return result;
    }

    auto w = static_cast<float>(size.width);
    auto h = static_cast<float>(size.height);
    std::vector<cv::Point2f> dst = {cv::Point2f(0.0f, 0.0f),
                                    cv::Point2f(w, 0.0f), cv::Point2f(w, h),
                                    cv::Point2f(0.0f, h)};

    cv::Mat matrix = cv::getPerspectiveTransform(src, dst);
    double det = cv::determinant(matrix);
    if (!cv::checkRange(matrix) || !std::isfinite(det) ||
        std::abs(det) < m_config.singularDeterminant) {
      result.skipReason = "singular homography";
      return result;
    }

    cv::Mat warped;
    cv::warpPerspective(raster.image, warped, matrix, size, cv::INTER_LINEAR,
                        cv::BORDER_REPLICATE);
    if (warped.empty()) {
      result.skipReason = "warp produced an empty image";
      return result;
    }

    result.raster.image = warped;
    result.applied = true;
  } catch (const cv::Exception &e) {
    result.raster = raster;
    result.skipReason = std::string("OpenCV rejected the transform: ") +
                        e.what();
  }

  return result;
}

} // namespace scanpdf
