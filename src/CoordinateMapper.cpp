#include "scanpdf/CoordinateMapper.hpp"

#include <algorithm>
#include <cmath>

namespace scanpdf {

CoordinateMapper::CoordinateMapper(const FontSizeConfig &config)
    : m_config(config) {}

PageSize CoordinateMapper::pageSizeForRaster(int widthPx, int heightPx,
                                             double dpi) {
  PageSize size;
  if (dpi <= 0) {
    return size;
  }
  size.width = widthPx * 72.0 / dpi;
  size.height = heightPx * 72.0 / dpi;
  return size;
}

double CoordinateMapper::fontSizeForHeight(double heightPt) const {
  double lo = std::min(m_config.minPt, m_config.maxPt);
  double hi = std::max(m_config.minPt, m_config.maxPt);
  double size = heightPt * m_config.heightRatio;
  if (!std::isfinite(size)) {
    return lo;
  }
  return std::clamp(size, lo, hi);
}

std::vector<MappedLine>
CoordinateMapper::mapLines(const std::vector<RecognizedLine> &lines,
                           const cv::Size &rasterSize,
                           const PageSize &pageSize) const {
  std::vector<MappedLine> mapped;
  if (rasterSize.width <= 0 || rasterSize.height <= 0 ||
      pageSize.width <= 0 || pageSize.height <= 0) {
    return mapped;
  }

  double scaleX = pageSize.width / rasterSize.width;
  double scaleY = pageSize.height / rasterSize.height;

  mapped.reserve(lines.size());
  for (const auto &line : lines) {
    const cv::Rect &box = line.boundingBox;

    double left = std::clamp(box.x * scaleX, 0.0, pageSize.width);
    double top = std::clamp(box.y * scaleY, 0.0, pageSize.height);
    double right = std::clamp((box.x + box.width) * scaleX, left,
                              pageSize.width);
    double bottom = std::clamp((box.y + box.height) * scaleY, top,
                               pageSize.height);

    MappedLine out;
    out.box = cv::Rect2d(left, top, right - left, bottom - top);
    out.anchor = cv::Point2d(left, top);
    out.fontSize = fontSizeForHeight(bottom - top);
    out.text = line.text;
    mapped.push_back(out);
  }

  return mapped;
}

} // namespace scanpdf
