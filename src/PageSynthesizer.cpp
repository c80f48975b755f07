#include "scanpdf/PageSynthesizer.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <cairo-pdf.h>
#include <cairo.h>
#include <opencv2/imgproc.hpp>

namespace scanpdf {

namespace {

// Cairo refuses zero-sized pages
constexpr double kMinPageSizePt = 1.0;

// Largest image surface side Cairo accepts
constexpr int kMaxSurfaceSide = 32767;

std::string trimText(const std::string &text) {
  size_t start = text.find_first_not_of(" \t\n\r");
  size_t end = text.find_last_not_of(" \t\n\r");
  if (start == std::string::npos || end == std::string::npos) {
    return std::string();
  }
  return text.substr(start, end - start + 1);
}

/**
 * @brief Copy a raster into an RGB24 image surface
 *
 * Rasters wider or taller than Cairo allows are shrunk first; the surface is
 * stretched to the page anyway. Returns nullptr with error set when Cairo
 * cannot allocate the surface.
 */
cairo_surface_t *createBackgroundSurface(const cv::Mat &image,
                                         std::string &error) {
  cv::Mat bgr;
  if (image.channels() == 1) {
    cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = image;
  }

  int longest = std::max(bgr.cols, bgr.rows);
  if (longest > kMaxSurfaceSide) {
    double scale = static_cast<double>(kMaxSurfaceSide) / longest;
    cv::Size size(std::max(1, static_cast<int>(bgr.cols * scale)),
                  std::max(1, static_cast<int>(bgr.rows * scale)));
    cv::Mat shrunk;
    cv::resize(bgr, shrunk, size, 0, 0, cv::INTER_AREA);
    bgr = shrunk;
  }

  cairo_surface_t *imgSurface =
      cairo_image_surface_create(CAIRO_FORMAT_RGB24, bgr.cols, bgr.rows);
  cairo_status_t status = cairo_surface_status(imgSurface);
  if (status != CAIRO_STATUS_SUCCESS) {
    error = "Cannot create " + std::to_string(bgr.cols) + "x" +
            std::to_string(bgr.rows) +
            " background surface: " + cairo_status_to_string(status);
    cairo_surface_destroy(imgSurface);
    return nullptr;
  }

  cairo_surface_flush(imgSurface);
  unsigned char *data = cairo_image_surface_get_data(imgSurface);
  int stride = cairo_image_surface_get_stride(imgSurface);

  // Copy pixel data (Cairo uses BGRA on little-endian)
  for (int row = 0; row < bgr.rows; row++) {
    const auto *src = bgr.ptr<cv::Vec3b>(row);
    for (int col = 0; col < bgr.cols; col++) {
      int offset = row * stride + col * 4;
      data[offset + 0] = src[col][0]; // B
      data[offset + 1] = src[col][1]; // G
      data[offset + 2] = src[col][2]; // R
      data[offset + 3] = 255;         // A
    }
  }
  cairo_surface_mark_dirty(imgSurface);
  return imgSurface;
}

} // namespace

PageSynthesizer::PageSynthesizer(const FontSizeConfig &config)
    : m_mapper(config) {}

SynthesizedPage
PageSynthesizer::synthesize(const RasterPage &background,
                            const std::vector<RecognizedLine> &lines) const {
  SynthesizedPage page;
  page.size = CoordinateMapper::pageSizeForRaster(
      background.width(), background.height(), background.dpi);
  page.background = background.image;
  page.lines = m_mapper.mapLines(
      lines, cv::Size(background.width(), background.height()), page.size);
  return page;
}

SynthesizedPage PageSynthesizer::blankPage(const PageSize &size) {
  SynthesizedPage page;
  page.size = size;
  return page;
}

PdfWriter::PdfWriter(const FontSizeConfig &config) : m_config(config) {}

PdfWriter::~PdfWriter() {
  if (m_surface) {
    abandon();
  }
}

bool PdfWriter::open(const std::string &outputPath) {
  if (m_surface) {
    m_errorMessage = "A document is already open: " + m_outputPath;
    return false;
  }

  m_outputPath = outputPath;
  m_partPath = outputPath + ".part";
  m_pageCount = 0;
  m_errorMessage.clear();

  // Page size is set again for every page
  m_surface = cairo_pdf_surface_create(m_partPath.c_str(), 595.0, 842.0);
  cairo_status_t status = cairo_surface_status(m_surface);
  if (status != CAIRO_STATUS_SUCCESS) {
    m_errorMessage = "Failed to create PDF " + m_partPath + ": " +
                     cairo_status_to_string(status);
    cairo_surface_destroy(m_surface);
    m_surface = nullptr;
    std::error_code ec;
    std::filesystem::remove(m_partPath, ec);
    return false;
  }

  cairo_pdf_surface_set_metadata(m_surface, CAIRO_PDF_METADATA_CREATOR,
                                 "scanpdf");
  return true;
}

PageWriteResult PdfWriter::addPage(const SynthesizedPage &page) {
  PageWriteResult result;

  if (!m_surface) {
    result.errorMessage = "No document open";
    return result;
  }

  // Nothing is drawn until the background is ready
  cairo_surface_t *imgSurface = nullptr;
  if (!page.background.empty()) {
    imgSurface = createBackgroundSurface(page.background, result.errorMessage);
    if (!imgSurface) {
      return result;
    }
  }

  double width = std::max(page.size.width, kMinPageSizePt);
  double height = std::max(page.size.height, kMinPageSizePt);
  cairo_pdf_surface_set_size(m_surface, width, height);

  cairo_t *cr = cairo_create(m_surface);

  // Text layer first; the opaque background painted next hides it
  cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
  for (const auto &line : page.lines) {
    std::string error = drawLine(cr, line);
    if (error.empty()) {
      ++result.writtenLines;
    } else {
      ++result.skippedLines;
      result.lineErrors.push_back(error);
    }
  }

  drawBackground(cr, page.size, imgSurface);
  if (imgSurface) {
    cairo_surface_destroy(imgSurface);
  }

  cairo_show_page(cr);

  cairo_status_t status = cairo_status(cr);
  cairo_destroy(cr);

  if (status != CAIRO_STATUS_SUCCESS) {
    result.errorMessage =
        std::string("Cairo failed to emit page: ") +
        cairo_status_to_string(status);
    return result;
  }

  ++m_pageCount;
  result.success = true;
  return result;
}

std::string PdfWriter::drawLine(cairo_t *cr, const MappedLine &line) {
  std::string text = trimText(line.text);
  if (text.empty()) {
    return "empty text";
  }

  cairo_save(cr);
  cairo_select_font_face(cr, m_config.fontFamily.c_str(),
                         CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_font_size(cr, line.fontSize);

  cairo_scaled_font_t *font = cairo_get_scaled_font(cr);

  // Shape outside the drawing context: an invalid string here must not
  // put the context into an error state for the remaining lines.
  cairo_glyph_t *glyphs = nullptr;
  int numGlyphs = 0;
  cairo_text_cluster_t *clusters = nullptr;
  int numClusters = 0;
  cairo_text_cluster_flags_t clusterFlags;
  cairo_status_t status = cairo_scaled_font_text_to_glyphs(
      font, 0.0, 0.0, text.c_str(), static_cast<int>(text.size()), &glyphs,
      &numGlyphs, &clusters, &numClusters, &clusterFlags);

  if (status != CAIRO_STATUS_SUCCESS || numGlyphs == 0) {
    cairo_glyph_free(glyphs);
    cairo_text_cluster_free(clusters);
    cairo_restore(cr);
    return std::string("cannot shape \"") + text + "\": " +
           (status != CAIRO_STATUS_SUCCESS ? cairo_status_to_string(status)
                                           : "no glyphs");
  }

  cairo_font_extents_t fontExtents;
  cairo_scaled_font_extents(font, &fontExtents);
  cairo_text_extents_t textExtents;
  cairo_scaled_font_glyph_extents(font, glyphs, numGlyphs, &textExtents);

  // Stretch the run horizontally so selection covers the whole box
  double stretch = 1.0;
  if (textExtents.x_advance > 0 && line.box.width > 0) {
    stretch = line.box.width / textExtents.x_advance;
  }

  cairo_translate(cr, line.anchor.x, line.anchor.y + fontExtents.ascent);
  cairo_scale(cr, stretch, 1.0);
  cairo_show_text_glyphs(cr, text.c_str(), static_cast<int>(text.size()),
                         glyphs, numGlyphs, clusters, numClusters,
                         clusterFlags);

  cairo_glyph_free(glyphs);
  cairo_text_cluster_free(clusters);
  cairo_restore(cr);

  status = cairo_status(cr);
  if (status != CAIRO_STATUS_SUCCESS) {
    return std::string("Cairo rejected \"") + text + "\": " +
           cairo_status_to_string(status);
  }
  return std::string();
}

void PdfWriter::drawBackground(cairo_t *cr, const PageSize &size,
                               cairo_surface_t *image) {
  double width = std::max(size.width, kMinPageSizePt);
  double height = std::max(size.height, kMinPageSizePt);

  if (!image) {
    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_rectangle(cr, 0, 0, width, height);
    cairo_fill(cr);
    return;
  }

  cairo_save(cr);
  cairo_scale(cr, width / cairo_image_surface_get_width(image),
              height / cairo_image_surface_get_height(image));
  cairo_set_source_surface(cr, image, 0, 0);
  cairo_paint(cr);
  cairo_restore(cr);
}

bool PdfWriter::close() {
  if (!m_surface) {
    m_errorMessage = "No document open";
    return false;
  }

  cairo_surface_finish(m_surface);
  cairo_status_t status = cairo_surface_status(m_surface);
  cairo_surface_destroy(m_surface);
  m_surface = nullptr;

  std::error_code ec;
  if (status != CAIRO_STATUS_SUCCESS) {
    m_errorMessage = std::string("Failed to write PDF: ") +
                     cairo_status_to_string(status);
    std::filesystem::remove(m_partPath, ec);
    return false;
  }

  std::filesystem::rename(m_partPath, m_outputPath, ec);
  if (ec) {
    m_errorMessage = "Failed to move " + m_partPath + " to " + m_outputPath +
                     ": " + ec.message();
    std::filesystem::remove(m_partPath, ec);
    return false;
  }

  return true;
}

void PdfWriter::abandon() {
  cairo_surface_finish(m_surface);
  cairo_surface_destroy(m_surface);
  m_surface = nullptr;

  std::error_code ec;
  std::filesystem::remove(m_partPath, ec);
}

} // namespace scanpdf
