#ifndef SCANPDF_PAGE_SYNTHESIZER_HPP
#define SCANPDF_PAGE_SYNTHESIZER_HPP

#include "scanpdf/CoordinateMapper.hpp"
#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/Types.hpp"

#include <string>
#include <vector>

typedef struct _cairo_surface cairo_surface_t;
typedef struct _cairo cairo_t;

namespace scanpdf {

/**
 * @brief Assembles the page model for one output PDF page
 */
class PageSynthesizer {
public:
  PageSynthesizer() = default;
  explicit PageSynthesizer(const FontSizeConfig &config);

  /**
   * @brief Build a page from the final raster and its recognized lines
   *
   * The page is the raster's pixel size at its DPI. Lines must be in the
   * raster's pixel space.
   */
  SynthesizedPage synthesize(const RasterPage &background,
                             const std::vector<RecognizedLine> &lines) const;

  /**
   * @brief A page with no background and no text, for pages that could
   * not be rasterized
   */
  static SynthesizedPage blankPage(const PageSize &size);

private:
  CoordinateMapper m_mapper;
};

/**
 * @brief Result of writing one page
 */
struct PageWriteResult {
  bool success = false;             ///< Page was emitted
  int writtenLines = 0;             ///< Text runs embedded
  int skippedLines = 0;             ///< Text runs that failed to embed
  std::vector<std::string> lineErrors; ///< One message per skipped line
  std::string errorMessage;         ///< Page-level error
};

/**
 * @brief Multi-page PDF output through a Cairo PDF surface
 *
 * Each page gets the background raster stretched over the whole page and
 * one text run per mapped line. Cairo has no invisible text rendering
 * mode, so the text runs are drawn first and the opaque background is
 * painted over them: the glyphs stay in the content stream (selectable
 * and searchable) but are never seen.
 *
 * Output goes to "<path>.part" and is renamed to the final path only when
 * close() succeeds, so a failed save leaves nothing behind.
 *
 * Example usage:
 * @code
 * scanpdf::PdfWriter writer(config.font);
 * if (writer.open("out.pdf")) {
 *     writer.addPage(page);
 *     writer.close();
 * }
 * @endcode
 */
class PdfWriter {
public:
  explicit PdfWriter(const FontSizeConfig &config = FontSizeConfig());
  ~PdfWriter();

  PdfWriter(const PdfWriter &) = delete;
  PdfWriter &operator=(const PdfWriter &) = delete;

  /**
   * @brief Start a new document
   * @return false (with errorMessage() set) when the file cannot be created
   */
  bool open(const std::string &outputPath);

  bool isOpen() const { return m_surface != nullptr; }

  /**
   * @brief Append one page; individual line failures are skipped
   */
  PageWriteResult addPage(const SynthesizedPage &page);

  /**
   * @brief Finish the document and move it into place
   * @return false when Cairo reports an error or the rename fails
   */
  bool close();

  int pageCount() const { return m_pageCount; }

  const std::string &errorMessage() const { return m_errorMessage; }

private:
  /// Embed one text run; returns an error message, empty on success
  std::string drawLine(cairo_t *cr, const MappedLine &line);

  /// Paint the prepared raster (white when null) over the whole page
  void drawBackground(cairo_t *cr, const PageSize &size,
                      cairo_surface_t *image);

  /// Drop the unfinished output
  void abandon();

  FontSizeConfig m_config;
  cairo_surface_t *m_surface = nullptr;
  std::string m_outputPath;
  std::string m_partPath;
  int m_pageCount = 0;
  std::string m_errorMessage;
};

} // namespace scanpdf

#endif // SCANPDF_PAGE_SYNTHESIZER_HPP
