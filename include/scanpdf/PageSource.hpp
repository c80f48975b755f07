#ifndef SCANPDF_PAGE_SOURCE_HPP
#define SCANPDF_PAGE_SOURCE_HPP

#include "scanpdf/RasterLoader.hpp"
#include "scanpdf/Types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
} // namespace poppler

namespace scanpdf {

/**
 * @brief A multi-page input the orchestrator can walk
 *
 * Implementations are not required to be thread-safe; the orchestrator
 * serializes calls into a source.
 */
class PageSource {
public:
  virtual ~PageSource() = default;

  /// Number of pages
  virtual int pageCount() const = 0;

  /**
   * @brief Page size in points, used for pages that fail to render
   * @param index 0-indexed page
   */
  virtual PageSize pageSize(int index) const = 0;

  /**
   * @brief Text already embedded in the page (empty when none)
   *
   * Throws on extraction errors; callers treat that as "no text".
   */
  virtual std::string extractText(int index) = 0;

  /// Materialize the page at the requested DPI
  virtual RasterResult renderPage(int index, double dpi) = 0;
};

/**
 * @brief Pages of a PDF file, read through Poppler
 */
class PdfPageSource : public PageSource {
public:
  /**
   * @brief Open a PDF
   * @throws std::runtime_error when the file cannot be loaded or is locked
   */
  explicit PdfPageSource(const std::string &pdfPath);
  ~PdfPageSource() override;

  PdfPageSource(const PdfPageSource &) = delete;
  PdfPageSource &operator=(const PdfPageSource &) = delete;

  int pageCount() const override;
  PageSize pageSize(int index) const override;
  std::string extractText(int index) override;
  RasterResult renderPage(int index, double dpi) override;

private:
  std::unique_ptr<poppler::document> m_document;
  std::string m_path;
};

/**
 * @brief One page per image file (photographed pages)
 *
 * Images never carry embedded text. Their page size is derived from the
 * pixel size at the DPI the source was created with.
 */
class ImagePageSource : public PageSource {
public:
  ImagePageSource(std::vector<std::string> imagePaths, double dpi);

  int pageCount() const override;
  PageSize pageSize(int index) const override;
  std::string extractText(int index) override;
  RasterResult renderPage(int index, double dpi) override;

private:
  std::vector<std::string> m_paths;
  double m_dpi;
};

/**
 * @brief True when text has at least one non-whitespace character
 */
bool hasMeaningfulText(const std::string &text);

} // namespace scanpdf

#endif // SCANPDF_PAGE_SOURCE_HPP
