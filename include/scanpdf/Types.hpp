#ifndef SCANPDF_TYPES_HPP
#define SCANPDF_TYPES_HPP

#include <opencv2/opencv.hpp>

#include <array>
#include <string>
#include <vector>

namespace scanpdf {

/**
 * @brief Kinds of problems the pipeline can run into
 *
 * Only DocumentOpenFailure and OutputWriteFailure ever fail a whole
 * document. NoDocumentEdges and SingularHomography are informational: the
 * page continues with the full frame or the unwarped raster.
 */
enum class ErrorKind {
  None,
  UnreadableRaster,     ///< Page could not be decoded or rendered
  NoDocumentEdges,      ///< Edge search found nothing, full frame used
  SingularHomography,   ///< Degenerate quadrilateral, rectification skipped
  RecognitionFailure,   ///< OCR engine failed, timed out or threw
  TextInsertionFailure, ///< A single line could not be embedded
  OutputWriteFailure,   ///< Final document could not be saved
  DocumentOpenFailure   ///< Input document could not be opened
};

/**
 * @brief Human-readable name of an error kind
 */
std::string errorKindToString(ErrorKind kind);

/**
 * @brief A page held as pixels
 */
struct RasterPage {
  cv::Mat image;     ///< Pixel buffer (BGR, BGRA or gray)
  double dpi = 300.0; ///< Resolution the buffer was produced at

  int width() const { return image.cols; }
  int height() const { return image.rows; }
  int channels() const { return image.channels(); }
  int depth() const { return image.depth(); }
  bool empty() const { return image.empty(); }
};

/**
 * @brief Four document corners in canonical order
 *
 * corners[0] is top-left, then top-right, bottom-right, bottom-left.
 */
struct Quadrilateral {
  std::array<cv::Point2f, 4> corners;
  bool degenerate = false; ///< Built from a bounding rectangle

  const cv::Point2f &topLeft() const { return corners[0]; }
  const cv::Point2f &topRight() const { return corners[1]; }
  const cv::Point2f &bottomRight() const { return corners[2]; }
  const cv::Point2f &bottomLeft() const { return corners[3]; }
};

/**
 * @brief Output of the perspective rectifier
 */
struct RectifiedPage {
  RasterPage raster;
  bool applied = false;    ///< False when the input was returned unchanged
  std::string skipReason;  ///< Why rectification was skipped
};

/**
 * @brief Raster after tone, denoise and threshold stages (always BGR)
 */
struct EnhancedPage {
  RasterPage raster;
};

/**
 * @brief One line reported by the text recognizer
 */
struct RecognizedLine {
  cv::Rect boundingBox;    ///< In the pixel space of the recognized raster
  std::string text;        ///< UTF-8 text
  float confidence = 0.0f; ///< Normalized to [0, 1]
};

/**
 * @brief Page size in PDF points
 */
struct PageSize {
  double width = 0.0;
  double height = 0.0;
};

/**
 * @brief A recognized line converted to PDF point space
 *
 * Coordinates use a top-left origin with y growing downward, which is how
 * Cairo addresses a PDF page.
 */
struct MappedLine {
  cv::Rect2d box;        ///< Bounding box in points
  cv::Point2d anchor;    ///< Top-left insertion point in points
  double fontSize = 0.0; ///< Clamped font size in points
  std::string text;
};

/**
 * @brief Everything needed to emit one output PDF page
 */
struct SynthesizedPage {
  PageSize size;                 ///< Page size in points
  cv::Mat background;            ///< Full-page background (BGR), may be empty
  std::vector<MappedLine> lines; ///< Invisible text runs, recognizer order
};

/**
 * @brief Outcome of processing one page
 */
struct PageReport {
  int pageNumber = 0;                  ///< 1-indexed
  bool success = true;                 ///< False for page-level failures
  ErrorKind error = ErrorKind::None;   ///< First failure on the page
  std::string errorMessage;            ///< Details for error
  std::vector<ErrorKind> notes;        ///< Informational outcomes
  bool usedOcr = false;                ///< Recognizer was invoked
  int lineCount = 0;                   ///< Lines recognized or extracted
  int skippedLines = 0;                ///< Lines that failed to embed
  double processingTimeMs = 0;
};

/**
 * @brief Outcome of processing one document
 */
struct DocumentReport {
  std::string inputPath;
  std::string outputPath;
  bool success = false;      ///< Output written
  ErrorKind error = ErrorKind::None;
  std::string errorMessage;
  int totalPages = 0;
  int succeededPages = 0;
  int failedPages = 0;
  std::vector<PageReport> pages; ///< Input page order
  double processingTimeMs = 0;
};

} // namespace scanpdf

#endif // SCANPDF_TYPES_HPP
