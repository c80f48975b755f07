#ifndef SCANPDF_PIPELINE_CONFIG_HPP
#define SCANPDF_PIPELINE_CONFIG_HPP

#include <opencv2/core.hpp>
#include <tesseract/publictypes.h>

#include <optional>
#include <string>

namespace scanpdf {

/**
 * @brief What the pipeline writes for each document
 */
enum class OutputMode {
  Text,         ///< UTF-8 .txt, OCR only where no text can be extracted
  Markdown,     ///< Same as Text, written as .md with rule separators
  SearchablePdf ///< New PDF, every page rasterized and OCR-indexed
};

/**
 * @brief Tunables for document edge detection
 */
struct EdgeDetectionConfig {
  int blurKernelSize = 5;        ///< Gaussian kernel (odd)
  double cannyLowThreshold = 75.0;
  double cannyHighThreshold = 200.0;
  double approxTolerance = 0.02; ///< Fraction of contour perimeter
};

/**
 * @brief Tunables for perspective rectification
 */
struct RectificationConfig {
  double minQuadArea = 1.0;          ///< Below this (px^2) the quad is degenerate
  double singularDeterminant = 1e-9; ///< |det(H)| below this is singular
};

/**
 * @brief Tunables for the enhancement stages
 *
 * A factor of exactly 1.0 skips its stage.
 */
struct EnhancementConfig {
  double brightness = 1.0;
  double contrast = 1.5;
  double sharpness = 1.0;
  bool denoise = true;   ///< Bilateral filter after grayscale conversion
  int bilateralDiameter = 9;
  double bilateralSigmaColor = 75.0;
  double bilateralSigmaSpace = 75.0;
  bool binarize = true;  ///< Adaptive Gaussian threshold
  int thresholdBlockSize = 11;
  double thresholdOffset = 2.0;
};

/**
 * @brief Invisible glyph sizing
 */
struct FontSizeConfig {
  double heightRatio = 0.8; ///< Font size as a fraction of box height
  double minPt = 4.0;
  double maxPt = 30.0;
  std::string fontFamily = "Sans";
};

/**
 * @brief Tesseract settings
 */
struct OCRConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode = tesseract::PSM_AUTO;
  int minConfidence = 0;     ///< Lines below this (0-100) are dropped
  std::string tessDataPath;  ///< Empty = TESSDATA_PREFIX, then built-in
  int timeoutMs = 0;         ///< Per-page recognition deadline, 0 = none
};

/**
 * @brief Complete pipeline configuration
 */
struct PipelineConfig {
  OutputMode mode = OutputMode::Text;
  double dpi = 300.0;
  bool forceOcr = false;
  int rotation = 0;                 ///< Clockwise degrees: 0, 90, 180 or 270
  std::optional<cv::Rect> crop;     ///< In rotated raster pixels
  bool autoEnhance = false;         ///< Edge detection + rectification
  int jobs = 1;                     ///< Page worker threads
  std::string outputDir;            ///< Empty = next to the input
  bool verbose = false;             ///< Emit DEBUG diagnostics

  EdgeDetectionConfig edges;
  RectificationConfig rectification;
  EnhancementConfig enhancement;
  FontSizeConfig font;
  OCRConfig ocr;
};

} // namespace scanpdf

#endif // SCANPDF_PIPELINE_CONFIG_HPP
