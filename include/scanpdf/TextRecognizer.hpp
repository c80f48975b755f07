#ifndef SCANPDF_TEXT_RECOGNIZER_HPP
#define SCANPDF_TEXT_RECOGNIZER_HPP

#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/Types.hpp"

#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace scanpdf {

/**
 * @brief Result of recognizing one raster
 */
struct RecognitionResult {
  bool success = false;              ///< Engine ran to completion
  std::vector<RecognizedLine> lines; ///< Recognizer reading order
  std::string errorMessage;          ///< Error message if failed
  double processingTimeMs = 0;       ///< Processing time in milliseconds
};

/**
 * @brief Line-level OCR engine handle
 *
 * Boxes are reported in the pixel space of the image passed to
 * recognize(), in the engine's natural reading order. Callers must not
 * re-sort them.
 *
 * One handle is created per batch and shared by every page. When
 * isThreadSafe() returns false, callers must serialize recognize().
 */
class TextRecognizer {
public:
  virtual ~TextRecognizer() = default;

  /**
   * @brief Recognize text lines in a raster
   * @param image BGR, BGRA or gray raster in its final orientation
   * @param dpi Resolution of the raster, used as a sizing hint
   */
  virtual RecognitionResult recognize(const cv::Mat &image, double dpi) = 0;

  /// Whether recognize() may be called from several threads at once
  virtual bool isThreadSafe() const = 0;
};

/**
 * @brief TextRecognizer backed by the Tesseract API
 *
 * Not thread-safe: a TessBaseAPI holds per-image state between SetImage()
 * and the result iterator.
 *
 * Example usage:
 * @code
 * scanpdf::TesseractRecognizer recognizer(config.ocr);
 * if (recognizer.initialize()) {
 *     auto result = recognizer.recognize(page.image, page.dpi);
 * }
 * @endcode
 */
class TesseractRecognizer : public TextRecognizer {
public:
  explicit TesseractRecognizer(const OCRConfig &config = OCRConfig());
  ~TesseractRecognizer() override;

  // Disable copy operations (Tesseract API is not copyable)
  TesseractRecognizer(const TesseractRecognizer &) = delete;
  TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;

  /**
   * @brief Initialize the OCR engine
   *
   * The tessdata location is taken from the configuration, then from
   * TESSDATA_PREFIX, then from Tesseract's compiled-in default.
   *
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  RecognitionResult recognize(const cv::Mat &image, double dpi) override;

  bool isThreadSafe() const override { return false; }

  const OCRConfig &getConfig() const;

  /// Tesseract version string
  static std::string getTesseractVersion();

  /// Languages available in the loaded tessdata directory
  std::vector<std::string> getAvailableLanguages() const;

private:
  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  OCRConfig m_config;
  bool m_initialized = false;
};

} // namespace scanpdf

#endif // SCANPDF_TEXT_RECOGNIZER_HPP
