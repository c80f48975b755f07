#include "scanpdf/TextRecognizer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <opencv2/imgproc.hpp>
#include <tesseract/ocrclass.h>
#include <tesseract/resultiterator.h>

namespace scanpdf {

namespace {

std::string trimLine(const std::string &text) {
  size_t start = text.find_first_not_of(" \t\n\r");
  size_t end = text.find_last_not_of(" \t\n\r");
  if (start == std::string::npos || end == std::string::npos) {
    return std::string();
  }
  return text.substr(start, end - start + 1);
}

} // namespace

TesseractRecognizer::TesseractRecognizer(const OCRConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()),
      m_config(config) {}

TesseractRecognizer::~TesseractRecognizer() { m_tesseract->End(); }

bool TesseractRecognizer::initialize() {
  if (m_initialized) {
    return true;
  }

  // Configured path, then TESSDATA_PREFIX, then the compiled-in location
  const char *dataPath = m_config.tessDataPath.empty()
                             ? std::getenv("TESSDATA_PREFIX")
                             : m_config.tessDataPath.c_str();
  if (dataPath == nullptr) {
    std::cerr << "WARNING: TESSDATA_PREFIX not set, using Tesseract default"
              << std::endl;
  }

  if (m_tesseract->Init(dataPath, m_config.language.c_str()) != 0) {
    std::cerr << "ERROR: Cannot load Tesseract language '"
              << m_config.language << "'"
              << (dataPath ? std::string(" from ") + dataPath : std::string())
              << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool TesseractRecognizer::isInitialized() const { return m_initialized; }

RecognitionResult TesseractRecognizer::recognize(const cv::Mat &image,
                                                 double dpi) {
  RecognitionResult result;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    // Tesseract copies packed RGB into its own Pix
    cv::Mat rgb;
    if (image.channels() == 1) {
      cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
    } else if (image.channels() == 4) {
      cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
    } else {
      cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
    }
    m_tesseract->SetImage(rgb.data, rgb.cols, rgb.rows, 3,
                          static_cast<int>(rgb.step));
    if (dpi > 0) {
      m_tesseract->SetSourceResolution(static_cast<int>(dpi));
    }

    tesseract::ETEXT_DESC monitor;
    if (m_config.timeoutMs > 0) {
      monitor.set_deadline_msecs(m_config.timeoutMs);
    }

    // Must call Recognize before GetIterator
    int status = m_tesseract->Recognize(&monitor);
    if (m_config.timeoutMs > 0 && monitor.deadline_exceeded()) {
      result.errorMessage = "Recognition timed out after " +
                            std::to_string(m_config.timeoutMs) + " ms";
    } else if (status != 0) {
      result.errorMessage = "Tesseract recognition failed";
    } else {
      std::unique_ptr<tesseract::ResultIterator> ri(
          m_tesseract->GetIterator());
      tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;

      if (ri != nullptr && !ri->Empty(level)) {
        do {
          char *text = ri->GetUTF8Text(level);
          float conf = ri->Confidence(level);

          std::string lineText = text != nullptr ? trimLine(text) : "";
          delete[] text;

          if (lineText.empty() || conf < m_config.minConfidence) {
            continue;
          }

          int x1, y1, x2, y2;
          if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
            continue;
          }

          RecognizedLine line;
          line.text = lineText;
          line.confidence = std::min(1.0f, std::max(0.0f, conf / 100.0f));
          line.boundingBox = cv::Rect(x1, y1, x2 - x1, y2 - y1);
          result.lines.push_back(line);
        } while (ri->Next(level));
      }

      result.success = true;
    }
  } catch (const std::exception &e) {
    result.lines.clear();
    result.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  m_tesseract->Clear();

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const OCRConfig &TesseractRecognizer::getConfig() const { return m_config; }

std::string TesseractRecognizer::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> TesseractRecognizer::getAvailableLanguages() const {
  std::vector<std::string> languages;
  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }
  return languages;
}

} // namespace scanpdf
