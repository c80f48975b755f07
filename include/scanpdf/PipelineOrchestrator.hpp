#ifndef SCANPDF_PIPELINE_ORCHESTRATOR_HPP
#define SCANPDF_PIPELINE_ORCHESTRATOR_HPP

#include "scanpdf/EdgeDetector.hpp"
#include "scanpdf/ImageEnhancer.hpp"
#include "scanpdf/PageSource.hpp"
#include "scanpdf/PageSynthesizer.hpp"
#include "scanpdf/PerspectiveRectifier.hpp"
#include "scanpdf/PipelineConfig.hpp"
#include "scanpdf/TextRecognizer.hpp"
#include "scanpdf/Types.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace scanpdf {

/**
 * @brief Result of running the stage chain on one raster
 */
struct PageOutcome {
  bool success = false;              ///< False when recognition failed
  ErrorKind error = ErrorKind::None; ///< First page-level failure
  std::string errorMessage;
  std::vector<ErrorKind> notes;      ///< NoDocumentEdges, SingularHomography
  RasterPage rectified;              ///< After rotation, crop and warp
  RasterPage enhanced;               ///< Raster given to the recognizer
  std::vector<RecognizedLine> lines; ///< Recognizer order
  SynthesizedPage page;              ///< Ready for PdfWriter
  double processingTimeMs = 0;
};

/**
 * @brief Sequences the page stages over whole documents
 *
 * In text modes each page tries the source's own text first and only falls
 * back to OCR when that text is blank (or forceOcr is set). In searchable
 * PDF mode every page goes through the full chain. Page failures are
 * recorded in the report and never stop the document; only open and save
 * failures fail a document.
 *
 * The recognizer is borrowed for the orchestrator's lifetime. Calls into it
 * are serialized unless it reports itself thread-safe, and calls into a
 * PageSource are always serialized.
 *
 * Example usage:
 * @code
 * scanpdf::TesseractRecognizer recognizer(config.ocr);
 * recognizer.initialize();
 * scanpdf::PipelineOrchestrator orchestrator(config, recognizer);
 * auto reports = orchestrator.processBatch({"scans/", "letter.pdf"});
 * @endcode
 */
class PipelineOrchestrator {
public:
  PipelineOrchestrator(const PipelineConfig &config,
                       TextRecognizer &recognizer);

  PipelineOrchestrator(const PipelineOrchestrator &) = delete;
  PipelineOrchestrator &operator=(const PipelineOrchestrator &) = delete;

  /**
   * @brief Raster -> (Quadrilateral) -> Rectified -> Enhanced -> Lines ->
   * SynthesizedPage for a single page
   *
   * Never throws. A recognition failure still yields a page carrying the
   * enhanced background and no lines.
   */
  PageOutcome processPage(const RasterPage &raster);

  /**
   * @brief Process every page of a source and write one output document
   * @param source Pages to process, in output order
   * @param outputPath Destination file (.txt/.md text or .pdf)
   */
  DocumentReport processDocument(PageSource &source,
                                 const std::string &outputPath);

  /**
   * @brief Open a PDF (or a single image) and process it
   *
   * The output lands in the configured output directory, or next to the
   * input, named by outputPathFor().
   */
  DocumentReport processFile(const std::string &inputPath);

  /**
   * @brief Build one document from photographed pages, one page per image
   */
  DocumentReport processImages(const std::vector<std::string> &imagePaths,
                               const std::string &outputPath);

  /**
   * @brief Process files and folders (every *.pdf inside, sorted by name)
   * @return One report per document, in input order
   */
  std::vector<DocumentReport>
  processBatch(const std::vector<std::string> &inputs);

  /**
   * @brief <stem>.txt, <stem>.md or <stem>_ocr.pdf for the current mode
   */
  std::string outputPathFor(const std::string &inputPath) const;

  /**
   * @brief Expand folders into their PDF files
   */
  static std::vector<std::string>
  collectInputs(const std::vector<std::string> &inputs);

  const PipelineConfig &getConfig() const;

private:
  /// Everything a worker produces for one page
  struct PageTask {
    PageReport report;
    std::string text;     ///< Text modes
    SynthesizedPage page; ///< Searchable PDF mode
  };

  PageTask runPageTask(PageSource &source, int index);
  PageTask runTextTask(PageSource &source, int index);
  PageTask runPdfTask(PageSource &source, int index);

  RasterResult renderSerialized(PageSource &source, int index);
  RecognitionResult recognizeSerialized(const cv::Mat &image, double dpi);

  bool writeTextFile(const std::string &path, const std::string &text,
                     std::string &errorMessage) const;

  void logDebug(const std::string &message) const;

  PipelineConfig m_config;
  TextRecognizer &m_recognizer;
  EdgeDetector m_edgeDetector;
  PerspectiveRectifier m_rectifier;
  ImageEnhancer m_enhancer;
  PageSynthesizer m_synthesizer;

  std::mutex m_recognizerMutex;
  std::mutex m_sourceMutex;
};

} // namespace scanpdf

#endif // SCANPDF_PIPELINE_ORCHESTRATOR_HPP
