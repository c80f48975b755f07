#include "scanpdf/PipelineOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>

namespace scanpdf {

namespace fs = std::filesystem;

namespace {

const char *const kTextPageSeparator = "\f";
const char *const kMarkdownPageSeparator = "\n\n---\n\n";

// A4, used when a page that failed to render has no readable size either
constexpr double kFallbackPageWidthPt = 595.0;
constexpr double kFallbackPageHeightPt = 842.0;

// Finished pages a worker may hold ahead of the writer, per worker
constexpr int kLookAheadPerJob = 2;

std::string lowercaseExtension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

bool isImageFile(const fs::path &path) {
  static const std::vector<std::string> extensions = {
      ".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp", ".webp"};
  std::string ext = lowercaseExtension(path);
  return std::find(extensions.begin(), extensions.end(), ext) !=
         extensions.end();
}

int countTextLines(const std::string &text) {
  int count = 0;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (hasMeaningfulText(line)) {
      ++count;
    }
  }
  return count;
}

std::string joinLines(const std::vector<RecognizedLine> &lines) {
  std::string text;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      text += "\n";
    }
    text += lines[i].text;
  }
  return text;
}

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig &config,
                                           TextRecognizer &recognizer)
    : m_config(config), m_recognizer(recognizer),
      m_edgeDetector(config.edges), m_rectifier(config.rectification),
      m_enhancer(config.enhancement), m_synthesizer(config.font) {}

const PipelineConfig &PipelineOrchestrator::getConfig() const {
  return m_config;
}

PageOutcome PipelineOrchestrator::processPage(const RasterPage &raster) {
  PageOutcome outcome;
  auto startTime = std::chrono::high_resolution_clock::now();

  // Stage 1: rotation and working region
  RasterPage working;
  try {
    working = prepareRaster(raster, m_config.rotation, m_config.crop);
  } catch (const std::exception &e) {
    outcome.error = ErrorKind::UnreadableRaster;
    outcome.errorMessage = std::string("Failed to prepare raster: ") + e.what();
    outcome.processingTimeMs = elapsedMs(startTime);
    return outcome;
  }

  if (working.empty()) {
    outcome.error = ErrorKind::UnreadableRaster;
    outcome.errorMessage = "Raster is empty";
    outcome.processingTimeMs = elapsedMs(startTime);
    return outcome;
  }

  // Stage 2: document boundary and perspective correction
  outcome.rectified = working;
  if (m_config.autoEnhance) {
    std::optional<Quadrilateral> quad = m_edgeDetector.detect(working.image);
    if (!quad) {
      outcome.notes.push_back(ErrorKind::NoDocumentEdges);
      logDebug("No document edges found, using the full frame");
      quad = fullFrameQuad(working.width(), working.height());
    }

    RectifiedPage rectified = m_rectifier.rectify(working, *quad);
    if (!rectified.applied) {
      outcome.notes.push_back(ErrorKind::SingularHomography);
      logDebug("Rectification skipped: " + rectified.skipReason);
    }
    outcome.rectified = rectified.raster;
  }

  // Stage 3: enhancement
  try {
    outcome.enhanced = m_enhancer.enhance(outcome.rectified).raster;
  } catch (const std::exception &e) {
    logDebug(std::string("Enhancement failed, using rectified raster: ") +
             e.what());
    outcome.enhanced = outcome.rectified;
  }

  // Stage 4: recognition
  RecognitionResult recognition;
  try {
    recognition =
        recognizeSerialized(outcome.enhanced.image, outcome.enhanced.dpi);
  } catch (const std::exception &e) {
    recognition = RecognitionResult();
    recognition.errorMessage =
        std::string("Recognizer threw an exception: ") + e.what();
  }

  if (recognition.success) {
    outcome.lines = recognition.lines;
    outcome.success = true;
  } else {
    outcome.error = ErrorKind::RecognitionFailure;
    outcome.errorMessage = recognition.errorMessage.empty()
                               ? "Recognizer returned no result"
                               : recognition.errorMessage;
  }

  // Stage 5: page model (also for failed recognition, with no lines)
  outcome.page = m_synthesizer.synthesize(outcome.enhanced, outcome.lines);

  outcome.processingTimeMs = elapsedMs(startTime);
  return outcome;
}

DocumentReport PipelineOrchestrator::processDocument(
    PageSource &source, const std::string &outputPath) {
  DocumentReport report;
  report.outputPath = outputPath;
  auto startTime = std::chrono::high_resolution_clock::now();

  report.totalPages = source.pageCount();
  if (report.totalPages <= 0) {
    report.error = ErrorKind::DocumentOpenFailure;
    report.errorMessage = "Document has no pages";
    report.processingTimeMs = elapsedMs(startTime);
    return report;
  }

  const bool pdfMode = m_config.mode == OutputMode::SearchablePdf;
  const char *separator = m_config.mode == OutputMode::Markdown
                              ? kMarkdownPageSeparator
                              : kTextPageSeparator;

  PdfWriter writer(m_config.font);
  if (pdfMode && !writer.open(outputPath)) {
    report.error = ErrorKind::OutputWriteFailure;
    report.errorMessage = writer.errorMessage();
    report.processingTimeMs = elapsedMs(startTime);
    return report;
  }

  std::string documentText;

  // Consumes page results strictly in page order
  auto consume = [&](PageTask &task) {
    PageReport &page = task.report;

    if (pdfMode) {
      PageWriteResult written = writer.addPage(task.page);
      page.skippedLines += written.skippedLines;
      if (written.skippedLines > 0) {
        page.notes.push_back(ErrorKind::TextInsertionFailure);
        for (const auto &lineError : written.lineErrors) {
          std::cerr << "WARNING: Page " << page.pageNumber
                    << ": skipped text line: " << lineError << std::endl;
        }
      }
      if (!written.success && page.success) {
        page.success = false;
        page.error = ErrorKind::OutputWriteFailure;
        page.errorMessage = written.errorMessage;
      }
    } else {
      if (page.pageNumber > 1) {
        documentText += separator;
      }
      documentText += task.text;
    }

    if (page.success) {
      ++report.succeededPages;
    } else {
      ++report.failedPages;
      std::cerr << "WARNING: Page " << page.pageNumber << " failed ("
                << errorKindToString(page.error)
                << "): " << page.errorMessage << std::endl;
    }

    logDebug("Page " + std::to_string(page.pageNumber) + "/" +
             std::to_string(report.totalPages) + ": " +
             (page.usedOcr ? "ocr" : "extracted") + ", " +
             std::to_string(page.lineCount) + " lines, " +
             std::to_string(static_cast<int>(page.processingTimeMs)) + " ms");

    report.pages.push_back(std::move(page));
  };

  const int pageCount = report.totalPages;
  const int jobs = std::max(1, std::min(m_config.jobs, pageCount));

  if (jobs == 1) {
    for (int i = 0; i < pageCount; ++i) {
      PageTask task = runPageTask(source, i);
      consume(task);
    }
  } else {
    // Workers claim page indices; results land in their own slot and are
    // consumed here in index order as soon as each one is ready. A worker
    // may run at most kLookAheadPerJob * jobs pages past the consumer.
    std::vector<std::optional<PageTask>> slots(pageCount);
    std::mutex slotMutex;
    std::condition_variable slotReady;
    std::condition_variable slotFreed;
    std::atomic<int> nextPage(0);
    int consumed = 0;
    bool stopping = false;
    const int lookAhead = kLookAheadPerJob * jobs;

    auto worker = [&]() {
      for (;;) {
        int index = nextPage++;
        if (index >= pageCount) {
          break;
        }
        {
          std::unique_lock<std::mutex> lock(slotMutex);
          slotFreed.wait(lock, [&]() {
            return stopping || index < consumed + lookAhead;
          });
          if (stopping) {
            break;
          }
        }
        PageTask task = runPageTask(source, index);
        {
          std::lock_guard<std::mutex> lock(slotMutex);
          slots[index] = std::move(task);
        }
        slotReady.notify_all();
      }
    };

    std::vector<std::thread> workers;
    workers.reserve(jobs);
    for (int i = 0; i < jobs; ++i) {
      workers.emplace_back(worker);
    }

    auto joinWorkers = [&]() {
      {
        std::lock_guard<std::mutex> lock(slotMutex);
        stopping = true;
      }
      slotFreed.notify_all();
      for (auto &thread : workers) {
        thread.join();
      }
    };

    try {
      for (int i = 0; i < pageCount; ++i) {
        PageTask task;
        {
          std::unique_lock<std::mutex> lock(slotMutex);
          slotReady.wait(lock, [&]() { return slots[i].has_value(); });
          task = std::move(*slots[i]);
          slots[i].reset();
        }
        consume(task);
        {
          std::lock_guard<std::mutex> lock(slotMutex);
          consumed = i + 1;
        }
        slotFreed.notify_all();
      }
    } catch (...) {
      // Workers must be joined before the exception leaves this frame
      joinWorkers();
      throw;
    }

    joinWorkers();
  }

  std::string writeError;
  bool written = false;
  if (pdfMode) {
    written = writer.close();
    writeError = writer.errorMessage();
  } else {
    written = writeTextFile(outputPath, documentText, writeError);
  }

  if (written) {
    report.success = true;
  } else {
    report.error = ErrorKind::OutputWriteFailure;
    report.errorMessage = writeError;
  }

  report.processingTimeMs = elapsedMs(startTime);
  return report;
}

PipelineOrchestrator::PageTask
PipelineOrchestrator::runPageTask(PageSource &source, int index) {
  auto startTime = std::chrono::high_resolution_clock::now();
  PageTask task;

  try {
    task = m_config.mode == OutputMode::SearchablePdf
               ? runPdfTask(source, index)
               : runTextTask(source, index);
  } catch (const std::exception &e) {
    task = PageTask();
    task.report.success = false;
    task.report.error = ErrorKind::UnreadableRaster;
    task.report.errorMessage = e.what();
  }

  task.report.pageNumber = index + 1;
  task.report.processingTimeMs = elapsedMs(startTime);
  return task;
}

PipelineOrchestrator::PageTask
PipelineOrchestrator::runTextTask(PageSource &source, int index) {
  PageTask task;

  if (!m_config.forceOcr) {
    std::string extracted;
    try {
      std::lock_guard<std::mutex> lock(m_sourceMutex);
      extracted = source.extractText(index);
    } catch (const std::exception &e) {
      logDebug("Page " + std::to_string(index + 1) +
               ": text extraction failed: " + e.what());
      extracted.clear();
    }

    if (hasMeaningfulText(extracted)) {
      task.text = extracted;
      task.report.lineCount = countTextLines(extracted);
      return task;
    }
    logDebug("Page " + std::to_string(index + 1) +
             ": no extractable text, falling back to OCR");
  }

  RasterResult raster = renderSerialized(source, index);
  if (!raster.success) {
    task.report.success = false;
    task.report.error = ErrorKind::UnreadableRaster;
    task.report.errorMessage = raster.errorMessage;
    return task;
  }

  PageOutcome outcome = processPage(raster.page);
  task.report.usedOcr = outcome.error != ErrorKind::UnreadableRaster;
  task.report.success = outcome.success;
  task.report.error = outcome.error;
  task.report.errorMessage = outcome.errorMessage;
  task.report.notes = outcome.notes;
  task.report.lineCount = static_cast<int>(outcome.lines.size());
  task.text = joinLines(outcome.lines);
  return task;
}

PipelineOrchestrator::PageTask
PipelineOrchestrator::runPdfTask(PageSource &source, int index) {
  PageTask task;

  RasterResult raster = renderSerialized(source, index);
  PageOutcome outcome;
  if (raster.success) {
    outcome = processPage(raster.page);
  } else {
    outcome.error = ErrorKind::UnreadableRaster;
    outcome.errorMessage = raster.errorMessage;
  }

  if (outcome.error == ErrorKind::UnreadableRaster) {
    // Keep page count and order aligned with the source
    PageSize size{kFallbackPageWidthPt, kFallbackPageHeightPt};
    try {
      std::lock_guard<std::mutex> lock(m_sourceMutex);
      PageSize sourceSize = source.pageSize(index);
      if (sourceSize.width > 0 && sourceSize.height > 0) {
        size = sourceSize;
      }
    } catch (const std::exception &e) {
      logDebug("Page " + std::to_string(index + 1) +
               ": no page size available: " + e.what());
    }
    task.page = PageSynthesizer::blankPage(size);
  } else {
    task.report.usedOcr = true;
    task.page = std::move(outcome.page);
  }

  task.report.success = outcome.success;
  task.report.error = outcome.error;
  task.report.errorMessage = outcome.errorMessage;
  task.report.notes = outcome.notes;
  task.report.lineCount = static_cast<int>(outcome.lines.size());
  return task;
}

RasterResult PipelineOrchestrator::renderSerialized(PageSource &source,
                                                    int index) {
  std::lock_guard<std::mutex> lock(m_sourceMutex);
  return source.renderPage(index, m_config.dpi);
}

RecognitionResult
PipelineOrchestrator::recognizeSerialized(const cv::Mat &image, double dpi) {
  if (m_recognizer.isThreadSafe()) {
    return m_recognizer.recognize(image, dpi);
  }
  std::lock_guard<std::mutex> lock(m_recognizerMutex);
  return m_recognizer.recognize(image, dpi);
}

DocumentReport PipelineOrchestrator::processFile(const std::string &inputPath) {
  DocumentReport report;
  report.inputPath = inputPath;
  report.outputPath = outputPathFor(inputPath);

  if (!m_config.outputDir.empty()) {
    std::error_code ec;
    fs::create_directories(m_config.outputDir, ec);
  }

  std::unique_ptr<PageSource> source;
  try {
    if (isImageFile(inputPath)) {
      source = std::make_unique<ImagePageSource>(
          std::vector<std::string>{inputPath}, m_config.dpi);
    } else {
      source = std::make_unique<PdfPageSource>(inputPath);
    }
  } catch (const std::exception &e) {
    report.error = ErrorKind::DocumentOpenFailure;
    report.errorMessage = e.what();
    std::cerr << "ERROR: " << report.errorMessage << std::endl;
    return report;
  }

  logDebug("Processing " + inputPath + " -> " + report.outputPath);

  DocumentReport result = processDocument(*source, report.outputPath);
  result.inputPath = inputPath;
  if (!result.success) {
    std::cerr << "ERROR: " << inputPath << ": " << result.errorMessage
              << std::endl;
  }
  return result;
}

DocumentReport
PipelineOrchestrator::processImages(const std::vector<std::string> &imagePaths,
                                    const std::string &outputPath) {
  if (imagePaths.empty()) {
    DocumentReport report;
    report.outputPath = outputPath;
    report.error = ErrorKind::DocumentOpenFailure;
    report.errorMessage = "No images given";
    return report;
  }

  ImagePageSource source(imagePaths, m_config.dpi);
  logDebug("Processing " + std::to_string(imagePaths.size()) +
           " images -> " + outputPath);

  DocumentReport report = processDocument(source, outputPath);
  report.inputPath = imagePaths.front();
  if (!report.success) {
    std::cerr << "ERROR: " << outputPath << ": " << report.errorMessage
              << std::endl;
  }
  return report;
}

std::vector<DocumentReport>
PipelineOrchestrator::processBatch(const std::vector<std::string> &inputs) {
  std::vector<DocumentReport> reports;
  for (const auto &input : collectInputs(inputs)) {
    reports.push_back(processFile(input));
  }
  return reports;
}

std::vector<std::string>
PipelineOrchestrator::collectInputs(const std::vector<std::string> &inputs) {
  std::vector<std::string> files;

  for (const auto &input : inputs) {
    std::error_code ec;
    if (!fs::is_directory(input, ec)) {
      files.push_back(input);
      continue;
    }

    std::vector<std::string> folderFiles;
    for (const auto &entry : fs::directory_iterator(input, ec)) {
      if (entry.is_regular_file(ec) &&
          lowercaseExtension(entry.path()) == ".pdf") {
        folderFiles.push_back(entry.path().string());
      }
    }
    if (ec) {
      std::cerr << "WARNING: Failed to list folder " << input << ": "
                << ec.message() << std::endl;
    }
    std::sort(folderFiles.begin(), folderFiles.end());
    files.insert(files.end(), folderFiles.begin(), folderFiles.end());
  }

  return files;
}

std::string
PipelineOrchestrator::outputPathFor(const std::string &inputPath) const {
  fs::path input(inputPath);
  fs::path directory = m_config.outputDir.empty() ? input.parent_path()
                                                  : fs::path(m_config.outputDir);
  std::string stem = input.stem().string();

  switch (m_config.mode) {
  case OutputMode::Markdown:
    return (directory / (stem + ".md")).string();
  case OutputMode::SearchablePdf:
    return (directory / (stem + "_ocr.pdf")).string();
  case OutputMode::Text:
    break;
  }
  return (directory / (stem + ".txt")).string();
}

bool PipelineOrchestrator::writeTextFile(const std::string &path,
                                         const std::string &text,
                                         std::string &errorMessage) const {
  std::string partPath = path + ".part";
  std::error_code ec;

  {
    std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      errorMessage = "Failed to create " + partPath;
      return false;
    }
    out << text;
    out.close();
    if (!out) {
      errorMessage = "Failed to write " + partPath;
      fs::remove(partPath, ec);
      return false;
    }
  }

  fs::rename(partPath, path, ec);
  if (ec) {
    errorMessage = "Failed to move " + partPath + " to " + path + ": " +
                   ec.message();
    fs::remove(partPath, ec);
    return false;
  }
  return true;
}

void PipelineOrchestrator::logDebug(const std::string &message) const {
  if (m_config.verbose) {
    std::cerr << "DEBUG: " << message << std::endl;
  }
}

} // namespace scanpdf
