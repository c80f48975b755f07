#include "scanpdf/PipelineOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <poppler-document.h>
#include <poppler-page.h>

namespace fs = std::filesystem;

namespace {

int failures = 0;

void check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << "\n";
  if (!condition) {
    ++failures;
  }
}

/**
 * @brief In-memory document whose pages are flat gray rasters
 *
 * Page i (0-indexed) is filled with gray level 10 * (i + 1) so the fake
 * recognizer can tell which page it was given.
 */
class FakePageSource : public scanpdf::PageSource {
public:
  explicit FakePageSource(std::vector<std::string> texts)
      : m_texts(std::move(texts)) {}

  int pageCount() const override { return static_cast<int>(m_texts.size()); }

  scanpdf::PageSize pageSize(int) const override {
    return scanpdf::PageSize{200.0, 100.0};
  }

  std::string extractText(int index) override {
    ++extractCalls;
    if (brokenText.count(index)) {
      throw std::runtime_error("corrupt content stream");
    }
    return m_texts.at(index);
  }

  scanpdf::RasterResult renderPage(int index, double dpi) override {
    ++renderCalls;
    scanpdf::RasterResult result;
    if (unreadable.count(index)) {
      result.errorMessage = "cannot decode page " + std::to_string(index + 1);
      return result;
    }
    auto level = static_cast<double>(10 * (index + 1));
    result.page.image = cv::Mat(100, 200, CV_8UC3, cv::Scalar::all(level));
    result.page.dpi = dpi;
    result.success = true;
    return result;
  }

  std::set<int> unreadable;
  std::set<int> brokenText;
  int extractCalls = 0;
  int renderCalls = 0;

private:
  std::vector<std::string> m_texts;
};

/**
 * @brief Recognizer that reports one line naming the page it was shown
 */
class FakeRecognizer : public scanpdf::TextRecognizer {
public:
  enum class Failure { Result, Throw, Timeout };

  scanpdf::RecognitionResult recognize(const cv::Mat &image,
                                       double) override {
    ++calls;
    int page = image.at<cv::Vec3b>(0, 0)[0] / 10;

    if (delayed) {
      // Later pages finish first
      std::this_thread::sleep_for(std::chrono::milliseconds(3 * (20 - page)));
    }
    if (stallFirstPage && page == 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(300));
      callsWhenFirstDone = calls.load();
    }

    scanpdf::RecognitionResult result;
    if (failingPages.count(page)) {
      if (failure == Failure::Throw) {
        throw std::runtime_error("engine crashed");
      }
      result.errorMessage = failure == Failure::Timeout
                                ? "Recognition timed out after 1 ms"
                                : "engine gave up";
      return result;
    }

    scanpdf::RecognizedLine line;
    line.boundingBox = cv::Rect(10, 10, 150, 30);
    line.text = "ocr page " + std::to_string(page);
    line.confidence = 0.9f;
    result.lines.push_back(line);
    result.success = true;
    return result;
  }

  bool isThreadSafe() const override { return threadSafe; }

  std::atomic<int> calls{0};
  std::set<int> failingPages; ///< 1-indexed
  Failure failure = Failure::Result;
  bool threadSafe = false;
  bool delayed = false;
  bool stallFirstPage = false;
  std::atomic<int> callsWhenFirstDone{-1};
};

/**
 * @brief Configuration that keeps the flat page gray levels intact
 */
scanpdf::PipelineConfig createConfig(scanpdf::OutputMode mode) {
  scanpdf::PipelineConfig config;
  config.mode = mode;
  config.enhancement.contrast = 1.0;
  config.enhancement.denoise = false;
  config.enhancement.binarize = false;
  return config;
}

std::string readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

std::vector<std::string> readPdfPages(const fs::path &path) {
  std::vector<std::string> pages;
  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(path.string()));
  if (!doc) {
    return pages;
  }
  for (int i = 0; i < doc->pages(); ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    poppler::byte_array bytes = page->text().to_utf8();
    pages.emplace_back(bytes.begin(), bytes.end());
  }
  return pages;
}

bool contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}

bool hasNote(const std::vector<scanpdf::ErrorKind> &notes,
             scanpdf::ErrorKind kind) {
  return std::find(notes.begin(), notes.end(), kind) != notes.end();
}

} // namespace

int main() {
  std::cout << "=== Pipeline Orchestrator Test ===\n\n";

  fs::path workDir = fs::temp_directory_path() / "scanpdf_test_pipeline";
  fs::remove_all(workDir);
  fs::create_directories(workDir);

  const std::vector<std::string> threePages = {
      "First page text\n", "  \n\t ", "Third page text\n"};

  std::cout << "[Text mode falls back to OCR only where needed]\n";
  {
    FakePageSource source(threePages);
    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::Text), recognizer);

    fs::path output = workDir / "three.txt";
    auto report = orchestrator.processDocument(source, output.string());

    check(report.success, "document written");
    check(recognizer.calls == 1, "OCR ran for exactly one page");
    check(source.renderCalls == 1, "only the blank page was rendered");
    check(report.totalPages == 3 && report.succeededPages == 3 &&
              report.failedPages == 0,
          "3 of 3 pages succeeded");
    check(!report.pages[0].usedOcr && report.pages[1].usedOcr &&
              !report.pages[2].usedOcr,
          "page 2 is the OCR page");
    check(readFile(output) ==
              "First page text\n\focr page 2\fThird page text\n",
          "extracted text kept verbatim, pages separated by form feeds");
  }

  std::cout << "\n[Markdown mode]\n";
  {
    FakePageSource source(threePages);
    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::Markdown), recognizer);

    fs::path output = workDir / "three.md";
    auto report = orchestrator.processDocument(source, output.string());
    check(report.success, "document written");
    check(readFile(output) ==
              "First page text\n\n\n---\n\nocr page 2\n\n---\n\nThird page "
              "text\n",
          "pages separated by horizontal rules");
  }

  std::cout << "\n[Force OCR and broken text extraction]\n";
  {
    FakePageSource source(threePages);
    FakeRecognizer recognizer;
    auto config = createConfig(scanpdf::OutputMode::Text);
    config.forceOcr = true;
    scanpdf::PipelineOrchestrator orchestrator(config, recognizer);

    auto report =
        orchestrator.processDocument(source, (workDir / "forced.txt").string());
    check(recognizer.calls == 3, "force OCR recognizes every page");
    check(source.extractCalls == 0, "force OCR skips text extraction");
    check(report.succeededPages == 3, "all pages succeeded");

    FakePageSource broken(threePages);
    broken.brokenText.insert(0);
    FakeRecognizer second;
    scanpdf::PipelineOrchestrator fallback(
        createConfig(scanpdf::OutputMode::Text), second);
    auto brokenReport =
        fallback.processDocument(broken, (workDir / "broken.txt").string());
    check(second.calls == 2, "failed extraction falls back to OCR");
    check(brokenReport.succeededPages == 3, "extraction errors are absorbed");
  }

  std::cout << "\n[Searchable PDF mode recognizes every page]\n";
  {
    FakePageSource source(threePages);
    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::SearchablePdf), recognizer);

    fs::path output = workDir / "three_ocr.pdf";
    auto report = orchestrator.processDocument(source, output.string());
    check(report.success, "document written");
    check(recognizer.calls == 3, "OCR ran for all 3 pages");
    check(source.extractCalls == 0, "existing text ignored");

    auto pages = readPdfPages(output);
    check(pages.size() == 3, "one output page per source page");
    if (pages.size() == 3) {
      check(contains(pages[0], "ocr page 1") &&
                contains(pages[1], "ocr page 2") &&
                contains(pages[2], "ocr page 3"),
            "text layers in page order");
    }
  }

  std::cout << "\n[Recognition failure still yields a page]\n";
  for (auto failure :
       {FakeRecognizer::Failure::Result, FakeRecognizer::Failure::Throw,
        FakeRecognizer::Failure::Timeout}) {
    FakePageSource source(threePages);
    FakeRecognizer recognizer;
    recognizer.failingPages.insert(2);
    recognizer.failure = failure;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::SearchablePdf), recognizer);

    fs::path output = workDir / "failing_ocr.pdf";
    auto report = orchestrator.processDocument(source, output.string());
    std::string how = failure == FakeRecognizer::Failure::Throw ? " (throw)"
                      : failure == FakeRecognizer::Failure::Timeout
                          ? " (timeout)"
                          : " (result)";

    check(report.success, "document still written" + how);
    check(report.succeededPages == 2 && report.failedPages == 1,
          "failure recorded in the totals" + how);
    check(report.pages[1].error == scanpdf::ErrorKind::RecognitionFailure &&
              !report.pages[1].success,
          "page 2 marked as recognition failure" + how);
    check(recognizer.calls == 3, "remaining pages processed" + how);
    if (failure == FakeRecognizer::Failure::Timeout) {
      check(contains(report.pages[1].errorMessage, "timed out"),
            "timeout reason reported");
    }

    auto pages = readPdfPages(output);
    check(pages.size() == 3, "failed page still emitted" + how);
    if (pages.size() == 3) {
      check(!scanpdf::hasMeaningfulText(pages[1]),
            "failed page has no text layer" + how);
      check(contains(pages[2], "ocr page 3"), "page 3 unaffected" + how);
    }
  }

  std::cout << "\n[Unreadable pages]\n";
  {
    FakePageSource source(threePages);
    source.unreadable.insert(1);
    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::SearchablePdf), recognizer);

    fs::path output = workDir / "unreadable_ocr.pdf";
    auto report = orchestrator.processDocument(source, output.string());
    check(report.success && report.failedPages == 1, "document written");
    check(report.pages[1].error == scanpdf::ErrorKind::UnreadableRaster,
          "page 2 reported unreadable");
    check(recognizer.calls == 2, "no OCR for the unreadable page");

    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(output.string()));
    check(doc && doc->pages() == 3, "blank placeholder keeps page count");
    if (doc && doc->pages() == 3) {
      std::unique_ptr<poppler::page> blank(doc->create_page(1));
      poppler::rectf rect = blank->page_rect();
      check(std::abs(rect.width() - 200.0) < 0.5 &&
                std::abs(rect.height() - 100.0) < 0.5,
            "placeholder has the source page size");

      // 200 x 100 px at 300 DPI
      std::unique_ptr<poppler::page> rendered(doc->create_page(0));
      poppler::rectf renderedRect = rendered->page_rect();
      check(std::abs(renderedRect.width() - 48.0) < 0.5 &&
                std::abs(renderedRect.height() - 24.0) < 0.5,
            "rendered page sized from its raster");
    }

    FakePageSource textSource({"", "", "Third page text"});
    textSource.unreadable.insert(0);
    FakeRecognizer textRecognizer;
    scanpdf::PipelineOrchestrator textOrchestrator(
        createConfig(scanpdf::OutputMode::Text), textRecognizer);
    fs::path textOutput = workDir / "unreadable.txt";
    auto textReport =
        textOrchestrator.processDocument(textSource, textOutput.string());
    check(textReport.success && textReport.failedPages == 1,
          "text document written despite an unreadable page");
    check(readFile(textOutput) == "\focr page 2\fThird page text",
          "unreadable page contributes empty text");
  }

  std::cout << "\n[Parallel pages keep input order]\n";
  for (bool threadSafe : {true, false}) {
    std::vector<std::string> blankTexts(12, "");
    std::string expected;
    for (int i = 1; i <= 12; ++i) {
      if (i > 1) {
        expected += "\f";
      }
      expected += "ocr page " + std::to_string(i);
    }
    std::string how = threadSafe ? " (shared engine)" : " (serialized engine)";

    FakePageSource source(blankTexts);
    FakeRecognizer recognizer;
    recognizer.threadSafe = threadSafe;
    recognizer.delayed = true;
    auto config = createConfig(scanpdf::OutputMode::Text);
    config.jobs = 4;
    scanpdf::PipelineOrchestrator orchestrator(config, recognizer);

    fs::path output = workDir / "parallel.txt";
    auto report = orchestrator.processDocument(source, output.string());
    check(report.success && report.succeededPages == 12,
          "all pages processed" + how);
    check(readFile(output) == expected, "text in page order" + how);

    bool numbered = report.pages.size() == 12;
    for (size_t i = 0; numbered && i < report.pages.size(); ++i) {
      numbered = report.pages[i].pageNumber == static_cast<int>(i + 1);
    }
    check(numbered, "reports in page order" + how);
  }
  {
    FakePageSource source(std::vector<std::string>(6, ""));
    FakeRecognizer recognizer;
    recognizer.threadSafe = true;
    recognizer.delayed = true;
    auto config = createConfig(scanpdf::OutputMode::SearchablePdf);
    config.jobs = 3;
    scanpdf::PipelineOrchestrator orchestrator(config, recognizer);

    fs::path output = workDir / "parallel_ocr.pdf";
    auto report = orchestrator.processDocument(source, output.string());
    auto pages = readPdfPages(output);
    bool ordered = report.success && pages.size() == 6;
    for (size_t i = 0; ordered && i < pages.size(); ++i) {
      ordered = contains(pages[i], "ocr page " + std::to_string(i + 1));
    }
    check(ordered, "PDF pages written in page order");
  }

  std::cout << "\n[Workers stay close to the writer]\n";
  {
    // Page 1 holds up the writer; the other worker must not run ahead
    FakePageSource source(std::vector<std::string>(16, ""));
    FakeRecognizer recognizer;
    recognizer.threadSafe = true;
    recognizer.stallFirstPage = true;
    auto config = createConfig(scanpdf::OutputMode::SearchablePdf);
    config.jobs = 2;
    scanpdf::PipelineOrchestrator orchestrator(config, recognizer);

    auto report = orchestrator.processDocument(
        source, (workDir / "bounded.pdf").string());
    check(report.success && report.succeededPages == 16,
          "all pages processed");
    check(recognizer.callsWhenFirstDone >= 1 &&
              recognizer.callsWhenFirstDone <= 4,
          "at most two pages per worker ahead of the writer");
    check(recognizer.calls == 16, "every page recognized once");
  }

  std::cout << "\n[Single page stages]\n";
  {
    FakeRecognizer recognizer;
    auto config = createConfig(scanpdf::OutputMode::SearchablePdf);
    config.autoEnhance = true;
    scanpdf::PipelineOrchestrator orchestrator(config, recognizer);

    scanpdf::RasterPage flat;
    flat.image = cv::Mat(100, 200, CV_8UC3, cv::Scalar::all(30));
    flat.dpi = 300;
    auto outcome = orchestrator.processPage(flat);
    check(outcome.success && outcome.lines.size() == 1, "page recognized");
    check(hasNote(outcome.notes, scanpdf::ErrorKind::NoDocumentEdges),
          "flat page notes missing edges");
    check(!hasNote(outcome.notes, scanpdf::ErrorKind::SingularHomography),
          "full frame fallback rectifies cleanly");
    check(outcome.rectified.image.size() == flat.image.size(),
          "full frame keeps the raster size");
    check(outcome.enhanced.channels() == 3, "enhanced raster is BGR");
    check(outcome.page.lines.size() == 1 && outcome.page.lines[0].text ==
                                                "ocr page 3",
          "mapped line carried into the page");

    auto rotatedConfig = createConfig(scanpdf::OutputMode::SearchablePdf);
    rotatedConfig.rotation = 90;
    scanpdf::PipelineOrchestrator rotating(rotatedConfig, recognizer);
    auto rotated = rotating.processPage(flat);
    check(rotated.enhanced.width() == 100 && rotated.enhanced.height() == 200,
          "rotation applied before recognition");
    check(std::abs(rotated.page.size.width - 24.0) < 1e-9 &&
              std::abs(rotated.page.size.height - 48.0) < 1e-9,
          "page size follows the rotated raster");

    auto emptyOutcome = orchestrator.processPage(scanpdf::RasterPage());
    check(!emptyOutcome.success &&
              emptyOutcome.error == scanpdf::ErrorKind::UnreadableRaster,
          "empty raster is unreadable");
  }

  std::cout << "\n[Output failures]\n";
  {
    for (auto mode : {scanpdf::OutputMode::Text,
                      scanpdf::OutputMode::SearchablePdf}) {
      FakePageSource source(threePages);
      FakeRecognizer recognizer;
      scanpdf::PipelineOrchestrator orchestrator(createConfig(mode),
                                                 recognizer);
      fs::path output = workDir / "no" / "such" / "dir" / "out.bin";
      auto report = orchestrator.processDocument(source, output.string());
      std::string how =
          mode == scanpdf::OutputMode::Text ? " (text)" : " (pdf)";
      check(!report.success &&
                report.error == scanpdf::ErrorKind::OutputWriteFailure,
            "unwritable output reported" + how);
      check(!fs::exists(output) && !fs::exists(output.string() + ".part"),
            "nothing left at the output path" + how);
    }

    FakePageSource empty(std::vector<std::string>{});
    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::Text), recognizer);
    auto report =
        orchestrator.processDocument(empty, (workDir / "empty.txt").string());
    check(!report.success &&
              report.error == scanpdf::ErrorKind::DocumentOpenFailure,
          "document without pages is rejected");
  }

  std::cout << "\n[Files, folders and naming]\n";
  {
    auto textConfig = createConfig(scanpdf::OutputMode::Text);
    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator textOrchestrator(textConfig, recognizer);
    check(textOrchestrator.outputPathFor("/data/scans/report.pdf") ==
              "/data/scans/report.txt",
          "text output next to the input");

    auto mdConfig = createConfig(scanpdf::OutputMode::Markdown);
    mdConfig.outputDir = "/tmp/out";
    scanpdf::PipelineOrchestrator mdOrchestrator(mdConfig, recognizer);
    check(mdOrchestrator.outputPathFor("/data/scans/report.pdf") ==
              "/tmp/out/report.md",
          "markdown output in the output directory");

    scanpdf::PipelineOrchestrator pdfOrchestrator(
        createConfig(scanpdf::OutputMode::SearchablePdf), recognizer);
    check(pdfOrchestrator.outputPathFor("/data/scans/report.pdf") ==
              "/data/scans/report_ocr.pdf",
          "searchable PDF gets the _ocr suffix");

    // A folder of real PDFs written by the synthesizer
    fs::path folder = workDir / "inbox";
    fs::create_directories(folder);
    scanpdf::PageSynthesizer synthesizer;
    scanpdf::RasterPage white;
    white.image = cv::Mat(400, 600, CV_8UC3, cv::Scalar::all(255));
    white.dpi = 72;
    for (const std::string name : {"b_second", "a_first"}) {
      scanpdf::RecognizedLine line;
      line.boundingBox = cv::Rect(50, 50, 400, 40);
      line.text = "Embedded text of " + name;
      scanpdf::PdfWriter writer;
      writer.open((folder / (name + ".pdf")).string());
      writer.addPage(synthesizer.synthesize(white, {line}));
      writer.close();
    }
    std::ofstream((folder / "notes.txt").string()) << "not a pdf";

    auto inputs = scanpdf::PipelineOrchestrator::collectInputs(
        {(workDir / "missing.pdf").string(), folder.string()});
    check(inputs.size() == 3, "folder expanded to its PDFs");
    if (inputs.size() == 3) {
      check(fs::path(inputs[1]).filename() == "a_first.pdf" &&
                fs::path(inputs[2]).filename() == "b_second.pdf",
            "folder PDFs sorted by name");
    }

    auto batchConfig = createConfig(scanpdf::OutputMode::Text);
    batchConfig.outputDir = (workDir / "text_out").string();
    FakeRecognizer batchRecognizer;
    scanpdf::PipelineOrchestrator batch(batchConfig, batchRecognizer);
    auto reports =
        batch.processBatch({(workDir / "missing.pdf").string(), folder.string()});

    check(reports.size() == 3, "one report per document");
    if (reports.size() == 3) {
      check(!reports[0].success &&
                reports[0].error == scanpdf::ErrorKind::DocumentOpenFailure,
            "missing input fails to open");
      check(reports[1].success && reports[2].success,
            "batch continues after a failed document");
      check(contains(readFile(workDir / "text_out" / "a_first.txt"),
                     "Embedded text of a_first"),
            "embedded PDF text extracted");
      check(batchRecognizer.calls == 0,
            "pages with embedded text never reach OCR");
    }
  }

  std::cout << "\n[Scan to PDF]\n";
  {
    std::vector<std::string> images;
    for (int i = 0; i < 2; ++i) {
      fs::path path = workDir / ("photo" + std::to_string(i) + ".png");
      cv::imwrite(path.string(),
                  cv::Mat(100, 200, CV_8UC3, cv::Scalar::all(10 * (i + 1))));
      images.push_back(path.string());
    }

    FakeRecognizer recognizer;
    scanpdf::PipelineOrchestrator orchestrator(
        createConfig(scanpdf::OutputMode::SearchablePdf), recognizer);
    fs::path output = workDir / "photos.pdf";
    auto report = orchestrator.processImages(images, output.string());
    check(report.success && report.totalPages == 2, "two photos, two pages");

    auto pages = readPdfPages(output);
    check(pages.size() == 2 && contains(pages[0], "ocr page 1") &&
              contains(pages[1], "ocr page 2"),
          "one searchable page per photo, in order");

    auto none = orchestrator.processImages({}, output.string());
    check(!none.success &&
              none.error == scanpdf::ErrorKind::DocumentOpenFailure,
          "no images is rejected");
  }

  std::cout << "\n[Error kinds]\n";
  {
    check(scanpdf::errorKindToString(scanpdf::ErrorKind::RecognitionFailure) ==
              "RecognitionFailure",
          "error kinds have readable names");
  }

  fs::remove_all(workDir);

  std::cout << "\n" << (failures == 0 ? "All checks passed" : "FAILED")
            << " (" << failures << " failures)\n";
  return failures == 0 ? 0 : 1;
}
