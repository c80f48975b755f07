#include "scanpdf/PipelineOrchestrator.hpp"
#include "scanpdf/TextRecognizer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input>... [options]\n"
      << "       " << programName
      << " --images <output.pdf> <image>... [options]\n"
      << "\nInputs are PDF files, images, or folders (every *.pdf inside).\n"
      << "\nOptions:\n"
      << "  -m, --mode <mode>       Output: text, md or pdf (default: text)\n"
      << "  -o, --output-dir <dir>  Write outputs here (default: next to "
         "input)\n"
      << "  -d, --dpi <dpi>         Rendering resolution (default: 300)\n"
      << "  -f, --force-ocr         OCR pages even when they carry text\n"
      << "  -a, --auto-enhance      Detect document edges and rectify\n"
      << "  -r, --rotation <deg>    Rotate clockwise: 0, 90, 180 or 270\n"
      << "      --crop <x,y,w,h>    Working region in raster pixels\n"
      << "  -b, --brightness <f>    Brightness factor (default: 1.0)\n"
      << "  -c, --contrast <f>      Contrast factor (default: 1.5)\n"
      << "  -s, --sharpness <f>     Sharpness factor (default: 1.0)\n"
      << "      --no-denoise        Skip bilateral denoising\n"
      << "      --no-binarize       Skip adaptive thresholding\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "      --tessdata <dir>    Tesseract data directory\n"
      << "      --psm <mode>        Tesseract page segmentation mode "
         "(default: 3)\n"
      << "      --confidence <val>  Minimum line confidence (0-100)\n"
      << "  -t, --timeout <ms>      Per-page OCR deadline (default: none)\n"
      << "      --min-font <pt>     Smallest text layer font (default: 4)\n"
      << "      --max-font <pt>     Largest text layer font (default: 30)\n"
      << "  -j, --jobs <n>          Page worker threads (default: 1)\n"
      << "  -v, --verbose           Print debug diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf\n"
      << "  " << programName << " scans/ -m pdf -j 4 -o out/\n"
      << "  " << programName
      << " --images letter.pdf page1.jpg page2.jpg -a\n";
}

bool parseCrop(const std::string &value, cv::Rect &crop) {
  std::istringstream stream(value);
  char sep1 = 0, sep2 = 0, sep3 = 0;
  int x, y, w, h;
  if (!(stream >> x >> sep1 >> y >> sep2 >> w >> sep3 >> h) || sep1 != ',' ||
      sep2 != ',' || sep3 != ',' || w <= 0 || h <= 0) {
    return false;
  }
  crop = cv::Rect(x, y, w, h);
  return true;
}

void printReport(const scanpdf::DocumentReport &report) {
  std::cout << (report.success ? "[OK]   " : "[FAIL] ")
            << (report.inputPath.empty() ? report.outputPath
                                         : report.inputPath);
  if (report.success) {
    std::cout << " -> " << report.outputPath;
  }
  std::cout << "\n";

  if (!report.success) {
    std::cout << "       " << scanpdf::errorKindToString(report.error) << ": "
              << report.errorMessage << "\n";
  }

  std::cout << "       Pages: " << report.totalPages
            << "  succeeded: " << report.succeededPages
            << "  failed: " << report.failedPages << "  time: " << std::fixed
            << std::setprecision(2) << report.processingTimeMs << " ms\n";

  for (const auto &page : report.pages) {
    if (page.success && page.skippedLines == 0) {
      continue;
    }
    std::cout << "       Page " << std::setw(4) << page.pageNumber << ": ";
    if (!page.success) {
      std::cout << scanpdf::errorKindToString(page.error) << " - "
                << page.errorMessage;
    } else {
      std::cout << page.skippedLines << " text line(s) skipped";
    }
    std::cout << "\n";
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  scanpdf::PipelineConfig config;
  std::vector<std::string> inputs;
  std::string imagesOutput;
  bool imagesMode = false;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      auto requireValue = [&](const std::string &option) -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(option + " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-m" || arg == "--mode") {
        std::string mode = requireValue(arg);
        if (mode == "text" || mode == "txt") {
          config.mode = scanpdf::OutputMode::Text;
        } else if (mode == "md" || mode == "markdown") {
          config.mode = scanpdf::OutputMode::Markdown;
        } else if (mode == "pdf") {
          config.mode = scanpdf::OutputMode::SearchablePdf;
        } else {
          throw std::invalid_argument("unknown mode: " + mode);
        }
      } else if (arg == "-o" || arg == "--output-dir") {
        config.outputDir = requireValue(arg);
      } else if (arg == "-d" || arg == "--dpi") {
        config.dpi = std::stod(requireValue(arg));
        if (config.dpi <= 0) {
          throw std::invalid_argument("--dpi must be positive");
        }
      } else if (arg == "-f" || arg == "--force-ocr") {
        config.forceOcr = true;
      } else if (arg == "-a" || arg == "--auto-enhance") {
        config.autoEnhance = true;
      } else if (arg == "-r" || arg == "--rotation") {
        config.rotation = std::stoi(requireValue(arg));
        if (config.rotation != 0 && config.rotation != 90 &&
            config.rotation != 180 && config.rotation != 270) {
          throw std::invalid_argument("--rotation must be 0, 90, 180 or 270");
        }
      } else if (arg == "--crop") {
        cv::Rect crop;
        if (!parseCrop(requireValue(arg), crop)) {
          throw std::invalid_argument("--crop expects x,y,width,height");
        }
        config.crop = crop;
      } else if (arg == "-b" || arg == "--brightness") {
        config.enhancement.brightness = std::stod(requireValue(arg));
      } else if (arg == "-c" || arg == "--contrast") {
        config.enhancement.contrast = std::stod(requireValue(arg));
      } else if (arg == "-s" || arg == "--sharpness") {
        config.enhancement.sharpness = std::stod(requireValue(arg));
      } else if (arg == "--no-denoise") {
        config.enhancement.denoise = false;
      } else if (arg == "--no-binarize") {
        config.enhancement.binarize = false;
      } else if (arg == "-l" || arg == "--language") {
        config.ocr.language = requireValue(arg);
      } else if (arg == "--tessdata") {
        config.ocr.tessDataPath = requireValue(arg);
      } else if (arg == "--psm") {
        config.ocr.pageSegMode =
            static_cast<tesseract::PageSegMode>(std::stoi(requireValue(arg)));
      } else if (arg == "--confidence") {
        config.ocr.minConfidence = std::stoi(requireValue(arg));
      } else if (arg == "-t" || arg == "--timeout") {
        config.ocr.timeoutMs = std::stoi(requireValue(arg));
      } else if (arg == "--min-font") {
        config.font.minPt = std::stod(requireValue(arg));
      } else if (arg == "--max-font") {
        config.font.maxPt = std::stod(requireValue(arg));
      } else if (arg == "-j" || arg == "--jobs") {
        config.jobs = std::max(1, std::stoi(requireValue(arg)));
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg == "--images") {
        imagesMode = true;
        imagesOutput = requireValue(arg);
      } else if (arg[0] != '-') {
        inputs.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    // std::stoi/std::stod report malformed numbers the same way
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (inputs.empty()) {
    std::cerr << "Error: No input provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (imagesMode) {
    // Scan-to-PDF always produces a searchable PDF
    config.mode = scanpdf::OutputMode::SearchablePdf;
  }

  std::cout << "=== ScanPDF ===\n"
            << "Tesseract version: "
            << scanpdf::TesseractRecognizer::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << config.ocr.language << "\n"
            << "===============\n\n";

  // One engine for the whole run
  scanpdf::TesseractRecognizer recognizer(config.ocr);

  if (!recognizer.initialize()) {
    std::cerr
        << "Failed to initialize OCR engine.\n"
        << "Make sure Tesseract is installed and tessdata is available.\n";
    return 1;
  }

  scanpdf::PipelineOrchestrator orchestrator(config, recognizer);

  std::vector<scanpdf::DocumentReport> reports;
  if (imagesMode) {
    reports.push_back(orchestrator.processImages(inputs, imagesOutput));
  } else {
    reports = orchestrator.processBatch(inputs);
  }

  if (reports.empty()) {
    std::cerr << "Error: No PDF files found in the given inputs\n";
    return 1;
  }

  int failedDocuments = 0;
  for (const auto &report : reports) {
    printReport(report);
    if (!report.success) {
      ++failedDocuments;
    }
  }

  std::cout << "\nDocuments: " << reports.size()
            << "  written: " << reports.size() - failedDocuments
            << "  failed: " << failedDocuments << "\n";

  return failedDocuments == 0 ? 0 : 1;
}
