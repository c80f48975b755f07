#include "scanpdf/PageSource.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <poppler-document.h>
#include <poppler-page.h>

namespace scanpdf {

namespace {

std::unique_ptr<poppler::page> loadPage(poppler::document &doc, int index) {
  if (index < 0 || index >= doc.pages()) {
    throw std::out_of_range("Page index out of range: " +
                            std::to_string(index));
  }
  std::unique_ptr<poppler::page> page(doc.create_page(index));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(index + 1));
  }
  return page;
}

} // namespace

PdfPageSource::PdfPageSource(const std::string &pdfPath) : m_path(pdfPath) {
  m_document.reset(poppler::document::load_from_file(pdfPath));
  if (!m_document) {
    throw std::runtime_error("Failed to load PDF file: " + pdfPath);
  }
  if (m_document->is_locked()) {
    throw std::runtime_error("PDF file is password protected: " + pdfPath);
  }
}

PdfPageSource::~PdfPageSource() = default;

int PdfPageSource::pageCount() const { return m_document->pages(); }

PageSize PdfPageSource::pageSize(int index) const {
  std::unique_ptr<poppler::page> page = loadPage(*m_document, index);
  poppler::rectf pageRect = page->page_rect();
  PageSize size;
  size.width = pageRect.width();
  size.height = pageRect.height();
  // Rotated pages render with swapped dimensions
  if (page->orientation() == poppler::page::landscape ||
      page->orientation() == poppler::page::seascape) {
    std::swap(size.width, size.height);
  }
  return size;
}

std::string PdfPageSource::extractText(int index) {
  std::unique_ptr<poppler::page> page = loadPage(*m_document, index);
  poppler::byte_array textBytes = page->text().to_utf8();
  return std::string(textBytes.begin(), textBytes.end());
}

RasterResult PdfPageSource::renderPage(int index, double dpi) {
  RasterResult result;
  try {
    std::unique_ptr<poppler::page> page = loadPage(*m_document, index);
    result = renderPdfPage(*page, dpi);
  } catch (const std::exception &e) {
    result.success = false;
    result.errorMessage = e.what();
  }
  return result;
}

ImagePageSource::ImagePageSource(std::vector<std::string> imagePaths,
                                 double dpi)
    : m_paths(std::move(imagePaths)), m_dpi(dpi > 0 ? dpi : 300.0) {}

int ImagePageSource::pageCount() const {
  return static_cast<int>(m_paths.size());
}

PageSize ImagePageSource::pageSize(int index) const {
  PageSize size;
  // Undecodable images get an A4 placeholder page
  cv::Mat image = cv::imread(m_paths.at(index), cv::IMREAD_UNCHANGED);
  if (image.empty()) {
    size.width = 595.0;
    size.height = 842.0;
    return size;
  }
  size.width = image.cols * 72.0 / m_dpi;
  size.height = image.rows * 72.0 / m_dpi;
  return size;
}

std::string ImagePageSource::extractText(int) { return std::string(); }

RasterResult ImagePageSource::renderPage(int index, double dpi) {
  if (index < 0 || index >= pageCount()) {
    RasterResult result;
    result.errorMessage = "Page index out of range: " + std::to_string(index);
    return result;
  }
  return loadImage(m_paths[index], dpi);
}

bool hasMeaningfulText(const std::string &text) {
  return std::any_of(text.begin(), text.end(), [](char c) {
    return !std::isspace(static_cast<unsigned char>(c));
  });
}

} // namespace scanpdf
