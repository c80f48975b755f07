#include "scanpdf/Types.hpp"

namespace scanpdf {

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::UnreadableRaster:
    return "UnreadableRaster";
  case ErrorKind::NoDocumentEdges:
    return "NoDocumentEdges";
  case ErrorKind::SingularHomography:
    return "SingularHomography";
  case ErrorKind::RecognitionFailure:
    return "RecognitionFailure";
  case ErrorKind::TextInsertionFailure:
    return "TextInsertionFailure";
  case ErrorKind::OutputWriteFailure:
    return "OutputWriteFailure";
  case ErrorKind::DocumentOpenFailure:
    return "DocumentOpenFailure";
  }
  return "Unknown";
}

} // namespace scanpdf
