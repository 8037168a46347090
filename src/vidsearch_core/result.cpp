#include "vidsearch_core/result.hpp"

namespace vidsearch_core {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InputNotFound:
      return "InputNotFound";
    case ErrorKind::DecodeFailure:
      return "DecodeFailure";
    case ErrorKind::NoScenesDetected:
      return "NoScenesDetected";
    case ErrorKind::EncoderUnavailable:
      return "EncoderUnavailable";
    case ErrorKind::StoreWriteFailure:
      return "StoreWriteFailure";
    case ErrorKind::StoreQueryFailure:
      return "StoreQueryFailure";
    case ErrorKind::EmptyInput:
      return "EmptyInput";
    case ErrorKind::Cancelled:
      return "Cancelled";
    default:
      return "Unknown";
  }
}

std::string Failure::describe() const {
  std::string text = to_string(kind) + ": " + message;
  if (!context.empty()) {
    text += " [" + context + "]";
  }
  return text;
}

}  // namespace vidsearch_core
