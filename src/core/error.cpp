#include "core/error.h"

namespace dynamix {

const char* errorString(DjError error) {
  switch (error) {
    case DjError::OK:
      return "No error";
    case DjError::InvalidDuration:
      return "Invalid track duration (must be > 0)";
    case DjError::InvalidTempo:
      return "Invalid tempo (must be > 0 BPM)";
    case DjError::InvalidEnergy:
      return "Invalid energy (mean must be finite and >= 0)";
    case DjError::InvalidConfidence:
      return "Invalid confidence (must be 0.0-1.0)";
    case DjError::InvalidBounds:
      return "Invalid duration bounds";
    case DjError::InvalidSensitivity:
      return "Invalid sensitivity (must be 0.0-1.0)";
    case DjError::EmptyInput:
      return "No tracks to process";
    case DjError::ExtractionFailed:
      return "Feature extraction failed";
  }
  return "Unknown error";
}

ErrorCategory errorCategory(DjError error) {
  switch (error) {
    case DjError::OK:
      return ErrorCategory::None;
    case DjError::InvalidDuration:
    case DjError::InvalidTempo:
    case DjError::InvalidEnergy:
    case DjError::InvalidConfidence:
    case DjError::InvalidBounds:
    case DjError::InvalidSensitivity:
      return ErrorCategory::InvalidInput;
    case DjError::EmptyInput:
      return ErrorCategory::EmptyInput;
    case DjError::ExtractionFailed:
      return ErrorCategory::ExtractionError;
  }
  return ErrorCategory::InvalidInput;
}

const char* errorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::None: return "none";
    case ErrorCategory::InvalidInput: return "invalid_input";
    case ErrorCategory::EmptyInput: return "empty_input";
    case ErrorCategory::ExtractionError: return "extraction_error";
  }
  return "unknown";
}

}  // namespace dynamix
