/**
 * @file error.h
 * @brief Error codes reported by DynaMix operations.
 */

#ifndef DYNAMIX_CORE_ERROR_H
#define DYNAMIX_CORE_ERROR_H

#include <cstdint>

namespace dynamix {

// Error codes. OK means the accompanying result is valid.
enum class DjError : uint8_t {
  OK = 0,
  InvalidDuration,     // Track duration <= 0 or not finite
  InvalidTempo,        // Tempo <= 0 or not finite
  InvalidEnergy,       // Mean energy negative or not finite
  InvalidConfidence,   // Tempo/key confidence outside [0, 1]
  InvalidBounds,       // Duration bounds or budget out of range
  InvalidSensitivity,  // Onset sensitivity outside [0, 1]
  EmptyInput,          // Zero tracks where at least one is required
  ExtractionFailed     // Feature collaborator could not produce a record
};

// Broad error taxonomy.
enum class ErrorCategory : uint8_t {
  None,
  InvalidInput,    // Malformed or degenerate input
  EmptyInput,      // Nothing to work on
  ExtractionError  // Collaborator failure, propagated without retry
};

// Returns a human-readable description of an error code.
const char* errorString(DjError error);

// Maps an error code onto its category.
ErrorCategory errorCategory(DjError error);

// Returns the category name ("invalid_input", ...).
const char* errorCategoryName(ErrorCategory category);

}  // namespace dynamix

#endif  // DYNAMIX_CORE_ERROR_H
