/**
 * @file error_test.cpp
 * @brief Tests for error codes and categories.
 */

#include "core/error.h"

#include <gtest/gtest.h>

#include <string>

namespace dynamix {
namespace {

TEST(ErrorTest, OkIsCategoryNone) {
  EXPECT_EQ(errorCategory(DjError::OK), ErrorCategory::None);
  EXPECT_STREQ(errorCategoryName(ErrorCategory::None), "none");
}

TEST(ErrorTest, InputErrorsAreInvalidInput) {
  for (DjError err : {DjError::InvalidDuration, DjError::InvalidTempo, DjError::InvalidEnergy,
                      DjError::InvalidConfidence, DjError::InvalidBounds,
                      DjError::InvalidSensitivity}) {
    EXPECT_EQ(errorCategory(err), ErrorCategory::InvalidInput) << errorString(err);
  }
}

TEST(ErrorTest, EmptyAndExtractionCategories) {
  EXPECT_EQ(errorCategory(DjError::EmptyInput), ErrorCategory::EmptyInput);
  EXPECT_EQ(errorCategory(DjError::ExtractionFailed), ErrorCategory::ExtractionError);
  EXPECT_STREQ(errorCategoryName(ErrorCategory::ExtractionError), "extraction_error");
}

TEST(ErrorTest, EveryCodeHasDistinctMessage) {
  const DjError codes[] = {DjError::OK,           DjError::InvalidDuration,
                           DjError::InvalidTempo, DjError::InvalidEnergy,
                           DjError::InvalidConfidence, DjError::InvalidBounds,
                           DjError::InvalidSensitivity, DjError::EmptyInput,
                           DjError::ExtractionFailed};
  for (size_t i = 0; i < sizeof(codes) / sizeof(codes[0]); ++i) {
    std::string a = errorString(codes[i]);
    EXPECT_FALSE(a.empty());
    for (size_t j = i + 1; j < sizeof(codes) / sizeof(codes[0]); ++j) {
      EXPECT_NE(a, std::string(errorString(codes[j])));
    }
  }
}

}  // namespace
}  // namespace dynamix
