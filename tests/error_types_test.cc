// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "volscan/support/error_types.hpp"
#include <sstream>

using namespace volscan;

TEST(ErrorTypesTest, ValidationErrorDefaults) {
    ValidationError err(ValidationErrorCode::InvalidSpotPrice, -100.0);
    EXPECT_EQ(err.code, ValidationErrorCode::InvalidSpotPrice);
    EXPECT_DOUBLE_EQ(err.value, -100.0);
    EXPECT_EQ(err.index, 0);
}

TEST(ErrorTypesTest, ErrorCodeOfVariant) {
    ErrorVariant validation = ValidationError(ValidationErrorCode::InvalidStrike, 0.0);
    ErrorVariant config = ConfigurationError(ConfigurationErrorCode::InvalidTopN, 0.0);
    ErrorVariant quality = DataQualityError{.code = DataQualityErrorCode::NoLiquidity};
    ErrorVariant message = std::string("provider down");

    EXPECT_EQ(error_code(validation), static_cast<int>(ValidationErrorCode::InvalidStrike));
    EXPECT_EQ(error_code(config), static_cast<int>(ConfigurationErrorCode::InvalidTopN));
    EXPECT_EQ(error_code(quality), static_cast<int>(DataQualityErrorCode::NoLiquidity));
    EXPECT_EQ(error_code(message), -1);
}

TEST(ErrorTypesTest, StreamsOffendingValue) {
    std::ostringstream oss;
    oss << ErrorVariant{ConfigurationError(ConfigurationErrorCode::InvertedDeltaBand, 0.5, 0.2)};
    EXPECT_NE(oss.str().find("ConfigurationError"), std::string::npos);
    EXPECT_NE(oss.str().find("0.5"), std::string::npos);
    EXPECT_NE(oss.str().find("0.2"), std::string::npos);
}
