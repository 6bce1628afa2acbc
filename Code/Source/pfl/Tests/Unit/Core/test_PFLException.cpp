/**
 * @file test_PFLException.cpp
 * @brief Unit tests for PFLException.h - exception hierarchy and macros
 */

#include <gtest/gtest.h>
#include "pfl/Core/PFLException.h"
#include <string>

using namespace pfl;

namespace {

void check_positive(int value) {
    PFL_CHECK_ARG(value > 0, "value must be positive");
}

void fail_shape() {
    PFL_CHECK_SHAPE(false, "x=3 vs x=4");
}

} // namespace

TEST(PFLExceptionTest, StatusAndMessage) {
    PFLException e("boom", PFLStatus::InvalidArgument);
    EXPECT_EQ(e.status(), PFLStatus::InvalidArgument);
    EXPECT_EQ(e.message(), "boom");
    EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
    EXPECT_EQ(e.mpi_rank(), -1);
}

TEST(PFLExceptionTest, CheckArgThrowsWithLocation) {
    EXPECT_NO_THROW(check_positive(1));
    try {
        check_positive(0);
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_EQ(e.status(), PFLStatus::InvalidArgument);
        EXPECT_NE(e.file().find("test_PFLException.cpp"), std::string::npos);
        EXPECT_GT(e.line(), 0);
    }
}

TEST(PFLExceptionTest, SpecificTypesDeriveFromBase) {
    EXPECT_THROW(fail_shape(), ShapeMismatchException);
    EXPECT_THROW(fail_shape(), PFLException);
    EXPECT_THROW(PFL_NOT_IMPLEMENTED("mesh sampling"), NotImplementedException);
    EXPECT_THROW(PFL_THROW(IncompatibleExtrapolations, "PERIODIC + BOUNDARY"), IncompatibleExtrapolations);
}

TEST(PFLExceptionTest, ThrowIfTwoArgumentFormUsesBase) {
    try {
        PFL_THROW_IF(true, "generic failure");
        FAIL() << "expected PFLException";
    } catch (const PFLException& e) {
        EXPECT_EQ(e.status(), PFLStatus::Unknown);
    }
}

TEST(PFLExceptionTest, NotImplementedNamesFeature) {
    NotImplementedException e("rotated boxes");
    EXPECT_EQ(e.status(), PFLStatus::NotImplemented);
    EXPECT_NE(e.message().find("rotated boxes"), std::string::npos);
}

TEST(PFLExceptionTest, AddContextPrependsMessage) {
    OutOfRangeException e("index 5");
    e.add_context("while slicing");
    EXPECT_EQ(e.message().find("while slicing"), 0u);
    EXPECT_NE(std::string(e.what()).find("index 5"), std::string::npos);
}
