/**
 * @file test_lengthformatter.cpp
 * @brief Unit tests for significant-digit formatting and scale input
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "lengthformatter.h"

namespace {

Calibration micronCalibration(double unitsPerPixel)
{
    Calibration c;
    c.unit = LengthFormatter::defaultUnit();
    c.unitsPerPixel = unitsPerPixel;
    return c;
}

} // anonymous namespace

TEST(LengthFormatterTest, FourSignificantDigits) {
    EXPECT_EQ(LengthFormatter::formatSignificant(123.456, RoundingMode::Round), "123.5");
    EXPECT_EQ(LengthFormatter::formatSignificant(2.5, RoundingMode::Round), "2.500");
    EXPECT_EQ(LengthFormatter::formatSignificant(0.000123456, RoundingMode::Round), "0.0001235");
    EXPECT_EQ(LengthFormatter::formatSignificant(12345.0, RoundingMode::Round), "12350");
}

TEST(LengthFormatterTest, RoundingCarriesIntoNextDecade) {
    EXPECT_EQ(LengthFormatter::formatSignificant(99999.0, RoundingMode::Round), "100000");
    EXPECT_EQ(LengthFormatter::formatSignificant(9.9996, RoundingMode::Round), "10.00");
}

TEST(LengthFormatterTest, ZeroAndNonFinite) {
    EXPECT_EQ(LengthFormatter::formatSignificant(0.0, RoundingMode::Round), "0.0000");
    EXPECT_EQ(LengthFormatter::formatSignificant(0.0, RoundingMode::Ceil), "0.0000");
    EXPECT_TRUE(LengthFormatter::formatSignificant(
        std::numeric_limits<double>::quiet_NaN(), RoundingMode::Round).isEmpty());
    EXPECT_TRUE(LengthFormatter::formatSignificant(
        std::numeric_limits<double>::infinity(), RoundingMode::Ceil).isEmpty());
}

TEST(LengthFormatterTest, SubnormalValuesStayFinite) {
    const double tiny = 1e-320;
    const double rounded = LengthFormatter::roundToSignificant(tiny, 4, RoundingMode::Round);
    EXPECT_TRUE(std::isfinite(rounded));
    EXPECT_GT(rounded, 0.0);

    const QString text = LengthFormatter::formatSignificant(tiny, RoundingMode::Ceil);
    EXPECT_TRUE(text.startsWith("0.000"));
    EXPECT_EQ(LengthFormatter::scaleText(micronCalibration(tiny), RoundingMode::Round).right(5),
              QString::fromUtf8("\xC2\xB5m/px"));
}

TEST(LengthFormatterTest, CeilRoundsAwayFromZero) {
    EXPECT_EQ(LengthFormatter::formatSignificant(1.2341, RoundingMode::Round), "1.234");
    EXPECT_EQ(LengthFormatter::formatSignificant(1.2341, RoundingMode::Ceil), "1.235");
    EXPECT_EQ(LengthFormatter::formatSignificant(-1.2341, RoundingMode::Ceil), "-1.235");
    EXPECT_EQ(LengthFormatter::formatSignificant(2.5, RoundingMode::Ceil), "2.500");
}

TEST(LengthFormatterTest, FormattedLengthWithUnits) {
    EXPECT_EQ(LengthFormatter::formattedLength(123.456, Calibration(), RoundingMode::Round),
              "123.5 px");
    EXPECT_EQ(LengthFormatter::formattedLength(123.456, micronCalibration(0.01), RoundingMode::Round),
              QString::fromUtf8("1.235 \xC2\xB5m"));
}

TEST(LengthFormatterTest, CalibratedLengthIgnoresInvalidCalibration) {
    Calibration broken;
    broken.unit = "mm";
    broken.unitsPerPixel = -2.0;
    EXPECT_FALSE(broken.isValid());
    EXPECT_DOUBLE_EQ(LengthFormatter::calibratedLength(10.0, broken), 10.0);
    EXPECT_EQ(LengthFormatter::unitLabel(broken), "px");
    EXPECT_DOUBLE_EQ(LengthFormatter::calibratedLength(10.0, micronCalibration(0.5)), 5.0);
}

TEST(LengthFormatterTest, ScaleText) {
    EXPECT_EQ(LengthFormatter::scaleText(Calibration(), RoundingMode::Round), "Not set");
    EXPECT_EQ(LengthFormatter::scaleText(micronCalibration(0.01), RoundingMode::Round),
              QString::fromUtf8("0.01000 \xC2\xB5m/px"));
}

TEST(LengthFormatterTest, CalibrationFromInputAcceptsCommaDecimal) {
    Calibration c;
    ASSERT_TRUE(LengthFormatter::calibrationFromInput("", "2,5", 100.0, c));
    EXPECT_EQ(c.unit, LengthFormatter::defaultUnit());
    EXPECT_DOUBLE_EQ(c.unitsPerPixel, 0.025);

    ASSERT_TRUE(LengthFormatter::calibrationFromInput(" mm ", " 10 ", 50.0, c));
    EXPECT_EQ(c.unit, "mm");
    EXPECT_DOUBLE_EQ(c.unitsPerPixel, 0.2);
}

TEST(LengthFormatterTest, CalibrationFromInputRejectsBadValues) {
    Calibration c = micronCalibration(0.5);
    QString error;

    EXPECT_FALSE(LengthFormatter::calibrationFromInput("mm", "abc", 100.0, c, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(LengthFormatter::calibrationFromInput("mm", "0", 100.0, c));
    EXPECT_FALSE(LengthFormatter::calibrationFromInput("mm", "-3", 100.0, c));
    EXPECT_FALSE(LengthFormatter::calibrationFromInput("mm", "", 100.0, c));
    EXPECT_FALSE(LengthFormatter::calibrationFromInput("mm", "5", 0.0, c));

    // Untouched on failure
    EXPECT_EQ(c, micronCalibration(0.5));
}
