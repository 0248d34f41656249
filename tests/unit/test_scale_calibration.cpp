#include <gtest/gtest.h>
#include "scalecalibration.h"

#include <cmath>
#include <limits>

// =============================================================================
// Validation
// =============================================================================

TEST(ScaleCalibrationTest, UncalibratedByDefault) {
    ScaleCalibration c;
    double out = -1.0;
    EXPECT_FALSE(c.isCalibrated());
    EXPECT_EQ(c.convert(10.0, &out), MeasureError::Uncalibrated);
    EXPECT_DOUBLE_EQ(out, -1.0);
    EXPECT_TRUE(std::isnan(c.scaleFactor(LengthUnit::Nanometer)));
}

TEST(ScaleCalibrationTest, RejectsInvalidInput) {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    ScaleCalibration c;
    EXPECT_EQ(c.set(0.0, 50.0, LengthUnit::Nanometer), MeasureError::InvalidScale);
    EXPECT_EQ(c.set(100.0, 0.0, LengthUnit::Nanometer), MeasureError::InvalidScale);
    EXPECT_EQ(c.set(-5.0, 50.0, LengthUnit::Nanometer), MeasureError::InvalidScale);
    EXPECT_EQ(c.set(100.0, -1.0, LengthUnit::Nanometer), MeasureError::InvalidScale);
    EXPECT_EQ(c.set(nan, 50.0, LengthUnit::Nanometer), MeasureError::InvalidScale);
    EXPECT_EQ(c.set(100.0, inf, LengthUnit::Nanometer), MeasureError::InvalidScale);
    EXPECT_FALSE(c.isCalibrated());
}

TEST(ScaleCalibrationTest, FailedSetKeepsPreviousScale) {
    ScaleCalibration c;
    ASSERT_EQ(c.set(100.0, 50.0, LengthUnit::Nanometer), MeasureError::None);
    EXPECT_EQ(c.set(0.0, 10.0, LengthUnit::Micrometer), MeasureError::InvalidScale);

    EXPECT_TRUE(c.isCalibrated());
    EXPECT_EQ(c.unit(), LengthUnit::Nanometer);
    EXPECT_DOUBLE_EQ(c.scaleFactor(LengthUnit::Nanometer), 0.5);
}

// =============================================================================
// Conversion
// =============================================================================

TEST(ScaleCalibrationTest, ConvertReferenceSegmentGivesLength) {
    struct Case { double px; double length; LengthUnit unit; };
    const Case cases[] = {
        {100.0, 50.0, LengthUnit::Nanometer},
        {237.5, 2.0, LengthUnit::Micrometer},
        {12.0, 300.0, LengthUnit::Angstrom},
        {1024.0, 0.1, LengthUnit::Millimeter},
    };

    for (const Case& cs : cases) {
        ScaleCalibration c;
        ASSERT_EQ(c.set(cs.px, cs.length, cs.unit), MeasureError::None);

        double angstroms = 0.0;
        ASSERT_EQ(c.convert(cs.px, &angstroms), MeasureError::None);
        EXPECT_NEAR(convertLength(angstroms, LengthUnit::Angstrom, cs.unit), cs.length,
                    cs.length * 1e-12);
    }
}

TEST(ScaleCalibrationTest, ScaleFactorInUnits) {
    ScaleCalibration c;
    ASSERT_EQ(c.set(100.0, 50.0, LengthUnit::Nanometer), MeasureError::None);
    EXPECT_DOUBLE_EQ(c.scaleFactorAngstrom(), 5.0);
    EXPECT_DOUBLE_EQ(c.scaleFactor(LengthUnit::Angstrom), 5.0);
    EXPECT_DOUBLE_EQ(c.scaleFactor(LengthUnit::Nanometer), 0.5);
}

TEST(ScaleCalibrationTest, DisplayUnitFollowsSet) {
    ScaleCalibration c;
    c.setDisplayUnit(LengthUnit::Centimeter);
    ASSERT_EQ(c.set(10.0, 1.0, LengthUnit::Micrometer), MeasureError::None);
    EXPECT_EQ(c.displayUnit(), LengthUnit::Micrometer);

    c.setDisplayUnit(LengthUnit::Nanometer);
    EXPECT_DOUBLE_EQ(c.toDisplay(100.0), 10.0);
    EXPECT_DOUBLE_EQ(c.fromDisplay(10.0), 100.0);
}

TEST(ScaleCalibrationTest, Reset) {
    ScaleCalibration c;
    ASSERT_EQ(c.set(100.0, 50.0, LengthUnit::Nanometer), MeasureError::None);
    c.reset();
    EXPECT_FALSE(c.isCalibrated());
    EXPECT_DOUBLE_EQ(c.pixelDistance(), 0.0);
}
