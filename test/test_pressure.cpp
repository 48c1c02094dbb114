// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <gtest/gtest.h>

#include "include/pressure.h"

namespace {

PressureCalibration ShopGauge()
{
	PressureCalibration cal;
	cal.min_angle = 31;
	cal.max_angle = 265;
	cal.max_primary = 58;
	cal.max_secondary = 4.0;
	return cal;
}

} // namespace

TEST(Pressure, HalfScale)
{
	// 148 is exactly halfway between 31 and 265.
	PressureReading p = ConvertPressure(148, ShopGauge());
	EXPECT_NEAR(p.primary, 29.0, 1e-9);
	EXPECT_NEAR(p.secondary, 2.0, 1e-9);
}

TEST(Pressure, EndStops)
{
	PressureCalibration cal = ShopGauge();
	EXPECT_NEAR(ConvertPressure(cal.min_angle, cal).primary, 0.0, 1e-9);
	EXPECT_NEAR(ConvertPressure(cal.max_angle, cal).primary, 58.0, 1e-9);
	EXPECT_NEAR(ConvertPressure(cal.max_angle, cal).secondary, 4.0, 1e-9);
}

TEST(Pressure, ClampsOutsideTheArc)
{
	PressureCalibration cal = ShopGauge();

	PressureReading lo = ConvertPressure(5, cal);
	EXPECT_EQ(lo.primary, 0.0);
	EXPECT_EQ(lo.secondary, 0.0);

	PressureReading hi = ConvertPressure(350, cal);
	EXPECT_EQ(hi.primary, 58.0);
	EXPECT_EQ(hi.secondary, 4.0);

	EXPECT_EQ(CalibrationFraction(-10, cal), 0.0);
	EXPECT_EQ(CalibrationFraction(359.9, cal), 1.0);
}

TEST(Pressure, UnitsStayProportional)
{
	PressureCalibration cal = ShopGauge();
	for(double a=0; a<360; a+=13.5) {
		PressureReading p = ConvertPressure(a, cal);
		EXPECT_NEAR(p.secondary * cal.max_primary, p.primary * cal.max_secondary, 1e-9) << "angle " << a;
		EXPECT_GE(p.primary, 0.0);
		EXPECT_LE(p.primary, cal.max_primary);
	}
}

TEST(Pressure, MonotonicAlongTheArc)
{
	PressureCalibration cal = ShopGauge();
	double prev = -1.0;
	for(double a=cal.min_angle; a<=cal.max_angle; a+=1.0) {
		double v = ConvertPressure(a, cal).primary;
		EXPECT_GE(v, prev);
		prev = v;
	}
}

TEST(Pressure, RoundTo)
{
	EXPECT_DOUBLE_EQ(RoundTo(29.004, 2), 29.0);
	EXPECT_DOUBLE_EQ(RoundTo(1.235, 1), 1.2);
	EXPECT_DOUBLE_EQ(RoundTo(-3.14159, 2), -3.14);
	EXPECT_DOUBLE_EQ(RoundTo(7.0, 0), 7.0);
}
