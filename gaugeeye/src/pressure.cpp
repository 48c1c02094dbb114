// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <cmath>

#include "include/geometry.h"
#include "include/pressure.h"

/*
 *  Position of 'angle' along the calibrated arc, clamped to [0, 1]. Angles past either stop
 *  saturate instead of failing: a needle resting below zero still reads zero.
 *  Bounds are validated with the rest of the config, so max_angle > min_angle here.
 */
double CalibrationFraction(double angle, const PressureCalibration& cal)
{
	double f = (angle - cal.min_angle) / (cal.max_angle - cal.min_angle);
	return geom::Clamp(f, 0.0, 1.0);
}

PressureReading ConvertPressure(double angle, const PressureCalibration& cal)
{
	double f = CalibrationFraction(angle, cal);

	PressureReading p;
	p.primary = geom::Lerp(0.0, cal.max_primary, f);
	p.secondary = geom::Lerp(0.0, cal.max_secondary, f);
	return p;
}

double RoundTo(double v, int places)
{
	double p = std::pow(10.0, places);
	return std::round(v * p) / p;
}
