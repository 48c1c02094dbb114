// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

/*
 *	Linear calibration of the dial arc. 'min_angle' reads zero, 'max_angle' reads full scale.
 *	Primary and secondary are two units for the same scale (PSI and BAR on the shop gauge).
 */
struct PressureCalibration {
	double min_angle;
	double max_angle;
	double max_primary;
	double max_secondary;
};

struct PressureReading {
	double primary;
	double secondary;
};

PressureReading ConvertPressure(double angle, const PressureCalibration& cal);
double CalibrationFraction(double angle, const PressureCalibration& cal);
double RoundTo(double v, int places);
