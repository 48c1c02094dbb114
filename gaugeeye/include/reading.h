// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <string>

#include "include/timestamp.h"

/*
 *	One row of gauge_results. Written once per successfully processed image; 'image_name' is the
 *	file's basename and the unique key across both result tables.
 */
struct GaugeReading {
	std::string image_name;
	double angle;
	int center_x;
	int center_y;
	int radius;
	NaiveTime timestamp;
	double pressure_primary;
	double pressure_secondary;
};

/*
 *	One row of detection_failures.
 */
struct DetectionFailure {
	std::string image_name;
	NaiveTime timestamp;
};
