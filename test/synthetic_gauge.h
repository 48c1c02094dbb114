// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <cmath>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "include/config.h"

/*
 *	Clean test dial: white 640x480 frame, dark rim of radius 150 at (320, 240) and a needle from
 *	the center toward 'angle_deg' in image coordinates. A negative angle draws no needle.
 */
inline cv::Mat SyntheticGauge(double angle_deg)
{
	cv::Mat img(480, 640, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::Point center(320, 240);
	cv::circle(img, center, 150, cv::Scalar(0, 0, 0), 4);

	if(angle_deg >= 0) {
		double rad = angle_deg * M_PI / 180.0;
		cv::Point tip(cvRound(320 + 120 * std::cos(rad)), cvRound(240 + 120 * std::sin(rad)));
		cv::line(img, center, tip, cv::Scalar(0, 0, 0), 5);
	}
	return img;
}

inline cv::Mat BlankFrame()
{
	return cv::Mat(480, 640, CV_8UC3, cv::Scalar(255, 255, 255));
}

/*
 *	Detector settings sized for SyntheticGauge().
 */
inline GaugeConfig SyntheticConfig()
{
	GaugeConfig cfg;
	cfg.detection.min_radius = 100;
	cfg.detection.max_radius = 200;
	cfg.pressure.min_angle = 30;
	cfg.pressure.max_angle = 295;
	cfg.runtime.backup_on_open = false;
	return cfg;
}
