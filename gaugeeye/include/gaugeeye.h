// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include <string>

#include "include/config.h"
#include "include/geometry.h"
#include "include/pressure.h"
#include "include/reading.h"
#include "include/timestamp.h"


/*
 *	Possible status that a GaugeDetection can have. Always check this before using the angle.
 *	Everything other than GS_SUCCESS is recorded as a detection failure.
 */
enum GaugeStatus
{
	GS_PROCESSING_ERROR = -4,	// OpenCV threw while processing the image.
	GS_TIMEOUT          = -3,	// Detection ran past the per-image time limit.
	GS_DECODE_ERROR     = -2,	// File missing, unreadable or not an image.
	GS_NOT_FOUND        = -1,	// No gauge face or no needle in the image.
	GS_SUCCESS          =  0	// Circle and needle found, angle and pressure computed.
};

/*
 * 	Result data from FromFrame. Don't just use `angle`, make sure to verify status first.
 * 	'circle' is only meaningful when 'has_circle' is set; a needle miss still reports the face
 * 	so it can be drawn in debug output.
 */
struct GaugeDetection {
	GaugeStatus status;			// Result of attempted read. Should always be checked.
	std::string filename;		// Path the image was read from.
	std::string image_name;		// Basename, used as the database key.
	NaiveTime   timestamp;		// From the filename when it carries one, otherwise now.
	std::string error;			// Reason for failure, empty on success.

	bool has_circle;
	DetectedCircle circle;
	DetectedNeedle needle;

	double angle;				// Needle angle in degrees, [0, 360).
	PressureReading pressure;	// Calibrated values, rounded to 2 places.

	GaugeReading ToReading() const;
};

const char* StatusName(GaugeStatus s);

/*
 * 	Detector for a single-needle dial. Built once per run from the validated config and reused
 * 	for every image; it holds no per-image state, so one instance can be shared across threads.
 *
 * 	Method descriptions can be found in ../src/gaugeeye.cpp
 */
class Gaugeeye
{
private:
	GaugeConfig cfg;
	PressureCalibration cal;
	NeedleCriteria criteria;

	int font = cv::FONT_HERSHEY_SIMPLEX;	// Font for the text line on debug output.

	cv::Mat ToGray(const cv::Mat& frame) const;
	cv::Mat NeedleMask(const cv::Mat& gray, const DetectedCircle& circle) const;
	std::vector<DetectedNeedle> FindSegments(const cv::Mat& binary, const DetectedCircle& circle) const;
	void WriteDebug(const cv::Mat& frame, const GaugeDetection& res, const cv::Mat& binary,
			const std::vector<DetectedNeedle>& segments) const;

public:
	explicit Gaugeeye(const GaugeConfig& cfg);

	bool LocateCircle(const cv::Mat& frame, int min_radius, int max_radius, int binary_threshold,
			DetectedCircle* out) const;
	// 'binary' and 'segments', when given, receive the needle mask and every Hough segment.
	bool ExtractNeedle(const cv::Mat& frame, const DetectedCircle& circle, DetectedNeedle* out,
			cv::Mat* binary=NULL, std::vector<DetectedNeedle>* segments=NULL) const;
	GaugeDetection FromFrame(const cv::Mat& frame, const std::string& path) const;
	GaugeDetection GetReading(const std::string& path) const;
	NaiveTime ExtractTimestamp(const std::string& path) const;

	const GaugeConfig& Config() const { return this->cfg; }

	static std::string DescribeReading(const GaugeDetection& r);
};
