// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <vector>


/*
 *	Gauge face found by the circle search. Pixel coordinates, top-left origin.
 */
struct DetectedCircle {
	int center_x;
	int center_y;
	int radius;
};

/*
 *	Needle segment in pixel coordinates. Endpoint order is whatever the line search produced,
 *	use NeedleTip() to get the end that points at the scale.
 */
struct DetectedNeedle {
	double x1, y1;
	double x2, y2;
};

/*
 *	Raw output of the circular Hough search before any bounds are applied. 'votes' is the
 *	accumulator score, higher means a stronger circle.
 */
struct CircleCandidate {
	double x, y, r;
	double votes;
};

/*
 *	Tunables for needle candidate filtering. All factors are relative to the circle radius.
 */
struct NeedleCriteria {
	double min_length_factor;		// Shortest accepted segment.
	double center_distance_factor;	// Max distance from center to the segment's line.
	double pivot_factor;			// Max distance from center to the nearer endpoint.
};

namespace geom {

double Distance(double x1, double y1, double x2, double y2);
double SegmentLength(const DetectedNeedle& n);
double LineDistance(const DetectedNeedle& n, double px, double py);
void NeedleTip(const DetectedNeedle& n, const DetectedCircle& c, double* tx, double* ty);
double NormalizeDegrees(double deg);
double AngleOf(const DetectedNeedle& n, const DetectedCircle& c, double zero_offset=0.0);
double Clamp(double v, double lo, double hi);
double Lerp(double a, double b, double t);

bool CircleInBounds(const CircleCandidate& c, int width, int height);
int SelectCircle(const std::vector<CircleCandidate>& candidates, int width, int height,
		int min_radius, int max_radius);
int SelectNeedle(const std::vector<DetectedNeedle>& segments, const DetectedCircle& circle,
		const NeedleCriteria& criteria);

} // namespace geom
