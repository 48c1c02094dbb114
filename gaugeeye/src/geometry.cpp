// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

/*
 *  Plain geometry used by the detector. Nothing in here touches an image, so every rule that
 *  decides which circle or which line "wins" can be tested without running a Hough transform.
 *
 *  Angle convention used everywhere in gaugeeye:
 *    - measured at the circle center, toward the needle tip
 *    - 0 degrees points right (3 o'clock)
 *    - image y grows downward, so angles grow clockwise on screen
 *    - the configured zero offset is subtracted, then the result is wrapped into [0, 360)
 */

#include <algorithm>
#include <cmath>
#include <limits>

#include "include/geometry.h"

namespace geom {

static const double RAD2DEG = 180.0 / M_PI;
static const double LENGTH_EPS = 1e-9;

double Distance(double x1, double y1, double x2, double y2)
{
	return std::sqrt((x2-x1)*(x2-x1) + (y2-y1)*(y2-y1));
}

double SegmentLength(const DetectedNeedle& n)
{
	return Distance(n.x1, n.y1, n.x2, n.y2);
}

/*
 *  Perpendicular distance from a point to the infinite line through the segment. A degenerate
 *  segment falls back to the point distance.
 */
double LineDistance(const DetectedNeedle& n, double px, double py)
{
	double len = SegmentLength(n);
	if(len < LENGTH_EPS)
		return Distance(n.x1, n.y1, px, py);

	double vx = px - n.x1, vy = py - n.y1;
	double dx = n.x2 - n.x1, dy = n.y2 - n.y1;
	return std::abs(vx*dy - vy*dx) / len;
}

/*
 *  Needles pivot at the center, so the tip is whichever endpoint is farther away from it.
 */
void NeedleTip(const DetectedNeedle& n, const DetectedCircle& c, double* tx, double* ty)
{
	double d1 = Distance(n.x1, n.y1, c.center_x, c.center_y);
	double d2 = Distance(n.x2, n.y2, c.center_x, c.center_y);
	if(d1 > d2) {
		*tx = n.x1;
		*ty = n.y1;
	} else {
		*tx = n.x2;
		*ty = n.y2;
	}
}

double NormalizeDegrees(double deg)
{
	double r = std::fmod(deg, 360.0);
	if(r < 0)
		r += 360.0;
	// fmod of a tiny negative can round back up to exactly 360.
	if(r >= 360.0)
		r -= 360.0;
	return r;
}

double AngleOf(const DetectedNeedle& n, const DetectedCircle& c, double zero_offset)
{
	double tx, ty;
	NeedleTip(n, c, &tx, &ty);
	double raw = std::atan2(ty - c.center_y, tx - c.center_x) * RAD2DEG;
	return NormalizeDegrees(raw - zero_offset);
}

double Clamp(double v, double lo, double hi)
{
	return std::max(lo, std::min(v, hi));
}

double Lerp(double a, double b, double t)
{
	return a + (b - a) * t;
}

/*
 *  A circle touching the frame edge still counts as inside. One that crosses it does not.
 */
bool CircleInBounds(const CircleCandidate& c, int width, int height)
{
	return c.x - c.r >= 0 && c.y - c.r >= 0 &&
		c.x + c.r <= width - 1 && c.y + c.r <= height - 1;
}

/*
 *  Returns the index of the winning candidate or -1. Candidates that satisfy the radius bounds
 *  and sit fully in frame are ordered by votes, then radius, then detection order.
 */
int SelectCircle(const std::vector<CircleCandidate>& candidates, int width, int height,
		int min_radius, int max_radius)
{
	int best = -1;
	for(int i=0; i<(int)candidates.size(); i++) {
		const CircleCandidate& c = candidates[i];
		if(c.r < min_radius || c.r > max_radius)
			continue;
		if(!CircleInBounds(c, width, height))
			continue;

		if(best < 0) {
			best = i;
			continue;
		}

		const CircleCandidate& b = candidates[best];
		if(c.votes > b.votes || (c.votes == b.votes && c.r > b.r))
			best = i;
	}
	return best;
}

/*
 *  Returns the index of the needle segment or -1. A segment qualifies when its line passes
 *  close to the center, its nearer endpoint sits close to the pivot, and it is long enough to
 *  reach the scale. The longest qualifying segment wins; equal lengths prefer the one whose
 *  line passes closer to the center, then detection order.
 */
int SelectNeedle(const std::vector<DetectedNeedle>& segments, const DetectedCircle& circle,
		const NeedleCriteria& criteria)
{
	const double r = circle.radius;
	const double cx = circle.center_x, cy = circle.center_y;

	int best = -1;
	double best_len = 0.0, best_dist = std::numeric_limits<double>::max();

	for(int i=0; i<(int)segments.size(); i++) {
		const DetectedNeedle& s = segments[i];

		double len = SegmentLength(s);
		if(len < LENGTH_EPS || len < r * criteria.min_length_factor)
			continue;

		double dist = LineDistance(s, cx, cy);
		if(dist > r * criteria.center_distance_factor)
			continue;

		double near = std::min(Distance(s.x1, s.y1, cx, cy), Distance(s.x2, s.y2, cx, cy));
		if(near > r * criteria.pivot_factor)
			continue;

		bool longer = len > best_len + LENGTH_EPS;
		bool tied = std::abs(len - best_len) <= LENGTH_EPS;
		if(best < 0 || longer || (tied && dist < best_dist)) {
			best = i;
			best_len = len;
			best_dist = dist;
		}
	}
	return best;
}

} // namespace geom
