// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

/*
 * Gaugeeye reads analog pressure gauges from still photos. Each image goes through two searches:
 * a circular Hough transform to find the dial face, then a probabilistic line transform inside
 * that face to find the needle. The needle's direction from the dial center gives an angle, and
 * the angle maps linearly onto the calibrated pressure scale.
 *
 * The selection rules that pick one circle and one line out of the Hough output live in
 * geometry.cpp, this file only runs the image processing and feeds them.
 */


#include <opencv2/opencv.hpp>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <cerrno>
#include <iomanip>
#include <sstream>

#include "include/gaugeeye.h"

GaugeReading GaugeDetection::ToReading() const
{
	GaugeReading r;
	r.image_name = this->image_name;
	r.angle = this->angle;
	r.center_x = this->circle.center_x;
	r.center_y = this->circle.center_y;
	r.radius = this->circle.radius;
	r.timestamp = this->timestamp;
	r.pressure_primary = this->pressure.primary;
	r.pressure_secondary = this->pressure.secondary;
	return r;
}

const char* StatusName(GaugeStatus s)
{
	switch(s) {
		case GS_SUCCESS:
			return "SUCCESS";
		case GS_NOT_FOUND:
			return "NOTFOUND";
		case GS_DECODE_ERROR:
			return "DECODE";
		case GS_TIMEOUT:
			return "TIMEOUT";
		default:
			return "ERROR";
	}
}

/*
 *  Gaugeeye is intended to be used by creating a single object, and then using it on multiple image
 *  files. The config is copied in, so the object stays valid after the caller's config goes away.
 */
Gaugeeye::Gaugeeye(const GaugeConfig& cfg)
	: cfg(cfg), cal(cfg.Calibration()), criteria(cfg.Needle())
{
	if(this->cfg.runtime.debug) {
		if(mkdir(this->cfg.paths.debug_dir.c_str(), 0755) != 0 && errno != EEXIST)
			spdlog::warn("Could not create debug directory {}", this->cfg.paths.debug_dir);
	}
}

/*
 *  Wrapper that loads the image from disk. An unreadable file comes back as GS_DECODE_ERROR
 *  from FromFrame, it never throws.
 */
GaugeDetection Gaugeeye::GetReading(const std::string& path) const
{
	cv::Mat frame;
	try {
		frame = cv::imread(path);
	} catch(const cv::Exception& e) {
		spdlog::warn("Could not read image {}: {}", path, e.what());
	}
	return this->FromFrame(frame, path);
}

/*
 *  Reading time for an image. The capture script stamps the time into the filename; images
 *  without it are dated when they are processed.
 */
NaiveTime Gaugeeye::ExtractTimestamp(const std::string& path) const
{
	NaiveTime t;
	if(TimestampFromFilename(path, &t))
		return t;
	return NaiveNow();
}

/*
 *  Pretty-print for GaugeDetection. Relies on your terminal having basic color functionality.
 */
std::string Gaugeeye::DescribeReading(const GaugeDetection& r)
{
	std::stringstream ret;

	ret << "\n   Gaugeeye reading for \033[1;33m" << r.image_name << "\033[1;0m\n\n";
	ret << "   ";
	switch(r.status) {
		case GS_SUCCESS:
			ret << "\033[1;32mSUCCESS\033[1;0m";
			break;
		case GS_NOT_FOUND:
			ret << "\033[1;33mNOTFOUND\033[1;0m";
			break;
		default:
			ret << "\033[1;31m" << StatusName(r.status) << "\033[1;0m";
			break;
	}

	ret << " - \033[1;34m";
	ret << std::fixed << std::setprecision(2) << r.angle;
	ret << " deg\033[1;0m\n";
	ret << "   --  Timestamp:  " << FormatTimestamp(r.timestamp) << std::endl;
	if(r.has_circle) {
		ret << "   --  Center:     (" << r.circle.center_x << ", " << r.circle.center_y << ")\n";
		ret << "   --  Radius:     " << r.circle.radius << " px\n";
	}
	if(r.status == GS_SUCCESS) {
		ret << "   --  Primary:    " << std::setprecision(2) << r.pressure.primary << "\n";
		ret << "   --  Secondary:  " << std::setprecision(2) << r.pressure.secondary << "\n";
	} else {
		ret << "   --  Reason:     " << r.error << "\n";
	}

	return ret.str();
}

cv::Mat Gaugeeye::ToGray(const cv::Mat& frame) const
{
	cv::Mat gray;
	if(frame.channels() == 1)
		gray = frame.clone();
	else if(frame.channels() == 4)
		cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
	else
		cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
	return gray;
}

/*
 *  Circular Hough search for the dial face. Highlights above 'binary_threshold' are clipped
 *  first so glare on the glass doesn't outvote the dial rim; the threshold only softens edges,
 *  it never rejects an image on its own.
 *
 *  Every circle Hough reports is handed to geom::SelectCircle, which keeps the highest scoring
 *  one that is within the radius bounds and fully inside the frame.
 */
bool Gaugeeye::LocateCircle(const cv::Mat& frame, int min_radius, int max_radius,
		int binary_threshold, DetectedCircle* out) const
{
	cv::Mat gray = this->ToGray(frame);
	cv::threshold(gray, gray, binary_threshold, 255, cv::THRESH_TRUNC);

	int k = this->cfg.detection.blur_size;
	cv::GaussianBlur(gray, gray, cv::Size(k, k), 0);

	// Vec4f output carries the accumulator votes as the fourth element.
	std::vector<cv::Vec4f> circles;
	cv::HoughCircles(gray, circles, cv::HOUGH_GRADIENT, 1, this->cfg.detection.min_dist,
			this->cfg.detection.param1, this->cfg.detection.param2, min_radius, max_radius);

	std::vector<CircleCandidate> candidates;
	for(const auto& c : circles) {
		CircleCandidate cand;
		cand.x = c[0];
		cand.y = c[1];
		cand.r = c[2];
		cand.votes = c[3];
		candidates.push_back(cand);
	}

	int best = geom::SelectCircle(candidates, gray.cols, gray.rows, min_radius, max_radius);
	spdlog::debug("Circle search: {} candidates, selected {}", candidates.size(), best);
	if(best < 0)
		return false;

	out->center_x = cvRound(candidates[best].x);
	out->center_y = cvRound(candidates[best].y);
	out->radius = cvRound(candidates[best].r);

	// Rounding can push a candidate sitting right at a bound just past it.
	out->radius = std::max(min_radius, std::min(out->radius, max_radius));
	return true;
}

/*
 *  Blanks everything outside the dial and inverts the threshold, so the dark needle comes out
 *  white on a black face.
 */
cv::Mat Gaugeeye::NeedleMask(const cv::Mat& gray, const DetectedCircle& circle) const
{
	cv::Mat mask = cv::Mat::zeros(gray.size(), CV_8UC1);
	cv::circle(mask, cv::Point(circle.center_x, circle.center_y), circle.radius, 255, -1);

	cv::Mat masked, binary;
	cv::bitwise_and(gray, gray, masked, mask);
	cv::threshold(masked, binary, this->cfg.detection.binary_threshold, 255, cv::THRESH_BINARY_INV);
	return binary;
}

std::vector<DetectedNeedle> Gaugeeye::FindSegments(const cv::Mat& binary,
		const DetectedCircle& circle) const
{
	const LineDetectionConfig& lc = this->cfg.lines;

	cv::Mat edges;
	cv::Canny(binary, edges, lc.canny_low, lc.canny_high);

	std::vector<cv::Vec4i> lines;
	cv::HoughLinesP(edges, lines, 1, CV_PI / 180, lc.hough_threshold,
			circle.radius * lc.min_line_length_factor, lc.max_line_gap);

	std::vector<DetectedNeedle> segments;
	for(const auto& l : lines) {
		DetectedNeedle n;
		n.x1 = l[0];
		n.y1 = l[1];
		n.x2 = l[2];
		n.y2 = l[3];
		segments.push_back(n);
	}
	return segments;
}

bool Gaugeeye::ExtractNeedle(const cv::Mat& frame, const DetectedCircle& circle,
		DetectedNeedle* out, cv::Mat* binary, std::vector<DetectedNeedle>* segments) const
{
	cv::Mat mask = this->NeedleMask(this->ToGray(frame), circle);
	std::vector<DetectedNeedle> found = this->FindSegments(mask, circle);

	int best = geom::SelectNeedle(found, circle, this->criteria);
	spdlog::debug("Needle search: {} segments, selected {}", found.size(), best);
	if(best >= 0)
		*out = found[best];

	if(binary)
		*binary = mask;
	if(segments)
		segments->swap(found);
	return best >= 0;
}

/*
 *  Main Gaugeeye algorithm. The responsibility of loading the image falls on the wrapper which
 *  calls this method; an empty frame means the load failed.
 */
GaugeDetection Gaugeeye::FromFrame(const cv::Mat& frame, const std::string& path) const
{
	GaugeDetection res;

	// Starts building the return object in case of early failure.
	res.status = GS_NOT_FOUND;
	res.filename = path;
	res.image_name = BaseName(path);
	res.timestamp = this->ExtractTimestamp(path);
	res.has_circle = false;
	res.circle.center_x = res.circle.center_y = res.circle.radius = 0;
	res.needle.x1 = res.needle.y1 = res.needle.x2 = res.needle.y2 = 0;
	res.angle = 0.0;
	res.pressure.primary = res.pressure.secondary = 0.0;

	if(frame.empty()) {
		res.status = GS_DECODE_ERROR;
		res.error = "could not decode image";
		return res;
	}

	cv::Mat binary;
	std::vector<DetectedNeedle> segments;

	try {
		const DetectionConfig& dc = this->cfg.detection;
		if(!this->LocateCircle(frame, dc.min_radius, dc.max_radius, dc.binary_threshold, &res.circle)) {
			res.error = "no gauge face found";
		} else {
			res.has_circle = true;

			if(!this->ExtractNeedle(frame, res.circle, &res.needle, &binary, &segments)) {
				res.error = segments.empty() ? "no lines found" : "no valid needle among lines";
			} else {
				res.angle = geom::AngleOf(res.needle, res.circle, this->cfg.pressure.zero_angle_offset);

				PressureReading p = ConvertPressure(res.angle, this->cal);
				res.pressure.primary = RoundTo(p.primary, 2);
				res.pressure.secondary = RoundTo(p.secondary, 2);
				res.status = GS_SUCCESS;
			}
		}
	} catch(const std::exception& e) {
		// cv::Exception, and allocation failures on oversized frames.
		res.status = GS_PROCESSING_ERROR;
		res.error = e.what();
	}

	if(this->cfg.runtime.debug)
		this->WriteDebug(frame, res, binary, segments);

	return res;
}

/*
 *  Debug output, written next to each other in the debug directory:
 *    <name>_1_binary.jpg     thresholded face the line search ran on
 *    <name>_2_all_lines.jpg  every segment the line search returned
 *    <name>_result.jpg       selected needle, face and the final reading
 */
void Gaugeeye::WriteDebug(const cv::Mat& frame, const GaugeDetection& res, const cv::Mat& binary,
		const std::vector<DetectedNeedle>& segments) const
{
	const std::string base = this->cfg.paths.debug_dir + "/" + res.image_name;

	try {
		if(!binary.empty())
			cv::imwrite(base + "_1_binary.jpg", binary);

		if(!res.has_circle)
			return;

		cv::Point center(res.circle.center_x, res.circle.center_y);

		cv::Mat all = frame.clone();
		cv::circle(all, center, res.circle.radius, cv::Scalar(0, 255, 0), 2);
		for(const auto& s : segments) {
			cv::line(all, cv::Point(cvRound(s.x1), cvRound(s.y1)), cv::Point(cvRound(s.x2), cvRound(s.y2)),
					cv::Scalar(0, 0, 255), 1);
		}
		cv::imwrite(base + "_2_all_lines.jpg", all);

		if(res.status != GS_SUCCESS)
			return;

		cv::Mat display = frame.clone();
		cv::circle(display, center, res.circle.radius, cv::Scalar(0, 255, 0), 2);

		double tx, ty;
		geom::NeedleTip(res.needle, res.circle, &tx, &ty);
		cv::arrowedLine(display, center, cv::Point(cvRound(tx), cvRound(ty)), cv::Scalar(255, 0, 0), 2,
				cv::LINE_8, 0, 0.1);

		std::stringstream l1;
		l1 << std::fixed << std::setprecision(1) << "Angle: " << res.angle << " deg (";
		l1 << std::setprecision(1) << res.pressure.primary << " / ";
		l1 << std::setprecision(2) << res.pressure.secondary << ")";
		cv::putText(display, l1.str(), cv::Point(10, 30), this->font, 0.7, cv::Scalar(255, 255, 255), 2);

		cv::imwrite(base + "_result.jpg", display);
	} catch(const cv::Exception& e) {
		spdlog::warn("Could not write debug images for {}: {}", res.image_name, e.what());
	}
}
