// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

/*
 *  Config is read with OpenCV's FileStorage so the tool needs nothing beyond what the detector
 *  already links. The file mirrors GaugeConfig section for section:
 *
 *    %YAML:1.0
 *    detection:
 *       binary_threshold: 140
 *       min_radius: 100
 *    pressure:
 *       min_angle: 30
 *       max_angle: 295
 *
 *  Keys that are missing keep their defaults. Unknown keys are ignored.
 */

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include "include/config.h"
#include "include/timestamp.h"

namespace {

void ReadInt(const cv::FileNode& sec, const char* key, int* out)
{
	cv::FileNode n = sec[key];
	if(n.empty())
		return;
	if(!n.isInt() && !n.isReal())
		throw ConfigError(std::string("expected a number for '") + key + "'");
	*out = (int)n;
}

void ReadDouble(const cv::FileNode& sec, const char* key, double* out)
{
	cv::FileNode n = sec[key];
	if(n.empty())
		return;
	if(!n.isInt() && !n.isReal())
		throw ConfigError(std::string("expected a number for '") + key + "'");
	*out = (double)n;
}

void ReadString(const cv::FileNode& sec, const char* key, std::string* out)
{
	cv::FileNode n = sec[key];
	if(n.empty())
		return;
	if(!n.isString())
		throw ConfigError(std::string("expected a string for '") + key + "'");
	*out = (std::string)n;
}

void ReadBool(const cv::FileNode& sec, const char* key, bool* out)
{
	cv::FileNode n = sec[key];
	if(n.empty())
		return;
	if(n.isString()) {
		std::string s = (std::string)n;
		if(s == "true" || s == "yes" || s == "on")
			*out = true;
		else if(s == "false" || s == "no" || s == "off")
			*out = false;
		else
			throw ConfigError(std::string("expected a boolean for '") + key + "'");
		return;
	}
	*out = (int)n != 0;
}

bool FileExists(const std::string& path)
{
	std::ifstream f(path.c_str());
	return f.good();
}

} // namespace

PressureCalibration GaugeConfig::Calibration() const
{
	PressureCalibration cal;
	cal.min_angle = this->pressure.min_angle;
	cal.max_angle = this->pressure.max_angle;
	cal.max_primary = this->pressure.max_primary;
	cal.max_secondary = this->pressure.max_secondary;
	return cal;
}

NeedleCriteria GaugeConfig::Needle() const
{
	NeedleCriteria c;
	c.min_length_factor = this->lines.min_line_length_factor;
	c.center_distance_factor = this->lines.line_center_distance_factor;
	c.pivot_factor = this->lines.needle_pivot_factor;
	return c;
}

/*
 *  Reads 'path' over the built-in defaults. A file that can't be opened or parsed is a
 *  ConfigError.
 */
GaugeConfig LoadConfig(const std::string& path)
{
	GaugeConfig cfg;

	cv::FileStorage fs;
	try {
		if(!fs.open(path, cv::FileStorage::READ))
			throw ConfigError("could not open config file " + path);
	} catch(const cv::Exception& e) {
		throw ConfigError("could not parse config file " + path + ": " + e.what());
	}

	std::string period = PeriodName(cfg.plotting.default_average_period);
	std::string unit = UnitName(cfg.plotting.default_unit);
	std::string policy = cfg.runtime.storage_policy == SP_ABORT ? "abort" : "skip";

	try {
		cv::FileNode p = fs["paths"];
		ReadString(p, "default_image_dir",     &cfg.paths.image_dir);
		ReadString(p, "default_image_pattern", &cfg.paths.image_pattern);
		ReadString(p, "default_debug_dir",     &cfg.paths.debug_dir);
		ReadString(p, "default_db_file",       &cfg.paths.db_file);
		ReadString(p, "default_series_output", &cfg.paths.series_output);

		cv::FileNode d = fs["detection"];
		ReadInt(d,    "binary_threshold", &cfg.detection.binary_threshold);
		ReadInt(d,    "min_radius",       &cfg.detection.min_radius);
		ReadInt(d,    "max_radius",       &cfg.detection.max_radius);
		ReadDouble(d, "change_threshold", &cfg.detection.change_threshold);
		ReadDouble(d, "param1",           &cfg.detection.param1);
		ReadDouble(d, "param2",           &cfg.detection.param2);
		ReadInt(d,    "blur_size",        &cfg.detection.blur_size);
		ReadDouble(d, "min_dist",         &cfg.detection.min_dist);

		cv::FileNode l = fs["line_detection"];
		ReadInt(l,    "canny_low",                   &cfg.lines.canny_low);
		ReadInt(l,    "canny_high",                  &cfg.lines.canny_high);
		ReadInt(l,    "hough_threshold",             &cfg.lines.hough_threshold);
		ReadDouble(l, "min_line_length_factor",      &cfg.lines.min_line_length_factor);
		ReadDouble(l, "max_line_gap",                &cfg.lines.max_line_gap);
		ReadDouble(l, "line_center_distance_factor", &cfg.lines.line_center_distance_factor);
		ReadDouble(l, "needle_pivot_factor",         &cfg.lines.needle_pivot_factor);

		cv::FileNode pr = fs["pressure"];
		ReadDouble(pr, "min_angle",         &cfg.pressure.min_angle);
		ReadDouble(pr, "max_angle",         &cfg.pressure.max_angle);
		ReadDouble(pr, "max_primary",       &cfg.pressure.max_primary);
		ReadDouble(pr, "max_secondary",     &cfg.pressure.max_secondary);
		ReadDouble(pr, "zero_angle_offset", &cfg.pressure.zero_angle_offset);

		cv::FileNode pl = fs["plotting"];
		ReadInt(pl,    "default_time_window",    &cfg.plotting.default_window_days);
		ReadString(pl, "default_average_period", &period);
		ReadInt(pl,    "default_average_value",  &cfg.plotting.default_average_value);
		ReadString(pl, "default_pressure_unit",  &unit);

		cv::FileNode r = fs["runtime"];
		ReadString(r, "gauge_id",         &cfg.runtime.gauge_id);
		ReadInt(r,    "workers",          &cfg.runtime.workers);
		ReadInt(r,    "image_timeout_ms", &cfg.runtime.image_timeout_ms);
		ReadString(r, "storage_policy",   &policy);
		ReadBool(r,   "backup_on_open",   &cfg.runtime.backup_on_open);
	} catch(const cv::Exception& e) {
		throw ConfigError("bad value in " + path + ": " + e.what());
	}

	if(!ParsePeriod(period, &cfg.plotting.default_average_period))
		throw ConfigError("unknown average period '" + period + "'");
	if(!ParseUnit(unit, &cfg.plotting.default_unit))
		throw ConfigError("unknown pressure unit '" + unit + "'");
	if(!ParseStoragePolicy(policy, &cfg.runtime.storage_policy))
		throw ConfigError("unknown storage policy '" + policy + "'");

	cfg.source = path;
	return cfg;
}

std::vector<std::string> DefaultConfigLocations()
{
	std::vector<std::string> locs;
	locs.push_back(GAUGEEYE_CONFIG_PATH);

	const char* home = std::getenv("HOME");
	if(home != NULL)
		locs.push_back(std::string(home) + "/.config/gaugeeye/config.yml");

	locs.push_back("/etc/gaugeeye/config.yml");
	return locs;
}

/*
 *  First config found in the default locations, or built-in defaults if there are none.
 */
GaugeConfig LoadDefaultConfig()
{
	std::vector<std::string> locs = DefaultConfigLocations();
	for(const auto& loc : locs) {
		if(FileExists(loc)) {
			spdlog::info("Loaded configuration from {}", loc);
			return LoadConfig(loc);
		}
	}
	spdlog::warn("No configuration file found, using defaults");
	return GaugeConfig();
}

/*
 *  Throws ConfigError on the first problem. Called once at startup, before the store is opened
 *  or any image is read.
 */
void ValidateConfig(const GaugeConfig& cfg)
{
	std::ostringstream err;

	const PressureConfig& p = cfg.pressure;
	if(!(p.min_angle < p.max_angle))
		err << "min_angle (" << p.min_angle << ") must be less than max_angle (" << p.max_angle << ")";
	else if(p.max_primary <= 0 || p.max_secondary <= 0)
		err << "max_primary and max_secondary must be positive";
	else if(cfg.detection.min_radius <= 0 || cfg.detection.max_radius < cfg.detection.min_radius)
		err << "radius bounds [" << cfg.detection.min_radius << ", " << cfg.detection.max_radius
			<< "] are invalid";
	else if(cfg.detection.binary_threshold < 0 || cfg.detection.binary_threshold > 255)
		err << "binary_threshold must be within [0, 255]";
	else if(cfg.detection.change_threshold < 0)
		err << "change_threshold must not be negative";
	else if(cfg.detection.blur_size < 1 || cfg.detection.blur_size % 2 == 0)
		err << "blur_size must be a positive odd number";
	else if(cfg.lines.min_line_length_factor <= 0 || cfg.lines.line_center_distance_factor <= 0 ||
			cfg.lines.needle_pivot_factor <= 0)
		err << "line detection factors must be positive";
	else if(cfg.plotting.default_average_value < 1)
		err << "default_average_value must be at least 1";
	else if(cfg.plotting.default_window_days < 1)
		err << "default_time_window must be at least 1 day";
	else if(cfg.runtime.workers < 1)
		err << "workers must be at least 1";
	else if(cfg.runtime.image_timeout_ms < 0)
		err << "image_timeout_ms must not be negative";

	if(!err.str().empty())
		throw ConfigError(err.str());
}

bool ParsePeriod(const std::string& name, AveragePeriod* out)
{
	if(name == "minute")
		*out = AP_MINUTE;
	else if(name == "hour")
		*out = AP_HOUR;
	else if(name == "day")
		*out = AP_DAY;
	else
		return false;
	return true;
}

bool ParseUnit(const std::string& name, SeriesUnit* out)
{
	if(name == "angle")
		*out = SU_ANGLE;
	else if(name == "psi" || name == "primary")
		*out = SU_PRIMARY;
	else if(name == "bar" || name == "secondary")
		*out = SU_SECONDARY;
	else
		return false;
	return true;
}

bool ParseStoragePolicy(const std::string& name, StoragePolicy* out)
{
	if(name == "skip")
		*out = SP_SKIP;
	else if(name == "abort")
		*out = SP_ABORT;
	else
		return false;
	return true;
}

const char* PeriodName(AveragePeriod p)
{
	switch(p) {
		case AP_MINUTE:
			return "minute";
		case AP_DAY:
			return "day";
		default:
			return "hour";
	}
}

const char* UnitName(SeriesUnit u)
{
	switch(u) {
		case SU_ANGLE:
			return "angle";
		case SU_SECONDARY:
			return "bar";
		default:
			return "psi";
	}
}

long PeriodSeconds(AveragePeriod p)
{
	switch(p) {
		case AP_MINUTE:
			return SECONDS_PER_MINUTE;
		case AP_DAY:
			return SECONDS_PER_DAY;
		default:
			return SECONDS_PER_HOUR;
	}
}
