// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "include/geometry.h"
#include "include/pressure.h"

/*
 *	Config file looked up when none is given on the command line. Override at build time by
 *	passing -DGAUGEEYE_CONFIG_PATH=... to CMake.
 */
#ifndef GAUGEEYE_CONFIG_PATH
	#define GAUGEEYE_CONFIG_PATH "./gaugeeye.yml"
#endif

/*
 *	Thrown for anything that makes a run meaningless before the first image is touched: a
 *	config file that won't parse, or values that fail ValidateConfig().
 */
class ConfigError : public std::runtime_error
{
public:
	explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum AveragePeriod
{
	AP_MINUTE = 0,
	AP_HOUR   = 1,
	AP_DAY    = 2
};

enum SeriesUnit
{
	SU_ANGLE     = 0,	// Raw needle angle in degrees.
	SU_PRIMARY   = 1,	// First calibrated unit (PSI).
	SU_SECONDARY = 2	// Second calibrated unit (BAR).
};

/*
 *	What the batch does when a result can't be written. 'Skip' logs and moves on to the next
 *	image, 'abort' stops the run. Either way rows already committed are untouched.
 */
enum StoragePolicy
{
	SP_SKIP  = 0,
	SP_ABORT = 1
};

struct PathConfig {
	std::string image_dir     = "dial_images";
	std::string image_pattern = "*.jpg";
	std::string debug_dir     = "debug";
	std::string db_file       = "gauge_data.db";
	std::string series_output = "gauge_series.csv";
};

struct DetectionConfig {
	int binary_threshold    = 140;
	int min_radius          = 100;
	int max_radius          = 1000;
	double change_threshold = 5.0;
	double param1           = 60;	// Canny high threshold inside HoughCircles.
	double param2           = 30;	// Accumulator threshold for circle centers.
	int blur_size           = 9;
	double min_dist         = 100;
};

struct LineDetectionConfig {
	int canny_low                      = 50;
	int canny_high                     = 150;
	int hough_threshold                = 25;
	double min_line_length_factor      = 0.25;
	double max_line_gap                = 20;
	double line_center_distance_factor = 0.125;
	double needle_pivot_factor         = 0.5;
};

struct PressureConfig {
	double min_angle         = 30;
	double max_angle         = 295;
	double max_primary       = 58;
	double max_secondary     = 4.0;
	double zero_angle_offset = 0;
};

struct PlotConfig {
	int default_window_days              = 7;
	AveragePeriod default_average_period = AP_HOUR;
	int default_average_value            = 1;
	SeriesUnit default_unit              = SU_PRIMARY;
};

struct RuntimeConfig {
	std::string gauge_id   = "default";
	int workers            = 1;
	int image_timeout_ms   = 0;		// 0 disables the per-image timeout.
	StoragePolicy storage_policy = SP_SKIP;
	bool backup_on_open    = true;
	bool debug             = false;
};

/*
 *	Everything a run needs, built once at startup and passed by const reference to each
 *	component. Defaults match the shop gauge the tool was first deployed on.
 */
struct GaugeConfig {
	PathConfig paths;
	DetectionConfig detection;
	LineDetectionConfig lines;
	PressureConfig pressure;
	PlotConfig plotting;
	RuntimeConfig runtime;
	std::string source;		// File the values came from, empty for built-in defaults.

	PressureCalibration Calibration() const;
	NeedleCriteria Needle() const;
};

GaugeConfig LoadConfig(const std::string& path);
GaugeConfig LoadDefaultConfig();
void ValidateConfig(const GaugeConfig& cfg);
std::vector<std::string> DefaultConfigLocations();

bool ParsePeriod(const std::string& name, AveragePeriod* out);
bool ParseUnit(const std::string& name, SeriesUnit* out);
bool ParseStoragePolicy(const std::string& name, StoragePolicy* out);
const char* PeriodName(AveragePeriod p);
const char* UnitName(SeriesUnit u);
long PeriodSeconds(AveragePeriod p);
