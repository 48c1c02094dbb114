// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <ostream>
#include <vector>

#include "include/config.h"
#include "include/reading.h"
#include "include/timestamp.h"

/*
 *	One point of an output series. Raw points have count 1 and no stddev. Averaged points are
 *	stamped with their bucket's start time.
 */
struct SeriesPoint {
	NaiveTime timestamp;
	double value;
	bool has_stddev;
	double stddev;		// Population standard deviation of the bucket.
	int count;
	double min;
	double max;
};

struct SeriesSummary {
	int count;
	double min;
	double max;
	double mean;
	double stddev;
};

/*
 *	Query parameters for one series. 'now' is passed in rather than read from the clock so a
 *	window is reproducible.
 */
struct AggregateOptions {
	int window_days;
	bool all_time;
	bool average;
	AveragePeriod period;
	int average_value;
	SeriesUnit unit;
	NaiveTime now;
};

class TimeSeriesAggregator
{
private:
	AggregateOptions opts;

	long BucketSeconds() const;
	static NaiveTime BucketStart(NaiveTime t, long width);

public:
	explicit TimeSeriesAggregator(const AggregateOptions& opts);

	std::vector<GaugeReading> FilterWindow(const std::vector<GaugeReading>& readings) const;
	std::vector<SeriesPoint> Aggregate(const std::vector<GaugeReading>& readings) const;
	const AggregateOptions& Options() const { return opts; }

	static AggregateOptions DefaultOptions(const GaugeConfig& cfg);
	static double ValueOf(const GaugeReading& r, SeriesUnit unit);
	static SeriesSummary Summarize(const std::vector<SeriesPoint>& series);
	static void WriteCsv(std::ostream& out, const std::vector<SeriesPoint>& series, SeriesUnit unit);
};
