// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

/*
 *  Turns the stored reading history into the series the chart renderer plots. Values come
 *  straight from the stored columns; calibration happened when the reading was taken and is
 *  never redone here.
 *
 *  Buckets are fixed width (average_value * period) and aligned to the naive-local epoch, so hour
 *  and day buckets start on the clock. Buckets without readings produce no point.
 */

#include <algorithm>
#include <cmath>
#include <iomanip>

#include "include/aggregator.h"

TimeSeriesAggregator::TimeSeriesAggregator(const AggregateOptions& opts) : opts(opts)
{
}

AggregateOptions TimeSeriesAggregator::DefaultOptions(const GaugeConfig& cfg)
{
	AggregateOptions o;
	o.window_days = cfg.plotting.default_window_days;
	o.all_time = false;
	o.average = false;
	o.period = cfg.plotting.default_average_period;
	o.average_value = cfg.plotting.default_average_value;
	o.unit = cfg.plotting.default_unit;
	o.now = NaiveNow();
	return o;
}

double TimeSeriesAggregator::ValueOf(const GaugeReading& r, SeriesUnit unit)
{
	switch(unit) {
		case SU_ANGLE:
			return r.angle;
		case SU_SECONDARY:
			return r.pressure_secondary;
		default:
			return r.pressure_primary;
	}
}

long TimeSeriesAggregator::BucketSeconds() const
{
	return PeriodSeconds(this->opts.period) * std::max(1, this->opts.average_value);
}

// Floor division, so pre-epoch timestamps land in the right bucket too.
NaiveTime TimeSeriesAggregator::BucketStart(NaiveTime t, long width)
{
	NaiveTime q = t / width;
	if(t % width != 0 && t < 0)
		q--;
	return q * width;
}

/*
 *  Readings inside the window, oldest first. Readings sharing a timestamp keep their input
 *  order. With 'all_time' nothing is dropped.
 */
std::vector<GaugeReading> TimeSeriesAggregator::FilterWindow(
		const std::vector<GaugeReading>& readings) const
{
	std::vector<GaugeReading> kept;
	NaiveTime cutoff = this->opts.now - (NaiveTime)this->opts.window_days * SECONDS_PER_DAY;

	for(const auto& r : readings) {
		if(this->opts.all_time || r.timestamp >= cutoff)
			kept.push_back(r);
	}

	std::stable_sort(kept.begin(), kept.end(),
			[] (const GaugeReading& a, const GaugeReading& b) {return a.timestamp < b.timestamp;});
	return kept;
}

std::vector<SeriesPoint> TimeSeriesAggregator::Aggregate(
		const std::vector<GaugeReading>& readings) const
{
	std::vector<GaugeReading> kept = this->FilterWindow(readings);
	std::vector<SeriesPoint> series;

	if(!this->opts.average) {
		for(const auto& r : kept) {
			SeriesPoint p;
			p.timestamp = r.timestamp;
			p.value = ValueOf(r, this->opts.unit);
			p.has_stddev = false;
			p.stddev = 0.0;
			p.count = 1;
			p.min = p.max = p.value;
			series.push_back(p);
		}
		return series;
	}

	const long width = this->BucketSeconds();

	// 'kept' is sorted, so each bucket is one contiguous run.
	size_t i = 0;
	while(i < kept.size()) {
		NaiveTime start = BucketStart(kept[i].timestamp, width);

		std::vector<double> values;
		while(i < kept.size() && BucketStart(kept[i].timestamp, width) == start) {
			values.push_back(ValueOf(kept[i], this->opts.unit));
			i++;
		}

		double sum = 0.0;
		for(const auto& v : values)
			sum += v;
		double mean = sum / values.size();

		double sq = 0.0;
		for(const auto& v : values)
			sq += (v - mean) * (v - mean);

		SeriesPoint p;
		p.timestamp = start;
		p.value = mean;
		p.has_stddev = true;
		p.stddev = std::sqrt(sq / values.size());
		p.count = (int)values.size();
		p.min = *std::min_element(values.begin(), values.end());
		p.max = *std::max_element(values.begin(), values.end());
		series.push_back(p);
	}

	return series;
}

/*
 *  Footer statistics over the output values: population stddev, like the per-bucket one.
 */
SeriesSummary TimeSeriesAggregator::Summarize(const std::vector<SeriesPoint>& series)
{
	SeriesSummary s;
	s.count = (int)series.size();
	s.min = s.max = s.mean = s.stddev = 0.0;
	if(series.empty())
		return s;

	s.min = s.max = series[0].value;
	double sum = 0.0;
	for(const auto& p : series) {
		s.min = std::min(s.min, p.value);
		s.max = std::max(s.max, p.value);
		sum += p.value;
	}
	s.mean = sum / s.count;

	double sq = 0.0;
	for(const auto& p : series)
		sq += (p.value - s.mean) * (p.value - s.mean);
	s.stddev = std::sqrt(sq / s.count);

	return s;
}

/*
 *  CSV handed to the chart renderer: timestamp,<unit>,stddev. The stddev column is empty for
 *  raw points.
 */
void TimeSeriesAggregator::WriteCsv(std::ostream& out, const std::vector<SeriesPoint>& series,
		SeriesUnit unit)
{
	out << "timestamp," << UnitName(unit) << ",stddev\n";
	for(const auto& p : series) {
		out << FormatTimestamp(p.timestamp) << ",";
		out << std::fixed << std::setprecision(4) << p.value << ",";
		if(p.has_stddev)
			out << std::fixed << std::setprecision(4) << p.stddev;
		out << "\n";
	}
}
