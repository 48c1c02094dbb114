// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <cmath>

#include "include/history.h"

/*
 *  Replaces the gauge's history with 'readings', kept in the order given. The store hands them
 *  over sorted by timestamp.
 */
void ReadingHistory::Load(const std::string& gauge, const std::vector<GaugeReading>& readings)
{
	std::lock_guard<std::mutex> lock(this->mtx);

	std::vector<Entry>& v = this->entries[gauge];
	v.clear();
	v.reserve(readings.size());
	for(const auto& r : readings) {
		Entry e;
		e.angle = r.angle;
		e.timestamp = r.timestamp;
		v.push_back(e);
	}
}

bool ReadingHistory::Last(const std::string& gauge, double* angle, NaiveTime* t) const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	auto it = this->entries.find(gauge);
	if(it == this->entries.end() || it->second.empty())
		return false;

	*angle = it->second.back().angle;
	if(t != NULL)
		*t = it->second.back().timestamp;
	return true;
}

size_t ReadingHistory::Size(const std::string& gauge) const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	auto it = this->entries.find(gauge);
	return it == this->entries.end() ? 0 : it->second.size();
}

/*
 *  Equality counts as significant: a 5 degree move against a 5 degree threshold is flagged.
 */
bool ReadingHistory::IsSignificant(double previous, double next, double threshold)
{
	return std::abs(next - previous) >= threshold;
}

ChangeAssessment ReadingHistory::AssessLocked(const std::string& gauge, double angle, NaiveTime t,
		double threshold) const
{
	ChangeAssessment a;
	a.has_previous = false;
	a.change = 0.0;
	a.rate = 0.0;
	a.notable = false;

	auto it = this->entries.find(gauge);
	if(it == this->entries.end() || it->second.empty())
		return a;

	const Entry& prev = it->second.back();
	a.has_previous = true;
	a.change = angle - prev.angle;
	a.notable = IsSignificant(prev.angle, angle, threshold);

	double minutes = double(t - prev.timestamp) / SECONDS_PER_MINUTE;
	if(minutes != 0.0)
		a.rate = a.change / minutes;

	return a;
}

ChangeAssessment ReadingHistory::Assess(const std::string& gauge, double angle, NaiveTime t,
		double threshold) const
{
	std::lock_guard<std::mutex> lock(this->mtx);
	return this->AssessLocked(gauge, angle, t, threshold);
}

/*
 *  Compares against the last accepted angle and appends in one step, so two workers finishing
 *  at once each compare against a real predecessor.
 */
ChangeAssessment ReadingHistory::Accept(const std::string& gauge, double angle, NaiveTime t,
		double threshold)
{
	std::lock_guard<std::mutex> lock(this->mtx);

	ChangeAssessment a = this->AssessLocked(gauge, angle, t, threshold);

	Entry e;
	e.angle = angle;
	e.timestamp = t;
	this->entries[gauge].push_back(e);
	return a;
}
