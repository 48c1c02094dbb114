// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "include/reading.h"
#include "include/timestamp.h"

/*
 *	How a new angle compares to the previous accepted one for the same gauge. With no previous
 *	reading, 'has_previous' is false and nothing is notable.
 */
struct ChangeAssessment {
	bool has_previous;
	double change;			// new - previous, degrees.
	double rate;			// Degrees per minute, 0 when both readings share a timestamp.
	bool notable;			// |change| >= change_threshold.
};

/*
 *	Accepted angles per gauge, in the order they were accepted. Rebuilt from the result store at
 *	the start of a run and appended to as readings succeed. Safe to share between workers.
 */
class ReadingHistory
{
private:
	struct Entry {
		double angle;
		NaiveTime timestamp;
	};

	std::map<std::string, std::vector<Entry> > entries;
	mutable std::mutex mtx;

	ChangeAssessment AssessLocked(const std::string& gauge, double angle, NaiveTime t,
			double threshold) const;

public:
	void Load(const std::string& gauge, const std::vector<GaugeReading>& readings);
	bool Last(const std::string& gauge, double* angle, NaiveTime* t=NULL) const;
	size_t Size(const std::string& gauge) const;

	ChangeAssessment Assess(const std::string& gauge, double angle, NaiveTime t,
			double threshold) const;
	ChangeAssessment Accept(const std::string& gauge, double angle, NaiveTime t, double threshold);

	static bool IsSignificant(double previous, double next, double threshold);
};
