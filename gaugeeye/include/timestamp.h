// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <ctime>
#include <string>

/*
 *	Timestamps are kept as "naive local" seconds: the local wall-clock time encoded as if it were
 *	UTC. That is what the database text column stores, and it keeps bucket arithmetic free of DST
 *	jumps. Never compare these against time(NULL) directly, use NaiveNow().
 */
typedef std::time_t NaiveTime;

const long SECONDS_PER_MINUTE = 60;
const long SECONDS_PER_HOUR   = 3600;
const long SECONDS_PER_DAY    = 86400;

NaiveTime NaiveNow();
NaiveTime MakeNaiveTime(int year, int month, int day, int hour, int minute, int second=0);
std::string FormatTimestamp(NaiveTime t);
bool ParseTimestamp(const std::string& text, NaiveTime* out);
bool TimestampFromFilename(const std::string& name, NaiveTime* out);
std::string BaseName(const std::string& path);
