// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <cstdio>
#include <cstring>
#include <regex>

#include "include/timestamp.h"

NaiveTime NaiveNow()
{
	std::time_t now = std::time(NULL);
	std::tm local;
	localtime_r(&now, &local);
	return timegm(&local);
}

NaiveTime MakeNaiveTime(int year, int month, int day, int hour, int minute, int second)
{
	std::tm t;
	std::memset(&t, 0, sizeof(t));
	t.tm_year = year - 1900;
	t.tm_mon  = month - 1;
	t.tm_mday = day;
	t.tm_hour = hour;
	t.tm_min  = minute;
	t.tm_sec  = second;
	return timegm(&t);
}

/*
 *  Same text layout as the gauge_results.timestamp column: "YYYY-MM-DD HH:MM:SS".
 */
std::string FormatTimestamp(NaiveTime t)
{
	std::tm b;
	gmtime_r(&t, &b);
	char buf[32];
	std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &b);
	return std::string(buf);
}

bool ParseTimestamp(const std::string& text, NaiveTime* out)
{
	int y, mo, d, h, mi, s;
	if(std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d", &y, &mo, &d, &h, &mi, &s) != 6)
		return false;
	if(mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60)
		return false;

	*out = MakeNaiveTime(y, mo, d, h, mi, s);
	return true;
}

/*
 *  The capture script names files like "gauge_250314_0930.jpg" (YYMMDD_HHMM). The first match
 *  in the basename is used. Returns false when there is no usable match, in which case the
 *  caller falls back to the processing time.
 */
bool TimestampFromFilename(const std::string& name, NaiveTime* out)
{
	static const std::regex pattern("(\\d{6})_(\\d{4})");

	std::string base = BaseName(name);
	std::smatch m;
	if(!std::regex_search(base, m, pattern))
		return false;

	const std::string date = m[1].str();
	const std::string time = m[2].str();

	int year   = 2000 + std::stoi(date.substr(0, 2));
	int month  = std::stoi(date.substr(2, 2));
	int day    = std::stoi(date.substr(4, 2));
	int hour   = std::stoi(time.substr(0, 2));
	int minute = std::stoi(time.substr(2, 2));

	if(month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59)
		return false;

	*out = MakeNaiveTime(year, month, day, hour, minute);
	return true;
}

std::string BaseName(const std::string& path)
{
	size_t pos = path.find_last_of('/');
	if(pos == std::string::npos)
		return path;
	return path.substr(pos + 1);
}
