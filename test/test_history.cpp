// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "include/history.h"

namespace {

GaugeReading Reading(const std::string& name, double angle, NaiveTime t)
{
	GaugeReading r;
	r.image_name = name;
	r.angle = angle;
	r.center_x = r.center_y = r.radius = 0;
	r.timestamp = t;
	r.pressure_primary = r.pressure_secondary = 0.0;
	return r;
}

} // namespace

TEST(ReadingHistory, FirstReadingHasNoPredecessor)
{
	ReadingHistory h;
	ChangeAssessment a = h.Accept("g", 40.0, MakeNaiveTime(2025, 3, 14, 9, 0), 5.0);
	EXPECT_FALSE(a.has_previous);
	EXPECT_FALSE(a.notable);
	EXPECT_EQ(h.Size("g"), 1u);
}

TEST(ReadingHistory, LargeChangeIsNotable)
{
	ReadingHistory h;
	h.Accept("g", 40.0, MakeNaiveTime(2025, 3, 14, 9, 0), 5.0);
	ChangeAssessment a = h.Accept("g", 46.0, MakeNaiveTime(2025, 3, 14, 9, 10), 5.0);

	EXPECT_TRUE(a.has_previous);
	EXPECT_TRUE(a.notable);
	EXPECT_NEAR(a.change, 6.0, 1e-9);
	EXPECT_NEAR(a.rate, 0.6, 1e-9);
}

TEST(ReadingHistory, SmallChangeIsNotNotable)
{
	ReadingHistory h;
	h.Accept("g", 40.0, MakeNaiveTime(2025, 3, 14, 9, 0), 5.0);
	ChangeAssessment a = h.Accept("g", 43.0, MakeNaiveTime(2025, 3, 14, 9, 1), 5.0);
	EXPECT_TRUE(a.has_previous);
	EXPECT_FALSE(a.notable);
	EXPECT_NEAR(a.change, 3.0, 1e-9);
}

TEST(ReadingHistory, ThresholdIsInclusive)
{
	EXPECT_TRUE(ReadingHistory::IsSignificant(40.0, 45.0, 5.0));
	EXPECT_TRUE(ReadingHistory::IsSignificant(45.0, 40.0, 5.0));
	EXPECT_FALSE(ReadingHistory::IsSignificant(40.0, 44.5, 5.0));
}

TEST(ReadingHistory, NegativeChangeKeepsSign)
{
	ReadingHistory h;
	h.Accept("g", 100.0, MakeNaiveTime(2025, 3, 14, 9, 0), 5.0);
	ChangeAssessment a = h.Accept("g", 80.0, MakeNaiveTime(2025, 3, 14, 9, 4), 5.0);
	EXPECT_NEAR(a.change, -20.0, 1e-9);
	EXPECT_NEAR(a.rate, -5.0, 1e-9);
	EXPECT_TRUE(a.notable);
}

TEST(ReadingHistory, SameTimestampHasZeroRate)
{
	ReadingHistory h;
	NaiveTime t = MakeNaiveTime(2025, 3, 14, 9, 0);
	h.Accept("g", 10.0, t, 5.0);
	ChangeAssessment a = h.Accept("g", 30.0, t, 5.0);
	EXPECT_EQ(a.rate, 0.0);
	EXPECT_TRUE(a.notable);
}

TEST(ReadingHistory, AssessDoesNotAppend)
{
	ReadingHistory h;
	h.Accept("g", 40.0, MakeNaiveTime(2025, 3, 14, 9, 0), 5.0);
	h.Assess("g", 90.0, MakeNaiveTime(2025, 3, 14, 9, 5), 5.0);

	double last = 0.0;
	ASSERT_TRUE(h.Last("g", &last));
	EXPECT_EQ(last, 40.0);
	EXPECT_EQ(h.Size("g"), 1u);
}

TEST(ReadingHistory, GaugesAreIndependent)
{
	ReadingHistory h;
	h.Accept("a", 40.0, MakeNaiveTime(2025, 3, 14, 9, 0), 5.0);
	ChangeAssessment b = h.Accept("b", 200.0, MakeNaiveTime(2025, 3, 14, 9, 5), 5.0);
	EXPECT_FALSE(b.has_previous);
}

TEST(ReadingHistory, LoadReplacesHistory)
{
	ReadingHistory h;
	h.Accept("g", 1.0, MakeNaiveTime(2025, 1, 1, 0, 0), 5.0);

	std::vector<GaugeReading> stored;
	stored.push_back(Reading("a.jpg", 50.0, MakeNaiveTime(2025, 3, 14, 8, 0)));
	stored.push_back(Reading("b.jpg", 52.0, MakeNaiveTime(2025, 3, 14, 9, 0)));
	h.Load("g", stored);

	double last = 0.0;
	NaiveTime t = 0;
	ASSERT_TRUE(h.Last("g", &last, &t));
	EXPECT_EQ(h.Size("g"), 2u);
	EXPECT_EQ(last, 52.0);
	EXPECT_EQ(t, MakeNaiveTime(2025, 3, 14, 9, 0));
}

TEST(ReadingHistory, ConcurrentAcceptKeepsEveryEntry)
{
	ReadingHistory h;
	NaiveTime t0 = MakeNaiveTime(2025, 3, 14, 9, 0);

	std::vector<std::thread> pool;
	for(int w=0; w<4; w++) {
		pool.push_back(std::thread([&h, t0, w]() {
			for(int i=0; i<250; i++)
				h.Accept("g", w * 10.0 + i * 0.01, t0 + i, 5.0);
		}));
	}
	for(auto& t : pool)
		t.join();

	EXPECT_EQ(h.Size("g"), 1000u);
}
