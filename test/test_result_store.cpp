// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "include/result_store.h"

namespace {

GaugeReading Reading(const std::string& name, double angle, NaiveTime t)
{
	GaugeReading r;
	r.image_name = name;
	r.angle = angle;
	r.center_x = 320;
	r.center_y = 240;
	r.radius = 150;
	r.timestamp = t;
	r.pressure_primary = angle / 10.0;
	r.pressure_secondary = angle / 100.0;
	return r;
}

bool Exists(const std::string& path)
{
	std::ifstream f(path.c_str());
	return f.good();
}

class ResultStoreTest : public ::testing::Test
{
protected:
	std::string path;

	void SetUp() override
	{
		const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
		path = std::string("gaugeeye_store_") + info->name() + ".db";
		std::remove(path.c_str());
		std::remove((path + ".bak").c_str());
	}

	void TearDown() override
	{
		std::remove(path.c_str());
		std::remove((path + ".bak").c_str());
	}
};

} // namespace

TEST_F(ResultStoreTest, EmptyStore)
{
	ResultStore store(path);
	EXPECT_EQ(store.CountReadings(), 0);
	EXPECT_EQ(store.CountFailures(), 0);
	EXPECT_TRUE(store.LoadReadings().empty());
	EXPECT_FALSE(store.HasBeenProcessed("a.jpg"));
}

TEST_F(ResultStoreTest, SaveAndLoadReading)
{
	ResultStore store(path);
	store.SaveSuccess(Reading("a.jpg", 148.25, MakeNaiveTime(2025, 3, 14, 9, 30)));

	std::vector<GaugeReading> all = store.LoadReadings();
	ASSERT_EQ(all.size(), 1u);
	EXPECT_EQ(all[0].image_name, "a.jpg");
	EXPECT_DOUBLE_EQ(all[0].angle, 148.25);
	EXPECT_EQ(all[0].center_x, 320);
	EXPECT_EQ(all[0].center_y, 240);
	EXPECT_EQ(all[0].radius, 150);
	EXPECT_EQ(all[0].timestamp, MakeNaiveTime(2025, 3, 14, 9, 30));
	EXPECT_DOUBLE_EQ(all[0].pressure_primary, 14.825);
	EXPECT_DOUBLE_EQ(all[0].pressure_secondary, 1.4825);

	EXPECT_TRUE(store.HasReading("a.jpg"));
	EXPECT_FALSE(store.HasFailure("a.jpg"));
	EXPECT_TRUE(store.HasBeenProcessed("a.jpg"));
}

TEST_F(ResultStoreTest, SavingTwiceKeepsOneRow)
{
	ResultStore store(path);
	NaiveTime t = MakeNaiveTime(2025, 3, 14, 9, 30);
	store.SaveSuccess(Reading("a.jpg", 100.0, t));
	store.SaveSuccess(Reading("a.jpg", 120.0, t));

	EXPECT_EQ(store.CountReadings(), 1);
	EXPECT_DOUBLE_EQ(store.LoadReadings()[0].angle, 120.0);

	store.SaveFailure("b.jpg", t);
	store.SaveFailure("b.jpg", t);
	EXPECT_EQ(store.CountFailures(), 1);
}

TEST_F(ResultStoreTest, SuccessReplacesFailure)
{
	ResultStore store(path);
	NaiveTime t = MakeNaiveTime(2025, 3, 14, 9, 30);

	store.SaveFailure("a.jpg", t);
	EXPECT_TRUE(store.HasFailure("a.jpg"));
	EXPECT_TRUE(store.HasBeenProcessed("a.jpg"));

	store.SaveSuccess(Reading("a.jpg", 90.0, t));
	EXPECT_TRUE(store.HasReading("a.jpg"));
	EXPECT_FALSE(store.HasFailure("a.jpg"));
	EXPECT_EQ(store.CountFailures(), 0);
	EXPECT_EQ(store.CountReadings(), 1);
}

TEST_F(ResultStoreTest, FailureReplacesSuccess)
{
	ResultStore store(path);
	NaiveTime t = MakeNaiveTime(2025, 3, 14, 9, 30);

	store.SaveSuccess(Reading("a.jpg", 90.0, t));
	store.SaveFailure("a.jpg", t);
	EXPECT_FALSE(store.HasReading("a.jpg"));
	EXPECT_TRUE(store.HasFailure("a.jpg"));
	EXPECT_EQ(store.CountReadings(), 0);
}

TEST_F(ResultStoreTest, ReadingsComeBackOldestFirst)
{
	ResultStore store(path);
	store.SaveSuccess(Reading("c.jpg", 3.0, MakeNaiveTime(2025, 3, 14, 11, 0)));
	store.SaveSuccess(Reading("a.jpg", 1.0, MakeNaiveTime(2025, 3, 14, 9, 0)));
	store.SaveSuccess(Reading("b1.jpg", 2.0, MakeNaiveTime(2025, 3, 14, 10, 0)));
	store.SaveSuccess(Reading("b2.jpg", 2.5, MakeNaiveTime(2025, 3, 14, 10, 0)));

	std::vector<GaugeReading> all = store.LoadReadings();
	ASSERT_EQ(all.size(), 4u);
	EXPECT_EQ(all[0].image_name, "a.jpg");
	EXPECT_EQ(all[1].image_name, "b1.jpg");
	EXPECT_EQ(all[2].image_name, "b2.jpg");
	EXPECT_EQ(all[3].image_name, "c.jpg");
}

TEST_F(ResultStoreTest, LoadSinceCutoff)
{
	ResultStore store(path);
	store.SaveSuccess(Reading("old.jpg", 1.0, MakeNaiveTime(2025, 3, 1, 9, 0)));
	store.SaveSuccess(Reading("edge.jpg", 2.0, MakeNaiveTime(2025, 3, 7, 9, 0)));
	store.SaveSuccess(Reading("new.jpg", 3.0, MakeNaiveTime(2025, 3, 14, 9, 0)));

	std::vector<GaugeReading> recent = store.LoadReadingsSince(MakeNaiveTime(2025, 3, 7, 9, 0));
	ASSERT_EQ(recent.size(), 2u);
	EXPECT_EQ(recent[0].image_name, "edge.jpg");
	EXPECT_EQ(recent[1].image_name, "new.jpg");
}

TEST_F(ResultStoreTest, NameSets)
{
	ResultStore store(path);
	NaiveTime t = MakeNaiveTime(2025, 3, 14, 9, 30);
	store.SaveSuccess(Reading("ok.jpg", 10.0, t));
	store.SaveFailure("bad.jpg", t);

	std::set<std::string> failed = store.LoadFailureNames();
	std::set<std::string> done = store.LoadProcessedNames();
	EXPECT_EQ(failed.size(), 1u);
	EXPECT_EQ(failed.count("bad.jpg"), 1u);
	EXPECT_EQ(done.size(), 2u);
	EXPECT_EQ(done.count("ok.jpg"), 1u);
}

TEST_F(ResultStoreTest, DataSurvivesReopen)
{
	{
		ResultStore store(path);
		store.SaveSuccess(Reading("a.jpg", 10.0, MakeNaiveTime(2025, 3, 14, 9, 30)));
	}
	ResultStore again(path);
	EXPECT_EQ(again.CountReadings(), 1);
	EXPECT_TRUE(again.HasBeenProcessed("a.jpg"));
}

TEST_F(ResultStoreTest, BackupOnOpen)
{
	{
		ResultStore fresh(path, true);
		EXPECT_FALSE(Exists(path + ".bak"));
		fresh.SaveSuccess(Reading("a.jpg", 10.0, MakeNaiveTime(2025, 3, 14, 9, 30)));
	}
	ResultStore store(path, true);
	EXPECT_TRUE(Exists(path + ".bak"));

	ResultStore backup(path + ".bak");
	EXPECT_EQ(backup.CountReadings(), 1);
}

TEST_F(ResultStoreTest, SkipsRowsWithBadTimestamps)
{
	{
		ResultStore store(path);
		store.SaveSuccess(Reading("good.jpg", 10.0, MakeNaiveTime(2025, 3, 14, 9, 30)));
	}

	sqlite3* db = NULL;
	ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
	ASSERT_EQ(sqlite3_exec(db,
		"INSERT INTO gauge_results (image_name, angle, center_x, center_y, radius, timestamp, "
		"pressure_psi, pressure_bar) VALUES ('bad.jpg', 1, 0, 0, 0, 'yesterday', 0, 0)",
		NULL, NULL, NULL), SQLITE_OK);
	sqlite3_close(db);

	ResultStore store(path);
	std::vector<GaugeReading> all = store.LoadReadings();
	ASSERT_EQ(all.size(), 1u);
	EXPECT_EQ(all[0].image_name, "good.jpg");
	EXPECT_EQ(store.CountReadings(), 2);
}

TEST_F(ResultStoreTest, FailedSaveRollsBack)
{
	{
		ResultStore store(path);
		store.SaveFailure("a.jpg", MakeNaiveTime(2025, 3, 14, 9, 0));
	}

	sqlite3* db = NULL;
	ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
	ASSERT_EQ(sqlite3_exec(db,
		"CREATE TRIGGER block_results BEFORE INSERT ON gauge_results "
		"BEGIN SELECT RAISE(ABORT, 'blocked'); END",
		NULL, NULL, NULL), SQLITE_OK);
	sqlite3_close(db);

	ResultStore store(path);
	try {
		store.SaveSuccess(Reading("a.jpg", 10.0, MakeNaiveTime(2025, 3, 14, 9, 30)));
		FAIL() << "expected StorageError";
	} catch(const StorageError& e) {
		EXPECT_EQ(e.Kind(), SE_CONFLICT);
	}

	// The failure row deleted inside the transaction is back.
	EXPECT_TRUE(store.HasFailure("a.jpg"));
	EXPECT_FALSE(store.HasReading("a.jpg"));

	EXPECT_THROW(store.SaveSuccess(Reading("b.jpg", 20.0, MakeNaiveTime(2025, 3, 14, 9, 40))),
			StorageError);
	EXPECT_FALSE(store.HasBeenProcessed("b.jpg"));
	EXPECT_EQ(store.CountReadings(), 0);
	EXPECT_EQ(store.CountFailures(), 1);

	// Failures still save.
	store.SaveFailure("c.jpg", MakeNaiveTime(2025, 3, 14, 9, 50));
	EXPECT_TRUE(store.HasFailure("c.jpg"));
}

TEST_F(ResultStoreTest, LoadFailuresOldestFirst)
{
	ResultStore store(path);
	store.SaveFailure("late.jpg", MakeNaiveTime(2025, 3, 15, 8, 0));
	store.SaveFailure("early.jpg", MakeNaiveTime(2025, 3, 14, 8, 0));
	store.SaveSuccess(Reading("good.jpg", 10.0, MakeNaiveTime(2025, 3, 14, 9, 0)));

	std::vector<DetectionFailure> failures = store.LoadFailures();
	ASSERT_EQ(failures.size(), 2u);
	EXPECT_EQ(failures[0].image_name, "early.jpg");
	EXPECT_EQ(failures[0].timestamp, MakeNaiveTime(2025, 3, 14, 8, 0));
	EXPECT_EQ(failures[1].image_name, "late.jpg");

	store.SaveSuccess(Reading("early.jpg", 12.0, MakeNaiveTime(2025, 3, 14, 8, 0)));
	failures = store.LoadFailures();
	ASSERT_EQ(failures.size(), 1u);
	EXPECT_EQ(failures[0].image_name, "late.jpg");
}

TEST(ResultStore, UnopenablePathThrows)
{
	try {
		ResultStore store("no/such/directory/results.db");
		FAIL() << "expected StorageError";
	} catch(const StorageError& e) {
		EXPECT_EQ(e.Kind(), SE_OPEN);
	}
}
