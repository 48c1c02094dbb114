// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "include/reading.h"
#include "include/timestamp.h"

struct sqlite3;

enum StorageErrorKind
{
	SE_OPEN     = 0,	// Database could not be opened or its schema created.
	SE_QUERY    = 1,	// A statement or transaction failed.
	SE_CONFLICT = 2 	// Unexpected uniqueness violation.
};

class StorageError : public std::runtime_error
{
private:
	StorageErrorKind kind_;

public:
	StorageError(StorageErrorKind kind, const std::string& what)
		: std::runtime_error(what), kind_(kind) {}
	StorageErrorKind Kind() const { return kind_; }
};

/*
 *	SQLite-backed record of every image a run has looked at. An image name lives in at most one
 *	of the two tables; each save replaces the other table's row inside the same transaction.
 *
 *	Calls are serialized on an internal mutex so workers may share one store.
 */
class ResultStore
{
private:
	sqlite3* db;
	std::string path;
	mutable std::mutex mtx;

	void Exec(const char* sql) const;
	std::vector<GaugeReading> QueryReadings(const char* sql, const std::string* param) const;
	std::set<std::string> QueryNames(const char* sql) const;
	int Count(const char* sql) const;
	bool Exists(const char* sql, const std::string& name) const;

public:
	explicit ResultStore(const std::string& path, bool backup=false);
	~ResultStore();

	ResultStore(const ResultStore&) = delete;
	ResultStore& operator=(const ResultStore&) = delete;

	bool HasBeenProcessed(const std::string& image_name) const;
	bool HasReading(const std::string& image_name) const;
	bool HasFailure(const std::string& image_name) const;

	void SaveSuccess(const GaugeReading& reading);
	void SaveFailure(const std::string& image_name, NaiveTime timestamp);

	std::vector<GaugeReading> LoadReadings() const;
	std::vector<GaugeReading> LoadReadingsSince(NaiveTime cutoff) const;
	std::set<std::string> LoadFailureNames() const;
	std::vector<DetectionFailure> LoadFailures() const;
	std::set<std::string> LoadProcessedNames() const;

	int CountReadings() const;
	int CountFailures() const;
	const std::string& Path() const { return path; }
};
