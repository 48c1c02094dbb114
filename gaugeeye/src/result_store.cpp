// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

/*
 *  Result persistence. The schema is shared with databases written by the earlier Python tooling,
 *  so the column names (pressure_psi, pressure_bar) and the text timestamp format stay as they
 *  were: pressure_psi holds the primary unit and pressure_bar the secondary.
 */

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <fstream>

#include "include/result_store.h"

namespace {

const char* SCHEMA =
	"CREATE TABLE IF NOT EXISTS gauge_results ("
	"  id INTEGER PRIMARY KEY AUTOINCREMENT,"
	"  image_name TEXT UNIQUE,"
	"  angle REAL,"
	"  center_x INTEGER,"
	"  center_y INTEGER,"
	"  radius INTEGER,"
	"  timestamp TEXT,"
	"  pressure_psi REAL,"
	"  pressure_bar REAL"
	");"
	"CREATE TABLE IF NOT EXISTS detection_failures ("
	"  id INTEGER PRIMARY KEY AUTOINCREMENT,"
	"  image_name TEXT UNIQUE,"
	"  timestamp TEXT"
	");";

const char* READING_COLUMNS =
	"SELECT image_name, angle, center_x, center_y, radius, timestamp, pressure_psi, pressure_bar "
	"FROM gauge_results ";

/*
 *  Owns one prepared statement. Errors carry the database's message.
 */
class Statement
{
private:
	sqlite3* db;
	sqlite3_stmt* stmt;

public:
	Statement(sqlite3* db, const char* sql) : db(db), stmt(NULL)
	{
		if(sqlite3_prepare_v2(db, sql, -1, &this->stmt, NULL) != SQLITE_OK)
			throw StorageError(SE_QUERY, std::string("prepare failed: ") + sqlite3_errmsg(db));
	}

	~Statement() { sqlite3_finalize(this->stmt); }

	Statement(const Statement&) = delete;
	Statement& operator=(const Statement&) = delete;

	void Bind(int idx, const std::string& v)
	{
		if(sqlite3_bind_text(this->stmt, idx, v.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
			throw StorageError(SE_QUERY, std::string("bind failed: ") + sqlite3_errmsg(this->db));
	}

	void Bind(int idx, double v)
	{
		if(sqlite3_bind_double(this->stmt, idx, v) != SQLITE_OK)
			throw StorageError(SE_QUERY, std::string("bind failed: ") + sqlite3_errmsg(this->db));
	}

	void Bind(int idx, int v)
	{
		if(sqlite3_bind_int(this->stmt, idx, v) != SQLITE_OK)
			throw StorageError(SE_QUERY, std::string("bind failed: ") + sqlite3_errmsg(this->db));
	}

	// True while rows remain.
	bool Step()
	{
		int rc = sqlite3_step(this->stmt);
		if(rc == SQLITE_ROW)
			return true;
		if(rc == SQLITE_DONE)
			return false;
		if((rc & 0xff) == SQLITE_CONSTRAINT)
			throw StorageError(SE_CONFLICT, std::string("constraint violated: ") + sqlite3_errmsg(this->db));
		throw StorageError(SE_QUERY, std::string("step failed: ") + sqlite3_errmsg(this->db));
	}

	std::string Text(int col)
	{
		const unsigned char* t = sqlite3_column_text(this->stmt, col);
		return t == NULL ? std::string() : std::string(reinterpret_cast<const char*>(t));
	}

	double Double(int col) { return sqlite3_column_double(this->stmt, col); }
	int Int(int col) { return sqlite3_column_int(this->stmt, col); }
};

/*
 *  BEGIN on construction, ROLLBACK on destruction unless Commit() ran first. A result write that
 *  throws halfway leaves neither table touched.
 */
class Transaction
{
private:
	sqlite3* db;
	bool done;

public:
	explicit Transaction(sqlite3* db) : db(db), done(false)
	{
		char* err = NULL;
		if(sqlite3_exec(db, "BEGIN IMMEDIATE", NULL, NULL, &err) != SQLITE_OK) {
			std::string msg = err ? err : "unknown error";
			sqlite3_free(err);
			throw StorageError(SE_QUERY, "begin failed: " + msg);
		}
	}

	~Transaction()
	{
		if(!this->done)
			sqlite3_exec(this->db, "ROLLBACK", NULL, NULL, NULL);
	}

	Transaction(const Transaction&) = delete;
	Transaction& operator=(const Transaction&) = delete;

	void Commit()
	{
		char* err = NULL;
		if(sqlite3_exec(this->db, "COMMIT", NULL, NULL, &err) != SQLITE_OK) {
			std::string msg = err ? err : "unknown error";
			sqlite3_free(err);
			throw StorageError(SE_QUERY, "commit failed: " + msg);
		}
		this->done = true;
	}
};

bool CopyFile(const std::string& from, const std::string& to)
{
	std::ifstream in(from.c_str(), std::ios::binary);
	if(!in.good())
		return false;
	std::ofstream out(to.c_str(), std::ios::binary | std::ios::trunc);
	if(!out.good())
		return false;
	out << in.rdbuf();
	return out.good();
}

} // namespace

/*
 *  Opens or creates the database and its tables. With 'backup' set, an existing file is first
 *  copied to <path>.bak; a failed copy is only a warning.
 */
ResultStore::ResultStore(const std::string& path, bool backup) : db(NULL), path(path)
{
	if(backup) {
		std::ifstream existing(path.c_str());
		if(existing.good()) {
			existing.close();
			if(!CopyFile(path, path + ".bak"))
				spdlog::warn("Could not create backup of {}", path);
		}
	}

	int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
	if(sqlite3_open_v2(path.c_str(), &this->db, flags, NULL) != SQLITE_OK) {
		std::string msg = this->db ? sqlite3_errmsg(this->db) : "out of memory";
		sqlite3_close(this->db);
		this->db = NULL;
		throw StorageError(SE_OPEN, "could not open " + path + ": " + msg);
	}

	try {
		this->Exec(SCHEMA);
	} catch(const StorageError& e) {
		sqlite3_close(this->db);
		this->db = NULL;
		throw StorageError(SE_OPEN, "could not create schema in " + path + ": " + e.what());
	}
}

ResultStore::~ResultStore()
{
	sqlite3_close(this->db);
}

void ResultStore::Exec(const char* sql) const
{
	char* err = NULL;
	if(sqlite3_exec(this->db, sql, NULL, NULL, &err) != SQLITE_OK) {
		std::string msg = err ? err : "unknown error";
		sqlite3_free(err);
		throw StorageError(SE_QUERY, msg);
	}
}

bool ResultStore::Exists(const char* sql, const std::string& name) const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	Statement st(this->db, sql);
	st.Bind(1, name);
	return st.Step();
}

bool ResultStore::HasReading(const std::string& image_name) const
{
	return this->Exists("SELECT 1 FROM gauge_results WHERE image_name = ?", image_name);
}

bool ResultStore::HasFailure(const std::string& image_name) const
{
	return this->Exists("SELECT 1 FROM detection_failures WHERE image_name = ?", image_name);
}

bool ResultStore::HasBeenProcessed(const std::string& image_name) const
{
	return this->Exists(
		"SELECT 1 FROM gauge_results WHERE image_name = ?1 "
		"UNION ALL SELECT 1 FROM detection_failures WHERE image_name = ?1", image_name);
}

/*
 *  Insert-or-replace by image name. A failure recorded for the same image on an earlier run is
 *  removed in the same transaction.
 */
void ResultStore::SaveSuccess(const GaugeReading& r)
{
	std::lock_guard<std::mutex> lock(this->mtx);

	Transaction tx(this->db);
	{
		Statement del(this->db, "DELETE FROM detection_failures WHERE image_name = ?");
		del.Bind(1, r.image_name);
		del.Step();
	}
	{
		Statement ins(this->db,
			"INSERT OR REPLACE INTO gauge_results "
			"(image_name, angle, center_x, center_y, radius, timestamp, pressure_psi, pressure_bar) "
			"VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
		ins.Bind(1, r.image_name);
		ins.Bind(2, r.angle);
		ins.Bind(3, r.center_x);
		ins.Bind(4, r.center_y);
		ins.Bind(5, r.radius);
		ins.Bind(6, FormatTimestamp(r.timestamp));
		ins.Bind(7, r.pressure_primary);
		ins.Bind(8, r.pressure_secondary);
		ins.Step();
	}
	tx.Commit();
}

/*
 *  Insert-or-replace by image name. A forced rerun that now fails drops the earlier reading.
 */
void ResultStore::SaveFailure(const std::string& image_name, NaiveTime timestamp)
{
	std::lock_guard<std::mutex> lock(this->mtx);

	Transaction tx(this->db);
	{
		Statement del(this->db, "DELETE FROM gauge_results WHERE image_name = ?");
		del.Bind(1, image_name);
		del.Step();
	}
	{
		Statement ins(this->db,
			"INSERT OR REPLACE INTO detection_failures (image_name, timestamp) VALUES (?, ?)");
		ins.Bind(1, image_name);
		ins.Bind(2, FormatTimestamp(timestamp));
		ins.Step();
	}
	tx.Commit();
}

std::vector<GaugeReading> ResultStore::QueryReadings(const char* sql, const std::string* param) const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	std::vector<GaugeReading> out;
	int skipped = 0;

	Statement st(this->db, sql);
	if(param != NULL)
		st.Bind(1, *param);

	while(st.Step()) {
		GaugeReading r;
		r.image_name = st.Text(0);
		if(!ParseTimestamp(st.Text(5), &r.timestamp)) {
			spdlog::warn("Skipping {}: unreadable timestamp '{}'", r.image_name, st.Text(5));
			skipped++;
			continue;
		}
		r.angle = st.Double(1);
		r.center_x = st.Int(2);
		r.center_y = st.Int(3);
		r.radius = st.Int(4);
		r.pressure_primary = st.Double(6);
		r.pressure_secondary = st.Double(7);
		out.push_back(r);
	}

	if(skipped > 0)
		spdlog::warn("Loaded {} readings ({} skipped due to data issues)", out.size(), skipped);
	return out;
}

/*
 *  All readings, oldest first. Equal timestamps keep insertion order.
 */
std::vector<GaugeReading> ResultStore::LoadReadings() const
{
	std::string sql = std::string(READING_COLUMNS) + "ORDER BY timestamp, id";
	return this->QueryReadings(sql.c_str(), NULL);
}

std::vector<GaugeReading> ResultStore::LoadReadingsSince(NaiveTime cutoff) const
{
	std::string sql = std::string(READING_COLUMNS) + "WHERE timestamp >= ? ORDER BY timestamp, id";
	std::string ts = FormatTimestamp(cutoff);
	return this->QueryReadings(sql.c_str(), &ts);
}

std::set<std::string> ResultStore::QueryNames(const char* sql) const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	std::set<std::string> names;
	Statement st(this->db, sql);
	while(st.Step())
		names.insert(st.Text(0));
	return names;
}

std::set<std::string> ResultStore::LoadFailureNames() const
{
	return this->QueryNames("SELECT image_name FROM detection_failures");
}

// Oldest first. Rows whose timestamp does not parse keep the name with a zero time.
std::vector<DetectionFailure> ResultStore::LoadFailures() const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	std::vector<DetectionFailure> out;
	Statement st(this->db, "SELECT image_name, timestamp FROM detection_failures ORDER BY timestamp, id");
	while(st.Step()) {
		DetectionFailure f;
		f.image_name = st.Text(0);
		if(!ParseTimestamp(st.Text(1), &f.timestamp))
			f.timestamp = 0;
		out.push_back(f);
	}
	return out;
}

std::set<std::string> ResultStore::LoadProcessedNames() const
{
	return this->QueryNames(
		"SELECT image_name FROM gauge_results UNION SELECT image_name FROM detection_failures");
}

int ResultStore::Count(const char* sql) const
{
	std::lock_guard<std::mutex> lock(this->mtx);

	Statement st(this->db, sql);
	return st.Step() ? st.Int(0) : 0;
}

int ResultStore::CountReadings() const
{
	return this->Count("SELECT COUNT(*) FROM gauge_results");
}

int ResultStore::CountFailures() const
{
	return this->Count("SELECT COUNT(*) FROM detection_failures");
}
