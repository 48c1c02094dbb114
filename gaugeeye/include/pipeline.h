// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.


#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "include/config.h"
#include "include/gaugeeye.h"
#include "include/history.h"
#include "include/result_store.h"

/*
 *	Per-image state. Every image starts Pending and ends in exactly one terminal state; a
 *	Failed image is not retried by the pipeline itself.
 */
enum PipelineState
{
	PS_PENDING   = 0,
	PS_SUCCEEDED = 1,
	PS_FAILED    = 2
};

struct ImageOutcome {
	PipelineState state;
	GaugeDetection detection;
	ChangeAssessment change;	// Only filled in for PS_SUCCEEDED.
	bool stored;				// Result committed to the store.
	std::string storage_error;	// Set when the write was skipped under SP_SKIP.
};

/*
 *	'force_reprocess' runs every listed image regardless of the store. 'retry_failures' also
 *	runs images recorded as failures; new images are always run.
 */
struct BatchOptions {
	bool force_reprocess;
	bool retry_failures;
};

struct BatchSummary {
	int total_images;
	int to_process;
	int skipped;
	int processed;
	int succeeded;
	int failed;
	int notable;
	int storage_errors;
	int total_in_store;
	bool cancelled;
	std::vector<GaugeReading> new_readings;	// Readings stored by this run, in completion order.
};

/*
 *	Timed-out detection threads allowed to keep running beyond the worker count. Past that, an
 *	image that needs a timed detection fails with GS_TIMEOUT without starting another thread.
 */
const int MAX_STALLED_DETECTIONS = 4;

/*
 *	Runs images through the detector and records each outcome. Owns the reading history, which
 *	is rebuilt from the store on construction and at the start of every batch.
 */

class MeasurementPipeline
{
private:
	GaugeConfig cfg;
	std::shared_ptr<const Gaugeeye> detector;	// Shared with timed-out detection threads.
	ResultStore& store;
	ReadingHistory history;

	const std::atomic<bool>* cancel;
	std::function<void(const ImageOutcome&)> observer;
	std::mutex observer_mtx;

	// Detection threads started under a timeout that have not returned yet. Shared with the
	// threads themselves, which may outlive the pipeline.
	std::shared_ptr<std::atomic<int> > pending;

	GaugeDetection Detect(const std::string& path) const;
	GaugeDetection FailedDetection(const std::string& path, GaugeStatus status,
			const std::string& error) const;
	bool Cancelled() const;
	void Notify(const ImageOutcome& outcome);

public:
	MeasurementPipeline(const GaugeConfig& cfg, ResultStore& store);

	void RebuildHistory(const std::set<std::string>& exclude=std::set<std::string>());
	ImageOutcome ProcessImage(const std::string& path);
	std::vector<std::string> SelectImages(const std::vector<std::string>& files,
			const BatchOptions& opts) const;
	BatchSummary RunBatch(const std::vector<std::string>& files, const BatchOptions& opts);

	void SetCancelFlag(const std::atomic<bool>* flag) { cancel = flag; }
	void SetObserver(std::function<void(const ImageOutcome&)> fn) { observer = fn; }
	const ReadingHistory& History() const { return history; }

	int PendingDetections() const { return pending->load(); }
	bool WaitForPending(int timeout_ms) const;

	static std::vector<std::string> ListImages(const std::string& dir, const std::string& pattern);
};
