// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

/*
 *  Batch driver. One image is one transaction: detect, classify, store, then on to the next.
 *  Images are independent, so with workers > 1 the same loop runs on a small thread pool; the
 *  only shared state is the store and the reading history, and both lock internally.
 */

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <system_error>
#include <thread>

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include "include/pipeline.h"

MeasurementPipeline::MeasurementPipeline(const GaugeConfig& cfg, ResultStore& store)
	: cfg(cfg), detector(std::make_shared<Gaugeeye>(cfg)), store(store), cancel(NULL),
	pending(std::make_shared<std::atomic<int> >(0))
{
	this->RebuildHistory();
}

/*
 *  Seeds the history with the stored readings, oldest first, so the first image of a run is
 *  compared against the last reading of the previous one. Readings for images in 'exclude' are
 *  left out; those images are about to be read again and must not be their own predecessor.
 */
void MeasurementPipeline::RebuildHistory(const std::set<std::string>& exclude)
{
	std::vector<GaugeReading> readings;
	for(const auto& r : this->store.LoadReadings()) {
		if(exclude.count(r.image_name) == 0)
			readings.push_back(r);
	}

	this->history.Load(this->cfg.runtime.gauge_id, readings);
	spdlog::debug("History for gauge '{}' rebuilt with {} readings", this->cfg.runtime.gauge_id,
			readings.size());
}

bool MeasurementPipeline::WaitForPending(int timeout_ms) const
{
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
	while(this->pending->load() > 0) {
		if(std::chrono::steady_clock::now() >= deadline)
			return false;
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return true;
}

bool MeasurementPipeline::Cancelled() const
{
	return this->cancel != NULL && this->cancel->load();
}

void MeasurementPipeline::Notify(const ImageOutcome& outcome)
{
	if(!this->observer)
		return;
	std::lock_guard<std::mutex> lock(this->observer_mtx);
	try {
		this->observer(outcome);
	} catch(const std::exception& e) {
		spdlog::warn("Observer failed for {}: {}", outcome.detection.image_name, e.what());
	}
}

GaugeDetection MeasurementPipeline::FailedDetection(const std::string& path, GaugeStatus status,
		const std::string& error) const
{
	GaugeDetection d = this->detector->FromFrame(cv::Mat(), path);
	d.status = status;
	d.error = error;
	return d;
}

/*
 *  Runs the detector, bounded by image_timeout_ms when set. On timeout the worker thread is left
 *  to finish on its own and its result is dropped; it holds its own reference to the detector.
 *  At most workers + MAX_STALLED_DETECTIONS such threads run at once.
 */
GaugeDetection MeasurementPipeline::Detect(const std::string& path) const
{
	const int timeout_ms = this->cfg.runtime.image_timeout_ms;
	if(timeout_ms <= 0)
		return this->detector->GetReading(path);

	const int limit = std::max(1, this->cfg.runtime.workers) + MAX_STALLED_DETECTIONS;
	if(this->pending->load() >= limit) {
		spdlog::warn("{} detections still running, not starting another for {}",
				this->pending->load(), path);
		return this->FailedDetection(path, GS_TIMEOUT, "too many stalled detections");
	}

	std::shared_ptr<std::promise<GaugeDetection> > task =
		std::make_shared<std::promise<GaugeDetection> >();
	std::future<GaugeDetection> result = task->get_future();
	std::shared_ptr<const Gaugeeye> det = this->detector;
	std::shared_ptr<std::atomic<int> > count = this->pending;

	(*count)++;
	try {
		std::thread([task, det, path, count]() {
			try {
				task->set_value(det->GetReading(path));
			} catch(...) {
				task->set_exception(std::current_exception());
			}
			(*count)--;
		}).detach();
	} catch(const std::system_error& e) {
		(*count)--;
		return this->FailedDetection(path, GS_PROCESSING_ERROR, e.what());
	}

	if(result.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
		spdlog::warn("Detection timed out after {} ms for {}", timeout_ms, path);
		return this->FailedDetection(path, GS_TIMEOUT, "detection timed out");
	}

	try {
		return result.get();
	} catch(const std::exception& e) {
		return this->FailedDetection(path, GS_PROCESSING_ERROR, e.what());
	}
}

/*
 *  Single image transaction. Detection problems of any kind end in PS_FAILED and a failure row.
 *  A StorageError is logged and reported on the outcome under SP_SKIP, rethrown under SP_ABORT.
 */
ImageOutcome MeasurementPipeline::ProcessImage(const std::string& path)
{
	ImageOutcome out;
	out.state = PS_PENDING;
	out.stored = false;
	out.change.has_previous = false;
	out.change.change = out.change.rate = 0.0;
	out.change.notable = false;

	try {
		out.detection = this->Detect(path);
	} catch(const std::exception& e) {
		spdlog::error("Detection failed for {}: {}", path, e.what());
		out.detection = this->FailedDetection(path, GS_PROCESSING_ERROR, e.what());
	}
	const GaugeDetection& d = out.detection;
	const std::string& gauge = this->cfg.runtime.gauge_id;
	const double threshold = this->cfg.detection.change_threshold;

	try {
		if(d.status == GS_SUCCESS) {
			out.state = PS_SUCCEEDED;
			this->store.SaveSuccess(d.ToReading());
			out.stored = true;
			out.change = this->history.Accept(gauge, d.angle, d.timestamp, threshold);
		} else {
			out.state = PS_FAILED;
			this->store.SaveFailure(d.image_name, NaiveNow());
			out.stored = true;
		}
	} catch(const StorageError& e) {
		spdlog::error("Could not store result for {}: {}", d.image_name, e.what());
		if(this->cfg.runtime.storage_policy == SP_ABORT)
			throw;
		out.storage_error = e.what();
		if(out.state == PS_SUCCEEDED)
			out.change = this->history.Assess(gauge, d.angle, d.timestamp, threshold);
	}

	if(out.state == PS_SUCCEEDED) {
		if(out.change.has_previous) {
			spdlog::info("  Angle: {:.1f} deg, Change: {}{:.2f} deg, Rate: {:.2f} deg/min", d.angle,
					out.change.notable ? "* " : "  ", out.change.change, out.change.rate);
		} else {
			spdlog::info("  Angle: {:.1f} deg", d.angle);
		}
	} else {
		spdlog::warn("  Failed to detect gauge in {} ({})", d.image_name, d.error);
	}

	this->Notify(out);
	return out;
}

/*
 *  Images this run should look at, in listing order. Names are compared by basename, the same
 *  key the store uses.
 */
std::vector<std::string> MeasurementPipeline::SelectImages(const std::vector<std::string>& files,
		const BatchOptions& opts) const
{
	if(opts.force_reprocess)
		return files;

	std::set<std::string> done = this->store.LoadProcessedNames();
	std::set<std::string> failed;
	if(opts.retry_failures)
		failed = this->store.LoadFailureNames();

	std::vector<std::string> todo;
	for(const auto& f : files) {
		std::string name = BaseName(f);
		if(done.count(name) == 0 || failed.count(name) != 0)
			todo.push_back(f);
	}
	return todo;
}

BatchSummary MeasurementPipeline::RunBatch(const std::vector<std::string>& files,
		const BatchOptions& opts)
{
	BatchSummary sum;
	sum.total_images = (int)files.size();
	sum.processed = sum.succeeded = sum.failed = sum.notable = sum.storage_errors = 0;
	sum.cancelled = false;

	std::vector<std::string> todo = this->SelectImages(files, opts);
	sum.to_process = (int)todo.size();
	sum.skipped = sum.total_images - sum.to_process;

	std::set<std::string> rerun;
	for(const auto& f : todo)
		rerun.insert(BaseName(f));
	this->RebuildHistory(rerun);

	if(opts.force_reprocess)
		spdlog::info("Forcing processing of all {} images", files.size());
	else
		spdlog::info("Found {} total images, {} need processing, {} skipped", sum.total_images,
				sum.to_process, sum.skipped);

	std::mutex sum_mtx;
	std::atomic<size_t> next(0);
	std::atomic<bool> stop(false);
	std::exception_ptr fatal;

	auto work = [&]() {
		for(;;) {
			if(stop.load() || this->Cancelled())
				return;
			size_t i = next++;
			if(i >= todo.size())
				return;

			spdlog::info("Processing {}/{}: {}", i + 1, todo.size(), BaseName(todo[i]));

			ImageOutcome o;
			try {
				o = this->ProcessImage(todo[i]);
			} catch(const StorageError&) {
				std::lock_guard<std::mutex> lock(sum_mtx);
				if(!fatal)
					fatal = std::current_exception();
				stop = true;
				return;
			} catch(const std::exception& e) {
				spdlog::error("Skipping {}: {}", BaseName(todo[i]), e.what());
				std::lock_guard<std::mutex> lock(sum_mtx);
				sum.processed++;
				sum.failed++;
				continue;
			}

			std::lock_guard<std::mutex> lock(sum_mtx);
			sum.processed++;
			if(o.state == PS_SUCCEEDED)
				sum.succeeded++;
			else
				sum.failed++;
			if(o.change.notable)
				sum.notable++;
			if(!o.stored)
				sum.storage_errors++;
			if(o.state == PS_SUCCEEDED && o.stored)
				sum.new_readings.push_back(o.detection.ToReading());
		}
	};

	int workers = std::max(1, std::min(this->cfg.runtime.workers, (int)todo.size()));
	if(workers <= 1) {
		work();
	} else {
		std::vector<std::thread> pool;
		for(int w=0; w<workers; w++)
			pool.push_back(std::thread(work));
		for(auto& t : pool)
			t.join();
	}

	if(fatal)
		std::rethrow_exception(fatal);

	sum.cancelled = this->Cancelled() && sum.processed < sum.to_process;
	if(sum.cancelled)
		spdlog::warn("Run cancelled after {} of {} images", sum.processed, sum.to_process);

	if(this->pending->load() > 0)
		spdlog::warn("{} timed-out detections are still running", this->pending->load());

	sum.total_in_store = this->store.CountReadings();
	return sum;
}

/*
 *  Sorted paths in 'dir' matching the glob 'pattern'. A missing directory is an empty listing.
 */
std::vector<std::string> MeasurementPipeline::ListImages(const std::string& dir,
		const std::string& pattern)
{
	std::vector<cv::String> found;
	try {
		cv::glob(dir + "/" + pattern, found, false);
	} catch(const cv::Exception& e) {
		spdlog::warn("Could not list {}: {}", dir, e.what());
	}

	std::vector<std::string> files(found.begin(), found.end());
	std::sort(files.begin(), files.end());
	return files;
}
