// Copyright 2022, Jefferson Science Associates, LLC.
// Subject to the terms in the LICENSE file found in the top-level directory.

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "include/aggregator.h"
#include "include/config.h"
#include "include/gaugeeye.h"
#include "include/pipeline.h"
#include "include/result_store.h"

namespace {

enum ExitCode
{
	EXIT_OK        = 0,
	EXIT_USAGE     = 1,
	EXIT_CONFIG    = 2,
	EXIT_STORAGE   = 3
};

// How long main waits for timed-out detections before exiting anyway.
const int PENDING_WAIT_MS = 5000;

std::atomic<bool> g_cancel(false);

void OnSignal(int)
{
	g_cancel = true;
}

/*
 *  Command line state. 'given' holds every value flag that appeared, so only those override the
 *  config file and any value given, negative or not, goes through ValidateConfig.
 */
struct CliOptions {
	std::set<std::string> given;

	std::string config_path;
	std::string dir, pattern, db, debug_dir, series_output;
	int threshold = 0, min_radius = 0, max_radius = 0;
	double change_threshold = 0;
	int workers = 0, timeout_ms = 0;
	int time_window = 0, average_value = 0;
	std::string average_period, unit;

	bool debug = false, force = false, retry = false;
	bool series = false, all_time = false, average = false, no_process = false, new_only = false;
	bool describe = false, verbose = false, quiet = false, help = false;

	bool Given(const char* flag) const { return given.count(flag) > 0; }
};

void PrintUsage(const char* prog)
{
	std::cout <<
		"Usage: " << prog << " [options]\n\n"
		"Reads gauge images, stores calibrated readings, and writes time series.\n\n"
		"Input and storage:\n"
		"  --dir DIR               image directory\n"
		"  --pattern GLOB          image file pattern (default *.jpg)\n"
		"  --db FILE               SQLite database file\n"
		"  --config FILE           configuration file (YAML)\n"
		"  --debug                 write debug images\n"
		"  --debug-dir DIR         directory for debug images\n\n"
		"Detection:\n"
		"  --threshold N           binary threshold (0-255)\n"
		"  --min-radius N          minimum gauge radius in pixels\n"
		"  --max-radius N          maximum gauge radius in pixels\n"
		"  --change-threshold DEG  minimum significant angle change\n"
		"  --force                 process every image, even ones already stored\n"
		"  --retry-failures        reprocess images recorded as failures\n"
		"  --workers N             worker threads\n"
		"  --timeout-ms N          per-image time limit, 0 for none\n"
		"  --no-process            skip image processing\n"
		"  --describe              print a report for each image\n\n"
		"Series:\n"
		"  --series                write a time series of stored readings\n"
		"  --series-output FILE    CSV output, '-' for stdout\n"
		"  --new-only              series from this run's readings only\n"
		"  --time-window DAYS      days of history to include\n"
		"  --all-time              include all history\n"
		"  --average               average readings into time buckets\n"
		"  --average-period P      minute, hour or day\n"
		"  --average-value N       periods per bucket\n"
		"  --unit U                angle, psi or bar\n\n"
		"  --verbose | --quiet     log level\n"
		"  --help\n";
}

/*
 *  Returns false on a malformed command line. Unknown flags are an error rather than ignored.
 */
bool ParseArgs(int argc, char** argv, CliOptions* o)
{
	for(int i=1; i<argc; i++) {
		std::string a = argv[i];

		// Flags that take a value.
		if(a == "--dir" || a == "--pattern" || a == "--db" || a == "--config" ||
				a == "--debug-dir" || a == "--series-output" || a == "--threshold" ||
				a == "--min-radius" || a == "--max-radius" || a == "--change-threshold" ||
				a == "--workers" || a == "--timeout-ms" || a == "--time-window" ||
				a == "--average-period" || a == "--average-value" || a == "--unit") {
			if(i + 1 >= argc) {
				spdlog::error("{} needs a value", a);
				return false;
			}
			std::string v = argv[++i];
			o->given.insert(a);

			try {
				if(a == "--dir") o->dir = v;
				else if(a == "--pattern") o->pattern = v;
				else if(a == "--db") o->db = v;
				else if(a == "--config") o->config_path = v;
				else if(a == "--debug-dir") o->debug_dir = v;
				else if(a == "--series-output") o->series_output = v;
				else if(a == "--threshold") o->threshold = std::stoi(v);
				else if(a == "--min-radius") o->min_radius = std::stoi(v);
				else if(a == "--max-radius") o->max_radius = std::stoi(v);
				else if(a == "--change-threshold") o->change_threshold = std::stod(v);
				else if(a == "--workers") o->workers = std::stoi(v);
				else if(a == "--timeout-ms") o->timeout_ms = std::stoi(v);
				else if(a == "--time-window") o->time_window = std::stoi(v);
				else if(a == "--average-period") o->average_period = v;
				else if(a == "--average-value") o->average_value = std::stoi(v);
				else if(a == "--unit") o->unit = v;
			} catch(const std::logic_error&) {
				spdlog::error("invalid value '{}' for {}", v, a);
				return false;
			}
			continue;
		}

		if(a == "--debug") o->debug = true;
		else if(a == "--force") o->force = true;
		else if(a == "--retry-failures") o->retry = true;
		else if(a == "--series") o->series = true;
		else if(a == "--all-time") o->all_time = true;
		else if(a == "--average") o->average = true;
		else if(a == "--no-process") o->no_process = true;
		else if(a == "--new-only") o->new_only = true;
		else if(a == "--describe" || a == "-d") o->describe = true;
		else if(a == "--verbose" || a == "-v") o->verbose = true;
		else if(a == "--quiet" || a == "-q") o->quiet = true;
		else if(a == "--help" || a == "-h") o->help = true;
		else {
			spdlog::error("unknown option {}", a);
			return false;
		}
	}
	return true;
}

/*
 *  Command line values win over the config file. Validation runs afterwards on the merged result.
 */
void ApplyOverrides(const CliOptions& o, GaugeConfig* cfg)
{
	if(o.Given("--dir")) cfg->paths.image_dir = o.dir;
	if(o.Given("--pattern")) cfg->paths.image_pattern = o.pattern;
	if(o.Given("--db")) cfg->paths.db_file = o.db;
	if(o.Given("--debug-dir")) cfg->paths.debug_dir = o.debug_dir;
	if(o.Given("--series-output")) cfg->paths.series_output = o.series_output;

	if(o.Given("--threshold")) cfg->detection.binary_threshold = o.threshold;
	if(o.Given("--min-radius")) cfg->detection.min_radius = o.min_radius;
	if(o.Given("--max-radius")) cfg->detection.max_radius = o.max_radius;
	if(o.Given("--change-threshold")) cfg->detection.change_threshold = o.change_threshold;

	if(o.Given("--workers")) cfg->runtime.workers = o.workers;
	if(o.Given("--timeout-ms")) cfg->runtime.image_timeout_ms = o.timeout_ms;
	if(o.debug) cfg->runtime.debug = true;

	if(o.Given("--time-window")) cfg->plotting.default_window_days = o.time_window;
	if(o.Given("--average-value")) cfg->plotting.default_average_value = o.average_value;
	if(o.Given("--average-period") &&
			!ParsePeriod(o.average_period, &cfg->plotting.default_average_period))
		throw ConfigError("unknown average period '" + o.average_period + "'");
	if(o.Given("--unit") && !ParseUnit(o.unit, &cfg->plotting.default_unit))
		throw ConfigError("unknown pressure unit '" + o.unit + "'");
}

void PrintSummary(const BatchSummary& s)
{
	std::cout << "\nProcessing summary:\n";
	std::cout << "  Total images: " << s.total_images << "\n";
	std::cout << "  Processed this run: " << s.processed << " of " << s.to_process << "\n";
	std::cout << "  Successfully processed: " << s.succeeded << "\n";
	std::cout << "  Failed detections: " << s.failed << "\n";
	std::cout << "  Notable changes: " << s.notable << "\n";
	if(s.storage_errors > 0)
		std::cout << "  Not stored (storage errors): " << s.storage_errors << "\n";
	std::cout << "  Total successful detections: " << s.total_in_store << std::endl;
}

/*
 *  'fresh' is the readings stored by this run. With --new-only and a non-empty run the series is
 *  built from those alone, otherwise from the store.
 */
int WriteSeries(const CliOptions& o, const GaugeConfig& cfg, const ResultStore& store,
		const std::vector<GaugeReading>& fresh)
{
	AggregateOptions opts = TimeSeriesAggregator::DefaultOptions(cfg);
	opts.all_time = o.all_time;
	opts.average = o.average;

	std::vector<GaugeReading> readings;
	if(o.new_only && !fresh.empty()) {
		spdlog::info("Using the {} readings from this run for the series", fresh.size());
		readings = fresh;
		opts.all_time = true;
	} else if(opts.all_time) {
		spdlog::info("Loading all results for the series");
		readings = store.LoadReadings();
	} else {
		spdlog::info("Loading results from the past {} days for the series", opts.window_days);
		readings = store.LoadReadingsSince(opts.now - (NaiveTime)opts.window_days * SECONDS_PER_DAY);
	}

	TimeSeriesAggregator agg(opts);
	std::vector<SeriesPoint> series = agg.Aggregate(readings);
	SeriesSummary st = TimeSeriesAggregator::Summarize(series);

	const std::string& out = cfg.paths.series_output;
	if(out == "-") {
		TimeSeriesAggregator::WriteCsv(std::cout, series, opts.unit);
	} else {
		std::ofstream f(out.c_str());
		if(!f.good()) {
			spdlog::error("Could not write series to {}", out);
			return EXIT_USAGE;
		}
		TimeSeriesAggregator::WriteCsv(f, series, opts.unit);
		spdlog::info("Wrote series: {}", out);
	}

	if(opts.average)
		spdlog::info("Data points: {} raw, {} time periods (per {} {})", readings.size(), series.size(),
				opts.average_value, PeriodName(opts.period));
	else
		spdlog::info("Data points: {}", series.size());
	if(st.count > 0)
		spdlog::info("Min: {:.2f}  Max: {:.2f}  Avg: {:.2f}  Std Dev: {:.2f} ({})", st.min, st.max,
				st.mean, st.stddev, UnitName(opts.unit));

	return EXIT_OK;
}

} // namespace

int main(int argc, char** argv)
{
	auto console = spdlog::stdout_color_mt("gaugeeye");
	spdlog::set_default_logger(console);
	spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

	CliOptions o;
	if(!ParseArgs(argc, argv, &o)) {
		PrintUsage(argv[0]);
		return EXIT_USAGE;
	}
	if(o.help) {
		PrintUsage(argv[0]);
		return EXIT_OK;
	}

	if(o.verbose)
		spdlog::set_level(spdlog::level::debug);
	else if(o.quiet)
		spdlog::set_level(spdlog::level::warn);

	GaugeConfig cfg;
	try {
		cfg = o.config_path.empty() ? LoadDefaultConfig() : LoadConfig(o.config_path);
		ApplyOverrides(o, &cfg);
		ValidateConfig(cfg);
	} catch(const ConfigError& e) {
		spdlog::error("Configuration error: {}", e.what());
		return EXIT_CONFIG;
	}

	std::signal(SIGINT, OnSignal);
	std::signal(SIGTERM, OnSignal);

	try {
		ResultStore store(cfg.paths.db_file, cfg.runtime.backup_on_open);
		std::vector<GaugeReading> fresh;

		if(!o.no_process) {
			std::vector<std::string> files =
				MeasurementPipeline::ListImages(cfg.paths.image_dir, cfg.paths.image_pattern);
			if(files.empty()) {
				spdlog::error("No images found matching pattern '{}/{}'", cfg.paths.image_dir,
						cfg.paths.image_pattern);
				return EXIT_USAGE;
			}

			MeasurementPipeline pipeline(cfg, store);
			pipeline.SetCancelFlag(&g_cancel);
			if(o.describe) {
				pipeline.SetObserver([] (const ImageOutcome& out) {
					std::cout << Gaugeeye::DescribeReading(out.detection) << std::endl;
				});
			}

			BatchOptions bo;
			bo.force_reprocess = o.force;
			bo.retry_failures = o.retry;
			if(o.retry && !o.force) {
				std::vector<DetectionFailure> failures = store.LoadFailures();
				spdlog::info("Will retry {} previously failed detections", failures.size());
				for(const auto& f : failures)
					spdlog::debug("  {} (failed {})", f.image_name, FormatTimestamp(f.timestamp));
			}

			BatchSummary s = pipeline.RunBatch(files, bo);
			PrintSummary(s);
			fresh.swap(s.new_readings);

			if(!pipeline.WaitForPending(PENDING_WAIT_MS))
				spdlog::warn("Exiting with {} timed-out detections still running",
						pipeline.PendingDetections());
		}

		if(o.series)
			return WriteSeries(o, cfg, store, fresh);
	} catch(const StorageError& e) {
		spdlog::error("Storage error: {}", e.what());
		return EXIT_STORAGE;
	}

	return EXIT_OK;
}
