#include <chrono>
#include <exception>
#include <ostream>
#include <string>

#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "loader.hpp"
#include "search.hpp"

using Clock = std::chrono::high_resolution_clock;

static double since_ms(const Clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count() / 1000.0;
}

static void print_event(std::ostream &out, std::ostream &err, const SearchEvent &ev) {
	switch (ev.kind) {
	case SearchEvent::Kind::Dispatched:
		out << "[SEARCH] Segment " << ev.index << " dispatched [" << ev.range.lo << ", " << ev.range.hi << ")" << std::endl;
		break;
	case SearchEvent::Kind::Completed:
		break;
	case SearchEvent::Kind::Failed:
		err << "[ERROR] Segment " << ev.index << " failed: " << ev.error << std::endl;
		break;
	}
}

static int search_and_report(
	const SequenceStore &store, const std::string &pattern, const SearchConfig &cfg, std::ostream &out, std::ostream &err
) {
	SearchCoordinator coordinator;
	if (cfg.verbose)
		coordinator.set_observer([&out, &err](const SearchEvent &ev) { print_event(out, err, ev); });

	SearchResults res;
	try {
		res = coordinator.search(store, pattern, cfg.workers);
	} catch (const SearchError &e) {
		err << "[ERROR] " << to_string(e.code()) << ": " << e.what() << std::endl;
		return 3;
	} catch (const std::exception &e) {
		err << "[ERROR] Search failed: " << e.what() << std::endl;
		return 3;
	}

	if (cfg.verbose) {
		for (size_t i = 0; i < res.segments.size(); ++i) {
			const SegmentStats &seg = res.segments[i];
			out << "[SEARCH] Segment " << i << " [" << seg.range.lo << ", " << seg.range.hi << "): " << seg.matches
				<< " matches in " << seg.time_ms << " ms" << std::endl;
		}
	}
	out << "[TIME] Search: " << res.time_ms << " ms (" << res.workers << " workers)" << std::endl;

	if (res.matches.empty()) {
		out << "not found" << std::endl;
	} else {
		for (const size_t pos : res.matches)
			out << "found " << pattern << " at " << pos << "\n";
		out.flush();
	}
	return 0;
}

int run_cli(const int argc, const char *const *argv, std::ostream &out, std::ostream &err) {
	if (argc < 2 || argc > 4) {
		err << "Usage: ./seqfind_runner <sequence.fa> [pattern] [config.json]" << std::endl;
		return 1;
	}

	SearchConfig cfg;
	if (argc == 4) {
		try {
			cfg = ConfigLoader::load_from_json(argv[3]);
		} catch (const std::exception &e) {
			err << "[ERROR] " << e.what() << std::endl;
			return 3;
		}
		if (cfg.verbose)
			ConfigLoader::print(cfg, out);
	}

	LoadOptions opts;
	opts.max_file_bytes = cfg.max_file_bytes;
	opts.use_cache = cfg.use_cache;
	opts.verbose = cfg.verbose;

	const auto t_load = Clock::now();
	try {
		const SequenceStore store = SequenceStore::load(argv[1], opts);
		out << "[TIME] Load: " << since_ms(t_load) << " ms" << std::endl;
		if (argc == 2)
			return 0;

		const int code = search_and_report(store, argv[2], cfg, out, err);
		if (code == 0)
			out << "[TIME] Total: " << since_ms(t_load) << " ms" << std::endl;
		return code;
	} catch (const SearchError &e) {
		err << "[ERROR] " << to_string(e.code()) << ": " << e.what() << std::endl;
		return 2;
	} catch (const std::exception &e) {
		err << "[ERROR] " << e.what() << std::endl;
		return 2;
	}
}
