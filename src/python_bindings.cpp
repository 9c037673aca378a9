#include <memory>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config.hpp"
#include "errors.hpp"
#include "loader.hpp"
#include "search.hpp"

namespace py = pybind11;

class SeqFindEngine {
	std::unique_ptr<SequenceStore> store;
	SearchCoordinator coordinator;
	SearchConfig cfg;

public:
	explicit SeqFindEngine(const std::string &fasta_path, const std::string &config_path) {
		if (!config_path.empty())
			cfg = ConfigLoader::load_from_json(config_path);

		LoadOptions opts;
		opts.max_file_bytes = cfg.max_file_bytes;
		opts.use_cache = cfg.use_cache;
		opts.verbose = false;

		if (cfg.verbose)
			py::print("[C++] Loading sequence from:", fasta_path);
		store = std::make_unique<SequenceStore>(SequenceStore::load(fasta_path, opts));
		if (cfg.verbose)
			py::print("[C++] Ready.", store->valid_length(), "valid bytes");
	}

	std::vector<size_t> search(const std::string &pattern, const size_t workers) {
		SearchResults res;
		{
			py::gil_scoped_release release;
			res = coordinator.search(*store, pattern, workers ? workers : cfg.workers);
		}
		return std::move(res.matches);
	}

	[[nodiscard]] size_t valid_length() const {
		return store->valid_length();
	}

	[[nodiscard]] size_t buffer_size() const {
		return store->buffer_size();
	}
};

PYBIND11_MODULE(seqfind_engine, m) {
	m.doc() = "Parallel exact pattern search over FASTA sequence files";

	py::register_exception<SearchError>(m, "SearchError", PyExc_RuntimeError);

	py::class_<SeqFindEngine>(m, "Engine")
		.def(py::init<const std::string &, const std::string &>(), py::arg("path"), py::arg("config_path") = "")
		.def("search", &SeqFindEngine::search, py::arg("pattern"), py::arg("workers") = 0)
		.def_property_readonly("valid_length", &SeqFindEngine::valid_length)
		.def_property_readonly("buffer_size", &SeqFindEngine::buffer_size);
}
