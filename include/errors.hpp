#pragma once

#include <stdexcept>
#include <string>

enum class SearchErrc {
	FileTooLarge,
	IOError,
	InvalidPattern,
	TaskFailure,
	Interrupted,
};

inline const char *to_string(const SearchErrc code) {
	switch (code) {
	case SearchErrc::FileTooLarge:
		return "FileTooLarge";
	case SearchErrc::IOError:
		return "IOError";
	case SearchErrc::InvalidPattern:
		return "InvalidPattern";
	case SearchErrc::TaskFailure:
		return "TaskFailure";
	case SearchErrc::Interrupted:
		return "Interrupted";
	}
	return "Unknown";
}

class SearchError : public std::runtime_error {
	SearchErrc code_;

public:
	SearchError(const SearchErrc code, const std::string &what) : std::runtime_error(what), code_(code) {}

	[[nodiscard]] SearchErrc code() const noexcept {
		return code_;
	}
};
