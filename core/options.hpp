#pragma once
#include "dispatcher.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace burrow
{
struct Options
{
	struct Error: std::runtime_error
	{
		explicit Error(const std::string& s):
			runtime_error("options error: " + s) {}
	};

	struct Log
	{
		enum class Severity {
			error,
			warning,
			info,
			debug,
			trace,
		};

		struct Console {};
		struct File { std::string path; };

		std::variant<Console, File> dest;
		Severity level = Severity::info;
	};

	DispatchOptions dispatch;
	Log log;
	std::string routes_path;
	std::string settings_path;
	// "METHOD PATH[?QUERY]" each
	std::vector<std::string> requests;
};

// throws Options::Error
auto parse_severity(const std::string& s) -> Options::Log::Severity;
// "console" or a file path
auto parse_log_dest(const std::string& s) -> decltype(Options::Log::dest);
}
