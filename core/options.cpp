#include "options.hpp"
#include <unordered_map>

using std::string;

namespace burrow
{
auto parse_severity(const string& s) -> Options::Log::Severity
{
	using severity = Options::Log::Severity;
	static const std::unordered_map<string, severity> severities = {
		{ "error",   severity::error },
		{ "warning", severity::warning },
		{ "info",    severity::info },
		{ "debug",   severity::debug },
		{ "trace",   severity::trace },
	};

	auto it = severities.find(s);
	if (it == severities.end())
		throw Options::Error{ "unknown severity: " + s };
	return it->second;
}

auto parse_log_dest(const string& s) -> decltype(Options::Log::dest)
{
	if (s.empty())
		throw Options::Error{ "empty log destination" };
	if (s == "console")
		return Options::Log::Console{};
	return Options::Log::File{ s };
}
}
