#pragma once
#include <stdexcept>
#include <string>

namespace burrow
{
// Thrown at registration time for malformed or conflicting routes
class RouteError : public std::logic_error
{
public:
	RouteError(const std::string& pattern, const std::string& msg):
		logic_error{ msg + " in path '" + pattern + "'" },
		patt{ pattern }
	{}

	auto pattern() const noexcept -> const std::string& { return patt; }

private:
	const std::string patt;
};
}
