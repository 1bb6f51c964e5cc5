#pragma once
#include <memory>
#include <string>

namespace burrow
{
struct RequestHandler;

struct Route
{
	std::string method;
	std::string pattern;
	std::shared_ptr<RequestHandler> handler;
};

// Outcome of a lookup: the route, or whether the path with its trailing
// slash toggled would have one
struct RouteMatch
{
	const Route* route = nullptr;
	bool tsr = false;

	explicit operator bool() const noexcept { return route != nullptr; }
};
}
