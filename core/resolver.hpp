#pragma once
#include "dispatcher.hpp"
#include "params_pool.hpp"
#include "request.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <optional>
#include <ostream>

namespace burrow
{
class Logger;
class Router;

// "METHOD PATH[?QUERY]", blanks around and between allowed
auto parse_request(string_view line) -> std::optional<Request>;

// Resolves textual requests and prints what the dispatcher would answer
class Resolver : boost::noncopyable
{
public:
	Resolver(const Router& router, DispatchOptions opt, Logger& lg);

	// false if the line is not a request
	auto resolve(string_view line, std::ostream& out) -> bool;
	auto resolve(const Request& req, std::ostream& out) -> Outcome;

private:
	const Dispatcher dispatcher;
	ParamsPool pool;
	Logger& lg;
};
}
