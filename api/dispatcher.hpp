#pragma once
#include "response_status.hpp"
#include "route.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <iosfwd>
#include <string>

namespace burrow
{
class Logger;
class Params;
class Router;
struct Request;

struct DispatchOptions
{
	// Redirect when only the path with the trailing slash toggled is routed
	bool redirect_trailing_slash = true;
	// Redirect to the case-insensitive match of the cleaned path
	bool redirect_fixed_path = true;
	// Answer 405 with Allow when another method serves the path
	bool handle_method_not_allowed = true;
	std::string body_404 = "404 page not found";
	std::string body_405 = "405 method not allowed";
};

struct Outcome
{
	enum class Kind
	{
		matched,
		redirect,
		method_not_allowed,
		not_found,
	};

	Kind kind = Kind::not_found;
	Status status = Status::not_found;
	const Route* route = nullptr;
	// redirect target, query included
	std::string location;
	// Allow header value for 405
	std::string allow;
	string_view body;
};

auto operator<<(std::ostream& stream, Outcome::Kind kind) -> std::ostream&;

class Dispatcher : boost::noncopyable
{
public:
	Dispatcher(const Router& router, DispatchOptions opt);

	// Bound parameters are left in `params` only for a match
	auto dispatch(const Request& req, Params& params, Logger& lg) const -> Outcome;

	// dispatch() and run the matched handler, writing its output to `out`
	auto serve(const Request& req, Params& params, std::ostream& out) const -> Outcome;

	auto options() const noexcept -> const DispatchOptions& { return opt; }

private:
	auto redirect(Status code, std::string target, const Request& req) const -> Outcome;

	const Router& router;
	const DispatchOptions opt;
};
}
