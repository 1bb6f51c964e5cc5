#pragma once
#include "string_view.hpp"
#include <iosfwd>

namespace burrow
{
class Logger;
class Params;
struct Request;
struct Route;

struct RequestHandler
{
	struct Context
	{
		const Request& req;
		const Route& route;
		const Params& params;
		Logger& lg;
		std::ostream& out;
	};

	RequestHandler() = default;
	RequestHandler(const RequestHandler&) = delete;
	RequestHandler& operator=(const RequestHandler&) = delete;
	RequestHandler(RequestHandler&&) = delete;
	RequestHandler& operator=(RequestHandler&&) = delete;
	virtual ~RequestHandler() = default;

	virtual auto get_name() const noexcept -> string_view = 0;

	virtual auto handle(Context& ctx) -> void = 0;
};
}
