#include "resolver.hpp"
#include "logger.hpp"
#include "response_status.hpp"
#include "router.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace burrow
{
namespace
{
auto is_blank(char c) noexcept
{
	return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

auto trim(string_view s) noexcept
{
	while (!s.empty() && is_blank(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && is_blank(s.back()))
		s.remove_suffix(1);
	return s;
}
}

auto parse_request(string_view line) -> std::optional<Request>
{
	line = trim(line);
	const auto sep = std::find_if(line.begin(), line.end(), is_blank);
	if (sep == line.begin() || sep == line.end())
		return std::nullopt;

	Request req;
	req.method = line.substr(0, sep - line.begin());
	auto target = trim(line.substr(sep - line.begin()));
	if (target.empty() || std::any_of(target.begin(), target.end(), is_blank))
		return std::nullopt;

	const auto q = target.find('?');
	req.path = target.substr(0, q);
	if (q != string_view::npos)
		req.query = target.substr(q + 1);
	return req;
}

Resolver::Resolver(const Router& router, DispatchOptions opt, Logger& lg):
	dispatcher{ router, std::move(opt) },
	pool{ router.max_params() },
	lg{ lg }
{
}

auto Resolver::resolve(string_view line, std::ostream& out) -> bool
{
	const auto req = parse_request(line);
	if (!req) {
		lg.warning("not a request: ", quoted(line));
		return false;
	}
	resolve(*req, out);
	return true;
}

auto Resolver::resolve(const Request& req, std::ostream& out) -> Outcome
{
	auto params = pool.acquire();
	std::ostringstream body;
	auto res = dispatcher.serve(req, *params, body);

	out << req.method << ' ' << req.path;
	if (!req.query.empty())
		out << '?' << req.query;
	out << " -> " << status_string(res.status) << '\n';

	switch (res.kind) {
	case Outcome::Kind::matched:
		out << "Route: " << res.route->pattern << ' ' << *params << '\n';
		out << body.str();
		break;
	case Outcome::Kind::redirect:
		out << "Location: " << res.location << '\n';
		break;
	case Outcome::Kind::method_not_allowed:
		out << "Allow: " << res.allow << '\n' << res.body << '\n';
		break;
	case Outcome::Kind::not_found:
		out << res.body << '\n';
		break;
	}
	return res;
}
}
