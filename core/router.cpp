#include "router.hpp"
#include "logger.hpp"
#include "method.hpp"
#include "node.hpp"
#include "request_handler.hpp"
#include "route_error.hpp"
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <utility>

namespace burrow
{
namespace
{
auto count_params(string_view pattern) noexcept
{
	return static_cast<std::size_t>(std::count_if(pattern.begin(), pattern.end(),
		[](char c) { return c == ':' || c == '*'; }));
}
}

Router::Router(Logger& lg):
	lg{ lg }
{
}

Router::~Router() = default;

auto Router::handle(string_view method, string_view pattern,
	std::shared_ptr<RequestHandler> handler) -> void
{
	const auto patt = std::string{ pattern };
	if (method.empty())
		throw RouteError{ patt, "method must not be empty" };
	if (pattern.empty() || pattern.front() != '/')
		throw RouteError{ patt, "path must begin with '/'" };
	if (!handler)
		throw RouteError{ patt, "handler must not be null" };

	auto it = trees.find(method);
	const auto fresh = it == trees.end();
	if (fresh)
		it = trees.emplace(std::string{ method }, std::make_unique<Node>()).first;

	const auto name = handler->get_name();
	try {
		it->second->add_route(pattern, std::make_unique<const Route>(
			Route{ std::string{ method }, patt, std::move(handler) }));
	} catch (RouteError&) {
		if (fresh)
			trees.erase(it);
		throw;
	}

	n_max_params = std::max(n_max_params, count_params(pattern));
	++n_routes;

	lg.debug("route ", method, " ", quoted(pattern), " -> ", name);
}

auto Router::get(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::get, pattern, std::move(handler));
}

auto Router::head(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::head, pattern, std::move(handler));
}

auto Router::options(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::options, pattern, std::move(handler));
}

auto Router::post(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::post, pattern, std::move(handler));
}

auto Router::put(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::put, pattern, std::move(handler));
}

auto Router::patch(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::patch, pattern, std::move(handler));
}

auto Router::del(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	handle(method::del, pattern, std::move(handler));
}

auto Router::any(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void
{
	for (auto m : method::all)
		handle(m, pattern, handler);
}

auto Router::lookup(string_view method, string_view path, Params& params) const -> RouteMatch
{
	auto root = tree(method);
	if (!root)
		return {};

	auto m = root->get_value(path, params);
	if (!m)
		params.reset();
	return m;
}

auto Router::find_case_insensitive_path(string_view method, string_view path,
	bool fix_trailing_slash) const -> std::optional<std::string>
{
	if (auto root = tree(method))
		return root->find_case_insensitive_path(path, fix_trailing_slash);
	return std::nullopt;
}

auto Router::allowed(string_view path, string_view req_method) const -> std::string
{
	std::vector<std::string> allow;
	allow.reserve(method::all.size());

	if (path == "*") {
		for (auto& [m, root] : trees)
			if (m != method::options)
				allow.emplace_back(m);
	} else {
		Params scratch{ n_max_params };
		for (auto& [m, root] : trees) {
			if (m == req_method || m == method::options)
				continue;

			scratch.reset();
			if (root->get_value(path, scratch))
				allow.emplace_back(m);
		}
	}

	if (allow.empty())
		return {};

	allow.emplace_back(method::options);
	std::sort(allow.begin(), allow.end());
	return boost::algorithm::join(allow, ", ");
}

auto Router::tree(string_view method) const noexcept -> const Node*
{
	auto it = trees.find(method);
	return it == trees.end() ? nullptr : it->second.get();
}

auto Router::methods() const -> std::vector<string_view>
{
	std::vector<string_view> res;
	res.reserve(trees.size());
	for (auto& [m, root] : trees)
		res.emplace_back(m);
	return res;
}
}
