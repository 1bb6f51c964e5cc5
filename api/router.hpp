#pragma once
#include "params.hpp"
#include "route.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace burrow
{
class Logger;
class Node;
struct RequestHandler;

// One radix tree per method. Registration happens once, before lookups
// start; lookups never modify the router and need no locking.
class Router : boost::noncopyable
{
public:
	explicit Router(Logger& lg);
	~Router();

	// throws RouteError
	auto handle(string_view method, string_view pattern,
		std::shared_ptr<RequestHandler> handler) -> void;

	auto get(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto head(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto options(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto post(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto put(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto patch(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto del(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;
	auto any(string_view pattern, std::shared_ptr<RequestHandler> handler) -> void;

	// `params` is left empty unless a route matches
	auto lookup(string_view method, string_view path, Params& params) const -> RouteMatch;

	auto find_case_insensitive_path(string_view method, string_view path,
		bool fix_trailing_slash) const -> std::optional<std::string>;

	// Methods other than `req_method` serving `path`, for the Allow header.
	// "*" asks for every method the router knows.
	auto allowed(string_view path, string_view req_method) const -> std::string;

	[[nodiscard]] auto tree(string_view method) const noexcept -> const Node*;
	[[nodiscard]] auto methods() const -> std::vector<string_view>;
	[[nodiscard]] auto max_params() const noexcept -> std::size_t { return n_max_params; }
	[[nodiscard]] auto size() const noexcept -> std::size_t { return n_routes; }

private:
	Logger& lg;
	std::map<std::string, std::unique_ptr<Node>, std::less<>> trees;
	std::size_t n_max_params = 0;
	std::size_t n_routes = 0;
};
}
