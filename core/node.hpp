#pragma once
#include "params.hpp"
#include "route.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace burrow
{
// Compressed trie node. Every node owns its children; static children are
// indexed by their first byte in `indices`, the wild child (if any) is last.
class Node : boost::noncopyable
{
public:
	enum class Kind : std::uint8_t
	{
		literal,
		root,
		param,
		catch_all,
	};

	using Match = RouteMatch;

	Node() = default;
	~Node() = default;

	// throws RouteError
	auto add_route(string_view pattern, std::unique_ptr<const Route> route) -> void;

	// Read-only: safe to call concurrently once registration is over
	auto get_value(string_view path, Params& params) const -> Match;

	auto find_case_insensitive_path(string_view path, bool fix_trailing_slash) const
		-> std::optional<std::string>;

	auto prefix() const noexcept -> const std::string& { return text; }
	auto kind() const noexcept -> Kind { return type; }
	auto priority() const noexcept -> std::uint32_t { return prio; }
	auto has_wild_child() const noexcept -> bool { return wild; }
	auto indices() const noexcept -> const std::string& { return first_bytes; }
	auto child_count() const noexcept -> std::size_t { return children.size(); }
	auto child(std::size_t i) const noexcept -> const Node& { return *children[i]; }
	auto route() const noexcept -> const Route* { return leaf.get(); }

private:
	auto insert_child(string_view path, string_view full_path,
		std::unique_ptr<const Route> route) -> void;
	auto add_child(std::unique_ptr<Node> child) -> Node*;
	auto increment_child_prio(std::size_t pos) -> std::size_t;

	auto matches_lone_slash() const noexcept -> bool;
	auto routes_with_slash() const noexcept -> bool;

	auto find_ci(string_view path, std::string& ci, bool fix) const -> bool;
	auto find_ci_wild(string_view path, std::string& ci, bool fix) const -> bool;

	std::string text;
	bool wild = false;
	Kind type = Kind::literal;
	std::uint32_t prio = 0;
	std::string first_bytes;
	std::vector<std::unique_ptr<Node>> children;
	std::unique_ptr<const Route> leaf;
};
}
