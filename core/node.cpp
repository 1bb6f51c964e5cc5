#include "node.hpp"
#include "route_error.hpp"
#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <utility>

namespace burrow
{
namespace
{
struct Wildcard
{
	string_view name;
	std::size_t pos = string_view::npos;
	bool valid = false;
};

// First ':' or '*' segment of the path; invalid if the segment holds another one
auto find_wildcard(string_view path) noexcept -> Wildcard
{
	for (std::size_t start = 0; start < path.size(); ++start) {
		auto c = path[start];
		if (c != ':' && c != '*')
			continue;

		auto valid = true;
		for (auto end = start + 1; end < path.size(); ++end) {
			switch (path[end]) {
			case '/':
				return { path.substr(start, end - start), start, valid };
			case ':':
			case '*':
				valid = false;
				break;
			default:
				break;
			}
		}
		return { path.substr(start), start, valid };
	}
	return {};
}

auto common_prefix(string_view a, string_view b) noexcept -> std::size_t
{
	auto max = std::min(a.size(), b.size());
	std::size_t i = 0;
	while (i < max && a[i] == b[i])
		++i;
	return i;
}

auto starts_with(string_view s, string_view prefix) noexcept -> bool
{
	return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// ASCII only, other bytes compare exactly
auto lower(char c) noexcept -> char
{
	return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
}

auto iequals(string_view a, string_view b) noexcept -> bool
{
	return a.size() == b.size()
		&& std::equal(a.begin(), a.end(), b.begin(),
			[](char x, char y) { return lower(x) == lower(y); });
}

auto segment_end(string_view path) noexcept -> std::size_t
{
	return std::min(path.find('/'), path.size());
}

auto str(string_view s)
{
	return std::string{ s };
}

// Pattern-local faults, raised before the tree is touched
auto check_wildcards(string_view full_path) -> void
{
	boost::container::small_vector<string_view, 4> names;
	std::size_t offset = 0;

	for (;;) {
		const auto wc = find_wildcard(full_path.substr(offset));
		if (wc.pos == string_view::npos)
			return;

		if (!wc.valid)
			throw RouteError{ str(full_path),
				"only one wildcard per path segment is allowed, has: '" + str(wc.name) + "'" };

		if (wc.name.size() < 2)
			throw RouteError{ str(full_path), "wildcards must be named with a non-empty name" };

		const auto at = offset + wc.pos;
		if (wc.name.front() == '*') {
			if (at + wc.name.size() != full_path.size())
				throw RouteError{ str(full_path),
					"catch-all routes are only allowed at the end of the path" };
			if (at == 0 || full_path[at - 1] != '/')
				throw RouteError{ str(full_path), "no / before catch-all" };
		}

		// one binding per key, whatever the wildcard kind
		const auto key = wc.name.substr(1);
		if (std::find(names.begin(), names.end(), key) != names.end())
			throw RouteError{ str(full_path), "duplicate wildcard name '" + str(wc.name) + "'" };
		names.push_back(key);

		offset = at + wc.name.size();
	}
}

struct Fallback
{
	const Node* node;
	string_view path;
	Params::size_type n_params;
};
}

auto Node::add_route(string_view path, std::unique_ptr<const Route> route) -> void
{
	const auto full_path = path;
	check_wildcards(full_path);

	auto n = this;
	++n->prio;

	if (n->text.empty() && n->children.empty()) {
		n->insert_child(path, full_path, std::move(route));
		n->type = Kind::root;
		return;
	}

	for (;;) {
		const auto i = common_prefix(path, n->text);

		// split the edge, the old node keeps its routes and children below
		if (i < n->text.size()) {
			auto child = std::make_unique<Node>();
			child->text = n->text.substr(i);
			child->wild = n->wild;
			child->first_bytes = std::move(n->first_bytes);
			child->children = std::move(n->children);
			child->leaf = std::move(n->leaf);
			child->prio = n->prio - 1;

			n->children.clear();
			n->children.push_back(std::move(child));
			n->first_bytes.assign(1, n->text[i]);
			n->text.resize(i);
			n->wild = false;
		}

		if (i == path.size()) {
			if (n->leaf)
				throw RouteError{ str(full_path), "a handler is already registered" };
			n->leaf = std::move(route);
			return;
		}

		path.remove_prefix(i);
		const auto c = path.front();

		if (n->type == Kind::param && c == '/' && n->children.size() == 1) {
			n = n->children.front().get();
			++n->prio;
			continue;
		}

		if (auto pos = n->first_bytes.find(c); pos != std::string::npos) {
			pos = n->increment_child_prio(pos);
			n = n->children[pos].get();
			continue;
		}

		if (c != ':' && c != '*' && n->type != Kind::catch_all) {
			n->first_bytes.push_back(c);
			auto child = n->add_child(std::make_unique<Node>());
			n->increment_child_prio(n->first_bytes.size() - 1);
			n = child;
		} else if (n->wild) {
			n = n->children.back().get();
			++n->prio;

			// same wildcard, and not a longer one like :id vs :ids
			if (starts_with(path, n->text) && n->type != Kind::catch_all
				&& (n->text.size() >= path.size() || path[n->text.size()] == '/'))
				continue;

			auto segment = n->type == Kind::catch_all ? path : path.substr(0, segment_end(path));
			auto prefix = str(full_path.substr(0, full_path.find(segment))) + n->text;
			throw RouteError{ str(full_path), "'" + str(segment)
				+ "' conflicts with existing wildcard '" + n->text
				+ "' in existing prefix '" + prefix + "'" };
		}

		n->insert_child(path, full_path, std::move(route));
		return;
	}
}

auto Node::insert_child(string_view path, string_view full_path,
	std::unique_ptr<const Route> route) -> void
{
	auto n = this;

	for (;;) {
		const auto wc = find_wildcard(path);
		if (wc.pos == string_view::npos)
			break;

		if (!wc.valid)
			throw RouteError{ str(full_path),
				"only one wildcard per path segment is allowed, has: '" + str(wc.name) + "'" };

		if (wc.name.size() < 2)
			throw RouteError{ str(full_path), "wildcards must be named with a non-empty name" };

		if (wc.name.front() == ':') {
			if (wc.pos > 0) {
				n->text = str(path.substr(0, wc.pos));
				path.remove_prefix(wc.pos);
			}

			auto child = std::make_unique<Node>();
			child->type = Kind::param;
			child->text = str(wc.name);

			auto parent = n;
			n = parent->add_child(std::move(child));
			parent->wild = true;
			++n->prio;

			// more segments follow, they start with '/'
			if (wc.name.size() < path.size()) {
				path.remove_prefix(wc.name.size());
				auto next = std::make_unique<Node>();
				next->prio = 1;
				n = n->add_child(std::move(next));
				continue;
			}

			n->leaf = std::move(route);
			return;
		}

		if (wc.pos + wc.name.size() != path.size())
			throw RouteError{ str(full_path),
				"catch-all routes are only allowed at the end of the path" };

		if (!n->text.empty() && n->text.back() == '/')
			throw RouteError{ str(full_path), "catch-all wildcard '" + str(path)
				+ "' conflicts with existing path segment root '" + n->text + "'" };

		if (wc.pos == 0 || path[wc.pos - 1] != '/')
			throw RouteError{ str(full_path), "no / before catch-all" };

		// the '/' before the wildcard belongs to the catch-all
		const auto slash = wc.pos - 1;
		n->text = str(path.substr(0, slash));

		auto hub = std::make_unique<Node>();
		hub->wild = true;
		hub->type = Kind::catch_all;

		auto parent = n;
		n = parent->add_child(std::move(hub));
		parent->first_bytes.assign(1, '/');
		++n->prio;

		auto holder = std::make_unique<Node>();
		holder->text = str(path.substr(slash));
		holder->type = Kind::catch_all;
		holder->leaf = std::move(route);
		holder->prio = 1;
		n->children.push_back(std::move(holder));
		return;
	}

	n->text = str(path);
	n->leaf = std::move(route);
}

auto Node::add_child(std::unique_ptr<Node> child) -> Node*
{
	auto raw = child.get();
	if (wild && !children.empty())
		children.insert(children.end() - 1, std::move(child));
	else
		children.push_back(std::move(child));
	return raw;
}

auto Node::increment_child_prio(std::size_t pos) -> std::size_t
{
	const auto p = ++children[pos]->prio;

	auto new_pos = pos;
	for (; new_pos > 0 && children[new_pos - 1]->prio < p; --new_pos)
		std::swap(children[new_pos - 1], children[new_pos]);

	if (new_pos != pos)
		first_bytes = first_bytes.substr(0, new_pos)
			+ first_bytes[pos]
			+ first_bytes.substr(new_pos, pos - new_pos)
			+ first_bytes.substr(pos + 1);

	return new_pos;
}

auto Node::matches_lone_slash() const noexcept -> bool
{
	if (type == Kind::catch_all)
		return !children.empty() && children.front()->leaf;
	if (text.empty())
		return routes_with_slash();
	return text == "/" && leaf;
}

auto Node::routes_with_slash() const noexcept -> bool
{
	auto pos = first_bytes.find('/');
	return pos != std::string::npos && children[pos]->matches_lone_slash();
}

auto Node::get_value(string_view path, Params& params) const -> Match
{
	boost::container::small_vector<Fallback, 4> fallbacks;
	const Node* n = this;
	const Node* parent = nullptr;
	auto tsr = false;
	auto resume_wild = false;

	// static branch failed: retry the wild child it shadowed
	auto backtrack = [&] {
		if (fallbacks.empty())
			return false;
		const auto f = fallbacks.back();
		fallbacks.pop_back();
		n = f.node;
		path = f.path;
		params.truncate(f.n_params);
		resume_wild = true;
		return true;
	};

	for (;;) {
		if (!resume_wild) {
			const auto& prefix = n->text;

			if (path.size() > prefix.size() && starts_with(path, prefix)) {
				path.remove_prefix(prefix.size());

				if (auto pos = n->first_bytes.find(path.front()); pos != std::string::npos) {
					if (n->wild)
						fallbacks.push_back({ n, path, params.size() });
					parent = n;
					n = n->children[pos].get();
					continue;
				}

				if (!n->wild) {
					tsr = tsr || (path == "/" && n->leaf);
					if (backtrack())
						continue;
					return { nullptr, tsr };
				}
			} else if (path == prefix) {
				if (n->leaf)
					return { n->leaf.get(), false };

				tsr = tsr || n->routes_with_slash()
					|| (path == "/" && parent && parent->leaf);
				if (backtrack())
					continue;
				return { nullptr, tsr };
			} else {
				tsr = tsr || (path == "/" && parent && parent->leaf)
					|| (n->leaf && prefix.size() == path.size() + 1
						&& prefix.back() == '/' && starts_with(prefix, path));
				if (backtrack())
					continue;
				return { nullptr, tsr };
			}
		}
		resume_wild = false;

		parent = n;
		n = n->children.back().get();

		if (n->type == Kind::catch_all) {
			params.push(string_view{ n->text }.substr(2), path);
			return { n->leaf.get(), false };
		}

		const auto end = segment_end(path);
		if (end == 0) {
			tsr = tsr || (path == "/" && parent->leaf);
			if (backtrack())
				continue;
			return { nullptr, tsr };
		}

		params.push(string_view{ n->text }.substr(1), path.substr(0, end));

		if (end < path.size()) {
			if (!n->children.empty()) {
				path.remove_prefix(end);
				parent = n;
				n = n->children.front().get();
				continue;
			}

			tsr = tsr || (n->leaf && path.size() == end + 1);
		} else if (n->leaf) {
			return { n->leaf.get(), false };
		} else {
			tsr = tsr || (n->children.size() == 1 && n->children.front()->matches_lone_slash());
		}

		if (backtrack())
			continue;
		return { nullptr, tsr };
	}
}

auto Node::find_case_insensitive_path(string_view path, bool fix_trailing_slash) const
	-> std::optional<std::string>
{
	std::string ci;
	ci.reserve(path.size() + 1);
	if (find_ci(path, ci, fix_trailing_slash))
		return ci;
	return std::nullopt;
}

auto Node::find_ci(string_view path, std::string& ci, bool fix) const -> bool
{
	const auto mark = ci.size();

	if (path.size() < text.size() || !iequals(path.substr(0, text.size()), text)) {
		// one '/' short of a route
		if (fix && leaf && text.size() == path.size() + 1 && text.back() == '/'
			&& iequals(path, string_view{ text }.substr(0, path.size()))) {
			ci += text;
			return true;
		}
		return false;
	}

	path.remove_prefix(text.size());
	ci += text;

	if (path.empty()) {
		if (leaf)
			return true;
		if (fix && routes_with_slash()) {
			ci += '/';
			return true;
		}
		ci.resize(mark);
		return false;
	}

	// both casings of the next byte may be indexed
	const auto c = lower(path.front());
	for (std::size_t i = 0; i < first_bytes.size(); ++i) {
		if (lower(first_bytes[i]) == c && children[i]->find_ci(path, ci, fix))
			return true;
	}

	if (wild && children.back()->find_ci_wild(path, ci, fix))
		return true;

	if (fix && leaf && path == "/")
		return true;

	ci.resize(mark);
	return false;
}

auto Node::find_ci_wild(string_view path, std::string& ci, bool fix) const -> bool
{
	const auto mark = ci.size();

	if (type == Kind::catch_all) {
		ci += path;
		return true;
	}

	const auto end = segment_end(path);
	if (end == 0)
		return false;

	ci += path.substr(0, end);
	path.remove_prefix(end);

	if (path.empty()) {
		if (leaf)
			return true;
		if (fix && children.size() == 1 && children.front()->matches_lone_slash()) {
			ci += '/';
			return true;
		}
	} else {
		if (!children.empty() && children.front()->find_ci(path, ci, fix))
			return true;
		if (fix && leaf && path == "/")
			return true;
	}

	ci.resize(mark);
	return false;
}
}
