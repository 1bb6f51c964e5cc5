#include "params.hpp"
#include <algorithm>

namespace burrow
{
auto operator<<(std::ostream& stream, const Param& p) -> std::ostream&
{
	return stream << p.key << "=" << p.value;
}

auto operator<<(std::ostream& stream, const Params& params) -> std::ostream&
{
	stream << "[";
	auto first = true;
	for (auto& p : params) {
		if (!first)
			stream << ", ";
		stream << p;
		first = false;
	}
	return stream << "]";
}

Params::Params(size_type capacity)
{
	list.reserve(capacity);
}

auto Params::push(string_view key, string_view value) -> void
{
	list.push_back({ key, value });
}

auto Params::reset() noexcept -> void
{
	list.clear();
}

auto Params::truncate(size_type n) noexcept -> void
{
	if (n < list.size())
		list.resize(n);
}

auto Params::reserve(size_type n) -> void
{
	list.reserve(n);
}

auto Params::by_name(string_view name) const noexcept -> string_view
{
	auto found = std::find_if(list.begin(), list.end(),
		[name](const Param& p) { return p.key == name; });
	return found == list.end() ? string_view{} : found->value;
}

auto Params::has(string_view name) const noexcept -> bool
{
	return std::any_of(list.begin(), list.end(),
		[name](const Param& p) { return p.key == name; });
}
}
