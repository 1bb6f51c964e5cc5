#pragma once
#include "string_view.hpp"
#include <cstddef>
#include <ostream>
#include <vector>

namespace burrow
{
struct Param
{
	string_view key;
	string_view value;
};

inline auto operator==(const Param& lhs, const Param& rhs) noexcept -> bool
{
	return lhs.key == rhs.key && lhs.value == rhs.value;
}

inline auto operator!=(const Param& lhs, const Param& rhs) noexcept -> bool
{
	return !(lhs == rhs);
}

auto operator<<(std::ostream& stream, const Param& p) -> std::ostream&;

// Path parameters bound by one lookup, in pattern order.
// Keys refer to the router, values to the looked-up path: both must outlive
// the carrier's contents.
class Params
{
public:
	using value_type = Param;
	using const_iterator = std::vector<Param>::const_iterator;
	using size_type = std::size_t;

	Params() = default;
	explicit Params(size_type capacity);

	auto push(string_view key, string_view value) -> void;

	// Drops all bindings, keeps the storage
	auto reset() noexcept -> void;
	auto truncate(size_type n) noexcept -> void;

	auto reserve(size_type n) -> void;

	// Value of the first parameter named `name`, empty if none
	[[nodiscard]] auto by_name(string_view name) const noexcept -> string_view;
	[[nodiscard]] auto has(string_view name) const noexcept -> bool;

	[[nodiscard]] auto size() const noexcept -> size_type { return list.size(); }
	[[nodiscard]] auto empty() const noexcept -> bool { return list.empty(); }
	[[nodiscard]] auto capacity() const noexcept -> size_type { return list.capacity(); }

	auto operator[](size_type i) const noexcept -> const Param& { return list[i]; }

	auto begin() const noexcept -> const_iterator { return list.begin(); }
	auto end() const noexcept -> const_iterator { return list.end(); }

	friend auto operator==(const Params& lhs, const Params& rhs) noexcept -> bool
	{
		return lhs.list == rhs.list;
	}
	friend auto operator!=(const Params& lhs, const Params& rhs) noexcept -> bool
	{
		return lhs.list != rhs.list;
	}

private:
	std::vector<Param> list;
};

auto operator<<(std::ostream& stream, const Params& params) -> std::ostream&;
}
