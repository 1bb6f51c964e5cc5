#pragma once
#include "string_view.hpp"
#include <array>

namespace burrow::method
{
constexpr auto get     = "GET"sv;
constexpr auto head    = "HEAD"sv;
constexpr auto post    = "POST"sv;
constexpr auto put     = "PUT"sv;
constexpr auto patch   = "PATCH"sv;
constexpr auto del     = "DELETE"sv;
constexpr auto connect = "CONNECT"sv;
constexpr auto options = "OPTIONS"sv;
constexpr auto trace   = "TRACE"sv;

// what Router::any registers
constexpr std::array all = {
	get, post, put, patch, head, options, del, connect, trace,
};
}
