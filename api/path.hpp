#pragma once
#include "string_view.hpp"
#include <string>

namespace burrow
{
enum class TrailingSlash
{
	keep,
	strip,
};

// Canonical form of a URL path: leading '/', no empty, "." or ".." segments.
// ".." never climbs above the root. clean_path(clean_path(p)) == clean_path(p)
auto clean_path(string_view path, TrailingSlash mode = TrailingSlash::keep) -> std::string;
}
