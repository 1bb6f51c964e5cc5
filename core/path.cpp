#include "path.hpp"

namespace burrow
{
auto clean_path(string_view p, TrailingSlash mode) -> std::string
{
	if (p.empty())
		return "/";

	const auto n = p.size();
	std::string buf;
	buf.reserve(n + 1);
	buf.push_back('/');

	auto trailing = n > 1 && p.back() == '/';
	std::size_t r = p.front() == '/' ? 1 : 0;

	while (r < n) {
		if (p[r] == '/') {
			++r;
		} else if (p[r] == '.' && r + 1 == n) {
			trailing = true;
			++r;
		} else if (p[r] == '.' && p[r + 1] == '/') {
			r += 2;
		} else if (p[r] == '.' && p[r + 1] == '.' && (r + 2 == n || p[r + 2] == '/')) {
			r += 3;
			// pop the last segment, root stays
			auto last = buf.rfind('/');
			buf.resize(last == 0 ? 1 : last);
		} else {
			if (buf.size() > 1)
				buf.push_back('/');
			while (r < n && p[r] != '/')
				buf.push_back(p[r++]);
		}
	}

	if (trailing && buf.size() > 1 && mode == TrailingSlash::keep)
		buf.push_back('/');

	return buf;
}
}
