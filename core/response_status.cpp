#include "response_status.hpp"
#include <boost/config.hpp>
#include <cstdlib>

namespace burrow
{
namespace
{
struct StringList
{
	const string_view* array;
	int size;

	template <int N>
	constexpr StringList(const string_view (&a)[N]):
		array{a},
		size{N}
	{}
};

constexpr string_view unsupported = "0 Unknown Status"sv;

constexpr string_view m0[] = {
	unsupported,
};

constexpr string_view m1[] = {
	"100 Continue"sv,
	"101 Switching Protocols"sv,
};

constexpr string_view m2[] = {
	"200 OK"sv,
};

// 306 is unused
constexpr string_view m3[] = {
	"300 Multiple Choices"sv,
	"301 Moved Permanently"sv,
	"302 Found"sv,
	"303 See Other"sv,
	"304 Not Modified"sv,
	"305 Use Proxy"sv,
	unsupported,
	"307 Temporary Redirect"sv,
	"308 Permanent Redirect"sv,
};

constexpr string_view m4[] = {
	"400 Bad Request"sv,
	"401 Unauthorized"sv,
	"402 Payment Required"sv,
	"403 Forbidden"sv,
	"404 Not Found"sv,
	"405 Method Not Allowed"sv,
};

constexpr string_view m5[] = {
	"500 Internal Server Error"sv,
	"501 Not Implemented"sv,
	"502 Bad Gateway"sv,
	"503 Service Unavailable"sv,
	"504 Gateway Timeout"sv,
	"505 HTTP Version Not Supported"sv,
};

constexpr StringList strings[] = {
	m0, m1, m2, m3, m4, m5
};
}

auto status_string(Status status) noexcept -> string_view
{
	auto dv = std::div(static_cast<int>(status), 100);

	int group = dv.quot;
	if (BOOST_UNLIKELY(group < 0 || group > 5))
		return unsupported;

	auto sublist = strings[group];
	int subcode = dv.rem;
	if (BOOST_UNLIKELY(subcode >= sublist.size))
		return unsupported;

	return sublist.array[subcode];
}
}
