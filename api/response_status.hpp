#pragma once
#include "string_view.hpp"
#include <ostream>

namespace burrow
{
enum class Status
{
	continue_ = 100,
	switching_protocols = 101,

	ok = 200,

	multiple_choices = 300,
	moved_permanently = 301,
	found = 302,
	see_other = 303,
	not_modified = 304,
	use_proxy = 305,
	temporary_redirect = 307,
	permanent_redirect = 308,

	bad_request = 400,
	unauthorized = 401,
	payment_required = 402,
	forbidden = 403,
	not_found = 404,
	method_not_allowed = 405,

	internal_server_error = 500,
	not_implemented = 501,
	bad_gateway = 502,
	service_unavailable = 503,
	gateway_timeout = 504,
	http_version_not_supported = 505,
};

auto status_string(Status status) noexcept -> string_view;

inline auto is_redirect(Status status) noexcept -> bool
{
	auto code = static_cast<int>(status);
	return code >= 300 && code < 400;
}

inline auto operator<<(std::ostream& strm, Status status) -> std::ostream&
{
	return strm << static_cast<int>(status);
}
}
