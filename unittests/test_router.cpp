#include "router.hpp"
#include "logger_imp.hpp"
#include "node.hpp"
#include "route_error.hpp"
#include "test_util.hpp"
#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>

using namespace burrow;
using burrow::test::handler;

namespace
{
struct RouterFixture
{
	auto match(string_view method, string_view path)
	{
		params.reset();
		auto m = router.lookup(method, path, params);
		return m ? m.route->pattern : std::string{};
	}

	const std::shared_ptr<RequestHandler> h1 = handler("h1");
	const std::shared_ptr<RequestHandler> h2 = handler("h2");
	BaseLogger lg;
	Router router{ lg };
	Params params;
};
}

BOOST_FIXTURE_TEST_SUITE(router_tests, RouterFixture)

BOOST_AUTO_TEST_CASE(test_per_method)
{
	router.get("/path", h1);
	router.post("/path", h2);

	auto m = router.lookup("GET", "/path", params);
	BOOST_REQUIRE(m);
	BOOST_TEST(m.route->handler == h1);
	BOOST_TEST(m.route->method == "GET");

	m = router.lookup("POST", "/path", params);
	BOOST_REQUIRE(m);
	BOOST_TEST(m.route->handler == h2);

	BOOST_TEST(!router.lookup("PUT", "/path", params));
	BOOST_TEST(router.tree("PUT") == nullptr);
	BOOST_TEST(router.tree("GET") != nullptr);
}

BOOST_AUTO_TEST_CASE(test_shortcuts)
{
	router.get("/r", h1);
	router.head("/r", h1);
	router.options("/r", h1);
	router.post("/r", h1);
	router.put("/r", h1);
	router.patch("/r", h1);
	router.del("/r", h1);

	const std::vector<string_view> expected = {
		"DELETE", "GET", "HEAD", "OPTIONS", "PATCH", "POST", "PUT",
	};
	BOOST_TEST(router.methods() == expected, boost::test_tools::per_element());
	for (auto m : expected)
		BOOST_TEST(match(m, "/r") == "/r");
	BOOST_TEST(router.size() == 7u);
}

BOOST_AUTO_TEST_CASE(test_custom_method)
{
	router.handle("PROPFIND", "/dav/*path", h1);
	BOOST_TEST(match("PROPFIND", "/dav/a/b") == "/dav/*path");
	BOOST_TEST(params.by_name("path") == "/a/b");
}

BOOST_AUTO_TEST_CASE(test_any)
{
	router.any("/all", h1);

	BOOST_TEST(router.size() == 9u);
	for (auto m : { "GET", "POST", "PUT", "PATCH", "HEAD", "OPTIONS", "DELETE",
		"CONNECT", "TRACE" })
		BOOST_TEST(match(m, "/all") == "/all");
	BOOST_TEST(router.allowed("*", "") ==
		"CONNECT, DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT, TRACE");
}

BOOST_AUTO_TEST_CASE(test_allowed)
{
	router.get("/path", h1);
	router.post("/path", h1);
	router.put("/other", h1);
	router.options("/path", h1);

	BOOST_TEST(router.allowed("/path", "DELETE") == "GET, OPTIONS, POST");
	BOOST_TEST(router.allowed("/path", "GET") == "OPTIONS, POST");
	BOOST_TEST(router.allowed("/other", "GET") == "OPTIONS, PUT");
	BOOST_TEST(router.allowed("/nowhere", "GET") == "");
	BOOST_TEST(router.allowed("/other", "PUT") == "");
}

BOOST_AUTO_TEST_CASE(test_allowed_server_wide)
{
	router.get("/a", h1);
	router.post("/b", h1);
	router.options("/c", h1);

	BOOST_TEST(router.allowed("*", "OPTIONS") == "GET, OPTIONS, POST");
}

BOOST_AUTO_TEST_CASE(test_max_params)
{
	BOOST_TEST(router.max_params() == 0u);
	router.get("/a/:b/:c", h1);
	BOOST_TEST(router.max_params() == 2u);
	router.get("/src/*filepath", h1);
	BOOST_TEST(router.max_params() == 2u);
	router.post("/x/:a/:b/:c/*d", h1);
	BOOST_TEST(router.max_params() == 4u);
}

BOOST_AUTO_TEST_CASE(test_static_over_param)
{
	router.get("/users/:id", h1);
	router.get("/users/me", h2);

	auto m = router.lookup("GET", "/users/me", params);
	BOOST_REQUIRE(m);
	BOOST_TEST(m.route->handler == h2);

	params.reset();
	m = router.lookup("GET", "/users/you", params);
	BOOST_REQUIRE(m);
	BOOST_TEST(m.route->handler == h1);
	BOOST_TEST(params.by_name("id") == "you");
}

BOOST_AUTO_TEST_CASE(test_bad_registration)
{
	BOOST_CHECK_THROW(router.handle("", "/x", h1), RouteError);
	BOOST_CHECK_THROW(router.get("", h1), RouteError);
	BOOST_CHECK_THROW(router.get("x", h1), RouteError);
	BOOST_CHECK_THROW(router.get("/x", nullptr), RouteError);
	BOOST_TEST(router.size() == 0u);
	BOOST_TEST(router.tree("GET") == nullptr);
}

BOOST_AUTO_TEST_CASE(test_failed_registration_leaves_no_tree)
{
	BOOST_CHECK_THROW(router.get("/:", h1), RouteError);
	BOOST_TEST(router.tree("GET") == nullptr);
	BOOST_TEST(router.methods().empty());
}

BOOST_AUTO_TEST_CASE(test_error_names_pattern)
{
	router.get("/src/*filepath", h1);
	try {
		router.get("/src/*other", h1);
		BOOST_FAIL("conflict not detected");
	} catch (RouteError& e) {
		BOOST_TEST(e.pattern() == "/src/*other");
		BOOST_TEST(std::string{ e.what() }.find("'/src/*other'") != std::string::npos);
	}
}

BOOST_AUTO_TEST_CASE(test_failed_lookup_leaves_no_params)
{
	router.get("/users/:id/posts", h1);

	BOOST_TEST(!router.lookup("GET", "/users/42/x", params));
	BOOST_TEST(params.empty());

	params.push("stale", "1");
	BOOST_TEST(!router.lookup("GET", "/users/42/posts/", params));
	BOOST_TEST(params.empty());

	BOOST_REQUIRE(router.lookup("GET", "/users/42/posts", params));
	BOOST_TEST(params.size() == 1u);
	BOOST_TEST(params.by_name("id") == "42");
}

BOOST_AUTO_TEST_CASE(test_duplicate_wildcard_name)
{
	BOOST_CHECK_THROW(router.get("/:id/x/:id", h1), RouteError);
	BOOST_TEST(router.tree("GET") == nullptr);
	BOOST_TEST(router.max_params() == 0u);
}

BOOST_AUTO_TEST_CASE(test_case_insensitive_per_method)
{
	router.get("/Hello", h1);

	auto fixed = router.find_case_insensitive_path("GET", "/hello", false);
	BOOST_REQUIRE(fixed);
	BOOST_TEST(*fixed == "/Hello");
	BOOST_TEST(!router.find_case_insensitive_path("POST", "/hello", true));
}

BOOST_AUTO_TEST_SUITE_END()
