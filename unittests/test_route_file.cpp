#include "route_file.hpp"
#include "handler_registry.hpp"
#include "logger_imp.hpp"
#include "router.hpp"
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <initializer_list>
#include <ostream>
#include <string>

using namespace burrow;
using boost::unit_test::data::make;

namespace
{
struct BadSample
{
	string_view text;
	std::size_t error_pos;
};

using BadSampleList = std::initializer_list<BadSample>;

std::ostream &operator<<(std::ostream &stream, const BadSample &sample)
{
	return stream << "TEXT{\"" << sample.text << "\"} -> error at " << sample.error_pos;
}

BadSampleList bad_samples = {
	{ "get /x hello", 0 },
	{ "GET /a hello\nget /b hello", 13 },
	{ "GET x hello", 4 },
	{ "GET /x", 6 },
	{ "  GET /x hello extra", 15 },
	{ "GET /x 9lives", 7 },
};

struct RouteFileFixture
{
	auto load(string_view text)
	{
		return RouteFile{ std::string{ text }, "routes.conf" };
	}

	const std::unique_ptr<HandlerRegistry> handlers = make_default_registry();
	BaseLogger lg;
	Router router{ lg };
};

auto error_of(const RouteFile& file, Router& router, const HandlerRegistry& handlers)
{
	try {
		file.register_routes(router, handlers);
	} catch (RouteFile::Error& e) {
		return std::string{ e.what() };
	}
	return std::string{};
}
}

BOOST_FIXTURE_TEST_SUITE(route_file_tests, RouteFileFixture)

BOOST_AUTO_TEST_CASE(test_entries)
{
	auto file = load(
		"# routes\n"
		"GET /hello hello\n"
		"POST /users/:id  echo   # trailing comment\n"
		"\t \n"
		"ANY /echo/*path echo\r\n"
	);

	auto& entries = file.entries();
	BOOST_REQUIRE(entries.size() == 3u);

	BOOST_TEST(entries[0].method == "GET");
	BOOST_TEST(entries[0].pattern == "/hello");
	BOOST_TEST(entries[0].handler == "hello");
	BOOST_TEST(entries[0].line == 2u);

	BOOST_TEST(entries[1].method == "POST");
	BOOST_TEST(entries[1].pattern == "/users/:id");
	BOOST_TEST(entries[1].handler == "echo");
	BOOST_TEST(entries[1].line == 3u);

	BOOST_TEST(entries[2].method == "ANY");
	BOOST_TEST(entries[2].pattern == "/echo/*path");
	BOOST_TEST(entries[2].line == 5u);
}

BOOST_AUTO_TEST_CASE(test_empty)
{
	BOOST_TEST(load("").entries().empty());
	BOOST_TEST(load("\n\n# nothing here\n").entries().empty());
}

BOOST_AUTO_TEST_CASE(test_register)
{
	auto file = load(
		"GET /hello hello\n"
		"POST /users/:id echo\n"
		"ANY /echo/*path echo\n"
	);
	file.register_routes(router, *handlers);

	BOOST_TEST(router.size() == 11u);

	Params params;
	auto m = router.lookup("POST", "/users/7", params);
	BOOST_REQUIRE(m);
	BOOST_TEST(m.route->handler == (*handlers)["echo"]);
	BOOST_TEST(params.by_name("id") == "7");

	params.reset();
	BOOST_REQUIRE(router.lookup("TRACE", "/echo/x", params));
	BOOST_TEST(params.by_name("path") == "/x");
}

BOOST_DATA_TEST_CASE(test_syntax_errors, make(bad_samples), sample)
{
	try {
		load(sample.text);
		BOOST_FAIL("error not detected");
	} catch (RouteFile::SyntaxError& e) {
		BOOST_TEST(e.where() == sample.error_pos);
		BOOST_TEST(std::string{ e.what() }.find("routes.conf") != std::string::npos);
	}
}

BOOST_AUTO_TEST_CASE(test_unknown_handler)
{
	auto file = load("GET /a hello\nGET /b nope\n");
	auto msg = error_of(file, router, *handlers);
	BOOST_TEST(msg.find("unknown handler 'nope'") != std::string::npos);
	BOOST_TEST(msg.find("line 2") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_route_conflict)
{
	auto file = load("GET /users/:id hello\nGET /users/:name echo\n");
	auto msg = error_of(file, router, *handlers);
	BOOST_TEST(msg.find("line 2") != std::string::npos);
	BOOST_TEST(msg.find("conflicts with existing wildcard") != std::string::npos);
	BOOST_TEST(router.size() == 1u);
}

BOOST_AUTO_TEST_CASE(test_missing_file)
{
	BOOST_CHECK_THROW(load_route_file("/nonexistent/burrow/routes.conf"), RouteFile::Error);
}

BOOST_AUTO_TEST_SUITE_END()
