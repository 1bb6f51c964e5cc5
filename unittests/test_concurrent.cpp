#include "dispatcher.hpp"
#include "logger_imp.hpp"
#include "params_pool.hpp"
#include "request.hpp"
#include "router.hpp"
#include "test_util.hpp"
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace burrow;
using burrow::test::handler;

namespace
{
constexpr int n_threads = 8;
constexpr int n_rounds = 2000;

struct SharedRouter
{
	SharedRouter()
	{
		router.get("/", handler("index"));
		router.get("/users/:id", handler("user"));
		router.get("/users/me", handler("me"));
		router.get("/users/:id/posts/:post", handler("post"));
		router.get("/src/*filepath", handler("src"));
		router.post("/users", handler("create"));
	}

	BaseLogger lg;
	Router router{ lg };
};
}

BOOST_FIXTURE_TEST_SUITE(concurrent_tests, SharedRouter)

BOOST_AUTO_TEST_CASE(test_parallel_lookups)
{
	std::atomic<int> failures{ 0 };
	std::vector<std::thread> threads;

	for (int t = 0; t < n_threads; ++t) {
		threads.emplace_back([this, t, &failures] {
			Params params{ router.max_params() };
			for (int i = 0; i < n_rounds; ++i) {
				const auto id = std::to_string(t * n_rounds + i);
				const auto path = "/users/" + id + "/posts/p" + id;

				params.reset();
				auto m = router.lookup("GET", path, params);
				if (!m || m.route->pattern != "/users/:id/posts/:post"
						|| params.by_name("id") != id
						|| params.by_name("post") != "p" + id)
					++failures;

				params.reset();
				m = router.lookup("GET", "/users/me", params);
				if (!m || m.route->pattern != "/users/me" || !params.empty())
					++failures;
			}
		});
	}
	for (auto& th : threads)
		th.join();

	BOOST_TEST(failures.load() == 0);
}

BOOST_AUTO_TEST_CASE(test_parallel_dispatch_with_pool)
{
	const Dispatcher dispatcher{ router, {} };
	ParamsPool pool{ router.max_params() };
	std::atomic<int> failures{ 0 };
	std::vector<std::thread> threads;

	for (int t = 0; t < n_threads; ++t) {
		threads.emplace_back([&, t] {
			BaseLogger tlg;
			for (int i = 0; i < n_rounds; ++i) {
				const auto file = "/f" + std::to_string(t) + "/" + std::to_string(i);
				const auto path = "/src" + file;

				auto params = pool.acquire();
				auto res = dispatcher.dispatch(Request{ "GET", path, {} }, *params, tlg);
				if (res.kind != Outcome::Kind::matched
						|| params->by_name("filepath") != file)
					++failures;

				res = dispatcher.dispatch(Request{ "GET", "/USERS/me", {} }, *params, tlg);
				if (res.kind != Outcome::Kind::redirect || res.location != "/users/me")
					++failures;

				res = dispatcher.dispatch(Request{ "PUT", "/users", {} }, *params, tlg);
				if (res.kind != Outcome::Kind::method_not_allowed
						|| res.allow != "OPTIONS, POST")
					++failures;
			}
		});
	}
	for (auto& th : threads)
		th.join();

	BOOST_TEST(failures.load() == 0);
	BOOST_TEST(pool.idle() <= static_cast<std::size_t>(n_threads));
	BOOST_TEST(pool.idle() >= 1u);
}

BOOST_AUTO_TEST_SUITE_END()
