#define BOOST_TEST_MODULE burrow tests
#define BOOST_TEST_MAIN
#include <boost/log/core/core.hpp>
#include <boost/test/unit_test.hpp>

struct GlobalFixture
{
	GlobalFixture()
	{
		auto core = boost::log::core::get();
		core->remove_all_sinks();
		core->set_logging_enabled(false);
	}
};

BOOST_TEST_GLOBAL_FIXTURE(GlobalFixture);
