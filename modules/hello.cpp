#include "hello.hpp"
#include "logger.hpp"
#include <ostream>

namespace burrow
{
string_view HelloHandler::get_name() const noexcept
{
	return "hello"sv;
}

void HelloHandler::handle(Context& ctx)
{
	ctx.out << "It works!\n";
	ctx.lg.info("sending hello...");
}
}
