#include "echo.hpp"
#include "logger.hpp"
#include "params.hpp"
#include "request.hpp"
#include "route.hpp"
#include <ostream>

namespace burrow
{
string_view EchoHandler::get_name() const noexcept
{
	return "echo"sv;
}

void EchoHandler::handle(Context& ctx)
{
	ctx.out << ctx.route.method << ' ' << ctx.route.pattern << '\n';
	for (auto& p : ctx.params)
		ctx.out << "  " << p.key << " = " << p.value << '\n';
	if (!ctx.req.query.empty())
		ctx.out << "  ?" << ctx.req.query << '\n';
	ctx.lg.debug("echoed ", ctx.params.size(), " parameters");
}
}
