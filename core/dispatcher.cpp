#include "dispatcher.hpp"
#include "logger_imp.hpp"
#include "method.hpp"
#include "node.hpp"
#include "params.hpp"
#include "path.hpp"
#include "request.hpp"
#include "request_handler.hpp"
#include "router.hpp"
#include <ostream>
#include <utility>

namespace burrow
{
auto operator<<(std::ostream& stream, Outcome::Kind kind) -> std::ostream&
{
	switch (kind) {
	case Outcome::Kind::matched: return stream << "matched";
	case Outcome::Kind::redirect: return stream << "redirect";
	case Outcome::Kind::method_not_allowed: return stream << "method not allowed";
	case Outcome::Kind::not_found: return stream << "not found";
	}
	return stream << "unknown";
}

Dispatcher::Dispatcher(const Router& router, DispatchOptions opt):
	router{ router },
	opt{ std::move(opt) }
{
}

auto Dispatcher::dispatch(const Request& req, Params& params, Logger& lg) const -> Outcome
{
	const auto root = router.tree(req.method);
	if (root) {
		const auto m = root->get_value(req.path, params);
		if (m) {
			lg.debug("matched ", quoted(m.route->pattern), ' ', params);
			Outcome res;
			res.kind = Outcome::Kind::matched;
			res.status = Status::ok;
			res.route = m.route;
			return res;
		}
		params.reset();

		if (req.method != method::connect && req.path != "/") {
			const auto code = req.method == method::get || req.method == method::head
				? Status::moved_permanently
				: Status::permanent_redirect;

			if (m.tsr && opt.redirect_trailing_slash) {
				std::string target{ req.path };
				if (target.size() > 1 && target.back() == '/')
					target.pop_back();
				else
					target.push_back('/');
				lg.trace("trailing slash redirect to ", quoted(target));
				return redirect(code, std::move(target), req);
			}

			if (opt.redirect_fixed_path) {
				auto fixed = root->find_case_insensitive_path(clean_path(req.path),
					opt.redirect_trailing_slash);
				if (fixed) {
					lg.trace("fixed path redirect to ", quoted(*fixed));
					return redirect(code, std::move(*fixed), req);
				}
			}
		}
	}

	if (opt.handle_method_not_allowed) {
		auto allow = router.allowed(req.path, req.method);
		if (!allow.empty()) {
			lg.debug("method not allowed, allow: ", allow);
			Outcome res;
			res.kind = Outcome::Kind::method_not_allowed;
			res.status = Status::method_not_allowed;
			res.allow = std::move(allow);
			res.body = opt.body_405;
			return res;
		}
	}

	lg.debug("not found");
	Outcome res;
	res.body = opt.body_404;
	return res;
}

auto Dispatcher::serve(const Request& req, Params& params, std::ostream& out) const -> Outcome
{
	RequestLogger lg{ req.method, req.path };

	auto res = dispatch(req, params, lg);
	if (res.kind != Outcome::Kind::matched)
		return res;

	const auto& route = *res.route;
	HandlerLoggerGuard guard{ lg, route.handler->get_name() };
	RequestHandler::Context ctx{ req, route, params, lg, out };
	route.handler->handle(ctx);
	return res;
}

auto Dispatcher::redirect(Status code, std::string target, const Request& req) const -> Outcome
{
	if (!req.query.empty()) {
		target.push_back('?');
		target.append(req.query.data(), req.query.size());
	}

	Outcome res;
	res.kind = Outcome::Kind::redirect;
	res.status = code;
	res.location = std::move(target);
	return res;
}
}
