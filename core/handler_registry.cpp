#include "handler_registry.hpp"
#include "request_handler.hpp"
#include "echo.hpp"
#include "hello.hpp"
#include <stdexcept>
#include <string>

namespace burrow
{
void HandlerRegistry::add(std::shared_ptr<RequestHandler> h)
{
	const auto name = h->get_name();
	if (!handlers.emplace(name, std::move(h)).second)
		throw std::logic_error{ "handler '" + std::string{ name } + "' is already registered" };
}

std::shared_ptr<RequestHandler> HandlerRegistry::operator[](string_view name) const
{
	auto found = handlers.find(name);
	return found == handlers.end() ? nullptr : found->second;
}

auto HandlerRegistry::names() const -> std::vector<string_view>
{
	std::vector<string_view> res;
	res.reserve(handlers.size());
	for (auto& h : handlers)
		res.push_back(h.first);
	return res;
}

auto make_default_registry() -> std::unique_ptr<HandlerRegistry>
{
	auto reg = std::make_unique<HandlerRegistry>();
	reg->add(std::make_shared<HelloHandler>());
	reg->add(std::make_shared<EchoHandler>());
	return reg;
}
}
