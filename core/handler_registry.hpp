#pragma once
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <map>
#include <memory>
#include <vector>

namespace burrow
{
struct RequestHandler;

// Handlers a route file may refer to, by name
class HandlerRegistry: boost::noncopyable
{
public:
	HandlerRegistry() = default;

	// throws std::logic_error on a duplicate name
	void add(std::shared_ptr<RequestHandler> h);
	std::shared_ptr<RequestHandler> operator[](string_view name) const;

	auto names() const -> std::vector<string_view>;

private:
	std::map<string_view, std::shared_ptr<RequestHandler>> handlers;
};

// Registry with the built-in handlers
auto make_default_registry() -> std::unique_ptr<HandlerRegistry>;
}
