#pragma once
#include "request_handler.hpp"
#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace burrow::test
{
// Writes its own name, counts the calls
class NamedHandler : public RequestHandler
{
public:
	explicit NamedHandler(std::string name):
		name{ std::move(name) }
	{}

	auto get_name() const noexcept -> string_view override { return name; }

	auto handle(Context& ctx) -> void override
	{
		++calls;
		ctx.out << name;
	}

	std::atomic<int> calls{ 0 };

private:
	const std::string name;
};

inline auto handler(std::string name)
{
	return std::make_shared<NamedHandler>(std::move(name));
}
}
