#pragma once

#include "request_handler.hpp"

namespace burrow
{
// Prints the matched pattern and the bound parameters
struct EchoHandler: RequestHandler
{
	EchoHandler() = default;
	~EchoHandler() = default;

	string_view get_name() const noexcept override;

	void handle(Context& ctx) override;
};
}
