#pragma once

#include "request_handler.hpp"

namespace burrow
{
struct HelloHandler: RequestHandler
{
	HelloHandler() = default;
	~HelloHandler() = default;

	string_view get_name() const noexcept override;

	void handle(Context& ctx) override;
};
}
