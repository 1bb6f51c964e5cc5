#pragma once
#include "options.hpp"

namespace burrow::logs
{
// Console sink until the options are known
void preinit();
// throws std::runtime_error if the level is above BURROW_LOG_LEVEL
void init(const Options::Log& opt);
}
