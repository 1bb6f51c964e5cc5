#pragma once
#include "string_view.hpp"

namespace burrow
{
struct Request
{
	string_view method;
	string_view path;
	string_view query;
};
}
