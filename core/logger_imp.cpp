#include "logger_imp.hpp"
#include <boost/log/attributes/attribute_value_impl.hpp>

using boost::log::attributes::make_attribute_value;

namespace burrow
{
const LoggerImp::AttrName LoggerImp::attr_name{};

auto LoggerImp::add(const boost::log::attribute_name& name,
	const boost::log::attribute& attr) -> Attribute
{
	auto r = lg.add_attribute(name, attr);
	return r.first;
}

bool LoggerImp::open_message(Severity s)
{
	rec = lg.open_record();
	if (!rec)
		return false;

	insert_attributes();
	attributes().insert(attr_name.severity, make_attribute_value(s));
	msg = {};
	return true;
}

void LoggerImp::push(const Fragment& f) noexcept
{
	const auto p = &f;
	if (!msg.first)
		msg.first = p;
	if (msg.last)
		msg.last->next = p;
	msg.last = p;
}

void LoggerImp::finalize()
{
	attributes().insert(attr_name.lazy_message, make_attribute_value(msg));
	lg.push_record(std::move(rec));
}

void GlobalLogger::insert_attributes()
{
	if (!component.empty())
		attributes().insert(attr_name.component, make_attribute_value(component));
}

void RequestLogger::insert_attributes()
{
	BaseLogger::insert_attributes();

	attributes().insert(attr_name.method, make_attribute_value(method));
	attributes().insert(attr_name.path, make_attribute_value(path));
	if (!handler.empty())
		attributes().insert(attr_name.handler, make_attribute_value(handler));
}

LoggerImp::AttrName::AttrName():
	lazy_message{"LazyMessage"},
	severity{"Severity"},
	component{"Component"},
	method{"Method"},
	path{"Path"},
	handler{"RequestHandler"}
{
}
}
