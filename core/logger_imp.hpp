#pragma once
#include "logger.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/log/core/record.hpp>
#include <boost/log/sources/logger.hpp>

namespace burrow
{
class LoggerImp: public Logger, boost::noncopyable
{
public:
	using Attribute = boost::log::attribute_set::iterator;

	struct AttrName
	{
		AttrName();

		boost::log::attribute_name lazy_message;
		boost::log::attribute_name severity;
		boost::log::attribute_name component;
		boost::log::attribute_name method;
		boost::log::attribute_name path;
		boost::log::attribute_name handler;
	};

	struct Message
	{
		const Fragment* first;
		const Fragment* last;
	};

	LoggerImp() = default;
	LoggerImp(const LoggerImp& rhs) = delete;
	virtual ~LoggerImp() = default;

	LoggerImp& operator=(const LoggerImp&) = delete;

	Attribute add(const boost::log::attribute_name& name,
		const boost::log::attribute& attr);
	// false if no sink is interested in the record
	bool open_message(Severity s);
	void push(const Fragment& f) noexcept;
	void finalize();

	static const AttrName attr_name;

protected:
	virtual void insert_attributes() = 0;

	boost::log::attribute_value_set& attributes() noexcept
	{
		return rec.attribute_values();
	}

private:
	boost::log::sources::logger lg;
	boost::log::record rec;
	Message msg{};
};

struct BaseLogger: LoggerImp
{
	void insert_attributes() override {}
};

struct GlobalLogger: BaseLogger
{
	GlobalLogger() = default;
	explicit GlobalLogger(string_view component) noexcept:
		component{ component }
	{}

	void insert_attributes() override;

	string_view component;
};

// One per request being dispatched; not shared between threads
struct RequestLogger: BaseLogger
{
	RequestLogger(string_view method, string_view path) noexcept:
		method{ method },
		path{ path }
	{}

	void insert_attributes() override;

	const string_view method;
	const string_view path;
	string_view handler;
};

struct HandlerLoggerGuard: boost::noncopyable
{
	HandlerLoggerGuard(RequestLogger& lg, string_view name) noexcept:
		lg{ lg }
	{
		lg.handler = name;
	}

	~HandlerLoggerGuard()
	{
		lg.handler = {};
	}

private:
	RequestLogger& lg;
};
}
