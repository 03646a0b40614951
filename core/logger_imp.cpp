#include "logger_imp.hpp"
#include <boost/log/attributes/attribute_value_impl.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/core/core.hpp>

using boost::log::attributes::constant;
using boost::log::attributes::make_attribute_value;

const LoggerImp::AttrName LoggerImp::attr_name{};

// filters see the attributes inserted here
bool LoggerImp::open_internal(boost::log::attribute_set& attrs)
{
	insert_attributes(attrs);

	rec = boost::log::core::get()->open_record(attrs);
	if (!rec)
		return false;

	msg = {};
	return true;
}

bool LoggerImp::open_message(Severity s)
{
	boost::log::attribute_set attrs;
	attrs.insert(attr_name.severity, constant<Severity>{ s });
	return open_internal(attrs);
}

bool LoggerImp::open_stamped()
{
	boost::log::attribute_set attrs;
	attrs.insert(attr_name.time, boost::log::attributes::local_clock{});
	return open_internal(attrs);
}

void LoggerImp::push(BasePrinter& p) noexcept
{
	const auto next = &p;
	if (!msg.first)
		msg.first = next;
	if (msg.last)
		msg.last->next = next;
	msg.last = next;
}

void LoggerImp::finalize()
{
	rec.attribute_values().insert(attr_name.lazy_message, make_attribute_value(msg));
	boost::log::core::get()->push_record(std::move(rec));
}

void GlobalLogger::insert_attributes(boost::log::attribute_set& attrs)
{
	if (!source.empty())
		attrs.insert(attr_name.source, constant<string_view>{ source });
}

void WorkerLogger::insert_attributes(boost::log::attribute_set& attrs)
{
	attrs.insert(attr_name.worker, constant<unsigned>{ id });
}

LoggerImp::AttrName::AttrName():
	lazy_message{ "LazyMessage" },
	time{ "TimeStamp" },
	severity{ "Severity" },
	source{ "Source" },
	worker{ "Worker" }
{
}
