#pragma once
#include "logger.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/log/attributes/attribute_set.hpp>
#include <boost/log/core/record.hpp>

class LoggerImp: public Logger, boost::noncopyable
{
public:
	struct AttrName
	{
		AttrName();

		boost::log::attribute_name lazy_message;
		boost::log::attribute_name time;
		boost::log::attribute_name severity;
		boost::log::attribute_name source;
		boost::log::attribute_name worker;
	};

	struct Message
	{
		BasePrinter* first;
		BasePrinter* last;
	};

	LoggerImp() = default;
	LoggerImp(const LoggerImp& rhs) = delete;
	virtual ~LoggerImp() = default;

	LoggerImp& operator=(const LoggerImp&) = delete;

	// false if no sink accepts the record
	bool open_message(Severity s);
	// timestamped record, only the resolution sink accepts it
	bool open_stamped();
	void push(BasePrinter& p) noexcept;
	void finalize();

	static const AttrName attr_name;

protected:
	virtual void insert_attributes(boost::log::attribute_set& attrs) = 0;

private:
	bool open_internal(boost::log::attribute_set& attrs);

	boost::log::record rec;
	Message msg{};
};

struct BaseLogger: LoggerImp
{
	void insert_attributes(boost::log::attribute_set&) override {}
};

struct GlobalLogger: BaseLogger
{
	void insert_attributes(boost::log::attribute_set& attrs) override;

	// route file being loaded
	string_view source;
};

struct SourceLoggerGuard: boost::noncopyable
{
	SourceLoggerGuard(GlobalLogger& lg, string_view name) noexcept:
		lg{ lg }
	{
		lg.source = name;
	}

	~SourceLoggerGuard()
	{
		lg.source = {};
	}

private:
	GlobalLogger& lg;
};

struct WorkerLogger: BaseLogger
{
	explicit WorkerLogger(unsigned id) noexcept:
		id{ id }
	{}

	void insert_attributes(boost::log::attribute_set& attrs) override;

	const unsigned id;
};
