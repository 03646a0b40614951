#pragma once
#include "logger_imp.hpp"
#include "route_table.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/core/noncopyable.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Resolves paths against a route table on a pool of worker threads.
// Each worker owns its event loop and logger, paths are spread round-robin.
class Dispatcher: boost::noncopyable
{
public:
	Dispatcher(const RouteTable& table, unsigned n_workers, GlobalLogger& lg);
	~Dispatcher();

	// Results follow the order of paths. If a task fails, its exception is
	// rethrown once every task of the call has finished.
	auto resolve(const std::vector<std::string>& paths) -> std::vector<RouteTable::Match>;

	auto worker_count() const noexcept -> unsigned
	{
		return static_cast<unsigned>(workers.size());
	}

private:
	class Worker: boost::noncopyable
	{
	public:
		explicit Worker(unsigned id);
		~Worker();

		boost::asio::io_context ctx;
		WorkerLogger lg;

	private:
		auto run() noexcept -> void;
		template <Logger::Severity S, typename... Args>
		auto log(const Args&... args) noexcept -> void;

		boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
		std::thread thread;
	};

	const RouteTable& table;
	GlobalLogger& lg;
	std::vector<std::unique_ptr<Worker>> workers;
};
