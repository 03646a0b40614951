#include "dispatcher.hpp"
#include <boost/asio/post.hpp>
#include <boost/assert.hpp>
#include <exception>
#include <future>
#include <iostream>

Dispatcher::Worker::Worker(unsigned id):
	ctx{ 1 },
	lg{ id },
	work{ make_work_guard(ctx) },
	thread{ [this] { run(); } }
{
}

Dispatcher::Worker::~Worker()
{
	work.reset();
	thread.join();
}

auto Dispatcher::Worker::run() noexcept -> void
{
	log<Logger::Severity::debug>("worker started");

	while (!ctx.stopped()) {
		try {
			ctx.run();
		} catch (std::exception& e) {
			log<Logger::Severity::error>(e.what());
		}
	}

	log<Logger::Severity::debug>("worker finished");
}

// a failing sink must not take the thread down
template <Logger::Severity S, typename... Args>
auto Dispatcher::Worker::log(const Args&... args) noexcept -> void
{
	try {
		lg.message<S>(args...);
	} catch (std::exception& e) {
		std::cerr << "worker #" << lg.id << ": logging failed: " << e.what() << std::endl;
	}
}

Dispatcher::Dispatcher(const RouteTable& table, unsigned n_workers, GlobalLogger& lg):
	table{ table },
	lg{ lg }
{
	BOOST_ASSERT(n_workers > 0);

	workers.reserve(n_workers);
	for (unsigned id = 1; id <= n_workers; ++id)
		workers.push_back(std::make_unique<Worker>(id));

	lg.debug("dispatcher started with ", n_workers, " workers");
}

Dispatcher::~Dispatcher()
{
	workers.clear();

	lg.trace("dispatcher finished");
}

auto Dispatcher::resolve(const std::vector<std::string>& paths) -> std::vector<RouteTable::Match>
{
	using Task = std::packaged_task<RouteTable::Match()>;

	std::vector<std::future<RouteTable::Match>> pending;
	pending.reserve(paths.size());
	for (std::size_t i = 0; i < paths.size(); ++i) {
		auto& worker = *workers[i % workers.size()];
		auto task = std::make_shared<Task>([this, &worker, path = paths[i]]
		{
			auto m = table.resolve(path);
			worker.lg.resolution(path, " -> ", m.matched(), " ",
				m.value() ? string_view{ *m.value() } : "-"sv);
			return m;
		});
		pending.push_back(task->get_future());
		boost::asio::post(worker.ctx, [task] { (*task)(); });
	}

	// no task of this call is left queued when a get() throws
	for (auto& f: pending)
		f.wait();

	std::vector<RouteTable::Match> result;
	result.reserve(pending.size());
	for (auto& f: pending)
		result.push_back(f.get());

	lg.trace("resolved ", result.size(), " paths");
	return result;
}
