#pragma once
#include "path_error.hpp"
#include "string_view.hpp"
#include "substring_map.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/algorithm/copy.hpp>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pathmux
{
template <typename T>
class PathMatch
{
public:
	PathMatch(std::string matched, std::string remaining, std::optional<T> value):
		m{ std::move(matched) },
		r{ std::move(remaining) },
		v{ std::move(value) }
	{}

	// registered prefix, or "/" if nothing but the default handler matched
	auto matched() const noexcept -> const std::string& { return m; }
	// part of the path after the matched prefix
	auto remaining() const noexcept -> const std::string& { return r; }
	auto value() const noexcept -> const std::optional<T>& { return v; }

private:
	std::string m;
	std::string r;
	std::optional<T> v;
};

// Dispatches a path to a handler by the longest registered prefix.
//
// This only matches a single level: "/foo" matches "/foo", "/foo/bar"
// and "/foobar" as well. Registering "/" sets the default handler,
// which is returned when no prefix matches.
//
// match() never locks and may run concurrently with add_prefix_path(),
// it sees the routes either before or after the registration.
template <typename T>
class PathMatcher: boost::noncopyable
{
public:
	static constexpr char separator = '/';

	PathMatcher() = default;

	// throws InvalidArgument if path is empty,
	// InvalidRoute if path ends with a separator
	auto add_prefix_path(std::string path, T handler) -> PathMatcher&;

	auto match(string_view path) const -> PathMatch<T>;

	// number of registered prefixes, the default handler is not counted
	auto size() const noexcept -> std::size_t { return paths.size(); }

private:
	// distinct lengths of registered paths, descending
	using Lengths = std::vector<std::size_t>;

	auto build_lengths() -> void;

	SubstringMap<T> paths;
	std::shared_ptr<const Lengths> lengths = std::make_shared<const Lengths>();
	std::shared_ptr<const T> default_handler;
	std::mutex write_mutex;
};

template <typename T>
auto PathMatcher<T>::add_prefix_path(std::string path, T handler) -> PathMatcher&
{
	if (path.empty())
		throw InvalidArgument{ "path not specified" };

	std::lock_guard<std::mutex> lock{ write_mutex };

	if (path.size() == 1 && path.front() == separator) {
		std::atomic_store(&default_handler, std::make_shared<const T>(std::move(handler)));
		return *this;
	}
	if (path.back() == separator)
		throw InvalidRoute{ "prefix path cannot end with " + std::string(1, separator) + ": " + path };

	paths.put(std::move(path), std::move(handler));
	build_lengths();

	return *this;
}

template <typename T>
auto PathMatcher<T>::match(string_view path) const -> PathMatch<T>
{
	const auto length = path.size();
	const auto current = std::atomic_load(&lengths);

	for (auto path_length: *current) {
		if (path_length == length) {
			if (auto next = paths.get(path))
				return { std::string{ path }, std::string{}, next->value() };
		} else if (path_length < length) {
			if (auto next = paths.get(path, path_length))
				return { next->key(), std::string{ path.substr(path_length) }, next->value() };
		}
	}

	std::optional<T> value;
	if (auto handler = std::atomic_load(&default_handler))
		value = *handler;
	return { std::string(1, separator), std::string{ path }, std::move(value) };
}

template <typename T>
auto PathMatcher<T>::build_lengths() -> void
{
	const auto keys = paths.keys();

	std::set<std::size_t, std::greater<>> distinct;
	boost::copy(keys | boost::adaptors::transformed(std::mem_fn(&std::string::size)),
		std::inserter(distinct, distinct.end()));

	std::atomic_store(&lengths,
		std::make_shared<const Lengths>(distinct.begin(), distinct.end()));
}
}
