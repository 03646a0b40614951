#pragma once
#include "string_view.hpp"
#include <boost/container_hash/hash.hpp>
#include <boost/core/noncopyable.hpp>
#include <boost/unordered_map.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pathmux
{
// String keyed map which can be probed by a prefix of a string
// without building a temporary key.
//
// Readers never lock: every put publishes a new immutable table,
// a reader works on the table it loaded, and a Match keeps it alive.
template <typename T>
class SubstringMap: boost::noncopyable
{
	struct Hash
	{
		auto operator()(string_view s) const noexcept -> std::size_t
		{
			return boost::hash_range(s.begin(), s.end());
		}
	};

	struct Equal
	{
		auto operator()(string_view lhs, string_view rhs) const noexcept -> bool
		{
			return lhs == rhs;
		}
	};

	using Table = boost::unordered_map<std::string, T, Hash, Equal>;

public:
	class Match
	{
	public:
		Match(std::shared_ptr<const Table> table, typename Table::const_iterator it) noexcept:
			table{ std::move(table) },
			it{ it }
		{}

		auto key() const noexcept -> const std::string& { return it->first; }
		auto value() const noexcept -> const T& { return it->second; }

	private:
		std::shared_ptr<const Table> table;
		typename Table::const_iterator it;
	};

	SubstringMap() = default;

	auto put(std::string key, T value) -> void;

	auto get(string_view key) const -> std::optional<Match>;
	// looks up the first length characters of key
	auto get(string_view key, std::size_t length) const -> std::optional<Match>;

	auto keys() const -> std::vector<std::string>;
	auto size() const noexcept -> std::size_t;

private:
	auto snapshot() const noexcept -> std::shared_ptr<const Table>
	{
		return std::atomic_load(&table);
	}

	std::shared_ptr<const Table> table = std::make_shared<const Table>();
	std::mutex write_mutex;
};

template <typename T>
auto SubstringMap<T>::put(std::string key, T value) -> void
{
	std::lock_guard<std::mutex> lock{ write_mutex };

	auto next = std::make_shared<Table>(*snapshot());
	auto found = next->find(key);
	if (found != next->end())
		found->second = std::move(value);
	else
		next->emplace(std::move(key), std::move(value));

	std::atomic_store(&table, std::shared_ptr<const Table>{ std::move(next) });
}

template <typename T>
auto SubstringMap<T>::get(string_view key) const -> std::optional<Match>
{
	auto current = snapshot();
	auto found = current->find(key, Hash{}, Equal{});
	if (found == current->end())
		return std::nullopt;
	return Match{ std::move(current), found };
}

template <typename T>
auto SubstringMap<T>::get(string_view key, std::size_t length) const -> std::optional<Match>
{
	return get(key.substr(0, length));
}

template <typename T>
auto SubstringMap<T>::keys() const -> std::vector<std::string>
{
	auto current = snapshot();

	std::vector<std::string> result;
	result.reserve(current->size());
	for (auto& entry: *current)
		result.push_back(entry.first);
	return result;
}

template <typename T>
auto SubstringMap<T>::size() const noexcept -> std::size_t
{
	return snapshot()->size();
}
}
