#pragma once

#include <cassert>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include "object_pool.hpp"
#include "pool_error.hpp"

namespace vpl {

struct registry_stats
{
	size_t pool_count{0};
	size_t total{0};
	size_t active{0};
	size_t free{0};
	std::map<std::string, pool_stats> pools;
};

namespace detail {

class registered_pool
{
public:

	virtual ~registered_pool() = default;
	virtual auto release_all() -> void = 0;
	virtual auto get_stats() const -> pool_stats = 0;
};

template <typename Pool>
class registered : public registered_pool
{
public:

	registered(std::unique_ptr<Pool> owned)
		: owned_{std::move(owned)}
		, pool_{owned_.get()}
	{
	}

	registered(Pool* pool)
		: pool_{pool}
	{
	}

	auto release_all() -> void override { pool_->release_all(); }
	auto get_stats() const -> pool_stats override { return pool_->get_stats(); }
	auto get() const -> Pool* { return pool_; }

private:

	std::unique_ptr<Pool> owned_;
	Pool* pool_{};
};

} // detail

// Named collection of pools of any type, used to end a
// frame for every pool at once and to collect diagnostics.
// A Pool is anything with release_all() and get_stats(),
// so object_pool and the typed pools both qualify.
//
// Pools made by create() are owned by the registry. Pools
// given to add() must outlive it, or be removed first.
//
// Not synchronized. Register everything before the
// registry is shared between threads.
class pool_registry
{
public:

	pool_registry() = default;
	pool_registry(const pool_registry&) = delete;
	auto operator=(const pool_registry&) -> pool_registry& = delete;

	// Returns the pool already registered under this name if
	// it has the requested type. The constructor arguments
	// are only used when a new pool is made. Throws
	// invalid_pool_name if the name is taken by a pool of
	// another type.
	template <typename Pool, typename... Args>
	auto create(const std::string& name, Args&&... args) -> Pool&
	{
		const auto pos{pools_.find(name)};

		if (pos != pools_.end())
		{
			return *checked_cast<Pool>(name, *pos->second);
		}

		auto pool{std::make_unique<Pool>(std::forward<Args>(args)...)};
		auto entry{std::make_unique<detail::registered<Pool>>(std::move(pool))};
		const auto out{entry->get()};

		pools_.emplace(name, std::move(entry));

		return *out;
	}

	// Register a pool the caller owns. Throws
	// invalid_pool_name if the name is taken.
	template <typename Pool>
	auto add(const std::string& name, Pool* pool) -> Pool&
	{
		assert (pool);

		if (contains(name))
		{
			throw invalid_pool_name{"pool_registry: '" + name + "' is already registered"};
		}

		pools_.emplace(name, std::make_unique<detail::registered<Pool>>(pool));

		return *pool;
	}

	// Null if there is no pool under this name. Throws
	// invalid_pool_name if there is one of another type.
	template <typename Pool>
	auto find(const std::string& name) const -> Pool*
	{
		const auto pos{pools_.find(name)};

		if (pos == pools_.end()) return nullptr;

		return checked_cast<Pool>(name, *pos->second);
	}

	// Owned pools are destroyed. Returns false if nothing
	// was registered under the name.
	auto remove(const std::string& name) -> bool
	{
		return pools_.erase(name) > 0;
	}

	auto contains(const std::string& name) const -> bool
	{
		return pools_.find(name) != pools_.end();
	}

	auto size() const -> size_t
	{
		return pools_.size();
	}

	auto release_all() -> void
	{
		for (auto& entry : pools_)
		{
			entry.second->release_all();
		}
	}

	auto get_stats() const -> registry_stats
	{
		registry_stats out;

		out.pool_count = pools_.size();

		for (const auto& [name, pool] : pools_)
		{
			const auto stats{pool->get_stats()};

			out.total += stats.total;
			out.active += stats.active;
			out.free += stats.free;
			out.pools.emplace(name, stats);
		}

		return out;
	}

private:

	template <typename Pool>
	static auto checked_cast(const std::string& name, detail::registered_pool& entry) -> Pool*
	{
		const auto typed{dynamic_cast<detail::registered<Pool>*>(&entry)};

		if (!typed)
		{
			throw invalid_pool_name{"pool_registry: '" + name + "' holds a pool of another type"};
		}

		return typed->get();
	}

	std::map<std::string, std::unique_ptr<detail::registered_pool>> pools_;
};

} // vpl
