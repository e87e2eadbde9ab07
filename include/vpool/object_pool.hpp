#pragma once

#include <cassert>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "checkout.hpp"
#include "expected.hpp"
#include "pool_error.hpp"
#include "signal.hpp"

namespace vpl {

// Lock policy for pools that are only touched from one
// thread. Satisfies BasicLockable.
struct null_mutex
{
	auto lock() -> void {}
	auto unlock() -> void {}
};

struct pool_options
{
	// Instances built up front. Not counted as growth.
	size_t initial_size{0};

	// Ceiling on the total number of instances. Zero means
	// the pool grows without limit.
	size_t max_size{0};
};

struct pool_stats
{
	size_t total{0};
	size_t active{0};
	size_t free{0};

	// Instances built because the free list was empty
	size_t growth_count{0};

	// Lifetime counters
	size_t created{0};
	size_t reused{0};
	size_t released{0};
	size_t rejected_releases{0};

	auto utilization() const -> double
	{
		const auto checkouts{created + reused};
		return checkouts > 0 ? double(reused) / double(checkouts) : 0.0;
	}

	// Reuses per release. Checkouts of instances built up
	// front count as reuses, so this can exceed 1.
	auto efficiency() const -> double
	{
		return double(reused) / double(released > 0 ? released : 1);
	}
};

template <typename T, typename ResetSignature = void(), typename Mutex = null_mutex>
class object_pool;

// Owns every T it ever constructs and hands them out for
// reuse. Each instance lives in a slot tagged free or
// active. Instances are never destroyed before the pool,
// so references stay valid across growth.
//
// The reset function receives the arguments given to get()
// and must overwrite every observable field of the item.
template <typename T, typename... ResetArgs, typename Mutex>
class object_pool<T, void(ResetArgs...), Mutex>
{
public:

	using value_type = T;
	using make_fn_t = std::function<T()>;
	using reset_fn_t = std::function<void(T&, ResetArgs...)>;
	using checkout_t = vpl::checkout<object_pool>;

	object_pool(make_fn_t make_fn, reset_fn_t reset_fn, size_t initial_size = 0)
		: object_pool{std::move(make_fn), std::move(reset_fn), pool_options{initial_size, 0}}
	{
	}

	object_pool(make_fn_t make_fn, reset_fn_t reset_fn, pool_options options)
		: make_fn_{std::move(make_fn)}
		, reset_fn_{std::move(reset_fn)}
		, max_size_{options.max_size}
	{
		assert (make_fn_);
		assert (reset_fn_);

		reserve(options.initial_size);
	}

	object_pool(const object_pool&) = delete;
	object_pool(object_pool&&) = delete;
	auto operator=(const object_pool&) -> object_pool& = delete;
	auto operator=(object_pool&&) -> object_pool& = delete;

	// Check out an item in its freshly reset state. Throws
	// pool_exhausted only if a ceiling is configured.
	auto get(ResetArgs... args) -> T&
	{
		auto result{try_get(args...)};

		if (!result)
		{
			throw pool_exhausted{"object_pool: ceiling of " + std::to_string(max_size_) + " instances reached"};
		}

		return *result.get_value();
	}

	auto try_get(ResetArgs... args) -> expected<T*, pool_error>
	{
		const auto result{acquire(args...)};

		emit(result.event, result.stats);

		if (!result.item)
		{
			return pool_error::exhausted;
		}

		return result.item;
	}

	// Like get() but the item comes back automatically when
	// the returned handle is destroyed.
	auto checkout(ResetArgs... args) -> checkout_t
	{
		const auto result{acquire(args...)};

		emit(result.event, result.stats);

		if (!result.item)
		{
			throw pool_exhausted{"object_pool: ceiling of " + std::to_string(max_size_) + " instances reached"};
		}

		return checkout_t{this, result.item, result.slot, result.generation};
	}

	auto release(const T& item) -> expected<slot_t, pool_error>
	{
		std::unique_lock lock{mutex_};

		const auto pos{index_.find(&item)};

		if (pos == index_.end())
		{
			return reject(std::move(lock), pool_error::not_a_member);
		}

		return release_unlocked(std::move(lock), pos->second);
	}

	auto release(slot_t slot) -> expected<slot_t, pool_error>
	{
		std::unique_lock lock{mutex_};

		if (slot >= slots_.size())
		{
			return reject(std::move(lock), pool_error::not_a_member);
		}

		return release_unlocked(std::move(lock), slot);
	}

	// Release a specific checkout of the slot. If the slot
	// was released since the generation was issued the call
	// is a no-op that reports stale. Stale results are not
	// counted as rejected releases.
	auto release(slot_t slot, generation_t generation) -> expected<slot_t, pool_error>
	{
		std::unique_lock lock{mutex_};

		if (slot >= slots_.size())
		{
			return reject(std::move(lock), pool_error::not_a_member);
		}

		if (slots_[slot].generation != generation)
		{
			return pool_error::stale;
		}

		return release_unlocked(std::move(lock), slot);
	}

	// Every item that was active before the call is free
	// after it.
	auto release_all() -> void
	{
		std::lock_guard lock{mutex_};

		if (active_count_ == 0) return;

		for (slot_t slot{0}; slot < slots_.size(); slot++)
		{
			if (slots_[slot].state == slot_state::active)
			{
				make_free(slot);
			}
		}

		assert (active_count_ == 0);
		assert (free_.size() == slots_.size());
	}

	// Build free instances until the pool holds at least
	// `size` in total. Never goes past the ceiling. The
	// factory runs with the lock released.
	auto reserve(size_t size) -> void
	{
		std::unique_lock lock{mutex_};

		const auto target{clamp_to_ceiling(size)};

		while (slots_.size() + pending_ < target)
		{
			auto item{build(lock)};
			free_.push_back(adopt(std::move(item), slot_state::free));
		}
	}

	auto get_stats() const -> pool_stats
	{
		std::lock_guard lock{mutex_};
		return stats_unlocked();
	}

	auto owns(const T& item) const -> bool
	{
		std::lock_guard lock{mutex_};
		return index_.find(&item) != index_.end();
	}

	auto is_active(const T& item) const -> bool
	{
		std::lock_guard lock{mutex_};
		const auto pos{index_.find(&item)};
		return pos != index_.end() && slots_[pos->second].state == slot_state::active;
	}

	auto is_current(slot_t slot, generation_t generation) const -> bool
	{
		std::lock_guard lock{mutex_};
		return slot < slots_.size() && slots_[slot].state == slot_state::active && slots_[slot].generation == generation;
	}

	auto slot_of(const T& item) const -> std::optional<slot_t>
	{
		std::lock_guard lock{mutex_};
		const auto pos{index_.find(&item)};
		if (pos == index_.end()) return std::nullopt;
		return pos->second;
	}

	auto generation_of(slot_t slot) const -> std::optional<generation_t>
	{
		std::lock_guard lock{mutex_};
		if (slot >= slots_.size()) return std::nullopt;
		return slots_[slot].generation;
	}

	// Throws invalid_slot unless the slot is checked out.
	auto at(slot_t slot) -> T&
	{
		std::lock_guard lock{mutex_};

		if (slot >= slots_.size())
		{
			throw invalid_slot{"object_pool: slot " + std::to_string(slot) + " out of range"};
		}

		if (slots_[slot].state != slot_state::active)
		{
			throw invalid_slot{"object_pool: slot " + std::to_string(slot) + " is not checked out"};
		}

		return *slots_[slot].item;
	}

	// Number of free instances
	auto size() const -> size_t
	{
		std::lock_guard lock{mutex_};
		return free_.size();
	}

	auto active_count() const -> size_t
	{
		std::lock_guard lock{mutex_};
		return active_count_;
	}

	auto capacity() const -> size_t
	{
		std::lock_guard lock{mutex_};
		return slots_.size();
	}

	auto max_size() const -> size_t { return max_size_; }

	// Observers must be connected before the pool is shared
	// between threads. The signals themselves are not locked.
	auto grew() -> signal<const pool_stats&>& { return grew_; }
	auto exhausted() -> signal<const pool_stats&>& { return exhausted_; }
	auto release_rejected() -> signal<pool_error>& { return release_rejected_; }

private:

	enum class slot_state { free, active };

	enum class pool_event { none, grew, exhausted };

	struct slot_record
	{
		std::unique_ptr<T> item;
		slot_state state{slot_state::free};
		generation_t generation{0};
	};

	struct acquire_result
	{
		T* item{};
		slot_t slot{};
		generation_t generation{};
		pool_event event{pool_event::none};
		pool_stats stats;
	};

	// The slot is claimed before the reset runs, so a reset
	// that checks out from this same pool gets a different
	// instance. Neither the factory nor the reset runs with
	// the lock held.
	auto acquire(ResetArgs... args) -> acquire_result
	{
		std::unique_lock lock{mutex_};

		acquire_result out;

		if (free_.empty())
		{
			if (at_ceiling())
			{
				out.event = pool_event::exhausted;
				out.stats = stats_unlocked();
				return out;
			}

			auto item{build(lock)};

			out.slot = adopt(std::move(item), slot_state::active);
			out.event = pool_event::grew;
			growth_count_++;
		}
		else
		{
			out.slot = free_.back();
			free_.pop_back();

			assert (slots_[out.slot].state == slot_state::free);

			slots_[out.slot].state = slot_state::active;
			reused_++;
		}

		active_count_++;

		out.item = slots_[out.slot].item.get();
		out.generation = slots_[out.slot].generation;

		lock.unlock();

		try
		{
			reset_fn_(*out.item, args...);
		}
		catch (...)
		{
			lock.lock();
			unclaim(out.slot, out.generation, out.event == pool_event::grew);
			throw;
		}

		if (out.event == pool_event::grew)
		{
			out.stats = get_stats();
		}

		return out;
	}

	// Undo a claim whose reset threw. The slot goes back on
	// top of the free list with its generation unchanged.
	// An instance built for the claim stays in the pool and
	// still counts as growth. Nothing to undo if the slot was
	// released while the reset was running.
	auto unclaim(slot_t slot, generation_t generation, bool grew) -> void
	{
		auto& record{slots_[slot]};

		if (record.state != slot_state::active || record.generation != generation) return;

		record.state = slot_state::free;
		active_count_--;

		if (!grew)
		{
			reused_--;
		}

		free_.push_back(slot);
	}

	auto release_unlocked(std::unique_lock<Mutex> lock, slot_t slot) -> expected<slot_t, pool_error>
	{
		if (slots_[slot].state == slot_state::free)
		{
			return reject(std::move(lock), pool_error::already_free);
		}

		make_free(slot);

		return slot;
	}

	auto make_free(slot_t slot) -> void
	{
		auto& record{slots_[slot]};

		assert (record.state == slot_state::active);

		record.state = slot_state::free;
		record.generation++;
		active_count_--;
		released_++;
		free_.push_back(slot);
	}

	auto reject(std::unique_lock<Mutex> lock, pool_error error) -> expected<slot_t, pool_error>
	{
		rejected_releases_++;
		lock.unlock();
		release_rejected_(error);
		return error;
	}

	// Run the factory with the lock released. The instance
	// counts against the ceiling while it is being built.
	auto build(std::unique_lock<Mutex>& lock) -> std::unique_ptr<T>
	{
		pending_++;
		lock.unlock();

		std::unique_ptr<T> item;

		try
		{
			item = std::make_unique<T>(make_fn_());
		}
		catch (...)
		{
			lock.lock();
			pending_--;
			throw;
		}

		lock.lock();
		pending_--;

		return item;
	}

	// Give a freshly built instance a slot. The caller pushes
	// free slots onto the free list, which has room for every
	// slot so that push cannot throw.
	auto adopt(std::unique_ptr<T> item, slot_state state) -> slot_t
	{
		assert (slots_.size() < std::numeric_limits<slot_t>::max());

		if (free_.capacity() <= slots_.size())
		{
			free_.reserve(2 * slots_.size() + 1);
		}

		const auto slot{static_cast<slot_t>(slots_.size())};
		const auto ptr{item.get()};

		slot_record record;
		record.item = std::move(item);
		record.state = state;
		slots_.push_back(std::move(record));

		try
		{
			index_.emplace(ptr, slot);
		}
		catch (...)
		{
			slots_.pop_back();
			throw;
		}

		created_++;

		return slot;
	}

	auto clamp_to_ceiling(size_t size) const -> size_t
	{
		if (max_size_ == 0) return size;
		return size < max_size_ ? size : max_size_;
	}

	auto at_ceiling() const -> bool
	{
		return max_size_ > 0 && slots_.size() + pending_ >= max_size_;
	}

	auto stats_unlocked() const -> pool_stats
	{
		pool_stats out;
		out.total = slots_.size();
		out.active = active_count_;
		out.free = free_.size();
		out.growth_count = growth_count_;
		out.created = created_;
		out.reused = reused_;
		out.released = released_;
		out.rejected_releases = rejected_releases_;
		return out;
	}

	auto emit(pool_event e, const pool_stats& stats) -> void
	{
		switch (e)
		{
			case pool_event::grew: grew_(stats); break;
			case pool_event::exhausted: exhausted_(stats); break;
			case pool_event::none: break;
		}
	}

	make_fn_t make_fn_;
	reset_fn_t reset_fn_;
	size_t max_size_{0};
	std::vector<slot_record> slots_;
	std::vector<slot_t> free_;
	std::unordered_map<const T*, slot_t> index_;
	size_t pending_{0};
	size_t active_count_{0};
	size_t growth_count_{0};
	size_t created_{0};
	size_t reused_{0};
	size_t released_{0};
	size_t rejected_releases_{0};
	mutable Mutex mutex_;
	signal<const pool_stats&> grew_;
	signal<const pool_stats&> exhausted_;
	signal<pool_error> release_rejected_;
};

template <typename T, typename ResetSignature = void()>
using synchronized_pool = object_pool<T, ResetSignature, std::mutex>;

} // vpl
