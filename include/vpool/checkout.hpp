#pragma once

#include <cassert>
#include "expected.hpp"
#include "pool_error.hpp"

namespace vpl {

// Owns one checked-out item and returns it to the pool
// when destroyed. The handle remembers the slot generation
// it was issued for, so if the pool reclaims the item first
// (release_all) the handle goes stale instead of releasing
// somebody else's checkout.
template <typename Pool>
class checkout
{
public:

	using value_type = typename Pool::value_type;

	checkout() = default;

	checkout(Pool* pool, value_type* item, slot_t slot, generation_t generation)
		: pool_{pool}
		, item_{item}
		, slot_{slot}
		, generation_{generation}
	{
	}

	checkout(checkout&& rhs) noexcept
		: pool_{rhs.pool_}
		, item_{rhs.item_}
		, slot_{rhs.slot_}
		, generation_{rhs.generation_}
	{
		rhs.pool_ = {};
		rhs.item_ = {};
	}

	auto operator=(checkout&& rhs) noexcept -> checkout&
	{
		if (this == &rhs) return *this;

		return_to_pool();

		pool_ = rhs.pool_;
		item_ = rhs.item_;
		slot_ = rhs.slot_;
		generation_ = rhs.generation_;
		rhs.pool_ = {};
		rhs.item_ = {};
		return *this;
	}

	checkout(const checkout& rhs) = delete;
	auto operator=(const checkout& rhs) -> checkout& = delete;

	~checkout()
	{
		return_to_pool();
	}

	// Returns the item early. The handle is empty afterwards
	// whatever the outcome.
	auto release() -> expected<slot_t, pool_error>
	{
		if (!item_)
		{
			return pool_error::not_a_member;
		}

		const auto pool{pool_};
		pool_ = {};
		item_ = {};

		return pool->release(slot_, generation_);
	}

	// False once the pool has reclaimed the item behind
	// this handle's back.
	auto is_current() const -> bool
	{
		return item_ && pool_->is_current(slot_, generation_);
	}

	auto get() const -> value_type* { return item_; }
	auto slot() const -> slot_t { return slot_; }
	auto generation() const -> generation_t { return generation_; }

	auto operator*() const -> value_type& { assert (item_); return *item_; }
	auto operator->() const -> value_type* { assert (item_); return item_; }

	explicit operator bool() const { return item_ != nullptr; }

private:

	auto return_to_pool() -> void
	{
		if (!item_) return;

		const auto result{release()};

		// Stale is the normal outcome when the pool was bulk
		// released while this handle was alive
		assert (result || result.get_error() == pool_error::stale);
		static_cast<void>(result);
	}

	Pool* pool_{};
	value_type* item_{};
	slot_t slot_{};
	generation_t generation_{};
};

} // vpl
