#pragma once

#include "object_pool.hpp"
#include "vector2.hpp"

namespace vpl {

// Pool of vector2 values. Checkouts come back zeroed unless
// coordinates are given.
template <typename Mutex = null_mutex>
class basic_vector2_pool
{
public:

	using pool_t = object_pool<vector2, void(double, double), Mutex>;
	using checkout_t = typename pool_t::checkout_t;

	static constexpr size_t DEFAULT_INITIAL_SIZE{100};

	basic_vector2_pool(size_t initial_size = DEFAULT_INITIAL_SIZE)
		: basic_vector2_pool{pool_options{initial_size, 0}}
	{
	}

	basic_vector2_pool(pool_options options)
		: pool_{make, reset, options}
	{
	}

	auto get(double x = 0.0, double y = 0.0) -> vector2& { return pool_.get(x, y); }
	auto checkout(double x = 0.0, double y = 0.0) -> checkout_t { return pool_.checkout(x, y); }
	auto release(const vector2& v) -> expected<slot_t, pool_error> { return pool_.release(v); }
	auto release_all() -> void { pool_.release_all(); }
	auto get_stats() const -> pool_stats { return pool_.get_stats(); }
	auto pool() -> pool_t& { return pool_; }
	auto pool() const -> const pool_t& { return pool_; }

private:

	static auto make() -> vector2 { return {}; }
	static auto reset(vector2& v, double x, double y) -> void { v.set(x, y); }

	pool_t pool_;
};

using vector2_pool = basic_vector2_pool<>;

} // vpl
