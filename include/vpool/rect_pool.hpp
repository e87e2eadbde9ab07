#pragma once

#include "object_pool.hpp"
#include "rect.hpp"

namespace vpl {

template <typename Mutex = null_mutex>
class basic_rect_pool
{
public:

	using pool_t = object_pool<rect, void(double, double, double, double), Mutex>;
	using checkout_t = typename pool_t::checkout_t;

	static constexpr size_t DEFAULT_INITIAL_SIZE{50};

	basic_rect_pool(size_t initial_size = DEFAULT_INITIAL_SIZE)
		: basic_rect_pool{pool_options{initial_size, 0}}
	{
	}

	basic_rect_pool(pool_options options)
		: pool_{make, reset, options}
	{
	}

	auto get(double x = 0.0, double y = 0.0, double width = 0.0, double height = 0.0) -> rect& {
		return pool_.get(x, y, width, height);
	}
	auto checkout(double x = 0.0, double y = 0.0, double width = 0.0, double height = 0.0) -> checkout_t {
		return pool_.checkout(x, y, width, height);
	}
	auto release(const rect& r) -> expected<slot_t, pool_error> { return pool_.release(r); }
	auto release_all() -> void { pool_.release_all(); }
	auto get_stats() const -> pool_stats { return pool_.get_stats(); }
	auto pool() -> pool_t& { return pool_; }
	auto pool() const -> const pool_t& { return pool_; }

private:

	static auto make() -> rect { return {}; }
	static auto reset(rect& r, double x, double y, double width, double height) -> void { r.set(x, y, width, height); }

	pool_t pool_;
};

using rect_pool = basic_rect_pool<>;

} // vpl
