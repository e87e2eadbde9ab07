#pragma once

namespace vpl {

// Bulk-releases a pool when the scope ends, typically at
// the end of a rendering frame.
template <typename Pool>
class frame_scope
{
public:

	explicit frame_scope(Pool* pool)
		: pool_{pool}
	{
	}

	frame_scope(frame_scope&& rhs) noexcept
		: pool_{rhs.pool_}
	{
		rhs.pool_ = {};
	}

	auto operator=(frame_scope&& rhs) noexcept -> frame_scope&
	{
		if (this == &rhs) return *this;

		end();
		pool_ = rhs.pool_;
		rhs.pool_ = {};
		return *this;
	}

	frame_scope(const frame_scope& rhs) = delete;
	auto operator=(const frame_scope& rhs) -> frame_scope& = delete;

	~frame_scope()
	{
		end();
	}

	// Release now instead of at scope exit
	auto end() -> void
	{
		if (!pool_) return;

		pool_->release_all();
		pool_ = {};
	}

private:

	Pool* pool_;
};

template <typename Pool>
auto make_frame_scope(Pool* pool) -> frame_scope<Pool>
{
	return frame_scope<Pool>{pool};
}

} // vpl
