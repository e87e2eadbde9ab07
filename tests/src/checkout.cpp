#include <utility>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <vpool/frame_scope.hpp>
#include <vpool/vector2_pool.hpp>

TEST_CASE("checkout", "[checkout]") {
	vpl::vector2_pool pool{2};

	SECTION("released on destruction") {
		{
			auto a = pool.checkout(1.0, 1.0);
			auto b = pool.checkout(2.0, 2.0);
			REQUIRE(a);
			REQUIRE(b);
			REQUIRE(a.get() != b.get());
			REQUIRE(pool.get_stats().active == 2);
		}
		const auto stats = pool.get_stats();
		REQUIRE(stats.active == 0);
		REQUIRE(stats.released == 2);
		REQUIRE(stats.rejected_releases == 0);
	}

	SECTION("the handle knows its slot and generation") {
		auto a = pool.checkout(1.0, 1.0);
		const auto slot = pool.pool().slot_of(*a);
		REQUIRE(slot.has_value());
		REQUIRE(a.slot() == *slot);
		REQUIRE(a.generation() == *pool.pool().generation_of(*slot));
		REQUIRE(&pool.pool().at(a.slot()) == a.get());
		const auto issued = a.generation();
		REQUIRE(a.release());
		REQUIRE(*pool.pool().generation_of(*slot) == issued + 1);
		auto b = pool.checkout(2.0, 2.0);
		REQUIRE(b.slot() == *slot);
		REQUIRE(b.generation() == issued + 1);
		REQUIRE(!pool.pool().is_current(*slot, issued));
		REQUIRE(pool.pool().is_current(b.slot(), b.generation()));
	}

	SECTION("early release empties the handle") {
		auto a = pool.checkout(1.0, 1.0);
		const auto result = a.release();
		REQUIRE(result);
		REQUIRE(!a);
		REQUIRE(a.get() == nullptr);
		REQUIRE(pool.get_stats().active == 0);
		const auto again = a.release();
		REQUIRE(!again);
		REQUIRE(again.get_error() == vpl::pool_error::not_a_member);
	}

	SECTION("moving transfers ownership") {
		auto a = pool.checkout(3.0, 4.0);
		const auto item = a.get();
		auto b = std::move(a);
		REQUIRE(!a);
		REQUIRE(b.get() == item);
		REQUIRE(b->length() == 5.0);
		std::vector<vpl::vector2_pool::checkout_t> held;
		held.push_back(std::move(b));
		held.push_back(pool.checkout());
		held.push_back(pool.checkout());
		REQUIRE(pool.get_stats().active == 3);
		held.clear();
		REQUIRE(pool.get_stats().active == 0);
	}

	SECTION("move assignment returns the old item") {
		auto a = pool.checkout(1.0, 0.0);
		auto b = pool.checkout(0.0, 1.0);
		a = std::move(b);
		REQUIRE(pool.get_stats().active == 1);
		REQUIRE(a->y == 1.0);
	}

	SECTION("handle goes stale after a bulk release") {
		auto a = pool.checkout(1.0, 1.0);
		REQUIRE(a.is_current());
		pool.release_all();
		REQUIRE(!a.is_current());
		// Someone else now holds the same slot
		auto& other = pool.get(9.0, 9.0);
		REQUIRE(&other == a.get());
		const auto result = a.release();
		REQUIRE(!result);
		REQUIRE(result.get_error() == vpl::pool_error::stale);
		REQUIRE(pool.pool().is_active(other));
		REQUIRE(other == vpl::vector2{9.0, 9.0});
		REQUIRE(pool.get_stats().rejected_releases == 0);
	}

	SECTION("checkouts inside a frame scope") {
		{
			auto frame = vpl::make_frame_scope(&pool);
			auto a = pool.checkout(1.0, 2.0);
			pool.get(3.0, 4.0);
			REQUIRE(pool.get_stats().active == 2);
			frame.end();
			REQUIRE(pool.get_stats().active == 0);
		}
		REQUIRE(pool.get_stats().active == 0);
		REQUIRE(pool.get_stats().rejected_releases == 0);
	}
}

TEST_CASE("frame_scope", "[frame_scope]") {
	vpl::vector2_pool pool{4};

	SECTION("moved scope releases once") {
		pool.get();
		{
			auto a = vpl::make_frame_scope(&pool);
			auto b = std::move(a);
			pool.get();
		}
		REQUIRE(pool.get_stats().active == 0);
		REQUIRE(pool.get_stats().released == 2);
	}

	SECTION("consecutive frames reuse the same instances") {
		for (int frame = 0; frame < 10; frame++) {
			vpl::frame_scope<vpl::vector2_pool> scope{&pool};
			for (int i = 0; i < 6; i++) {
				pool.get(double(frame), double(i));
			}
		}
		const auto stats = pool.get_stats();
		REQUIRE(stats.total == 6);
		REQUIRE(stats.growth_count == 2);
		REQUIRE(stats.active == 0);
	}
}
