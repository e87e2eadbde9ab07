#include <catch2/catch_test_macros.hpp>
#include <vpool/frame_scope.hpp>
#include <vpool/rect_pool.hpp>
#include <vpool/vector2_pool.hpp>

TEST_CASE("vector2_pool", "[vector2_pool]") {
	vpl::vector2_pool pool{2};

	SECTION("default size") {
		vpl::vector2_pool defaulted;
		REQUIRE(defaulted.get_stats().total == 100);
		REQUIRE(defaulted.get_stats().free == 100);
	}

	SECTION("get defaults to zero") {
		auto& v = pool.get();
		REQUIRE(v.x == 0.0);
		REQUIRE(v.y == 0.0);
	}

	SECTION("reset completeness") {
		auto& a = pool.get(3.0, 4.0);
		REQUIRE(a.x == 3.0);
		REQUIRE(a.y == 4.0);
		REQUIRE(pool.release(a));
		auto& b = pool.get(7.0, 9.0);
		REQUIRE(&b == &a);
		REQUIRE(b.x == 7.0);
		REQUIRE(b.y == 9.0);
	}

	SECTION("mutated values come back clean") {
		auto& a = pool.get(1.0, 1.0);
		a.multiply(100.0).add({5.0, 5.0});
		REQUIRE(pool.release(a));
		auto& b = pool.get();
		REQUIRE(b == vpl::vector2{});
	}

	SECTION("frame of short lived values") {
		{
			auto frame = vpl::make_frame_scope(&pool);
			auto& origin = pool.get(10.0, 10.0);
			auto& offset = pool.get(3.0, 4.0);
			auto& screen = pool.get().copy(origin).add(offset);
			REQUIRE(screen == vpl::vector2{13.0, 14.0});
			REQUIRE(pool.get_stats().active == 3);
		}
		const auto stats = pool.get_stats();
		REQUIRE(stats.total == 3);
		REQUIRE(stats.active == 0);
		REQUIRE(stats.free == 3);
		REQUIRE(stats.growth_count == 1);
	}

	SECTION("clone escapes the pool") {
		auto& v = pool.get(2.0, 3.0);
		const auto snapshot = v.clone();
		pool.release_all();
		pool.get(8.0, 8.0);
		REQUIRE(snapshot == vpl::vector2{2.0, 3.0});
		REQUIRE(!pool.pool().owns(snapshot));
	}

	SECTION("checkout") {
		{
			auto v = pool.checkout(1.0, 2.0);
			REQUIRE(v->x == 1.0);
			REQUIRE(v->y == 2.0);
			REQUIRE(pool.get_stats().active == 1);
		}
		REQUIRE(pool.get_stats().active == 0);
	}
}

TEST_CASE("rect_pool", "[rect_pool]") {
	vpl::rect_pool pool{1};

	SECTION("default size") {
		vpl::rect_pool defaulted;
		REQUIRE(defaulted.get_stats().total == 50);
	}

	SECTION("reset completeness") {
		auto& a = pool.get(1.0, 2.0, 3.0, 4.0);
		REQUIRE(a == vpl::rect{1.0, 2.0, 3.0, 4.0});
		REQUIRE(pool.release(a));
		auto& b = pool.get(5.0, 6.0);
		REQUIRE(&b == &a);
		REQUIRE(b == vpl::rect{5.0, 6.0, 0.0, 0.0});
	}

	SECTION("release_all") {
		pool.get();
		pool.get();
		pool.get();
		pool.release_all();
		const auto stats = pool.get_stats();
		REQUIRE(stats.total == 3);
		REQUIRE(stats.active == 0);
		REQUIRE(stats.free == 3);
	}

	SECTION("foreign rect is rejected") {
		vpl::rect stranger;
		const auto result = pool.release(stranger);
		REQUIRE(!result);
		REQUIRE(result.get_error() == vpl::pool_error::not_a_member);
	}
}

TEST_CASE("vector2_pool with ceiling", "[vector2_pool]") {
	vpl::vector2_pool pool{vpl::pool_options{0, 1}};
	REQUIRE(pool.get_stats().total == 0);
	pool.get(1.0, 1.0);
	REQUIRE_THROWS_AS(pool.get(), vpl::pool_exhausted);
	REQUIRE_THROWS_AS(pool.checkout(), vpl::pool_exhausted);
	pool.release_all();
	REQUIRE(pool.get(2.0, 2.0) == vpl::vector2{2.0, 2.0});
}
