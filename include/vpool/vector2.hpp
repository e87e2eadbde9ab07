#pragma once

#include <cmath>

namespace vpl {

// Mutable 2D vector. Every mutating operation works in
// place and returns *this so calls can be chained.
struct vector2
{
	double x{0.0};
	double y{0.0};

	vector2() = default;
	vector2(double x, double y) : x{x}, y{y} {}

	auto set(double new_x, double new_y) -> vector2&
	{
		x = new_x;
		y = new_y;
		return *this;
	}

	auto copy(const vector2& v) -> vector2&
	{
		x = v.x;
		y = v.y;
		return *this;
	}

	auto add(const vector2& v) -> vector2&
	{
		x += v.x;
		y += v.y;
		return *this;
	}

	auto subtract(const vector2& v) -> vector2&
	{
		x -= v.x;
		y -= v.y;
		return *this;
	}

	auto multiply(double scalar) -> vector2&
	{
		x *= scalar;
		y *= scalar;
		return *this;
	}

	// Dividing by exactly zero leaves the vector unchanged.
	auto divide(double scalar) -> vector2&
	{
		if (scalar != 0.0)
		{
			x /= scalar;
			y /= scalar;
		}

		return *this;
	}

	auto length() const -> double
	{
		return std::sqrt(x * x + y * y);
	}

	auto normalize() -> vector2&
	{
		return divide(length());
	}

	auto distance(const vector2& v) const -> double
	{
		const auto dx{x - v.x};
		const auto dy{y - v.y};
		return std::sqrt(dx * dx + dy * dy);
	}

	auto equals(const vector2& v) const -> bool
	{
		return x == v.x && y == v.y;
	}

	// The only operation that produces a new vector. Use it
	// when a value has to outlive its pool checkout.
	auto clone() const -> vector2
	{
		return {x, y};
	}

	friend auto operator==(const vector2& a, const vector2& b) -> bool { return a.equals(b); }
	friend auto operator!=(const vector2& a, const vector2& b) -> bool { return !a.equals(b); }
};

} // vpl
