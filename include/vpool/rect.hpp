#pragma once

namespace vpl {

struct rect
{
	double x{0.0};
	double y{0.0};
	double width{0.0};
	double height{0.0};

	rect() = default;
	rect(double x, double y, double width, double height)
		: x{x}, y{y}, width{width}, height{height}
	{
	}

	auto set(double new_x, double new_y, double new_width, double new_height) -> rect&
	{
		x = new_x;
		y = new_y;
		width = new_width;
		height = new_height;
		return *this;
	}

	auto copy(const rect& r) -> rect&
	{
		return set(r.x, r.y, r.width, r.height);
	}

	// Half-open: the right and bottom edges are outside.
	auto contains(double px, double py) const -> bool
	{
		return px >= x && px < right() && py >= y && py < bottom();
	}

	// Closed: rectangles that share an edge intersect.
	auto intersects(const rect& r) const -> bool
	{
		return !(r.x > right() || r.right() < x || r.y > bottom() || r.bottom() < y);
	}

	auto left() const { return x; }
	auto right() const -> double { return x + width; }
	auto top() const { return y; }
	auto bottom() const -> double { return y + height; }
	auto center_x() const { return x + width / 2; }
	auto center_y() const { return y + height / 2; }

	auto equals(const rect& r) const -> bool
	{
		return x == r.x && y == r.y && width == r.width && height == r.height;
	}

	auto clone() const -> rect
	{
		return {x, y, width, height};
	}

	friend auto operator==(const rect& a, const rect& b) -> bool { return a.equals(b); }
	friend auto operator!=(const rect& a, const rect& b) -> bool { return !a.equals(b); }
};

} // vpl
