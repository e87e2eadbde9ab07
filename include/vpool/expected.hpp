#pragma once

#include <cassert>
#include <utility>
#include <variant>

namespace vpl {

// Result of a pool operation that can fail as part of
// normal use. Always holds exactly one of a value or an
// error. Both are small, so they are taken by value.
template <typename Value, typename Error>
class expected
{
public:

	expected(Value value)
		: var_{std::in_place_index<0>, std::move(value)}
	{
	}

	expected(Error error)
		: var_{std::in_place_index<1>, std::move(error)}
	{
	}

	explicit operator bool() const
	{
		return var_.index() == 0;
	}

	auto get_value() const -> Value
	{
		assert (*this);
		return std::get<0>(var_);
	}

	auto get_error() const -> Error
	{
		assert (!*this);
		return std::get<1>(var_);
	}

private:

	std::variant<Value, Error> var_;
};

} // vpl
