#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vpl {

// Index of a pool-owned slot. Never changes for the
// lifetime of the pool.
using slot_t = uint32_t;

// Bumped every time a slot goes from active to free.
using generation_t = uint32_t;

enum class pool_error {
	// The item or slot does not belong to this pool
	not_a_member,
	// The item is already in the free list
	already_free,
	// The handle was issued for an earlier checkout of
	// the slot, which has since been released
	stale,
	// The pool reached its ceiling and the free list is empty
	exhausted,
};

inline auto to_string(pool_error error) -> const char* {
	switch (error) {
		case pool_error::not_a_member: return "not_a_member";
		case pool_error::already_free: return "already_free";
		case pool_error::stale: return "stale";
		case pool_error::exhausted: return "exhausted";
	}
	return "unknown";
}

class pool_exhausted : public std::runtime_error {
public:
	explicit pool_exhausted(const std::string& what) : std::runtime_error(what) {}
	explicit pool_exhausted(const char* what) : std::runtime_error(what) {}
};

class invalid_slot : public std::logic_error {
public:
	explicit invalid_slot(const std::string& what) : std::logic_error(what) {}
	explicit invalid_slot(const char* what) : std::logic_error(what) {}
};

class invalid_pool_name : public std::logic_error {
public:
	explicit invalid_pool_name(const std::string& what) : std::logic_error(what) {}
	explicit invalid_pool_name(const char* what) : std::logic_error(what) {}
};

} // vpl
