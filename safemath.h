#pragma once

#include <eosiolib/eosio.hpp>

inline int64_t checked_add(int64_t a, int64_t b) {
	eosio_assert(b >= 0 ? a <= INT64_MAX - b : a >= INT64_MIN - b, "Overflow");
	return a + b;
}

inline uint64_t checked_add(uint64_t a, uint64_t b) {
	eosio_assert(a <= UINT64_MAX - b, "Overflow");
	return a + b;
}

inline uint64_t checked_inc(uint64_t a) {
	eosio_assert(a < UINT64_MAX, "Overflow");
	return a + 1;
}

inline uint64_t checked_dec(uint64_t a) {
	eosio_assert(a > 0, "Overflow");
	return a - 1;
}

// a * num / denom without intermediate overflow, rounded down
inline int64_t mul_div(int64_t a, uint64_t num, uint64_t denom) {
	eosio_assert(denom != 0, "Division by zero");
	int128_t result = static_cast<int128_t>(a) * num / denom;
	eosio_assert(result <= INT64_MAX && result >= INT64_MIN, "Overflow");
	return static_cast<int64_t>(result);
}
