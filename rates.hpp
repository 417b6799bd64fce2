#pragma once

#include <eosiolib/eosio.hpp>

#include <string>
#include <vector>

#include "config.h"
#include "safemath.h"

/*
 * Row layout of the `rates` table published by a rates contract in its own
 * scope. Each row takes a cut of every unit price: additive rows are charged
 * to the buyer on top of the price, deductive rows come out of the price.
 */
// @abi table rates i64
struct rate_t {
	uint64_t id;
	account_name recipient;
	bool is_additive;
	uint16_t percent_bp;
	int64_t flat;
	std::string memo;

	uint64_t primary_key() const { return id; }

	EOSLIB_SERIALIZE(rate_t, (id)(recipient)(is_additive)(percent_bp)(flat)(memo))
};

typedef eosio::multi_index<N(rates), rate_t> rates_table;

struct payout_t {
	account_name recipient;
	int64_t amount;
	std::string memo;

	EOSLIB_SERIALIZE(payout_t, (recipient)(amount)(memo))
};

struct split_t {
	int64_t tax;
	int64_t remainder;
	std::vector<payout_t> payouts;
};

inline int64_t rate_fee(const rate_t& rate, int64_t price) {
	if (rate.flat > 0) {
		return rate.flat;
	}
	return mul_div(price, rate.percent_bp, PERCENT_DENOM_BP);
}

/*
 * Splits one unit price according to the rates currently published by
 * `rates_contract`. With no rates contract the whole price is the remainder.
 * Payouts must be deliverable later, so every recipient has to be an existing
 * account other than `payer_contract`, the contract holding the funds.
 * `tax` is what the buyer pays on top of the price, `remainder` what is left
 * of the price for the sale recipient, and `payouts` every fee to disburse.
 */
inline split_t split_funds(account_name rates_contract, account_name payer_contract, int64_t price) {
	split_t split{0, price, {}};
	if (rates_contract == 0) {
		return split;
	}

	rates_table rates(rates_contract, rates_contract);
	for (auto it = rates.begin(); it != rates.end(); ++it) {
		int64_t fee = rate_fee(*it, price);
		eosio_assert(fee >= 0, "Invalid rate");
		if (fee == 0) {
			continue;
		}
		eosio_assert(is_account(it->recipient) && it->recipient != payer_contract, "Invalid payout recipient");
		if (it->is_additive) {
			split.tax = checked_add(split.tax, fee);
		} else {
			eosio_assert(fee <= split.remainder, "Royalties exceed price");
			split.remainder -= fee;
		}
		split.payouts.push_back(payout_t{it->recipient, fee, it->memo});
	}
	return split;
}
