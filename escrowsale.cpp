#include "escrowsale.hpp"
#include "override.hpp"
#include "safemath.h"

#include <algorithm>

static bool parse_uint64(const std::string& str, uint64_t& value) {
	if (str.empty()) {
		return false;
	}
	value = 0;
	for (char c : str) {
		if (c < '0' || c > '9') {
			return false;
		}
		uint64_t digit = c - '0';
		if (value > (UINT64_MAX - digit) / 10) {
			return false;
		}
		value = value * 10 + digit;
	}
	return true;
}

static bool has_prefix(const std::string& str, const std::string& prefix) {
	return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// Folds payouts into `merged`, one entry per recipient and memo
static void merge_payouts(std::vector<payout_t>& merged, const std::vector<payout_t>& payouts) {
	for (const auto& payout : payouts) {
		auto it = std::find_if(merged.begin(), merged.end(), [&payout](const payout_t& p) {
			return p.recipient == payout.recipient && p.memo == payout.memo;
		});
		if (it == merged.end()) {
			merged.push_back(payout);
		} else {
			it->amount = checked_add(it->amount, payout.amount);
		}
	}
}

escrowsale::escrowsale(account_name self) :
	eosio::contract(self),
	config_singleton(this->_self, this->_self),
	globals_singleton(this->_self, this->_self),
	state_singleton(this->_self, this->_self),
	available(this->_self, this->_self),
	purchases(this->_self, this->_self),
	globals(globals_singleton.exists() ? globals_singleton.get() : default_globals())
{
}

escrowsale::~escrowsale() {
	this->globals_singleton.set(this->globals, this->_self);
}

void escrowsale::init(account_name token_contract, bool can_mint_after_sale, account_name rates_contract) {
	require_auth(this->_self);
	eosio_assert(!this->config_singleton.exists(), "Already initialized");
	eosio_assert(is_account(token_contract), "Invalid token contract");
	eosio_assert(rates_contract == 0 || is_account(rates_contract), "Invalid rates contract");

	this->config_singleton.set(config_t{token_contract, can_mint_after_sale, rates_contract}, this->_self);
	this->globals = default_globals();
}

void escrowsale::settokens(account_name token_contract) {
	require_auth(this->_self);
	config_t config = this->get_config();

	// Tokens already in escrow belong to the current token contract
	eosio_assert(!this->state_singleton.exists(), "Sale started");
	eosio_assert(this->globals.tokens_available == 0, "Tokens already minted");
	eosio_assert(is_account(token_contract), "Invalid token contract");

	config.token_contract = token_contract;
	this->config_singleton.set(config, this->_self);
}

void escrowsale::setrates(account_name rates_contract) {
	require_auth(this->_self);
	config_t config = this->get_config();
	eosio_assert(rates_contract == 0 || is_account(rates_contract), "Invalid rates contract");

	config.rates_contract = rates_contract;
	this->config_singleton.set(config, this->_self);
}

void escrowsale::mint(std::vector<mint_t> items) {
	eosio_assert(items.size() <= MAX_MINT_LIMIT, "Too many mint messages");
	require_auth(this->_self);
	eosio_assert(!this->state_singleton.exists(), "Sale started");

	config_t config = this->get_config();
	eosio_assert(config.can_mint_after_sale || !this->globals.sale_conducted, "Cannot mint after sale conducted");

	uint64_t escrowed = 0;
	for (const auto& item : items) {
		account_name owner = item.owner ? item.owner : this->_self;
		// Only tokens held by the contract itself are put up for sale
		if (owner == this->_self) {
			eosio_assert(this->available.find(item.id) == this->available.end(), "Token already available");
			this->available.emplace(this->_self, [&item](auto& token) {
				token.id = item.id;
			});
			this->globals.tokens_available = checked_inc(this->globals.tokens_available);
			escrowed++;
		}
		this->inline_mint(config.token_contract, owner, item.id, item.uri);
	}

	this->log_receipt("mint", this->_self, escrowed, eosio::asset());
}

void escrowsale::startsale(uint32_t start, uint32_t end, eosio::asset price, account_name price_contract,
		uint64_t min_tokens_sold, uint32_t max_per_wallet, recipient_t recipient,
		uint8_t target_percent, uint32_t max_duration) {
	eosio_assert(is_account(recipient.account) && recipient.account != this->_self, "Invalid recipient");
	require_auth(this->_self);
	this->get_config();

	eosio_assert(price.is_valid() && price.amount >= 0, "Invalid price");
	eosio_assert(is_account(price_contract), "Invalid price contract");
	eosio_assert(target_percent <= 100, "Invalid target percentage");

	uint32_t current = now();
	if (start == 0) {
		start = current;
	} else {
		eosio_assert(start >= current, "Start time in the past");
	}
	eosio_assert(end > start, "Start time after end time");
	eosio_assert(!this->state_singleton.exists(), "Sale started");

	this->state_singleton.set(state_t{
		.start_time = start,
		.end_time = end,
		.price = price,
		.price_contract = price_contract,
		.min_tokens_sold = min_tokens_sold,
		.max_per_wallet = max_per_wallet ? max_per_wallet : DEFAULT_MAX_PER_WALLET,
		.amount_sold = 0,
		.amount_to_send = 0,
		.amount_transferred = 0,
		.amount_delivered = 0,
		.total_tokens = this->globals.tokens_available,
		.target_percent = target_percent,
		.max_duration = max_duration,
		.ended = false,
		.recipient = recipient
	}, this->_self);
	this->globals.sale_conducted = true;

	this->log_receipt("startsale", recipient.account, min_tokens_sold, price);
}

void escrowsale::transfer(account_name code) {
	// Item contracts may notify on their own transfers, which carry a different payload
	if (this->config_singleton.exists() && code == this->config_singleton.get().token_contract) {
		return;
	}

	struct transfer_t {
		account_name from;
		account_name to;
		eosio::asset quantity;
		std::string memo;
	} data = eosio::unpack_action_data<transfer_t>();

	if (data.from == this->_self || data.to != this->_self) {
		return;
	}
	eosio_assert(data.quantity.is_valid() && data.quantity.amount > 0, "Invalid token transfer");

	uint64_t value = 0;
	if (data.memo == "purchase") {
		this->on_purchase(code, data.from, data.quantity, 0, false, 0);
	} else if (has_prefix(data.memo, "purchase:")) {
		bool valid = parse_uint64(data.memo.substr(9), value);
		eosio_assert(valid && value > 0, "Invalid purchase count");
		this->on_purchase(code, data.from, data.quantity, value, false, 0);
	} else if (has_prefix(data.memo, "token:")) {
		eosio_assert(parse_uint64(data.memo.substr(6), value), "Invalid token id");
		this->on_purchase(code, data.from, data.quantity, 0, true, value);
	} else {
		eosio_assert(false, "Unrecognized memo");
	}
}

void escrowsale::on_purchase(account_name code, account_name buyer, eosio::asset quantity,
		uint64_t wanted, bool by_id, uint64_t token_id) {
	eosio_assert(this->state_singleton.exists(), "No ongoing sale");
	state_t state = this->state_singleton.get();

	uint32_t current = now();
	eosio_assert(!state.ended && current < state.end_time, "No ongoing sale");
	eosio_assert(current >= state.start_time, "Sale hasn't started");
	eosio_assert(code == state.price_contract && quantity.symbol == state.price.symbol, "Invalid payment token");

	std::vector<purchase_t> items;
	auto it = this->purchases.find(buyer);
	if (it != this->purchases.end()) {
		items = it->items;
	}

	eosio_assert(items.size() < state.max_per_wallet, "Purchase limit reached");
	uint64_t max_possible = state.max_per_wallet - items.size();

	std::vector<uint64_t> token_ids;
	if (by_id) {
		eosio_assert(this->available.find(token_id) != this->available.end(), "Token not available");
		token_ids.push_back(token_id);
	} else {
		uint64_t count = wanted ? std::min(wanted, max_possible) : max_possible;
		for (auto token = this->available.begin(); token != this->available.end() && token_ids.size() < count; ++token) {
			token_ids.push_back(token->id);
		}
	}

	eosio::asset required = this->purchase_tokens(buyer, token_ids, quantity, state, items);

	this->save_purchases(buyer, items);
	this->state_singleton.set(state, this->_self);

	// Near the end of a sale fewer tokens than requested may be left
	if (quantity > required) {
		this->inline_transfer(buyer, eosio::extended_asset(quantity - required, state.price_contract), "Purchase refund");
	}

	this->log_receipt("purchase", buyer, token_ids.size(), required);
}

eosio::asset escrowsale::purchase_tokens(account_name buyer, const std::vector<uint64_t>& token_ids,
		eosio::asset quantity, state_t& state, std::vector<purchase_t>& items) {
	eosio_assert(!token_ids.empty(), "All tokens purchased");

	int64_t count = token_ids.size();
	eosio::asset total_cost = state.price * count;
	eosio_assert(quantity >= total_cost, "Insufficient funds");

	// The split is the same for every token of this purchase
	split_t split = split_funds(this->get_config().rates_contract, this->_self, state.price.amount);

	int64_t total_tax = 0;
	for (auto id : token_ids) {
		items.push_back(purchase_t{id, split.tax, split.payouts});
		total_tax = checked_add(total_tax, split.tax);

		state.amount_to_send = checked_add(state.amount_to_send, split.remainder);
		state.amount_sold = checked_inc(state.amount_sold);

		this->available.erase(this->available.find(id));
		this->globals.tokens_available = checked_dec(this->globals.tokens_available);
	}

	eosio::asset required = total_cost + eosio::asset(total_tax, state.price.symbol);
	eosio_assert(quantity >= required, "Insufficient funds");
	return required;
}

void escrowsale::save_purchases(account_name buyer, const std::vector<purchase_t>& items) {
	auto it = this->purchases.find(buyer);
	if (it == this->purchases.end()) {
		uint64_t seq = this->globals.next_seq;
		this->globals.next_seq = checked_inc(seq);
		this->purchases.emplace(this->_self, [buyer, seq, &items](auto& entry) {
			entry.buyer = buyer;
			entry.seq = seq;
			entry.items = items;
		});
	} else {
		this->purchases.modify(it, this->_self, [&items](auto& entry) {
			entry.items = items;
		});
	}
}

void escrowsale::claimrefund(account_name buyer) {
	require_auth(buyer);

	eosio_assert(this->state_singleton.exists(), "No ongoing sale");
	state_t state = this->state_singleton.get();
	eosio_assert(state.ended || now() >= state.end_time, "Sale hasn't ended");
	eosio_assert(state.amount_sold < state.min_tokens_sold, "Min sales exceeded");

	auto it = this->purchases.find(buyer);
	eosio_assert(it != this->purchases.end(), "No purchases");

	ledger_t entry = *it;
	this->purchases.erase(it);
	this->refund_purchases(entry, state, this->get_config());
}

bool escrowsale::end_condition_met(const state_t& state) const {
	uint32_t current = now();

	bool is_sale_expired = current >= state.end_time;

	bool is_minimum_sold = state.min_tokens_sold > 0 && state.amount_sold >= state.min_tokens_sold;

	bool is_target_percentage_sold = state.target_percent > 0 && state.total_tokens > 0 &&
		mul_div(state.amount_sold, 100, state.total_tokens) >= state.target_percent;

	bool is_max_duration_reached = state.max_duration > 0 && current >= state.start_time &&
		current - state.start_time >= state.max_duration;

	return is_sale_expired
		|| is_minimum_sold
		|| is_target_percentage_sold
		|| is_max_duration_reached
		|| state.ended;
}

void escrowsale::endsale(uint32_t limit) {
	// Nothing left to settle
	if (!this->state_singleton.exists()) {
		return;
	}
	state_t state = this->state_singleton.get();

	limit = limit ? std::min<uint32_t>(limit, MAX_LIMIT) : DEFAULT_LIMIT;

	bool is_owner = has_auth(this->_self);
	if (!is_owner && this->globals.tokens_available != 0 && !this->end_condition_met(state)) {
		return;
	}

	// From here on the sale accepts no purchases, so the path below is final
	state.ended = true;
	if (state.amount_sold < state.min_tokens_sold) {
		this->state_singleton.set(state, this->_self);
		this->issue_refunds_and_burn_tokens(state, limit);
	} else {
		this->transfer_tokens_and_send_funds(state, limit);
	}
}

void escrowsale::issue_refunds_and_burn_tokens(const state_t& state, uint32_t limit) {
	config_t config = this->get_config();

	auto by_seq = this->purchases.get_index<N(byseq)>();
	for (uint32_t refunded = 0; refunded < limit; refunded++) {
		auto it = by_seq.begin();
		if (it == by_seq.end()) {
			break;
		}
		ledger_t entry = *it;
		by_seq.erase(it);
		this->refund_purchases(entry, state, config);
	}

	this->burn_available(config, limit);

	if (this->purchases.begin() == this->purchases.end() && this->globals.tokens_available == 0) {
		this->clear_state();
	}
}

void escrowsale::transfer_tokens_and_send_funds(state_t& state, uint32_t limit) {
	config_t config = this->get_config();

	int64_t pending = state.amount_to_send - state.amount_transferred;
	if (pending > 0) {
		eosio::asset proceeds(pending, state.price.symbol);
		this->inline_transfer(state.recipient.account, eosio::extended_asset(proceeds, state.price_contract), state.recipient.memo);
		state.amount_transferred = state.amount_to_send;
		this->log_receipt("forward", state.recipient.account, 0, proceeds);
	}

	auto by_seq = this->purchases.get_index<N(byseq)>();
	if (by_seq.begin() != by_seq.end()) {
		// Whole ledger entries only, so a buyer never ends up half delivered
		std::vector<payout_t> payouts;
		uint64_t delivered = 0;
		while (delivered < limit) {
			auto it = by_seq.begin();
			if (it == by_seq.end()) {
				break;
			}
			ledger_t entry = *it;
			by_seq.erase(it);

			for (const auto& purchase : entry.items) {
				this->inline_transfer_token(config.token_contract, entry.buyer, purchase.token_id, "Sale purchase");
				merge_payouts(payouts, purchase.payouts);
			}
			delivered += entry.items.size();
			this->log_receipt("deliver", entry.buyer, entry.items.size(), eosio::asset(0, state.price.symbol));
		}

		for (const auto& payout : payouts) {
			eosio::asset amount(payout.amount, state.price.symbol);
			this->inline_transfer(payout.recipient, eosio::extended_asset(amount, state.price_contract), payout.memo);
		}
		state.amount_delivered = checked_add(state.amount_delivered, delivered);
	} else {
		// Unsold tokens are only burned once every sold token has been delivered
		this->burn_available(config, limit);
	}

	if (this->purchases.begin() == this->purchases.end() && this->globals.tokens_available == 0) {
		this->clear_state();
	} else {
		this->state_singleton.set(state, this->_self);
	}
}

void escrowsale::refund_purchases(const ledger_t& entry, const state_t& state, const config_t& config) {
	int64_t amount = 0;
	for (const auto& purchase : entry.items) {
		amount = checked_add(amount, checked_add(purchase.tax_amount, state.price.amount));
		// Refunded tokens stay with the contract and are retired with the rest
		this->inline_burn(config.token_contract, purchase.token_id);
	}

	eosio::asset refund(amount, state.price.symbol);
	if (amount > 0) {
		this->inline_transfer(entry.buyer, eosio::extended_asset(refund, state.price_contract), "Refund");
	}
	this->log_receipt("refund", entry.buyer, entry.items.size(), refund);
}

void escrowsale::burn_available(const config_t& config, uint64_t limit) {
	uint64_t burned = 0;
	auto it = this->available.begin();
	while (it != this->available.end() && burned < limit) {
		this->inline_burn(config.token_contract, it->id);
		it = this->available.erase(it);
		this->globals.tokens_available = checked_dec(this->globals.tokens_available);
		burned++;
	}
	if (burned > 0) {
		this->log_receipt("burn", this->_self, burned, eosio::asset());
	}
}

void escrowsale::clear_state() {
	this->state_singleton.remove();
	this->globals.tokens_available = 0;
	this->log_receipt("clear", this->_self, 0, eosio::asset());
}

void escrowsale::receipt(std::string event, account_name account, uint64_t count, eosio::asset amount) {
	require_auth(this->_self);
}

EOSIO_ABI(escrowsale, (init)(settokens)(setrates)(mint)(startsale)(claimrefund)(endsale)(receipt));
