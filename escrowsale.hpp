#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/singleton.hpp>
#include <eosiolib/asset.hpp>

#include <string>
#include <vector>

#include "config.h"
#include "rates.hpp"

class escrowsale : public eosio::contract {
public:
	struct recipient_t {
		account_name account;
		std::string memo;

		EOSLIB_SERIALIZE(recipient_t, (account)(memo))
	};

	struct mint_t {
		uint64_t id;
		account_name owner;
		std::string uri;

		EOSLIB_SERIALIZE(mint_t, (id)(owner)(uri))
	};

	struct purchase_t {
		uint64_t token_id;
		int64_t tax_amount;
		std::vector<payout_t> payouts;

		EOSLIB_SERIALIZE(purchase_t, (token_id)(tax_amount)(payouts))
	};

private:
	// @abi table config i64
	struct config_t {
		account_name token_contract;
		bool can_mint_after_sale;
		account_name rates_contract;

		EOSLIB_SERIALIZE(config_t, (token_contract)(can_mint_after_sale)(rates_contract))
	};

	// @abi table globals i64
	struct globals_t {
		bool sale_conducted;
		uint64_t tokens_available;
		uint64_t next_seq;
	};

	// @abi table state i64
	struct state_t {
		uint32_t start_time;
		uint32_t end_time;
		eosio::asset price;
		account_name price_contract;
		uint64_t min_tokens_sold;
		uint32_t max_per_wallet;
		uint64_t amount_sold;
		int64_t amount_to_send;
		int64_t amount_transferred;
		uint64_t amount_delivered;
		uint64_t total_tokens;
		uint8_t target_percent;
		uint32_t max_duration;
		bool ended;
		recipient_t recipient;

		EOSLIB_SERIALIZE(state_t, (start_time)(end_time)(price)(price_contract)(min_tokens_sold)
			(max_per_wallet)(amount_sold)(amount_to_send)(amount_transferred)(amount_delivered)
			(total_tokens)(target_percent)(max_duration)(ended)(recipient))
	};

	// @abi table available i64
	struct token_t {
		uint64_t id;
		uint64_t primary_key() const { return id; }
	};

	// @abi table purchases i64
	struct ledger_t {
		account_name buyer;
		uint64_t seq;
		std::vector<purchase_t> items;

		uint64_t primary_key() const { return buyer; }
		uint64_t by_seq() const { return seq; }

		EOSLIB_SERIALIZE(ledger_t, (buyer)(seq)(items))
	};

	typedef eosio::multi_index<N(purchases), ledger_t,
		eosio::indexed_by<N(byseq), eosio::const_mem_fun<ledger_t, uint64_t, &ledger_t::by_seq>>
	> ledger_table;

	eosio::singleton<N(config), config_t> config_singleton;
	eosio::singleton<N(globals), globals_t> globals_singleton;
	eosio::singleton<N(state), state_t> state_singleton;
	eosio::multi_index<N(available), token_t> available;
	ledger_table purchases;

	globals_t globals;

	globals_t default_globals() const {
		return globals_t{
			.sale_conducted = false,
			.tokens_available = 0,
			.next_seq = 0
		};
	}

	config_t get_config() const {
		eosio_assert(this->config_singleton.exists(), "Not initialized");
		return this->config_singleton.get();
	}

	void on_purchase(account_name code, account_name buyer, eosio::asset quantity, uint64_t wanted, bool by_id, uint64_t token_id);
	eosio::asset purchase_tokens(account_name buyer, const std::vector<uint64_t>& token_ids,
		eosio::asset quantity, state_t& state, std::vector<purchase_t>& items);
	void save_purchases(account_name buyer, const std::vector<purchase_t>& items);

	bool end_condition_met(const state_t& state) const;
	void issue_refunds_and_burn_tokens(const state_t& state, uint32_t limit);
	void transfer_tokens_and_send_funds(state_t& state, uint32_t limit);
	void refund_purchases(const ledger_t& entry, const state_t& state, const config_t& config);
	void burn_available(const config_t& config, uint64_t limit);
	void clear_state();

	void inline_mint(account_name token_contract, account_name owner, uint64_t id, std::string uri) const {
		struct mint {
			account_name issuer;
			account_name owner;
			uint64_t id;
			std::string uri;
		};
		eosio::action(
			eosio::permission_level(this->_self, N(active)),
			token_contract,
			N(mint),
			mint{this->_self, owner, id, uri}
		).send();
	}

	void inline_transfer_token(account_name token_contract, account_name to, uint64_t id, std::string memo) const {
		struct transfer {
			account_name from;
			account_name to;
			uint64_t id;
			std::string memo;
		};
		eosio::action(
			eosio::permission_level(this->_self, N(active)),
			token_contract,
			N(transfer),
			transfer{this->_self, to, id, memo}
		).send();
	}

	void inline_burn(account_name token_contract, uint64_t id) const {
		struct burn {
			account_name owner;
			uint64_t id;
		};
		eosio::action(
			eosio::permission_level(this->_self, N(active)),
			token_contract,
			N(burn),
			burn{this->_self, id}
		).send();
	}

	void inline_transfer(account_name to, eosio::extended_asset quantity, std::string memo) const {
		struct transfer {
			account_name from;
			account_name to;
			eosio::asset quantity;
			std::string memo;
		};
		eosio::action(
			eosio::permission_level(this->_self, N(active)),
			quantity.contract,
			N(transfer),
			transfer{this->_self, to, quantity, memo}
		).send();
	}

	void log_receipt(std::string event, account_name account, uint64_t count, eosio::asset amount) const {
		struct receipt {
			std::string event;
			account_name account;
			uint64_t count;
			eosio::asset amount;
		};
		eosio::action(
			eosio::permission_level(this->_self, N(active)),
			this->_self,
			N(receipt),
			receipt{event, account, count, amount}
		).send();
	}

public:
	escrowsale(account_name self);
	~escrowsale();
	void init(account_name token_contract, bool can_mint_after_sale, account_name rates_contract);
	void settokens(account_name token_contract);
	void setrates(account_name rates_contract);
	void mint(std::vector<mint_t> items);
	void startsale(uint32_t start, uint32_t end, eosio::asset price, account_name price_contract,
		uint64_t min_tokens_sold, uint32_t max_per_wallet, recipient_t recipient,
		uint8_t target_percent, uint32_t max_duration);
	void claimrefund(account_name buyer);
	void endsale(uint32_t limit);
	void receipt(std::string event, account_name account, uint64_t count, eosio::asset amount);
	void transfer(account_name code);
};
