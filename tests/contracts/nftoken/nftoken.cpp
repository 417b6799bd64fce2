#include "nftoken.hpp"

void nftoken::mint(account_name issuer, account_name owner, uint64_t id, std::string uri) {
	require_auth(issuer);
	eosio_assert(is_account(owner), "owner account does not exist");
	eosio_assert(this->items.find(id) == this->items.end(), "item already exists");

	this->items.emplace(issuer, [&](auto& i) {
		i.id = id;
		i.owner = owner;
		i.uri = uri;
	});
}

void nftoken::transfer(account_name from, account_name to, uint64_t id, std::string memo) {
	require_auth(from);
	eosio_assert(is_account(to), "to account does not exist");

	const auto& existing = this->items.get(id, "item does not exist");
	eosio_assert(existing.owner == from, "item not owned by sender");

	this->items.modify(existing, 0, [&](auto& i) {
		i.owner = to;
	});
}

void nftoken::burn(account_name owner, uint64_t id) {
	require_auth(owner);

	const auto& existing = this->items.get(id, "item does not exist");
	eosio_assert(existing.owner == owner, "item not owned by sender");
	this->items.erase(existing);
}

EOSIO_ABI(nftoken, (mint)(transfer)(burn))
