#include "escrowsale_tester.hpp"

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_FIXTURE_TEST_CASE(init_tests, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(error("missing authority of escrowsale"),
		push_action(escrow_abi, N(escrowsale), N(alice), N(init), mvo()
			("token_contract", "nftoken")
			("can_mint_after_sale", false)
			("rates_contract", "")
		));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid token contract"), init(N(nobody), false));

	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), true, N(ratesplit)));
	auto config = get_config();
	BOOST_REQUIRE_EQUAL("nftoken", config["token_contract"].as_string());
	BOOST_REQUIRE_EQUAL(true, config["can_mint_after_sale"].as_bool());
	BOOST_REQUIRE_EQUAL("ratesplit", config["rates_contract"].as_string());

	auto globals = get_globals();
	BOOST_REQUIRE_EQUAL(false, globals["sale_conducted"].as_bool());
	BOOST_REQUIRE_EQUAL(0, globals["tokens_available"].as_uint64());

	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Already initialized"), init(N(nftoken), false));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(mint_registers_escrowed_tokens_only, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Not initialized"), mint({1}));
	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), false));

	BOOST_REQUIRE_EQUAL(success(), mint({1, 2, 3}));
	BOOST_REQUIRE_EQUAL(3, tokens_available());
	BOOST_REQUIRE(is_available(1));
	BOOST_REQUIRE(is_available(3));
	BOOST_REQUIRE_EQUAL("escrowsale", item_owner(2));

	// Tokens minted for a third party are not for sale
	BOOST_REQUIRE_EQUAL(success(), mint({10, 11}, N(carol)));
	BOOST_REQUIRE_EQUAL(3, tokens_available());
	BOOST_REQUIRE(!is_available(10));
	BOOST_REQUIRE_EQUAL("carol", item_owner(10));

	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Token already available"), mint({2}));
	BOOST_REQUIRE_EQUAL(error("missing authority of escrowsale"), mint({4}, account_name(), N(alice)));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(mint_limit, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), false));

	vector<uint64_t> ids;
	for (uint64_t id = 1; id <= 101; id++) {
		ids.push_back(id);
	}
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Too many mint messages"), mint(ids));

	ids.pop_back();
	BOOST_REQUIRE_EQUAL(success(), mint(ids));
	BOOST_REQUIRE_EQUAL(100, tokens_available());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(mint_blocked_during_and_after_sale, escrowsale_tester) try {
	open_sale(2, "10.0000 PAY", 1, 1);
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Sale started"), mint({3}));

	BOOST_REQUIRE_EQUAL(success(), pay(N(alice), "10.0000 PAY", "purchase"));
	advance(3601);
	drain(N(bob));
	BOOST_REQUIRE(get_state().is_null());

	BOOST_REQUIRE_EQUAL(true, get_globals()["sale_conducted"].as_bool());
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Cannot mint after sale conducted"), mint({3}));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(mint_after_sale_when_allowed, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), true));
	BOOST_REQUIRE_EQUAL(success(), mint({1}));
	BOOST_REQUIRE_EQUAL(success(), startsale(0, now_sec() + 3600, "10.0000 PAY", 1, 1));
	BOOST_REQUIRE_EQUAL(success(), pay(N(alice), "10.0000 PAY", "purchase"));
	drain(N(escrowsale));

	BOOST_REQUIRE_EQUAL(success(), mint({2}));
	BOOST_REQUIRE(is_available(2));
	BOOST_REQUIRE_EQUAL(1, tokens_available());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(settokens_tests, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), false));
	BOOST_REQUIRE_EQUAL(error("missing authority of escrowsale"), settokens(N(carol), N(alice)));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid token contract"), settokens(N(nobody)));

	BOOST_REQUIRE_EQUAL(success(), settokens(N(carol)));
	BOOST_REQUIRE_EQUAL("carol", get_config()["token_contract"].as_string());
	BOOST_REQUIRE_EQUAL(success(), settokens(N(nftoken)));

	BOOST_REQUIRE_EQUAL(success(), mint({1}));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Tokens already minted"), settokens(N(carol)));
	BOOST_REQUIRE_EQUAL("nftoken", get_config()["token_contract"].as_string());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(settokens_blocked_until_sale_cleared, escrowsale_tester) try {
	open_sale(3, "10.0000 PAY", 1, 2);
	BOOST_REQUIRE_EQUAL(success(), pay(N(alice), "20.0000 PAY", "purchase"));
	BOOST_REQUIRE_EQUAL(success(), pay(N(bob), "10.0000 PAY", "purchase"));

	// Sold out: nothing is available, but sold tokens are still held in escrow
	BOOST_REQUIRE_EQUAL(0, tokens_available());
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Sale started"), settokens(N(carol)));

	advance(3601);
	BOOST_REQUIRE_EQUAL(success(), endsale(N(escrowsale), 1));
	BOOST_REQUIRE(!get_state().is_null());
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Sale started"), settokens(N(carol)));
	BOOST_REQUIRE_EQUAL("nftoken", get_config()["token_contract"].as_string());

	BOOST_REQUIRE_EQUAL("alice", item_owner(2));
	BOOST_REQUIRE_EQUAL("escrowsale", item_owner(3));

	drain(N(escrowsale));
	BOOST_REQUIRE_EQUAL("bob", item_owner(3));
	BOOST_REQUIRE_EQUAL(success(), settokens(N(carol)));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(setrates_tests, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), false));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid rates contract"), setrates(N(nobody)));

	BOOST_REQUIRE_EQUAL(success(), setrates(N(ratesplit)));
	BOOST_REQUIRE_EQUAL("ratesplit", get_config()["rates_contract"].as_string());
	BOOST_REQUIRE_EQUAL(success(), setrates(account_name()));
	BOOST_REQUIRE_EQUAL("", get_config()["rates_contract"].as_string());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(startsale_validation, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(success(), init(N(nftoken), false));
	BOOST_REQUIRE_EQUAL(success(), mint({1, 2, 3}));
	uint32_t now = now_sec();

	BOOST_REQUIRE_EQUAL(error("missing authority of escrowsale"),
		startsale(0, now + 3600, "10.0000 PAY", 1, 1, N(recipient), 0, 0, N(alice)));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid recipient"), startsale(0, now + 3600, "10.0000 PAY", 1, 1, N(nobody)));
	// Proceeds sent back to the contract itself could never be forwarded
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid recipient"), startsale(0, now + 3600, "10.0000 PAY", 1, 1, N(escrowsale)));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Start time after end time"), startsale(now + 100, now + 100, "10.0000 PAY", 1, 1));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Start time in the past"), startsale(now - 100, now + 3600, "10.0000 PAY", 1, 1));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid price"), startsale(0, now + 3600, "-10.0000 PAY", 1, 1));
	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Invalid target percentage"),
		startsale(0, now + 3600, "10.0000 PAY", 1, 1, N(recipient), 101));

	BOOST_REQUIRE_EQUAL(success(), startsale(0, now + 3600, "10.0000 PAY", 2, 0));
	auto state = get_state();
	BOOST_REQUIRE_EQUAL(1, state["max_per_wallet"].as_uint64());
	BOOST_REQUIRE_EQUAL(2, state["min_tokens_sold"].as_uint64());
	BOOST_REQUIRE_EQUAL(3, state["total_tokens"].as_uint64());
	BOOST_REQUIRE_EQUAL(0, state["amount_sold"].as_uint64());
	BOOST_REQUIRE_EQUAL(0, state["amount_to_send"].as_int64());
	BOOST_REQUIRE_EQUAL(false, state["ended"].as_bool());
	BOOST_REQUIRE_EQUAL("recipient", state["recipient"]["account"].as_string());
	BOOST_REQUIRE_EQUAL(true, get_globals()["sale_conducted"].as_bool());

	BOOST_REQUIRE_EQUAL(wasm_assert_msg("Sale started"), startsale(0, now + 7200, "10.0000 PAY", 1, 1));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(receipts_are_internal, escrowsale_tester) try {
	BOOST_REQUIRE_EQUAL(error("missing authority of escrowsale"),
		push_action(escrow_abi, N(escrowsale), N(alice), N(receipt), mvo()
			("event", "purchase")
			("account", "alice")
			("count", 1)
			("amount", "10.0000 PAY")
		));
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
