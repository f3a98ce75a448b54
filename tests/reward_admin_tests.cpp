#include "reward_tester.hpp"

using namespace rewardfi_testing;

namespace {

   class admin_tester : public reward_tester {
   public:
      transaction_trace_ptr loan_event_trace(const account_name& user, const asset& principal, uint64_t term_seconds, bool ontime_full) {
         return push_trace(N(reward.core), N(lendengine), N(onloanevent), mvo()
            ("submitter",     "lendengine")
            ("user",          user)
            ("principal",     principal)
            ("term_seconds",  term_seconds)
            ("ontime_full",   ontime_full));
      }

      action_result set_telemetry(bool enabled, const account_name& sink) {
         return set_param(N(settelemetry), mvo()("enabled", enabled)("sink", sink));
      }

      action_result set_enabled(bool enabled, const account_name& signer = N(governance)) {
         return push(N(reward.core), signer, N(setenabled), mvo()("enabled", enabled));
      }
   };

}

BOOST_AUTO_TEST_SUITE(reward_admin_tests)

BOOST_FIXTURE_TEST_CASE( init_state, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( error("missing authority of reward.core"),
                        push(N(reward.core), N(alice), N(init), mvo()("admin", "alice")("points_contract", "reward.pts")) );

   auto g = get_global();
   BOOST_REQUIRE_EQUAL( "governance", g["admin"].as_string() );
   BOOST_REQUIRE_EQUAL( "reward.pts", g["points_contract"].as_string() );
   BOOST_REQUIRE_EQUAL( true, g["enabled"].as_bool() );
   BOOST_REQUIRE_EQUAL( musdt("100.000000"), g["base_usd"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 10u, g["per_day_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 500u, g["bonus_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 0u, g["early_penalty_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 500u, g["late_penalty_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 15000u, g["upgrade_multiplier_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 100u, g["max_batch_size"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 3600u, g["cache_expiry_seconds"].as_uint64() );
   BOOST_REQUIRE_EQUAL( DAY_SECONDS, g["on_time_window_seconds"].as_uint64() );

   auto rule = get_row(N(reward.core), N(reward.core), N(levelrules), 2, "level_rule_t");
   BOOST_REQUIRE_EQUAL( musdt("10000.000000"), rule["min_volume"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 3u, rule["min_eligible_loans"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, rule["min_ontime_repays"].as_uint64() );
   BOOST_REQUIRE( get_row(N(reward.core), N(reward.core), N(levelrules), 1, "level_rule_t").is_null() );

   // re-init keeps the rules already tuned
   BOOST_REQUIRE_EQUAL( success(), set_param(N(setlevelrule), mvo()
      ("level", 2)("min_volume", musdt("1.000000"))("min_eligible_loans", 1)("min_ontime_repays", 1)) );
   BOOST_REQUIRE_EQUAL( success(), push(N(reward.core), N(reward.core), N(init), mvo()
      ("admin", "governance")("points_contract", "reward.pts")) );
   rule = get_row(N(reward.core), N(reward.core), N(levelrules), 2, "level_rule_t");
   BOOST_REQUIRE_EQUAL( musdt("1.000000"), rule["min_volume"].as<asset>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( role_management, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( err(8, "no auth for operate"),
                        push(N(reward.core), N(alice), N(grantrole), mvo()("account", "alice")("role", "loanevent")) );
   BOOST_REQUIRE_EQUAL( err(5, "unknown role: badrole"), grant(N(alice), N(badrole)) );
   BOOST_REQUIRE_EQUAL( err(15, "account does not exist"), grant(N(nobody), N(loanevent)) );
   BOOST_REQUIRE_EQUAL( err(2, "role already granted"), grant(N(lendengine), N(loanevent)) );

   // admin holds no role implicitly
   BOOST_REQUIRE_EQUAL( err(8, "missing role: loanevent"),
                        loan_event(N(alice), musdt("2000.000000"), 30 * DAY_SECONDS, false, N(governance)) );

   BOOST_REQUIRE_EQUAL( success(), revoke(N(lendengine), N(loanevent)) );
   BOOST_REQUIRE_EQUAL( err(8, "missing role: loanevent"), borrow(N(alice), musdt("2000.000000")) );
   BOOST_REQUIRE_EQUAL( err(1, "role not granted"), revoke(N(lendengine), N(loanevent)) );

   // the remaining roles of an account survive a revoke
   BOOST_REQUIRE_EQUAL( success(), revoke(N(governance), N(penalty)) );
   BOOST_REQUIRE_EQUAL( err(8, "missing role: penalty"), deduct(N(alice), pts("1.00000000")) );
   BOOST_REQUIRE_EQUAL( success(), set_param(N(setupgrmult), mvo()("multiplier_bps", 12000)) );

   BOOST_REQUIRE_EQUAL( success(), grant(N(alice), N(loanevent)) );
   BOOST_REQUIRE_EQUAL( success(), loan_event(N(bob), musdt("2000.000000"), 30 * DAY_SECONDS, false, N(alice)) );
   BOOST_REQUIRE_EQUAL( pts("1.00000000"), get_account(N(bob))["locked_points"].as<asset>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( disabled_contract_rejects_entry_points, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( err(8, "no auth for operate"), set_enabled(false, N(alice)) );
   BOOST_REQUIRE_EQUAL( success(), set_enabled(false) );
   BOOST_REQUIRE_EQUAL( false, get_global()["enabled"].as_bool() );

   BOOST_REQUIRE_EQUAL( err(7, "not effective yet"), borrow(N(alice), musdt("2000.000000")) );
   BOOST_REQUIRE_EQUAL( err(7, "not effective yet"), consume(N(alice), 0, 0) );
   BOOST_REQUIRE_EQUAL( err(7, "not effective yet"), deduct(N(alice), pts("1.00000000")) );
   BOOST_REQUIRE_EQUAL( err(7, "not effective yet"), set_param(N(setbatchmax), mvo()("max_size", 10)) );

   // admin actions stay available
   BOOST_REQUIRE_EQUAL( success(), grant(N(alice), N(loanevent)) );

   BOOST_REQUIRE_EQUAL( success(), set_enabled(true) );
   BOOST_REQUIRE_EQUAL( success(), borrow(N(alice), musdt("2000.000000")) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( parameter_validation, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( err(8, "missing role: setparam"),
                        set_param(N(setpenalty), mvo()("early_bps", 0)("late_bps", 100), N(alice)) );

   BOOST_REQUIRE_EQUAL( err(4, "base usd symbol mismatch"),
                        set_param(N(setrewardpar), mvo()("base_usd", pts("1.00000000"))("per_day_bps", 10)("bonus_bps", 500)) );
   BOOST_REQUIRE_EQUAL( err(9, "base usd must be positive"),
                        set_param(N(setrewardpar), mvo()("base_usd", musdt("0.000000"))("per_day_bps", 10)("bonus_bps", 500)) );
   BOOST_REQUIRE_EQUAL( err(5, "bonus bps exceeds 10000"),
                        set_param(N(setrewardpar), mvo()("base_usd", musdt("100.000000"))("per_day_bps", 10)("bonus_bps", 10001)) );

   BOOST_REQUIRE_EQUAL( err(5, "invalid level"),  set_param(N(setlevelmult), mvo()("level", 0)("multiplier_bps", 10000)) );
   BOOST_REQUIRE_EQUAL( err(5, "invalid level"),  set_param(N(setlevelmult), mvo()("level", 6)("multiplier_bps", 10000)) );
   BOOST_REQUIRE_EQUAL( err(9, "multiplier must be positive"),
                        set_param(N(setlevelmult), mvo()("level", 2)("multiplier_bps", 0)) );
   BOOST_REQUIRE_EQUAL( err(5, "invalid level"),
                        set_param(N(setlevelrule), mvo()("level", 1)("min_volume", musdt("1.000000"))
                                                        ("min_eligible_loans", 0)("min_ontime_repays", 0)) );

   BOOST_REQUIRE_EQUAL( err(9, "threshold must be positive"),
                        set_param(N(setdynreward), mvo()("threshold", musdt("0.000000"))("multiplier_bps", 12000)) );
   BOOST_REQUIRE_EQUAL( err(9, "cache expiry must be positive"), set_param(N(setcacheexp), mvo()("seconds", 0)) );
   BOOST_REQUIRE_EQUAL( err(5, "penalty bps exceeds 10000"),
                        set_param(N(setpenalty), mvo()("early_bps", 10001)("late_bps", 0)) );
   BOOST_REQUIRE_EQUAL( err(9, "multiplier must be positive"), set_param(N(setupgrmult), mvo()("multiplier_bps", 0)) );
   BOOST_REQUIRE_EQUAL( err(9, "batch size must be positive"), set_param(N(setbatchmax), mvo()("max_size", 0)) );
   BOOST_REQUIRE_EQUAL( err(11, "batch size exceeds 500"),     set_param(N(setbatchmax), mvo()("max_size", 501)) );
   BOOST_REQUIRE_EQUAL( err(5, "invalid service type"),
                        set_param(N(setcatalog), mvo()("service_type", 5)("provider", "reward.cat")) );
   BOOST_REQUIRE_EQUAL( err(15, "provider account does not exist"),
                        set_param(N(setcatalog), mvo()("service_type", 3)("provider", "nobody")) );
   BOOST_REQUIRE_EQUAL( err(5, "invalid level"),
                        set_param(N(setuserlevel), mvo()("user", "alice")("level", 6)) );
   BOOST_REQUIRE_EQUAL( err(15, "user account does not exist"),
                        set_param(N(setuserlevel), mvo()("user", "nobody")("level", 2)) );

   BOOST_REQUIRE_EQUAL( success(), set_param(N(setpenalty), mvo()("early_bps", 100)("late_bps", 200)) );
   BOOST_REQUIRE_EQUAL( success(), set_param(N(setbatchmax), mvo()("max_size", 2)) );
   BOOST_REQUIRE_EQUAL( success(), set_param(N(setontimewin), mvo()("seconds", 3600)) );
   auto g = get_global();
   BOOST_REQUIRE_EQUAL( 100u, g["early_penalty_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 200u, g["late_penalty_bps"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 2u, g["max_batch_size"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 3600u, g["on_time_window_seconds"].as_uint64() );

   BOOST_REQUIRE_EQUAL( err(11, "batch exceeds 2"),
                        batch_loan({ N(alice), N(bob), N(carol) },
                                   { musdt("1000.000000"), musdt("1000.000000"), musdt("1000.000000") },
                                   { 30 * DAY_SECONDS, 30 * DAY_SECONDS, 30 * DAY_SECONDS }, { 0, 0, 0 }) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( user_level_override, admin_tester ) try {
   auto trace = push_trace(N(reward.core), N(governance), N(setuserlevel), mvo()
      ("submitter", "governance")("user", "alice")("level", 4));
   BOOST_REQUIRE_EQUAL( 4u, level_of(N(alice)) );

   auto pushed = find_actions(trace, N(notifylevel));
   BOOST_REQUIRE_EQUAL( 1u, pushed.size() );
   auto data = action_data(pushed[0]);
   BOOST_REQUIRE_EQUAL( "alice", data["user"].as_string() );
   BOOST_REQUIRE_EQUAL( 1u, data["old_level"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 4u, data["new_level"].as_uint64() );

   // demotion only through the override
   BOOST_REQUIRE_EQUAL( success(), set_param(N(setuserlevel), mvo()("user", "alice")("level", 1)) );
   BOOST_REQUIRE_EQUAL( 1u, level_of(N(alice)) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( telemetry_follows_mint_and_burn, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), borrow(N(alice), musdt("2000.000000")) );
   auto trace = loan_event_trace(N(alice), musdt("0.000000"), 0, true);
   BOOST_REQUIRE_EQUAL( pts("1.00000000"), balance(N(alice)) );

   auto earned = find_actions(trace, N(notifyearned));
   BOOST_REQUIRE_EQUAL( 1u, earned.size() );
   auto data = action_data(earned[0]);
   BOOST_REQUIRE_EQUAL( "alice", data["user"].as_string() );
   BOOST_REQUIRE_EQUAL( pts("1.00000000"), data["quantity"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 1u, find_actions(trace, N(mint)).size() );

   trace = push_trace(N(reward.core), N(governance), N(deductpoints), mvo()
      ("submitter", "governance")("user", "alice")("quantity", pts("1.50000000")));
   BOOST_REQUIRE_EQUAL( pts("0.00000000"), balance(N(alice)) );
   auto burned = find_actions(trace, N(notifyburned));
   BOOST_REQUIRE_EQUAL( 1u, burned.size() );
   BOOST_REQUIRE_EQUAL( pts("1.00000000"), action_data(burned[0])["quantity"].as<asset>() );
   auto debt = find_actions(trace, N(notifydebt));
   BOOST_REQUIRE_EQUAL( 1u, debt.size() );
   BOOST_REQUIRE_EQUAL( pts("0.50000000"), action_data(debt[0])["debt"].as<asset>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( telemetry_can_be_disabled, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), set_telemetry(false, name()) );
   BOOST_REQUIRE_EQUAL( success(), borrow(N(alice), musdt("2000.000000")) );
   auto trace = loan_event_trace(N(alice), musdt("0.000000"), 0, true);

   BOOST_REQUIRE_EQUAL( pts("1.00000000"), balance(N(alice)) );
   BOOST_REQUIRE_EQUAL( 0u, find_actions(trace, N(notifyearned)).size() );
   BOOST_REQUIRE_EQUAL( 0u, find_actions(trace, N(pushfailed)).size() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( missing_sink_does_not_block_ledger, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), set_telemetry(true, N(nosink)) );
   BOOST_REQUIRE_EQUAL( success(), borrow(N(alice), musdt("2000.000000")) );
   auto trace = loan_event_trace(N(alice), musdt("0.000000"), 0, true);

   BOOST_REQUIRE_EQUAL( pts("1.00000000"), balance(N(alice)) );
   BOOST_REQUIRE_EQUAL( 0u, find_actions(trace, N(notifyearned)).size() );

   auto failed = find_actions(trace, N(pushfailed));
   BOOST_REQUIRE_EQUAL( 1u, failed.size() );
   auto data = action_data(failed[0]);
   BOOST_REQUIRE_EQUAL( "earned", data["data_type"].as_string() );
   BOOST_REQUIRE_EQUAL( "alice", data["user"].as_string() );
   BOOST_REQUIRE_EQUAL( "telemetry sink not found: nosink", data["reason"].as_string() );

   // pushes resume once the sink exists
   BOOST_REQUIRE_EQUAL( success(), set_telemetry(true, N(carol)) );
   BOOST_REQUIRE_EQUAL( success(), borrow(N(alice), musdt("2000.000000")) );
   trace = loan_event_trace(N(alice), musdt("0.000000"), 0, true);
   BOOST_REQUIRE_EQUAL( 1u, find_actions(trace, N(notifyearned)).size() );
   BOOST_REQUIRE_EQUAL( pts("2.00000000"), balance(N(alice)) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( privilege_push_is_packed, admin_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), set_config(0, 2, pts("1.00000000"), 30 * DAY_SECONDS) );
   BOOST_REQUIRE_EQUAL( success(), set_config(4, 1, pts("1.00000000"), 30 * DAY_SECONDS) );
   BOOST_REQUIRE_EQUAL( success(), fund(N(alice), pts("5.00000000")) );

   auto trace = push_trace(N(reward.core), N(alice), N(consume), mvo()
      ("user", "alice")("service_type", 0)("service_level", 2));
   auto pushed = find_actions(trace, N(notifypriv));
   BOOST_REQUIRE_EQUAL( 1u, pushed.size() );
   // access bit 0, level 2 in bits 8..11
   BOOST_REQUIRE_EQUAL( 513u, action_data(pushed[0])["privileges"].as_uint64() );

   trace = push_trace(N(reward.core), N(alice), N(consume), mvo()
      ("user", "alice")("service_type", 4)("service_level", 1));
   pushed = find_actions(trace, N(notifypriv));
   BOOST_REQUIRE_EQUAL( 1u, pushed.size() );
   // 1 << 24 | 2 << 8 | 1 << 4 | 1
   BOOST_REQUIRE_EQUAL( 16777745u,action_data(pushed[0])["privileges"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( batch_pushes_stats, admin_tester ) try {
   auto trace = push_trace(N(reward.core), N(lendengine), N(onbatchloan), mvo()
      ("submitter",  "lendengine")
      ("users",      to_variants(vector<account_name>{ N(alice), N(bob) }))
      ("principals", to_variants(vector<asset>{ musdt("2000.000000"), musdt("500.000000") }))
      ("terms",      to_variants(vector<uint64_t>{ 30 * DAY_SECONDS, 30 * DAY_SECONDS }))
      ("outcomes",   to_variants(vector<uint8_t>{ 0, 0 })));

   auto stats = find_actions(trace, N(notifystats));
   BOOST_REQUIRE_EQUAL( 1u, stats.size() );
   auto data = action_data(stats[0]);
   BOOST_REQUIRE_EQUAL( 1u, data["total_batch_ops"].as_uint64() );
   BOOST_REQUIRE_EQUAL( pts("1.00000000"), data["batch_points"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 1u, get_global()["total_batch_ops"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
