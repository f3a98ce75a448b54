#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <reward.core/reward.core.db.hpp>
#include <reward.catalog/reward.catalog.db.hpp>
#include <reward.points/reward.points.hpp>

namespace rewardfi {

using std::string;
using std::vector;

using namespace eosio;

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   RECORD_EXISTING      = 2,
   SYMBOL_MISMATCH      = 4,
   PARAM_ERROR          = 5,
   PAUSED               = 7,
   NO_AUTH              = 8,
   NOT_POSITIVE         = 9,
   OVERSIZED            = 11,
   TIME_PREMATURE       = 13,
   ACCOUNT_INVALID      = 15,
   STATUS_ERROR         = 18,
   UNAVAILABLE_PURCHASE = 20,
   INSUFFICIENT_BALANCE = 23,
   SYSTEM_ERROR         = 200

};

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

/**
 * Read handle of one service catalog provider, resolved through the `catalogs` table.
 */
struct catalog_handle {
   name        provider;
   uint8_t     service_type;

   service_config_t get_config(const uint8_t& level) const {
      service_config_t::tbl_t confs(provider, service_type);
      auto itr = confs.find(level);
      CHECKC( itr != confs.end(), err::RECORD_NOT_FOUND, "service config not found" )
      return *itr;
   }

   uint32_t get_cooldown_seconds() const {
      service_meta_t::tbl_t metas(provider, provider.value);
      auto itr = metas.find(service_type);
      return itr == metas.end() ? 0 : itr->cooldown_seconds;
   }
};

/**
 * The `reward.core` contract keeps the points incentive ledger of the lending platform.
 *
 * Loan events reported by the lending engine lock one point per eligible borrow. The lock is
 * released (minted, after offsetting any debt) when the loan is repaid on time and in full,
 * or forfeited with a penalty burn otherwise. A penalty that the balance cannot cover is kept
 * as debt and offset against future releases.
 *
 * Users spend points on the services listed by the catalog providers. Each purchase burns the
 * price, appends a consumption record, stamps the per service cooldown and refreshes the
 * privilege summary of the user.
 *
 * Lifetime counters drive the user level, which maps to a reward multiplier used by the
 * reward estimate.
 */
class [[eosio::contract("reward.core")]] reward_core : public contract {
   public:
      using contract::contract;

   reward_core(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value),
        _global_state(global_state::make_global(get_self()))
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~reward_core() { _global.set( _gstate, get_self() );
      _global_state->save(get_self());
   }

   //admin
   ACTION init(const name& admin, const name& points_contract);
   ACTION setenabled(const bool& enabled);
   ACTION grantrole(const name& account, const name& role);
   ACTION revokerole(const name& account, const name& role);

   //role: setparam
   ACTION setrewardpar(const name& submitter, const asset& base_usd, const uint64_t& per_day_bps, const uint64_t& bonus_bps);
   ACTION setlevelmult(const name& submitter, const uint8_t& level, const uint64_t& multiplier_bps);
   ACTION setlevelrule(const name& submitter, const uint8_t& level, const asset& min_volume,
                       const uint64_t& min_eligible_loans, const uint64_t& min_ontime_repays);
   ACTION setdynreward(const name& submitter, const asset& threshold, const uint64_t& multiplier_bps);
   ACTION setcacheexp(const name& submitter, const uint32_t& seconds);
   ACTION setontimewin(const name& submitter, const uint32_t& seconds);
   ACTION setpenalty(const name& submitter, const uint64_t& early_bps, const uint64_t& late_bps);
   ACTION setupgrmult(const name& submitter, const uint64_t& multiplier_bps);
   ACTION setbatchmax(const name& submitter, const uint16_t& max_size);
   ACTION settelemetry(const name& submitter, const bool& enabled, const name& sink);
   ACTION setcatalog(const name& submitter, const uint8_t& service_type, const name& provider);
   ACTION setuserlevel(const name& submitter, const name& user, const uint8_t& level);

   //role: loanevent
   /**
    * Aggregate loan event: `term_seconds > 0` is a borrow, `term_seconds == 0` a repay.
    *
    * @param ontime_full - repay only, true when repaid on time and in full
    */
   ACTION onloanevent(const name& submitter, const name& user, const asset& principal,
                      const uint64_t& term_seconds, const bool& ontime_full);

   /**
    * Per-order loan event, idempotent on `order_id`.
    *
    * @param outcome - 0 borrow, 1 on-time full repay, 2 early full repay, 3 late full repay
    */
   ACTION onloanorder(const name& submitter, const name& user, const uint64_t& order_id,
                      const asset& principal, const time_point_sec& maturity, const uint8_t& outcome);

   /**
    * Batch of aggregate loan events, `outcomes[i] != 0` means on time and in full.
    */
   ACTION onbatchloan(const name& submitter, const vector<name>& users, const vector<asset>& principals,
                      const vector<uint64_t>& terms, const vector<uint8_t>& outcomes);

   ACTION calcreward(const name& submitter, const name& user, const asset& principal,
                     const uint64_t& term_seconds, const bool& healthy);

   //role: setparam
   ACTION clearcache(const name& submitter, const name& user);

   //role: penalty
   ACTION deductpoints(const name& submitter, const name& user, const asset& quantity);

   //user
   ACTION consume(const name& user, const uint8_t& service_type, const uint8_t& service_level);
   ACTION upgrade(const name& user, const uint8_t& service_type, const uint8_t& new_level);

   //role: consume
   ACTION batchconsume(const name& submitter, const vector<name>& users,
                       const vector<uint8_t>& service_types, const vector<uint8_t>& service_levels);

   ACTION notifyearned(const name& user, const asset& quantity, const string& memo);
   using notifyearned_action  = action_wrapper<"notifyearned"_n,  &reward_core::notifyearned>;
   ACTION notifyburned(const name& user, const asset& quantity, const string& memo);
   using notifyburned_action  = action_wrapper<"notifyburned"_n,  &reward_core::notifyburned>;
   ACTION notifydebt(const name& user, const asset& debt);
   using notifydebt_action    = action_wrapper<"notifydebt"_n,    &reward_core::notifydebt>;
   ACTION notifylevel(const name& user, const uint8_t& old_level, const uint8_t& new_level);
   using notifylevel_action   = action_wrapper<"notifylevel"_n,   &reward_core::notifylevel>;
   ACTION notifypriv(const name& user, const uint64_t& privileges);
   using notifypriv_action    = action_wrapper<"notifypriv"_n,    &reward_core::notifypriv>;
   ACTION notifystats(const uint64_t& total_batch_ops, const asset& total_cached_rewards, const asset& batch_points);
   using notifystats_action   = action_wrapper<"notifystats"_n,   &reward_core::notifystats>;
   ACTION pushfailed(const name& data_type, const name& user, const string& reason);
   using pushfailed_action    = action_wrapper<"pushfailed"_n,    &reward_core::pushfailed>;

   private:
      //accrual
      asset _on_loan_event( const name& user, const asset& principal, const uint64_t& term_seconds, const bool& ontime_full );
      void _check_principal( const name& user, const asset& principal );
      void _touch_activity( account_t& acct, const asset& principal, const bool& is_borrow );
      void _release( account_t& acct, const asset& locked, const string& memo );
      void _forfeit( account_t& acct, const asset& locked, const uint64_t& penalty_bps, const string& memo );
      void _charge( account_t& acct, const asset& penalty, const string& memo );
      void _promote( account_t& acct );

      //consumption
      asset _consume( const name& user, const uint8_t& service_type, const uint8_t& service_level, const bool& is_upgrade );
      catalog_handle _resolve_catalog( const uint8_t& service_type );
      privilege_t _refresh_privilege( const name& user );

      //points
      asset _balance_of( const name& user );
      void _mint( const name& user, const asset& quantity, const string& memo );
      void _burn( const name& user, const asset& quantity, const string& memo );

      account_t _load_account( const name& user );
      void _save_account( const account_t& acct );

      void _require_role( const name& caller, const name& role );
      bool _has_role( const name& account, const name& role );
      void _require_admin();

      //telemetry
      bool _telemetry_ready( const name& data_type, const name& user );
      void _push_debt( const account_t& acct );
      void _push_level( const name& user, const uint8_t& old_level, const uint8_t& new_level );
      void _push_privileges( const privilege_t& priv );
      void _push_stats( const asset& batch_points );

      global_singleton     _global;
      global_t             _gstate;
      global_state::ptr_t  _global_state;

      map<name, int64_t>   _pending_deltas;      //mint/burn sent inline but not yet applied by the points contract
};
} //namespace rewardfi
