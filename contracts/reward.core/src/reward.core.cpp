#include <reward.core/reward.core.hpp>
#include <reward.core.utils.hpp>

#include <eosio/time.hpp>

namespace rewardfi {
using namespace std;

#define NOTIFY_ACTION( action_t, ... ) \
     { reward_core::action_t act{ _self, { {_self, active_perm} } };\
	        act.send( __VA_ARGS__ );}

void reward_core::init(const name& admin, const name& points_contract) {
   require_auth( _self );
   CHECKC( is_account(admin),            err::ACCOUNT_INVALID, "admin account does not exist" )
   CHECKC( is_account(points_contract),  err::ACCOUNT_INVALID, "points contract does not exist" )

   _gstate.admin              = admin;
   _gstate.points_contract    = points_contract;
   _gstate.enabled            = true;

   level_rule_t::tbl_t rules(_self, _self.value);
   if (rules.begin() != rules.end()) return;

   const uint8_t  levels[]    = { 2,      3,      4,       5 };
   const int64_t  volumes[]   = { 10'000, 50'000, 200'000, 1'000'000 };    //MUSDT
   const uint64_t eligibles[] = { 3,      20,     50,      100 };
   const uint64_t ontimes[]   = { 1,      15,     40,      90 };
   for (size_t i = 0; i < 4; i++) {
      rules.emplace(_self, [&](auto& r) {
         r.level              = levels[i];
         r.min_volume         = asset(volumes[i] * 1'000000, MUSDT);
         r.min_eligible_loans = eligibles[i];
         r.min_ontime_repays  = ontimes[i];
      });
   }
}

void reward_core::setenabled(const bool& enabled) {
   _require_admin();
   _gstate.enabled = enabled;
}

void reward_core::grantrole(const name& account, const name& role) {
   _require_admin();
   CHECKC( is_account(account), err::ACCOUNT_INVALID, "account does not exist" )
   CHECKC( role == role::LOAN_EVENT || role == role::SET_PARAM || role == role::PENALTY || role == role::CONSUME,
           err::PARAM_ERROR, "unknown role: " + role.to_string() )

   role_t::tbl_t roles(_self, _self.value);
   auto itr = roles.find(account.value);
   if (itr == roles.end()) {
      roles.emplace(_self, [&](auto& r) {
         r.account = account;
         r.roles.insert(role);
      });
      return;
   }
   CHECKC( itr->roles.count(role) == 0, err::RECORD_EXISTING, "role already granted" )
   roles.modify(itr, same_payer, [&](auto& r) {
      r.roles.insert(role);
   });
}

void reward_core::revokerole(const name& account, const name& role) {
   _require_admin();

   role_t::tbl_t roles(_self, _self.value);
   auto itr = roles.find(account.value);
   CHECKC( itr != roles.end() && itr->roles.count(role) > 0, err::RECORD_NOT_FOUND, "role not granted" )
   if (itr->roles.size() == 1) {
      roles.erase(itr);
      return;
   }
   roles.modify(itr, same_payer, [&](auto& r) {
      r.roles.erase(role);
   });
}

void reward_core::setrewardpar(const name& submitter, const asset& base_usd, const uint64_t& per_day_bps, const uint64_t& bonus_bps) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( base_usd.symbol == MUSDT,   err::SYMBOL_MISMATCH,  "base usd symbol mismatch" )
   CHECKC( base_usd.amount > 0,        err::NOT_POSITIVE,     "base usd must be positive" )
   CHECKC( per_day_bps <= PCT_BOOST,   err::PARAM_ERROR,      "per day bps exceeds 10000" )
   CHECKC( bonus_bps <= PCT_BOOST,     err::PARAM_ERROR,      "bonus bps exceeds 10000" )

   _gstate.base_usd     = base_usd;
   _gstate.per_day_bps  = per_day_bps;
   _gstate.bonus_bps    = bonus_bps;
}

void reward_core::setlevelmult(const name& submitter, const uint8_t& level, const uint64_t& multiplier_bps) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( level >= MIN_LEVEL && level <= MAX_LEVEL, err::PARAM_ERROR,   "invalid level" )
   CHECKC( multiplier_bps > 0,                        err::NOT_POSITIVE,  "multiplier must be positive" )

   _gstate.level_multipliers[level] = multiplier_bps;
}

void reward_core::setlevelrule(const name& submitter, const uint8_t& level, const asset& min_volume,
                               const uint64_t& min_eligible_loans, const uint64_t& min_ontime_repays) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( level > MIN_LEVEL && level <= MAX_LEVEL,   err::PARAM_ERROR,      "invalid level" )
   CHECKC( min_volume.symbol == MUSDT,                err::SYMBOL_MISMATCH,  "volume symbol mismatch" )
   CHECKC( min_volume.amount >= 0,                    err::NOT_POSITIVE,     "volume must not be negative" )

   level_rule_t::tbl_t rules(_self, _self.value);
   auto itr = rules.find(level);
   if (itr == rules.end()) {
      rules.emplace(_self, [&](auto& r) {
         r.level              = level;
         r.min_volume         = min_volume;
         r.min_eligible_loans = min_eligible_loans;
         r.min_ontime_repays  = min_ontime_repays;
      });
      return;
   }
   rules.modify(itr, same_payer, [&](auto& r) {
      r.min_volume         = min_volume;
      r.min_eligible_loans = min_eligible_loans;
      r.min_ontime_repays  = min_ontime_repays;
   });
}

void reward_core::setdynreward(const name& submitter, const asset& threshold, const uint64_t& multiplier_bps) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( threshold.symbol == MUSDT,  err::SYMBOL_MISMATCH,  "threshold symbol mismatch" )
   CHECKC( threshold.amount > 0,       err::NOT_POSITIVE,     "threshold must be positive" )
   CHECKC( multiplier_bps > 0,         err::NOT_POSITIVE,     "multiplier must be positive" )

   _gstate.dyn_threshold      = threshold;
   _gstate.dyn_multiplier_bps = multiplier_bps;
}

void reward_core::setcacheexp(const name& submitter, const uint32_t& seconds) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( seconds > 0, err::NOT_POSITIVE, "cache expiry must be positive" )
   _gstate.cache_expiry_seconds = seconds;
}

void reward_core::setontimewin(const name& submitter, const uint32_t& seconds) {
   _require_role( submitter, role::SET_PARAM );
   _gstate.on_time_window_seconds = seconds;
}

void reward_core::setpenalty(const name& submitter, const uint64_t& early_bps, const uint64_t& late_bps) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( early_bps <= PCT_BOOST && late_bps <= PCT_BOOST, err::PARAM_ERROR, "penalty bps exceeds 10000" )

   _gstate.early_penalty_bps  = early_bps;
   _gstate.late_penalty_bps   = late_bps;
}

void reward_core::setupgrmult(const name& submitter, const uint64_t& multiplier_bps) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( multiplier_bps > 0, err::NOT_POSITIVE, "multiplier must be positive" )
   _gstate.upgrade_multiplier_bps = multiplier_bps;
}

void reward_core::setbatchmax(const name& submitter, const uint16_t& max_size) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( max_size > 0,                err::NOT_POSITIVE,  "batch size must be positive" )
   CHECKC( max_size <= MAX_BATCH_LIMIT, err::OVERSIZED,     "batch size exceeds " + to_string(MAX_BATCH_LIMIT) )
   _gstate.max_batch_size = max_size;
}

void reward_core::settelemetry(const name& submitter, const bool& enabled, const name& sink) {
   _require_role( submitter, role::SET_PARAM );
   _gstate.telemetry_enabled  = enabled;
   _gstate.telemetry_sink     = sink;
}

void reward_core::setcatalog(const name& submitter, const uint8_t& service_type, const name& provider) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( service_type < SERVICE_TYPE_COUNT, err::PARAM_ERROR,      "invalid service type" )
   CHECKC( is_account(provider),              err::ACCOUNT_INVALID,  "provider account does not exist" )

   catalog_t::tbl_t catalogs(_self, _self.value);
   auto itr = catalogs.find(service_type);
   if (itr == catalogs.end()) {
      catalogs.emplace(_self, [&](auto& c) {
         c.service_type = service_type;
         c.provider     = provider;
      });
      return;
   }
   catalogs.modify(itr, same_payer, [&](auto& c) {
      c.provider = provider;
   });
}

void reward_core::setuserlevel(const name& submitter, const name& user, const uint8_t& level) {
   _require_role( submitter, role::SET_PARAM );
   CHECKC( level >= MIN_LEVEL && level <= MAX_LEVEL, err::PARAM_ERROR,     "invalid level" )
   CHECKC( is_account(user),                          err::ACCOUNT_INVALID, "user account does not exist" )

   auto acct = _load_account(user);
   auto old_level = acct.level;
   acct.level = level;
   _save_account(acct);
   if (old_level != level)
      _push_level(user, old_level, level);
}

void reward_core::notifyearned(const name& user, const asset& quantity, const string& memo) {
   require_auth(get_self());
   require_recipient(get_self());
}

void reward_core::notifyburned(const name& user, const asset& quantity, const string& memo) {
   require_auth(get_self());
   require_recipient(get_self());
}

void reward_core::notifydebt(const name& user, const asset& debt) {
   require_auth(get_self());
   require_recipient(get_self());
}

void reward_core::notifylevel(const name& user, const uint8_t& old_level, const uint8_t& new_level) {
   require_auth(get_self());
   require_recipient(get_self());
}

void reward_core::notifypriv(const name& user, const uint64_t& privileges) {
   require_auth(get_self());
   require_recipient(get_self());
}

void reward_core::notifystats(const uint64_t& total_batch_ops, const asset& total_cached_rewards, const asset& batch_points) {
   require_auth(get_self());
   require_recipient(get_self());
}

void reward_core::pushfailed(const name& data_type, const name& user, const string& reason) {
   require_auth(get_self());
   require_recipient(get_self());
}

asset reward_core::_balance_of( const name& user ) {
   auto balance = reward_points::get_balance(_gstate.points_contract, user, POINTS);
   auto itr = _pending_deltas.find(user);
   if (itr != _pending_deltas.end())
      balance.amount += itr->second;
   return balance;
}

void reward_core::_mint( const name& user, const asset& quantity, const string& memo ) {
   if (quantity.amount == 0) return;

   MINT( _gstate.points_contract, user, quantity, memo )
   _pending_deltas[user]   += quantity.amount;
   _gstate.total_minted    += quantity;

   if (_telemetry_ready("earned"_n, user))
      NOTIFY_ACTION( notifyearned_action, user, quantity, memo )
}

void reward_core::_burn( const name& user, const asset& quantity, const string& memo ) {
   if (quantity.amount == 0) return;

   BURN( _gstate.points_contract, user, quantity, memo )
   _pending_deltas[user]   -= quantity.amount;
   _gstate.total_burned    += quantity;

   if (_telemetry_ready("burned"_n, user))
      NOTIFY_ACTION( notifyburned_action, user, quantity, memo )
}

account_t reward_core::_load_account( const name& user ) {
   account_t::tbl_t accounts(_self, _self.value);
   auto itr = accounts.find(user.value);
   if (itr != accounts.end()) return *itr;

   account_t acct(user);
   acct.created_at = current_time_point();
   return acct;
}

void reward_core::_save_account( const account_t& acct ) {
   account_t::tbl_t accounts(_self, _self.value);
   auto itr = accounts.find(acct.owner.value);
   if (itr == accounts.end()) {
      accounts.emplace(_self, [&](auto& a) { a = acct; });
   } else {
      accounts.modify(itr, same_payer, [&](auto& a) { a = acct; });
   }
}

void reward_core::_require_admin() {
   CHECKC( _gstate.admin != name(), err::STATUS_ERROR, "contract not initialized" )
   CHECKC( has_auth(_self) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operate" )
}

bool reward_core::_has_role( const name& account, const name& role ) {
   role_t::tbl_t roles(_self, _self.value);
   auto itr = roles.find(account.value);
   return itr != roles.end() && itr->roles.count(role) > 0;
}

void reward_core::_require_role( const name& caller, const name& role ) {
   require_auth( caller );
   CHECKC( _gstate.enabled,          err::PAUSED,   "not effective yet" )
   CHECKC( _has_role(caller, role),  err::NO_AUTH,  "missing role: " + role.to_string() )
}

bool reward_core::_telemetry_ready( const name& data_type, const name& user ) {
   if (!_gstate.telemetry_enabled) return false;

   if (_gstate.telemetry_sink != name() && !is_account(_gstate.telemetry_sink)) {
      NOTIFY_ACTION( pushfailed_action, data_type, user, "telemetry sink not found: " + _gstate.telemetry_sink.to_string() )
      return false;
   }
   return true;
}

void reward_core::_push_debt( const account_t& acct ) {
   if (_telemetry_ready("debt"_n, acct.owner))
      NOTIFY_ACTION( notifydebt_action, acct.owner, acct.debt )
}

void reward_core::_push_level( const name& user, const uint8_t& old_level, const uint8_t& new_level ) {
   if (_telemetry_ready("level"_n, user))
      NOTIFY_ACTION( notifylevel_action, user, old_level, new_level )
}

void reward_core::_push_privileges( const privilege_t& priv ) {
   if (_telemetry_ready("privilege"_n, priv.owner))
      NOTIFY_ACTION( notifypriv_action, priv.owner, pack_privileges(priv.services) )
}

void reward_core::_push_stats( const asset& batch_points ) {
   if (_telemetry_ready("stats"_n, _self))
      NOTIFY_ACTION( notifystats_action, _gstate.total_batch_ops, _gstate.total_cached_rewards, batch_points )
}

} //namespace rewardfi
