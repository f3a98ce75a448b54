#include <reward.core/reward.core.hpp>
#include <reward.core.utils.hpp>

#include <eosio/time.hpp>

namespace rewardfi {
using namespace std;

void reward_core::onloanevent(const name& submitter, const name& user, const asset& principal,
                              const uint64_t& term_seconds, const bool& ontime_full) {
   _require_role( submitter, role::LOAN_EVENT );

   _on_loan_event( user, principal, term_seconds, ontime_full );
}

void reward_core::onloanorder(const name& submitter, const name& user, const uint64_t& order_id,
                              const asset& principal, const time_point_sec& maturity, const uint8_t& outcome) {
   _require_role( submitter, role::LOAN_EVENT );
   CHECKC( outcome <= loan_outcome::REPAY_LATE_FULL, err::PARAM_ERROR, "invalid loan outcome" )
   _check_principal( user, principal );

   auto now = time_point_sec(current_time_point());
   order_lock_t::tbl_t locks(_self, _self.value);
   auto itr = locks.find(order_id);

   if (outcome == loan_outcome::BORROW) {
      if (itr != locks.end()) return;     //order already seen, live or settled
      CHECKC( maturity > now, err::PARAM_ERROR, "maturity must be in the future" )

      auto acct = _load_account(user);
      _touch_activity( acct, principal, true );
      auto locked = asset(0, POINTS);
      if (is_eligible_principal(principal)) {
         locked = one_point();
         acct.eligible_loan_count++;
      }
      locks.emplace(_self, [&](auto& l) {
         l.order_id        = order_id;
         l.borrower        = user;
         l.locked_points   = locked;
         l.maturity        = maturity;
         l.created_at      = now;
      });
      _promote( acct );
      _save_account( acct );
      return;
   }

   if (itr == locks.end()) return;        //unknown order
   CHECKC( itr->borrower == user, err::NO_AUTH, "order borrower mismatch" )
   if (itr->is_settled()) return;         //repeated repay callback

   auto locked = itr->locked_points;
   locks.modify(itr, same_payer, [&](auto& l) {
      l.settled_at      = now;
      l.outcome         = outcome;
   });

   auto acct = _load_account(user);
   _touch_activity( acct, principal, false );
   switch (outcome) {
      case loan_outcome::REPAY_ONTIME_FULL:
         _release( acct, locked, "order " + to_string(order_id) + " repaid on time" );
         acct.ontime_repay_count++;
         break;
      case loan_outcome::REPAY_EARLY_FULL:
         _forfeit( acct, locked, _gstate.early_penalty_bps, "order " + to_string(order_id) + " repaid early" );
         break;
      default:
         _forfeit( acct, locked, _gstate.late_penalty_bps, "order " + to_string(order_id) + " repaid late" );
         break;
   }
   _promote( acct );
   _save_account( acct );
}

void reward_core::onbatchloan(const name& submitter, const vector<name>& users, const vector<asset>& principals,
                              const vector<uint64_t>& terms, const vector<uint8_t>& outcomes) {
   _require_role( submitter, role::LOAN_EVENT );

   auto size = users.size();
   CHECKC( size > 0, err::PARAM_ERROR, "empty batch" )
   CHECKC( principals.size() == size && terms.size() == size && outcomes.size() == size,
           err::PARAM_ERROR, "batch length mismatch" )
   CHECKC( size <= _gstate.max_batch_size, err::OVERSIZED, "batch exceeds " + to_string(_gstate.max_batch_size) )

   auto batch_points = asset(0, POINTS);
   for (size_t i = 0; i < size; i++) {
      batch_points += _on_loan_event( users[i], principals[i], terms[i], outcomes[i] != 0 );
   }

   _gstate.total_batch_ops++;
   _push_stats( batch_points );
}

void reward_core::deductpoints(const name& submitter, const name& user, const asset& quantity) {
   _require_role( submitter, role::PENALTY );
   CHECKC( is_account(user),           err::ACCOUNT_INVALID,  "user account does not exist" )
   CHECKC( quantity.symbol == POINTS,  err::SYMBOL_MISMATCH,  "points symbol mismatch" )
   CHECKC( quantity.amount > 0,        err::NOT_POSITIVE,     "penalty must be positive" )

   auto acct = _load_account(user);
   _charge( acct, quantity, "penalty" );
   _save_account( acct );
}

void reward_core::calcreward(const name& submitter, const name& user, const asset& principal,
                             const uint64_t& term_seconds, const bool& healthy) {
   _require_role( submitter, role::LOAN_EVENT );
   _check_principal( user, principal );
   CHECKC( term_seconds > 0,                  err::NOT_POSITIVE, "term must be positive" )
   CHECKC( term_seconds <= MAX_TERM_SECONDS,  err::OVERSIZED,    "term exceeds " + to_string(MAX_TERM_SECONDS) + " seconds" )

   auto now = time_point_sec(current_time_point());
   reward_cache_t::tbl_t caches(_self, _self.value);
   auto itr = caches.find(user.value);
   if (itr != caches.end() && itr->expired_at > now) {
      print("cached reward: ", itr->expected_points, "\n");
      return;
   }

   account_t::tbl_t accounts(_self, _self.value);
   auto acct_itr = accounts.find(user.value);
   auto level = acct_itr == accounts.end() ? MIN_LEVEL : acct_itr->level;
   auto mult_itr = _gstate.level_multipliers.find(level);
   auto level_multiplier = mult_itr == _gstate.level_multipliers.end() ? PCT_BOOST : mult_itr->second;

   auto expected = calc_expected_points( principal, term_seconds, healthy,
                                         _gstate.base_usd, _gstate.per_day_bps, _gstate.bonus_bps,
                                         level_multiplier, _gstate.dyn_threshold, _gstate.dyn_multiplier_bps );

   auto expired_at = add_seconds( now, _gstate.cache_expiry_seconds );
   if (itr == caches.end()) {
      caches.emplace(_self, [&](auto& c) {
         c.owner              = user;
         c.expected_points    = expected;
         c.cached_at          = now;
         c.expired_at         = expired_at;
      });
   } else {
      _gstate.total_cached_rewards -= itr->expected_points;
      caches.modify(itr, same_payer, [&](auto& c) {
         c.expected_points    = expected;
         c.cached_at          = now;
         c.expired_at         = expired_at;
      });
   }
   _gstate.total_cached_rewards += expected;
   print("expected reward: ", expected, "\n");

   _push_stats( asset(0, POINTS) );
}

void reward_core::clearcache(const name& submitter, const name& user) {
   _require_role( submitter, role::SET_PARAM );

   reward_cache_t::tbl_t caches(_self, _self.value);
   auto itr = caches.find(user.value);
   if (itr == caches.end()) return;

   _gstate.total_cached_rewards -= itr->expected_points;
   caches.erase(itr);
}

/**
 * Single aggregate loan event, returns the points locked by it.
 */
asset reward_core::_on_loan_event( const name& user, const asset& principal, const uint64_t& term_seconds, const bool& ontime_full ) {
   _check_principal( user, principal );
   CHECKC( term_seconds <= MAX_TERM_SECONDS, err::OVERSIZED, "term exceeds " + to_string(MAX_TERM_SECONDS) + " seconds" )

   auto now    = time_point_sec(current_time_point());
   auto locked = asset(0, POINTS);
   auto acct   = _load_account(user);
   _touch_activity( acct, principal, term_seconds > 0 );

   if (term_seconds > 0) {
      if (is_eligible_principal(principal)) {
         locked                  = one_point();
         acct.eligible_loan_count++;
         acct.locked_points      += locked;
         acct.locked_maturity    = add_seconds(now, term_seconds);
      }

   } else {
      auto to_settle = acct.locked_points;
      auto maturity  = acct.locked_maturity;
      acct.locked_points   = asset(0, POINTS);
      acct.locked_maturity = time_point_sec();

      if (ontime_full) {
         _release( acct, to_settle, "repaid on time" );
         acct.ontime_repay_count++;

      } else {
         bool early = (uint64_t)now.sec_since_epoch() + _gstate.on_time_window_seconds < (uint64_t)maturity.sec_since_epoch();
         if (early)
            _forfeit( acct, to_settle, _gstate.early_penalty_bps, "repaid early" );
         else
            _forfeit( acct, to_settle, _gstate.late_penalty_bps, "repaid late" );
      }
   }

   _promote( acct );
   _save_account( acct );
   return locked;
}

void reward_core::_check_principal( const name& user, const asset& principal ) {
   CHECKC( is_account(user),            err::ACCOUNT_INVALID,  "user account does not exist: " + user.to_string() )
   CHECKC( principal.symbol == MUSDT,   err::SYMBOL_MISMATCH,  "principal symbol mismatch" )
   CHECKC( principal.amount >= 0,       err::NOT_POSITIVE,     "principal must not be negative" )
}

void reward_core::_touch_activity( account_t& acct, const asset& principal, const bool& is_borrow ) {
   acct.last_activity_at = current_time_point();
   if (!is_borrow) return;

   acct.total_loan_count++;
   acct.total_volume += principal;
}

void reward_core::_release( account_t& acct, const asset& locked, const string& memo ) {
   if (locked.amount == 0) return;

   auto debt_before = acct.debt;
   auto payout = offset_debt( acct.debt, locked );
   if (acct.debt != debt_before) {
      _gstate.total_debt -= (debt_before - acct.debt);
      _push_debt( acct );
   }
   _mint( acct.owner, payout, memo );
}

void reward_core::_forfeit( account_t& acct, const asset& locked, const uint64_t& penalty_bps, const string& memo ) {
   _charge( acct, calc_bps_quant(locked, penalty_bps), memo );
}

/**
 * Burn what the balance covers, the shortfall becomes debt.
 */
void reward_core::_charge( account_t& acct, const asset& penalty, const string& memo ) {
   if (penalty.amount == 0) return;

   auto balance   = _balance_of( acct.owner );
   auto burnable  = balance < penalty ? balance : penalty;
   if (burnable.amount > 0)
      _burn( acct.owner, burnable, memo );

   auto shortfall = penalty - burnable;
   if (shortfall.amount > 0) {
      acct.debt            += shortfall;
      _gstate.total_debt   += shortfall;
      _push_debt( acct );
   }
}

/**
 * Move up while the next level's thresholds are all met, never down.
 */
void reward_core::_promote( account_t& acct ) {
   level_rule_t::tbl_t rules(_self, _self.value);
   auto level = acct.level;
   while (level < MAX_LEVEL) {
      auto itr = rules.find(level + 1);
      if (itr == rules.end() || !itr->satisfied_by(acct)) break;
      level++;
   }
   if (level == acct.level) return;

   auto old_level = acct.level;
   acct.level = level;
   _push_level( acct.owner, old_level, level );
}

} //namespace rewardfi
