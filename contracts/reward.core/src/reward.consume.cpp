#include <reward.core/reward.core.hpp>
#include <reward.core.utils.hpp>

#include <eosio/time.hpp>

namespace rewardfi {
using namespace std;

void reward_core::consume(const name& user, const uint8_t& service_type, const uint8_t& service_level) {
   require_auth( user );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   _consume( user, service_type, service_level, false );
}

void reward_core::upgrade(const name& user, const uint8_t& service_type, const uint8_t& new_level) {
   require_auth( user );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   _consume( user, service_type, new_level, true );
}

/**
 * Any failing item fails the whole batch.
 */
void reward_core::batchconsume(const name& submitter, const vector<name>& users,
                               const vector<uint8_t>& service_types, const vector<uint8_t>& service_levels) {
   _require_role( submitter, role::CONSUME );

   auto size = users.size();
   CHECKC( size > 0, err::PARAM_ERROR, "empty batch" )
   CHECKC( service_types.size() == size && service_levels.size() == size, err::PARAM_ERROR, "batch length mismatch" )
   CHECKC( size <= _gstate.max_batch_size, err::OVERSIZED, "batch exceeds " + to_string(_gstate.max_batch_size) )

   auto batch_points = asset(0, POINTS);
   for (size_t i = 0; i < size; i++) {
      CHECKC( is_account(users[i]), err::ACCOUNT_INVALID, "user account does not exist: " + users[i].to_string() )
      batch_points += _consume( users[i], service_types[i], service_levels[i], false );
   }

   _gstate.total_batch_ops++;
   _push_stats( batch_points );
}

/**
 * Purchase or upgrade one service level, returns the points burnt.
 */
asset reward_core::_consume( const name& user, const uint8_t& service_type, const uint8_t& service_level, const bool& is_upgrade ) {
   CHECKC( service_type < SERVICE_TYPE_COUNT,   err::PARAM_ERROR, "invalid service type" )
   CHECKC( service_level < SERVICE_LEVEL_COUNT, err::PARAM_ERROR, "invalid service level" )

   auto catalog = _resolve_catalog( service_type );
   auto conf    = catalog.get_config( service_level );
   CHECKC( conf.is_active,             err::UNAVAILABLE_PURCHASE, "service not available" )
   CHECKC( conf.price.symbol == POINTS, err::SYMBOL_MISMATCH,     "service price symbol mismatch" )

   auto now = time_point_sec(current_time_point());
   cooldown_t::tbl_t cooldowns(_self, user.value);
   auto cd_itr = cooldowns.find(service_type);
   if (cd_itr != cooldowns.end()) {
      auto ready_at = add_seconds( cd_itr->last_consumed_at, catalog.get_cooldown_seconds() );
      CHECKC( now >= ready_at, err::TIME_PREMATURE, "service in cooldown" )
   }

   auto cost = conf.price;
   if (is_upgrade) {
      auto priv = _refresh_privilege( user );
      const auto& current = priv.services[service_type];
      CHECKC( current.has_access,               err::STATUS_ERROR, "no active privilege to upgrade" )
      CHECKC( current.level < service_level,    err::PARAM_ERROR,  "upgrade level must be higher than current" )
      cost = calc_bps_quant( conf.price, _gstate.upgrade_multiplier_bps );
   }
   CHECKC( cost.amount > 0, err::NOT_POSITIVE, "service price must be positive" )

   auto balance = _balance_of( user );
   CHECKC( balance >= cost, err::INSUFFICIENT_BALANCE,
           "insufficient points: " + balance.to_string() + " < " + cost.to_string() )

   _burn( user, cost, is_upgrade ? "service upgrade" : "service purchase" );

   consumption_t::tbl_t consumptions(_self, user.value);
   consumptions.emplace(_self, [&](auto& c) {
      c.id              = _global_state->new_consumption_id();
      c.points          = cost;
      c.consumed_at     = now;
      c.service_type    = service_type;
      c.service_level   = service_level;
      c.expired_at      = add_seconds( now, conf.duration_seconds );
      c.is_upgrade      = is_upgrade;
   });

   if (cd_itr == cooldowns.end()) {
      cooldowns.emplace(_self, [&](auto& c) {
         c.service_type       = service_type;
         c.last_consumed_at   = now;
      });
   } else {
      cooldowns.modify(cd_itr, same_payer, [&](auto& c) {
         c.last_consumed_at   = now;
      });
   }

   service_usage_t::tbl_t usages(_self, _self.value);
   auto usage_itr = usages.find(service_type);
   if (usage_itr == usages.end()) {
      usages.emplace(_self, [&](auto& u) {
         u.service_type    = service_type;
         u.total_count     = 1;
         u.total_points    = cost;
      });
   } else {
      usages.modify(usage_itr, same_payer, [&](auto& u) {
         u.total_count++;
         u.total_points += cost;
      });
   }

   _push_privileges( _refresh_privilege(user) );
   return cost;
}

catalog_handle reward_core::_resolve_catalog( const uint8_t& service_type ) {
   catalog_t::tbl_t catalogs(_self, _self.value);
   auto itr = catalogs.find(service_type);
   CHECKC( itr != catalogs.end(),     err::RECORD_NOT_FOUND, "catalog not registered for service " + to_string(service_type) )
   CHECKC( is_account(itr->provider), err::RECORD_NOT_FOUND, "catalog provider not found: " + itr->provider.to_string() )

   return catalog_handle{ itr->provider, service_type };
}

/**
 * Rebuild the privilege summary from the unexpired consumption records.
 */
privilege_t reward_core::_refresh_privilege( const name& user ) {
   auto now = time_point_sec(current_time_point());

   privilege_t priv(user);
   priv.services.resize(SERVICE_TYPE_COUNT);
   priv.updated_at = now;

   consumption_t::tbl_t consumptions(_self, user.value);
   auto idx = consumptions.get_index<"byexpiry"_n>();
   for (auto itr = idx.upper_bound((uint64_t)now.sec_since_epoch()); itr != idx.end(); itr++) {
      auto& service = priv.services[itr->service_type];
      service.has_access = true;
      if (itr->service_level > service.level)
         service.level = itr->service_level;
   }

   privilege_t::tbl_t privileges(_self, _self.value);
   auto priv_itr = privileges.find(user.value);
   if (priv_itr == privileges.end()) {
      privileges.emplace(_self, [&](auto& p) { p = priv; });
   } else {
      privileges.modify(priv_itr, same_payer, [&](auto& p) { p = priv; });
   }
   return priv;
}

} //namespace rewardfi
