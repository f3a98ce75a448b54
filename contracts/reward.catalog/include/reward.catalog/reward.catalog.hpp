#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#include <reward.catalog/reward.catalog.db.hpp>

namespace rewardfi {

using std::string;
using namespace eosio;

/**
 * The `reward.catalog` contract holds the price list of the services that points
 * can be spent on. `reward.core` reads `svcconfs` and `svcmeta` directly through
 * its catalog locator and never writes them.
 */
class [[eosio::contract("reward.catalog")]] reward_catalog : public contract {
   public:
      using contract::contract;

   reward_catalog(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
   {
      _gstate = _global.exists() ? _global.get() : catalog_global_t{};
   }

   ~reward_catalog() { _global.set( _gstate, get_self() ); }

   ACTION init(const name& admin);

   /**
    * Add or replace the config of one level of a service.
    *
    * @param service_type - 0..4
    * @param level - 0..3
    * @param price - points burnt per purchase, must be positive
    * @param duration_seconds - how long the purchased privilege stays active
    */
   ACTION setconfig(const uint8_t& service_type, const uint8_t& level, const asset& price,
                    const uint32_t& duration_seconds, const bool& is_active, const string& description);

   ACTION setcooldown(const uint8_t& service_type, const uint32_t& cooldown_seconds);

   private:
      catalog_global_singleton   _global;
      catalog_global_t           _gstate;
};

} //namespace rewardfi
