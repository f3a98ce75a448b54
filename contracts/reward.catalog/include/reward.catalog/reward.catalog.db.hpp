#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/multi_index.hpp>

#include <string>

namespace rewardfi {

using namespace std;
using namespace eosio;

#define CATALOG_TBL struct [[eosio::table, eosio::contract("reward.catalog")]]
#define CATALOG_NTBL(name) struct [[eosio::table(name), eosio::contract("reward.catalog")]]

// service types: 0 AdvancedAnalytics, 1 PriorityService, 2 FeatureUnlock, 3 GovernanceAccess, 4 TestnetFeatures
static constexpr uint8_t SERVICE_TYPE_COUNT     = 5;
// service levels: 0 Basic, 1 Standard, 2 Premium, 3 VIP
static constexpr uint8_t SERVICE_LEVEL_COUNT    = 4;

CATALOG_NTBL("global") catalog_global_t {
    name                admin;

    EOSLIB_SERIALIZE( catalog_global_t, (admin) )
};
typedef eosio::singleton< "global"_n, catalog_global_t > catalog_global_singleton;

//Scope: service type
CATALOG_TBL service_config_t {
    uint8_t             level;                          //PK
    asset               price;                          //points burnt per purchase
    uint32_t            duration_seconds    = 0;        //privilege lifetime
    bool                is_active           = false;
    string              description;

    service_config_t() {}
    service_config_t(const uint8_t& l): level(l) {}

    uint64_t primary_key()const { return level; }

    typedef multi_index<"svcconfs"_n, service_config_t> tbl_t;

    EOSLIB_SERIALIZE( service_config_t, (level)(price)(duration_seconds)(is_active)(description) )
};

//Scope: _self
CATALOG_TBL service_meta_t {
    uint8_t             service_type;                   //PK
    uint32_t            cooldown_seconds    = 0;        //per user, independent of level

    service_meta_t() {}
    service_meta_t(const uint8_t& t): service_type(t) {}

    uint64_t primary_key()const { return service_type; }

    typedef multi_index<"svcmeta"_n, service_meta_t> tbl_t;

    EOSLIB_SERIALIZE( service_meta_t, (service_type)(cooldown_seconds) )
};

} //namespace rewardfi
