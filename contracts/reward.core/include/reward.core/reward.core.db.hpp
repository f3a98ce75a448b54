#pragma once

#include <eosio/asset.hpp>
#include <eosio/privileged.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <map>
#include <set>
#include <vector>
#include <type_traits>

#include <reward.core.const.hpp>

namespace rewardfi {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("reward.core")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("reward.core")]]

NTBL("global") global_t {
    name                admin;
    name                points_contract         = "reward.pts"_n;
    bool                telemetry_enabled       = true;
    name                telemetry_sink;                                     //gates pushes only, never notified; empty = self log only

    asset               base_usd                = asset(100'000000, MUSDT);  //principal unit of the reward estimate
    uint64_t            per_day_bps             = 10;                       //0.1% per day
    uint64_t            bonus_bps               = 500;                      //healthy bonus 5%
    map<uint8_t, uint64_t> level_multipliers    = {
        { 1, 10000 },
        { 2, 11000 },
        { 3, 12500 },
        { 4, 15000 },
        { 5, 20000 } };
    asset               dyn_threshold           = asset(10000'000000, MUSDT);
    uint64_t            dyn_multiplier_bps      = 12000;
    uint32_t            cache_expiry_seconds    = HOUR_SECONDS;

    uint32_t            on_time_window_seconds  = DAY_SECONDS;
    uint64_t            early_penalty_bps       = 0;
    uint64_t            late_penalty_bps        = 500;                      //5%
    uint64_t            upgrade_multiplier_bps  = 15000;                    //150%
    uint16_t            max_batch_size          = 100;

    uint64_t            total_batch_ops         = 0;
    asset               total_cached_rewards    = asset(0, POINTS);
    asset               total_minted            = asset(0, POINTS);
    asset               total_burned            = asset(0, POINTS);
    asset               total_debt              = asset(0, POINTS);        //outstanding debt of all users
    bool                enabled                 = false;

    EOSLIB_SERIALIZE( global_t, (admin)(points_contract)(telemetry_enabled)(telemetry_sink)
                                (base_usd)(per_day_bps)(bonus_bps)(level_multipliers)
                                (dyn_threshold)(dyn_multiplier_bps)(cache_expiry_seconds)
                                (on_time_window_seconds)(early_penalty_bps)(late_penalty_bps)
                                (upgrade_multiplier_bps)(max_batch_size)
                                (total_batch_ops)(total_cached_rewards)(total_minted)(total_burned)(total_debt)
                                (enabled) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL account_t {
    name                owner;                                  //PK
    uint8_t             level                   = MIN_LEVEL;
    asset               locked_points           = asset(0, POINTS); //aggregate lock of onloanevent
    time_point_sec      locked_maturity;                        //0 when nothing is locked
    asset               debt                    = asset(0, POINTS);
    time_point_sec      last_activity_at;
    uint64_t            total_loan_count        = 0;
    asset               total_volume            = asset(0, MUSDT);
    uint64_t            eligible_loan_count     = 0;
    uint64_t            ontime_repay_count      = 0;
    time_point_sec      created_at;

    account_t() {}
    account_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"accounts"_n, account_t> tbl_t;

    EOSLIB_SERIALIZE( account_t, (owner)(level)(locked_points)(locked_maturity)(debt)(last_activity_at)
                                 (total_loan_count)(total_volume)(eligible_loan_count)(ontime_repay_count)
                                 (created_at) )
};

//Scope: _self
//Note: kept after settlement so that a redelivered callback finds the order
TBL order_lock_t {
    uint64_t            order_id;                               //PK
    name                borrower;
    asset               locked_points;                          //0 for an ineligible order
    time_point_sec      maturity;
    time_point_sec      created_at;
    time_point_sec      settled_at;                             //0 while the lock is live
    uint8_t             outcome                 = loan_outcome::BORROW; //repay outcome once settled

    bool is_settled()const { return settled_at != time_point_sec(); }

    order_lock_t() {}
    order_lock_t(const uint64_t& id): order_id(id) {}

    uint64_t primary_key()const { return order_id; }
    uint64_t by_borrower()const { return borrower.value; }

    typedef multi_index<"orderlocks"_n, order_lock_t,
        indexed_by<"byborrower"_n, const_mem_fun<order_lock_t, uint64_t, &order_lock_t::by_borrower> >
    > tbl_t;

    EOSLIB_SERIALIZE( order_lock_t, (order_id)(borrower)(locked_points)(maturity)(created_at)(settled_at)(outcome) )
};

//Scope: _self
TBL level_rule_t {
    uint8_t             level;                                  //PK, 2..5
    asset               min_volume;
    uint64_t            min_eligible_loans      = 0;
    uint64_t            min_ontime_repays       = 0;

    level_rule_t() {}
    level_rule_t(const uint8_t& l): level(l) {}

    uint64_t primary_key()const { return level; }

    bool satisfied_by(const account_t& acct)const {
        return acct.total_volume >= min_volume
            && acct.eligible_loan_count >= min_eligible_loans
            && acct.ontime_repay_count >= min_ontime_repays;
    }

    typedef multi_index<"levelrules"_n, level_rule_t> tbl_t;

    EOSLIB_SERIALIZE( level_rule_t, (level)(min_volume)(min_eligible_loans)(min_ontime_repays) )
};

//Scope: _self
//service locator: service type -> catalog provider
TBL catalog_t {
    uint8_t             service_type;                           //PK
    name                provider;

    catalog_t() {}
    catalog_t(const uint8_t& t): service_type(t) {}

    uint64_t primary_key()const { return service_type; }

    typedef multi_index<"catalogs"_n, catalog_t> tbl_t;

    EOSLIB_SERIALIZE( catalog_t, (service_type)(provider) )
};

//Scope: user
TBL consumption_t {
    uint64_t            id;                                     //PK
    asset               points;
    time_point_sec      consumed_at;
    uint8_t             service_type;
    uint8_t             service_level;
    time_point_sec      expired_at;
    bool                is_upgrade              = false;

    consumption_t() {}
    consumption_t(const uint64_t& i): id(i) {}

    uint64_t primary_key()const { return id; }
    uint64_t by_expiry()const { return (uint64_t)expired_at.sec_since_epoch(); }

    typedef multi_index<"consumptions"_n, consumption_t,
        indexed_by<"byexpiry"_n, const_mem_fun<consumption_t, uint64_t, &consumption_t::by_expiry> >
    > tbl_t;

    EOSLIB_SERIALIZE( consumption_t, (id)(points)(consumed_at)(service_type)(service_level)(expired_at)(is_upgrade) )
};

//Scope: user
TBL cooldown_t {
    uint8_t             service_type;                           //PK
    time_point_sec      last_consumed_at;

    cooldown_t() {}
    cooldown_t(const uint8_t& t): service_type(t) {}

    uint64_t primary_key()const { return service_type; }

    typedef multi_index<"cooldowns"_n, cooldown_t> tbl_t;

    EOSLIB_SERIALIZE( cooldown_t, (service_type)(last_consumed_at) )
};

struct service_privilege_t {
    bool                has_access              = false;
    uint8_t             level                   = 0;

    EOSLIB_SERIALIZE( service_privilege_t, (has_access)(level) )
};

//Scope: _self
TBL privilege_t {
    name                owner;                                  //PK
    vector<service_privilege_t> services;                       //indexed by service type
    time_point_sec      updated_at;

    privilege_t() {}
    privilege_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"privileges"_n, privilege_t> tbl_t;

    EOSLIB_SERIALIZE( privilege_t, (owner)(services)(updated_at) )
};

//Scope: _self
TBL service_usage_t {
    uint8_t             service_type;                           //PK
    uint64_t            total_count             = 0;
    asset               total_points            = asset(0, POINTS);

    service_usage_t() {}
    service_usage_t(const uint8_t& t): service_type(t) {}

    uint64_t primary_key()const { return service_type; }

    typedef multi_index<"svcusage"_n, service_usage_t> tbl_t;

    EOSLIB_SERIALIZE( service_usage_t, (service_type)(total_count)(total_points) )
};

//Scope: _self
TBL reward_cache_t {
    name                owner;                                  //PK
    asset               expected_points;
    time_point_sec      cached_at;
    time_point_sec      expired_at;

    reward_cache_t() {}
    reward_cache_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"rewardcache"_n, reward_cache_t> tbl_t;

    EOSLIB_SERIALIZE( reward_cache_t, (owner)(expected_points)(cached_at)(expired_at) )
};

//Scope: _self
TBL role_t {
    name                account;                                //PK
    set<name>           roles;

    role_t() {}
    role_t(const name& a): account(a) {}

    uint64_t primary_key()const { return account.value; }

    typedef multi_index<"roles"_n, role_t> tbl_t;

    EOSLIB_SERIALIZE( role_t, (account)(roles) )
};

TBL globalidx {
    uint64_t        consumption_id              = 0;               // the auto-increament consumption record id

    EOSLIB_SERIALIZE( globalidx, (consumption_id) )
};
typedef eosio::singleton< "globalidx"_n, globalidx > global_table;

struct global_state: public globalidx {
    public:
        bool changed = false;

        using ptr_t = std::unique_ptr<global_state>;

        static ptr_t make_global(const name &contract) {
            auto ret = std::make_unique<global_state>();
            ret->_global_tbl = std::make_unique<global_table>(contract, contract.value);

            if (ret->_global_tbl->exists()) {
                static_cast<globalidx&>(*ret) = ret->_global_tbl->get();
            }
            return ret;
        }

        inline uint64_t new_auto_inc_id(uint64_t &id) {
            if (id == 0 || id == std::numeric_limits<uint64_t>::max()) {
                id = 1;
            } else {
                id++;
            }
            change();
            return id;
        }

        inline uint64_t new_consumption_id() {
            return new_auto_inc_id(consumption_id);
        }

        inline void change() {
            changed = true;
        }

        inline void save(const name &payer) {
            if (changed) {
                auto &g = static_cast<globalidx&>(*this);
                _global_tbl->set(g, payer);
                changed = false;
            }
        }
    private:
        std::unique_ptr<global_table> _global_tbl;
};

} //namespace rewardfi
