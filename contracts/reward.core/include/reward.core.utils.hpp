#pragma once

#include <string>
#include <vector>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#include <reward.core.const.hpp>
#include "safemath.hpp"

using namespace std;
using namespace wasm::safemath;

inline asset one_point() {
    return asset(POINT_UNIT, POINTS);
}

inline bool is_eligible_principal(const asset& principal) {
    return principal.amount >= MIN_ELIGIBLE_AMOUNT;
}

// floor(quant * bps / 10000)
inline asset calc_bps_quant(const asset& quant, const uint64_t& bps) {
    return asset(mul_down(quant.amount, bps, PCT_BOOST), quant.symbol);
}

inline time_point_sec add_seconds(const time_point_sec& t, const uint64_t& seconds) {
    uint64_t sec = (uint64_t)t.sec_since_epoch() + seconds;
    eosio::check(sec <= std::numeric_limits<uint32_t>::max(), "time overflow");
    return time_point_sec((uint32_t)sec);
}

/**
 * Offset a release against the outstanding debt.
 * Returns the part of `release` left to mint, `debt` is reduced in place.
 */
inline asset offset_debt(asset& debt, const asset& release) {
    if (release >= debt) {
        auto payout = release - debt;
        debt.amount = 0;
        return payout;
    }
    debt -= release;
    return asset(0, release.symbol);
}

/**
 * Expected points of a loan:
 *   base  = principal / base_usd * term_days * per_day_bps / 10000
 *   base += base * bonus_bps / 10000                 when healthy
 *   base  = base * level_multiplier_bps / 10000
 *   base  = base * dyn_multiplier_bps / 10000        when principal >= dyn_threshold
 */
inline asset calc_expected_points(const asset& principal, const uint64_t& term_seconds, const bool& healthy,
                                  const asset& base_usd, const uint64_t& per_day_bps, const uint64_t& bonus_bps,
                                  const uint64_t& level_multiplier_bps,
                                  const asset& dyn_threshold, const uint64_t& dyn_multiplier_bps) {
    // points per base unit of principal, scaled by term days in seconds
    int64_t units   = div_down(principal.amount, base_usd.amount, POINT_UNIT);
    int64_t base    = mul_down(units, (uint128_t)term_seconds * per_day_bps, (uint64_t)DAY_SECONDS * PCT_BOOST);
    if (healthy)
        base       += mul_down(base, bonus_bps, PCT_BOOST);
    base            = mul_down(base, level_multiplier_bps, PCT_BOOST);
    if (principal >= dyn_threshold)
        base        = mul_down(base, dyn_multiplier_bps, PCT_BOOST);
    return asset(base, POINTS);
}

/**
 * Pack per-service access flags and levels into one word:
 * bit i is the access flag of service i, bits 8+4i..11+4i hold its level.
 */
template<typename Privileges>
inline uint64_t pack_privileges(const Privileges& services) {
    uint64_t packed = 0;
    for (size_t i = 0; i < services.size(); i++) {
        if (services[i].has_access)
            packed |= (1ULL << i);
        packed |= ((uint64_t)(services[i].level & 0x0F)) << (8 + 4 * i);
    }
    return packed;
}
