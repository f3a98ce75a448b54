#pragma once

#include <cstdint>
#include <eosio/name.hpp>
#include <eosio/asset.hpp>
using namespace eosio;


static constexpr uint16_t  PCT_BOOST            = 10000;
static constexpr uint32_t  DAY_SECONDS          = 24 * 60 * 60;
static constexpr uint32_t  HOUR_SECONDS         = 60 * 60;

static constexpr symbol    POINTS               = symbol(symbol_code("POINTS"), 8);
static constexpr symbol    MUSDT                = symbol(symbol_code("MUSDT"), 6);
static constexpr int64_t   POINT_UNIT           = 1'0000'0000;      // 1.00000000 POINTS
static constexpr int64_t   MIN_ELIGIBLE_AMOUNT  = 1000'000000;      // 1000.000000 MUSDT, inclusive

static constexpr uint8_t   MIN_LEVEL            = 1;
static constexpr uint8_t   MAX_LEVEL            = 5;
static constexpr uint16_t  MAX_BATCH_LIMIT      = 500;
static constexpr uint64_t  MAX_TERM_SECONDS     = 10ULL * 365 * DAY_SECONDS;   // 10 years

namespace role {
    static constexpr name LOAN_EVENT            = "loanevent"_n;
    static constexpr name SET_PARAM             = "setparam"_n;
    static constexpr name PENALTY               = "penalty"_n;
    static constexpr name CONSUME               = "consume"_n;
}

// per-order loan outcome
namespace loan_outcome {
    static constexpr uint8_t BORROW             = 0;
    static constexpr uint8_t REPAY_ONTIME_FULL  = 1;
    static constexpr uint8_t REPAY_EARLY_FULL   = 2;
    static constexpr uint8_t REPAY_LATE_FULL    = 3;
}
