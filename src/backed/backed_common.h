// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_BACKED_COMMON_H
#define BACKED_BACKED_COMMON_H

/**
 * @file backed_common.h
 * @brief Common definitions and types for the reserve-backed issuer
 *
 * Shared constants, enums and result codes used by the pricing engine,
 * the redemption queue, the liquidity controller and the settlement
 * engine.
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace backed {

/** Fixed-point scale of prices and spreads (10^18) */
static const CAmount PRICE_SCALE = COIN;

/** Default number of queued redemptions settled per call */
static constexpr uint32_t DEFAULT_MAX_BATCH = 50;

/** Settlement actions carried by bridge records */
enum class SettlementAction : uint8_t {
    BUY = 0,
    REDEEM = 1
};

/** Error taxonomy of every settlement operation */
enum class SettlementError : uint8_t {
    NONE = 0,
    INVALID_INPUT = 1,          // zero amount, zero price, amount not above fee, bad config
    INSUFFICIENT_BALANCE = 2,   // burn or withdraw more than present
    EXTERNAL_CALL_FAILURE = 3,  // bridge, oracle or ledger call rejected
    UNAUTHORIZED = 4            // caller is not the owner/operator
};

/**
 * Convert SettlementAction to string for logging
 */
std::string SettlementActionToString(SettlementAction action);

/**
 * Convert SettlementError to string for logging
 */
std::string SettlementErrorToString(SettlementError error);

/**
 * Stream output operators for enum types (needed for Boost.Test)
 */
inline std::ostream& operator<<(std::ostream& os, SettlementAction action) {
    return os << SettlementActionToString(action);
}

inline std::ostream& operator<<(std::ostream& os, SettlementError error) {
    return os << SettlementErrorToString(error);
}

/**
 * Display form of an account: the name for accounts created from a short
 * name, otherwise the 40 hex digits in byte order.
 */
std::string AccountToString(const uint160& account);

/** Short form of an account for log lines */
std::string ShortAccount(const uint160& account);

} // namespace backed

#endif // BACKED_BACKED_COMMON_H
