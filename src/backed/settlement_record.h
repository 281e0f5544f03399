// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_SETTLEMENT_RECORD_H
#define BACKED_SETTLEMENT_RECORD_H

/**
 * @file settlement_record.h
 * @brief Settlement record sent over the bridge message channel
 *
 * Every buy and redeem emits one record for off-chain bookkeeping. The
 * wire layout is fixed and consumed by downstream services, so field
 * order and widths must never change within a version:
 *
 *   offset  size  field
 *   0       1     action tag (BUY=0, REDEEM=1)
 *   1       20    participant account
 *   21      32    amount, unsigned big-endian
 */

#include <backed/backed_common.h>
#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <vector>

namespace backed {

/** Wire format version of SettlementRecord */
static constexpr uint32_t SETTLEMENT_RECORD_VERSION = 1;

/** Encoded width of the amount field */
static constexpr size_t SETTLEMENT_AMOUNT_SIZE = 32;

/** Total encoded size of a version 1 record */
static constexpr size_t SETTLEMENT_RECORD_SIZE = 1 + 20 + SETTLEMENT_AMOUNT_SIZE;

struct SettlementRecord {
    /** BUY or REDEEM */
    SettlementAction action;

    /** Buyer or redeemer */
    uint160 participant;

    /** Net reserve amount (after fees) */
    CAmount amount;

    SettlementRecord()
        : action(SettlementAction::BUY)
        , amount(0)
    {}

    SettlementRecord(SettlementAction act, const uint160& who, const CAmount& amt)
        : action(act)
        , participant(who)
        , amount(amt)
    {}

    /** Serialize to the version 1 wire layout */
    std::vector<unsigned char> Serialize() const;

    /** Deserialize from bytes. Rejects wrong lengths and unknown tags. */
    bool Deserialize(const std::vector<unsigned char>& data);

    bool operator==(const SettlementRecord& other) const {
        return action == other.action &&
               participant == other.participant &&
               amount == other.amount;
    }
};

} // namespace backed

#endif // BACKED_SETTLEMENT_RECORD_H
