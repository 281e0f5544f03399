// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_BACKED_CONFIG_H
#define BACKED_BACKED_CONFIG_H

/**
 * @file backed_config.h
 * @brief Engine configuration and its command-line/config-file options
 *
 * Options:
 *   -bufferthreshold=<amt>   Reserve kept in local custody (default: 0)
 *   -minbridgeamount=<amt>   Smallest excess worth forwarding (default: 0)
 *   -buyspread=<frac>        Buy markup, e.g. 0.01 for 1% (default: 0)
 *   -redeemspread=<frac>     Redeem markdown, must be below 1 (default: 0)
 *   -buyfee=<amt>            Fixed buy fee (default: 0)
 *   -redeemfee=<amt>         Fixed redeem fee (default: 0)
 *   -maxbatch=<n>            Queued redemptions settled per call (default: 50)
 *   -autosettle              Settle after every buy/deposit (default: 1)
 *   -queuestorage=<type>     indexed or compacting (default: indexed)
 *   -oracleprice=<price>     Initial oracle price (default: 1)
 *   -owner=<acct>            Engine owner (default: owner)
 *   -operator=<acct>         Automation principal (default: operator)
 *   -feecollector=<acct>     Fee recipient (default: fees)
 */

#include <backed/backed_common.h>
#include <backed/liquidity_controller.h>
#include <backed/pricing_engine.h>
#include <backed/redemption_queue.h>
#include <amount.h>
#include <uint256.h>

#include <string>

namespace backed {

static const bool DEFAULT_AUTO_SETTLE = true;
static const char* const DEFAULT_QUEUE_STORAGE = "indexed";
static const char* const DEFAULT_ORACLE_PRICE = "1";
static const char* const DEFAULT_OWNER = "owner";
static const char* const DEFAULT_OPERATOR = "operator";
static const char* const DEFAULT_FEE_COLLECTOR = "fees";

/**
 * @brief Everything the configuration authority controls
 *
 * Copied once per engine call so a call sees one consistent snapshot.
 */
struct EngineConfig {
    PricingParameters pricing;
    LiquidityPolicy liquidity;

    /** Upper bound on queued redemptions paid per call */
    uint32_t maxBatch;

    uint160 owner;

    /** May trigger ProcessQueue, ForwardExcess and Settle */
    uint160 operatorAccount;

    uint160 feeCollector;

    /** Run Settle after every buy and buffer deposit */
    bool autoSettle;

    QueueStorage queueStorage;

    /** Starting price of the simulator's oracle */
    CAmount oraclePrice;

    EngineConfig()
        : maxBatch(DEFAULT_MAX_BATCH)
        , autoSettle(DEFAULT_AUTO_SETTLE)
        , queueStorage(QueueStorage::INDEXED)
        , oraclePrice(PRICE_SCALE)
    {}

    /** Check the owner, the fee collector and the pricing parameters */
    bool Validate(std::string& strError) const;

    std::string ToString() const;
};

/**
 * Parse an account given as 40 hex digits (optionally 0x-prefixed) or as a
 * short name of up to 20 letters, digits or '_', stored as its ASCII bytes.
 */
bool ParseAccount(const std::string& str, uint160& account);

/** Help text for the engine options */
std::string GetBackedHelpMessage();

/**
 * Build an EngineConfig from gArgs.
 * @return false with strError set on a malformed or invalid option
 */
bool InitEngineConfig(EngineConfig& config, std::string& strError);

} // namespace backed

#endif // BACKED_BACKED_CONFIG_H
