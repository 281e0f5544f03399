// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_SIMULATOR_H
#define BACKED_SIMULATOR_H

/**
 * @file simulator.h
 * @brief Command interpreter driving a settlement engine over in-memory
 *        collaborators
 *
 * Commands (amounts are decimals with up to 18 fractional digits,
 * accounts are 40 hex digits or short names):
 *
 *   mint <acct> <amount>       Credit reserve to an account (faucet)
 *   approve <acct> <amount>    Authorize the engine to pull reserve
 *   buy <acct> <amount>        Buy tokens for reserve
 *   redeem <acct> <tokens>     Redeem tokens for reserve
 *   deposit <amount>           Owner deposits buffer reserve
 *   withdraw <amount>          Owner withdraws buffer reserve
 *   process                    Operator drains the queue
 *   forward                    Operator forwards the excess
 *   settle                     Operator drains then forwards
 *   setprice <price>           Change the oracle price
 *   bridgefail <0|1>           Make the bridge reject transfers
 *   balance <acct>             Show reserve and token balances
 *   status                     Show engine state
 */

#include <backed/backed_config.h>
#include <backed/bridge_gateway.h>
#include <backed/price_oracle.h>
#include <backed/settlement_engine.h>
#include <backed/token_ledger.h>

#include <string>
#include <vector>

namespace backed {

class Simulator {
public:
    explicit Simulator(const EngineConfig& config);

    /**
     * Run one command.
     * @param words    Command name followed by its arguments
     * @param strOutput Receives the text to show for the command
     * @return false if the command is unknown, malformed or failed
     */
    bool Execute(const std::vector<std::string>& words, std::string& strOutput);

    /**
     * Split line on whitespace and run it, then deliver bridge notifications.
     * Blank lines and # comments succeed.
     */
    bool ExecuteLine(const std::string& line, std::string& strOutput);

    SettlementEngine& GetEngine() { return engine_; }
    TokenLedger& GetReserve() { return reserve_; }
    TokenLedger& GetToken() { return token_; }
    LocalBridge& GetBridge() { return bridge_; }
    FixedPriceOracle& GetOracle() { return oracle_; }

    std::string GetStatus() const;

    static uint160 CustodyAccount();
    static uint160 BridgeAccount();

private:
    std::string DescribeResult(const std::string& command, const SettlementResult& result) const;

    /** Caller used for process, forward and settle */
    uint160 Trigger() const;

    EngineConfig config_;
    TokenLedger reserve_;
    TokenLedger token_;
    FixedPriceOracle oracle_;
    LocalBridge bridge_;
    SettlementEngine engine_;
};

} // namespace backed

#endif // BACKED_SIMULATOR_H
