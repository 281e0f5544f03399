// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_SETTLEMENT_ENGINE_H
#define BACKED_SETTLEMENT_ENGINE_H

/**
 * @file settlement_engine.h
 * @brief Buy/redeem settlement of the reserve-backed token
 *
 * The SettlementEngine owns the redemption queue and the custody account
 * holding the local reserve. Every entry operation runs under cs_engine
 * against one copy of the EngineConfig, so queue state, local balance and
 * configuration are never observed half-updated.
 *
 * Buy:    pull reserve, mint tokens, pay the fee, report the record to the
 *         bridge, then Settle when autoSettle is on.
 * Redeem: burn tokens, pay the fee, report the record, then submit the
 *         payout to the queue, which pays it now or parks it at the tail.
 * Settle: drain up to maxBatch queued redemptions, then forward whatever
 *         exceeds the buffer policy.
 *
 * Validation failures are returned before anything is mutated. A failure
 * of the automatic Settle after a committed buy or deposit does not undo
 * that operation; it is reported in SettlementResult::settlementError.
 */

#include <backed/backed_common.h>
#include <backed/backed_config.h>
#include <backed/liquidity_controller.h>
#include <backed/redemption_queue.h>
#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <optional>
#include <string>
#include <vector>

namespace backed {

class BridgeGateway;
class PriceOracle;
class ReserveAsset;
class TokenLedger;

/**
 * @brief Result of a settlement engine operation
 */
struct SettlementResult {
    bool success;
    SettlementError error;
    std::string errorMessage;

    /** Execution price and fee of a buy or redeem */
    CAmount execPrice;
    CAmount fee;

    /** Reserve after fees (buy) or payout owed (redeem) */
    CAmount netAmount;

    /** Tokens minted (buy) or burned (redeem) */
    CAmount tokens;

    /** Redemptions actually transferred by this call, FIFO order */
    std::vector<RedemptionRequest> payouts;

    /** The redeem payout was appended to the queue */
    bool queued;

    /** Reserve handed to the bridge by this call */
    CAmount forwarded;

    /** Outcome of the automatic Settle after a buy or deposit */
    SettlementError settlementError;
    std::string settlementMessage;

    SettlementResult()
        : success(false)
        , error(SettlementError::NONE)
        , execPrice(0)
        , fee(0)
        , netAmount(0)
        , tokens(0)
        , queued(false)
        , forwarded(0)
        , settlementError(SettlementError::NONE)
    {}

    static SettlementResult Success() {
        SettlementResult result;
        result.success = true;
        return result;
    }

    static SettlementResult Failure(SettlementError err, const std::string& message) {
        SettlementResult result;
        result.success = false;
        result.error = err;
        result.errorMessage = message;
        return result;
    }

    /** Sum of the executed payouts */
    CAmount TotalPaid() const;
};

/**
 * @brief Settlement orchestrator of one reserve-backed token
 *
 * The engine does not own its collaborators; they must outlive it.
 */
class SettlementEngine {
public:
    /**
     * @param custody   Account holding the local reserve
     * @param reserve   Reserve asset ledger
     * @param token     Synthetic token ledger (minted and burned here)
     * @param oracle    Price source
     * @param bridge    Settlement channel
     * @param config    Initial configuration
     * @throws std::invalid_argument if config fails Validate() or a
     *         collaborator pointer is null
     */
    SettlementEngine(const uint160& custody,
                     ReserveAsset& reserve,
                     TokenLedger& token,
                     PriceOracle* oracle,
                     BridgeGateway* bridge,
                     const EngineConfig& config);

    // =========================================================================
    // Entry operations
    // =========================================================================

    /** Pay reserveAmount (spender must have authorized the custody account) for tokens */
    SettlementResult Buy(const uint160& spender, const CAmount& reserveAmount);

    /** Burn tokenAmount and pay out, now or through the queue */
    SettlementResult Redeem(const uint160& holder, const CAmount& tokenAmount);

    /** Owner adds reserve to local custody */
    SettlementResult DepositBuffer(const uint160& caller, const CAmount& amount);

    /** Owner takes reserve out of local custody */
    SettlementResult WithdrawBuffer(const uint160& caller, const CAmount& amount);

    /** Pay up to maxBatch queued redemptions from the local balance */
    SettlementResult ProcessQueue(const uint160& caller);

    /** Forward the balance above the buffer policy to the bridge */
    SettlementResult ForwardExcess(const uint160& caller);

    /** ProcessQueue followed by ForwardExcess */
    SettlementResult Settle(const uint160& caller);

    // =========================================================================
    // Configuration authority (owner only)
    // =========================================================================

    SettlementResult SetPricingParameters(const uint160& caller, const PricingParameters& params);
    SettlementResult SetLiquidityPolicy(const uint160& caller, const LiquidityPolicy& policy);
    SettlementResult SetMaxBatch(const uint160& caller, uint32_t maxBatch);
    SettlementResult SetFeeCollector(const uint160& caller, const uint160& feeCollector);
    SettlementResult SetOperator(const uint160& caller, const uint160& operatorAccount);
    SettlementResult SetAutoSettle(const uint160& caller, bool autoSettle);
    SettlementResult SetOracle(const uint160& caller, PriceOracle* oracle);
    SettlementResult SetBridge(const uint160& caller, BridgeGateway* bridge);
    SettlementResult TransferOwnership(const uint160& caller, const uint160& newOwner);

    // =========================================================================
    // Queries
    // =========================================================================

    const uint160& GetCustodyAccount() const { return custody_; }
    CAmount GetLocalBalance() const;
    uint64_t GetQueueLength() const;
    std::vector<RedemptionRequest> GetPendingRedemptions() const;
    CAmount GetTotalPending() const;
    EngineConfig GetConfig() const;
    CAmount TokenBalanceOf(const uint160& account) const;
    CAmount TotalSupply() const;

private:
    /** Owner check; cs_engine held */
    bool IsOwner(const uint160& caller) const;

    /** Owner or operator check; cs_engine held */
    bool IsOwnerOrOperator(const uint160& caller) const;

    /**
     * Plan a queue pass against the current local balance, transfer each
     * payout in order and commit the ones that went through.
     * @return false if a payout transfer failed
     */
    bool RunQueue(const EngineConfig& cfg,
                  const std::optional<RedemptionRequest>& newRequest,
                  SettlementResult& result);

    /** Queue pass then forwarding; fills payouts, forwarded and the error */
    bool SettleLocked(const EngineConfig& cfg, SettlementResult& result,
                      SettlementError& error, std::string& message);

    /** Run the automatic Settle after a committed operation */
    void AutoSettle(const EngineConfig& cfg, SettlementResult& result);

    /**
     * Pull amount from 'from' into custody and verify the custody balance
     * grew by exactly amount. A short transfer is sent back.
     */
    bool PullReserve(const uint160& from, const CAmount& amount, std::string& strError);

    SettlementResult BuyLocked(const EngineConfig& cfg, const uint160& spender, const CAmount& reserveAmount);
    SettlementResult RedeemLocked(const EngineConfig& cfg, const uint160& holder, const CAmount& tokenAmount);

    mutable CCriticalSection cs_engine;

    const uint160 custody_;
    ReserveAsset& reserve_;
    TokenLedger& token_;
    PriceOracle* oracle_;
    BridgeGateway* bridge_;
    EngineConfig config_;
    RedemptionQueue queue_;
    LiquidityController liquidity_;
};

} // namespace backed

#endif // BACKED_SETTLEMENT_ENGINE_H
