// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_LIQUIDITY_CONTROLLER_H
#define BACKED_LIQUIDITY_CONTROLLER_H

/**
 * @file liquidity_controller.h
 * @brief Local reserve buffer management and forwarding of the excess
 *
 * The engine keeps bufferThreshold of reserve in local custody to serve
 * redemptions. Anything above that is forwarded to the bridge, but only
 * once the excess is larger than minBridgeAmount so that tiny transfers
 * are not worth a bridge call.
 *
 * Forwarding authorizes the bridge and then asks it to pull the funds.
 * If the pull fails the authorization is set back to zero before the
 * failure is returned.
 */

#include <backed/backed_common.h>
#include <amount.h>
#include <uint256.h>

#include <optional>
#include <string>

namespace backed {

class BridgeGateway;
class ReserveAsset;

/** Buffer sizing policy */
struct LiquidityPolicy {
    /** Reserve always retained locally */
    CAmount bufferThreshold;

    /** Excess above the threshold must be larger than this to forward */
    CAmount minBridgeAmount;

    LiquidityPolicy()
        : bufferThreshold(0)
        , minBridgeAmount(0)
    {}

    LiquidityPolicy(const CAmount& threshold, const CAmount& minBridge)
        : bufferThreshold(threshold)
        , minBridgeAmount(minBridge)
    {}

    bool operator==(const LiquidityPolicy& other) const {
        return bufferThreshold == other.bufferThreshold &&
               minBridgeAmount == other.minBridgeAmount;
    }

    bool operator!=(const LiquidityPolicy& other) const {
        return !(*this == other);
    }
};

/** Amount to hand to the bridge */
struct ForwardInstruction {
    CAmount amount;

    ForwardInstruction() : amount(0) {}
    explicit ForwardInstruction(const CAmount& amt) : amount(amt) {}
};

/**
 * @brief Result of a forward attempt
 */
struct ForwardResult {
    bool success;
    SettlementError error;
    std::string errorMessage;
    CAmount forwarded;

    ForwardResult()
        : success(false)
        , error(SettlementError::NONE)
        , forwarded(0)
    {}

    static ForwardResult Success(const CAmount& amount) {
        ForwardResult result;
        result.success = true;
        result.forwarded = amount;
        return result;
    }

    static ForwardResult Failure(SettlementError err, const std::string& message) {
        ForwardResult result;
        result.success = false;
        result.error = err;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Moves excess local reserve to the bridge
 *
 * Operates on the custody account of one engine. Not internally locked;
 * the settlement engine calls it under cs_engine.
 */
class LiquidityController {
public:
    LiquidityController(const uint160& custody, ReserveAsset& reserve);

    /**
     * Decide whether to forward.
     * @return localBalance - bufferThreshold when localBalance exceeds
     *         bufferThreshold + minBridgeAmount, nothing otherwise
     */
    static std::optional<ForwardInstruction> EvaluateForwarding(const CAmount& localBalance,
                                                                const LiquidityPolicy& policy);

    /**
     * Authorize the bridge for instruction.amount and invoke SendStable.
     *
     * On failure no allowance for the bridge remains and the local balance
     * is unchanged. On success the local balance has dropped by exactly
     * instruction.amount.
     */
    ForwardResult ExecuteForward(BridgeGateway& bridge, const ForwardInstruction& instruction);

    /** Evaluate against the current balance and execute if needed */
    ForwardResult ForwardExcess(BridgeGateway& bridge, const LiquidityPolicy& policy);

    CAmount GetLocalBalance() const;

private:
    /** Set the bridge allowance back to zero; logs if that fails */
    void RevokeAllowance(const uint160& bridgeAddress);

    uint160 custody_;
    ReserveAsset& reserve_;
};

} // namespace backed

#endif // BACKED_LIQUIDITY_CONTROLLER_H
