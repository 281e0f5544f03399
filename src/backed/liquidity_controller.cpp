// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/liquidity_controller.h>
#include <backed/bridge_gateway.h>
#include <backed/token_ledger.h>
#include <util.h>
#include <utilmoneystr.h>

#include <stdexcept>

namespace backed {

LiquidityController::LiquidityController(const uint160& custody, ReserveAsset& reserve)
    : custody_(custody)
    , reserve_(reserve)
{
}

std::optional<ForwardInstruction> LiquidityController::EvaluateForwarding(
    const CAmount& localBalance,
    const LiquidityPolicy& policy)
{
    // threshold + minBridge may not fit in 256 bits; then nothing can exceed it
    CAmount trigger;
    try {
        trigger = policy.bufferThreshold + policy.minBridgeAmount;
    } catch (const std::overflow_error&) {
        return std::nullopt;
    }

    if (localBalance <= trigger) {
        return std::nullopt;
    }
    return ForwardInstruction(localBalance - policy.bufferThreshold);
}

CAmount LiquidityController::GetLocalBalance() const
{
    return reserve_.BalanceOf(custody_);
}

void LiquidityController::RevokeAllowance(const uint160& bridgeAddress)
{
    if (reserve_.Allowance(custody_, bridgeAddress) == 0) {
        return;
    }
    if (!reserve_.Approve(custody_, bridgeAddress, 0)) {
        LogPrintf("LiquidityController: failed to revoke bridge allowance of %s\n",
                  ShortAccount(bridgeAddress));
    }
}

ForwardResult LiquidityController::ExecuteForward(BridgeGateway& bridge,
                                                  const ForwardInstruction& instruction)
{
    const CAmount& amount = instruction.amount;
    if (amount == 0) {
        return ForwardResult::Failure(SettlementError::INVALID_INPUT, "Forward amount must be positive");
    }

    CAmount balanceBefore = reserve_.BalanceOf(custody_);
    if (balanceBefore < amount) {
        return ForwardResult::Failure(SettlementError::INSUFFICIENT_BALANCE,
            strprintf("Forward of %s exceeds local balance %s", FormatMoney(amount), FormatMoney(balanceBefore)));
    }

    const uint160 bridgeAddress = bridge.GetAddress();

    // Step 1: authorize the bridge
    if (!reserve_.Approve(custody_, bridgeAddress, amount)) {
        return ForwardResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE,
            "Reserve asset rejected bridge authorization");
    }

    // Step 2: let the bridge pull the funds
    if (!bridge.SendStable(custody_, reserve_.GetAssetId(), amount)) {
        RevokeAllowance(bridgeAddress);
        LogPrint(BCLog::BRIDGE, "LiquidityController: forward of %s rejected by bridge, allowance revoked\n",
                 FormatMoney(amount));
        return ForwardResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Bridge transfer failed");
    }

    // A bridge that reports success must have consumed exactly the authorization
    CAmount balanceAfter = reserve_.BalanceOf(custody_);
    RevokeAllowance(bridgeAddress);
    if (balanceAfter > balanceBefore || balanceBefore - balanceAfter != amount) {
        LogPrintf("LiquidityController: bridge moved %s instead of %s\n",
                  FormatMoney(balanceAfter > balanceBefore ? CAmount(0) : CAmount(balanceBefore - balanceAfter)),
                  FormatMoney(amount));
        return ForwardResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE,
            "Bridge transfer did not move the forwarded amount");
    }

    LogPrint(BCLog::BRIDGE, "LiquidityController: forwarded %s, local balance now %s\n",
             FormatMoney(amount), FormatMoney(balanceAfter));
    return ForwardResult::Success(amount);
}

ForwardResult LiquidityController::ForwardExcess(BridgeGateway& bridge, const LiquidityPolicy& policy)
{
    std::optional<ForwardInstruction> instruction = EvaluateForwarding(GetLocalBalance(), policy);
    if (!instruction) {
        return ForwardResult::Success(0);
    }
    return ExecuteForward(bridge, *instruction);
}

} // namespace backed
