// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/settlement_engine.h>
#include <backed/bridge_gateway.h>
#include <backed/price_oracle.h>
#include <backed/pricing_engine.h>
#include <backed/settlement_record.h>
#include <backed/token_ledger.h>
#include <util.h>
#include <utilmoneystr.h>

#include <stdexcept>

namespace backed {

CAmount SettlementResult::TotalPaid() const
{
    CAmount total = 0;
    for (const auto& payout : payouts) {
        total += payout.amount;
    }
    return total;
}

SettlementEngine::SettlementEngine(const uint160& custody,
                                   ReserveAsset& reserve,
                                   TokenLedger& token,
                                   PriceOracle* oracle,
                                   BridgeGateway* bridge,
                                   const EngineConfig& config)
    : custody_(custody)
    , reserve_(reserve)
    , token_(token)
    , oracle_(oracle)
    , bridge_(bridge)
    , config_(config)
    , queue_(config.queueStorage)
    , liquidity_(custody, reserve)
{
    if (custody_.IsNull()) {
        throw std::invalid_argument("SettlementEngine: null custody account");
    }
    if (oracle_ == nullptr || bridge_ == nullptr) {
        throw std::invalid_argument("SettlementEngine: oracle and bridge are required");
    }
    std::string strError;
    if (!config_.Validate(strError)) {
        throw std::invalid_argument("SettlementEngine: " + strError);
    }

    LogPrintf("SettlementEngine: custody %s, %s\n", ShortAccount(custody_), config_.ToString());
}

// ============================================================================
// Helpers (cs_engine held)
// ============================================================================

bool SettlementEngine::IsOwner(const uint160& caller) const
{
    return !caller.IsNull() && caller == config_.owner;
}

bool SettlementEngine::IsOwnerOrOperator(const uint160& caller) const
{
    return IsOwner(caller) || (!caller.IsNull() && caller == config_.operatorAccount);
}

bool SettlementEngine::PullReserve(const uint160& from, const CAmount& amount, std::string& strError)
{
    CAmount balanceBefore = reserve_.BalanceOf(custody_);
    if (!reserve_.TransferFrom(custody_, from, custody_, amount)) {
        strError = "Reserve transfer from sender failed";
        return false;
    }

    CAmount balanceAfter = reserve_.BalanceOf(custody_);
    if (balanceAfter < balanceBefore) {
        strError = "Reserve balance decreased during transfer";
        return false;
    }

    CAmount received = balanceAfter - balanceBefore;
    if (received != amount) {
        if (received > 0 && !reserve_.Transfer(custody_, from, received)) {
            LogPrintf("SettlementEngine: failed to return short transfer of %s to %s\n",
                      FormatMoney(received), ShortAccount(from));
        }
        strError = strprintf("Short transfer: expected %s, received %s",
                             FormatMoney(amount), FormatMoney(received));
        return false;
    }
    return true;
}

bool SettlementEngine::RunQueue(const EngineConfig& cfg,
                                const std::optional<RedemptionRequest>& newRequest,
                                SettlementResult& result)
{
    CAmount available = reserve_.BalanceOf(custody_);
    ProcessResult plan = queue_.Plan(newRequest, available, cfg.maxBatch);

    size_t executed = 0;
    for (const RedemptionRequest& payout : plan.payouts) {
        if (!reserve_.Transfer(custody_, payout.beneficiary, payout.amount)) {
            LogPrintf("SettlementEngine: payout of %s to %s failed, left in queue\n",
                      FormatMoney(payout.amount), ShortAccount(payout.beneficiary));
            break;
        }
        executed++;
    }

    bool allExecuted = executed == plan.payouts.size();
    queue_.Apply(plan, executed);

    result.payouts.insert(result.payouts.end(), plan.payouts.begin(), plan.payouts.end());
    if (plan.hasNewRequest) {
        result.queued = plan.newRequestQueued;
    }
    return allExecuted;
}

bool SettlementEngine::SettleLocked(const EngineConfig& cfg, SettlementResult& result,
                                    SettlementError& error, std::string& message)
{
    if (!RunQueue(cfg, std::nullopt, result)) {
        error = SettlementError::EXTERNAL_CALL_FAILURE;
        message = "Redemption payout transfer failed";
        return false;
    }

    // Forwarding sees the balance left after the queue was paid down
    ForwardResult forward = liquidity_.ForwardExcess(*bridge_, cfg.liquidity);
    if (!forward.success) {
        error = forward.error;
        message = forward.errorMessage;
        return false;
    }
    result.forwarded += forward.forwarded;
    return true;
}

void SettlementEngine::AutoSettle(const EngineConfig& cfg, SettlementResult& result)
{
    SettlementError error = SettlementError::NONE;
    std::string message;
    if (!SettleLocked(cfg, result, error, message)) {
        result.settlementError = error;
        result.settlementMessage = message;
        LogPrintf("SettlementEngine: automatic settlement failed (%s): %s\n",
                  SettlementErrorToString(error), message);
    }
}

// ============================================================================
// Entry operations
// ============================================================================

SettlementResult SettlementEngine::Buy(const uint160& spender, const CAmount& reserveAmount)
{
    LOCK(cs_engine);
    const EngineConfig cfg = config_;
    try {
        return BuyLocked(cfg, spender, reserveAmount);
    } catch (const std::overflow_error& e) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strprintf("Arithmetic overflow: %s", e.what()));
    } catch (const std::range_error& e) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strprintf("Arithmetic underflow: %s", e.what()));
    }
}

SettlementResult SettlementEngine::BuyLocked(const EngineConfig& cfg, const uint160& spender,
                                             const CAmount& reserveAmount)
{
    if (spender.IsNull()) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Invalid spender");
    }
    if (reserveAmount == 0) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount must be greater than zero");
    }

    CAmount basePrice;
    if (!oracle_->GetPrice(basePrice)) {
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Oracle price unavailable");
    }

    PricingEngine pricing(cfg.pricing);
    PriceQuote quote;
    std::string strError;
    if (!pricing.GetBuyQuote(basePrice, quote, strError)) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strError);
    }

    if (reserveAmount <= quote.fee) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount too small");
    }
    CAmount netAmount = reserveAmount - quote.fee;
    CAmount tokens = PricingEngine::TokensForReserve(netAmount, quote.execPrice);
    if (tokens == 0) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount too small for current price");
    }

    if (!PullReserve(spender, reserveAmount, strError)) {
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, strError);
    }

    if (!token_.Mint(spender, tokens)) {
        if (!reserve_.Transfer(custody_, spender, reserveAmount)) {
            LogPrintf("SettlementEngine: failed to refund %s to %s\n", FormatMoney(reserveAmount), ShortAccount(spender));
        }
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Token mint failed");
    }

    if (quote.fee > 0 && !reserve_.Transfer(custody_, cfg.feeCollector, quote.fee)) {
        if (!token_.Burn(spender, tokens) || !reserve_.Transfer(custody_, spender, reserveAmount)) {
            LogPrintf("SettlementEngine: failed to unwind buy of %s by %s\n", FormatMoney(reserveAmount), ShortAccount(spender));
        }
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Fee transfer failed");
    }

    bridge_->SendMessage(custody_, SettlementRecord(SettlementAction::BUY, spender, netAmount).Serialize());

    SettlementResult result = SettlementResult::Success();
    result.execPrice = quote.execPrice;
    result.fee = quote.fee;
    result.netAmount = netAmount;
    result.tokens = tokens;

    LogPrint(BCLog::SETTLEMENT, "SettlementEngine: buy by %s: paid %s, fee %s, price %s, minted %s\n",
             ShortAccount(spender), FormatMoney(reserveAmount), FormatMoney(quote.fee),
             FormatMoney(quote.execPrice), FormatMoney(tokens));

    if (cfg.autoSettle) {
        AutoSettle(cfg, result);
    }
    return result;
}

SettlementResult SettlementEngine::Redeem(const uint160& holder, const CAmount& tokenAmount)
{
    LOCK(cs_engine);
    const EngineConfig cfg = config_;
    try {
        return RedeemLocked(cfg, holder, tokenAmount);
    } catch (const std::overflow_error& e) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strprintf("Arithmetic overflow: %s", e.what()));
    } catch (const std::range_error& e) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strprintf("Arithmetic underflow: %s", e.what()));
    }
}

SettlementResult SettlementEngine::RedeemLocked(const EngineConfig& cfg, const uint160& holder,
                                                const CAmount& tokenAmount)
{
    if (holder.IsNull()) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Invalid holder");
    }
    if (tokenAmount == 0) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount must be greater than zero");
    }

    CAmount basePrice;
    if (!oracle_->GetPrice(basePrice)) {
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Oracle price unavailable");
    }

    PricingEngine pricing(cfg.pricing);
    PriceQuote quote;
    std::string strError;
    if (!pricing.GetRedeemQuote(basePrice, quote, strError)) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strError);
    }

    CAmount grossAmount = PricingEngine::ReserveForTokens(tokenAmount, quote.execPrice);
    if (grossAmount <= quote.fee) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount too small");
    }
    CAmount netAmount = grossAmount - quote.fee;

    CAmount held = token_.BalanceOf(holder);
    if (held < tokenAmount) {
        return SettlementResult::Failure(SettlementError::INSUFFICIENT_BALANCE,
            strprintf("Insufficient token balance (need %s, have %s)", FormatMoney(tokenAmount), FormatMoney(held)));
    }

    CAmount localBalance = reserve_.BalanceOf(custody_);
    if (localBalance < quote.fee) {
        return SettlementResult::Failure(SettlementError::INSUFFICIENT_BALANCE,
            strprintf("Local reserve %s cannot cover redeem fee %s", FormatMoney(localBalance), FormatMoney(quote.fee)));
    }

    if (!token_.Burn(holder, tokenAmount)) {
        return SettlementResult::Failure(SettlementError::INSUFFICIENT_BALANCE, "Token burn failed");
    }

    if (quote.fee > 0 && !reserve_.Transfer(custody_, cfg.feeCollector, quote.fee)) {
        if (!token_.Mint(holder, tokenAmount)) {
            LogPrintf("SettlementEngine: failed to restore %s tokens of %s\n", FormatMoney(tokenAmount), ShortAccount(holder));
        }
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Fee transfer failed");
    }

    bridge_->SendMessage(custody_, SettlementRecord(SettlementAction::REDEEM, holder, netAmount).Serialize());

    SettlementResult result = SettlementResult::Success();
    result.execPrice = quote.execPrice;
    result.fee = quote.fee;
    result.netAmount = netAmount;
    result.tokens = tokenAmount;

    // The request is committed once burned: a failed payout leaves it queued
    if (!RunQueue(cfg, RedemptionRequest(holder, netAmount), result)) {
        result.settlementError = SettlementError::EXTERNAL_CALL_FAILURE;
        result.settlementMessage = "Redemption payout transfer failed";
    }

    LogPrint(BCLog::SETTLEMENT, "SettlementEngine: redeem by %s: burned %s, fee %s, price %s, owed %s, %s\n",
             ShortAccount(holder), FormatMoney(tokenAmount), FormatMoney(quote.fee),
             FormatMoney(quote.execPrice), FormatMoney(netAmount), result.queued ? "queued" : "paid");
    return result;
}

SettlementResult SettlementEngine::DepositBuffer(const uint160& caller, const CAmount& amount)
{
    LOCK(cs_engine);
    const EngineConfig cfg = config_;

    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    if (amount == 0) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount must be greater than zero");
    }

    std::string strError;
    if (!PullReserve(caller, amount, strError)) {
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, strError);
    }

    SettlementResult result = SettlementResult::Success();
    result.netAmount = amount;
    LogPrint(BCLog::SETTLEMENT, "SettlementEngine: buffer deposit of %s\n", FormatMoney(amount));

    if (cfg.autoSettle) {
        AutoSettle(cfg, result);
    }
    return result;
}

SettlementResult SettlementEngine::WithdrawBuffer(const uint160& caller, const CAmount& amount)
{
    LOCK(cs_engine);

    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    if (amount == 0) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Amount must be greater than zero");
    }

    CAmount localBalance = reserve_.BalanceOf(custody_);
    if (amount > localBalance) {
        return SettlementResult::Failure(SettlementError::INSUFFICIENT_BALANCE,
            strprintf("Withdraw of %s exceeds local balance %s", FormatMoney(amount), FormatMoney(localBalance)));
    }

    if (!reserve_.Transfer(custody_, caller, amount)) {
        return SettlementResult::Failure(SettlementError::EXTERNAL_CALL_FAILURE, "Reserve transfer to owner failed");
    }

    SettlementResult result = SettlementResult::Success();
    result.netAmount = amount;
    LogPrint(BCLog::SETTLEMENT, "SettlementEngine: buffer withdrawal of %s\n", FormatMoney(amount));
    return result;
}

SettlementResult SettlementEngine::ProcessQueue(const uint160& caller)
{
    LOCK(cs_engine);
    const EngineConfig cfg = config_;

    if (!IsOwnerOrOperator(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner or operator");
    }

    SettlementResult result = SettlementResult::Success();
    if (!RunQueue(cfg, std::nullopt, result)) {
        result.success = false;
        result.error = SettlementError::EXTERNAL_CALL_FAILURE;
        result.errorMessage = "Redemption payout transfer failed";
    }
    return result;
}

SettlementResult SettlementEngine::ForwardExcess(const uint160& caller)
{
    LOCK(cs_engine);
    const EngineConfig cfg = config_;

    if (!IsOwnerOrOperator(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner or operator");
    }

    ForwardResult forward = liquidity_.ForwardExcess(*bridge_, cfg.liquidity);
    if (!forward.success) {
        return SettlementResult::Failure(forward.error, forward.errorMessage);
    }

    SettlementResult result = SettlementResult::Success();
    result.forwarded = forward.forwarded;
    return result;
}

SettlementResult SettlementEngine::Settle(const uint160& caller)
{
    LOCK(cs_engine);
    const EngineConfig cfg = config_;

    if (!IsOwnerOrOperator(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner or operator");
    }

    SettlementResult result = SettlementResult::Success();
    SettlementError error = SettlementError::NONE;
    std::string message;
    if (!SettleLocked(cfg, result, error, message)) {
        // Payouts already transferred stay committed and are still reported
        result.success = false;
        result.error = error;
        result.errorMessage = message;
    }
    return result;
}

// ============================================================================
// Configuration authority
// ============================================================================

SettlementResult SettlementEngine::SetPricingParameters(const uint160& caller, const PricingParameters& params)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    std::string strError;
    if (!PricingEngine::ValidateParameters(params, strError)) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, strError);
    }
    config_.pricing = params;
    LogPrint(BCLog::CONFIG, "SettlementEngine: pricing set to buySpread=%s redeemSpread=%s buyFee=%s redeemFee=%s\n",
             FormatMoney(params.buySpread), FormatMoney(params.redeemSpread),
             FormatMoney(params.buyFee), FormatMoney(params.redeemFee));
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetLiquidityPolicy(const uint160& caller, const LiquidityPolicy& policy)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    config_.liquidity = policy;
    LogPrint(BCLog::CONFIG, "SettlementEngine: buffer threshold %s, min bridge amount %s\n",
             FormatMoney(policy.bufferThreshold), FormatMoney(policy.minBridgeAmount));
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetMaxBatch(const uint160& caller, uint32_t maxBatch)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    config_.maxBatch = maxBatch;
    LogPrint(BCLog::CONFIG, "SettlementEngine: max batch %u\n", maxBatch);
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetFeeCollector(const uint160& caller, const uint160& feeCollector)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    if (feeCollector.IsNull()) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Fee collector must be set");
    }
    config_.feeCollector = feeCollector;
    LogPrint(BCLog::CONFIG, "SettlementEngine: fee collector %s\n", ShortAccount(feeCollector));
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetOperator(const uint160& caller, const uint160& operatorAccount)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    // A null operator leaves settlement triggers to the owner alone
    config_.operatorAccount = operatorAccount;
    LogPrint(BCLog::CONFIG, "SettlementEngine: operator %s\n", ShortAccount(operatorAccount));
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetAutoSettle(const uint160& caller, bool autoSettle)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    config_.autoSettle = autoSettle;
    LogPrint(BCLog::CONFIG, "SettlementEngine: autosettle %d\n", autoSettle);
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetOracle(const uint160& caller, PriceOracle* oracle)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    if (oracle == nullptr) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Oracle must be set");
    }
    oracle_ = oracle;
    LogPrint(BCLog::CONFIG, "SettlementEngine: oracle replaced\n");
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::SetBridge(const uint160& caller, BridgeGateway* bridge)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    if (bridge == nullptr) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "Bridge must be set");
    }
    bridge_ = bridge;
    LogPrint(BCLog::CONFIG, "SettlementEngine: bridge set to %s\n", ShortAccount(bridge->GetAddress()));
    return SettlementResult::Success();
}

SettlementResult SettlementEngine::TransferOwnership(const uint160& caller, const uint160& newOwner)
{
    LOCK(cs_engine);
    if (!IsOwner(caller)) {
        return SettlementResult::Failure(SettlementError::UNAUTHORIZED, "Caller is not the owner");
    }
    if (newOwner.IsNull()) {
        return SettlementResult::Failure(SettlementError::INVALID_INPUT, "New owner must be set");
    }
    config_.owner = newOwner;
    LogPrint(BCLog::CONFIG, "SettlementEngine: ownership transferred to %s\n", ShortAccount(newOwner));
    return SettlementResult::Success();
}

// ============================================================================
// Queries
// ============================================================================

CAmount SettlementEngine::GetLocalBalance() const
{
    LOCK(cs_engine);
    return reserve_.BalanceOf(custody_);
}

uint64_t SettlementEngine::GetQueueLength() const
{
    LOCK(cs_engine);
    return queue_.Length();
}

std::vector<RedemptionRequest> SettlementEngine::GetPendingRedemptions() const
{
    LOCK(cs_engine);
    return queue_.GetPending();
}

CAmount SettlementEngine::GetTotalPending() const
{
    LOCK(cs_engine);
    return queue_.TotalPending();
}

EngineConfig SettlementEngine::GetConfig() const
{
    LOCK(cs_engine);
    return config_;
}

CAmount SettlementEngine::TokenBalanceOf(const uint160& account) const
{
    return token_.BalanceOf(account);
}

CAmount SettlementEngine::TotalSupply() const
{
    return token_.TotalSupply();
}

} // namespace backed
