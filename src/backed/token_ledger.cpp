// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/token_ledger.h>
#include <backed/backed_common.h>
#include <util.h>
#include <utilmoneystr.h>

#include <stdexcept>

namespace backed {

TokenLedger::TokenLedger(const uint160& assetId, const std::string& symbol)
    : assetId_(assetId)
    , symbol_(symbol)
{
}

CAmount TokenLedger::BalanceOf(const uint160& account) const
{
    LOCK(cs_ledger_);
    auto it = balances_.find(account);
    return it == balances_.end() ? CAmount(0) : it->second;
}

bool TokenLedger::MoveBalance(const uint160& from, const uint160& to, const CAmount& amount)
{
    auto it = balances_.find(from);
    CAmount fromBalance = it == balances_.end() ? CAmount(0) : it->second;
    if (fromBalance < amount) {
        LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): insufficient balance for %s (need %s, have %s)\n",
                 symbol_, ShortAccount(from), FormatMoney(amount), FormatMoney(fromBalance));
        return false;
    }
    if (amount == 0 || from == to) {
        return true;
    }

    CAmount newFrom = fromBalance - amount;
    CAmount newTo;
    try {
        newTo = BalanceOf(to) + amount;
    } catch (const std::overflow_error& e) {
        LogPrintf("TokenLedger(%s): credit to %s overflows: %s\n", symbol_, ShortAccount(to), e.what());
        return false;
    }

    if (newFrom == 0) {
        balances_.erase(from);
    } else {
        balances_[from] = newFrom;
    }
    balances_[to] = newTo;
    return true;
}

bool TokenLedger::Transfer(const uint160& from, const uint160& to, const CAmount& amount)
{
    LOCK(cs_ledger_);
    if (from.IsNull() || to.IsNull()) {
        LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): transfer with null account rejected\n", symbol_);
        return false;
    }
    return MoveBalance(from, to, amount);
}

bool TokenLedger::TransferFrom(const uint160& spender, const uint160& from,
                               const uint160& to, const CAmount& amount)
{
    LOCK(cs_ledger_);
    if (from.IsNull() || to.IsNull() || spender.IsNull()) {
        LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): transferFrom with null account rejected\n", symbol_);
        return false;
    }

    if (spender != from) {
        CAmount allowed = Allowance(from, spender);
        if (allowed < amount) {
            LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): allowance of %s for %s too low (need %s, have %s)\n",
                     symbol_, ShortAccount(spender), ShortAccount(from),
                     FormatMoney(amount), FormatMoney(allowed));
            return false;
        }
        if (!MoveBalance(from, to, amount)) {
            return false;
        }
        CAmount remaining = allowed - amount;
        if (remaining == 0) {
            allowances_.erase(std::make_pair(from, spender));
        } else {
            allowances_[std::make_pair(from, spender)] = remaining;
        }
        return true;
    }

    return MoveBalance(from, to, amount);
}

bool TokenLedger::Approve(const uint160& owner, const uint160& spender, const CAmount& amount)
{
    LOCK(cs_ledger_);
    if (owner.IsNull() || spender.IsNull()) {
        return false;
    }
    if (amount == 0) {
        allowances_.erase(std::make_pair(owner, spender));
    } else {
        allowances_[std::make_pair(owner, spender)] = amount;
    }
    return true;
}

CAmount TokenLedger::Allowance(const uint160& owner, const uint160& spender) const
{
    LOCK(cs_ledger_);
    auto it = allowances_.find(std::make_pair(owner, spender));
    return it == allowances_.end() ? CAmount(0) : it->second;
}

bool TokenLedger::Mint(const uint160& to, const CAmount& amount)
{
    LOCK(cs_ledger_);
    if (to.IsNull() || amount == 0) {
        return false;
    }

    CAmount newBalance;
    CAmount newMinted;
    CAmount newTotal;
    try {
        newBalance = BalanceOf(to) + amount;
        newMinted = supply_.mintedSupply + amount;
        newTotal = supply_.totalSupply + amount;
    } catch (const std::exception& e) {
        LogPrintf("TokenLedger(%s): Mint overflow: %s\n", symbol_, e.what());
        return false;
    }

    balances_[to] = newBalance;
    supply_.mintedSupply = newMinted;
    supply_.totalSupply = newTotal;

    LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): minted %s to %s\n",
             symbol_, FormatMoney(amount), ShortAccount(to));
    return true;
}

bool TokenLedger::Burn(const uint160& from, const CAmount& amount)
{
    LOCK(cs_ledger_);
    if (from.IsNull() || amount == 0) {
        return false;
    }

    CAmount balance = BalanceOf(from);
    if (balance < amount) {
        LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): burn of %s exceeds balance %s of %s\n",
                 symbol_, FormatMoney(amount), FormatMoney(balance), ShortAccount(from));
        return false;
    }

    CAmount newBalance = balance - amount;
    if (newBalance == 0) {
        balances_.erase(from);
    } else {
        balances_[from] = newBalance;
    }
    supply_.burnedSupply += amount;
    supply_.totalSupply -= amount;

    LogPrint(BCLog::SETTLEMENT, "TokenLedger(%s): burned %s from %s\n",
             symbol_, FormatMoney(amount), ShortAccount(from));
    return true;
}

TokenSupply TokenLedger::GetSupply() const
{
    LOCK(cs_ledger_);
    return supply_;
}

CAmount TokenLedger::TotalSupply() const
{
    LOCK(cs_ledger_);
    return supply_.totalSupply;
}

bool TokenLedger::VerifySupplyInvariant() const
{
    LOCK(cs_ledger_);
    if (!supply_.VerifyInvariant()) {
        return false;
    }
    CAmount sum = 0;
    for (const auto& entry : balances_) {
        sum += entry.second;
    }
    return sum == supply_.totalSupply;
}

size_t TokenLedger::GetAccountCount() const
{
    LOCK(cs_ledger_);
    return balances_.size();
}

} // namespace backed
