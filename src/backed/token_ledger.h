// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_TOKEN_LEDGER_H
#define BACKED_TOKEN_LEDGER_H

/**
 * @file token_ledger.h
 * @brief Fungible token bookkeeping used for the reserve asset and the
 *        synthetic token
 *
 * ReserveAsset is the interface the settlement engine consumes for the
 * external reserve asset: balances, transfers and spending allowances.
 * TokenLedger is the in-memory implementation used by the simulator and
 * the unit tests. It doubles as the synthetic token ledger, adding
 * Mint/Burn with supply tracking so that
 *
 *     sum(balances) == totalSupply == mintedSupply - burnedSupply
 *
 * holds after every operation.
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <map>
#include <string>

namespace backed {

/**
 * @brief Interface of a fungible reserve asset
 *
 * All mutating calls are atomic: they either apply completely and return
 * true, or leave every balance and allowance untouched and return false.
 */
class ReserveAsset {
public:
    virtual ~ReserveAsset() = default;

    /** Identifier of the asset, passed to the bridge on forward */
    virtual uint160 GetAssetId() const = 0;

    virtual CAmount BalanceOf(const uint160& account) const = 0;

    /** Move amount from 'from' to 'to' on behalf of 'from' */
    virtual bool Transfer(const uint160& from, const uint160& to, const CAmount& amount) = 0;

    /**
     * Move amount from 'from' to 'to' on behalf of 'spender', consuming
     * allowance(from, spender).
     */
    virtual bool TransferFrom(const uint160& spender, const uint160& from,
                              const uint160& to, const CAmount& amount) = 0;

    /** Set allowance(owner, spender) to amount (zero revokes) */
    virtual bool Approve(const uint160& owner, const uint160& spender, const CAmount& amount) = 0;

    virtual CAmount Allowance(const uint160& owner, const uint160& spender) const = 0;
};

/**
 * @brief Supply counters of a mintable token
 */
struct TokenSupply {
    /** Sum of all balances */
    CAmount totalSupply;

    /** Tokens created through Mint */
    CAmount mintedSupply;

    /** Tokens destroyed through Burn */
    CAmount burnedSupply;

    TokenSupply()
        : totalSupply(0)
        , mintedSupply(0)
        , burnedSupply(0)
    {}

    /** totalSupply == mintedSupply - burnedSupply */
    bool VerifyInvariant() const {
        return burnedSupply <= mintedSupply &&
               totalSupply == mintedSupply - burnedSupply;
    }

    bool operator==(const TokenSupply& other) const {
        return totalSupply == other.totalSupply &&
               mintedSupply == other.mintedSupply &&
               burnedSupply == other.burnedSupply;
    }

    bool operator!=(const TokenSupply& other) const {
        return !(*this == other);
    }
};

/**
 * @brief In-memory token ledger
 *
 * Thread-safe; every call takes cs_ledger_. Zero balances and zero
 * allowances are erased so GetAccountCount() only counts holders.
 */
class TokenLedger : public ReserveAsset {
public:
    TokenLedger(const uint160& assetId, const std::string& symbol);

    uint160 GetAssetId() const override { return assetId_; }
    const std::string& GetSymbol() const { return symbol_; }

    CAmount BalanceOf(const uint160& account) const override;
    bool Transfer(const uint160& from, const uint160& to, const CAmount& amount) override;
    bool TransferFrom(const uint160& spender, const uint160& from,
                      const uint160& to, const CAmount& amount) override;
    bool Approve(const uint160& owner, const uint160& spender, const CAmount& amount) override;
    CAmount Allowance(const uint160& owner, const uint160& spender) const override;

    /** Create amount new tokens in 'to' */
    bool Mint(const uint160& to, const CAmount& amount);

    /** Destroy amount tokens held by 'from'; fails if 'from' holds less */
    bool Burn(const uint160& from, const CAmount& amount);

    TokenSupply GetSupply() const;
    CAmount TotalSupply() const;

    /**
     * Check the supply counters and that the balances sum to totalSupply.
     * O(number of holders).
     */
    bool VerifySupplyInvariant() const;

    size_t GetAccountCount() const;

protected:
    /** Debit/credit without any checks beyond balance; cs_ledger_ held */
    bool MoveBalance(const uint160& from, const uint160& to, const CAmount& amount);

    mutable CCriticalSection cs_ledger_;

private:
    uint160 assetId_;
    std::string symbol_;
    std::map<uint160, CAmount> balances_;
    std::map<std::pair<uint160, uint160>, CAmount> allowances_;
    TokenSupply supply_;
};

} // namespace backed

#endif // BACKED_TOKEN_LEDGER_H
