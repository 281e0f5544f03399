// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_PRICE_ORACLE_H
#define BACKED_PRICE_ORACLE_H

#include <amount.h>
#include <sync.h>

namespace backed {

/**
 * @brief Source of the reserve-per-token price (scale PRICE_SCALE)
 */
class PriceOracle {
public:
    virtual ~PriceOracle() = default;

    /**
     * Fetch the current price.
     * @return false if no price is available
     */
    virtual bool GetPrice(CAmount& price) const = 0;
};

/**
 * @brief Oracle returning a price set by its operator
 *
 * Used by the simulator (-oracleprice, setprice) and the unit tests.
 * A price of zero is reported as-is; the pricing engine rejects it.
 */
class FixedPriceOracle : public PriceOracle {
public:
    explicit FixedPriceOracle(const CAmount& price);

    bool GetPrice(CAmount& price) const override;

    void SetPrice(const CAmount& price);

    /** Simulate an unavailable feed */
    void SetAvailable(bool available);

private:
    mutable CCriticalSection cs_oracle_;
    CAmount price_;
    bool available_;
};

} // namespace backed

#endif // BACKED_PRICE_ORACLE_H
