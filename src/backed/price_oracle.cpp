// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/price_oracle.h>
#include <util.h>
#include <utilmoneystr.h>

namespace backed {

FixedPriceOracle::FixedPriceOracle(const CAmount& price)
    : price_(price)
    , available_(true)
{
}

bool FixedPriceOracle::GetPrice(CAmount& price) const
{
    LOCK(cs_oracle_);
    if (!available_) {
        return false;
    }
    price = price_;
    return true;
}

void FixedPriceOracle::SetPrice(const CAmount& price)
{
    LOCK(cs_oracle_);
    price_ = price;
    LogPrint(BCLog::PRICING, "FixedPriceOracle: price set to %s\n", FormatMoney(price));
}

void FixedPriceOracle::SetAvailable(bool available)
{
    LOCK(cs_oracle_);
    available_ = available;
}

} // namespace backed
