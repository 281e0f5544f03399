// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/pricing_engine.h>
#include <util.h>
#include <utilmoneystr.h>

namespace backed {

PricingEngine::PricingEngine(const PricingParameters& params)
    : params_(params)
{
}

bool PricingEngine::ValidateParameters(const PricingParameters& params, std::string& strError)
{
    if (params.redeemSpread >= PRICE_SCALE) {
        strError = strprintf("redeem spread %s must be below 100%%", FormatMoney(params.redeemSpread));
        return false;
    }
    return true;
}

bool PricingEngine::GetBuyQuote(const CAmount& basePrice, PriceQuote& quote, std::string& strError) const
{
    if (basePrice == 0) {
        strError = "oracle price must be positive";
        return false;
    }

    CAmount markup = MulDiv(basePrice, params_.buySpread, PRICE_SCALE);
    quote = PriceQuote(basePrice + markup, params_.buyFee);

    LogPrint(BCLog::PRICING, "PricingEngine: buy quote base=%s exec=%s fee=%s\n",
             FormatMoney(basePrice), FormatMoney(quote.execPrice), FormatMoney(quote.fee));
    return true;
}

bool PricingEngine::GetRedeemQuote(const CAmount& basePrice, PriceQuote& quote, std::string& strError) const
{
    if (basePrice == 0) {
        strError = "oracle price must be positive";
        return false;
    }

    // A spread of 100% or more is a configuration error, never clamped
    if (!ValidateParameters(params_, strError)) {
        return false;
    }

    CAmount markdown = MulDiv(basePrice, params_.redeemSpread, PRICE_SCALE);
    quote = PriceQuote(basePrice - markdown, params_.redeemFee);

    LogPrint(BCLog::PRICING, "PricingEngine: redeem quote base=%s exec=%s fee=%s\n",
             FormatMoney(basePrice), FormatMoney(quote.execPrice), FormatMoney(quote.fee));
    return true;
}

CAmount PricingEngine::TokensForReserve(const CAmount& netReserve, const CAmount& execPrice)
{
    return MulDiv(netReserve, PRICE_SCALE, execPrice);
}

CAmount PricingEngine::ReserveForTokens(const CAmount& tokens, const CAmount& execPrice)
{
    return MulDiv(tokens, execPrice, PRICE_SCALE);
}

} // namespace backed
