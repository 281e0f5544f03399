// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_PRICING_ENGINE_H
#define BACKED_PRICING_ENGINE_H

/**
 * @file pricing_engine.h
 * @brief Oracle price to buy/redeem execution price and fee
 *
 * Prices and spreads are fixed point with scale PRICE_SCALE (10^18).
 * The buy side marks the oracle price up by the buy spread, the redeem
 * side marks it down by the redeem spread. Fees are flat reserve amounts.
 * All products are taken at 512 bits before dividing.
 */

#include <backed/backed_common.h>
#include <amount.h>

#include <string>

namespace backed {

/**
 * @brief Spreads and flat fees applied on top of the oracle price
 */
struct PricingParameters {
    /** Markup on buys, scale PRICE_SCALE */
    CAmount buySpread;

    /** Markdown on redeems, scale PRICE_SCALE. Must stay below 100%. */
    CAmount redeemSpread;

    /** Flat reserve fee charged per buy */
    CAmount buyFee;

    /** Flat reserve fee charged per redeem */
    CAmount redeemFee;

    PricingParameters()
        : buySpread(0)
        , redeemSpread(0)
        , buyFee(0)
        , redeemFee(0)
    {}

    PricingParameters(const CAmount& bSpread, const CAmount& rSpread,
                      const CAmount& bFee, const CAmount& rFee)
        : buySpread(bSpread)
        , redeemSpread(rSpread)
        , buyFee(bFee)
        , redeemFee(rFee)
    {}

    bool operator==(const PricingParameters& other) const {
        return buySpread == other.buySpread &&
               redeemSpread == other.redeemSpread &&
               buyFee == other.buyFee &&
               redeemFee == other.redeemFee;
    }
};

/**
 * @brief Execution price and fee for one operation
 */
struct PriceQuote {
    /** Reserve per token after spread, scale PRICE_SCALE */
    CAmount execPrice;

    /** Flat fee in reserve units */
    CAmount fee;

    PriceQuote() : execPrice(0), fee(0) {}
    PriceQuote(const CAmount& price, const CAmount& f) : execPrice(price), fee(f) {}
};

/**
 * @brief Stateless pricing transform over a parameter snapshot
 *
 * A PricingEngine is constructed from the parameters of one settlement
 * call so that the whole call prices against one consistent snapshot.
 */
class PricingEngine {
public:
    explicit PricingEngine(const PricingParameters& params);

    /**
     * @brief Check that the parameters can produce positive prices
     * @param[out] strError Reason on failure
     * @return false if redeemSpread >= 100%
     */
    static bool ValidateParameters(const PricingParameters& params, std::string& strError);

    /**
     * @brief Quote a buy
     * @param basePrice Oracle price, scale PRICE_SCALE
     * @param[out] quote execPrice = base + base*buySpread/P, fee = buyFee
     * @param[out] strError Reason on failure
     * @return false on a zero price
     */
    bool GetBuyQuote(const CAmount& basePrice, PriceQuote& quote, std::string& strError) const;

    /**
     * @brief Quote a redeem
     * @param basePrice Oracle price, scale PRICE_SCALE
     * @param[out] quote execPrice = base - base*redeemSpread/P, fee = redeemFee
     * @param[out] strError Reason on failure
     * @return false on a zero price or a spread that drives the price to zero
     */
    bool GetRedeemQuote(const CAmount& basePrice, PriceQuote& quote, std::string& strError) const;

    /** Tokens bought by a net reserve amount: net * P / execPrice */
    static CAmount TokensForReserve(const CAmount& netReserve, const CAmount& execPrice);

    /** Reserve paid for a token amount: tokens * execPrice / P */
    static CAmount ReserveForTokens(const CAmount& tokens, const CAmount& execPrice);

    const PricingParameters& GetParameters() const { return params_; }

private:
    PricingParameters params_;
};

} // namespace backed

#endif // BACKED_PRICING_ENGINE_H
