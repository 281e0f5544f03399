// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_AMOUNT_H
#define BACKED_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>

/**
 * Amount in the smallest unit of the reserve asset or the synthetic token.
 *
 * Both assets use 18 decimals, so amounts routinely exceed 64 bits. The
 * checked 256-bit type throws std::overflow_error on overflow and
 * std::range_error on a subtraction that would go negative instead of
 * wrapping around.
 */
typedef boost::multiprecision::checked_uint256_t CAmount;

/** Intermediate type for products of two amounts */
typedef boost::multiprecision::uint512_t CWideAmount;

/** One whole unit (10^18 base units) */
static const CAmount COIN = CAmount(1000000000000000000ULL);

/** Largest representable amount */
inline CAmount MaxAmount()
{
    return std::numeric_limits<CAmount>::max();
}

/**
 * Compute a * b / d with a 512-bit intermediate product.
 * Throws std::overflow_error if d is zero or the quotient does not fit.
 */
CAmount MulDiv(const CAmount& a, const CAmount& b, const CAmount& d);

#endif // BACKED_AMOUNT_H
