// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef BACKED_UTILMONEYSTR_H
#define BACKED_UTILMONEYSTR_H

#include <amount.h>

#include <string>

/** Number of fractional digits of one COIN */
static constexpr int COIN_DECIMALS = 18;

/** Format an amount as whole units with at least two fractional digits, e.g. "1.50" */
std::string FormatMoney(const CAmount& n);

/**
 * Parse a decimal string with at most 18 fractional digits into base units.
 * Leading/trailing whitespace is ignored. Rejects signs, exponents and values
 * that do not fit in 256 bits.
 */
bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

#endif // BACKED_UTILMONEYSTR_H
