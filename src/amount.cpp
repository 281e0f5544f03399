// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <amount.h>

#include <stdexcept>

CAmount MulDiv(const CAmount& a, const CAmount& b, const CAmount& d)
{
    if (d == 0) {
        throw std::overflow_error("MulDiv: division by zero");
    }
    CWideAmount product = CWideAmount(a) * CWideAmount(b);
    CWideAmount quotient = product / CWideAmount(d);
    if (quotient > CWideAmount(MaxAmount())) {
        throw std::overflow_error("MulDiv: result exceeds 256 bits");
    }
    return static_cast<CAmount>(quotient);
}
