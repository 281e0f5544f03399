// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utilmoneystr.h>

#include <cctype>
#include <stdexcept>

std::string FormatMoney(const CAmount& n)
{
    CAmount quotient = n / COIN;
    CAmount remainder = n % COIN;

    std::string frac = remainder.str();
    if (frac.size() < static_cast<size_t>(COIN_DECIMALS)) {
        frac.insert(0, COIN_DECIMALS - frac.size(), '0');
    }

    // Right-trim excess zeros after the decimal point, keeping two
    size_t nTrim = 0;
    for (int i = frac.size() - 1; i >= 2 && frac[i] == '0'; --i)
        ++nTrim;
    frac.erase(frac.size() - nTrim, nTrim);

    return quotient.str() + "." + frac;
}

bool ParseMoney(const std::string& str, CAmount& nRet)
{
    return ParseMoney(str.c_str(), nRet);
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    std::string strWhole;
    std::string strFrac;
    const char* p = pszIn;
    while (isspace((unsigned char)*p))
        p++;
    for (; *p; p++)
    {
        if (*p == '.')
        {
            p++;
            for (; *p && isdigit((unsigned char)*p); p++)
            {
                if (strFrac.size() >= static_cast<size_t>(COIN_DECIMALS))
                    return false;
                strFrac.push_back(*p);
            }
            break;
        }
        if (isspace((unsigned char)*p))
            break;
        if (!isdigit((unsigned char)*p))
            return false;
        strWhole.push_back(*p);
    }
    for (; *p; p++)
        if (!isspace((unsigned char)*p))
            return false;
    if (strWhole.empty() && strFrac.empty())
        return false;
    strFrac.append(COIN_DECIMALS - strFrac.size(), '0');

    try {
        CAmount nUnits = 0;
        for (char c : strWhole + strFrac) {
            nUnits = nUnits * 10 + (c - '0');
        }
        nRet = nUnits;
    } catch (const std::exception&) {
        // overflow of the 256-bit range
        return false;
    }
    return true;
}
