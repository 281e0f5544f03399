// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/backed_common.h>

#include <utilstrencodings.h>

#include <cctype>

namespace backed {

std::string SettlementActionToString(SettlementAction action)
{
    switch (action) {
        case SettlementAction::BUY:    return "BUY";
        case SettlementAction::REDEEM: return "REDEEM";
        default:                       return "UNKNOWN";
    }
}

std::string SettlementErrorToString(SettlementError error)
{
    switch (error) {
        case SettlementError::NONE:                  return "NONE";
        case SettlementError::INVALID_INPUT:         return "INVALID_INPUT";
        case SettlementError::INSUFFICIENT_BALANCE:  return "INSUFFICIENT_BALANCE";
        case SettlementError::EXTERNAL_CALL_FAILURE: return "EXTERNAL_CALL_FAILURE";
        case SettlementError::UNAUTHORIZED:          return "UNAUTHORIZED";
        default:                                     return "UNKNOWN";
    }
}

std::string AccountToString(const uint160& account)
{
    // Names are stored as ASCII followed by zero padding
    const unsigned char* it = account.begin();
    std::string name;
    while (it != account.end() && *it != 0) {
        if (!isalnum(*it) && *it != '_') {
            break;
        }
        name.push_back(static_cast<char>(*it++));
    }
    bool padded = !name.empty();
    for (; padded && it != account.end(); ++it) {
        padded = *it == 0;
    }
    if (padded) {
        return name;
    }
    return HexStr(account.begin(), account.end());
}

std::string ShortAccount(const uint160& account)
{
    return AccountToString(account).substr(0, 16);
}

} // namespace backed
