// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/settlement_record.h>

#include <algorithm>
#include <iterator>

namespace backed {

std::vector<unsigned char> SettlementRecord::Serialize() const
{
    std::vector<unsigned char> out;
    out.reserve(SETTLEMENT_RECORD_SIZE);

    out.push_back(static_cast<unsigned char>(action));
    out.insert(out.end(), participant.begin(), participant.end());

    // export_bits writes the minimal big-endian form; left-pad to 32 bytes
    std::vector<unsigned char> amountBytes;
    boost::multiprecision::export_bits(amount, std::back_inserter(amountBytes), 8);
    if (amount == 0) {
        amountBytes.clear();
    }
    out.insert(out.end(), SETTLEMENT_AMOUNT_SIZE - amountBytes.size(), 0);
    out.insert(out.end(), amountBytes.begin(), amountBytes.end());

    return out;
}

bool SettlementRecord::Deserialize(const std::vector<unsigned char>& data)
{
    if (data.size() != SETTLEMENT_RECORD_SIZE) {
        return false;
    }

    uint8_t tag = data[0];
    if (tag > static_cast<uint8_t>(SettlementAction::REDEEM)) {
        return false;
    }

    std::copy(data.begin() + 1, data.begin() + 21, participant.begin());

    CAmount value = 0;
    boost::multiprecision::import_bits(value, data.begin() + 21, data.end(), 8);

    action = static_cast<SettlementAction>(tag);
    amount = value;
    return true;
}

} // namespace backed
