// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/bridge_gateway.h>
#include <backed/backed_common.h>
#include <backed/token_ledger.h>
#include <util.h>
#include <utilmoneystr.h>

namespace backed {

LocalBridge::LocalBridge(const uint160& address, ReserveAsset& reserve)
    : address_(address)
    , reserve_(reserve)
    , failing_(false)
{
}

bool LocalBridge::SendStable(const uint160& from, const uint160& assetId, const CAmount& amount)
{
    LOCK(cs_bridge_);

    if (failing_) {
        LogPrint(BCLog::BRIDGE, "LocalBridge: rejecting transfer of %s from %s\n",
                 FormatMoney(amount), ShortAccount(from));
        return false;
    }

    if (assetId != reserve_.GetAssetId()) {
        LogPrint(BCLog::BRIDGE, "LocalBridge: unknown asset %s\n", AccountToString(assetId));
        return false;
    }

    if (amount == 0) {
        return false;
    }

    if (!reserve_.TransferFrom(address_, from, address_, amount)) {
        LogPrint(BCLog::BRIDGE, "LocalBridge: pull of %s from %s failed\n",
                 FormatMoney(amount), ShortAccount(from));
        return false;
    }

    StableSentEvent event(assetId, from, amount);
    stableSent_.push_back(event);
    pendingNotifications_.push_back(event);

    LogPrint(BCLog::BRIDGE, "LocalBridge: StableSent %s from %s\n",
             FormatMoney(amount), ShortAccount(from));
    return true;
}

size_t LocalBridge::ProcessNotifications()
{
    std::vector<StableSentEvent> events;
    std::vector<StableSentCallback> callbacks;
    {
        LOCK(cs_bridge_);
        events.swap(pendingNotifications_);
        callbacks = stableSentCallbacks_;
    }

    for (const auto& event : events) {
        for (const auto& callback : callbacks) {
            callback(event);
        }
    }
    return events.size();
}

void LocalBridge::SendMessage(const uint160& from, const std::vector<unsigned char>& payload)
{
    LOCK(cs_bridge_);
    messages_.emplace_back(from, payload);
    LogPrint(BCLog::BRIDGE, "LocalBridge: MessageSent (%u bytes) from %s\n",
             payload.size(), ShortAccount(from));
}

void LocalBridge::SetFailing(bool failing)
{
    LOCK(cs_bridge_);
    failing_ = failing;
}

void LocalBridge::RegisterStableSentCallback(StableSentCallback callback)
{
    LOCK(cs_bridge_);
    stableSentCallbacks_.push_back(std::move(callback));
}

std::vector<StableSentEvent> LocalBridge::GetStableSent() const
{
    LOCK(cs_bridge_);
    return stableSent_;
}

std::vector<MessageSentEvent> LocalBridge::GetMessages() const
{
    LOCK(cs_bridge_);
    return messages_;
}

CAmount LocalBridge::GetTotalReceived() const
{
    LOCK(cs_bridge_);
    CAmount total = 0;
    for (const auto& event : stableSent_) {
        total += event.amount;
    }
    return total;
}

} // namespace backed
