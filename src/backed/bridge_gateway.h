// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_BRIDGE_GATEWAY_H
#define BACKED_BRIDGE_GATEWAY_H

/**
 * @file bridge_gateway.h
 * @brief Settlement channel to the other execution domain
 *
 * The engine forwards surplus reserve through SendStable and reports every
 * buy and redeem through SendMessage. SendStable pulls funds the sender has
 * authorized beforehand and is atomic: either the funds move and the
 * authorization is consumed, or nothing changes.
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace backed {

class ReserveAsset;

/** Reserve moved across the bridge */
struct StableSentEvent {
    uint160 assetId;
    uint160 from;
    CAmount amount;

    StableSentEvent() : amount(0) {}
    StableSentEvent(const uint160& asset, const uint160& sender, const CAmount& amt)
        : assetId(asset), from(sender), amount(amt) {}
};

/** Opaque settlement record handed to the bridge */
struct MessageSentEvent {
    uint160 from;
    std::vector<unsigned char> payload;

    MessageSentEvent() {}
    MessageSentEvent(const uint160& sender, const std::vector<unsigned char>& data)
        : from(sender), payload(data) {}
};

/**
 * @brief Interface of the external bridge
 */
class BridgeGateway {
public:
    virtual ~BridgeGateway() = default;

    /** Account that must be authorized to pull forwarded funds */
    virtual uint160 GetAddress() const = 0;

    /**
     * Pull amount of assetId from 'from', which must have authorized
     * GetAddress() for at least amount.
     * @return false if the transfer was rejected; nothing moved in that case
     */
    virtual bool SendStable(const uint160& from, const uint160& assetId, const CAmount& amount) = 0;

    /** Deliver a settlement record; delivery is not confirmed */
    virtual void SendMessage(const uint160& from, const std::vector<unsigned char>& payload) = 0;
};

/**
 * @brief In-process bridge for the simulator and the unit tests
 *
 * Pulls forwarded funds into its own account on the reserve ledger and
 * keeps a log of every transfer and message. StableSent notifications are
 * queued by SendStable and delivered by ProcessNotifications, so callbacks
 * never run inside the caller of SendStable and may call back into it.
 */
class LocalBridge : public BridgeGateway {
public:
    /** Callback type for forwarded reserve notifications */
    using StableSentCallback = std::function<void(const StableSentEvent&)>;

    LocalBridge(const uint160& address, ReserveAsset& reserve);

    uint160 GetAddress() const override { return address_; }
    bool SendStable(const uint160& from, const uint160& assetId, const CAmount& amount) override;
    void SendMessage(const uint160& from, const std::vector<unsigned char>& payload) override;

    /** Reject every following SendStable */
    void SetFailing(bool failing);

    void RegisterStableSentCallback(StableSentCallback callback);

    /**
     * Deliver queued StableSent notifications to the registered callbacks.
     * Must not be called from inside an engine operation.
     * @return number of events delivered
     */
    size_t ProcessNotifications();

    std::vector<StableSentEvent> GetStableSent() const;
    std::vector<MessageSentEvent> GetMessages() const;

    /** Sum of all forwarded amounts */
    CAmount GetTotalReceived() const;

private:
    mutable CCriticalSection cs_bridge_;
    uint160 address_;
    ReserveAsset& reserve_;
    bool failing_;
    std::vector<StableSentEvent> stableSent_;
    std::vector<MessageSentEvent> messages_;
    std::vector<StableSentCallback> stableSentCallbacks_;
    std::vector<StableSentEvent> pendingNotifications_;
};

} // namespace backed

#endif // BACKED_BRIDGE_GATEWAY_H
