// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_REDEMPTION_QUEUE_H
#define BACKED_REDEMPTION_QUEUE_H

/**
 * @file redemption_queue.h
 * @brief FIFO queue of redemption payouts waiting for local liquidity
 *
 * A redemption whose net payout cannot be covered by the local reserve
 * balance is parked here and paid later, strictly in arrival order. The
 * queue never skips a queued request that does not fit: an oversized
 * request at the head blocks everything behind it until enough liquidity
 * has accumulated. This head-of-line blocking is the ordering policy, not
 * an accident of the implementation.
 *
 * Each call settles at most maxBatch requests, so a deep queue needs
 * several calls to drain.
 *
 * Storage is pluggable (see RedemptionStore):
 * - IndexedRedemptionStore: head/tail indexed slots, erased on dequeue and
 *   never reused. O(1) per operation, live storage is tail - head.
 * - CompactingRedemptionStore: append-only vector with an advancing head,
 *   compacted once the head passes half the vector. Bounds allocated
 *   capacity at the cost of an O(n) shift on compaction.
 */

#include <backed/backed_common.h>
#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace backed {

/**
 * @brief A payout obligation to one beneficiary
 *
 * Immutable once created; removed from the queue only by being paid.
 */
struct RedemptionRequest {
    /** Account receiving the reserve payout */
    uint160 beneficiary;

    /** Reserve amount owed */
    CAmount amount;

    RedemptionRequest() : amount(0) {}

    RedemptionRequest(const uint160& who, const CAmount& amt)
        : beneficiary(who)
        , amount(amt)
    {}

    /** A request with no beneficiary or no amount is never queued */
    bool IsValid() const {
        return !beneficiary.IsNull() && amount > 0;
    }

    bool operator==(const RedemptionRequest& other) const {
        return beneficiary == other.beneficiary && amount == other.amount;
    }
};

// ============================================================================
// Storage strategies
// ============================================================================

/** Backing storage selector */
enum class QueueStorage : uint8_t {
    INDEXED = 0,
    COMPACTING = 1
};

std::string QueueStorageToString(QueueStorage storage);
bool ParseQueueStorage(const std::string& str, QueueStorage& storage);

/**
 * @brief Ordered storage behind a RedemptionQueue
 *
 * Indices are absolute: Head() is the index of the next unpaid request and
 * Tail() the index the next appended request will get.
 */
class RedemptionStore {
public:
    virtual ~RedemptionStore() = default;

    /** Append at the tail */
    virtual void PushBack(const RedemptionRequest& request) = 0;

    /** Request at Head() + offset. Throws std::out_of_range past the tail. */
    virtual const RedemptionRequest& At(uint64_t offset) const = 0;

    /** Drop count requests from the head */
    virtual void PopFront(uint64_t count) = 0;

    virtual uint64_t Head() const = 0;
    virtual uint64_t Tail() const = 0;

    /** Slots currently held in memory, live or not */
    virtual size_t AllocatedSlots() const = 0;

    uint64_t Size() const { return Tail() - Head(); }
};

/**
 * @brief Head/tail indexed slots, cleared on dequeue
 */
class IndexedRedemptionStore : public RedemptionStore {
public:
    IndexedRedemptionStore();

    void PushBack(const RedemptionRequest& request) override;
    const RedemptionRequest& At(uint64_t offset) const override;
    void PopFront(uint64_t count) override;
    uint64_t Head() const override { return head_; }
    uint64_t Tail() const override { return tail_; }
    size_t AllocatedSlots() const override { return slots_.size(); }

private:
    std::unordered_map<uint64_t, RedemptionRequest> slots_;
    uint64_t head_;
    uint64_t tail_;
};

/**
 * @brief Append-only vector with periodic compaction
 *
 * Dequeued entries stay in the vector until the head passes half of it;
 * the remaining entries are then shifted down and the vector truncated.
 */
class CompactingRedemptionStore : public RedemptionStore {
public:
    CompactingRedemptionStore();

    void PushBack(const RedemptionRequest& request) override;
    const RedemptionRequest& At(uint64_t offset) const override;
    void PopFront(uint64_t count) override;
    uint64_t Head() const override { return base_ + headPos_; }
    uint64_t Tail() const override { return base_ + entries_.size(); }
    size_t AllocatedSlots() const override { return entries_.size(); }

    /** Number of compactions performed so far */
    uint64_t GetCompactionCount() const { return compactions_; }

private:
    void MaybeCompact();

    std::vector<RedemptionRequest> entries_;

    /** Position of the head inside entries_ */
    size_t headPos_;

    /** Absolute index of entries_[0] */
    uint64_t base_;

    uint64_t compactions_;
};

std::unique_ptr<RedemptionStore> MakeRedemptionStore(QueueStorage storage);

// ============================================================================
// RedemptionQueue
// ============================================================================

/**
 * @brief Outcome of one settlement pass over the queue
 */
struct ProcessResult {
    /** Payouts in FIFO order: queued requests first, then the new request */
    std::vector<RedemptionRequest> payouts;

    /** Number of leading payouts that came from the queue */
    uint64_t queuedPaid;

    /** Whether a valid new request was supplied */
    bool hasNewRequest;

    /** The supplied new request (valid only if hasNewRequest) */
    RedemptionRequest newRequest;

    /** New request paid immediately */
    bool newRequestPaid;

    /** New request appended at the tail */
    bool newRequestQueued;

    /** Liquidity the pass started with */
    CAmount available;

    /** available minus every payout */
    CAmount remaining;

    ProcessResult()
        : queuedPaid(0)
        , hasNewRequest(false)
        , newRequestPaid(false)
        , newRequestQueued(false)
        , available(0)
        , remaining(0)
    {}

    CAmount TotalPaid() const;
};

/**
 * @brief Admission-controlled FIFO of pending redemptions
 *
 * Not thread-safe. The owning SettlementEngine serializes every access
 * together with the local reserve balance it settles against.
 */
class RedemptionQueue {
public:
    explicit RedemptionQueue(QueueStorage storage = QueueStorage::INDEXED);
    explicit RedemptionQueue(std::unique_ptr<RedemptionStore> store);

    /**
     * @brief Settle queued requests and admit a new one
     * @param newRequest Optional new request; ignored unless IsValid()
     * @param available Liquidity for this pass
     * @param maxBatch Upper bound on requests paid by this pass
     * @return The payouts, already dequeued
     *
     * 1. From the head, pay queued requests while fewer than maxBatch were
     *    paid and the next one fits the remaining liquidity.
     * 2. Stop at the first queued request that does not fit.
     * 3. Pay the new request if the batch is not exhausted and it fits,
     *    otherwise append it at the tail.
     *
     * The caller must transfer every payout. Use Plan() and Apply() when
     * the transfers can fail.
     */
    ProcessResult Process(const std::optional<RedemptionRequest>& newRequest,
                          const CAmount& available,
                          uint32_t maxBatch);

    /**
     * @brief Compute what Process() would pay, without mutating the queue
     */
    ProcessResult Plan(const std::optional<RedemptionRequest>& newRequest,
                       const CAmount& available,
                       uint32_t maxBatch) const;

    /**
     * @brief Commit the first executed payouts of a plan
     * @param plan A plan computed against the current queue state; updated
     *             to describe what was committed
     * @param executed Number of leading payouts actually transferred
     *
     * Queued requests not covered by executed stay at the head. A new
     * request that was not executed is appended at the tail.
     */
    void Apply(ProcessResult& plan, size_t executed);

    /** Number of unpaid requests (tail - head) */
    uint64_t Length() const { return store_->Size(); }

    uint64_t Head() const { return store_->Head(); }
    uint64_t Tail() const { return store_->Tail(); }

    /** Request at head + offset, if any */
    std::optional<RedemptionRequest> Peek(uint64_t offset = 0) const;

    /** All unpaid requests in FIFO order */
    std::vector<RedemptionRequest> GetPending() const;

    /** Sum of all unpaid amounts */
    CAmount TotalPending() const;

    const RedemptionStore& GetStore() const { return *store_; }

private:
    std::unique_ptr<RedemptionStore> store_;
};

} // namespace backed

#endif // BACKED_REDEMPTION_QUEUE_H
