// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/redemption_queue.h>
#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>
#include <stdexcept>

namespace backed {

std::string QueueStorageToString(QueueStorage storage)
{
    switch (storage) {
        case QueueStorage::INDEXED:    return "indexed";
        case QueueStorage::COMPACTING: return "compacting";
        default:                       return "unknown";
    }
}

bool ParseQueueStorage(const std::string& str, QueueStorage& storage)
{
    if (str == "indexed") {
        storage = QueueStorage::INDEXED;
        return true;
    }
    if (str == "compacting") {
        storage = QueueStorage::COMPACTING;
        return true;
    }
    return false;
}

// ============================================================================
// IndexedRedemptionStore
// ============================================================================

IndexedRedemptionStore::IndexedRedemptionStore()
    : head_(0)
    , tail_(0)
{
}

void IndexedRedemptionStore::PushBack(const RedemptionRequest& request)
{
    slots_[tail_] = request;
    tail_++;
}

const RedemptionRequest& IndexedRedemptionStore::At(uint64_t offset) const
{
    if (offset >= Size()) {
        throw std::out_of_range("IndexedRedemptionStore::At: offset past tail");
    }
    return slots_.at(head_ + offset);
}

void IndexedRedemptionStore::PopFront(uint64_t count)
{
    if (count > Size()) {
        throw std::out_of_range("IndexedRedemptionStore::PopFront: count exceeds size");
    }
    for (uint64_t i = 0; i < count; ++i) {
        slots_.erase(head_);
        head_++;
    }
}

// ============================================================================
// CompactingRedemptionStore
// ============================================================================

CompactingRedemptionStore::CompactingRedemptionStore()
    : headPos_(0)
    , base_(0)
    , compactions_(0)
{
}

void CompactingRedemptionStore::PushBack(const RedemptionRequest& request)
{
    entries_.push_back(request);
}

const RedemptionRequest& CompactingRedemptionStore::At(uint64_t offset) const
{
    if (offset >= Size()) {
        throw std::out_of_range("CompactingRedemptionStore::At: offset past tail");
    }
    return entries_[headPos_ + offset];
}

void CompactingRedemptionStore::PopFront(uint64_t count)
{
    if (count > Size()) {
        throw std::out_of_range("CompactingRedemptionStore::PopFront: count exceeds size");
    }
    headPos_ += count;
    MaybeCompact();
}

void CompactingRedemptionStore::MaybeCompact()
{
    if (headPos_ == 0 || headPos_ <= entries_.size() / 2) {
        return;
    }

    entries_.erase(entries_.begin(), entries_.begin() + headPos_);
    entries_.shrink_to_fit();
    base_ += headPos_;
    headPos_ = 0;
    compactions_++;

    LogPrint(BCLog::QUEUE, "CompactingRedemptionStore: compacted to %u live entries at index %u\n",
             entries_.size(), base_);
}

std::unique_ptr<RedemptionStore> MakeRedemptionStore(QueueStorage storage)
{
    switch (storage) {
        case QueueStorage::COMPACTING:
            return std::make_unique<CompactingRedemptionStore>();
        case QueueStorage::INDEXED:
        default:
            return std::make_unique<IndexedRedemptionStore>();
    }
}

// ============================================================================
// ProcessResult
// ============================================================================

CAmount ProcessResult::TotalPaid() const
{
    CAmount total = 0;
    for (const RedemptionRequest& payout : payouts) {
        total += payout.amount;
    }
    return total;
}

// ============================================================================
// RedemptionQueue
// ============================================================================

RedemptionQueue::RedemptionQueue(QueueStorage storage)
    : store_(MakeRedemptionStore(storage))
{
}

RedemptionQueue::RedemptionQueue(std::unique_ptr<RedemptionStore> store)
    : store_(std::move(store))
{
    if (!store_) {
        store_ = MakeRedemptionStore(QueueStorage::INDEXED);
    }
}

ProcessResult RedemptionQueue::Plan(const std::optional<RedemptionRequest>& newRequest,
                                    const CAmount& available,
                                    uint32_t maxBatch) const
{
    ProcessResult plan;
    plan.available = available;
    plan.remaining = available;

    // Walk from the head; stop at the batch cap or the first request that
    // does not fit. Smaller requests behind a blocked head wait.
    const uint64_t queued = store_->Size();
    uint64_t processed = 0;
    while (processed < maxBatch && processed < queued) {
        const RedemptionRequest& next = store_->At(processed);
        if (next.amount > plan.remaining) {
            break;
        }
        plan.remaining -= next.amount;
        plan.payouts.push_back(next);
        processed++;
    }
    plan.queuedPaid = processed;

    if (newRequest && newRequest->IsValid()) {
        plan.hasNewRequest = true;
        plan.newRequest = *newRequest;
        if (processed < maxBatch && newRequest->amount <= plan.remaining) {
            plan.remaining -= newRequest->amount;
            plan.payouts.push_back(*newRequest);
            plan.newRequestPaid = true;
        } else {
            plan.newRequestQueued = true;
        }
    }

    return plan;
}

void RedemptionQueue::Apply(ProcessResult& plan, size_t executed)
{
    if (executed > plan.payouts.size()) {
        throw std::invalid_argument("RedemptionQueue::Apply: executed exceeds planned payouts");
    }

    uint64_t dequeue = std::min<uint64_t>(executed, plan.queuedPaid);
    store_->PopFront(dequeue);

    bool newPaid = plan.newRequestPaid && executed == plan.payouts.size();
    if (plan.hasNewRequest && !newPaid) {
        store_->PushBack(plan.newRequest);
    }

    plan.payouts.resize(executed);
    plan.queuedPaid = dequeue;
    plan.newRequestPaid = plan.hasNewRequest && newPaid;
    plan.newRequestQueued = plan.hasNewRequest && !newPaid;
    plan.remaining = plan.available - plan.TotalPaid();

    LogPrint(BCLog::QUEUE, "RedemptionQueue: paid %u queued%s, %s queued, head=%u tail=%u remaining=%s\n",
             plan.queuedPaid, plan.newRequestPaid ? " + new" : "",
             plan.newRequestQueued ? "new request" : "nothing",
             store_->Head(), store_->Tail(), FormatMoney(plan.remaining));
}

ProcessResult RedemptionQueue::Process(const std::optional<RedemptionRequest>& newRequest,
                                       const CAmount& available,
                                       uint32_t maxBatch)
{
    ProcessResult plan = Plan(newRequest, available, maxBatch);
    Apply(plan, plan.payouts.size());
    return plan;
}

std::optional<RedemptionRequest> RedemptionQueue::Peek(uint64_t offset) const
{
    if (offset >= store_->Size()) {
        return std::nullopt;
    }
    return store_->At(offset);
}

std::vector<RedemptionRequest> RedemptionQueue::GetPending() const
{
    std::vector<RedemptionRequest> pending;
    pending.reserve(store_->Size());
    for (uint64_t i = 0; i < store_->Size(); ++i) {
        pending.push_back(store_->At(i));
    }
    return pending;
}

CAmount RedemptionQueue::TotalPending() const
{
    CAmount total = 0;
    for (uint64_t i = 0; i < store_->Size(); ++i) {
        total += store_->At(i).amount;
    }
    return total;
}

} // namespace backed
