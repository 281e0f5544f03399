// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file redemption_queue_tests.cpp
 * @brief Tests for the redemption queue and its storage strategies
 *
 * The ordering, batch bound, conservation and admission checks run against
 * both storage strategies.
 */

#include <backed/redemption_queue.h>
#include <test/test_backed.h>

#include <boost/test/unit_test.hpp>

#include <map>
#include <vector>

using namespace backed;

static const QueueStorage ALL_STORAGES[] = {QueueStorage::INDEXED, QueueStorage::COMPACTING};

static RedemptionRequest Request(const std::string& who, uint64_t coins)
{
    return RedemptionRequest(TestAccount(who), Coins(coins));
}

/** Queue holding the given amounts, enqueued against zero liquidity */
static void Fill(RedemptionQueue& queue, const std::vector<uint64_t>& amounts)
{
    int n = 0;
    for (uint64_t amount : amounts) {
        ProcessResult result = queue.Process(Request("user" + std::to_string(n++), amount), 0, DEFAULT_MAX_BATCH);
        BOOST_REQUIRE(result.newRequestQueued);
    }
}

BOOST_FIXTURE_TEST_SUITE(redemption_queue_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(empty_queue)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        BOOST_CHECK_EQUAL(queue.Length(), 0u);
        BOOST_CHECK_EQUAL(queue.Head(), 0u);
        BOOST_CHECK_EQUAL(queue.Tail(), 0u);
        BOOST_CHECK(!queue.Peek());
        BOOST_CHECK_EQUAL(queue.TotalPending(), 0);

        ProcessResult result = queue.Process(std::nullopt, Coins(10), DEFAULT_MAX_BATCH);
        BOOST_CHECK(result.payouts.empty());
        BOOST_CHECK_EQUAL(result.remaining, Coins(10));
    }
}

BOOST_AUTO_TEST_CASE(liquid_request_paid_immediately)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        ProcessResult result = queue.Process(Request("alice", 30), Coins(50), DEFAULT_MAX_BATCH);

        BOOST_REQUIRE_EQUAL(result.payouts.size(), 1u);
        BOOST_CHECK(result.payouts[0] == Request("alice", 30));
        BOOST_CHECK(result.newRequestPaid);
        BOOST_CHECK(!result.newRequestQueued);
        BOOST_CHECK_EQUAL(result.remaining, Coins(20));
        BOOST_CHECK_EQUAL(queue.Length(), 0u);
        BOOST_CHECK_EQUAL(queue.Tail(), 0u);
    }
}

BOOST_AUTO_TEST_CASE(invalid_request_ignored)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);

        ProcessResult result = queue.Process(RedemptionRequest(uint160(), Coins(5)), Coins(50), DEFAULT_MAX_BATCH);
        BOOST_CHECK(!result.hasNewRequest);
        BOOST_CHECK(result.payouts.empty());

        result = queue.Process(RedemptionRequest(TestAccount("bob"), 0), 0, DEFAULT_MAX_BATCH);
        BOOST_CHECK(!result.hasNewRequest);
        BOOST_CHECK_EQUAL(queue.Length(), 0u);
    }
}

BOOST_AUTO_TEST_CASE(oversized_head_blocks_smaller_requests)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {50, 20});

        // 40 would pay the 20 behind the head, but the head comes first
        ProcessResult result = queue.Process(std::nullopt, Coins(40), DEFAULT_MAX_BATCH);
        BOOST_CHECK(result.payouts.empty());
        BOOST_CHECK_EQUAL(result.remaining, Coins(40));
        BOOST_CHECK_EQUAL(queue.Length(), 2u);

        result = queue.Process(std::nullopt, Coins(60), DEFAULT_MAX_BATCH);
        BOOST_REQUIRE_EQUAL(result.payouts.size(), 1u);
        BOOST_CHECK_EQUAL(result.payouts[0].amount, Coins(50));
        BOOST_CHECK_EQUAL(queue.Length(), 1u);
        BOOST_CHECK_EQUAL(queue.Peek()->amount, Coins(20));

        result = queue.Process(std::nullopt, Coins(20), DEFAULT_MAX_BATCH);
        BOOST_CHECK_EQUAL(result.payouts.size(), 1u);
        BOOST_CHECK_EQUAL(queue.Length(), 0u);
        BOOST_CHECK_EQUAL(queue.Head(), 2u);
        BOOST_CHECK_EQUAL(queue.Tail(), 2u);
    }
}

BOOST_AUTO_TEST_CASE(new_request_appended_at_tail)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {10, 10});

        // Pays both queued entries; the new one no longer fits
        ProcessResult result = queue.Process(Request("carol", 15), Coins(25), DEFAULT_MAX_BATCH);
        BOOST_CHECK_EQUAL(result.queuedPaid, 2u);
        BOOST_CHECK(result.newRequestQueued);
        BOOST_CHECK_EQUAL(result.payouts.size(), 2u);
        BOOST_CHECK_EQUAL(result.remaining, Coins(5));

        BOOST_REQUIRE_EQUAL(queue.Length(), 1u);
        BOOST_CHECK(*queue.Peek() == Request("carol", 15));
        BOOST_CHECK_EQUAL(queue.Head(), 2u);
        BOOST_CHECK_EQUAL(queue.Tail(), 3u);
    }
}

BOOST_AUTO_TEST_CASE(payouts_queued_first_then_new)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {5, 7});

        ProcessResult result = queue.Process(Request("dave", 3), Coins(20), DEFAULT_MAX_BATCH);
        BOOST_REQUIRE_EQUAL(result.payouts.size(), 3u);
        BOOST_CHECK_EQUAL(result.payouts[0].amount, Coins(5));
        BOOST_CHECK_EQUAL(result.payouts[1].amount, Coins(7));
        BOOST_CHECK(result.payouts[2] == Request("dave", 3));
        BOOST_CHECK(result.newRequestPaid);
        BOOST_CHECK_EQUAL(result.TotalPaid(), Coins(15));
        BOOST_CHECK_EQUAL(result.remaining, Coins(5));
    }
}

BOOST_AUTO_TEST_CASE(batch_limit)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {1, 1, 1, 1, 1});

        ProcessResult result = queue.Process(Request("erin", 1), Coins(100), 2);
        BOOST_CHECK_EQUAL(result.queuedPaid, 2u);
        BOOST_CHECK(!result.newRequestPaid);
        BOOST_CHECK(result.newRequestQueued);
        BOOST_CHECK_EQUAL(queue.Length(), 4u);

        // Several calls are needed to drain a queue deeper than the batch
        int calls = 0;
        while (queue.Length() > 0) {
            result = queue.Process(std::nullopt, Coins(100), 2);
            BOOST_CHECK(result.payouts.size() <= 2u);
            calls++;
        }
        BOOST_CHECK_EQUAL(calls, 2);
    }
}

BOOST_AUTO_TEST_CASE(zero_batch_pays_nothing)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {1});

        ProcessResult result = queue.Process(Request("frank", 1), Coins(100), 0);
        BOOST_CHECK(result.payouts.empty());
        BOOST_CHECK(result.newRequestQueued);
        BOOST_CHECK_EQUAL(queue.Length(), 2u);
    }
}

BOOST_AUTO_TEST_CASE(new_request_fits_below_blocked_head)
{
    // The head is never skipped; a new request is judged on what is left
    // after the queued pass.
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {100});

        ProcessResult result = queue.Process(Request("gina", 10), Coins(30), DEFAULT_MAX_BATCH);
        BOOST_CHECK_EQUAL(result.queuedPaid, 0u);
        BOOST_CHECK(result.newRequestPaid);
        BOOST_CHECK_EQUAL(queue.Length(), 1u);
        BOOST_CHECK_EQUAL(queue.Peek()->amount, Coins(100));
    }
}

BOOST_AUTO_TEST_CASE(plan_does_not_mutate)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {4, 4});

        ProcessResult plan = queue.Plan(Request("hank", 4), Coins(100), DEFAULT_MAX_BATCH);
        BOOST_CHECK_EQUAL(plan.payouts.size(), 3u);
        BOOST_CHECK_EQUAL(queue.Length(), 2u);
        BOOST_CHECK_EQUAL(queue.Tail(), 2u);
    }
}

BOOST_AUTO_TEST_CASE(partial_apply_keeps_unpaid_in_order)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);
        Fill(queue, {1, 2, 3});

        ProcessResult plan = queue.Plan(Request("ivan", 4), Coins(100), DEFAULT_MAX_BATCH);
        BOOST_REQUIRE_EQUAL(plan.payouts.size(), 4u);

        // Only the first transfer went through
        queue.Apply(plan, 1);
        BOOST_CHECK_EQUAL(plan.payouts.size(), 1u);
        BOOST_CHECK_EQUAL(plan.queuedPaid, 1u);
        BOOST_CHECK(!plan.newRequestPaid);
        BOOST_CHECK(plan.newRequestQueued);
        BOOST_CHECK_EQUAL(plan.remaining, Coins(99));

        std::vector<RedemptionRequest> pending = queue.GetPending();
        BOOST_REQUIRE_EQUAL(pending.size(), 3u);
        BOOST_CHECK_EQUAL(pending[0].amount, Coins(2));
        BOOST_CHECK_EQUAL(pending[1].amount, Coins(3));
        BOOST_CHECK(pending[2] == Request("ivan", 4));
        BOOST_CHECK_EQUAL(queue.TotalPending(), Coins(9));

        ProcessResult other = queue.Plan(std::nullopt, Coins(100), DEFAULT_MAX_BATCH);
        BOOST_CHECK_THROW(queue.Apply(other, other.payouts.size() + 1), std::invalid_argument);
    }
}

BOOST_AUTO_TEST_CASE(randomized_queue_properties)
{
    for (QueueStorage storage : ALL_STORAGES) {
        RedemptionQueue queue(storage);

        // Reference FIFO of (sequence number, amount)
        std::vector<std::pair<uint64_t, CAmount>> model;
        std::map<uint160, uint64_t> sequenceOf;
        uint64_t nextSequence = 0;

        for (int round = 0; round < 500; round++) {
            std::optional<RedemptionRequest> request;
            if (InsecureRandBool()) {
                uint160 who = InsecureRand160();
                request = RedemptionRequest(who, CAmount(InsecureRandRange(100) + 1));
                sequenceOf[who] = nextSequence++;
            }
            CAmount available = CAmount(InsecureRandRange(250));
            uint32_t maxBatch = InsecureRandRange(6);

            ProcessResult result = queue.Process(request, available, maxBatch);

            // Conservation
            BOOST_CHECK(result.TotalPaid() <= available);
            BOOST_CHECK_EQUAL(available - result.TotalPaid(), result.remaining);

            // Batch bound
            BOOST_CHECK(result.queuedPaid <= maxBatch);
            BOOST_CHECK(result.payouts.size() <= result.queuedPaid + 1);

            // Queued payouts are exactly the head of the model, in order
            for (uint64_t i = 0; i < result.queuedPaid; i++) {
                BOOST_REQUIRE(!model.empty());
                BOOST_CHECK_EQUAL(sequenceOf[result.payouts[i].beneficiary], model.front().first);
                BOOST_CHECK_EQUAL(result.payouts[i].amount, model.front().second);
                model.erase(model.begin());
            }

            // The walk stopped at a head that did not fit, or at the batch limit
            if (!model.empty() && result.queuedPaid < maxBatch) {
                BOOST_CHECK(model.front().second > available - result.TotalPaid() +
                            (result.newRequestPaid ? request->amount : CAmount(0)));
            }

            if (request) {
                // Admission: paid iff the batch had room and it fit what was left
                CAmount leftAfterQueued = available;
                for (uint64_t i = 0; i < result.queuedPaid; i++) {
                    leftAfterQueued -= result.payouts[i].amount;
                }
                bool shouldPay = result.queuedPaid < maxBatch && request->amount <= leftAfterQueued;
                BOOST_CHECK_EQUAL(result.newRequestPaid, shouldPay);
                if (!shouldPay) {
                    model.emplace_back(sequenceOf[request->beneficiary], request->amount);
                }
            }

            BOOST_REQUIRE_EQUAL(queue.Length(), model.size());
            BOOST_CHECK_EQUAL(queue.Tail() - queue.Head(), queue.Length());
        }
    }
}

BOOST_AUTO_TEST_CASE(indexed_store_releases_slots)
{
    IndexedRedemptionStore store;
    for (int i = 0; i < 10; i++) {
        store.PushBack(Request("x", i + 1));
    }
    BOOST_CHECK_EQUAL(store.AllocatedSlots(), 10u);

    store.PopFront(7);
    BOOST_CHECK_EQUAL(store.Head(), 7u);
    BOOST_CHECK_EQUAL(store.Tail(), 10u);
    BOOST_CHECK_EQUAL(store.AllocatedSlots(), 3u);
    BOOST_CHECK_EQUAL(store.At(0).amount, Coins(8));
    BOOST_CHECK_THROW(store.At(3), std::out_of_range);

    // Indices are never reused
    store.PushBack(Request("y", 11));
    BOOST_CHECK_EQUAL(store.Tail(), 11u);
    BOOST_CHECK_EQUAL(store.At(3).amount, Coins(11));
}

BOOST_AUTO_TEST_CASE(compacting_store_bounds_allocation)
{
    CompactingRedemptionStore store;
    for (int i = 0; i < 10; i++) {
        store.PushBack(Request("x", i + 1));
    }

    // Head at 5 of 10 is not past half yet
    store.PopFront(5);
    BOOST_CHECK_EQUAL(store.GetCompactionCount(), 0u);
    BOOST_CHECK_EQUAL(store.AllocatedSlots(), 10u);

    store.PopFront(1);
    BOOST_CHECK_EQUAL(store.GetCompactionCount(), 1u);
    BOOST_CHECK_EQUAL(store.AllocatedSlots(), 4u);

    // Absolute indices survive compaction
    BOOST_CHECK_EQUAL(store.Head(), 6u);
    BOOST_CHECK_EQUAL(store.Tail(), 10u);
    BOOST_CHECK_EQUAL(store.At(0).amount, Coins(7));
    BOOST_CHECK_EQUAL(store.At(3).amount, Coins(10));

    store.PopFront(4);
    BOOST_CHECK_EQUAL(store.Size(), 0u);
    BOOST_CHECK_EQUAL(store.AllocatedSlots(), 0u);
    BOOST_CHECK_EQUAL(store.Head(), 10u);
}

BOOST_AUTO_TEST_CASE(compacting_queue_steady_state)
{
    RedemptionQueue queue(QueueStorage::COMPACTING);
    for (int i = 0; i < 1000; i++) {
        queue.Process(Request("z", 1), 0, DEFAULT_MAX_BATCH);
        queue.Process(std::nullopt, Coins(1), DEFAULT_MAX_BATCH);
    }
    BOOST_CHECK_EQUAL(queue.Length(), 0u);
    BOOST_CHECK_EQUAL(queue.Tail(), 1000u);
    BOOST_CHECK(queue.GetStore().AllocatedSlots() <= 2u);
}

BOOST_AUTO_TEST_CASE(queue_storage_names)
{
    QueueStorage storage;
    BOOST_CHECK(ParseQueueStorage("indexed", storage));
    BOOST_CHECK(storage == QueueStorage::INDEXED);
    BOOST_CHECK(ParseQueueStorage("compacting", storage));
    BOOST_CHECK(storage == QueueStorage::COMPACTING);
    BOOST_CHECK(!ParseQueueStorage("ring", storage));
    BOOST_CHECK_EQUAL(QueueStorageToString(QueueStorage::COMPACTING), "compacting");
}

BOOST_AUTO_TEST_SUITE_END()
