// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/bridge_gateway.h>
#include <backed/liquidity_controller.h>
#include <backed/token_ledger.h>
#include <test/test_backed.h>

#include <boost/test/unit_test.hpp>

using namespace backed;

namespace {

/** Reports success without pulling anything */
class LyingBridge : public BridgeGateway {
public:
    uint160 GetAddress() const override { return TestAccount("liar"); }
    bool SendStable(const uint160&, const uint160&, const CAmount&) override { return true; }
    void SendMessage(const uint160&, const std::vector<unsigned char>&) override {}
};

struct LiquidityTestingSetup : public BasicTestingSetup {
    TokenLedger reserve;
    uint160 custody;
    LocalBridge bridge;
    LiquidityController controller;

    LiquidityTestingSetup()
        : reserve(TestAccount("reserve"), "RSV")
        , custody(TestAccount("engine"))
        , bridge(TestAccount("bridge"), reserve)
        , controller(custody, reserve)
    {}
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(liquidity_controller_tests, LiquidityTestingSetup)

BOOST_AUTO_TEST_CASE(evaluate_forwarding_threshold)
{
    LiquidityPolicy policy(Coins(50), 0);
    std::optional<ForwardInstruction> instruction = LiquidityController::EvaluateForwarding(Coins(100), policy);
    BOOST_REQUIRE(instruction);
    BOOST_CHECK_EQUAL(instruction->amount, Coins(50));

    BOOST_CHECK(!LiquidityController::EvaluateForwarding(Coins(50), policy));
    BOOST_CHECK(!LiquidityController::EvaluateForwarding(0, policy));
}

BOOST_AUTO_TEST_CASE(evaluate_forwarding_min_bridge)
{
    LiquidityPolicy policy(Coins(40), Coins(30));

    // 60 is not above 40 + 30
    BOOST_CHECK(!LiquidityController::EvaluateForwarding(Coins(60), policy));
    BOOST_CHECK(!LiquidityController::EvaluateForwarding(Coins(70), policy));

    std::optional<ForwardInstruction> instruction = LiquidityController::EvaluateForwarding(Coins(80), policy);
    BOOST_REQUIRE(instruction);
    BOOST_CHECK_EQUAL(instruction->amount, Coins(40));
}

BOOST_AUTO_TEST_CASE(evaluate_forwarding_huge_policy)
{
    LiquidityPolicy policy(MaxAmount(), MaxAmount());
    BOOST_CHECK(!LiquidityController::EvaluateForwarding(MaxAmount(), policy));
}

BOOST_AUTO_TEST_CASE(forward_moves_funds_and_consumes_allowance)
{
    BOOST_REQUIRE(reserve.Mint(custody, Coins(100)));

    ForwardResult result = controller.ExecuteForward(bridge, ForwardInstruction(Coins(60)));
    BOOST_REQUIRE(result.success);
    BOOST_CHECK_EQUAL(result.forwarded, Coins(60));
    BOOST_CHECK_EQUAL(reserve.BalanceOf(custody), Coins(40));
    BOOST_CHECK_EQUAL(reserve.BalanceOf(bridge.GetAddress()), Coins(60));
    BOOST_CHECK_EQUAL(reserve.Allowance(custody, bridge.GetAddress()), 0);

    std::vector<StableSentEvent> sent = bridge.GetStableSent();
    BOOST_REQUIRE_EQUAL(sent.size(), 1u);
    BOOST_CHECK(sent[0].assetId == reserve.GetAssetId());
    BOOST_CHECK(sent[0].from == custody);
    BOOST_CHECK_EQUAL(sent[0].amount, Coins(60));
}

BOOST_AUTO_TEST_CASE(failed_forward_revokes_allowance)
{
    BOOST_REQUIRE(reserve.Mint(custody, Coins(100)));
    bridge.SetFailing(true);

    ForwardResult result = controller.ExecuteForward(bridge, ForwardInstruction(Coins(60)));
    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.error, SettlementError::EXTERNAL_CALL_FAILURE);
    BOOST_CHECK_EQUAL(reserve.Allowance(custody, bridge.GetAddress()), 0);
    BOOST_CHECK_EQUAL(reserve.BalanceOf(custody), Coins(100));
    BOOST_CHECK(bridge.GetStableSent().empty());
}

BOOST_AUTO_TEST_CASE(bridge_that_moves_nothing_is_a_failure)
{
    BOOST_REQUIRE(reserve.Mint(custody, Coins(100)));
    LyingBridge liar;

    ForwardResult result = controller.ExecuteForward(liar, ForwardInstruction(Coins(10)));
    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.error, SettlementError::EXTERNAL_CALL_FAILURE);
    BOOST_CHECK_EQUAL(reserve.Allowance(custody, liar.GetAddress()), 0);
    BOOST_CHECK_EQUAL(reserve.BalanceOf(custody), Coins(100));
}

BOOST_AUTO_TEST_CASE(forward_more_than_balance_rejected)
{
    BOOST_REQUIRE(reserve.Mint(custody, Coins(5)));

    ForwardResult result = controller.ExecuteForward(bridge, ForwardInstruction(Coins(6)));
    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.error, SettlementError::INSUFFICIENT_BALANCE);
    BOOST_CHECK_EQUAL(reserve.Allowance(custody, bridge.GetAddress()), 0);

    result = controller.ExecuteForward(bridge, ForwardInstruction(0));
    BOOST_CHECK_EQUAL(result.error, SettlementError::INVALID_INPUT);
}

BOOST_AUTO_TEST_CASE(forward_excess_uses_current_balance)
{
    BOOST_REQUIRE(reserve.Mint(custody, Coins(30)));
    LiquidityPolicy policy(Coins(10), 0);

    int notified = 0;
    bridge.RegisterStableSentCallback([&notified](const StableSentEvent&) { notified++; });

    ForwardResult result = controller.ForwardExcess(bridge, policy);
    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(result.forwarded, Coins(20));
    BOOST_CHECK_EQUAL(controller.GetLocalBalance(), Coins(10));

    // Delivered only when asked
    BOOST_CHECK_EQUAL(notified, 0);
    BOOST_CHECK_EQUAL(bridge.ProcessNotifications(), 1u);
    BOOST_CHECK_EQUAL(notified, 1);
    BOOST_CHECK_EQUAL(bridge.ProcessNotifications(), 0u);
    BOOST_CHECK_EQUAL(notified, 1);

    // Nothing left above the threshold
    result = controller.ForwardExcess(bridge, policy);
    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(result.forwarded, 0);
    BOOST_CHECK_EQUAL(bridge.GetTotalReceived(), Coins(20));
}

BOOST_AUTO_TEST_SUITE_END()
