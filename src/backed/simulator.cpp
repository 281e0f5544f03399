// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/simulator.h>
#include <util.h>
#include <utilmoneystr.h>
#include <utilstrencodings.h>

#include <stdexcept>

namespace backed {

static uint160 NamedAccount(const std::string& name)
{
    uint160 account;
    if (!ParseAccount(name, account)) {
        throw std::logic_error("Simulator: invalid built-in account name " + name);
    }
    return account;
}

uint160 Simulator::CustodyAccount()
{
    return NamedAccount("engine");
}

uint160 Simulator::BridgeAccount()
{
    return NamedAccount("bridge");
}

Simulator::Simulator(const EngineConfig& config)
    : config_(config)
    , reserve_(NamedAccount("reserve"), "RSV")
    , token_(NamedAccount("backed"), "BKD")
    , oracle_(config.oraclePrice)
    , bridge_(BridgeAccount(), reserve_)
    , engine_(CustodyAccount(), reserve_, token_, &oracle_, &bridge_, config)
{
}

uint160 Simulator::Trigger() const
{
    EngineConfig cfg = engine_.GetConfig();
    return cfg.operatorAccount.IsNull() ? cfg.owner : cfg.operatorAccount;
}

std::string Simulator::DescribeResult(const std::string& command, const SettlementResult& result) const
{
    if (!result.success) {
        return strprintf("%s failed: %s (%s)", command, result.errorMessage, SettlementErrorToString(result.error));
    }

    std::string str = strprintf("%s ok", command);
    if (result.tokens > 0) {
        str += strprintf(" tokens=%s price=%s fee=%s net=%s", FormatMoney(result.tokens),
                         FormatMoney(result.execPrice), FormatMoney(result.fee), FormatMoney(result.netAmount));
    }
    for (const RedemptionRequest& payout : result.payouts) {
        str += strprintf("\n  paid %s to %s", FormatMoney(payout.amount), AccountToString(payout.beneficiary));
    }
    if (result.queued) {
        str += "\n  redemption queued";
    }
    if (result.forwarded > 0) {
        str += strprintf("\n  forwarded %s", FormatMoney(result.forwarded));
    }
    if (result.settlementError != SettlementError::NONE) {
        str += strprintf("\n  settlement failed: %s (%s)", result.settlementMessage,
                         SettlementErrorToString(result.settlementError));
    }
    return str;
}

std::string Simulator::GetStatus() const
{
    std::string str;
    str += strprintf("local balance:   %s\n", FormatMoney(engine_.GetLocalBalance()));
    str += strprintf("queue length:    %u\n", engine_.GetQueueLength());
    str += strprintf("pending payouts: %s\n", FormatMoney(engine_.GetTotalPending()));
    str += strprintf("token supply:    %s\n", FormatMoney(engine_.TotalSupply()));
    str += strprintf("bridged:         %s\n", FormatMoney(bridge_.GetTotalReceived()));
    str += strprintf("messages:        %u", bridge_.GetMessages().size());
    return str;
}

bool Simulator::Execute(const std::vector<std::string>& words, std::string& strOutput)
{
    strOutput.clear();
    if (words.empty()) {
        return true;
    }

    const std::string& command = words[0];
    uint160 account;
    CAmount amount;

    // <command> <acct> <amount>
    if (command == "mint" || command == "approve" || command == "buy" || command == "redeem") {
        if (words.size() != 3) {
            strOutput = strprintf("usage: %s <acct> <amount>", command);
            return false;
        }
        if (!ParseAccount(words[1], account)) {
            strOutput = strprintf("invalid account '%s'", words[1]);
            return false;
        }
        if (!ParseMoney(words[2], amount)) {
            strOutput = strprintf("invalid amount '%s'", words[2]);
            return false;
        }

        if (command == "mint") {
            if (!reserve_.Mint(account, amount)) {
                strOutput = "mint failed";
                return false;
            }
            strOutput = strprintf("minted %s reserve to %s", FormatMoney(amount), words[1]);
            return true;
        }
        if (command == "approve") {
            if (!reserve_.Approve(account, CustodyAccount(), amount)) {
                strOutput = "approve failed";
                return false;
            }
            strOutput = strprintf("%s approved %s", words[1], FormatMoney(amount));
            return true;
        }

        SettlementResult result = command == "buy" ? engine_.Buy(account, amount)
                                                   : engine_.Redeem(account, amount);
        strOutput = DescribeResult(command, result);
        return result.success;
    }

    // <command> <amount>
    if (command == "deposit" || command == "withdraw" || command == "setprice") {
        if (words.size() != 2) {
            strOutput = strprintf("usage: %s <amount>", command);
            return false;
        }
        if (!ParseMoney(words[1], amount)) {
            strOutput = strprintf("invalid amount '%s'", words[1]);
            return false;
        }

        if (command == "setprice") {
            oracle_.SetPrice(amount);
            strOutput = strprintf("price set to %s", FormatMoney(amount));
            return true;
        }

        const uint160 owner = engine_.GetConfig().owner;
        SettlementResult result = command == "deposit" ? engine_.DepositBuffer(owner, amount)
                                                       : engine_.WithdrawBuffer(owner, amount);
        strOutput = DescribeResult(command, result);
        return result.success;
    }

    if (command == "process" || command == "forward" || command == "settle") {
        if (words.size() != 1) {
            strOutput = strprintf("usage: %s", command);
            return false;
        }
        SettlementResult result;
        if (command == "process") {
            result = engine_.ProcessQueue(Trigger());
        } else if (command == "forward") {
            result = engine_.ForwardExcess(Trigger());
        } else {
            result = engine_.Settle(Trigger());
        }
        strOutput = DescribeResult(command, result);
        return result.success;
    }

    if (command == "bridgefail") {
        if (words.size() != 2 || (words[1] != "0" && words[1] != "1")) {
            strOutput = "usage: bridgefail <0|1>";
            return false;
        }
        bridge_.SetFailing(words[1] == "1");
        strOutput = strprintf("bridge %s", words[1] == "1" ? "rejecting transfers" : "accepting transfers");
        return true;
    }

    if (command == "balance") {
        if (words.size() != 2 || !ParseAccount(words[1], account)) {
            strOutput = "usage: balance <acct>";
            return false;
        }
        strOutput = strprintf("%s: reserve %s, tokens %s", words[1],
                              FormatMoney(reserve_.BalanceOf(account)), FormatMoney(token_.BalanceOf(account)));
        return true;
    }

    if (command == "status") {
        strOutput = GetStatus();
        return true;
    }

    strOutput = strprintf("unknown command '%s'", command);
    return false;
}

bool Simulator::ExecuteLine(const std::string& line, std::string& strOutput)
{
    std::string trimmed = TrimString(line);
    if (trimmed.empty() || trimmed[0] == '#') {
        strOutput.clear();
        return true;
    }
    bool fSuccess = Execute(SplitWords(trimmed), strOutput);
    bridge_.ProcessNotifications();
    return fSuccess;
}

} // namespace backed
