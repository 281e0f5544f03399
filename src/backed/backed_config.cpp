// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/backed_config.h>
#include <util.h>
#include <utilmoneystr.h>
#include <utilstrencodings.h>

#include <cctype>
#include <limits>
#include <vector>

namespace backed {

bool EngineConfig::Validate(std::string& strError) const
{
    if (owner.IsNull()) {
        strError = "Owner account must be set";
        return false;
    }
    if (feeCollector.IsNull()) {
        strError = "Fee collector account must be set";
        return false;
    }
    return PricingEngine::ValidateParameters(pricing, strError);
}

std::string EngineConfig::ToString() const
{
    return strprintf("EngineConfig(buySpread=%s, redeemSpread=%s, buyFee=%s, redeemFee=%s, "
                     "bufferThreshold=%s, minBridgeAmount=%s, maxBatch=%u, autoSettle=%d, storage=%s)",
                     FormatMoney(pricing.buySpread), FormatMoney(pricing.redeemSpread),
                     FormatMoney(pricing.buyFee), FormatMoney(pricing.redeemFee),
                     FormatMoney(liquidity.bufferThreshold), FormatMoney(liquidity.minBridgeAmount),
                     maxBatch, autoSettle, QueueStorageToString(queueStorage));
}

bool ParseAccount(const std::string& str, uint160& account)
{
    std::string hex = str;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    // Hex accounts keep their bytes in written order, matching the record wire form
    if (hex.size() == 40 && IsHex(hex)) {
        account = uint160(ParseHex(hex));
        return !account.IsNull();
    }

    if (str.empty() || str.size() > 20) {
        return false;
    }
    std::vector<unsigned char> bytes(20, 0);
    for (size_t i = 0; i < str.size(); i++) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (!isalnum(c) && c != '_') {
            return false;
        }
        bytes[i] = c;
    }
    account = uint160(bytes);
    return true;
}

std::string GetBackedHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Pricing and liquidity options:");
    strUsage += HelpMessageOpt("-bufferthreshold=<amt>", "Reserve amount always kept in local custody (default: 0)");
    strUsage += HelpMessageOpt("-minbridgeamount=<amt>", "Excess above the buffer must be larger than this to be forwarded (default: 0)");
    strUsage += HelpMessageOpt("-buyspread=<frac>", "Markup on the oracle price for buys, e.g. 0.01 for 1% (default: 0)");
    strUsage += HelpMessageOpt("-redeemspread=<frac>", "Markdown on the oracle price for redemptions, must be below 1 (default: 0)");
    strUsage += HelpMessageOpt("-buyfee=<amt>", "Fixed reserve fee charged on every buy (default: 0)");
    strUsage += HelpMessageOpt("-redeemfee=<amt>", "Fixed reserve fee charged on every redemption (default: 0)");

    strUsage += HelpMessageGroup("Queue and settlement options:");
    strUsage += HelpMessageOpt("-maxbatch=<n>", strprintf("Maximum queued redemptions settled per call (default: %u)", DEFAULT_MAX_BATCH));
    strUsage += HelpMessageOpt("-autosettle", strprintf("Drain the queue and forward excess after every buy and deposit (default: %u)", DEFAULT_AUTO_SETTLE));
    strUsage += HelpMessageOpt("-queuestorage=<type>", strprintf("Redemption queue storage, indexed or compacting (default: %s)", DEFAULT_QUEUE_STORAGE));
    strUsage += HelpMessageOpt("-oracleprice=<price>", strprintf("Initial oracle price in reserve per token (default: %s)", DEFAULT_ORACLE_PRICE));
    strUsage += HelpMessageOpt("-owner=<acct>", strprintf("Engine owner account (default: %s)", DEFAULT_OWNER));
    strUsage += HelpMessageOpt("-operator=<acct>", strprintf("Operator account allowed to trigger settlement (default: %s)", DEFAULT_OPERATOR));
    strUsage += HelpMessageOpt("-feecollector=<acct>", strprintf("Account credited with fees (default: %s)", DEFAULT_FEE_COLLECTOR));

    return strUsage;
}

static bool ReadAmountArg(const std::string& name, const std::string& strDefault,
                          CAmount& amount, std::string& strError)
{
    std::string value = gArgs.GetArg(name, strDefault);
    if (!ParseMoney(value, amount)) {
        strError = strprintf("Invalid amount for %s: '%s'", name, value);
        return false;
    }
    return true;
}

static bool ReadAccountArg(const std::string& name, const std::string& strDefault,
                           uint160& account, std::string& strError)
{
    std::string value = gArgs.GetArg(name, strDefault);
    if (!ParseAccount(value, account)) {
        strError = strprintf("Invalid account for %s: '%s'", name, value);
        return false;
    }
    return true;
}

bool InitEngineConfig(EngineConfig& config, std::string& strError)
{
    EngineConfig result;

    if (!ReadAmountArg("-bufferthreshold", "0", result.liquidity.bufferThreshold, strError) ||
        !ReadAmountArg("-minbridgeamount", "0", result.liquidity.minBridgeAmount, strError) ||
        !ReadAmountArg("-buyspread", "0", result.pricing.buySpread, strError) ||
        !ReadAmountArg("-redeemspread", "0", result.pricing.redeemSpread, strError) ||
        !ReadAmountArg("-buyfee", "0", result.pricing.buyFee, strError) ||
        !ReadAmountArg("-redeemfee", "0", result.pricing.redeemFee, strError) ||
        !ReadAmountArg("-oracleprice", DEFAULT_ORACLE_PRICE, result.oraclePrice, strError)) {
        return false;
    }

    int64_t maxBatch = gArgs.GetArg("-maxbatch", (int64_t)DEFAULT_MAX_BATCH);
    if (maxBatch < 0 || maxBatch > std::numeric_limits<uint32_t>::max()) {
        strError = strprintf("Invalid -maxbatch value %d", maxBatch);
        return false;
    }
    result.maxBatch = static_cast<uint32_t>(maxBatch);

    result.autoSettle = gArgs.GetBoolArg("-autosettle", DEFAULT_AUTO_SETTLE);

    std::string storage = gArgs.GetArg("-queuestorage", DEFAULT_QUEUE_STORAGE);
    if (!ParseQueueStorage(storage, result.queueStorage)) {
        strError = strprintf("Unknown -queuestorage '%s' (expected indexed or compacting)", storage);
        return false;
    }

    if (!ReadAccountArg("-owner", DEFAULT_OWNER, result.owner, strError) ||
        !ReadAccountArg("-operator", DEFAULT_OPERATOR, result.operatorAccount, strError) ||
        !ReadAccountArg("-feecollector", DEFAULT_FEE_COLLECTOR, result.feeCollector, strError)) {
        return false;
    }

    if (result.oraclePrice == 0) {
        strError = "-oracleprice must be positive";
        return false;
    }

    if (!result.Validate(strError)) {
        return false;
    }

    config = result;
    LogPrint(BCLog::CONFIG, "Backed: Initialized %s\n", config.ToString());
    return true;
}

} // namespace backed
