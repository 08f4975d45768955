// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "logging.h"
#include "rpc/server.h"
#include "token/token.h"
#include "token/token_fees.h"
#include "utiltime.h"

#include <limits>
#include <stdexcept>

#include <univalue.h>

static void ThrowIfRejected(bool fOk, const CValidationState& state)
{
    if (!fOk) {
        throw JSONRPCTokenError(state);
    }
}

static bool ParseBoolV(const UniValue& v)
{
    RPCTypeCheckArgument(v, UniValue::VBOOL);
    return v.get_bool();
}

static UniValue FeesToJSON(const TokenFeeSchedule& fees)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("reflection", (int64_t)fees.nReflection);
    obj.pushKV("liquidity", (int64_t)fees.nLiquidity);
    obj.pushKV("marketing", (int64_t)fees.nMarketing);
    obj.pushKV("burn", (int64_t)fees.nBurn);
    obj.pushKV("total", (int64_t)fees.GetTotal());
    return obj;
}

static UniValue LimitsToJSON(const TokenLimits& limits)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("maxTransactionAmount", limits.nMaxTransactionAmount.str());
    obj.pushKV("maxWalletSize", limits.nMaxWalletSize.str());
    obj.pushKV("cooldownTime", (int64_t)limits.nCooldownTime);
    return obj;
}

/**
 * gettokeninfo - Token identity, supply and global state
 */
static UniValue gettokeninfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "gettokeninfo\n"
            "\nReturns the token identity, supply and global state.\n"
            "\nResult:\n"
            "{\n"
            "  \"name\": \"str\",              (string) Token name\n"
            "  \"symbol\": \"str\",            (string) Ticker\n"
            "  \"decimals\": n,              (numeric) Display decimals\n"
            "  \"variant\": \"str\",           (string) reflection|standard\n"
            "  \"owner\": \"addr\",            (string) Owner address\n"
            "  \"tokenAddress\": \"addr\",     (string) Liquidity and reflection pool\n"
            "  \"marketingWallet\": \"addr\",  (string) Marketing fee destination\n"
            "  \"burnAddress\": \"addr\",      (string) Burn sink\n"
            "  \"totalSupply\": \"n\",         (string) Total supply in base units\n"
            "  \"circulatingSupply\": \"n\",   (string) Total supply minus burned, base units\n"
            "  \"tradingEnabled\": true|false, (boolean) Trading state\n"
            "  \"launchedAt\": n,            (numeric) Launch time, 0 before launch\n"
            "  \"paused\": true|false,       (boolean) Pause gate\n"
            "  \"invariants_ok\": true|false (boolean) Conservation and fee ceiling hold\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("gettokeninfo", "")
            + HelpExampleRpc("gettokeninfo", "")
        );
    }

    CMemeToken& token = EnsureToken(request);
    const TokenTradingState trading = token.GetTradingState();

    UniValue result(UniValue::VOBJ);
    result.pushKV("name", token.GetName());
    result.pushKV("symbol", token.GetSymbol());
    result.pushKV("decimals", (int64_t)token.GetDecimals());
    result.pushKV("variant", TokenVariantName(token.GetVariant()));
    result.pushKV("owner", token.GetOwner().ToString());
    result.pushKV("tokenAddress", token.GetTokenAddress().ToString());
    result.pushKV("marketingWallet", token.GetMarketingWallet().ToString());
    result.pushKV("burnAddress", BurnAddress().ToString());
    result.pushKV("totalSupply", token.TotalSupply().str());
    result.pushKV("circulatingSupply", token.CirculatingSupply().str());
    result.pushKV("tradingEnabled", trading.fEnabled);
    result.pushKV("launchedAt", trading.nLaunchedAt);
    result.pushKV("paused", token.IsPaused());
    result.pushKV("invariants_ok", token.CheckInvariants());
    return result;
}

static UniValue getfeatures(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getfeatures\n"
            "\nReturns the feature toggles.\n"
            "\nResult:\n"
            "{\n"
            "  \"reflectionEnabled\": true|false,\n"
            "  \"antiWhaleEnabled\": true|false,\n"
            "  \"autoLiquidityEnabled\": true|false,\n"
            "  \"cooldownEnabled\": true|false,\n"
            "  \"blacklistEnabled\": true|false,\n"
            "  \"autoBurnEnabled\": true|false\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getfeatures", "")
        );
    }

    const TokenFeatureSet features = EnsureToken(request).GetFeatures();
    UniValue result(UniValue::VOBJ);
    for (TokenFeature feature : {TokenFeature::REFLECTION, TokenFeature::ANTI_WHALE, TokenFeature::AUTO_LIQUIDITY,
                                 TokenFeature::COOLDOWN, TokenFeature::BLACKLIST, TokenFeature::AUTO_BURN}) {
        result.pushKV(TokenFeatureName(feature), features.Get(feature));
    }
    return result;
}

static UniValue getfees(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getfees\n"
            "\nReturns the fee schedule in whole percent.\n"
            "\nResult:\n"
            "{\n"
            "  \"reflection\": n,  (numeric) Reflection component\n"
            "  \"liquidity\": n,   (numeric) Liquidity component\n"
            "  \"marketing\": n,   (numeric) Marketing component\n"
            "  \"burn\": n,        (numeric) Burn component\n"
            "  \"total\": n        (numeric) Sum of all components (<= 25)\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getfees", "")
        );
    }

    return FeesToJSON(EnsureToken(request).GetFees());
}

static UniValue getlimits(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getlimits\n"
            "\nReturns the anti-whale and cooldown limits.\n"
            "\nResult:\n"
            "{\n"
            "  \"maxTransactionAmount\": \"n\", (string) Per-transfer cap, base units\n"
            "  \"maxWalletSize\": \"n\",        (string) Recipient balance cap, base units\n"
            "  \"cooldownTime\": n            (numeric) Seconds between outbound trades\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getlimits", "")
        );
    }

    return LimitsToJSON(EnsureToken(request).GetLimits());
}

static UniValue getblacklist(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getblacklist\n"
            "\nReturns every address ever blacklisted, in order. Unblacklisted\n"
            "addresses stay listed; use isblacklisted for the current flag.\n"
            "\nResult:\n"
            "[\"addr\", ...]\n"
            "\nExamples:\n"
            + HelpExampleCli("getblacklist", "")
        );
    }

    UniValue result(UniValue::VARR);
    for (const CTokenAddress& address : EnsureToken(request).GetBlacklist()) {
        result.push_back(address.ToString());
    }
    return result;
}

static UniValue isblacklisted(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "isblacklisted \"address\"\n"
            "\nArguments:\n"
            "1. \"address\"    (string, required) The address\n"
            "\nResult:\n"
            "true|false      (boolean) Current blacklist flag\n"
            "\nExamples:\n"
            + HelpExampleCli("isblacklisted", "\"0x000000000000000000000000000000000000abcd\"")
        );
    }

    const CTokenAddress address = ParseAddressV(request.params[0], "address");
    return EnsureToken(request).IsBlacklisted(address);
}

static UniValue isexcludedfromfees(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "isexcludedfromfees \"address\"\n"
            "\nArguments:\n"
            "1. \"address\"    (string, required) The address\n"
            "\nResult:\n"
            "true|false      (boolean) Whether the address bypasses fees and the trading gate\n"
            "\nExamples:\n"
            + HelpExampleCli("isexcludedfromfees", "\"0x0000000000000000000000000000000000003333\"")
        );
    }

    const CTokenAddress address = ParseAddressV(request.params[0], "address");
    return EnsureToken(request).IsExcludedFromFees(address);
}

static UniValue balanceof(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "balanceof \"address\"\n"
            "\nArguments:\n"
            "1. \"address\"    (string, required) The address\n"
            "\nResult:\n"
            "\"n\"             (string) Balance in base units\n"
            "\nExamples:\n"
            + HelpExampleCli("balanceof", "\"0x0000000000000000000000000000000000000001\"")
        );
    }

    const CTokenAddress address = ParseAddressV(request.params[0], "address");
    return EnsureToken(request).BalanceOf(address).str();
}

static UniValue allowance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "allowance \"owner\" \"spender\"\n"
            "\nArguments:\n"
            "1. \"owner\"      (string, required) Token holder\n"
            "2. \"spender\"    (string, required) Approved spender\n"
            "\nResult:\n"
            "\"n\"             (string) Remaining allowance in base units\n"
            "\nExamples:\n"
            + HelpExampleCli("allowance", "\"0x...01\", \"0x...02\"")
        );
    }

    const CTokenAddress owner = ParseAddressV(request.params[0], "owner");
    const CTokenAddress spender = ParseAddressV(request.params[1], "spender");
    return EnsureToken(request).Allowance(owner, spender).str();
}

static UniValue getlasttrade(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getlasttrade \"address\"\n"
            "\nArguments:\n"
            "1. \"address\"    (string, required) The address\n"
            "\nResult:\n"
            "n               (numeric) Time of the last cooldown-tracked transfer, 0 if none\n"
            "\nExamples:\n"
            + HelpExampleCli("getlasttrade", "\"0x000000000000000000000000000000000000abcd\"")
        );
    }

    const CTokenAddress address = ParseAddressV(request.params[0], "address");
    return EnsureToken(request).GetLastTradeTime(address);
}

/**
 * calculatefee - Dry run of the fee calculator
 *
 * Does not run the transfer guard: a transfer that would be rejected
 * still gets a fee quote.
 */
static UniValue calculatefee(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "calculatefee \"from\" \"to\" amount\n"
            "\nQuotes the fee of a transfer without executing it.\n"
            "\nArguments:\n"
            "1. \"from\"       (string, required) Sender\n"
            "2. \"to\"         (string, required) Recipient\n"
            "3. amount       (string or numeric, required) Amount in base units\n"
            "\nResult:\n"
            "{\n"
            "  \"amount\": \"n\",       (string) Requested amount\n"
            "  \"fee\": \"n\",          (string) Total fee\n"
            "  \"net\": \"n\",          (string) Amount credited to the recipient\n"
            "  \"reflection\": \"n\",   (string) Reflection share\n"
            "  \"liquidity\": \"n\",    (string) Liquidity share\n"
            "  \"marketing\": \"n\",    (string) Marketing share\n"
            "  \"burn\": \"n\",         (string) Burned share\n"
            "  \"remainder\": \"n\",    (string) Rounding remainder kept by the sender\n"
            "  \"ratePercent\": n,    (numeric) Effective rate\n"
            "  \"exempt\": true|false, (boolean) A party is fee-excluded\n"
            "  \"whale\": true|false   (boolean) Large-transfer surcharge applied\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("calculatefee", "\"0x...0a\", \"0x...0b\", \"100000\"")
        );
    }

    const CTokenAddress from = ParseAddressV(request.params[0], "from");
    const CTokenAddress to = ParseAddressV(request.params[1], "to");
    const TokenAmount amount = ParseAmountV(request.params[2], "amount");

    token_fees::TokenFeeBreakdown fees;
    CValidationState state;
    ThrowIfRejected(EnsureToken(request).PreviewTransferFee(from, to, amount, fees, state), state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("amount", amount.str());
    result.pushKV("fee", fees.nTotalFee.str());
    result.pushKV("net", TokenAmount(amount - fees.nTotalFee).str());
    result.pushKV("reflection", fees.nReflection.str());
    result.pushKV("liquidity", fees.nLiquidity.str());
    result.pushKV("marketing", fees.nMarketing.str());
    result.pushKV("burn", fees.nBurn.str());
    result.pushKV("remainder", fees.GetRoundingRemainder().str());
    result.pushKV("ratePercent", (int64_t)fees.nRatePercent);
    result.pushKV("exempt", fees.fExempt);
    result.pushKV("whale", fees.fWhaleSurcharge);
    return result;
}

static UniValue transfer(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "transfer \"caller\" \"to\" amount\n"
            "\nTransfers amount from caller to a recipient, net of fees.\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Sender\n"
            "2. \"to\"         (string, required) Recipient\n"
            "3. amount       (string or numeric, required) Gross amount in base units\n"
            "\nResult:\n"
            "true            (boolean) Transfer applied\n"
            "\nExamples:\n"
            + HelpExampleCli("transfer", "\"0x...01\", \"0x...0a\", \"100000\"")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    const CTokenAddress to = ParseAddressV(request.params[1], "to");
    const TokenAmount amount = ParseAmountV(request.params[2], "amount");

    CValidationState state;
    ThrowIfRejected(EnsureToken(request).Transfer(caller, to, amount, state), state);
    return true;
}

static UniValue transferfrom(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 4) {
        throw std::runtime_error(
            "transferfrom \"caller\" \"from\" \"to\" amount\n"
            "\nSpends caller's allowance on from's balance.\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Approved spender\n"
            "2. \"from\"       (string, required) Token holder\n"
            "3. \"to\"         (string, required) Recipient\n"
            "4. amount       (string or numeric, required) Gross amount in base units\n"
            "\nResult:\n"
            "true            (boolean) Transfer applied\n"
            "\nExamples:\n"
            + HelpExampleCli("transferfrom", "\"0x...02\", \"0x...01\", \"0x...0a\", \"100000\"")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    const CTokenAddress from = ParseAddressV(request.params[1], "from");
    const CTokenAddress to = ParseAddressV(request.params[2], "to");
    const TokenAmount amount = ParseAmountV(request.params[3], "amount");

    CValidationState state;
    ThrowIfRejected(EnsureToken(request).TransferFrom(caller, from, to, amount, state), state);
    return true;
}

static UniValue approve(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "approve \"caller\" \"spender\" amount\n"
            "\nSets the allowance of spender over caller's balance.\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Token holder\n"
            "2. \"spender\"    (string, required) Spender\n"
            "3. amount       (string or numeric, required) Allowance in base units\n"
            "\nResult:\n"
            "true            (boolean) Allowance set\n"
            "\nExamples:\n"
            + HelpExampleCli("approve", "\"0x...01\", \"0x...02\", \"500000\"")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    const CTokenAddress spender = ParseAddressV(request.params[1], "spender");
    const TokenAmount amount = ParseAmountV(request.params[2], "amount");

    CValidationState state;
    ThrowIfRejected(EnsureToken(request).Approve(caller, spender, amount, state), state);
    return true;
}

static UniValue togglefeature(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "togglefeature \"caller\" \"name\" enabled\n"
            "\nSets a feature toggle (owner only). Unknown names are accepted and ignored.\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "2. \"name\"       (string, required) reflectionEnabled, antiWhaleEnabled, autoLiquidityEnabled,\n"
            "                 cooldownEnabled, blacklistEnabled or autoBurnEnabled\n"
            "3. enabled      (boolean, required) New value\n"
            "\nResult:\n"
            "{ ... }         (object) Feature toggles after the call\n"
            "\nExamples:\n"
            + HelpExampleCli("togglefeature", "\"0x...01\", \"cooldownEnabled\", false")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    RPCTypeCheckArgument(request.params[1], UniValue::VSTR);
    const std::string strName = request.params[1].get_str();
    const bool fEnabled = ParseBoolV(request.params[2]);

    CValidationState state;
    ThrowIfRejected(EnsureToken(request).ToggleFeature(caller, strName, fEnabled, state), state);

    JSONRPCRequest featuresReq(request);
    featuresReq.params = UniValue(UniValue::VARR);
    return getfeatures(featuresReq);
}

static UniValue updatefees(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 4 || request.params.size() > 5) {
        throw std::runtime_error(
            "updatefees \"caller\" liquidity marketing burn ( reflection )\n"
            "\nReplaces the fee schedule (owner only). The sum must not exceed 25.\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "2. liquidity    (numeric, required) Liquidity percent\n"
            "3. marketing    (numeric, required) Marketing percent\n"
            "4. burn         (numeric, required) Burn percent\n"
            "5. reflection   (numeric, optional, default=0) Reflection percent, reflection variant only\n"
            "\nResult:\n"
            "{ ... }         (object) Fee schedule after the call\n"
            "\nExamples:\n"
            + HelpExampleCli("updatefees", "\"0x...01\", 2, 2, 1")
            + HelpExampleCli("updatefees", "\"0x...01\", 2, 2, 1, 1")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    TokenFeeSchedule fees;
    fees.nLiquidity = ParsePercentV(request.params[1], "liquidity");
    fees.nMarketing = ParsePercentV(request.params[2], "marketing");
    fees.nBurn = ParsePercentV(request.params[3], "burn");
    if (request.params.size() > 4) {
        fees.nReflection = ParsePercentV(request.params[4], "reflection");
    }

    CMemeToken& token = EnsureToken(request);
    CValidationState state;
    ThrowIfRejected(token.UpdateFees(caller, fees, state), state);
    return FeesToJSON(token.GetFees());
}

static UniValue updatelimits(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 4) {
        throw std::runtime_error(
            "updatelimits \"caller\" maxtx maxwallet cooldown\n"
            "\nReplaces the limits (owner only).\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "2. maxtx        (string or numeric, required) Per-transfer cap, base units\n"
            "3. maxwallet    (string or numeric, required) Recipient balance cap, base units\n"
            "4. cooldown     (numeric, required) Seconds between outbound trades\n"
            "\nResult:\n"
            "{ ... }         (object) Limits after the call\n"
            "\nExamples:\n"
            + HelpExampleCli("updatelimits", "\"0x...01\", \"1000000\", \"2000000\", 60")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    const TokenAmount nMaxTx = ParseAmountV(request.params[1], "maxtx");
    const TokenAmount nMaxWallet = ParseAmountV(request.params[2], "maxwallet");
    RPCTypeCheckArgument(request.params[3], UniValue::VNUM);
    const int64_t nCooldown = request.params[3].get_int64();
    if (nCooldown < 0 || nCooldown > (int64_t)std::numeric_limits<uint32_t>::max()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("cooldown out of range: %d", nCooldown));
    }

    CMemeToken& token = EnsureToken(request);
    CValidationState state;
    ThrowIfRejected(token.UpdateLimits(caller, TokenLimits(nMaxTx, nMaxWallet, (uint32_t)nCooldown), state), state);
    return LimitsToJSON(token.GetLimits());
}

static UniValue setblacklisted(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "setblacklisted \"caller\" \"address\" flag\n"
            "\nSets or clears the blacklist flag of an address (owner only).\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "2. \"address\"    (string, required) Target address\n"
            "3. flag         (boolean, required) true to blacklist\n"
            "\nResult:\n"
            "true            (boolean) Flag applied\n"
            "\nExamples:\n"
            + HelpExampleCli("setblacklisted", "\"0x...01\", \"0x...bad\", true")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    const CTokenAddress address = ParseAddressV(request.params[1], "address");
    const bool fFlag = ParseBoolV(request.params[2]);

    CValidationState state;
    ThrowIfRejected(EnsureToken(request).SetBlacklisted(caller, address, fFlag, state), state);
    return true;
}

static UniValue setexcludedfromfees(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "setexcludedfromfees \"caller\" \"address\" flag\n"
            "\nSets or clears the fee exclusion of an address (owner only).\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "2. \"address\"    (string, required) Target address\n"
            "3. flag         (boolean, required) true to exclude\n"
            "\nResult:\n"
            "true            (boolean) Flag applied\n"
            "\nExamples:\n"
            + HelpExampleCli("setexcludedfromfees", "\"0x...01\", \"0x...0a\", true")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    const CTokenAddress address = ParseAddressV(request.params[1], "address");
    const bool fFlag = ParseBoolV(request.params[2]);

    CValidationState state;
    ThrowIfRejected(EnsureToken(request).SetExcludedFromFees(caller, address, fFlag, state), state);
    return true;
}

static UniValue enabletrading(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "enabletrading \"caller\"\n"
            "\nOpens trading to everyone (owner only, once).\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "\nResult:\n"
            "n               (numeric) Launch time\n"
            "\nExamples:\n"
            + HelpExampleCli("enabletrading", "\"0x...01\"")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    CMemeToken& token = EnsureToken(request);
    CValidationState state;
    ThrowIfRejected(token.EnableTrading(caller, state), state);
    return token.GetTradingState().nLaunchedAt;
}

static UniValue pausetoken(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "pause \"caller\"\n"
            "\nRejects transfer and transferfrom until unpause (owner only).\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "\nResult:\n"
            "true            (boolean)\n"
            "\nExamples:\n"
            + HelpExampleCli("pause", "\"0x...01\"")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    CValidationState state;
    ThrowIfRejected(EnsureToken(request).Pause(caller, state), state);
    return true;
}

static UniValue unpausetoken(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "unpause \"caller\"\n"
            "\nLifts the pause gate (owner only).\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) Owner address\n"
            "\nResult:\n"
            "true            (boolean)\n"
            "\nExamples:\n"
            + HelpExampleCli("unpause", "\"0x...01\"")
        );
    }

    const CTokenAddress caller = ParseAddressV(request.params[0], "caller");
    CValidationState state;
    ThrowIfRejected(EnsureToken(request).Unpause(caller, state), state);
    return true;
}

static UniValue setmocktime(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setmocktime timestamp\n"
            "\nSet the clock used for cooldowns and launch time to given timestamp\n"
            "\nArguments:\n"
            "1. timestamp  (integer, required) Unix seconds timestamp\n"
            "   Pass 0 to go back to using the system time."
        );
    }

    RPCTypeCheckArgument(request.params[0], UniValue::VNUM);
    SetMockTime(request.params[0].get_int64());
    return NullUniValue;
}

static const CRPCCommand commands[] = {
    //  category    name                      actor (function)            okSafe  argNames
    //  ----------- ------------------------  ------------------------    ------  ----------
    { "token",      "gettokeninfo",           &gettokeninfo,              true,   {} },
    { "token",      "getfeatures",            &getfeatures,               true,   {} },
    { "token",      "getfees",                &getfees,                   true,   {} },
    { "token",      "getlimits",              &getlimits,                 true,   {} },
    { "token",      "getblacklist",           &getblacklist,              true,   {} },
    { "token",      "isblacklisted",          &isblacklisted,             true,   {"address"} },
    { "token",      "isexcludedfromfees",     &isexcludedfromfees,        true,   {"address"} },
    { "token",      "balanceof",              &balanceof,                 true,   {"address"} },
    { "token",      "allowance",              &allowance,                 true,   {"owner", "spender"} },
    { "token",      "getlasttrade",           &getlasttrade,              true,   {"address"} },
    { "token",      "calculatefee",           &calculatefee,              true,   {"from", "to", "amount"} },
    { "token",      "transfer",               &transfer,                  false,  {"caller", "to", "amount"} },
    { "token",      "transferfrom",           &transferfrom,              false,  {"caller", "from", "to", "amount"} },
    { "token",      "approve",                &approve,                   false,  {"caller", "spender", "amount"} },

    { "admin",      "togglefeature",          &togglefeature,             false,  {"caller", "name", "enabled"} },
    { "admin",      "updatefees",             &updatefees,                false,  {"caller", "liquidity", "marketing", "burn", "reflection"} },
    { "admin",      "updatelimits",           &updatelimits,              false,  {"caller", "maxtx", "maxwallet", "cooldown"} },
    { "admin",      "setblacklisted",         &setblacklisted,            false,  {"caller", "address", "flag"} },
    { "admin",      "setexcludedfromfees",    &setexcludedfromfees,       false,  {"caller", "address", "flag"} },
    { "admin",      "enabletrading",          &enabletrading,             false,  {"caller"} },
    { "admin",      "pause",                  &pausetoken,                false,  {"caller"} },
    { "admin",      "unpause",                &unpausetoken,              false,  {"caller"} },

    { "hidden",     "setmocktime",            &setmocktime,               true,   {"timestamp"} },
};

void RegisterTokenRPCCommands(CRPCTable& t)
{
    for (const CRPCCommand& cmd : commands) {
        t.appendCommand(cmd.name, &cmd);
    }
}
