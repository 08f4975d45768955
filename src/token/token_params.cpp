// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_params.h"

#include "logging.h"
#include "util/system.h"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>

#include <limits>
#include <vector>

/** Largest decimals for which 10^decimals still fits in 256 bits */
static const unsigned int MAX_TOKEN_DECIMALS = 77;

static TokenAmount PercentOfSupply(const TokenAmount& nSupply, uint32_t nPercent)
{
    return static_cast<TokenAmount>(TokenAmountWide(nSupply) * nPercent / 100);
}

bool CTokenParams::Validate(std::string& strError) const
{
    if (strName.empty() || strSymbol.empty()) {
        strError = "token name and symbol must not be empty";
        return false;
    }
    if (nDecimals > MAX_TOKEN_DECIMALS) {
        strError = strprintf("decimals %u above %u", nDecimals, MAX_TOKEN_DECIMALS);
        return false;
    }
    if (nTotalSupply == 0) {
        strError = "total supply must be positive";
        return false;
    }
    if (owner.IsNull() || tokenAddress.IsNull() || marketingWallet.IsNull()) {
        strError = "owner, token address and marketing wallet must be set";
        return false;
    }
    if (owner == BurnAddress() || tokenAddress == BurnAddress() || marketingWallet == BurnAddress()) {
        strError = "the burn sink cannot hold a role";
        return false;
    }
    if (fees.GetTotal() > MAX_TOTAL_FEE_PERCENT) {
        strError = strprintf("total fee %u%% exceeds %u%%", fees.GetTotal(), MAX_TOTAL_FEE_PERCENT);
        return false;
    }
    if (options.variant == TokenVariant::STANDARD && fees.nReflection != 0) {
        strError = "standard variant has no reflection fee";
        return false;
    }
    return true;
}

static std::unique_ptr<CTokenParams> CreateReflectionTokenParams()
{
    std::unique_ptr<CTokenParams> params(new CTokenParams());
    params->strName = "MemeToken";
    params->strSymbol = "MEME";
    params->options = TokenPolicyOptions::ForVariant(TokenVariant::REFLECTION);

    params->features.fReflection = true;
    params->features.fAntiWhale = true;
    params->features.fAutoLiquidity = true;
    params->features.fCooldown = true;
    params->features.fBlacklist = true;
    params->features.fAutoBurn = true;

    params->fees = TokenFeeSchedule(1, 2, 2, 1);
    return params;
}

static std::unique_ptr<CTokenParams> CreateStandardTokenParams()
{
    std::unique_ptr<CTokenParams> params(new CTokenParams());
    params->strName = "MemeToken";
    params->strSymbol = "MEME";
    params->options = TokenPolicyOptions::ForVariant(TokenVariant::STANDARD);

    params->features.fReflection = false;
    params->features.fAntiWhale = true;
    params->features.fAutoLiquidity = true;
    params->features.fCooldown = true;
    params->features.fBlacklist = true;
    params->features.fAutoBurn = true;

    params->fees = TokenFeeSchedule(0, 2, 2, 1);
    return params;
}

std::unique_ptr<CTokenParams> CreateTokenParams(TokenVariant variant)
{
    std::unique_ptr<CTokenParams> params =
        variant == TokenVariant::REFLECTION ? CreateReflectionTokenParams() : CreateStandardTokenParams();

    params->nDecimals = TOKEN_DECIMALS;
    params->nTotalSupply = TokenUnits(DEFAULT_TOKEN_SUPPLY, params->nDecimals);
    params->owner = CTokenAddress::FromUint64(0x0001);
    params->tokenAddress = CTokenAddress::FromUint64(0x7070);
    params->marketingWallet = CTokenAddress::FromUint64(0x3333);

    // 1% / 2% of supply
    params->limits = TokenLimits(PercentOfSupply(params->nTotalSupply, 1),
                                 PercentOfSupply(params->nTotalSupply, 2),
                                 DEFAULT_COOLDOWN_TIME);
    return params;
}

static bool ParseAddressArg(const ArgsManager& args, const std::string& strArg,
                            CTokenAddress& addressOut, std::string& strError)
{
    if (!args.IsArgSet(strArg)) {
        return true;
    }
    const std::string str = args.GetArg(strArg, "");
    if (!CTokenAddress::FromString(str, addressOut)) {
        strError = strprintf("invalid address for %s: '%s'", strArg, str);
        return false;
    }
    return true;
}

static bool ParseAmountArg(const ArgsManager& args, const std::string& strArg, unsigned int nDecimals,
                           TokenAmount& amountOut, std::string& strError)
{
    if (!args.IsArgSet(strArg)) {
        return true;
    }
    const std::string str = args.GetArg(strArg, "");
    if (!ParseTokenAmount(str, nDecimals, amountOut)) {
        strError = strprintf("invalid amount for %s: '%s'", strArg, str);
        return false;
    }
    return true;
}

static bool ParseFeesArg(const std::string& str, TokenVariant variant, TokenFeeSchedule& feesOut, std::string& strError)
{
    std::vector<std::string> parts;
    boost::split(parts, str, boost::is_any_of(","));
    const size_t nExpected = variant == TokenVariant::REFLECTION ? 4 : 3;
    if (parts.size() != nExpected) {
        strError = strprintf("-fees expects %u comma separated percentages for the %s variant",
                             nExpected, TokenVariantName(variant));
        return false;
    }

    std::vector<uint32_t> values;
    try {
        for (const std::string& part : parts) {
            values.push_back(boost::lexical_cast<uint32_t>(part));
        }
    } catch (const boost::bad_lexical_cast&) {
        strError = strprintf("invalid -fees value '%s'", str);
        return false;
    }

    if (variant == TokenVariant::REFLECTION) {
        feesOut = TokenFeeSchedule(values[0], values[1], values[2], values[3]);
    } else {
        feesOut = TokenFeeSchedule(0, values[0], values[1], values[2]);
    }
    return true;
}

bool ApplyTokenArgs(const ArgsManager& args, CTokenParams& params, std::string& strError)
{
    params.strName = args.GetArg("-name", params.strName);
    params.strSymbol = args.GetArg("-symbol", params.strSymbol);

    if (!ParseAmountArg(args, "-supply", params.nDecimals, params.nTotalSupply, strError)) return false;
    if (args.IsArgSet("-supply")) {
        // Limits follow the supply unless given explicitly
        params.limits.nMaxTransactionAmount = PercentOfSupply(params.nTotalSupply, 1);
        params.limits.nMaxWalletSize = PercentOfSupply(params.nTotalSupply, 2);
    }

    if (!ParseAddressArg(args, "-owner", params.owner, strError)) return false;
    if (!ParseAddressArg(args, "-tokenaddress", params.tokenAddress, strError)) return false;
    if (!ParseAddressArg(args, "-marketing", params.marketingWallet, strError)) return false;

    if (args.IsArgSet("-fees")) {
        if (!ParseFeesArg(args.GetArg("-fees", ""), params.options.variant, params.fees, strError)) return false;
    }

    if (!ParseAmountArg(args, "-maxtx", params.nDecimals, params.limits.nMaxTransactionAmount, strError)) return false;
    if (!ParseAmountArg(args, "-maxwallet", params.nDecimals, params.limits.nMaxWalletSize, strError)) return false;
    if (args.IsArgSet("-cooldown")) {
        const int64_t nCooldown = args.GetArg("-cooldown", (int64_t)DEFAULT_COOLDOWN_TIME);
        if (nCooldown < 0 || nCooldown > (int64_t)std::numeric_limits<uint32_t>::max()) {
            strError = strprintf("-cooldown out of range: %d", nCooldown);
            return false;
        }
        params.limits.nCooldownTime = static_cast<uint32_t>(nCooldown);
    }

    for (const std::string& strName : args.GetArgs("-enablefeature")) {
        const TokenFeature feature = TokenFeatureFromName(strName);
        if (feature == TokenFeature::UNKNOWN) {
            strError = strprintf("unknown feature '%s'", strName);
            return false;
        }
        params.features.Set(feature, true);
    }
    for (const std::string& strName : args.GetArgs("-disablefeature")) {
        const TokenFeature feature = TokenFeatureFromName(strName);
        if (feature == TokenFeature::UNKNOWN) {
            strError = strprintf("unknown feature '%s'", strName);
            return false;
        }
        params.features.Set(feature, false);
    }

    params.options.fBlacklistGatedByFeature =
        args.GetBoolArg("-blacklistgated", params.options.fBlacklistGatedByFeature);

    return params.Validate(strError);
}
