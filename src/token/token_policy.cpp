// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_policy.h"

#include "consensus/validation.h"
#include "logging.h"

#include <algorithm>

bool ParseTokenVariant(const std::string& str, TokenVariant& variantOut)
{
    if (str == "reflection") {
        variantOut = TokenVariant::REFLECTION;
        return true;
    }
    if (str == "standard") {
        variantOut = TokenVariant::STANDARD;
        return true;
    }
    return false;
}

std::string TokenVariantName(TokenVariant variant)
{
    return variant == TokenVariant::REFLECTION ? "reflection" : "standard";
}

struct CTokenFeatureDesc
{
    TokenFeature feature;
    const char* name;
};

static const CTokenFeatureDesc TokenFeatureNames[] = {
    {TokenFeature::REFLECTION, "reflectionEnabled"},
    {TokenFeature::ANTI_WHALE, "antiWhaleEnabled"},
    {TokenFeature::AUTO_LIQUIDITY, "autoLiquidityEnabled"},
    {TokenFeature::COOLDOWN, "cooldownEnabled"},
    {TokenFeature::BLACKLIST, "blacklistEnabled"},
    {TokenFeature::AUTO_BURN, "autoBurnEnabled"},
};

TokenFeature TokenFeatureFromName(const std::string& strName)
{
    for (const CTokenFeatureDesc& desc : TokenFeatureNames) {
        if (strName == desc.name) {
            return desc.feature;
        }
    }
    return TokenFeature::UNKNOWN;
}

std::string TokenFeatureName(TokenFeature feature)
{
    for (const CTokenFeatureDesc& desc : TokenFeatureNames) {
        if (desc.feature == feature) {
            return desc.name;
        }
    }
    return "unknown";
}

bool TokenFeatureSet::Get(TokenFeature feature) const
{
    switch (feature) {
    case TokenFeature::REFLECTION: return fReflection;
    case TokenFeature::ANTI_WHALE: return fAntiWhale;
    case TokenFeature::AUTO_LIQUIDITY: return fAutoLiquidity;
    case TokenFeature::COOLDOWN: return fCooldown;
    case TokenFeature::BLACKLIST: return fBlacklist;
    case TokenFeature::AUTO_BURN: return fAutoBurn;
    case TokenFeature::UNKNOWN: return false;
    }
    return false;
}

void TokenFeatureSet::Set(TokenFeature feature, bool fEnabled)
{
    switch (feature) {
    case TokenFeature::REFLECTION: fReflection = fEnabled; break;
    case TokenFeature::ANTI_WHALE: fAntiWhale = fEnabled; break;
    case TokenFeature::AUTO_LIQUIDITY: fAutoLiquidity = fEnabled; break;
    case TokenFeature::COOLDOWN: fCooldown = fEnabled; break;
    case TokenFeature::BLACKLIST: fBlacklist = fEnabled; break;
    case TokenFeature::AUTO_BURN: fAutoBurn = fEnabled; break;
    case TokenFeature::UNKNOWN: break;
    }
}

std::string TokenFeeSchedule::ToString() const
{
    return strprintf("TokenFeeSchedule(reflection=%u, liquidity=%u, marketing=%u, burn=%u)",
                     nReflection, nLiquidity, nMarketing, nBurn);
}

std::string TokenLimits::ToString() const
{
    return strprintf("TokenLimits(maxTx=%s, maxWallet=%s, cooldown=%u)",
                     nMaxTransactionAmount.str(), nMaxWalletSize.str(), nCooldownTime);
}

TokenPolicyOptions TokenPolicyOptions::ForVariant(TokenVariant variant)
{
    TokenPolicyOptions result;
    result.variant = variant;
    if (variant == TokenVariant::REFLECTION) {
        result.fBlacklistGatedByFeature = true;
        result.blacklistMutation = BlacklistMutation::APPEND_ONCE;
    } else {
        result.fBlacklistGatedByFeature = false;
        result.blacklistMutation = BlacklistMutation::REQUIRE_FEATURE;
    }
    return result;
}

CTokenPolicy::CTokenPolicy(const TokenPolicyOptions& optionsIn) : options(optionsIn)
{
    NormalizeFeatures();
}

void CTokenPolicy::NormalizeFeatures()
{
    if (options.variant == TokenVariant::STANDARD) {
        features.fReflection = false;
        features.fAutoLiquidity = true;
    }
}

bool CTokenPolicy::HasFeature(TokenFeature feature) const
{
    if (feature == TokenFeature::UNKNOWN) {
        return false;
    }
    if (options.variant == TokenVariant::STANDARD) {
        return feature != TokenFeature::REFLECTION && feature != TokenFeature::AUTO_LIQUIDITY;
    }
    return true;
}

bool CTokenPolicy::IsFeatureEnabled(TokenFeature feature) const
{
    return features.Get(feature);
}

bool CTokenPolicy::IsBlacklisted(const CTokenAddress& address) const
{
    auto it = mapBlacklisted.find(address);
    return it != mapBlacklisted.end() && it->second;
}

bool CTokenPolicy::IsBlacklistEnforced() const
{
    return !options.fBlacklistGatedByFeature || features.fBlacklist;
}

bool CTokenPolicy::IsExcludedFromFees(const CTokenAddress& address) const
{
    auto it = mapExcludedFromFees.find(address);
    return it != mapExcludedFromFees.end() && it->second;
}

int64_t CTokenPolicy::GetLastTradeTime(const CTokenAddress& address) const
{
    auto it = mapLastTradeTime.find(address);
    return it == mapLastTradeTime.end() ? 0 : it->second;
}

bool CTokenPolicy::SetFeature(TokenFeature feature, bool fEnabled)
{
    if (!HasFeature(feature)) {
        LogPrint(BCLog::POLICY, "CTokenPolicy::SetFeature: %s not carried by %s variant, ignored\n",
                 TokenFeatureName(feature), TokenVariantName(options.variant));
        return false;
    }
    features.Set(feature, fEnabled);
    LogPrint(BCLog::POLICY, "CTokenPolicy::SetFeature: %s=%d\n", TokenFeatureName(feature), fEnabled);
    return true;
}

bool CTokenPolicy::SetFees(const TokenFeeSchedule& newFees, CValidationState& state)
{
    if (newFees.GetTotal() > MAX_TOTAL_FEE_PERCENT) {
        return state.Invalid(TokenError::INVALID_CONFIGURATION, "token-fee-too-high",
                             strprintf("total fee %u%% exceeds %u%%", newFees.GetTotal(), MAX_TOTAL_FEE_PERCENT));
    }
    if (options.variant == TokenVariant::STANDARD && newFees.nReflection != 0) {
        return state.Invalid(TokenError::INVALID_CONFIGURATION, "token-fee-no-reflection",
                             "standard variant has no reflection component");
    }

    fees = newFees;
    LogPrint(BCLog::POLICY, "CTokenPolicy::SetFees: %s\n", fees.ToString());
    return true;
}

void CTokenPolicy::SetLimits(const TokenLimits& newLimits)
{
    limits = newLimits;
    LogPrint(BCLog::POLICY, "CTokenPolicy::SetLimits: %s\n", limits.ToString());
}

bool CTokenPolicy::SetBlacklisted(const CTokenAddress& address, bool fBlacklisted, CValidationState& state)
{
    if (address.IsNull()) {
        return state.Invalid(TokenError::INVALID_ADDRESS, "token-blacklist-null-address");
    }

    if (options.blacklistMutation == BlacklistMutation::REQUIRE_FEATURE) {
        if (!features.fBlacklist) {
            return state.Invalid(TokenError::INVALID_CONFIGURATION, "token-blacklist-disabled",
                                 "blacklist feature is off");
        }
        if (fBlacklisted) {
            vBlacklistHistory.push_back(address);
        }
    } else if (fBlacklisted) {
        if (std::find(vBlacklistHistory.begin(), vBlacklistHistory.end(), address) == vBlacklistHistory.end()) {
            vBlacklistHistory.push_back(address);
        }
    }

    mapBlacklisted[address] = fBlacklisted;
    LogPrint(BCLog::POLICY, "CTokenPolicy::SetBlacklisted: %s=%d (history=%u)\n",
             address.ToString(), fBlacklisted, vBlacklistHistory.size());
    return true;
}

void CTokenPolicy::SetFeeExcluded(const CTokenAddress& address, bool fExcluded)
{
    mapExcludedFromFees[address] = fExcluded;
    LogPrint(BCLog::POLICY, "CTokenPolicy::SetFeeExcluded: %s=%d\n", address.ToString(), fExcluded);
}

bool CTokenPolicy::EnableTrading(int64_t nTime, CValidationState& state)
{
    if (trading.fEnabled) {
        return state.Invalid(TokenError::ALREADY_ENABLED, "token-trading-already-enabled",
                             strprintf("launched at %d", trading.nLaunchedAt));
    }
    trading.fEnabled = true;
    trading.nLaunchedAt = nTime;
    LogPrint(BCLog::POLICY, "CTokenPolicy::EnableTrading: launchedAt=%d\n", nTime);
    return true;
}

void CTokenPolicy::SetLastTradeTime(const CTokenAddress& address, int64_t nTime)
{
    mapLastTradeTime[address] = nTime;
}

bool CTokenPolicy::CheckInvariants() const
{
    if (fees.GetTotal() > MAX_TOTAL_FEE_PERCENT) {
        return false;
    }
    if (options.variant == TokenVariant::STANDARD) {
        if (fees.nReflection != 0 || features.fReflection || !features.fAutoLiquidity) {
            return false;
        }
    }
    if (!trading.fEnabled && trading.nLaunchedAt != 0) {
        return false;
    }
    return true;
}
