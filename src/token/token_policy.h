// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_POLICY_H
#define MEMETOKEN_TOKEN_POLICY_H

#include "address.h"
#include "amount.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

class CValidationState;

/** Hard ceiling on the sum of all fee schedule components (whole percent) */
static const uint32_t MAX_TOTAL_FEE_PERCENT = 25;

/**
 * TokenVariant
 *
 * REFLECTION carries six feature toggles and a reflection fee component.
 * STANDARD carries four toggles (anti-whale, cooldown, blacklist, auto-burn);
 * reflection is always off and the liquidity component always applies.
 */
enum class TokenVariant {
    REFLECTION,
    STANDARD,
};

bool ParseTokenVariant(const std::string& str, TokenVariant& variantOut);
std::string TokenVariantName(TokenVariant variant);

enum class TokenFeature {
    REFLECTION,
    ANTI_WHALE,
    AUTO_LIQUIDITY,
    COOLDOWN,
    BLACKLIST,
    AUTO_BURN,
    UNKNOWN,
};

/** "antiWhaleEnabled" -> ANTI_WHALE. Anything unrecognized maps to UNKNOWN. */
TokenFeature TokenFeatureFromName(const std::string& strName);
std::string TokenFeatureName(TokenFeature feature);

struct TokenFeatureSet
{
    bool fReflection;
    bool fAntiWhale;
    bool fAutoLiquidity;
    bool fCooldown;
    bool fBlacklist;
    bool fAutoBurn;

    TokenFeatureSet()
    {
        SetNull();
    }

    void SetNull()
    {
        fReflection = false;
        fAntiWhale = false;
        fAutoLiquidity = false;
        fCooldown = false;
        fBlacklist = false;
        fAutoBurn = false;
    }

    bool Get(TokenFeature feature) const;
    void Set(TokenFeature feature, bool fEnabled);

    friend bool operator==(const TokenFeatureSet& a, const TokenFeatureSet& b)
    {
        return a.fReflection == b.fReflection && a.fAntiWhale == b.fAntiWhale &&
               a.fAutoLiquidity == b.fAutoLiquidity && a.fCooldown == b.fCooldown &&
               a.fBlacklist == b.fBlacklist && a.fAutoBurn == b.fAutoBurn;
    }
};

/**
 * TokenFeeSchedule - Whole-percent fee components
 *
 * INVARIANT: GetTotal() <= MAX_TOTAL_FEE_PERCENT, enforced when the
 * schedule is replaced. The whale surcharge is added at transfer time and
 * may push the effective rate above the ceiling.
 */
struct TokenFeeSchedule
{
    uint32_t nReflection;
    uint32_t nLiquidity;
    uint32_t nMarketing;
    uint32_t nBurn;

    TokenFeeSchedule() : nReflection(0), nLiquidity(0), nMarketing(0), nBurn(0) {}
    TokenFeeSchedule(uint32_t nReflectionIn, uint32_t nLiquidityIn, uint32_t nMarketingIn, uint32_t nBurnIn) :
        nReflection(nReflectionIn), nLiquidity(nLiquidityIn), nMarketing(nMarketingIn), nBurn(nBurnIn) {}

    /** 64-bit sum so that four large components cannot wrap */
    uint64_t GetTotal() const
    {
        return (uint64_t)nReflection + nLiquidity + nMarketing + nBurn;
    }

    std::string ToString() const;

    friend bool operator==(const TokenFeeSchedule& a, const TokenFeeSchedule& b)
    {
        return a.nReflection == b.nReflection && a.nLiquidity == b.nLiquidity &&
               a.nMarketing == b.nMarketing && a.nBurn == b.nBurn;
    }
};

struct TokenLimits
{
    TokenAmount nMaxTransactionAmount;
    TokenAmount nMaxWalletSize;
    uint32_t nCooldownTime; // seconds

    TokenLimits() : nMaxTransactionAmount(0), nMaxWalletSize(0), nCooldownTime(0) {}
    TokenLimits(const TokenAmount& nMaxTx, const TokenAmount& nMaxWallet, uint32_t nCooldown) :
        nMaxTransactionAmount(nMaxTx), nMaxWalletSize(nMaxWallet), nCooldownTime(nCooldown) {}

    std::string ToString() const;

    friend bool operator==(const TokenLimits& a, const TokenLimits& b)
    {
        return a.nMaxTransactionAmount == b.nMaxTransactionAmount &&
               a.nMaxWalletSize == b.nMaxWalletSize && a.nCooldownTime == b.nCooldownTime;
    }
};

/** Disabled -> Enabled, one way. nLaunchedAt is written exactly once. */
struct TokenTradingState
{
    bool fEnabled;
    int64_t nLaunchedAt;

    TokenTradingState() : fEnabled(false), nLaunchedAt(0) {}
};

/** How SetBlacklisted maintains the historical blacklist */
enum class BlacklistMutation {
    APPEND_ONCE,     //!< no precondition, address appended the first time only
    REQUIRE_FEATURE, //!< blacklist feature must be on, appended on every set
};

struct TokenPolicyOptions
{
    TokenVariant variant;
    //! Transfer-path blacklist check only applies while the blacklist feature is on
    bool fBlacklistGatedByFeature;
    BlacklistMutation blacklistMutation;

    TokenPolicyOptions() :
        variant(TokenVariant::STANDARD),
        fBlacklistGatedByFeature(false),
        blacklistMutation(BlacklistMutation::REQUIRE_FEATURE) {}

    static TokenPolicyOptions ForVariant(TokenVariant variant);
};

/**
 * CTokenPolicy - Mutable transfer policy of one token
 *
 * Holds feature toggles, fee schedule, limits, trading state, the
 * exclusion and blacklist registries and the per-wallet last trade time.
 * Read by the transfer guard and fee calculator on every transfer; mutated
 * only through the owner-checked administrative surface of CMemeToken.
 */
class CTokenPolicy
{
private:
    TokenPolicyOptions options;
    TokenFeatureSet features;
    TokenFeeSchedule fees;
    TokenLimits limits;
    TokenTradingState trading;

    std::map<CTokenAddress, bool> mapBlacklisted;
    std::vector<CTokenAddress> vBlacklistHistory;
    std::map<CTokenAddress, bool> mapExcludedFromFees;
    std::map<CTokenAddress, int64_t> mapLastTradeTime;

    /** Force the toggles the variant does not carry to their fixed values */
    void NormalizeFeatures();

public:
    explicit CTokenPolicy(const TokenPolicyOptions& optionsIn);

    const TokenPolicyOptions& GetOptions() const { return options; }
    const TokenFeatureSet& GetFeatures() const { return features; }
    const TokenFeeSchedule& GetFees() const { return fees; }
    const TokenLimits& GetLimits() const { return limits; }
    const TokenTradingState& GetTradingState() const { return trading; }

    /** Whether the variant carries this toggle at all */
    bool HasFeature(TokenFeature feature) const;
    bool IsFeatureEnabled(TokenFeature feature) const;
    bool IsTradingEnabled() const { return trading.fEnabled; }

    bool IsBlacklisted(const CTokenAddress& address) const;
    /** True when the transfer path must honour blacklist flags */
    bool IsBlacklistEnforced() const;
    const std::vector<CTokenAddress>& GetBlacklistHistory() const { return vBlacklistHistory; }

    bool IsExcludedFromFees(const CTokenAddress& address) const;
    int64_t GetLastTradeTime(const CTokenAddress& address) const;

    /**
     * SetFeature - Apply a toggle
     *
     * UNKNOWN, or a feature the variant does not carry, is a no-op.
     * @return true if a toggle was changed or re-set
     */
    bool SetFeature(TokenFeature feature, bool fEnabled);

    /** Replace the whole schedule; InvalidConfiguration if the sum exceeds 25 */
    bool SetFees(const TokenFeeSchedule& newFees, CValidationState& state);

    void SetLimits(const TokenLimits& newLimits);

    bool SetBlacklisted(const CTokenAddress& address, bool fBlacklisted, CValidationState& state);
    void SetFeeExcluded(const CTokenAddress& address, bool fExcluded);

    /** AlreadyEnabled on the second call; records nTime as the launch time */
    bool EnableTrading(int64_t nTime, CValidationState& state);

    void SetLastTradeTime(const CTokenAddress& address, int64_t nTime);

    /** Fee ceiling and variant constraints */
    bool CheckInvariants() const;
};

#endif // MEMETOKEN_TOKEN_POLICY_H
