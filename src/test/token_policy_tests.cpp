// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "test/test_memetoken.h"
#include "token/token_params.h"
#include "token/token_policy.h"
#include "util/system.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(token_policy_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(feature_names)
{
    BOOST_CHECK(TokenFeatureFromName("reflectionEnabled") == TokenFeature::REFLECTION);
    BOOST_CHECK(TokenFeatureFromName("antiWhaleEnabled") == TokenFeature::ANTI_WHALE);
    BOOST_CHECK(TokenFeatureFromName("autoLiquidityEnabled") == TokenFeature::AUTO_LIQUIDITY);
    BOOST_CHECK(TokenFeatureFromName("cooldownEnabled") == TokenFeature::COOLDOWN);
    BOOST_CHECK(TokenFeatureFromName("blacklistEnabled") == TokenFeature::BLACKLIST);
    BOOST_CHECK(TokenFeatureFromName("autoBurnEnabled") == TokenFeature::AUTO_BURN);

    BOOST_CHECK(TokenFeatureFromName("") == TokenFeature::UNKNOWN);
    BOOST_CHECK(TokenFeatureFromName("CooldownEnabled") == TokenFeature::UNKNOWN);
    BOOST_CHECK(TokenFeatureFromName("moonEnabled") == TokenFeature::UNKNOWN);

    BOOST_CHECK_EQUAL(TokenFeatureName(TokenFeature::COOLDOWN), "cooldownEnabled");
    BOOST_CHECK_EQUAL(TokenFeatureName(TokenFeature::UNKNOWN), "unknown");

    TokenVariant variant;
    BOOST_CHECK(ParseTokenVariant("standard", variant));
    BOOST_CHECK(variant == TokenVariant::STANDARD);
    BOOST_CHECK(ParseTokenVariant("reflection", variant));
    BOOST_CHECK(variant == TokenVariant::REFLECTION);
    BOOST_CHECK(!ParseTokenVariant("Reflection", variant));
}

BOOST_AUTO_TEST_CASE(set_feature_unknown_is_noop)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::REFLECTION));
    policy.SetFeature(TokenFeature::COOLDOWN, true);
    const TokenFeatureSet before = policy.GetFeatures();

    BOOST_CHECK(!policy.SetFeature(TokenFeature::UNKNOWN, true));
    BOOST_CHECK(!policy.SetFeature(TokenFeature::UNKNOWN, false));
    BOOST_CHECK(policy.GetFeatures() == before);

    BOOST_CHECK(policy.SetFeature(TokenFeature::COOLDOWN, false));
    BOOST_CHECK(!policy.IsFeatureEnabled(TokenFeature::COOLDOWN));
}

BOOST_AUTO_TEST_CASE(standard_variant_fixed_toggles)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    BOOST_CHECK(!policy.IsFeatureEnabled(TokenFeature::REFLECTION));
    BOOST_CHECK(policy.IsFeatureEnabled(TokenFeature::AUTO_LIQUIDITY));

    BOOST_CHECK(!policy.HasFeature(TokenFeature::REFLECTION));
    BOOST_CHECK(!policy.HasFeature(TokenFeature::AUTO_LIQUIDITY));
    BOOST_CHECK(policy.HasFeature(TokenFeature::ANTI_WHALE));
    BOOST_CHECK(policy.HasFeature(TokenFeature::AUTO_BURN));

    // Toggles the variant does not carry cannot be moved
    BOOST_CHECK(!policy.SetFeature(TokenFeature::REFLECTION, true));
    BOOST_CHECK(!policy.SetFeature(TokenFeature::AUTO_LIQUIDITY, false));
    BOOST_CHECK(!policy.IsFeatureEnabled(TokenFeature::REFLECTION));
    BOOST_CHECK(policy.IsFeatureEnabled(TokenFeature::AUTO_LIQUIDITY));
    BOOST_CHECK(policy.CheckInvariants());
}

BOOST_AUTO_TEST_CASE(set_fees_ceiling)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    CValidationState state;
    BOOST_CHECK(policy.SetFees(TokenFeeSchedule(0, 2, 2, 1), state));
    BOOST_CHECK(state.IsValid());

    // 10 + 10 + 10 = 30 > 25: rejected, previous schedule stays
    BOOST_CHECK(!policy.SetFees(TokenFeeSchedule(0, 10, 10, 10), state));
    BOOST_CHECK(state.GetError() == TokenError::INVALID_CONFIGURATION);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-fee-too-high");
    BOOST_CHECK(policy.GetFees() == TokenFeeSchedule(0, 2, 2, 1));

    // Exactly 25 is allowed
    CValidationState state2;
    BOOST_CHECK(policy.SetFees(TokenFeeSchedule(0, 10, 10, 5), state2));
    BOOST_CHECK_EQUAL(policy.GetFees().GetTotal(), 25U);

    // Components large enough to wrap 32 bits are still rejected
    CValidationState state3;
    BOOST_CHECK(!policy.SetFees(TokenFeeSchedule(0, 0xffffffff, 0xffffffff, 2), state3));
    BOOST_CHECK_EQUAL(policy.GetFees().GetTotal(), 25U);

    // Standard variant has no reflection component
    CValidationState state4;
    BOOST_CHECK(!policy.SetFees(TokenFeeSchedule(1, 2, 2, 1), state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "token-fee-no-reflection");
    BOOST_CHECK(policy.CheckInvariants());
}

BOOST_AUTO_TEST_CASE(set_fees_reflection_variant)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::REFLECTION));
    CValidationState state;
    BOOST_CHECK(policy.SetFees(TokenFeeSchedule(1, 2, 2, 1), state));
    BOOST_CHECK_EQUAL(policy.GetFees().GetTotal(), 6U);
    BOOST_CHECK(!policy.SetFees(TokenFeeSchedule(20, 2, 2, 2), state));
    BOOST_CHECK(policy.GetFees() == TokenFeeSchedule(1, 2, 2, 1));
}

BOOST_AUTO_TEST_CASE(enable_trading_irreversible)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    BOOST_CHECK(!policy.IsTradingEnabled());
    BOOST_CHECK_EQUAL(policy.GetTradingState().nLaunchedAt, 0);

    CValidationState state;
    BOOST_CHECK(policy.EnableTrading(TEST_START_TIME, state));
    BOOST_CHECK(policy.IsTradingEnabled());
    BOOST_CHECK_EQUAL(policy.GetTradingState().nLaunchedAt, TEST_START_TIME);

    // Second call fails and keeps the original launch time
    BOOST_CHECK(!policy.EnableTrading(TEST_START_TIME + 100, state));
    BOOST_CHECK(state.GetError() == TokenError::ALREADY_ENABLED);
    BOOST_CHECK_EQUAL(policy.GetTradingState().nLaunchedAt, TEST_START_TIME);
    BOOST_CHECK(policy.IsTradingEnabled());
}

BOOST_AUTO_TEST_CASE(blacklist_append_once)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::REFLECTION));
    const CTokenAddress a = CTokenAddress::FromUint64(0xa);
    const CTokenAddress b = CTokenAddress::FromUint64(0xb);

    // No feature precondition in this mode
    BOOST_CHECK(!policy.IsFeatureEnabled(TokenFeature::BLACKLIST));
    CValidationState state;
    BOOST_CHECK(policy.SetBlacklisted(a, true, state));
    BOOST_CHECK(policy.SetBlacklisted(a, true, state));
    BOOST_CHECK(policy.SetBlacklisted(b, true, state));
    BOOST_CHECK(policy.IsBlacklisted(a));
    BOOST_CHECK_EQUAL(policy.GetBlacklistHistory().size(), 2U);

    // Unblacklisting clears the flag and keeps the history
    BOOST_CHECK(policy.SetBlacklisted(a, false, state));
    BOOST_CHECK(!policy.IsBlacklisted(a));
    BOOST_CHECK_EQUAL(policy.GetBlacklistHistory().size(), 2U);
    BOOST_CHECK(policy.GetBlacklistHistory()[0] == a);

    BOOST_CHECK(policy.SetBlacklisted(a, true, state));
    BOOST_CHECK_EQUAL(policy.GetBlacklistHistory().size(), 2U);

    // Gated enforcement follows the toggle
    BOOST_CHECK(!policy.IsBlacklistEnforced());
    policy.SetFeature(TokenFeature::BLACKLIST, true);
    BOOST_CHECK(policy.IsBlacklistEnforced());

    BOOST_CHECK(!policy.SetBlacklisted(CTokenAddress(), true, state));
    BOOST_CHECK(state.GetError() == TokenError::INVALID_ADDRESS);
}

BOOST_AUTO_TEST_CASE(blacklist_require_feature)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    const CTokenAddress a = CTokenAddress::FromUint64(0xa);

    // Feature off: rejected, nothing recorded
    CValidationState state;
    BOOST_CHECK(!policy.SetBlacklisted(a, true, state));
    BOOST_CHECK(state.GetError() == TokenError::INVALID_CONFIGURATION);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-blacklist-disabled");
    BOOST_CHECK(!policy.IsBlacklisted(a));
    BOOST_CHECK(policy.GetBlacklistHistory().empty());

    // Enforcement is unconditional in this mode
    BOOST_CHECK(policy.IsBlacklistEnforced());

    policy.SetFeature(TokenFeature::BLACKLIST, true);
    CValidationState state2;
    BOOST_CHECK(policy.SetBlacklisted(a, true, state2));
    BOOST_CHECK(policy.SetBlacklisted(a, true, state2));
    BOOST_CHECK(policy.IsBlacklisted(a));
    // Appended on every set
    BOOST_CHECK_EQUAL(policy.GetBlacklistHistory().size(), 2U);

    BOOST_CHECK(policy.SetBlacklisted(a, false, state2));
    BOOST_CHECK(!policy.IsBlacklisted(a));
    BOOST_CHECK_EQUAL(policy.GetBlacklistHistory().size(), 2U);
}

BOOST_AUTO_TEST_CASE(fee_exclusion_and_trade_time)
{
    CTokenPolicy policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    const CTokenAddress a = CTokenAddress::FromUint64(0xa);

    BOOST_CHECK(!policy.IsExcludedFromFees(a));
    policy.SetFeeExcluded(a, true);
    BOOST_CHECK(policy.IsExcludedFromFees(a));
    policy.SetFeeExcluded(a, false);
    BOOST_CHECK(!policy.IsExcludedFromFees(a));

    BOOST_CHECK_EQUAL(policy.GetLastTradeTime(a), 0);
    policy.SetLastTradeTime(a, TEST_START_TIME);
    BOOST_CHECK_EQUAL(policy.GetLastTradeTime(a), TEST_START_TIME);

    policy.SetLimits(TokenLimits(10, 20, 30));
    BOOST_CHECK(policy.GetLimits() == TokenLimits(10, 20, 30));
}

BOOST_AUTO_TEST_CASE(token_params_presets)
{
    std::unique_ptr<CTokenParams> reflection = CreateTokenParams(TokenVariant::REFLECTION);
    std::string strError;
    BOOST_CHECK(reflection->Validate(strError));
    BOOST_CHECK(reflection->fees == TokenFeeSchedule(1, 2, 2, 1));
    BOOST_CHECK(reflection->features.fReflection);
    BOOST_CHECK_EQUAL(reflection->nTotalSupply, TokenUnits(DEFAULT_TOKEN_SUPPLY));
    BOOST_CHECK_EQUAL(reflection->limits.nMaxTransactionAmount, TokenUnits(10000000));
    BOOST_CHECK_EQUAL(reflection->limits.nMaxWalletSize, TokenUnits(20000000));
    BOOST_CHECK_EQUAL(reflection->limits.nCooldownTime, DEFAULT_COOLDOWN_TIME);

    std::unique_ptr<CTokenParams> standard = CreateTokenParams(TokenVariant::STANDARD);
    BOOST_CHECK(standard->Validate(strError));
    BOOST_CHECK(standard->fees == TokenFeeSchedule(0, 2, 2, 1));
    BOOST_CHECK(!standard->features.fReflection);
    BOOST_CHECK(standard->features.fAutoLiquidity);

    standard->fees = TokenFeeSchedule(0, 10, 10, 10);
    BOOST_CHECK(!standard->Validate(strError));

    standard->fees = TokenFeeSchedule(0, 2, 2, 1);
    standard->marketingWallet = BurnAddress();
    BOOST_CHECK(!standard->Validate(strError));
}

BOOST_AUTO_TEST_CASE(apply_token_args)
{
    std::unique_ptr<CTokenParams> params = CreateTokenParams(TokenVariant::STANDARD);
    ArgsManager args;
    std::string strError;
    const char* argv[] = {"memetokend", "-supply=1000", "-fees=3,2,1", "-cooldown=60",
                          "-owner=0x00000000000000000000000000000000000000aa",
                          "-disablefeature=cooldownEnabled", "-maxwallet=50.5", "-blacklistgated"};
    BOOST_REQUIRE(args.ParseParameters(8, argv, strError));
    BOOST_REQUIRE_MESSAGE(ApplyTokenArgs(args, *params, strError), strError);

    BOOST_CHECK_EQUAL(params->nTotalSupply, TokenUnits(1000));
    // Max tx follows the new supply, max wallet given explicitly
    BOOST_CHECK_EQUAL(params->limits.nMaxTransactionAmount, TokenUnits(10));
    BOOST_CHECK_EQUAL(params->limits.nMaxWalletSize, TokenAmount("50500000000000000000"));
    BOOST_CHECK(params->fees == TokenFeeSchedule(0, 3, 2, 1));
    BOOST_CHECK_EQUAL(params->limits.nCooldownTime, 60U);
    BOOST_CHECK(params->owner == CTokenAddress::FromUint64(0xaa));
    BOOST_CHECK(!params->features.fCooldown);
    BOOST_CHECK(params->options.fBlacklistGatedByFeature);
}

BOOST_AUTO_TEST_CASE(apply_token_args_rejects)
{
    std::string strError;
    {
        std::unique_ptr<CTokenParams> params = CreateTokenParams(TokenVariant::STANDARD);
        ArgsManager args;
        const char* argv[] = {"memetokend", "-fees=1,2,2,1"};
        BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
        BOOST_CHECK(!ApplyTokenArgs(args, *params, strError));
    }
    {
        std::unique_ptr<CTokenParams> params = CreateTokenParams(TokenVariant::REFLECTION);
        ArgsManager args;
        const char* argv[] = {"memetokend", "-fees=10,10,5,5"};
        BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
        BOOST_CHECK(!ApplyTokenArgs(args, *params, strError));
    }
    {
        std::unique_ptr<CTokenParams> params = CreateTokenParams(TokenVariant::REFLECTION);
        ArgsManager args;
        const char* argv[] = {"memetokend", "-enablefeature=moonEnabled"};
        BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
        BOOST_CHECK(!ApplyTokenArgs(args, *params, strError));
    }
    {
        std::unique_ptr<CTokenParams> params = CreateTokenParams(TokenVariant::REFLECTION);
        ArgsManager args;
        const char* argv[] = {"memetokend", "-owner=0x1234"};
        BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
        BOOST_CHECK(!ApplyTokenArgs(args, *params, strError));
    }
    {
        std::unique_ptr<CTokenParams> params = CreateTokenParams(TokenVariant::REFLECTION);
        ArgsManager args;
        const char* argv[] = {"memetokend", "-supply=0"};
        BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
        BOOST_CHECK(!ApplyTokenArgs(args, *params, strError));
    }
}

BOOST_AUTO_TEST_SUITE_END()
