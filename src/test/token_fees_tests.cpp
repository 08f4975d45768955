// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "test/test_memetoken.h"
#include "token/token_fees.h"
#include "token/token_policy.h"

#include <boost/test/unit_test.hpp>

using namespace token_fees;

namespace {

struct FeePolicySetup : public BasicTestingSetup {
    const CTokenAddress alice;
    const CTokenAddress bob;
    CTokenPolicy policy;

    FeePolicySetup() :
        alice(CTokenAddress::FromUint64(0xa11ce)),
        bob(CTokenAddress::FromUint64(0xb0b)),
        policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD))
    {
        policy.SetFeature(TokenFeature::ANTI_WHALE, true);
        policy.SetFeature(TokenFeature::AUTO_BURN, true);
        CValidationState state;
        policy.SetFees(TokenFeeSchedule(0, 2, 2, 1), state);
        policy.SetLimits(TokenLimits(1000000, 2000000, 1800));
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(token_fees_tests, FeePolicySetup)

BOOST_AUTO_TEST_CASE(fee_split_scenario)
{
    TokenFeeBreakdown fees;
    CValidationState state;
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 100000, fees, state));

    BOOST_CHECK_EQUAL(fees.nTotalFee, 5000);
    BOOST_CHECK_EQUAL(fees.nLiquidity, 2000);
    BOOST_CHECK_EQUAL(fees.nMarketing, 2000);
    BOOST_CHECK_EQUAL(fees.nBurn, 1000);
    BOOST_CHECK_EQUAL(fees.nReflection, 0);
    BOOST_CHECK_EQUAL(fees.nBaseRatePercent, 5U);
    BOOST_CHECK_EQUAL(fees.nRatePercent, 5U);
    BOOST_CHECK_EQUAL(fees.GetRoundingRemainder(), 0);
    BOOST_CHECK(!fees.fExempt);
    BOOST_CHECK(!fees.fWhaleSurcharge);
}

BOOST_AUTO_TEST_CASE(whale_boundary)
{
    BOOST_CHECK(!IsWhaleTransfer(policy.GetLimits(), 500000));
    BOOST_CHECK(IsWhaleTransfer(policy.GetLimits(), 500001));

    TokenFeeBreakdown fees;
    CValidationState state;

    // Exactly half of max tx: base rate
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 500000, fees, state));
    BOOST_CHECK(!fees.fWhaleSurcharge);
    BOOST_CHECK_EQUAL(fees.nRatePercent, 5U);
    BOOST_CHECK_EQUAL(fees.nTotalFee, 25000);

    // One above: flat +3 points
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 500001, fees, state));
    BOOST_CHECK(fees.fWhaleSurcharge);
    BOOST_CHECK_EQUAL(fees.nRatePercent, 8U);
    BOOST_CHECK_EQUAL(fees.nTotalFee, 40000);
    BOOST_CHECK_EQUAL(fees.nLiquidity, 16000);
    BOOST_CHECK_EQUAL(fees.nMarketing, 16000);
    BOOST_CHECK_EQUAL(fees.nBurn, 8000);

    // Anti-whale off: no surcharge
    policy.SetFeature(TokenFeature::ANTI_WHALE, false);
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 500001, fees, state));
    BOOST_CHECK(!fees.fWhaleSurcharge);
    BOOST_CHECK_EQUAL(fees.nRatePercent, 5U);
}

BOOST_AUTO_TEST_CASE(exemption_short_circuit)
{
    TokenFeeBreakdown fees;
    CValidationState state;

    policy.SetFeeExcluded(alice, true);
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 900000, fees, state));
    BOOST_CHECK(fees.fExempt);
    BOOST_CHECK_EQUAL(fees.nTotalFee, 0);
    BOOST_CHECK(!fees.fWhaleSurcharge);

    // Recipient side exemption counts too
    BOOST_CHECK(CalculateTransferFee(policy, bob, alice, 900000, fees, state));
    BOOST_CHECK(fees.fExempt);
    BOOST_CHECK_EQUAL(fees.nTotalFee, 0);
}

BOOST_AUTO_TEST_CASE(disabled_components)
{
    TokenFeeBreakdown fees;
    CValidationState state;

    // Auto-burn off drops the burn component from the base rate
    policy.SetFeature(TokenFeature::AUTO_BURN, false);
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 100000, fees, state));
    BOOST_CHECK_EQUAL(fees.nBaseRatePercent, 4U);
    BOOST_CHECK_EQUAL(fees.nTotalFee, 4000);
    BOOST_CHECK_EQUAL(fees.nBurn, 0);
    BOOST_CHECK_EQUAL(fees.nLiquidity, 2000);
    BOOST_CHECK_EQUAL(fees.nMarketing, 2000);
}

BOOST_AUTO_TEST_CASE(zero_schedule)
{
    CValidationState state;
    BOOST_REQUIRE(policy.SetFees(TokenFeeSchedule(0, 0, 0, 0), state));

    // No division by zero and no surcharge on a zero schedule
    TokenFeeBreakdown fees;
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 900000, fees, state));
    BOOST_CHECK_EQUAL(fees.nTotalFee, 0);
    BOOST_CHECK(!fees.fWhaleSurcharge);
}

BOOST_AUTO_TEST_CASE(rounding_remainder)
{
    CValidationState state;
    BOOST_REQUIRE(policy.SetFees(TokenFeeSchedule(0, 1, 1, 1), state));

    // 3% of 101 = 3; each third = 1, nothing lost
    TokenFeeBreakdown fees;
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 101, fees, state));
    BOOST_CHECK_EQUAL(fees.nTotalFee, 3);
    BOOST_CHECK_EQUAL(fees.GetCollected(), 3);

    // 3% of 234 = 7 split 2/2/2 leaves 1 with the sender
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 234, fees, state));
    BOOST_CHECK_EQUAL(fees.nTotalFee, 7);
    BOOST_CHECK_EQUAL(fees.GetCollected(), 6);
    BOOST_CHECK_EQUAL(fees.GetRoundingRemainder(), 1);

    // Tiny amounts truncate to zero
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, 33, fees, state));
    BOOST_CHECK_EQUAL(fees.nTotalFee, 0);
}

BOOST_AUTO_TEST_CASE(no_overflow_on_max_amount)
{
    policy.SetLimits(TokenLimits(MaxTokenAmount(), MaxTokenAmount(), 0));

    TokenFeeBreakdown fees;
    CValidationState state;
    BOOST_CHECK(CalculateTransferFee(policy, alice, bob, MaxTokenAmount(), fees, state));
    BOOST_CHECK(fees.nTotalFee < MaxTokenAmount());
    BOOST_CHECK(fees.nTotalFee > MaxTokenAmount() / 100 * 4);
    BOOST_CHECK(fees.GetCollected() <= fees.nTotalFee);
}

BOOST_AUTO_TEST_CASE(reflection_component)
{
    CTokenPolicy reflection(TokenPolicyOptions::ForVariant(TokenVariant::REFLECTION));
    reflection.SetFeature(TokenFeature::REFLECTION, true);
    reflection.SetFeature(TokenFeature::AUTO_LIQUIDITY, true);
    reflection.SetFeature(TokenFeature::AUTO_BURN, true);
    CValidationState state;
    BOOST_REQUIRE(reflection.SetFees(TokenFeeSchedule(1, 2, 2, 1), state));

    TokenFeeBreakdown fees;
    BOOST_CHECK(CalculateTransferFee(reflection, alice, bob, 100000, fees, state));
    BOOST_CHECK_EQUAL(fees.nTotalFee, 6000);
    BOOST_CHECK_EQUAL(fees.nReflection, 1000);
    BOOST_CHECK_EQUAL(fees.nLiquidity, 2000);
    BOOST_CHECK_EQUAL(fees.nMarketing, 2000);
    BOOST_CHECK_EQUAL(fees.nBurn, 1000);

    // Reflection and liquidity only count while their toggles are on
    reflection.SetFeature(TokenFeature::REFLECTION, false);
    reflection.SetFeature(TokenFeature::AUTO_LIQUIDITY, false);
    BOOST_CHECK(CalculateTransferFee(reflection, alice, bob, 100000, fees, state));
    BOOST_CHECK_EQUAL(fees.nBaseRatePercent, 3U);
    BOOST_CHECK_EQUAL(fees.nReflection, 0);
    BOOST_CHECK_EQUAL(fees.nLiquidity, 0);
}

BOOST_AUTO_TEST_SUITE_END()
