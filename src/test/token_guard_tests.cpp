// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "test/test_memetoken.h"
#include "token/token_guard.h"
#include "token/token_ledger.h"
#include "token/token_policy.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

namespace {

struct GuardSetup : public BasicTestingSetup {
    const CTokenAddress owner;
    const CTokenAddress alice;
    const CTokenAddress bob;
    CTokenPolicy policy;
    CTokenLedger ledger;

    GuardSetup() :
        owner(CTokenAddress::FromUint64(0x0001)),
        alice(CTokenAddress::FromUint64(0xa11ce)),
        bob(CTokenAddress::FromUint64(0xb0b)),
        policy(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD)),
        ledger(owner, 100000000)
    {
        policy.SetFeature(TokenFeature::ANTI_WHALE, true);
        policy.SetFeature(TokenFeature::COOLDOWN, true);
        policy.SetFeature(TokenFeature::BLACKLIST, true);
        policy.SetLimits(TokenLimits(1000000, 2000000, 1800));
        policy.SetFeeExcluded(owner, true);
        CValidationState state;
        policy.EnableTrading(TEST_START_TIME, state);
    }

    bool Check(const CTokenAddress& from, const CTokenAddress& to, const TokenAmount& amount,
               int64_t nTime, TradeTimeUpdates& updates, CValidationState& state)
    {
        return token_guard::CheckTransfer(policy, ledger, from, to, amount, nTime, updates, state);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(token_guard_tests, GuardSetup)

BOOST_AUTO_TEST_CASE(guard_accepts_and_stages_cooldown)
{
    TradeTimeUpdates updates;
    CValidationState state;
    BOOST_CHECK(Check(alice, bob, 1000, TEST_START_TIME, updates, state));
    BOOST_CHECK(state.IsValid());

    // Timestamp staged, registry untouched
    BOOST_CHECK_EQUAL(updates.size(), 1U);
    BOOST_CHECK_EQUAL(updates[alice], TEST_START_TIME);
    BOOST_CHECK_EQUAL(policy.GetLastTradeTime(alice), 0);
}

BOOST_AUTO_TEST_CASE(guard_null_and_burn_sink)
{
    TradeTimeUpdates updates;
    CValidationState state;

    BOOST_CHECK(!Check(CTokenAddress(), bob, 1, TEST_START_TIME, updates, state));
    BOOST_CHECK(state.GetError() == TokenError::INVALID_ADDRESS);

    CValidationState state2;
    BOOST_CHECK(!Check(alice, CTokenAddress(), 1, TEST_START_TIME, updates, state2));
    BOOST_CHECK(state2.GetError() == TokenError::INVALID_ADDRESS);

    CValidationState state3;
    BOOST_CHECK(!Check(BurnAddress(), bob, 1, TEST_START_TIME, updates, state3));
    BOOST_CHECK(state3.GetError() == TokenError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "token-burn-sink-debit");

    BOOST_CHECK(updates.empty());
}

BOOST_AUTO_TEST_CASE(guard_blacklist_precedence)
{
    CValidationState state;
    BOOST_REQUIRE(policy.SetBlacklisted(bob, true, state));

    // Blacklist wins over every later rule, even for an otherwise failing transfer
    SetMockTime(TEST_START_TIME);
    TradeTimeUpdates updates;
    CValidationState state2;
    BOOST_CHECK(!Check(alice, bob, 5000000, TEST_START_TIME, updates, state2));
    BOOST_CHECK(state2.GetError() == TokenError::BLACKLISTED);

    // Either side
    CValidationState state3;
    BOOST_CHECK(!Check(bob, alice, 1, TEST_START_TIME, updates, state3));
    BOOST_CHECK(state3.GetError() == TokenError::BLACKLISTED);

    // Exclusion does not bypass the blacklist
    policy.SetFeeExcluded(bob, true);
    CValidationState state4;
    BOOST_CHECK(!Check(owner, bob, 1, TEST_START_TIME, updates, state4));
    BOOST_CHECK(state4.GetError() == TokenError::BLACKLISTED);
    BOOST_CHECK(updates.empty());

    // Unblacklisted: passes again
    BOOST_REQUIRE(policy.SetBlacklisted(bob, false, state));
    CValidationState state5;
    BOOST_CHECK(Check(bob, alice, 1, TEST_START_TIME, updates, state5));
}

BOOST_AUTO_TEST_CASE(guard_blacklisted_excluded_sender)
{
    // Trading still closed, so only the exclusion could let bob through
    CTokenPolicy closed(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    closed.SetFeature(TokenFeature::BLACKLIST, true);
    closed.SetLimits(TokenLimits(1000000, 2000000, 1800));
    closed.SetFeeExcluded(bob, true);
    CValidationState state;
    BOOST_REQUIRE(closed.SetBlacklisted(bob, true, state));

    TradeTimeUpdates updates;
    CValidationState state2;
    BOOST_CHECK(!token_guard::CheckTransfer(closed, ledger, bob, alice, 1, TEST_START_TIME, updates, state2));
    BOOST_CHECK(state2.GetError() == TokenError::BLACKLISTED);
    BOOST_CHECK(updates.empty());

    BOOST_REQUIRE(closed.SetBlacklisted(bob, false, state));
    CValidationState state3;
    BOOST_CHECK(token_guard::CheckTransfer(closed, ledger, bob, alice, 1, TEST_START_TIME, updates, state3));
}

BOOST_AUTO_TEST_CASE(guard_blacklist_gated_by_feature)
{
    TokenPolicyOptions options = TokenPolicyOptions::ForVariant(TokenVariant::REFLECTION);
    BOOST_CHECK(options.fBlacklistGatedByFeature);
    CTokenPolicy gated(options);
    CValidationState state;
    gated.EnableTrading(TEST_START_TIME, state);
    BOOST_REQUIRE(gated.SetBlacklisted(bob, true, state));

    // Feature off: flag recorded but not enforced
    TradeTimeUpdates updates;
    BOOST_CHECK(token_guard::CheckTransfer(gated, ledger, alice, bob, 1, TEST_START_TIME, updates, state));

    gated.SetFeature(TokenFeature::BLACKLIST, true);
    CValidationState state2;
    BOOST_CHECK(!token_guard::CheckTransfer(gated, ledger, alice, bob, 1, TEST_START_TIME, updates, state2));
    BOOST_CHECK(state2.GetError() == TokenError::BLACKLISTED);
}

BOOST_AUTO_TEST_CASE(guard_trading_gate)
{
    CTokenPolicy closed(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    closed.SetFeeExcluded(owner, true);

    TradeTimeUpdates updates;
    CValidationState state;
    BOOST_CHECK(!token_guard::CheckTransfer(closed, ledger, alice, bob, 1, TEST_START_TIME, updates, state));
    BOOST_CHECK(state.GetError() == TokenError::TRADING_NOT_ENABLED);

    // Either party excluded lets it through
    CValidationState state2;
    BOOST_CHECK(token_guard::CheckTransfer(closed, ledger, owner, alice, 1, TEST_START_TIME, updates, state2));
    CValidationState state3;
    BOOST_CHECK(token_guard::CheckTransfer(closed, ledger, alice, owner, 1, TEST_START_TIME, updates, state3));
}

BOOST_AUTO_TEST_CASE(guard_anti_whale)
{
    TradeTimeUpdates updates;
    CValidationState state;

    BOOST_CHECK(Check(alice, bob, 1000000, TEST_START_TIME, updates, state));

    CValidationState state2;
    BOOST_CHECK(!Check(alice, bob, 1000001, TEST_START_TIME, updates, state2));
    BOOST_CHECK(state2.GetError() == TokenError::EXCEEDS_MAX_TRANSACTION);

    // Recipient at 1,500,000: 500,000 fits, 500,001 does not
    CValidationState stateFund;
    BOOST_REQUIRE(ledger.DebitCredit(owner, bob, 1500000, stateFund));
    CValidationState state3;
    TradeTimeUpdates updates2;
    BOOST_CHECK(Check(alice, bob, 500000, TEST_START_TIME, updates2, state3));
    CValidationState state4;
    TradeTimeUpdates updates3;
    BOOST_CHECK(!Check(alice, bob, 500001, TEST_START_TIME, updates3, state4));
    BOOST_CHECK(state4.GetError() == TokenError::EXCEEDS_MAX_WALLET);
    BOOST_CHECK(updates3.empty());

    // Caps apply to excluded senders as well
    CValidationState state5;
    BOOST_CHECK(!Check(owner, alice, 1000001, TEST_START_TIME, updates3, state5));
    BOOST_CHECK(state5.GetError() == TokenError::EXCEEDS_MAX_TRANSACTION);

    // Feature off: no caps
    policy.SetFeature(TokenFeature::ANTI_WHALE, false);
    CValidationState state6;
    BOOST_CHECK(Check(owner, bob, 5000000, TEST_START_TIME, updates3, state6));
}

BOOST_AUTO_TEST_CASE(guard_wallet_cap_no_overflow)
{
    policy.SetLimits(TokenLimits(MaxTokenAmount(), MaxTokenAmount(), 0));
    CValidationState stateFund;
    BOOST_REQUIRE(ledger.DebitCredit(owner, bob, 100, stateFund));

    // balance + amount exceeds 2^256 - 1 without wrapping to a small number
    TradeTimeUpdates updates;
    CValidationState state;
    BOOST_CHECK(!Check(alice, bob, MaxTokenAmount(), TEST_START_TIME, updates, state));
    BOOST_CHECK(state.GetError() == TokenError::EXCEEDS_MAX_WALLET);
}

BOOST_AUTO_TEST_CASE(guard_cooldown)
{
    policy.SetLastTradeTime(alice, TEST_START_TIME);

    TradeTimeUpdates updates;
    CValidationState state;
    BOOST_CHECK(!Check(alice, bob, 1, TEST_START_TIME + 1799, updates, state));
    BOOST_CHECK(state.GetError() == TokenError::COOLDOWN_ACTIVE);
    BOOST_CHECK(updates.empty());

    CValidationState state2;
    BOOST_CHECK(Check(alice, bob, 1, TEST_START_TIME + 1800, updates, state2));
    BOOST_CHECK_EQUAL(updates[alice], TEST_START_TIME + 1800);

    // A second check in the same batch sees the staged time
    CValidationState state3;
    BOOST_CHECK(!Check(alice, bob, 1, TEST_START_TIME + 1801, updates, state3));
    BOOST_CHECK(state3.GetError() == TokenError::COOLDOWN_ACTIVE);

    // Excluded senders are neither checked nor stamped
    TradeTimeUpdates updates2;
    CValidationState state4;
    BOOST_CHECK(Check(owner, bob, 1, TEST_START_TIME, updates2, state4));
    BOOST_CHECK(Check(owner, bob, 1, TEST_START_TIME, updates2, state4));
    BOOST_CHECK(updates2.empty());

    // Feature off: no cooldown, no stamp
    policy.SetFeature(TokenFeature::COOLDOWN, false);
    TradeTimeUpdates updates3;
    CValidationState state5;
    BOOST_CHECK(Check(alice, bob, 1, TEST_START_TIME + 1, updates3, state5));
    BOOST_CHECK(updates3.empty());
}

BOOST_AUTO_TEST_CASE(guard_rule_order)
{
    // Trading closed and over the cap: the trading gate reports first
    CTokenPolicy closed(TokenPolicyOptions::ForVariant(TokenVariant::STANDARD));
    closed.SetFeature(TokenFeature::ANTI_WHALE, true);
    closed.SetLimits(TokenLimits(10, 10, 0));
    TradeTimeUpdates updates;
    CValidationState state;
    BOOST_CHECK(!token_guard::CheckTransfer(closed, ledger, alice, bob, 100, TEST_START_TIME, updates, state));
    BOOST_CHECK(state.GetError() == TokenError::TRADING_NOT_ENABLED);

    // Over the cap and in cooldown: the cap reports first
    policy.SetLastTradeTime(alice, TEST_START_TIME);
    CValidationState state2;
    BOOST_CHECK(!Check(alice, bob, 1000001, TEST_START_TIME, updates, state2));
    BOOST_CHECK(state2.GetError() == TokenError::EXCEEDS_MAX_TRANSACTION);
}

BOOST_AUTO_TEST_SUITE_END()
