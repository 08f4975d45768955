// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_guard.h"

#include "consensus/validation.h"
#include "logging.h"
#include "token/token_ledger.h"
#include "token/token_policy.h"

namespace token_guard {

static int64_t GetStagedTradeTime(const CTokenPolicy& policy, const TradeTimeUpdates& updates,
                                  const CTokenAddress& address)
{
    auto it = updates.find(address);
    return it != updates.end() ? it->second : policy.GetLastTradeTime(address);
}

bool CheckTransfer(const CTokenPolicy& policy,
                   const CTokenLedgerView& view,
                   const CTokenAddress& from,
                   const CTokenAddress& to,
                   const TokenAmount& amount,
                   int64_t nTime,
                   TradeTimeUpdates& updates,
                   CValidationState& state)
{
    // 1. Identities
    if (from.IsNull() || to.IsNull()) {
        return state.Invalid(TokenError::INVALID_ADDRESS, "token-null-address",
                             strprintf("from=%s to=%s", from.ToString(), to.ToString()));
    }
    if (from == BurnAddress()) {
        return state.Invalid(TokenError::INVALID_ADDRESS, "token-burn-sink-debit",
                             "burned tokens cannot be moved");
    }

    // 2. Blacklist
    if (policy.IsBlacklistEnforced() && (policy.IsBlacklisted(from) || policy.IsBlacklisted(to))) {
        return state.Invalid(TokenError::BLACKLISTED, "token-blacklisted",
                             strprintf("sender or recipient is blacklisted (from=%s to=%s)",
                                       from.ToString(), to.ToString()));
    }

    const bool fFromExcluded = policy.IsExcludedFromFees(from);
    const bool fToExcluded = policy.IsExcludedFromFees(to);

    // 3. Trading gate
    if (!policy.IsTradingEnabled() && !fFromExcluded && !fToExcluded) {
        return state.Invalid(TokenError::TRADING_NOT_ENABLED, "token-trading-not-enabled");
    }

    const TokenFeatureSet& features = policy.GetFeatures();
    const TokenLimits& limits = policy.GetLimits();

    // 4. Caps
    if (features.fAntiWhale) {
        if (amount > limits.nMaxTransactionAmount) {
            return state.Invalid(TokenError::EXCEEDS_MAX_TRANSACTION, "token-exceeds-max-transaction",
                                 strprintf("amount %s > max %s", amount.str(), limits.nMaxTransactionAmount.str()));
        }
        const TokenAmountWide newBalance = TokenAmountWide(view.BalanceOf(to)) + TokenAmountWide(amount);
        if (newBalance > TokenAmountWide(limits.nMaxWalletSize)) {
            return state.Invalid(TokenError::EXCEEDS_MAX_WALLET, "token-exceeds-max-wallet",
                                 strprintf("recipient balance would be %s > max %s", newBalance.str(), limits.nMaxWalletSize.str()));
        }
    }

    // 5. Cooldown
    if (features.fCooldown && !fFromExcluded) {
        const int64_t nLastTrade = GetStagedTradeTime(policy, updates, from);
        const int64_t nReady = nLastTrade + static_cast<int64_t>(limits.nCooldownTime);
        if (nTime < nReady) {
            return state.Invalid(TokenError::COOLDOWN_ACTIVE, "token-cooldown-active",
                                 strprintf("%s may trade again at %d (now %d)", from.ToString(), nReady, nTime));
        }
        updates[from] = nTime;
    }

    return true;
}

} // namespace token_guard
