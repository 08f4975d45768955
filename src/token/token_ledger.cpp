// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_ledger.h"

#include "consensus/validation.h"
#include "logging.h"

bool CTokenLedgerView::BatchWrite(const TokenBalanceMap&, const TokenAllowanceMap&)
{
    return false;
}

bool CTokenLedgerView::CheckConservation() const
{
    const TokenAmountWide sum = SumBalances();
    const TokenAmountWide supply(TotalSupply());
    if (sum != supply) {
        LogPrintf("TOKEN CONSERVATION VIOLATION: sum(balances)=%s totalSupply=%s\n",
                  sum.str(), supply.str());
        return false;
    }
    return true;
}

static bool CheckDebit(const CTokenAddress& from, const TokenAmount& balance,
                       const TokenAmount& amount, CValidationState& state)
{
    if (balance < amount) {
        return state.Invalid(TokenError::INSUFFICIENT_BALANCE, "token-insufficient-balance",
                             strprintf("%s has %s, needs %s", from.ToString(), balance.str(), amount.str()));
    }
    return true;
}

static bool CheckCredit(const CTokenAddress& to, const TokenAmount& balance,
                        const TokenAmount& amount, CValidationState& state)
{
    if (MaxTokenAmount() - balance < amount) {
        return state.Error(strprintf("token-balance-overflow: %s", to.ToString()));
    }
    return true;
}

// ============================================================================
// CTokenLedger
// ============================================================================

CTokenLedger::CTokenLedger(const CTokenAddress& holder, const TokenAmount& nSupply) :
    nTotalSupply(nSupply)
{
    if (nSupply > 0) {
        mapBalances[holder] = nSupply;
    }
}

TokenAmount CTokenLedger::BalanceOf(const CTokenAddress& address) const
{
    auto it = mapBalances.find(address);
    return it == mapBalances.end() ? TokenAmount(0) : it->second;
}

TokenAmount CTokenLedger::TotalSupply() const
{
    return nTotalSupply;
}

TokenAmount CTokenLedger::Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const
{
    auto it = mapAllowances.find(std::make_pair(owner, spender));
    return it == mapAllowances.end() ? TokenAmount(0) : it->second;
}

bool CTokenLedger::DebitCredit(const CTokenAddress& from, const CTokenAddress& to,
                               const TokenAmount& amount, CValidationState& state)
{
    const TokenAmount fromBalance = BalanceOf(from);
    if (!CheckDebit(from, fromBalance, amount, state)) {
        return false;
    }
    if (from == to || amount == 0) {
        return true;
    }
    const TokenAmount toBalance = BalanceOf(to);
    if (!CheckCredit(to, toBalance, amount, state)) {
        return false;
    }

    mapBalances[from] = fromBalance - amount;
    mapBalances[to] = toBalance + amount;
    return true;
}

bool CTokenLedger::Approve(const CTokenAddress& owner, const CTokenAddress& spender,
                           const TokenAmount& amount, CValidationState& state)
{
    if (owner.IsNull() || spender.IsNull()) {
        return state.Invalid(TokenError::INVALID_ADDRESS, "token-approve-null-address");
    }
    mapAllowances[std::make_pair(owner, spender)] = amount;
    return true;
}

bool CTokenLedger::DecreaseAllowance(const CTokenAddress& owner, const CTokenAddress& spender,
                                     const TokenAmount& amount, CValidationState& state)
{
    const TokenAmount current = Allowance(owner, spender);
    if (current < amount) {
        return state.Invalid(TokenError::INSUFFICIENT_ALLOWANCE, "token-insufficient-allowance",
                             strprintf("allowance %s < %s", current.str(), amount.str()));
    }
    mapAllowances[std::make_pair(owner, spender)] = current - amount;
    return true;
}

TokenAmountWide CTokenLedger::SumBalances() const
{
    TokenAmountWide sum = 0;
    for (const auto& entry : mapBalances) {
        sum += TokenAmountWide(entry.second);
    }
    return sum;
}

bool CTokenLedger::BatchWrite(const TokenBalanceMap& balances, const TokenAllowanceMap& allowances)
{
    for (const auto& entry : balances) {
        mapBalances[entry.first] = entry.second;
    }
    for (const auto& entry : allowances) {
        mapAllowances[entry.first] = entry.second;
    }
    return true;
}

// ============================================================================
// CTokenLedgerViewCache
// ============================================================================

CTokenLedgerViewCache::CTokenLedgerViewCache(CTokenLedgerView* baseIn) : base(baseIn) {}

TokenAmount CTokenLedgerViewCache::BalanceOf(const CTokenAddress& address) const
{
    auto it = cacheBalances.find(address);
    if (it != cacheBalances.end()) {
        return it->second;
    }
    return base->BalanceOf(address);
}

TokenAmount CTokenLedgerViewCache::TotalSupply() const
{
    return base->TotalSupply();
}

TokenAmount CTokenLedgerViewCache::Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const
{
    auto it = cacheAllowances.find(std::make_pair(owner, spender));
    if (it != cacheAllowances.end()) {
        return it->second;
    }
    return base->Allowance(owner, spender);
}

bool CTokenLedgerViewCache::DebitCredit(const CTokenAddress& from, const CTokenAddress& to,
                                        const TokenAmount& amount, CValidationState& state)
{
    const TokenAmount fromBalance = BalanceOf(from);
    if (!CheckDebit(from, fromBalance, amount, state)) {
        return false;
    }
    if (from == to || amount == 0) {
        return true;
    }
    const TokenAmount toBalance = BalanceOf(to);
    if (!CheckCredit(to, toBalance, amount, state)) {
        return false;
    }

    cacheBalances[from] = fromBalance - amount;
    cacheBalances[to] = toBalance + amount;
    return true;
}

bool CTokenLedgerViewCache::Approve(const CTokenAddress& owner, const CTokenAddress& spender,
                                    const TokenAmount& amount, CValidationState& state)
{
    if (owner.IsNull() || spender.IsNull()) {
        return state.Invalid(TokenError::INVALID_ADDRESS, "token-approve-null-address");
    }
    cacheAllowances[std::make_pair(owner, spender)] = amount;
    return true;
}

bool CTokenLedgerViewCache::DecreaseAllowance(const CTokenAddress& owner, const CTokenAddress& spender,
                                              const TokenAmount& amount, CValidationState& state)
{
    const TokenAmount current = Allowance(owner, spender);
    if (current < amount) {
        return state.Invalid(TokenError::INSUFFICIENT_ALLOWANCE, "token-insufficient-allowance",
                             strprintf("allowance %s < %s", current.str(), amount.str()));
    }
    cacheAllowances[std::make_pair(owner, spender)] = current - amount;
    return true;
}

TokenAmountWide CTokenLedgerViewCache::SumBalances() const
{
    // base sum + staged values - base values of the staged accounts
    TokenAmountWide sum = base->SumBalances();
    TokenAmountWide replaced = 0;
    for (const auto& entry : cacheBalances) {
        sum += TokenAmountWide(entry.second);
        replaced += TokenAmountWide(base->BalanceOf(entry.first));
    }
    return sum - replaced;
}

bool CTokenLedgerViewCache::CheckStagedConservation() const
{
    TokenAmountWide staged = 0;
    TokenAmountWide replaced = 0;
    for (const auto& entry : cacheBalances) {
        staged += TokenAmountWide(entry.second);
        replaced += TokenAmountWide(base->BalanceOf(entry.first));
    }
    if (staged != replaced) {
        LogPrintf("TOKEN CONSERVATION VIOLATION: staged=%s replaced=%s over %u accounts\n",
                  staged.str(), replaced.str(), cacheBalances.size());
        return false;
    }
    return true;
}

bool CTokenLedgerViewCache::BatchWrite(const TokenBalanceMap& balances, const TokenAllowanceMap& allowances)
{
    for (const auto& entry : balances) {
        cacheBalances[entry.first] = entry.second;
    }
    for (const auto& entry : allowances) {
        cacheAllowances[entry.first] = entry.second;
    }
    return true;
}

bool CTokenLedgerViewCache::Flush()
{
    if (!base->BatchWrite(cacheBalances, cacheAllowances)) {
        return error("CTokenLedgerViewCache::Flush: base view rejected %u staged entries", GetCacheSize());
    }
    cacheBalances.clear();
    cacheAllowances.clear();
    return true;
}
