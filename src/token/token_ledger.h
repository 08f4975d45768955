// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_LEDGER_H
#define MEMETOKEN_TOKEN_LEDGER_H

#include "address.h"
#include "amount.h"

#include <map>
#include <utility>

class CValidationState;

typedef std::map<CTokenAddress, TokenAmount> TokenBalanceMap;
typedef std::pair<CTokenAddress, CTokenAddress> TokenAllowanceKey; // (owner, spender)
typedef std::map<TokenAllowanceKey, TokenAmount> TokenAllowanceMap;

/**
 * CTokenLedgerView - Account table of the token
 *
 * Owns balances, total supply and allowances. The transfer orchestrator
 * only depends on this interface; CTokenLedger is the in-memory backing
 * store and CTokenLedgerViewCache stages writes on top of any view so that
 * a multi-leg transfer commits or rolls back as a unit.
 */
class CTokenLedgerView
{
public:
    virtual ~CTokenLedgerView() {}

    virtual TokenAmount BalanceOf(const CTokenAddress& address) const = 0;
    virtual TokenAmount TotalSupply() const = 0;
    virtual TokenAmount Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const = 0;

    /**
     * DebitCredit - Move amount from one account to another
     *
     * Atomic: fails with InsufficientBalance and changes nothing when
     * balance[from] < amount.
     */
    virtual bool DebitCredit(const CTokenAddress& from, const CTokenAddress& to,
                             const TokenAmount& amount, CValidationState& state) = 0;

    virtual bool Approve(const CTokenAddress& owner, const CTokenAddress& spender,
                         const TokenAmount& amount, CValidationState& state) = 0;

    /** Fails with InsufficientAllowance when the allowance is below amount */
    virtual bool DecreaseAllowance(const CTokenAddress& owner, const CTokenAddress& spender,
                                   const TokenAmount& amount, CValidationState& state) = 0;

    /** Sum of every balance, for the conservation check */
    virtual TokenAmountWide SumBalances() const = 0;

    /** Apply staged balances and allowances. Views that cannot be written return false. */
    virtual bool BatchWrite(const TokenBalanceMap& balances, const TokenAllowanceMap& allowances);

    /** sum(balances) == totalSupply */
    bool CheckConservation() const;
};

/**
 * CTokenLedger - In-memory account table
 *
 * The whole supply is minted to a single holder at construction. Accounts
 * appear on their first credit and are never deleted.
 */
class CTokenLedger : public CTokenLedgerView
{
private:
    TokenBalanceMap mapBalances;
    TokenAllowanceMap mapAllowances;
    TokenAmount nTotalSupply;

public:
    CTokenLedger(const CTokenAddress& holder, const TokenAmount& nSupply);

    TokenAmount BalanceOf(const CTokenAddress& address) const override;
    TokenAmount TotalSupply() const override;
    TokenAmount Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const override;
    bool DebitCredit(const CTokenAddress& from, const CTokenAddress& to,
                     const TokenAmount& amount, CValidationState& state) override;
    bool Approve(const CTokenAddress& owner, const CTokenAddress& spender,
                 const TokenAmount& amount, CValidationState& state) override;
    bool DecreaseAllowance(const CTokenAddress& owner, const CTokenAddress& spender,
                           const TokenAmount& amount, CValidationState& state) override;
    TokenAmountWide SumBalances() const override;
    bool BatchWrite(const TokenBalanceMap& balances, const TokenAllowanceMap& allowances) override;

    size_t GetAccountCount() const { return mapBalances.size(); }
};

/**
 * CTokenLedgerViewCache - Write overlay on top of another ledger view
 *
 * Reads fall through to the base view until an entry is touched. Flush()
 * pushes every staged entry to the base in one BatchWrite; dropping the
 * cache without flushing discards all staged changes.
 */
class CTokenLedgerViewCache : public CTokenLedgerView
{
private:
    CTokenLedgerView* base;
    TokenBalanceMap cacheBalances;
    TokenAllowanceMap cacheAllowances;

    CTokenLedgerViewCache(const CTokenLedgerViewCache&);
    void operator=(const CTokenLedgerViewCache&);

public:
    explicit CTokenLedgerViewCache(CTokenLedgerView* baseIn);

    TokenAmount BalanceOf(const CTokenAddress& address) const override;
    TokenAmount TotalSupply() const override;
    TokenAmount Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const override;
    bool DebitCredit(const CTokenAddress& from, const CTokenAddress& to,
                     const TokenAmount& amount, CValidationState& state) override;
    bool Approve(const CTokenAddress& owner, const CTokenAddress& spender,
                 const TokenAmount& amount, CValidationState& state) override;
    bool DecreaseAllowance(const CTokenAddress& owner, const CTokenAddress& spender,
                           const TokenAmount& amount, CValidationState& state) override;
    TokenAmountWide SumBalances() const override;
    bool BatchWrite(const TokenBalanceMap& balances, const TokenAllowanceMap& allowances) override;

    /**
     * Conservation of the staged entries alone: their values must sum to
     * what the base view holds for the same accounts.
     */
    bool CheckStagedConservation() const;

    /** Push staged changes to the base view and clear the cache */
    bool Flush();

    size_t GetCacheSize() const { return cacheBalances.size() + cacheAllowances.size(); }
};

#endif // MEMETOKEN_TOKEN_LEDGER_H
