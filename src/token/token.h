// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_TOKEN_H
#define MEMETOKEN_TOKEN_TOKEN_H

#include "address.h"
#include "amount.h"
#include "sync.h"
#include "token/token_events.h"
#include "token/token_fees.h"
#include "token/token_params.h"
#include "token/token_policy.h"

#include <memory>
#include <string>
#include <vector>

class CAccessControl;
class CReflectionDistributor;
class CTokenLedgerView;
class CValidationState;

/**
 * CMemeToken - Policy-enforcing fungible token
 *
 * Composes Guard -> Fee Calculator -> Ledger into one atomic transfer:
 *
 *   Transfer / TransferFrom
 *     -> pause gate
 *     -> ExecuteTransfer (non-reentrant)
 *          -> token_guard::CheckTransfer        (no effects, cooldown staged)
 *          -> token_fees::CalculateTransferFee  (pure)
 *          -> CTokenLedgerViewCache              (net leg + fee legs staged)
 *          -> conservation check, flush, apply staged cooldown
 *     -> notifications
 *
 * INVARIANTS (after every operation):
 * - sum(balances) == totalSupply
 * - fee schedule total <= 25
 * - a failed operation leaves ledger and policy untouched
 *
 * The ledger, access gate and reflection distributor are injected and
 * must outlive the token.
 */
class CMemeToken
{
private:
    mutable RecursiveMutex cs_token;

    const std::string strName;
    const std::string strSymbol;
    const unsigned int nDecimals;
    const CTokenAddress tokenAddress;
    const CTokenAddress marketingWallet;

    CTokenLedgerView& ledger;
    CAccessControl& access;
    CReflectionDistributor* pdistributor;
    std::unique_ptr<CReflectionDistributor> pdefaultDistributor;

    CTokenPolicy policy;
    CTokenSignals signals;

    //! Set while ExecuteTransfer runs; a nested transfer is rejected
    bool fTransferInProgress;

    bool CheckOwner(const CTokenAddress& caller, const char* strOperation, CValidationState& state) const;

    /**
     * Guard, fees, staged ledger legs, commit. cs_token must be held.
     * A non-null pspender has its allowance from `from` spent in the same commit.
     */
    bool ExecuteTransfer(const CTokenAddress& from, const CTokenAddress& to,
                         const TokenAmount& amount, const CTokenAddress* pspender,
                         CValidationState& state);

public:
    /**
     * @param params       Genesis configuration (must Validate)
     * @param ledgerIn     Account table already holding the supply
     * @param accessIn     Owner predicate and pause gate
     * @param distributor  Reflection step; nullptr credits the token address
     * @throws std::runtime_error on invalid params
     */
    CMemeToken(const CTokenParams& params,
               CTokenLedgerView& ledgerIn,
               CAccessControl& accessIn,
               CReflectionDistributor* distributor = nullptr);

    CMemeToken(const CMemeToken&) = delete;
    CMemeToken& operator=(const CMemeToken&) = delete;

    const std::string& GetName() const { return strName; }
    const std::string& GetSymbol() const { return strSymbol; }
    unsigned int GetDecimals() const { return nDecimals; }
    const CTokenAddress& GetTokenAddress() const { return tokenAddress; }
    const CTokenAddress& GetMarketingWallet() const { return marketingWallet; }
    CTokenAddress GetOwner() const;
    TokenVariant GetVariant() const;

    /** Listener registration. Listeners must outlive the token or unregister. */
    CTokenSignals& GetSignals() { return signals; }

    // ------------------------------------------------------------------------
    // Transfer entry points
    // ------------------------------------------------------------------------

    bool Transfer(const CTokenAddress& caller, const CTokenAddress& to,
                  const TokenAmount& amount, CValidationState& state);

    /** Spends allowance(from, caller) by the full amount after the transfer succeeds */
    bool TransferFrom(const CTokenAddress& caller, const CTokenAddress& from, const CTokenAddress& to,
                      const TokenAmount& amount, CValidationState& state);

    bool Approve(const CTokenAddress& caller, const CTokenAddress& spender,
                 const TokenAmount& amount, CValidationState& state);

    // ------------------------------------------------------------------------
    // Administrative surface (owner only)
    // ------------------------------------------------------------------------

    /** Unknown names are accepted and ignored; the notification is sent either way */
    bool ToggleFeature(const CTokenAddress& caller, const std::string& strName, bool fEnabled, CValidationState& state);
    bool UpdateFees(const CTokenAddress& caller, const TokenFeeSchedule& fees, CValidationState& state);
    bool UpdateLimits(const CTokenAddress& caller, const TokenLimits& limits, CValidationState& state);
    bool SetBlacklisted(const CTokenAddress& caller, const CTokenAddress& address, bool fBlacklisted, CValidationState& state);
    bool SetExcludedFromFees(const CTokenAddress& caller, const CTokenAddress& address, bool fExcluded, CValidationState& state);
    bool EnableTrading(const CTokenAddress& caller, CValidationState& state);
    bool Pause(const CTokenAddress& caller, CValidationState& state);
    bool Unpause(const CTokenAddress& caller, CValidationState& state);

    // ------------------------------------------------------------------------
    // Query surface
    // ------------------------------------------------------------------------

    TokenFeatureSet GetFeatures() const;
    TokenFeeSchedule GetFees() const;
    TokenLimits GetLimits() const;
    TokenTradingState GetTradingState() const;
    TokenPolicyOptions GetPolicyOptions() const;
    std::vector<CTokenAddress> GetBlacklist() const;
    bool IsBlacklisted(const CTokenAddress& address) const;
    bool IsExcludedFromFees(const CTokenAddress& address) const;
    int64_t GetLastTradeTime(const CTokenAddress& address) const;
    bool IsPaused() const;

    TokenAmount BalanceOf(const CTokenAddress& address) const;
    TokenAmount Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const;
    TokenAmount TotalSupply() const;
    /** Total supply minus the burn sink balance */
    TokenAmount CirculatingSupply() const;

    /** Dry run of the fee calculator for a transfer from -> to */
    bool PreviewTransferFee(const CTokenAddress& from, const CTokenAddress& to, const TokenAmount& amount,
                            token_fees::TokenFeeBreakdown& fees, CValidationState& state) const;

    /** Conservation and policy invariants */
    bool CheckInvariants() const;
};

#endif // MEMETOKEN_TOKEN_TOKEN_H
