// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token.h"

#include "consensus/validation.h"
#include "logging.h"
#include "token/token_access.h"
#include "token/token_guard.h"
#include "token/token_ledger.h"
#include "token/token_reflection.h"
#include "utiltime.h"

#include <stdexcept>

namespace {

/** Holds the in-progress flag for the lifetime of one ExecuteTransfer */
class CTransferReentrancyGuard
{
private:
    bool& fFlag;

public:
    explicit CTransferReentrancyGuard(bool& fFlagIn) : fFlag(fFlagIn) { fFlag = true; }
    ~CTransferReentrancyGuard() { fFlag = false; }

    CTransferReentrancyGuard(const CTransferReentrancyGuard&) = delete;
    CTransferReentrancyGuard& operator=(const CTransferReentrancyGuard&) = delete;
};

static bool RouteFeeLeg(CTokenLedgerView& view, const CTokenAddress& from, const CTokenAddress& to,
                        const TokenAmount& amount, CValidationState& state)
{
    if (amount == 0) {
        return true;
    }
    return view.DebitCredit(from, to, amount, state);
}

} // namespace

CMemeToken::CMemeToken(const CTokenParams& params,
                       CTokenLedgerView& ledgerIn,
                       CAccessControl& accessIn,
                       CReflectionDistributor* distributor) :
    strName(params.strName),
    strSymbol(params.strSymbol),
    nDecimals(params.nDecimals),
    tokenAddress(params.tokenAddress),
    marketingWallet(params.marketingWallet),
    ledger(ledgerIn),
    access(accessIn),
    pdistributor(distributor),
    policy(params.options),
    fTransferInProgress(false)
{
    std::string strError;
    if (!params.Validate(strError)) {
        throw std::runtime_error(strprintf("CMemeToken: invalid token parameters: %s", strError));
    }

    if (pdistributor == nullptr) {
        pdefaultDistributor.reset(new CPoolReflectionDistributor(tokenAddress));
        pdistributor = pdefaultDistributor.get();
    }

    for (TokenFeature feature : {TokenFeature::REFLECTION, TokenFeature::ANTI_WHALE, TokenFeature::AUTO_LIQUIDITY,
                                 TokenFeature::COOLDOWN, TokenFeature::BLACKLIST, TokenFeature::AUTO_BURN}) {
        policy.SetFeature(feature, params.features.Get(feature));
    }

    CValidationState state;
    if (!policy.SetFees(params.fees, state)) {
        throw std::runtime_error(strprintf("CMemeToken: %s", state.ToString()));
    }
    policy.SetLimits(params.limits);

    policy.SetFeeExcluded(params.owner, true);
    policy.SetFeeExcluded(tokenAddress, true);
    policy.SetFeeExcluded(marketingWallet, true);

    LogPrintf("CMemeToken: %s (%s) variant=%s supply=%s owner=%s\n",
              strName, strSymbol, TokenVariantName(params.options.variant),
              FormatTokenAmount(ledger.TotalSupply(), nDecimals), params.owner.ToString());
}

CTokenAddress CMemeToken::GetOwner() const
{
    LOCK(cs_token);
    return access.GetOwner();
}

TokenVariant CMemeToken::GetVariant() const
{
    LOCK(cs_token);
    return policy.GetOptions().variant;
}

bool CMemeToken::CheckOwner(const CTokenAddress& caller, const char* strOperation, CValidationState& state) const
{
    AssertLockHeld(cs_token);
    if (!access.IsOwner(caller)) {
        LogPrint(BCLog::TOKEN, "CMemeToken::%s: rejected caller %s\n", strOperation, caller.ToString());
        return state.Invalid(TokenError::UNAUTHORIZED, "token-unauthorized",
                             strprintf("%s is owner only", strOperation));
    }
    return true;
}

bool CMemeToken::ExecuteTransfer(const CTokenAddress& from, const CTokenAddress& to,
                                 const TokenAmount& amount, const CTokenAddress* pspender,
                                 CValidationState& state)
{
    AssertLockHeld(cs_token);

    if (fTransferInProgress) {
        return state.Invalid(TokenError::REENTRANCY, "token-reentrancy",
                             "transfer already in progress");
    }

    token_fees::TokenFeeBreakdown fees;
    TokenAmount netAmount;
    {
        CTransferReentrancyGuard reentrancyGuard(fTransferInProgress);

        CTokenLedgerViewCache view(&ledger);
        TradeTimeUpdates tradeTimes;

        if (!token_guard::CheckTransfer(policy, view, from, to, amount, GetTime(), tradeTimes, state)) {
            return false;
        }
        if (!token_fees::CalculateTransferFee(policy, from, to, amount, fees, state)) {
            return false;
        }
        if (fees.nTotalFee > amount) {
            return state.Invalid(TokenError::INVALID_CONFIGURATION, "token-fee-exceeds-amount",
                                 strprintf("fee %s above amount %s", fees.nTotalFee.str(), amount.str()));
        }
        netAmount = amount - fees.nTotalFee;

        if (!view.DebitCredit(from, to, netAmount, state)) {
            return false;
        }
        if (fees.nReflection != 0 && !pdistributor->Distribute(view, from, fees.nReflection, state)) {
            return false;
        }
        if (!RouteFeeLeg(view, from, tokenAddress, fees.nLiquidity, state)) {
            return false;
        }
        if (!RouteFeeLeg(view, from, marketingWallet, fees.nMarketing, state)) {
            return false;
        }
        if (!RouteFeeLeg(view, from, BurnAddress(), fees.nBurn, state)) {
            return false;
        }

        if (pspender != nullptr && !view.DecreaseAllowance(from, *pspender, amount, state)) {
            return false;
        }

        if (!view.CheckStagedConservation()) {
            error("%s: conservation violated by transfer %s -> %s of %s",
                  __func__, from.ToString(), to.ToString(), amount.str());
            return state.Error("token-conservation-violated");
        }

        if (!view.Flush()) {
            return state.Error("token-ledger-flush-failed");
        }
        for (const auto& it : tradeTimes) {
            policy.SetLastTradeTime(it.first, it.second);
        }
    }

    LogPrint(BCLog::TOKEN, "CMemeToken::ExecuteTransfer: %s -> %s amount=%s net=%s %s\n",
             from.ToString(), to.ToString(), amount.str(), netAmount.str(), fees.ToString());

    signals.TransferExecuted(from, to, netAmount, fees.nTotalFee);
    if (fees.nBurn != 0) {
        signals.TokensBurned(from, fees.nBurn);
    }
    return true;
}

bool CMemeToken::Transfer(const CTokenAddress& caller, const CTokenAddress& to,
                          const TokenAmount& amount, CValidationState& state)
{
    LOCK(cs_token);
    if (access.IsPaused()) {
        return state.Invalid(TokenError::PAUSED, "token-paused");
    }
    if (!ExecuteTransfer(caller, to, amount, nullptr, state)) {
        LogPrint(BCLog::TOKEN, "CMemeToken::Transfer: %s -> %s rejected: %s\n",
                 caller.ToString(), to.ToString(), state.ToString());
        return false;
    }
    return true;
}

bool CMemeToken::TransferFrom(const CTokenAddress& caller, const CTokenAddress& from, const CTokenAddress& to,
                              const TokenAmount& amount, CValidationState& state)
{
    LOCK(cs_token);
    if (access.IsPaused()) {
        return state.Invalid(TokenError::PAUSED, "token-paused");
    }

    const TokenAmount allowance = ledger.Allowance(from, caller);
    if (allowance < amount) {
        return state.Invalid(TokenError::INSUFFICIENT_ALLOWANCE, "token-insufficient-allowance",
                             strprintf("allowance %s below %s", allowance.str(), amount.str()));
    }

    if (!ExecuteTransfer(from, to, amount, &caller, state)) {
        LogPrint(BCLog::TOKEN, "CMemeToken::TransferFrom: %s -> %s by %s rejected: %s\n",
                 from.ToString(), to.ToString(), caller.ToString(), state.ToString());
        return false;
    }
    return true;
}

bool CMemeToken::Approve(const CTokenAddress& caller, const CTokenAddress& spender,
                         const TokenAmount& amount, CValidationState& state)
{
    LOCK(cs_token);
    // Pause gates value movement only; allowances can still be set
    if (!ledger.Approve(caller, spender, amount, state)) {
        return false;
    }
    LogPrint(BCLog::TOKEN, "CMemeToken::Approve: %s allows %s %s\n",
             caller.ToString(), spender.ToString(), amount.str());
    return true;
}

bool CMemeToken::ToggleFeature(const CTokenAddress& caller, const std::string& strFeature, bool fEnabled,
                               CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "ToggleFeature", state)) {
        return false;
    }
    policy.SetFeature(TokenFeatureFromName(strFeature), fEnabled);
    signals.FeatureToggled(strFeature, fEnabled);
    return true;
}

bool CMemeToken::UpdateFees(const CTokenAddress& caller, const TokenFeeSchedule& fees, CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "UpdateFees", state)) {
        return false;
    }
    const TokenFeeSchedule oldFees = policy.GetFees();
    if (!policy.SetFees(fees, state)) {
        return false;
    }
    signals.FeesUpdated(oldFees, fees);
    return true;
}

bool CMemeToken::UpdateLimits(const CTokenAddress& caller, const TokenLimits& limits, CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "UpdateLimits", state)) {
        return false;
    }
    const TokenLimits oldLimits = policy.GetLimits();
    policy.SetLimits(limits);
    signals.LimitsUpdated(oldLimits, limits);
    return true;
}

bool CMemeToken::SetBlacklisted(const CTokenAddress& caller, const CTokenAddress& address, bool fBlacklisted,
                                CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "SetBlacklisted", state)) {
        return false;
    }
    if (!policy.SetBlacklisted(address, fBlacklisted, state)) {
        return false;
    }
    signals.AddressBlacklisted(address, fBlacklisted);
    return true;
}

bool CMemeToken::SetExcludedFromFees(const CTokenAddress& caller, const CTokenAddress& address, bool fExcluded,
                                     CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "SetExcludedFromFees", state)) {
        return false;
    }
    policy.SetFeeExcluded(address, fExcluded);
    signals.FeeExclusionUpdated(address, fExcluded);
    return true;
}

bool CMemeToken::EnableTrading(const CTokenAddress& caller, CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "EnableTrading", state)) {
        return false;
    }
    if (!policy.EnableTrading(GetTime(), state)) {
        return false;
    }
    signals.TradingEnabled(policy.GetTradingState().nLaunchedAt);
    return true;
}

bool CMemeToken::Pause(const CTokenAddress& caller, CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "Pause", state)) {
        return false;
    }
    access.SetPaused(true);
    signals.PauseChanged(caller, true);
    return true;
}

bool CMemeToken::Unpause(const CTokenAddress& caller, CValidationState& state)
{
    LOCK(cs_token);
    if (!CheckOwner(caller, "Unpause", state)) {
        return false;
    }
    access.SetPaused(false);
    signals.PauseChanged(caller, false);
    return true;
}

TokenFeatureSet CMemeToken::GetFeatures() const
{
    LOCK(cs_token);
    return policy.GetFeatures();
}

TokenFeeSchedule CMemeToken::GetFees() const
{
    LOCK(cs_token);
    return policy.GetFees();
}

TokenLimits CMemeToken::GetLimits() const
{
    LOCK(cs_token);
    return policy.GetLimits();
}

TokenTradingState CMemeToken::GetTradingState() const
{
    LOCK(cs_token);
    return policy.GetTradingState();
}

TokenPolicyOptions CMemeToken::GetPolicyOptions() const
{
    LOCK(cs_token);
    return policy.GetOptions();
}

std::vector<CTokenAddress> CMemeToken::GetBlacklist() const
{
    LOCK(cs_token);
    return policy.GetBlacklistHistory();
}

bool CMemeToken::IsBlacklisted(const CTokenAddress& address) const
{
    LOCK(cs_token);
    return policy.IsBlacklisted(address);
}

bool CMemeToken::IsExcludedFromFees(const CTokenAddress& address) const
{
    LOCK(cs_token);
    return policy.IsExcludedFromFees(address);
}

int64_t CMemeToken::GetLastTradeTime(const CTokenAddress& address) const
{
    LOCK(cs_token);
    return policy.GetLastTradeTime(address);
}

bool CMemeToken::IsPaused() const
{
    LOCK(cs_token);
    return access.IsPaused();
}

TokenAmount CMemeToken::BalanceOf(const CTokenAddress& address) const
{
    LOCK(cs_token);
    return ledger.BalanceOf(address);
}

TokenAmount CMemeToken::Allowance(const CTokenAddress& owner, const CTokenAddress& spender) const
{
    LOCK(cs_token);
    return ledger.Allowance(owner, spender);
}

TokenAmount CMemeToken::TotalSupply() const
{
    LOCK(cs_token);
    return ledger.TotalSupply();
}

TokenAmount CMemeToken::CirculatingSupply() const
{
    LOCK(cs_token);
    return ledger.TotalSupply() - ledger.BalanceOf(BurnAddress());
}

bool CMemeToken::PreviewTransferFee(const CTokenAddress& from, const CTokenAddress& to, const TokenAmount& amount,
                                    token_fees::TokenFeeBreakdown& fees, CValidationState& state) const
{
    LOCK(cs_token);
    return token_fees::CalculateTransferFee(policy, from, to, amount, fees, state);
}

bool CMemeToken::CheckInvariants() const
{
    LOCK(cs_token);
    if (!ledger.CheckConservation()) {
        return error("%s: ledger balances do not sum to total supply", __func__);
    }
    if (!policy.CheckInvariants()) {
        return error("%s: policy invariants violated (%s)", __func__, policy.GetFees().ToString());
    }
    return true;
}
