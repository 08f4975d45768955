// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_fees.h"

#include "consensus/validation.h"
#include "logging.h"
#include "token/token_policy.h"

namespace token_fees {

std::string TokenFeeBreakdown::ToString() const
{
    return strprintf("TokenFeeBreakdown(total=%s, reflection=%s, liquidity=%s, marketing=%s, burn=%s, base=%u%%, rate=%u%%, exempt=%d, whale=%d)",
                     nTotalFee.str(), nReflection.str(), nLiquidity.str(), nMarketing.str(), nBurn.str(),
                     nBaseRatePercent, nRatePercent, fExempt, fWhaleSurcharge);
}

bool IsWhaleTransfer(const TokenLimits& limits, const TokenAmount& amount)
{
    const TokenAmountWide threshold =
        TokenAmountWide(limits.nMaxTransactionAmount) * WHALE_THRESHOLD_PERCENT / 100;
    return TokenAmountWide(amount) > threshold;
}

// component share of the total fee, truncating
static TokenAmount ComponentShare(const TokenAmount& nTotalFee, uint32_t nPercent, uint32_t nBasePercent)
{
    if (nPercent == 0) {
        return 0;
    }
    const TokenAmountWide share = TokenAmountWide(nTotalFee) * nPercent / nBasePercent;
    return static_cast<TokenAmount>(share);
}

bool CalculateTransferFee(const CTokenPolicy& policy,
                          const CTokenAddress& from,
                          const CTokenAddress& to,
                          const TokenAmount& amount,
                          TokenFeeBreakdown& fees,
                          CValidationState& state)
{
    fees.SetNull();

    // 1. Exemption short-circuit
    if (policy.IsExcludedFromFees(from) || policy.IsExcludedFromFees(to)) {
        fees.fExempt = true;
        return true;
    }

    // 2. Enabled components
    const TokenFeatureSet& features = policy.GetFeatures();
    const TokenFeeSchedule& schedule = policy.GetFees();

    const uint32_t nReflectionPct = features.fReflection ? schedule.nReflection : 0;
    const uint32_t nLiquidityPct = features.fAutoLiquidity ? schedule.nLiquidity : 0;
    const uint32_t nMarketingPct = schedule.nMarketing;
    const uint32_t nBurnPct = features.fAutoBurn ? schedule.nBurn : 0;

    const uint64_t nBase = (uint64_t)nReflectionPct + nLiquidityPct + nMarketingPct + nBurnPct;

    // 3. Nothing to collect
    if (nBase == 0) {
        return true;
    }

    // 4. Whale surcharge
    uint64_t nRate = nBase;
    if (features.fAntiWhale && IsWhaleTransfer(policy.GetLimits(), amount)) {
        nRate += WHALE_SURCHARGE_PERCENT;
        fees.fWhaleSurcharge = true;
    }

    if (nRate > 100) {
        return state.Invalid(TokenError::INVALID_CONFIGURATION, "token-fee-rate-overflow",
                             strprintf("effective fee rate %u%% exceeds the transfer amount", nRate));
    }

    fees.nBaseRatePercent = static_cast<uint32_t>(nBase);
    fees.nRatePercent = static_cast<uint32_t>(nRate);

    // 5. Total fee, truncating; rate <= 100 so the result fits in 256 bits
    fees.nTotalFee = static_cast<TokenAmount>(TokenAmountWide(amount) * nRate / 100);

    // 6. Proportional sub-allocation
    fees.nReflection = ComponentShare(fees.nTotalFee, nReflectionPct, fees.nBaseRatePercent);
    fees.nLiquidity = ComponentShare(fees.nTotalFee, nLiquidityPct, fees.nBaseRatePercent);
    fees.nMarketing = ComponentShare(fees.nTotalFee, nMarketingPct, fees.nBaseRatePercent);
    fees.nBurn = ComponentShare(fees.nTotalFee, nBurnPct, fees.nBaseRatePercent);

    LogPrint(BCLog::TOKEN, "CalculateTransferFee: %s -> %s amount=%s %s\n",
             from.ToString(), to.ToString(), amount.str(), fees.ToString());

    return true;
}

} // namespace token_fees
