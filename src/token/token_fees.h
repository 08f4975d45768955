// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_FEES_H
#define MEMETOKEN_TOKEN_FEES_H

#include "address.h"
#include "amount.h"

#include <stdint.h>
#include <string>

class CTokenPolicy;
class CValidationState;
struct TokenLimits;

namespace token_fees {

// ============================================================================
// Constants
// ============================================================================

/**
 * Anti-whale surcharge: a transfer strictly above 50% of the max
 * transaction amount pays a flat 3 extra percentage points. There is a
 * single threshold, no tiers.
 */
static const uint32_t WHALE_THRESHOLD_PERCENT = 50;
static const uint32_t WHALE_SURCHARGE_PERCENT = 3;

/**
 * TokenFeeBreakdown - Result of one fee computation
 *
 * nTotalFee = amount * nRatePercent / 100 (truncating)
 * component = nTotalFee * componentPercent / nBaseRatePercent (truncating)
 *
 * The sub-allocation remainder (nTotalFee - GetCollected()) is never
 * collected and stays with the sender. It is below the number of enabled
 * components in base units.
 */
struct TokenFeeBreakdown
{
    TokenAmount nTotalFee;
    TokenAmount nReflection;
    TokenAmount nLiquidity;
    TokenAmount nMarketing;
    TokenAmount nBurn;

    uint32_t nBaseRatePercent; //!< sum of enabled components
    uint32_t nRatePercent;     //!< base rate plus surcharge
    bool fExempt;              //!< sender or recipient fee-excluded
    bool fWhaleSurcharge;

    TokenFeeBreakdown()
    {
        SetNull();
    }

    void SetNull()
    {
        nTotalFee = 0;
        nReflection = 0;
        nLiquidity = 0;
        nMarketing = 0;
        nBurn = 0;
        nBaseRatePercent = 0;
        nRatePercent = 0;
        fExempt = false;
        fWhaleSurcharge = false;
    }

    /** Sum of the legs that are actually routed */
    TokenAmount GetCollected() const
    {
        return nReflection + nLiquidity + nMarketing + nBurn;
    }

    /** Truncation loss left with the sender */
    TokenAmount GetRoundingRemainder() const
    {
        return nTotalFee - GetCollected();
    }

    std::string ToString() const;
};

/** amount > maxTransactionAmount * 50 / 100 */
bool IsWhaleTransfer(const TokenLimits& limits, const TokenAmount& amount);

/**
 * CalculateTransferFee - Compute the fee split of a proposed transfer
 *
 * Pure: reads policy only. Order:
 * 1. Sender or recipient fee-excluded -> zero fee, no surcharge
 * 2. base = sum of enabled components (reflection iff reflection on,
 *    liquidity iff auto-liquidity on, marketing always, burn iff auto-burn on)
 * 3. base == 0 -> zero fee (no division by zero)
 * 4. anti-whale on and IsWhaleTransfer -> rate = base + 3
 * 5. total = amount * rate / 100, computed in 512 bits
 * 6. each component = total * componentPercent / base
 *
 * @param[out] fees  Breakdown
 * @param[out] state InvalidConfiguration if the rate exceeds 100%
 * @return true on success
 */
bool CalculateTransferFee(const CTokenPolicy& policy,
                          const CTokenAddress& from,
                          const CTokenAddress& to,
                          const TokenAmount& amount,
                          TokenFeeBreakdown& fees,
                          CValidationState& state);

} // namespace token_fees

#endif // MEMETOKEN_TOKEN_FEES_H
