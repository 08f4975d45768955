// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_GUARD_H
#define MEMETOKEN_TOKEN_GUARD_H

#include "address.h"
#include "amount.h"

#include <map>
#include <stdint.h>

class CTokenLedgerView;
class CTokenPolicy;
class CValidationState;

/** Cooldown timestamps written by a transfer, applied only when it commits */
typedef std::map<CTokenAddress, int64_t> TradeTimeUpdates;

namespace token_guard {

/**
 * CheckTransfer - Validate a proposed transfer against the token policy
 *
 * Rules, evaluated strictly in order; the first failure aborts:
 * 1. sender and recipient non-null, sender is not the burn sink  -> InvalidAddress
 * 2. neither party blacklisted (when blacklist enforcement applies) -> Blacklisted
 * 3. trading enabled, or sender/recipient fee-excluded            -> TradingNotEnabled
 * 4. anti-whale: amount <= maxTx                                   -> ExceedsMaxTransaction
 *                recipientBalance + amount <= maxWallet            -> ExceedsMaxWallet
 * 5. cooldown, sender not excluded: nTime >= last + cooldown       -> CooldownActive
 *
 * On success of rule 5 the new trade time of the sender is written to
 * `updates`, never to the policy: the caller applies it together with the
 * ledger changes.
 *
 * @param[in]  policy  Current policy
 * @param[in]  view    Ledger view used for the recipient balance
 * @param[in]  nTime   Current time (seconds)
 * @param[out] updates Staged trade time writes
 * @param[out] state   Rejection reason
 * @return true if the transfer may proceed
 */
bool CheckTransfer(const CTokenPolicy& policy,
                   const CTokenLedgerView& view,
                   const CTokenAddress& from,
                   const CTokenAddress& to,
                   const TokenAmount& amount,
                   int64_t nTime,
                   TradeTimeUpdates& updates,
                   CValidationState& state);

} // namespace token_guard

#endif // MEMETOKEN_TOKEN_GUARD_H
