// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_reflection.h"

#include "consensus/validation.h"
#include "logging.h"
#include "token/token_ledger.h"

bool CPoolReflectionDistributor::Distribute(CTokenLedgerView& view,
                                            const CTokenAddress& from,
                                            const TokenAmount& amount,
                                            CValidationState& state)
{
    if (amount == 0) {
        return true;
    }
    if (!view.DebitCredit(from, m_pool, amount, state)) {
        return false;
    }
    LogPrint(BCLog::TOKEN, "CPoolReflectionDistributor: %s reflected to pool %s\n",
             amount.str(), m_pool.ToString());
    return true;
}
