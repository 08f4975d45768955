// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_REFLECTION_H
#define MEMETOKEN_TOKEN_REFLECTION_H

#include "address.h"
#include "amount.h"

class CTokenLedgerView;
class CValidationState;

/**
 * CReflectionDistributor - Redistribution of the reflection fee share
 *
 * Called by the transfer orchestrator with the staging view of the
 * transfer in progress. Implementations must conserve value: whatever they
 * credit is debited from `from` on the same view. A failure aborts the
 * whole transfer.
 */
class CReflectionDistributor
{
public:
    virtual ~CReflectionDistributor() {}

    virtual bool Distribute(CTokenLedgerView& view,
                            const CTokenAddress& from,
                            const TokenAmount& amount,
                            CValidationState& state) = 0;
};

/** Credits the whole reflection share to a single pool account */
class CPoolReflectionDistributor : public CReflectionDistributor
{
private:
    CTokenAddress m_pool;

public:
    explicit CPoolReflectionDistributor(const CTokenAddress& pool) : m_pool(pool) {}

    const CTokenAddress& GetPool() const { return m_pool; }

    bool Distribute(CTokenLedgerView& view,
                    const CTokenAddress& from,
                    const TokenAmount& amount,
                    CValidationState& state) override;
};

#endif // MEMETOKEN_TOKEN_REFLECTION_H
