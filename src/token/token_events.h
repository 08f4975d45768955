// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_EVENTS_H
#define MEMETOKEN_TOKEN_EVENTS_H

#include "address.h"
#include "amount.h"
#include "token/token_policy.h"

#include <string>
#include <vector>

class CTokenSignals;

/**
 * CTokenEventInterface - Listener for token notifications
 *
 * Notifications are fire-and-forget: they are delivered after the
 * operation committed and nothing they return is consumed. Override the
 * ones of interest.
 */
class CTokenEventInterface
{
protected:
    virtual void FeatureToggled(const std::string& strName, bool fEnabled) {}
    virtual void FeesUpdated(const TokenFeeSchedule& oldFees, const TokenFeeSchedule& newFees) {}
    virtual void LimitsUpdated(const TokenLimits& oldLimits, const TokenLimits& newLimits) {}
    virtual void AddressBlacklisted(const CTokenAddress& address, bool fBlacklisted) {}
    virtual void FeeExclusionUpdated(const CTokenAddress& address, bool fExcluded) {}
    virtual void TradingEnabled(int64_t nLaunchedAt) {}
    virtual void TokensBurned(const CTokenAddress& from, const TokenAmount& amount) {}
    virtual void TransferExecuted(const CTokenAddress& from, const CTokenAddress& to,
                                  const TokenAmount& netAmount, const TokenAmount& feeAmount) {}
    virtual void PauseChanged(const CTokenAddress& caller, bool fPaused) {}
    friend class CTokenSignals;

public:
    virtual ~CTokenEventInterface() {}
};

/** Fan-out of token notifications to every registered listener */
class CTokenSignals
{
private:
    std::vector<CTokenEventInterface*> m_listeners;

public:
    void Register(CTokenEventInterface* listener);
    void Unregister(CTokenEventInterface* listener);
    void UnregisterAll();
    size_t Size() const { return m_listeners.size(); }

    void FeatureToggled(const std::string& strName, bool fEnabled);
    void FeesUpdated(const TokenFeeSchedule& oldFees, const TokenFeeSchedule& newFees);
    void LimitsUpdated(const TokenLimits& oldLimits, const TokenLimits& newLimits);
    void AddressBlacklisted(const CTokenAddress& address, bool fBlacklisted);
    void FeeExclusionUpdated(const CTokenAddress& address, bool fExcluded);
    void TradingEnabled(int64_t nLaunchedAt);
    void TokensBurned(const CTokenAddress& from, const TokenAmount& amount);
    void TransferExecuted(const CTokenAddress& from, const CTokenAddress& to,
                          const TokenAmount& netAmount, const TokenAmount& feeAmount);
    void PauseChanged(const CTokenAddress& caller, bool fPaused);
};

/** Writes every notification to the debug log under the token category */
class CLoggingTokenEvents : public CTokenEventInterface
{
protected:
    void FeatureToggled(const std::string& strName, bool fEnabled) override;
    void FeesUpdated(const TokenFeeSchedule& oldFees, const TokenFeeSchedule& newFees) override;
    void LimitsUpdated(const TokenLimits& oldLimits, const TokenLimits& newLimits) override;
    void AddressBlacklisted(const CTokenAddress& address, bool fBlacklisted) override;
    void FeeExclusionUpdated(const CTokenAddress& address, bool fExcluded) override;
    void TradingEnabled(int64_t nLaunchedAt) override;
    void TokensBurned(const CTokenAddress& from, const TokenAmount& amount) override;
    void TransferExecuted(const CTokenAddress& from, const CTokenAddress& to,
                          const TokenAmount& netAmount, const TokenAmount& feeAmount) override;
    void PauseChanged(const CTokenAddress& caller, bool fPaused) override;
};

#endif // MEMETOKEN_TOKEN_EVENTS_H
