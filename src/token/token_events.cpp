// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_events.h"

#include "logging.h"

#include <algorithm>

void CTokenSignals::Register(CTokenEventInterface* listener)
{
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
        m_listeners.push_back(listener);
    }
}

void CTokenSignals::Unregister(CTokenEventInterface* listener)
{
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener), m_listeners.end());
}

void CTokenSignals::UnregisterAll()
{
    m_listeners.clear();
}

void CTokenSignals::FeatureToggled(const std::string& strName, bool fEnabled)
{
    for (CTokenEventInterface* listener : m_listeners) listener->FeatureToggled(strName, fEnabled);
}

void CTokenSignals::FeesUpdated(const TokenFeeSchedule& oldFees, const TokenFeeSchedule& newFees)
{
    for (CTokenEventInterface* listener : m_listeners) listener->FeesUpdated(oldFees, newFees);
}

void CTokenSignals::LimitsUpdated(const TokenLimits& oldLimits, const TokenLimits& newLimits)
{
    for (CTokenEventInterface* listener : m_listeners) listener->LimitsUpdated(oldLimits, newLimits);
}

void CTokenSignals::AddressBlacklisted(const CTokenAddress& address, bool fBlacklisted)
{
    for (CTokenEventInterface* listener : m_listeners) listener->AddressBlacklisted(address, fBlacklisted);
}

void CTokenSignals::FeeExclusionUpdated(const CTokenAddress& address, bool fExcluded)
{
    for (CTokenEventInterface* listener : m_listeners) listener->FeeExclusionUpdated(address, fExcluded);
}

void CTokenSignals::TradingEnabled(int64_t nLaunchedAt)
{
    for (CTokenEventInterface* listener : m_listeners) listener->TradingEnabled(nLaunchedAt);
}

void CTokenSignals::TokensBurned(const CTokenAddress& from, const TokenAmount& amount)
{
    for (CTokenEventInterface* listener : m_listeners) listener->TokensBurned(from, amount);
}

void CTokenSignals::TransferExecuted(const CTokenAddress& from, const CTokenAddress& to,
                                     const TokenAmount& netAmount, const TokenAmount& feeAmount)
{
    for (CTokenEventInterface* listener : m_listeners) listener->TransferExecuted(from, to, netAmount, feeAmount);
}

void CTokenSignals::PauseChanged(const CTokenAddress& caller, bool fPaused)
{
    for (CTokenEventInterface* listener : m_listeners) listener->PauseChanged(caller, fPaused);
}

// ============================================================================
// CLoggingTokenEvents
// ============================================================================

void CLoggingTokenEvents::FeatureToggled(const std::string& strName, bool fEnabled)
{
    LogPrint(BCLog::TOKEN, "FeatureToggled: %s=%d\n", strName, fEnabled);
}

void CLoggingTokenEvents::FeesUpdated(const TokenFeeSchedule& oldFees, const TokenFeeSchedule& newFees)
{
    LogPrint(BCLog::TOKEN, "FeesUpdated: %s -> %s\n", oldFees.ToString(), newFees.ToString());
}

void CLoggingTokenEvents::LimitsUpdated(const TokenLimits& oldLimits, const TokenLimits& newLimits)
{
    LogPrint(BCLog::TOKEN, "LimitsUpdated: %s -> %s\n", oldLimits.ToString(), newLimits.ToString());
}

void CLoggingTokenEvents::AddressBlacklisted(const CTokenAddress& address, bool fBlacklisted)
{
    LogPrint(BCLog::TOKEN, "AddressBlacklisted: %s=%d\n", address.ToString(), fBlacklisted);
}

void CLoggingTokenEvents::FeeExclusionUpdated(const CTokenAddress& address, bool fExcluded)
{
    LogPrint(BCLog::TOKEN, "FeeExclusionUpdated: %s=%d\n", address.ToString(), fExcluded);
}

void CLoggingTokenEvents::TradingEnabled(int64_t nLaunchedAt)
{
    LogPrint(BCLog::TOKEN, "TradingEnabled: launchedAt=%d\n", nLaunchedAt);
}

void CLoggingTokenEvents::TokensBurned(const CTokenAddress& from, const TokenAmount& amount)
{
    LogPrint(BCLog::TOKEN, "TokensBurned: from=%s amount=%s\n", from.ToString(), amount.str());
}

void CLoggingTokenEvents::TransferExecuted(const CTokenAddress& from, const CTokenAddress& to,
                                           const TokenAmount& netAmount, const TokenAmount& feeAmount)
{
    LogPrint(BCLog::TOKEN, "TransferExecuted: %s -> %s net=%s fee=%s\n",
             from.ToString(), to.ToString(), netAmount.str(), feeAmount.str());
}

void CLoggingTokenEvents::PauseChanged(const CTokenAddress& caller, bool fPaused)
{
    LogPrint(BCLog::TOKEN, "PauseChanged: paused=%d by %s\n", fPaused, caller.ToString());
}
