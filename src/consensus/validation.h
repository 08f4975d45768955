// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_CONSENSUS_VALIDATION_H
#define MEMETOKEN_CONSENSUS_VALIDATION_H

#include <string>

/**
 * TokenError - Reason a token operation was rejected
 *
 * Every rejection is terminal for the current operation and leaves token
 * state unchanged.
 */
enum class TokenError {
    NONE,
    INVALID_ADDRESS,
    BLACKLISTED,
    TRADING_NOT_ENABLED,
    EXCEEDS_MAX_TRANSACTION,
    EXCEEDS_MAX_WALLET,
    COOLDOWN_ACTIVE,
    INSUFFICIENT_ALLOWANCE,
    INSUFFICIENT_BALANCE,
    INVALID_CONFIGURATION,
    ALREADY_ENABLED,
    UNAUTHORIZED,
    PAUSED,
    REENTRANCY,
    INTERNAL, //!< ledger inconsistency or failed commit
};

/** Stable name of an error code ("Blacklisted", "CooldownActive", ...) */
const char* TokenErrorString(TokenError error);

/** Capture information about token operation validity */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< operation rejected by policy or ledger rules
        MODE_ERROR,   //!< run-time error
    } mode;
    TokenError m_error;
    std::string m_reject_reason;
    std::string m_debug_message;

public:
    CValidationState() : mode(MODE_VALID), m_error(TokenError::NONE) {}

    bool Invalid(TokenError error,
                 const std::string& reject_reason = "",
                 const std::string& debug_message = "")
    {
        m_error = error;
        m_reject_reason = reject_reason;
        m_debug_message = debug_message;
        if (mode == MODE_ERROR)
            return false;
        mode = MODE_INVALID;
        return false;
    }

    bool Error(const std::string& reject_reason)
    {
        if (mode == MODE_VALID) {
            m_error = TokenError::INTERNAL;
            m_reject_reason = reject_reason;
        }
        mode = MODE_ERROR;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }

    TokenError GetError() const { return m_error; }
    const std::string& GetRejectReason() const { return m_reject_reason; }
    const std::string& GetDebugMessage() const { return m_debug_message; }

    std::string ToString() const
    {
        if (IsValid()) return "valid";
        if (m_debug_message.empty()) return m_reject_reason;
        return m_reject_reason + ", " + m_debug_message;
    }
};

#endif // MEMETOKEN_CONSENSUS_VALIDATION_H
