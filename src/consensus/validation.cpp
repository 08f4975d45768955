// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"

const char* TokenErrorString(TokenError error)
{
    switch (error) {
    case TokenError::NONE: return "None";
    case TokenError::INVALID_ADDRESS: return "InvalidAddress";
    case TokenError::BLACKLISTED: return "Blacklisted";
    case TokenError::TRADING_NOT_ENABLED: return "TradingNotEnabled";
    case TokenError::EXCEEDS_MAX_TRANSACTION: return "ExceedsMaxTransaction";
    case TokenError::EXCEEDS_MAX_WALLET: return "ExceedsMaxWallet";
    case TokenError::COOLDOWN_ACTIVE: return "CooldownActive";
    case TokenError::INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
    case TokenError::INSUFFICIENT_BALANCE: return "InsufficientBalance";
    case TokenError::INVALID_CONFIGURATION: return "InvalidConfiguration";
    case TokenError::ALREADY_ENABLED: return "AlreadyEnabled";
    case TokenError::UNAUTHORIZED: return "Unauthorized";
    case TokenError::PAUSED: return "Paused";
    case TokenError::REENTRANCY: return "Reentrancy";
    case TokenError::INTERNAL: return "Internal";
    }
    return "Unknown";
}
