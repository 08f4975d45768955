// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"

// 10^77 < 2^256 < 10^78
static const size_t MAX_AMOUNT_DIGITS = 78;

TokenAmount TokenUnits(uint64_t nWhole, unsigned int nDecimals)
{
    TokenAmountWide result = nWhole;
    for (unsigned int i = 0; i < nDecimals; ++i) {
        result *= 10;
    }
    if (result > TokenAmountWide(MaxTokenAmount())) {
        return MaxTokenAmount();
    }
    return static_cast<TokenAmount>(result);
}

bool ParseTokenAmount(const std::string& str, unsigned int nDecimals, TokenAmount& nAmountOut)
{
    if (str.empty()) {
        return false;
    }

    std::string strWhole = str;
    std::string strFraction;
    const size_t nPoint = str.find('.');
    if (nPoint != std::string::npos) {
        strWhole = str.substr(0, nPoint);
        strFraction = str.substr(nPoint + 1);
        if (strFraction.empty() || strFraction.size() > nDecimals) {
            return false;
        }
    }
    if (strWhole.empty() || strWhole.size() > MAX_AMOUNT_DIGITS) {
        return false;
    }

    TokenAmountWide value = 0;
    for (const char c : strWhole) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    for (unsigned int i = 0; i < nDecimals; ++i) {
        value *= 10;
        if (i < strFraction.size()) {
            const char c = strFraction[i];
            if (c < '0' || c > '9') {
                return false;
            }
            value += (c - '0');
        }
    }

    if (value > TokenAmountWide(MaxTokenAmount())) {
        return false;
    }
    nAmountOut = static_cast<TokenAmount>(value);
    return true;
}

std::string FormatTokenAmount(const TokenAmount& nAmount, unsigned int nDecimals)
{
    std::string digits = nAmount.str();
    if (nDecimals == 0) {
        return digits;
    }
    if (digits.size() <= nDecimals) {
        digits.insert(0, nDecimals - digits.size() + 1, '0');
    }

    std::string strWhole = digits.substr(0, digits.size() - nDecimals);
    std::string strFraction = digits.substr(digits.size() - nDecimals);
    const size_t nLast = strFraction.find_last_not_of('0');
    if (nLast == std::string::npos) {
        return strWhole;
    }
    strFraction.erase(nLast + 1);
    return strWhole + "." + strFraction;
}
