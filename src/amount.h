// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_AMOUNT_H
#define MEMETOKEN_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>
#include <stdint.h>
#include <string>

/**
 * Token balances are unsigned 256-bit integers counted in base units.
 * Intermediate products (amount * percent) are computed in 512 bits so a
 * fee computation on any representable amount cannot overflow.
 */
typedef boost::multiprecision::uint256_t TokenAmount;
typedef boost::multiprecision::uint512_t TokenAmountWide;

/** Number of fractional digits of the display unit */
static const unsigned int TOKEN_DECIMALS = 18;

inline TokenAmount MaxTokenAmount()
{
    return std::numeric_limits<TokenAmount>::max();
}

/** whole * 10^decimals, e.g. TokenUnits(5) == 5 tokens in base units */
TokenAmount TokenUnits(uint64_t nWhole, unsigned int nDecimals = TOKEN_DECIMALS);

/**
 * Parse a non-negative decimal string into base units.
 *
 * "1.5" with nDecimals=18 yields 1500000000000000000. Base-unit strings are
 * parsed with nDecimals=0. Rejects signs, exponents, more fractional digits
 * than nDecimals, and values above MaxTokenAmount().
 */
bool ParseTokenAmount(const std::string& str, unsigned int nDecimals, TokenAmount& nAmountOut);

/** Render base units with nDecimals fractional digits, trailing zeros trimmed */
std::string FormatTokenAmount(const TokenAmount& nAmount, unsigned int nDecimals = TOKEN_DECIMALS);

#endif // MEMETOKEN_AMOUNT_H
