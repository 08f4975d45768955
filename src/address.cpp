// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "address.h"

static int HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool CTokenAddress::IsNull() const
{
    for (const uint8_t b : m_data) {
        if (b != 0) return false;
    }
    return true;
}

std::string CTokenAddress::ToString() const
{
    static const char hexmap[] = "0123456789abcdef";
    std::string str = "0x";
    str.reserve(2 + WIDTH * 2);
    for (const uint8_t b : m_data) {
        str.push_back(hexmap[b >> 4]);
        str.push_back(hexmap[b & 0x0f]);
    }
    return str;
}

bool CTokenAddress::FromString(const std::string& str, CTokenAddress& addressOut)
{
    size_t nOffset = 0;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        nOffset = 2;
    }
    if (str.size() - nOffset != WIDTH * 2) {
        return false;
    }

    CTokenAddress result;
    for (unsigned int i = 0; i < WIDTH; ++i) {
        const int hi = HexDigit(str[nOffset + 2 * i]);
        const int lo = HexDigit(str[nOffset + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        result.m_data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    addressOut = result;
    return true;
}

CTokenAddress CTokenAddress::FromUint64(uint64_t nValue)
{
    CTokenAddress result;
    for (unsigned int i = 0; i < 8; ++i) {
        result.m_data[WIDTH - 1 - i] = static_cast<uint8_t>(nValue >> (8 * i));
    }
    return result;
}

const CTokenAddress& BurnAddress()
{
    static const CTokenAddress burn = CTokenAddress::FromUint64(0xdead);
    return burn;
}
