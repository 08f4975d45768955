// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_ADDRESS_H
#define MEMETOKEN_ADDRESS_H

#include <array>
#include <stdint.h>
#include <string>

/**
 * CTokenAddress - Opaque 160-bit account identity
 *
 * Textual form is "0x" followed by 40 hex digits. The all-zero address is
 * the null identity and never owns tokens.
 */
class CTokenAddress
{
public:
    static constexpr unsigned int WIDTH = 20;

private:
    std::array<uint8_t, WIDTH> m_data;

public:
    CTokenAddress()
    {
        SetNull();
    }

    void SetNull()
    {
        m_data.fill(0);
    }

    bool IsNull() const;

    /** Lowercase hex with 0x prefix */
    std::string ToString() const;

    /** Accepts 40 hex digits with or without a 0x prefix, any case */
    static bool FromString(const std::string& str, CTokenAddress& addressOut);

    /** Address whose last eight bytes hold nValue big-endian (test and preset helper) */
    static CTokenAddress FromUint64(uint64_t nValue);

    const uint8_t* begin() const { return m_data.data(); }
    const uint8_t* end() const { return m_data.data() + WIDTH; }

    friend bool operator==(const CTokenAddress& a, const CTokenAddress& b) { return a.m_data == b.m_data; }
    friend bool operator!=(const CTokenAddress& a, const CTokenAddress& b) { return a.m_data != b.m_data; }
    friend bool operator<(const CTokenAddress& a, const CTokenAddress& b) { return a.m_data < b.m_data; }
};

/** Canonical burn sink 0x000000000000000000000000000000000000dEaD */
const CTokenAddress& BurnAddress();

#endif // MEMETOKEN_ADDRESS_H
