// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_UTILTIME_H
#define MEMETOKEN_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime - Seconds since epoch, or the mock time when one is set.
 *
 * Cooldown windows and the trading launch timestamp are read from here.
 */
int64_t GetTime();

/** Wall clock seconds, never mocked (log timestamps) */
int64_t GetSystemTime();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument; 0 disables */
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

std::string FormatISO8601DateTime(int64_t nTime);

#endif // MEMETOKEN_UTILTIME_H
