// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TEST_TEST_MEMETOKEN_H
#define MEMETOKEN_TEST_TEST_MEMETOKEN_H

#include "address.h"
#include "amount.h"
#include "consensus/validation.h"
#include "token/token.h"
#include "token/token_access.h"
#include "token/token_ledger.h"
#include "token/token_params.h"

#include <memory>

/** Fixed clock the suites start from */
static const int64_t TEST_START_TIME = 1700000000;

/** Basic testing setup: mocked clock, quiet logging, clean args. */
struct BasicTestingSetup {
    explicit BasicTestingSetup();
    ~BasicTestingSetup();
};

/**
 * Testing setup with a small standard-variant token.
 *
 * 0 decimals, supply 100,000,000, fees liquidity 2 / marketing 2 / burn 1,
 * max tx 1,000,000, max wallet 2,000,000, cooldown 1800 s, trading closed.
 * The owner holds the whole supply.
 */
struct TokenTestingSetup : public BasicTestingSetup {
    const CTokenAddress owner;
    const CTokenAddress tokenAddress;
    const CTokenAddress marketing;
    const CTokenAddress alice;
    const CTokenAddress bob;
    const CTokenAddress carol;

    std::unique_ptr<CTokenParams> params;
    std::unique_ptr<CTokenLedger> ledger;
    std::unique_ptr<COwnableAccess> access;
    std::unique_ptr<CMemeToken> token;

    explicit TokenTestingSetup(TokenVariant variant = TokenVariant::STANDARD);
    ~TokenTestingSetup();

    /** Rebuild the token from `params` (after a test edited them) */
    void ResetToken();

    /** Owner -> address, fee and cooldown free. Fails the test on rejection. */
    void Fund(const CTokenAddress& to, const TokenAmount& amount);

    void EnableTrading();

    /** Move the mocked clock forward */
    void AdvanceTime(int64_t nSeconds);
};

struct ReflectionTokenTestingSetup : public TokenTestingSetup {
    ReflectionTokenTestingSetup() : TokenTestingSetup(TokenVariant::REFLECTION) {}
};

#endif // MEMETOKEN_TEST_TEST_MEMETOKEN_H
