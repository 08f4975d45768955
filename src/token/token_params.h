// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_PARAMS_H
#define MEMETOKEN_TOKEN_PARAMS_H

#include "address.h"
#include "amount.h"
#include "token/token_policy.h"

#include <memory>
#include <string>

class ArgsManager;

/** Default genesis supply in whole tokens */
static const uint64_t DEFAULT_TOKEN_SUPPLY = 1000000000;
/** Default cooldown between outbound trades, seconds */
static const uint32_t DEFAULT_COOLDOWN_TIME = 1800;

/**
 * CTokenParams - Genesis configuration of a token
 *
 * Presets per variant are built by CreateTokenParams and can be overridden
 * from the command line or config file with ApplyTokenArgs.
 */
struct CTokenParams
{
    std::string strName;
    std::string strSymbol;
    unsigned int nDecimals;
    TokenAmount nTotalSupply;

    CTokenAddress owner;           //!< receives the supply, fee-excluded
    CTokenAddress tokenAddress;    //!< token's own holding account: liquidity and reflection pool
    CTokenAddress marketingWallet; //!< marketing fee destination

    TokenPolicyOptions options;
    TokenFeatureSet features;
    TokenFeeSchedule fees;
    TokenLimits limits;

    CTokenParams() : nDecimals(TOKEN_DECIMALS), nTotalSupply(0) {}

    bool Validate(std::string& strError) const;
};

/**
 * Presets:
 * - reflection: six toggles all on, fees reflection 1 / liquidity 2 / marketing 2 / burn 1
 * - standard:   anti-whale, cooldown, blacklist, auto-burn on, fees 2 / 2 / 1
 * Both: 1,000,000,000 tokens, max tx 1% and max wallet 2% of supply, 1800 s cooldown.
 */
std::unique_ptr<CTokenParams> CreateTokenParams(TokenVariant variant);

/**
 * ApplyTokenArgs - Override a preset from -name, -symbol, -supply, -owner,
 * -tokenaddress, -marketing, -fees, -maxtx, -maxwallet, -cooldown,
 * -enablefeature, -disablefeature, -blacklistgated
 */
bool ApplyTokenArgs(const ArgsManager& args, CTokenParams& params, std::string& strError);

#endif // MEMETOKEN_TOKEN_PARAMS_H
