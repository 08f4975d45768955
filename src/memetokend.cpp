// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "logging.h"
#include "rpc/server.h"
#include "token/token.h"
#include "token/token_access.h"
#include "token/token_events.h"
#include "token/token_ledger.h"
#include "token/token_params.h"
#include "util/system.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

static const char* const DEFAULT_VARIANT = "reflection";
static const bool DEFAULT_PRINTTOCONSOLE = true;

static std::string HelpMessage()
{
    std::string strUsage;
    strUsage += "Usage:\n  memetokend [options]\n\n";
    strUsage += "Reads one JSON-RPC request per line from stdin and writes one reply per line to stdout.\n\n";
    strUsage += "Options:\n";
    strUsage += "  -?                     This help message\n";
    strUsage += "  -conf=<file>           Read options from a configuration file\n";
    strUsage += strprintf("  -variant=<v>           Token variant: reflection or standard (default: %s)\n", DEFAULT_VARIANT);
    strUsage += "  -name=<s>              Token name\n";
    strUsage += "  -symbol=<s>            Token ticker\n";
    strUsage += strprintf("  -supply=<n>            Total supply in whole tokens (default: %u)\n", DEFAULT_TOKEN_SUPPLY);
    strUsage += "  -owner=<addr>          Owner address, receives the supply\n";
    strUsage += "  -tokenaddress=<addr>   Token holding address (liquidity and reflection pool)\n";
    strUsage += "  -marketing=<addr>      Marketing wallet\n";
    strUsage += "  -fees=<r,l,m,b>        Fee percents; standard variant takes <l,m,b>\n";
    strUsage += "  -maxtx=<n>             Max transaction amount in whole tokens (default: 1% of supply)\n";
    strUsage += "  -maxwallet=<n>         Max wallet size in whole tokens (default: 2% of supply)\n";
    strUsage += strprintf("  -cooldown=<n>          Seconds between outbound trades (default: %u)\n", DEFAULT_COOLDOWN_TIME);
    strUsage += "  -enablefeature=<name>  Turn a feature on at genesis (can be specified multiple times)\n";
    strUsage += "  -disablefeature=<name> Turn a feature off at genesis (can be specified multiple times)\n";
    strUsage += "  -blacklistgated        Only enforce blacklist flags while blacklistEnabled is on\n";
    strUsage += "  -enabletrading         Open trading at startup\n";
    strUsage += "\nDebugging options:\n";
    strUsage += strprintf("  -debug=<category>      Output debugging information: %s\n", ListLogCategories());
    strUsage += strprintf("  -printtoconsole        Send trace/debug info to stderr (default: %u)\n", DEFAULT_PRINTTOCONSOLE);
    strUsage += strprintf("  -debuglogfile=<file>   Debug log file (default: %s, empty to disable)\n", DEFAULT_DEBUGLOGFILE);
    strUsage += strprintf("  -logtimestamps         Prepend debug output with timestamp (default: %u)\n", DEFAULT_LOGTIMESTAMPS);
    return strUsage;
}

static bool InitLogging(std::string& strError)
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    logger.m_file_path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
    logger.m_print_to_file = !gArgs.IsArgNegated("-debuglogfile") && !logger.m_file_path.empty();

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!logger.EnableCategory(cat)) {
            strError = strprintf("Unsupported logging category -debug=%s", cat);
            return false;
        }
    }

    if (logger.m_print_to_file && !logger.OpenDebugLog()) {
        strError = strprintf("Could not open debug log file %s", logger.m_file_path);
        return false;
    }
    return true;
}

static bool AppInit(int argc, char* argv[])
{
    std::string strError;
    if (!gArgs.ParseParameters(argc, argv, strError)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", strError.c_str());
        return false;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return true;
    }

    if (gArgs.IsArgSet("-conf") && !gArgs.ReadConfigFile(gArgs.GetArg("-conf", ""), strError)) {
        fprintf(stderr, "Error reading configuration file: %s\n", strError.c_str());
        return false;
    }

    if (!InitLogging(strError)) {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return false;
    }

    TokenVariant variant;
    const std::string strVariant = gArgs.GetArg("-variant", DEFAULT_VARIANT);
    if (!ParseTokenVariant(strVariant, variant)) {
        fprintf(stderr, "Error: unknown -variant '%s'\n", strVariant.c_str());
        return false;
    }

    std::unique_ptr<CTokenParams> params = CreateTokenParams(variant);
    if (!ApplyTokenArgs(gArgs, *params, strError)) {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return false;
    }

    CTokenLedger ledger(params->owner, params->nTotalSupply);
    COwnableAccess access(params->owner);
    std::unique_ptr<CMemeToken> token;
    try {
        token.reset(new CMemeToken(*params, ledger, access));
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return false;
    }

    CLoggingTokenEvents loggingEvents;
    token->GetSignals().Register(&loggingEvents);

    if (gArgs.GetBoolArg("-enabletrading", false)) {
        CValidationState state;
        if (!token->EnableTrading(params->owner, state)) {
            fprintf(stderr, "Error: %s\n", state.ToString().c_str());
            token->GetSignals().UnregisterAll();
            return false;
        }
    }

    RegisterTokenRPCCommands(tableRPC);
    LogPrintf("memetokend: serving %s (%s), %u commands\n",
              token->GetName(), TokenVariantName(variant), tableRPC.listCommands().size());

    std::string strLine;
    while (std::getline(std::cin, strLine)) {
        if (strLine.empty()) {
            continue;
        }
        std::cout << JSONRPCExecOne(strLine, *token) << std::endl;
    }

    token->GetSignals().UnregisterAll();
    LogPrintf("memetokend: shutdown\n");
    return true;
}

int main(int argc, char* argv[])
{
    return (AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE);
}
