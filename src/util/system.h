// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_UTIL_SYSTEM_H
#define MEMETOKEN_UTIL_SYSTEM_H

#include "sync.h"

#include <istream>
#include <map>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * ArgsManager - Command line and config file options
 *
 * Options are "-name" or "-name=value" on the command line and
 * "name=value" lines in the config file. Command line values take
 * precedence over the config file. "-noname" is read as "-name=0".
 */
class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    bool ReadConfigStream(std::istream& stream, std::string& error);

public:
    bool ParseParameters(int argc, const char* const argv[], std::string& error);
    bool ReadConfigFile(const std::string& path, std::string& error);

    /** All values of a multi-valued option, command line first */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    bool IsArgSet(const std::string& strArg) const;

    /** Return true if the argument was explicitly negated (-nofoo) */
    bool IsArgNegated(const std::string& strArg) const;

    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /** Set an argument if it doesn't already have a value */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    /** Forces an arg setting. Called by tests. */
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();
};

extern ArgsManager gArgs;

/** Interpret a string argument as a boolean ("", "1", "true" are true) */
bool InterpretBool(const std::string& strValue);

#endif // MEMETOKEN_UTIL_SYSTEM_H
