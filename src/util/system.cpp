// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <fstream>

ArgsManager gArgs;

bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    if (strValue == "true")
        return true;
    if (strValue == "false")
        return false;
    try {
        return boost::lexical_cast<int64_t>(strValue) != 0;
    } catch (const boost::bad_lexical_cast&) {
        return false;
    }
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Accept --foo as well as -foo
        if (key.size() > 1 && key[1] == '-')
            key = key.substr(1);

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);

    std::string line;
    int linenr = 1;
    while (std::getline(stream, line)) {
        const size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        boost::algorithm::trim(line);
        if (line.empty()) {
            ++linenr;
            continue;
        }

        const size_t pos = line.find('=');
        if (pos == std::string::npos) {
            error = strprintf("parse error on line %i: %s", linenr, line);
            return false;
        }
        std::string key = "-" + boost::algorithm::trim_copy(line.substr(0, pos));
        std::string val = boost::algorithm::trim_copy(line.substr(pos + 1));
        InterpretNegatedOption(key, val);
        m_config_args[key].push_back(val);
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& path, std::string& error)
{
    std::ifstream stream(path);
    if (!stream.good()) {
        error = strprintf("cannot open config file %s", path);
        return false;
    }
    if (!ReadConfigStream(stream, error)) {
        error = strprintf("%s: %s", path, error);
        return false;
    }
    LogPrintf("Using config file %s\n", path);
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_override_args.count(strArg) || m_config_args.count(strArg);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    return !values.empty() && values.front() == "0";
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return strDefault;
    // Last value on the command line wins, then the first in the config file.
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        return it->second.back();
    }
    return values.front();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    if (!IsArgSet(strArg)) return nDefault;
    try {
        return boost::lexical_cast<int64_t>(GetArg(strArg, std::string()));
    } catch (const boost::bad_lexical_cast&) {
        return nDefault;
    }
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    if (!IsArgSet(strArg)) return fDefault;
    return InterpretBool(GetArg(strArg, std::string()));
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    m_override_args[strArg] = {strValue};
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    return SoftSetArg(strArg, fValue ? std::string("1") : std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}
