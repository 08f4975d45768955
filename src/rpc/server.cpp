// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "consensus/validation.h"
#include "logging.h"
#include "token/token.h"

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

UniValue JSONRPCError(int code, const std::string& message)
{
    UniValue error(UniValue::VOBJ);
    error.pushKV("code", code);
    error.pushKV("message", message);
    return error;
}

UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id)
{
    UniValue reply(UniValue::VOBJ);
    if (!error.isNull())
        reply.pushKV("result", NullUniValue);
    else
        reply.pushKV("result", result);
    reply.pushKV("error", error);
    reply.pushKV("id", id);
    return reply;
}

UniValue JSONRPCTokenError(const CValidationState& state)
{
    const int code = state.IsError() ? RPC_VERIFY_ERROR : RPC_VERIFY_REJECTED;
    return JSONRPCError(code, state.ToString());
}

void JSONRPCRequest::parse(const UniValue& valRequest)
{
    if (!valRequest.isObject())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Invalid Request object");
    const UniValue& request = valRequest.get_obj();

    // Parse id now so errors from here on will have the id
    id = find_value(request, "id");

    UniValue valMethod = find_value(request, "method");
    if (valMethod.isNull())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Missing method");
    if (!valMethod.isStr())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Method must be a string");
    strMethod = valMethod.get_str();
    LogPrint(BCLog::RPC, "JSONRPCRequest::parse: method=%s\n", strMethod);

    UniValue valParams = find_value(request, "params");
    if (valParams.isArray())
        params = valParams.get_array();
    else if (valParams.isNull())
        params = UniValue(UniValue::VARR);
    else
        throw JSONRPCError(RPC_INVALID_REQUEST, "Params must be an array");
}

static UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand, jsonRequest);
}

static const CRPCCommand vRPCCommands[] = {
    //  category    name        actor (function)  okSafe  argNames
    //  ----------- ----------  ----------------  ------  ----------
    { "control",    "help",     &help,            true,   {"command"} },
};

CRPCTable::CRPCTable()
{
    for (const CRPCCommand& cmd : vRPCCommands) {
        mapCommands[cmd.name] = &cmd;
    }
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

std::string CRPCTable::help(const std::string& strCommand, const JSONRPCRequest& helpreq) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (const auto& entry : mapCommands)
        vCommands.push_back(std::make_pair(entry.second->category + entry.first, entry.second));
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq(helpreq);
    jreq.fHelp = true;
    jreq.params = UniValue();

    for (const std::pair<std::string, const CRPCCommand*>& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if ((strCommand != "" || pcmd->category == "hidden") && strMethod != strCommand)
            continue;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = (*this)[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    try {
        // Execute
        return pcmd->actor(request);
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& entry : mapCommands) {
        commandList.push_back(entry.first);
    }
    return commandList;
}

std::string JSONRPCExecOne(const std::string& strRequest, CMemeToken& token)
{
    JSONRPCRequest jreq;
    jreq.token = &token;

    UniValue reply;
    try {
        UniValue valRequest;
        if (!valRequest.read(strRequest))
            throw JSONRPCError(RPC_PARSE_ERROR, "Parse error");
        jreq.parse(valRequest);

        UniValue result = tableRPC.execute(jreq);
        reply = JSONRPCReplyObj(result, NullUniValue, jreq.id);
    } catch (const UniValue& objError) {
        LogPrint(BCLog::RPC, "JSONRPCExecOne: %s failed: %s\n", jreq.strMethod, objError.write());
        reply = JSONRPCReplyObj(NullUniValue, objError, jreq.id);
    } catch (const std::exception& e) {
        reply = JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_MISC_ERROR, e.what()), jreq.id);
    }
    return reply.write();
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> echo '{\"method\": \"" + methodname + "\", \"params\": [" + args + "]}' | memetokend\n";
}

std::string HelpExampleRpc(const std::string& methodname, const std::string& args)
{
    return "> {\"jsonrpc\": \"1.0\", \"id\":\"curltest\", "
           "\"method\": \"" + methodname + "\", \"params\": [" + args + "] }\n";
}

void RPCTypeCheckArgument(const UniValue& value, UniValue::VType typeExpected)
{
    if (value.type() != typeExpected) {
        throw JSONRPCError(RPC_TYPE_ERROR, strprintf("Expected type %s, got %s",
                                                     uvTypeName(typeExpected), uvTypeName(value.type())));
    }
}

CMemeToken& EnsureToken(const JSONRPCRequest& request)
{
    if (request.token == nullptr) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Token not initialized");
    }
    return *request.token;
}

CTokenAddress ParseAddressV(const UniValue& v, const std::string& strName)
{
    RPCTypeCheckArgument(v, UniValue::VSTR);
    CTokenAddress address;
    if (!CTokenAddress::FromString(v.get_str(), address)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS, strprintf("%s must be a 20 byte hex address (not '%s')",
                                                          strName, v.get_str()));
    }
    return address;
}

TokenAmount ParseAmountV(const UniValue& v, const std::string& strName)
{
    TokenAmount amount;
    if (v.isNum()) {
        const int64_t n = v.get_int64();
        if (n < 0) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("%s must be non-negative", strName));
        }
        return TokenAmount(n);
    }
    RPCTypeCheckArgument(v, UniValue::VSTR);
    if (!ParseTokenAmount(v.get_str(), 0, amount)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("%s must be an integer amount in base units (not '%s')",
                                                            strName, v.get_str()));
    }
    return amount;
}

uint32_t ParsePercentV(const UniValue& v, const std::string& strName)
{
    RPCTypeCheckArgument(v, UniValue::VNUM);
    const int64_t n = v.get_int64();
    if (n < 0 || n > 100) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("%s out of range [0, 100]: %d", strName, n));
    }
    return static_cast<uint32_t>(n);
}

CRPCTable tableRPC;
