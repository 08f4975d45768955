// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_RPC_SERVER_H
#define MEMETOKEN_RPC_SERVER_H

#include "address.h"
#include "amount.h"
#include "rpc/protocol.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

class CMemeToken;
class CValidationState;

class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;
    //! Token the request operates on; owned by the caller
    CMemeToken* token;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false), token(nullptr) {}

    /** Fill id, method and params from a request object; throws JSONRPCError */
    void parse(const UniValue& valRequest);
};

typedef UniValue (*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * Token RPC command dispatcher.
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name, const JSONRPCRequest& helpreq) const;

    /**
     * Execute a method.
     * @param request The request to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /** Names of all registered commands, sorted */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Returns false if the command name is already taken.
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

UniValue JSONRPCError(int code, const std::string& message);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);

/** RPC_VERIFY_REJECTED / RPC_VERIFY_ERROR carrying the state's reject reason and debug message */
UniValue JSONRPCTokenError(const CValidationState& state);

/**
 * Handle one serialized JSON request against a token and return the
 * serialized reply. Never throws: every failure becomes an error reply.
 */
std::string JSONRPCExecOne(const std::string& strRequest, CMemeToken& token);

std::string HelpExampleCli(const std::string& methodname, const std::string& args);
std::string HelpExampleRpc(const std::string& methodname, const std::string& args);

/** Throws RPC_TYPE_ERROR if value is not of the expected type */
void RPCTypeCheckArgument(const UniValue& value, UniValue::VType typeExpected);

CMemeToken& EnsureToken(const JSONRPCRequest& request);

/** Hex address, 0x prefix optional */
CTokenAddress ParseAddressV(const UniValue& v, const std::string& strName);
/** Non-negative integer amount in base units, as a string or number */
TokenAmount ParseAmountV(const UniValue& v, const std::string& strName);
/** Whole percent in [0, 100] */
uint32_t ParsePercentV(const UniValue& v, const std::string& strName);

void RegisterTokenRPCCommands(CRPCTable& tableRPC);

#endif // MEMETOKEN_RPC_SERVER_H
