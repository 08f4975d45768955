// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_RPC_PROTOCOL_H
#define MEMETOKEN_RPC_PROTOCOL_H

//! Token RPC error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR          = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR          = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_ADDRESS     = -5,  //!< Invalid address
    RPC_INVALID_PARAMETER   = -8,  //!< Invalid, missing or duplicate parameter
    RPC_VERIFY_ERROR        = -25, //!< Internal error while applying a token operation
    RPC_VERIFY_REJECTED     = -26, //!< Token operation rejected by policy or ledger rules
};

#endif // MEMETOKEN_RPC_PROTOCOL_H
