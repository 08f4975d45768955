// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_TOKEN_ACCESS_H
#define MEMETOKEN_TOKEN_ACCESS_H

#include "address.h"

/**
 * CAccessControl - Owner predicate and pause gate
 *
 * Every administrative call of CMemeToken is wrapped by IsOwner; the
 * transfer entry points are wrapped by IsPaused.
 */
class CAccessControl
{
public:
    virtual ~CAccessControl() {}

    virtual bool IsOwner(const CTokenAddress& caller) const = 0;
    virtual CTokenAddress GetOwner() const = 0;
    virtual bool IsPaused() const = 0;
    virtual void SetPaused(bool fPaused) = 0;
};

/** Fixed single owner, unpaused at construction */
class COwnableAccess : public CAccessControl
{
private:
    CTokenAddress m_owner;
    bool m_paused;

public:
    explicit COwnableAccess(const CTokenAddress& owner) : m_owner(owner), m_paused(false) {}

    bool IsOwner(const CTokenAddress& caller) const override
    {
        return !caller.IsNull() && caller == m_owner;
    }
    CTokenAddress GetOwner() const override { return m_owner; }
    bool IsPaused() const override { return m_paused; }
    void SetPaused(bool fPaused) override { m_paused = fPaused; }
};

#endif // MEMETOKEN_TOKEN_ACCESS_H
