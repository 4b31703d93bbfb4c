// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_INTERFACES_H
#define DSC_DSC_INTERFACES_H

#include <amount.h>

#include <cstdint>
#include <memory>
#include <string>

/**
 * Collaborators the engine talks to. Every call is made by the engine on its
 * own behalf, so "from" on Transfer and Burn is always the engine custody
 * account. A false return is a refused call, an exception is treated the same.
 */

class CCollateralToken {
public:
    virtual ~CCollateralToken() = default;
    virtual bool Transfer(const CAccountId &to, const CAmount &amount) = 0;
    virtual bool TransferFrom(const CAccountId &from, const CAccountId &to, const CAmount &amount) = 0;
};

class CDebtTokenController {
public:
    virtual ~CDebtTokenController() = default;
    virtual bool Mint(const CAccountId &to, const CAmount &amount) = 0;
    virtual bool Transfer(const CAccountId &to, const CAmount &amount) = 0;
    virtual bool TransferFrom(const CAccountId &from, const CAccountId &to, const CAmount &amount) = 0;
    virtual bool Burn(const CAmount &amount) = 0;
};

struct CRoundData {
    uint64_t roundId{0};
    CFeedPrice answer{0};
    int64_t startedAt{0};
    int64_t updatedAt{0};
    uint64_t answeredInRound{0};
};

class CPriceFeed {
public:
    virtual ~CPriceFeed() = default;
    virtual CRoundData LatestRoundData() const = 0;
};

/** Resolves configured references to live collaborators, nullptr when unknown */
class CCollaborators {
public:
    virtual ~CCollaborators() = default;
    virtual std::shared_ptr<CCollateralToken> GetCollateralToken(const CAssetId &asset) = 0;
    virtual std::shared_ptr<CPriceFeed> GetPriceFeed(const std::string &feed) = 0;
    virtual std::shared_ptr<CDebtTokenController> GetDebtToken(const std::string &token) = 0;
};

#endif // DSC_DSC_INTERFACES_H
