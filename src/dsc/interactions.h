// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_INTERACTIONS_H
#define DSC_DSC_INTERACTIONS_H

#include <amount.h>
#include <dsc/interfaces.h>
#include <dsc/res.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * Calls to collaborators are collected while an operation mutates its staged
 * view and run only once every check passed. Pulls run first so the engine
 * holds the funds it pays out, mints run last. A refused or throwing call
 * reverts the calls already made, newest first.
 */
enum class InteractionPhase : uint8_t {
    Pull = 0,
    Burn = 1,
    Push = 2,
    Mint = 3,
};

class CInteractionQueue {
public:
    explicit CInteractionQueue(CAccountId custody) : custody(std::move(custody)) {}

    void PullCollateral(std::shared_ptr<CCollateralToken> token, const CAssetId &asset, const CAccountId &from, const CAmount &amount);
    void PushCollateral(std::shared_ptr<CCollateralToken> token, const CAssetId &asset, const CAccountId &to, const CAmount &amount);
    void PullDebtToken(std::shared_ptr<CDebtTokenController> token, const CAccountId &from, const CAmount &amount);
    void BurnDebtToken(std::shared_ptr<CDebtTokenController> token, const CAmount &amount);
    void MintDebtToken(std::shared_ptr<CDebtTokenController> token, const CAccountId &to, const CAmount &amount);

    Res Execute();

    bool Empty() const { return calls.empty(); }
    size_t Size() const { return calls.size(); }

private:
    struct CInteraction {
        InteractionPhase phase;
        std::string description;
        std::function<bool()> call;
        // empty when the call cannot be undone by the engine alone
        std::function<bool()> revert;
    };

    void Revert(const std::vector<const CInteraction *> &done) const;

    const CAccountId custody;
    std::vector<CInteraction> calls;
};

#endif // DSC_DSC_INTERACTIONS_H
