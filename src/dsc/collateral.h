// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_COLLATERAL_H
#define DSC_DSC_COLLATERAL_H

#include <amount.h>
#include <flushablestorage.h>
#include <dsc/balances.h>
#include <dsc/interfaces.h>
#include <dsc/oracles.h>
#include <dsc/params.h>
#include <dsc/res.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

class CDscView;
class CInteractionQueue;

/** Per account collateral balances */
class CCollateralView : public virtual CStorageView
{
public:
    Res AddCollateral(const CAccountId& account, CTokenAmount amount);
    Res SubCollateral(const CAccountId& account, CTokenAmount amount);
    std::optional<CBalances> GetCollaterals(const CAccountId& account) const;
    CAmount GetCollateralBalance(const CAccountId& account, const CAssetId& asset) const;
    void ForEachCollateral(std::function<bool(const CAccountId&, const CBalances&)> callback, const CAccountId& start = {}) const;

    struct CollateralKey { static constexpr uint8_t prefix() { return 'c'; } };
};

/**
 * Collateral types, their tokens and price feeds plus the debt token, fixed
 * at construction. Registry order is the order collateral is valued in.
 */
class CCollateralRegistry
{
public:
    static ResVal<std::shared_ptr<CCollateralRegistry>> Create(const CEngineParams& params, CCollaborators& collaborators);

    bool IsAllowed(const CAssetId& asset) const { return tokens.count(asset) != 0; }
    const std::vector<CAssetId>& GetCollateralTokens() const { return order; }
    std::shared_ptr<CCollateralToken> GetToken(const CAssetId& asset) const;
    const std::shared_ptr<CDebtTokenController>& GetDebtToken() const { return debtToken; }
    const std::string& GetDebtTokenRef() const { return debtTokenRef; }
    const CAccountId& GetEngineAddress() const { return engineAddress; }
    const COracleAdapter& Oracle() const { return oracle; }

private:
    CCollateralRegistry(const CAccountId& engineAddress, int64_t oracleTimeout)
        : engineAddress(engineAddress), oracle(oracleTimeout) {}

    CAccountId engineAddress;
    std::vector<CAssetId> order;
    std::map<CAssetId, std::shared_ptr<CCollateralToken>> tokens;
    std::string debtTokenRef;
    std::shared_ptr<CDebtTokenController> debtToken;
    COracleAdapter oracle;
};

/** Collateral accounting of one operation, works on its staged view */
class CCollateralLedger
{
public:
    CCollateralLedger(CDscView& view, const CCollateralRegistry& registry, CInteractionQueue& interactions)
        : view(view), registry(registry), interactions(interactions) {}

    Res Deposit(const CAccountId& account, const CAssetId& asset, const CAmount& amount);
    Res Withdraw(const CAssetId& asset, const CAmount& amount, const CAccountId& from, const CAccountId& to);
    CAmount BalanceOf(const CAccountId& account, const CAssetId& asset) const;
    ResVal<CAmount> CollateralValue(const CAccountId& account) const;

private:
    CDscView& view;
    const CCollateralRegistry& registry;
    CInteractionQueue& interactions;
};

/** Sum of the USD value of every registered collateral type held by account */
ResVal<CAmount> GetAccountCollateralValue(const CCollateralView& view, const CCollateralRegistry& registry, const CAccountId& account);

#endif // DSC_DSC_COLLATERAL_H
