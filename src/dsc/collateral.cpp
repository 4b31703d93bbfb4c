// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/collateral.h>

#include <dsc/dscview.h>
#include <dsc/errors.h>
#include <dsc/interactions.h>
#include <logging.h>

#include <set>

Res CCollateralView::AddCollateral(const CAccountId& account, CTokenAmount amount)
{
    CBalances amounts;
    ReadBy<CollateralKey>(account, amounts);
    Require(amounts.Add(amount));
    if (!amounts.balances.empty()) {
        WriteBy<CollateralKey>(account, amounts);
    }
    return Res::Ok();
}

Res CCollateralView::SubCollateral(const CAccountId& account, CTokenAmount amount)
{
    CBalances amounts;
    ReadBy<CollateralKey>(account, amounts);
    const auto balance = amounts.Get(amount.nTokenId);
    if (balance < amount.nValue) {
        return DscErrors::InsufficientCollateral(amount.nTokenId, balance, amount.nValue);
    }
    Require(amounts.Sub(amount));

    if (amounts.balances.empty()) {
        EraseBy<CollateralKey>(account);
    } else {
        WriteBy<CollateralKey>(account, amounts);
    }
    return Res::Ok();
}

std::optional<CBalances> CCollateralView::GetCollaterals(const CAccountId& account) const
{
    return ReadBy<CollateralKey, CBalances>(account);
}

CAmount CCollateralView::GetCollateralBalance(const CAccountId& account, const CAssetId& asset) const
{
    auto amounts = GetCollaterals(account);
    return amounts ? amounts->Get(asset) : CAmount{0};
}

void CCollateralView::ForEachCollateral(std::function<bool(const CAccountId&, const CBalances&)> callback, const CAccountId& start) const
{
    ForEach<CollateralKey, CAccountId, CBalances>(callback, start);
}

ResVal<std::shared_ptr<CCollateralRegistry>> CCollateralRegistry::Create(const CEngineParams& params, CCollaborators& collaborators)
{
    if (params.collateralTokens.size() != params.priceFeeds.size()) {
        return DscErrors::TokenAddressesAndPriceFeedsMismatch(params.collateralTokens.size(), params.priceFeeds.size());
    }
    Require(!params.engineAddress.empty(), [] { return DscErrors::EmptyReference("engine address").msg; });
    Require(!params.debtToken.empty(), [] { return DscErrors::EmptyReference("debt token").msg; });
    Require(params.oracleTimeout > 0, "oracle timeout must be positive, got %d", params.oracleTimeout);

    std::shared_ptr<CCollateralRegistry> registry(new CCollateralRegistry(params.engineAddress, params.oracleTimeout));

    std::set<CAssetId> seen;
    for (size_t i = 0; i < params.collateralTokens.size(); ++i) {
        const auto& asset = params.collateralTokens[i];
        const auto& feedRef = params.priceFeeds[i];
        Require(!asset.empty(), [] { return DscErrors::EmptyReference("collateral token").msg; });
        Require(!feedRef.empty(), [] { return DscErrors::EmptyReference("price feed").msg; });
        if (!seen.insert(asset).second) {
            return DscErrors::TokenAddressDuplicated(asset);
        }

        auto token = collaborators.GetCollateralToken(asset);
        if (!token) {
            return DscErrors::UnresolvedReference("collateral token", asset);
        }
        auto feed = collaborators.GetPriceFeed(feedRef);
        if (!feed) {
            return DscErrors::UnresolvedReference("price feed", feedRef);
        }

        registry->order.push_back(asset);
        registry->tokens.emplace(asset, std::move(token));
        registry->oracle.AddFeed(asset, feedRef, std::move(feed));
    }

    registry->debtToken = collaborators.GetDebtToken(params.debtToken);
    if (!registry->debtToken) {
        return DscErrors::UnresolvedReference("debt token", params.debtToken);
    }
    registry->debtTokenRef = params.debtToken;

    return {registry, Res::Ok()};
}

std::shared_ptr<CCollateralToken> CCollateralRegistry::GetToken(const CAssetId& asset) const
{
    const auto it = tokens.find(asset);
    return it == tokens.end() ? nullptr : it->second;
}

ResVal<CAmount> GetAccountCollateralValue(const CCollateralView& view, const CCollateralRegistry& registry, const CAccountId& account)
{
    const auto balances = view.GetCollaterals(account).value_or(CBalances{});

    CAmount total{0};
    for (const auto& asset : registry.GetCollateralTokens()) {
        // every feed is read, a stale one freezes valuation even for a zero balance
        auto value = registry.Oracle().GetUsdValue(asset, balances.Get(asset));
        Require(value);
        auto sum = SafeAdd(total, *value);
        if (!sum) {
            return DscErrors::AmountOverflow("collateral value");
        }
        total = *sum;
    }
    return {total, Res::Ok()};
}

Res CCollateralLedger::Deposit(const CAccountId& account, const CAssetId& asset, const CAmount& amount)
{
    if (amount == 0) {
        return DscErrors::AmountMustBeMoreThanZero();
    }
    if (!registry.IsAllowed(asset)) {
        return DscErrors::TokenNotAllowed(asset);
    }

    Require(view.AddCollateral(account, {asset, amount}));
    view.WriteCollateralEvent({CollateralEventType::Deposited, account, registry.GetEngineAddress(), asset, amount});
    interactions.PullCollateral(registry.GetToken(asset), asset, account, amount);

    LogPrint(BCLog::LEDGER, "deposit %s by %s\n", CTokenAmount{asset, amount}.ToString(), account);
    return Res::Ok();
}

Res CCollateralLedger::Withdraw(const CAssetId& asset, const CAmount& amount, const CAccountId& from, const CAccountId& to)
{
    if (!registry.IsAllowed(asset)) {
        return DscErrors::TokenNotAllowed(asset);
    }

    Require(view.SubCollateral(from, {asset, amount}));
    view.WriteCollateralEvent({CollateralEventType::Redeemed, from, to, asset, amount});
    interactions.PushCollateral(registry.GetToken(asset), asset, to, amount);

    LogPrint(BCLog::LEDGER, "withdraw %s from %s to %s\n", CTokenAmount{asset, amount}.ToString(), from, to);
    return Res::Ok();
}

CAmount CCollateralLedger::BalanceOf(const CAccountId& account, const CAssetId& asset) const
{
    return view.GetCollateralBalance(account, asset);
}

ResVal<CAmount> CCollateralLedger::CollateralValue(const CAccountId& account) const
{
    return GetAccountCollateralValue(view, registry, account);
}
