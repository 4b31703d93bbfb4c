// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/loan.h>

#include <dsc/collateral.h>
#include <dsc/dscview.h>
#include <dsc/errors.h>
#include <dsc/healthfactor.h>
#include <dsc/interactions.h>
#include <logging.h>

Res CLoanView::AddDebt(const CAccountId& account, const CAmount& amount)
{
    auto sum = SafeAdd(GetDebt(account), amount);
    Require(sum, [](const std::string& msg) { return "debt " + msg; });

    if (*sum != 0) {
        WriteBy<DebtKey>(account, *sum);
    }
    return Res::Ok();
}

Res CLoanView::SubDebt(const CAccountId& account, const CAmount& amount)
{
    const auto debt = GetDebt(account);
    if (debt < amount) {
        return DscErrors::InsufficientDebt(account, debt, amount);
    }

    if (debt == amount) {
        EraseBy<DebtKey>(account);
    } else {
        WriteBy<DebtKey>(account, CAmount{debt - amount});
    }
    return Res::Ok();
}

CAmount CLoanView::GetDebt(const CAccountId& account) const
{
    return ReadBy<DebtKey, CAmount>(account).value_or(CAmount{0});
}

void CLoanView::ForEachDebt(std::function<bool(const CAccountId&, const CAmount&)> callback, const CAccountId& start) const
{
    ForEach<DebtKey, CAccountId, CAmount>(callback, start);
}

Res CMintBurnController::Mint(const CAccountId& account, const CAmount& amount)
{
    if (amount == 0) {
        return DscErrors::AmountMustBeMoreThanZero();
    }

    Require(view.AddDebt(account, amount));
    Require(RevertIfHealthFactorIsBroken(account));
    interactions.MintDebtToken(registry.GetDebtToken(), account, amount);

    LogPrint(BCLog::LOAN, "mint %s to %s, debt %s\n", GetDecimalString(amount), account, GetDecimalString(view.GetDebt(account)));
    return Res::Ok();
}

Res CMintBurnController::Burn(const CAmount& amount, const CAccountId& onBehalfOf, const CAccountId& dscFrom)
{
    Require(view.SubDebt(onBehalfOf, amount));
    interactions.PullDebtToken(registry.GetDebtToken(), dscFrom, amount);
    interactions.BurnDebtToken(registry.GetDebtToken(), amount);

    LogPrint(BCLog::LOAN, "burn %s for %s paid by %s, debt %s\n", GetDecimalString(amount), onBehalfOf, dscFrom, GetDecimalString(view.GetDebt(onBehalfOf)));
    return Res::Ok();
}

ResVal<CAmount> CMintBurnController::HealthFactor(const CAccountId& account) const
{
    const auto debt = view.GetDebt(account);
    auto value = ledger.CollateralValue(account);
    Require(value);
    return CalculateHealthFactor(debt, *value);
}

Res CMintBurnController::RevertIfHealthFactorIsBroken(const CAccountId& account) const
{
    auto healthFactor = HealthFactor(account);
    Require(healthFactor);
    if (*healthFactor < MIN_HEALTH_FACTOR) {
        return DscErrors::BreaksHealthFactor(account, *healthFactor);
    }
    return Res::Ok();
}
