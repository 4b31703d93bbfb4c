// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/liquidation.h>

#include <dsc/collateral.h>
#include <dsc/errors.h>
#include <dsc/loan.h>
#include <dsc/params.h>
#include <logging.h>

ResVal<CLiquidationResult> CLiquidationEngine::Liquidate(const CAssetId& asset, const CAccountId& user, const CAmount& debtToCover, const CAccountId& liquidator)
{
    auto startingHealthFactor = controller.HealthFactor(user);
    Require(startingHealthFactor);
    if (*startingHealthFactor >= MIN_HEALTH_FACTOR) {
        return DscErrors::HealthFactorOk(user, *startingHealthFactor);
    }
    if (debtToCover == 0) {
        return DscErrors::AmountMustBeMoreThanZero("debt to cover");
    }

    auto tokenAmountFromDebtCovered = registry.Oracle().GetTokenAmountFromUsd(asset, debtToCover);
    Require(tokenAmountFromDebtCovered);

    auto bonus = MulDiv(*tokenAmountFromDebtCovered, LIQUIDATION_BONUS, LIQUIDATION_PRECISION);
    Require(bonus);
    const CAmount bonusCollateral = *bonus;
    auto totalCollateralToRedeem = SafeAdd(*tokenAmountFromDebtCovered, bonusCollateral);
    Require(totalCollateralToRedeem, [](const std::string& msg) { return "seized collateral " + msg; });

    Require(ledger.Withdraw(asset, *totalCollateralToRedeem, user, liquidator));
    Require(controller.Burn(debtToCover, user, liquidator));

    auto endingHealthFactor = controller.HealthFactor(user);
    Require(endingHealthFactor);
    if (*endingHealthFactor <= *startingHealthFactor) {
        return DscErrors::HealthFactorNotImproved(*startingHealthFactor, *endingHealthFactor);
    }
    Require(controller.RevertIfHealthFactorIsBroken(liquidator));

    LogPrint(BCLog::LIQUIDATION, "%s liquidated %s of %s debt for %s (bonus %s), health factor %s -> %s\n",
             liquidator, GetDecimalString(debtToCover), user,
             CTokenAmount{asset, *totalCollateralToRedeem}.ToString(), GetDecimalString(bonusCollateral),
             GetDecimalString(*startingHealthFactor), GetDecimalString(*endingHealthFactor));

    return {CLiquidationResult{*startingHealthFactor, *endingHealthFactor, *totalCollateralToRedeem, bonusCollateral}, Res::Ok()};
}
