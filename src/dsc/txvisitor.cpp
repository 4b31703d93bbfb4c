// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/txvisitor.h>

#include <dsc/dscview.h>
#include <dsc/errors.h>

std::string ToString(const CEngineMessage& message) {
    struct {
        std::string operator()(const CDepositCollateralMessage& obj) const {
            return tfm::format("deposit(%s, %s)", obj.from, CTokenAmount{obj.asset, obj.amount}.ToString());
        }
        std::string operator()(const CMintDscMessage& obj) const {
            return tfm::format("mint(%s, %s)", obj.from, GetDecimalString(obj.amount));
        }
        std::string operator()(const CDepositAndMintMessage& obj) const {
            return tfm::format("depositAndMint(%s, %s, %s)", obj.from, CTokenAmount{obj.asset, obj.amountCollateral}.ToString(), GetDecimalString(obj.amountDsc));
        }
        std::string operator()(const CRedeemCollateralMessage& obj) const {
            return tfm::format("redeem(%s, %s)", obj.from, CTokenAmount{obj.asset, obj.amount}.ToString());
        }
        std::string operator()(const CBurnDscMessage& obj) const {
            return tfm::format("burn(%s, %s)", obj.from, GetDecimalString(obj.amount));
        }
        std::string operator()(const CBurnAndRedeemMessage& obj) const {
            return tfm::format("burnAndRedeem(%s, %s, %s)", obj.from, CTokenAmount{obj.asset, obj.amountCollateral}.ToString(), GetDecimalString(obj.amountDsc));
        }
        std::string operator()(const CLiquidateMessage& obj) const {
            return tfm::format("liquidate(%s, %s, %s, %s)", obj.liquidator, obj.asset, obj.user, GetDecimalString(obj.debtToCover));
        }
    } visitor;
    return std::visit(visitor, message);
}

CEngineTxVisitor::CEngineTxVisitor(CDscView& mnview, const CCollateralRegistry& registry, CInteractionQueue& interactions)
    : ledger(mnview, registry, interactions),
      controller(mnview, registry, ledger, interactions),
      liquidation(registry, ledger, controller) {}

Res CEngineTxVisitor::operator()(const CDepositCollateralMessage& obj) {
    return ledger.Deposit(obj.from, obj.asset, obj.amount);
}

Res CEngineTxVisitor::operator()(const CMintDscMessage& obj) {
    return controller.Mint(obj.from, obj.amount);
}

Res CEngineTxVisitor::operator()(const CDepositAndMintMessage& obj) {
    Require(ledger.Deposit(obj.from, obj.asset, obj.amountCollateral));
    return controller.Mint(obj.from, obj.amountDsc);
}

Res CEngineTxVisitor::operator()(const CRedeemCollateralMessage& obj) {
    if (obj.amount == 0) {
        return DscErrors::AmountMustBeMoreThanZero();
    }
    Require(ledger.Withdraw(obj.asset, obj.amount, obj.from, obj.from));
    return controller.RevertIfHealthFactorIsBroken(obj.from);
}

Res CEngineTxVisitor::operator()(const CBurnDscMessage& obj) {
    if (obj.amount == 0) {
        return DscErrors::AmountMustBeMoreThanZero();
    }
    Require(controller.Burn(obj.amount, obj.from, obj.from));
    return controller.RevertIfHealthFactorIsBroken(obj.from);
}

Res CEngineTxVisitor::operator()(const CBurnAndRedeemMessage& obj) {
    if (obj.amountCollateral == 0) {
        return DscErrors::AmountMustBeMoreThanZero("collateral amount");
    }
    if (obj.amountDsc == 0) {
        return DscErrors::AmountMustBeMoreThanZero("dsc amount");
    }
    Require(controller.Burn(obj.amountDsc, obj.from, obj.from));
    Require(ledger.Withdraw(obj.asset, obj.amountCollateral, obj.from, obj.from));
    return controller.RevertIfHealthFactorIsBroken(obj.from);
}

Res CEngineTxVisitor::operator()(const CLiquidateMessage& obj) {
    auto result = liquidation.Liquidate(obj.asset, obj.user, obj.debtToCover, obj.liquidator);
    Require(result);
    lastLiquidation = *result;
    return Res::Ok();
}
