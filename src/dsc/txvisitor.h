// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_TXVISITOR_H
#define DSC_DSC_TXVISITOR_H

#include <dsc/collateral.h>
#include <dsc/liquidation.h>
#include <dsc/loan.h>
#include <dsc/messages.h>
#include <dsc/res.h>

#include <optional>

class CDscView;
class CInteractionQueue;

/** Applies one engine message to a staged view, collaborator calls are queued */
class CEngineTxVisitor {
public:
    CEngineTxVisitor(CDscView& mnview, const CCollateralRegistry& registry, CInteractionQueue& interactions);

    Res operator()(const CDepositCollateralMessage& obj);
    Res operator()(const CMintDscMessage& obj);
    Res operator()(const CDepositAndMintMessage& obj);
    Res operator()(const CRedeemCollateralMessage& obj);
    Res operator()(const CBurnDscMessage& obj);
    Res operator()(const CBurnAndRedeemMessage& obj);
    Res operator()(const CLiquidateMessage& obj);

    const std::optional<CLiquidationResult>& LastLiquidation() const { return lastLiquidation; }

private:
    CCollateralLedger ledger;
    CMintBurnController controller;
    CLiquidationEngine liquidation;
    std::optional<CLiquidationResult> lastLiquidation;
};

#endif // DSC_DSC_TXVISITOR_H
