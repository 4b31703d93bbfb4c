// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_LIQUIDATION_H
#define DSC_DSC_LIQUIDATION_H

#include <amount.h>
#include <dsc/res.h>

class CCollateralLedger;
class CCollateralRegistry;
class CMintBurnController;

struct CLiquidationResult {
    CAmount startHealthFactor;
    CAmount endHealthFactor;
    CAmount collateralSeized;
    CAmount bonus;
};

/**
 * Partial liquidation of an unhealthy account against one collateral type.
 * The liquidator pays debtToCover in DSC and receives the matching amount of
 * the asset plus LIQUIDATION_BONUS percent.
 *
 * Only the named asset is seized. A position at or below 100% collateral
 * value cannot pay the bonus and fails with InsufficientFunds.
 */
class CLiquidationEngine {
public:
    CLiquidationEngine(const CCollateralRegistry& registry, CCollateralLedger& ledger, CMintBurnController& controller)
        : registry(registry), ledger(ledger), controller(controller) {}

    ResVal<CLiquidationResult> Liquidate(const CAssetId& asset, const CAccountId& user, const CAmount& debtToCover, const CAccountId& liquidator);

private:
    const CCollateralRegistry& registry;
    CCollateralLedger& ledger;
    CMintBurnController& controller;
};

#endif // DSC_DSC_LIQUIDATION_H
