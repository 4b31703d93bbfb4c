// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_HEALTHFACTOR_H
#define DSC_DSC_HEALTHFACTOR_H

#include <amount.h>
#include <dsc/res.h>

/**
 * Ratio of threshold-adjusted collateral value to debt, 18 decimals.
 * An account without debt is infinitely healthy and gets MaxAmount().
 */
ResVal<CAmount> CalculateHealthFactor(const CAmount &totalDscMinted, const CAmount &collateralValueInUsd);

#endif // DSC_DSC_HEALTHFACTOR_H
