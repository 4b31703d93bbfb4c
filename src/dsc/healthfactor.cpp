// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/healthfactor.h>

#include <dsc/params.h>

ResVal<CAmount> CalculateHealthFactor(const CAmount &totalDscMinted, const CAmount &collateralValueInUsd) {
    if (totalDscMinted == 0) {
        return {MaxAmount(), Res::Ok()};
    }
    const CWideAmount adjusted = CWideAmount(collateralValueInUsd) * LIQUIDATION_THRESHOLD / LIQUIDATION_PRECISION;
    const CWideAmount healthFactor = adjusted * CWideAmount(PRECISION) / CWideAmount(totalDscMinted);
    // saturates like the debt-free case
    if (healthFactor > CWideAmount(MaxAmount())) {
        return {MaxAmount(), Res::Ok()};
    }
    return {static_cast<CAmount>(healthFactor), Res::Ok()};
}
