// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_PARAMS_H
#define DSC_DSC_PARAMS_H

#include <amount.h>
#include <dsc/res.h>

#include <cstdint>
#include <string>
#include <vector>

class ArgsManager;

/** Collateral value counted towards solvency, in percent */
static constexpr uint32_t LIQUIDATION_THRESHOLD = 50;
/** Extra collateral paid to a liquidator, in percent */
static constexpr uint32_t LIQUIDATION_BONUS = 10;
static constexpr uint32_t LIQUIDATION_PRECISION = 100;

/** Feed answers carry 8 decimals, amounts 18 */
static const CAmount ADDITIONAL_FEED_PRECISION{10000000000ULL};
static const CAmount PRECISION = COIN;
static const CAmount MIN_HEALTH_FACTOR = COIN;

/** Answers older than this are stale */
static constexpr int64_t DEFAULT_ORACLE_TIMEOUT = 3 * 60 * 60;

struct CEngineParams {
    std::vector<CAssetId> collateralTokens;
    std::vector<std::string> priceFeeds;
    std::string debtToken;
    CAccountId engineAddress;
    int64_t oracleTimeout{DEFAULT_ORACLE_TIMEOUT};
};

/** -collateraltoken and -pricefeed are multi-valued and paired by position */
ResVal<CEngineParams> EngineParamsFromArgs(const ArgsManager &args);

#endif // DSC_DSC_PARAMS_H
