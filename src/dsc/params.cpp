// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/params.h>

#include <util/system.h>

ResVal<CEngineParams> EngineParamsFromArgs(const ArgsManager &args) {
    CEngineParams params;
    params.collateralTokens = args.GetArgs("-collateraltoken");
    params.priceFeeds = args.GetArgs("-pricefeed");
    params.debtToken = args.GetArg("-debttoken", "");
    params.engineAddress = args.GetArg("-engineaddress", "");
    params.oracleTimeout = args.GetArg("-oracletimeout", DEFAULT_ORACLE_TIMEOUT);

    Require(params.oracleTimeout > 0, "-oracletimeout must be positive, got %d", params.oracleTimeout);
    return {params, Res::Ok()};
}
