// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_ORACLES_H
#define DSC_DSC_ORACLES_H

#include <amount.h>
#include <dsc/interfaces.h>
#include <dsc/res.h>

#include <map>
#include <memory>
#include <string>

struct CFeedPricePoint {
    CFeedPrice price;
    int64_t updatedAt;
    uint64_t roundId;
};

/**
 * Reads the latest round of a feed and rejects it when it cannot be trusted:
 * never updated, answered in an older round, updated in the future, older
 * than timeout seconds or not positive.
 */
ResVal<CFeedPricePoint> StaleCheckLatestRoundData(const CPriceFeed &feed, const std::string &feedRef, int64_t timeout);

/** Converts between asset amounts and USD values through the registered feeds */
class COracleAdapter {
public:
    explicit COracleAdapter(int64_t timeout) : timeout(timeout) {}

    void AddFeed(const CAssetId &asset, const std::string &feedRef, std::shared_ptr<CPriceFeed> feed);

    ResVal<CFeedPricePoint> GetPrice(const CAssetId &asset) const;

    /** (price * 1e10) * amount / 1e18 */
    ResVal<CAmount> GetUsdValue(const CAssetId &asset, const CAmount &amount) const;

    /** usd * 1e18 / (price * 1e10) */
    ResVal<CAmount> GetTokenAmountFromUsd(const CAssetId &asset, const CAmount &usdAmount) const;

    bool HasFeed(const CAssetId &asset) const { return feeds.count(asset) != 0; }
    std::string GetFeedRef(const CAssetId &asset) const;
    int64_t GetTimeout() const { return timeout; }

private:
    struct CFeedEntry {
        std::string ref;
        std::shared_ptr<CPriceFeed> feed;
    };

    const int64_t timeout;
    std::map<CAssetId, CFeedEntry> feeds;
};

#endif // DSC_DSC_ORACLES_H
