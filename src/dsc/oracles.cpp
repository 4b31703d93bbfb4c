// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/oracles.h>

#include <dsc/errors.h>
#include <dsc/params.h>
#include <logging.h>
#include <util/time.h>

ResVal<CFeedPricePoint> StaleCheckLatestRoundData(const CPriceFeed &feed, const std::string &feedRef, int64_t timeout) {
    const auto round = feed.LatestRoundData();

    if (round.updatedAt == 0) {
        return DscErrors::StalePrice(feedRef, "round was never updated");
    }
    if (round.answeredInRound < round.roundId) {
        return DscErrors::StalePrice(feedRef, tfm::format("answered in round %d, latest round %d", round.answeredInRound, round.roundId));
    }
    const auto now = GetTime();
    if (round.updatedAt > now) {
        return DscErrors::StalePrice(feedRef, tfm::format("updated at %d, after current time %d", round.updatedAt, now));
    }
    // exact for any updatedAt <= now
    const auto age = static_cast<uint64_t>(now) - static_cast<uint64_t>(round.updatedAt);
    if (timeout < 0 || age > static_cast<uint64_t>(timeout)) {
        return DscErrors::StalePrice(feedRef, tfm::format("updated %u seconds ago, timeout %d", age, timeout));
    }
    if (round.answer <= 0) {
        return DscErrors::StalePrice(feedRef, tfm::format("non-positive answer %d", round.answer));
    }

    LogPrint(BCLog::ORACLE, "feed %s: price %d round %d updated %d\n", feedRef, round.answer, round.roundId, round.updatedAt);
    return {CFeedPricePoint{round.answer, round.updatedAt, round.roundId}, Res::Ok()};
}

void COracleAdapter::AddFeed(const CAssetId &asset, const std::string &feedRef, std::shared_ptr<CPriceFeed> feed) {
    feeds[asset] = CFeedEntry{feedRef, std::move(feed)};
}

std::string COracleAdapter::GetFeedRef(const CAssetId &asset) const {
    const auto it = feeds.find(asset);
    return it == feeds.end() ? std::string{} : it->second.ref;
}

ResVal<CFeedPricePoint> COracleAdapter::GetPrice(const CAssetId &asset) const {
    const auto it = feeds.find(asset);
    if (it == feeds.end()) {
        return DscErrors::TokenNotAllowed(asset);
    }

    try {
        return StaleCheckLatestRoundData(*it->second.feed, it->second.ref, timeout);
    } catch (const std::exception &e) {
        return DscErrors::StalePrice(it->second.ref, tfm::format("feed read failed: %s", e.what()));
    } catch (...) {
        return DscErrors::StalePrice(it->second.ref, "feed read failed: unknown exception");
    }
}

ResVal<CAmount> COracleAdapter::GetUsdValue(const CAssetId &asset, const CAmount &amount) const {
    auto price = GetPrice(asset);
    Require(price);

    const auto value = MulDiv(CAmount(price->price) * ADDITIONAL_FEED_PRECISION, amount, PRECISION);
    Require(value, [](const std::string &msg) { return "usd value: " + msg; });
    return value;
}

ResVal<CAmount> COracleAdapter::GetTokenAmountFromUsd(const CAssetId &asset, const CAmount &usdAmount) const {
    auto price = GetPrice(asset);
    Require(price);

    const auto amount = MulDiv(usdAmount, PRECISION, CAmount(price->price) * ADDITIONAL_FEED_PRECISION);
    Require(amount, [](const std::string &msg) { return "token amount: " + msg; });
    return amount;
}
