// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_HISTORY_H
#define DSC_DSC_HISTORY_H

#include <amount.h>
#include <flushablestorage.h>

#include <functional>
#include <string>

enum class CollateralEventType : uint8_t {
    Deposited = 'd',
    Redeemed  = 'r',
};

/**
 * Collateral movement. A deposit moves from the user into the engine
 * custody account, a redemption or seizure moves from the debtor to the
 * receiver.
 */
struct CCollateralEvent {
    CollateralEventType type{CollateralEventType::Deposited};
    CAccountId from;
    CAccountId to;
    CAssetId asset;
    CAmount amount;

    std::string ToString() const;

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action)
    {
        auto rawType = static_cast<uint8_t>(type);
        READWRITE(rawType);
        if (ser_action.ForRead()) {
            type = static_cast<CollateralEventType>(rawType);
        }
        READWRITE(from);
        READWRITE(to);
        READWRITE(asset);
        READWRITE(amount);
    }

    friend bool operator==(const CCollateralEvent& a, const CCollateralEvent& b)
    {
        return a.type == b.type && a.from == b.from && a.to == b.to && a.asset == b.asset && a.amount == b.amount;
    }
};

/** Append-only log of collateral events, numbered from zero */
class CHistoryView : public virtual CStorageView
{
public:
    uint64_t WriteCollateralEvent(const CCollateralEvent& event);
    uint64_t GetCollateralEventCount() const;
    std::optional<CCollateralEvent> GetCollateralEvent(uint64_t seq) const;
    void ForEachCollateralEvent(std::function<bool(uint64_t, const CCollateralEvent&)> callback, uint64_t start = 0) const;

    struct CollateralEventKey   { static constexpr uint8_t prefix() { return 'e'; } };
    struct CollateralEventCount { static constexpr uint8_t prefix() { return 'E'; } };
};

#endif // DSC_DSC_HISTORY_H
