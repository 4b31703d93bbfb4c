// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/history.h>

#include <logging.h>

std::string CCollateralEvent::ToString() const
{
    if (type == CollateralEventType::Deposited) {
        return tfm::format("CollateralDeposited(user=%s, token=%s, amount=%s)", from, asset, GetDecimalString(amount));
    }
    return tfm::format("CollateralRedeemed(from=%s, to=%s, token=%s, amount=%s)", from, to, asset, GetDecimalString(amount));
}

uint64_t CHistoryView::WriteCollateralEvent(const CCollateralEvent& event)
{
    const auto seq = GetCollateralEventCount();
    WriteBy<CollateralEventKey>(seq, event);
    WriteBy<CollateralEventCount>('\0', seq + 1);
    LogPrint(BCLog::STORAGE, "event #%d %s\n", seq, event.ToString());
    return seq;
}

uint64_t CHistoryView::GetCollateralEventCount() const
{
    uint64_t count{0};
    ReadBy<CollateralEventCount>('\0', count);
    return count;
}

std::optional<CCollateralEvent> CHistoryView::GetCollateralEvent(uint64_t seq) const
{
    return ReadBy<CollateralEventKey, CCollateralEvent>(seq);
}

void CHistoryView::ForEachCollateralEvent(std::function<bool(uint64_t, const CCollateralEvent&)> callback, uint64_t start) const
{
    ForEach<CollateralEventKey, uint64_t, CCollateralEvent>([&](const uint64_t& seq, CLazySerialize<CCollateralEvent> event) {
        return callback(seq, event.get());
    }, start);
}
