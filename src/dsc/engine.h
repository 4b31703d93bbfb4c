// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_ENGINE_H
#define DSC_DSC_ENGINE_H

#include <amount.h>
#include <dsc/collateral.h>
#include <dsc/history.h>
#include <dsc/interfaces.h>
#include <dsc/liquidation.h>
#include <dsc/messages.h>
#include <dsc/params.h>
#include <dsc/res.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

class CDscView;

/** Notified after an operation committed, in event order */
class CEngineEventListener {
public:
    virtual ~CEngineEventListener() = default;
    virtual void CollateralDeposited(const CAccountId& user, const CAssetId& asset, const CAmount& amount) {}
    virtual void CollateralRedeemed(const CAccountId& from, const CAccountId& to, const CAssetId& asset, const CAmount& amount) {}
};

struct CAccountInformation {
    CAmount totalDscMinted;
    CAmount collateralValueInUsd;
};

/**
 * Overcollateralized DSC engine.
 *
 * Every mutating call is one all-or-nothing operation: it runs on a child view
 * of the committed ledger, collaborator calls are made once all checks passed
 * and the child is flushed only when they all succeeded. Calls are serialized
 * per instance, a nested call from the thread running an operation (e.g. from
 * a token hook or an event listener) fails with ReentrantCall.
 *
 * Reads see the last committed state.
 */
class CDscEngine {
public:
    static ResVal<std::unique_ptr<CDscEngine>> Create(const CEngineParams& params, CCollaborators& collaborators);
    ~CDscEngine();

    CDscEngine(const CDscEngine&) = delete;
    CDscEngine& operator=(const CDscEngine&) = delete;

    Res DepositCollateral(const CAccountId& from, const CAssetId& asset, const CAmount& amount);
    Res MintDsc(const CAccountId& from, const CAmount& amount);
    Res DepositCollateralAndMintDsc(const CAccountId& from, const CAssetId& asset, const CAmount& amountCollateral, const CAmount& amountDsc);
    Res RedeemCollateral(const CAccountId& from, const CAssetId& asset, const CAmount& amount);
    Res BurnDsc(const CAccountId& from, const CAmount& amount);
    Res RedeemCollateralForDsc(const CAccountId& from, const CAssetId& asset, const CAmount& amountCollateral, const CAmount& amountDsc);
    ResVal<CLiquidationResult> Liquidate(const CAccountId& liquidator, const CAssetId& asset, const CAccountId& user, const CAmount& debtToCover);

    ResVal<CAmount> GetUsdValue(const CAssetId& asset, const CAmount& amount) const;
    ResVal<CAmount> GetTokenAmountFromUsd(const CAssetId& asset, const CAmount& usdAmount) const;
    ResVal<CAccountInformation> GetAccountInformation(const CAccountId& account) const;
    ResVal<CAmount> GetAccountCollateralValue(const CAccountId& account) const;
    CAmount GetCollateralBalanceOfUser(const CAccountId& account, const CAssetId& asset) const;
    CAmount GetDscMinted(const CAccountId& account) const;
    ResVal<CAmount> GetHealthFactor(const CAccountId& account) const;
    ResVal<CAmount> CalculateHealthFactor(const CAmount& totalDscMinted, const CAmount& collateralValueInUsd) const;

    const std::vector<CAssetId>& GetCollateralTokens() const;
    std::string GetCollateralTokenPriceFeed(const CAssetId& asset) const;
    const std::string& GetDebtToken() const;
    const CAccountId& GetEngineAddress() const;
    int64_t GetOracleTimeout() const;

    static CAmount GetPrecision() { return PRECISION; }
    static CAmount GetAdditionalFeedPrecision() { return ADDITIONAL_FEED_PRECISION; }
    static uint32_t GetLiquidationThreshold() { return LIQUIDATION_THRESHOLD; }
    static uint32_t GetLiquidationBonus() { return LIQUIDATION_BONUS; }
    static uint32_t GetLiquidationPrecision() { return LIQUIDATION_PRECISION; }
    static CAmount GetMinHealthFactor() { return MIN_HEALTH_FACTOR; }

    uint64_t GetCollateralEventCount() const;
    /** Iterates a snapshot taken when the call starts, the callback may call back into the engine */
    void ForEachCollateralEvent(std::function<bool(uint64_t, const CCollateralEvent&)> callback, uint64_t start = 0) const;
    /** Accounts with debt, in account order, from a snapshot like ForEachCollateralEvent */
    void ForEachDebt(std::function<bool(const CAccountId&, const CAmount&)> callback) const;

    void RegisterListener(std::shared_ptr<CEngineEventListener> listener);
    void UnregisterListener(const std::shared_ptr<CEngineEventListener>& listener);

private:
    CDscEngine(std::shared_ptr<CCollateralRegistry> registry);

    Res Apply(const CEngineMessage& message, std::optional<CLiquidationResult>* liquidation = nullptr);
    void NotifyListeners(uint64_t firstEvent);

    const std::shared_ptr<CCollateralRegistry> registry;

    std::mutex cs_engine;
    std::atomic<std::thread::id> inFlight{};

    mutable std::shared_mutex cs_state;
    std::unique_ptr<CDscView> view; // GUARDED_BY(cs_state)

    std::mutex cs_listeners;
    std::vector<std::shared_ptr<CEngineEventListener>> listeners;
};

#endif // DSC_DSC_ENGINE_H
