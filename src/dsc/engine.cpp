// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/engine.h>

#include <dsc/dscview.h>
#include <dsc/errors.h>
#include <dsc/healthfactor.h>
#include <dsc/interactions.h>
#include <dsc/txvisitor.h>
#include <logging.h>

#include <algorithm>

namespace {

// Clears the in-flight marker when an operation leaves, however it leaves
class CInFlightScope {
public:
    explicit CInFlightScope(std::atomic<std::thread::id>& inFlight) : inFlight(inFlight) {
        inFlight = std::this_thread::get_id();
    }
    ~CInFlightScope() {
        inFlight = std::thread::id{};
    }

private:
    std::atomic<std::thread::id>& inFlight;
};

} // namespace

ResVal<std::unique_ptr<CDscEngine>> CDscEngine::Create(const CEngineParams& params, CCollaborators& collaborators)
{
    auto registry = CCollateralRegistry::Create(params, collaborators);
    if (!registry) {
        LogPrintf("engine construction failed: %s\n", registry.msg);
        return Res(registry);
    }

    std::unique_ptr<CDscEngine> engine(new CDscEngine(*registry));
    LogPrintf("engine %s created, debt token %s, %d collateral tokens, oracle timeout %ds\n",
              params.engineAddress, params.debtToken, params.collateralTokens.size(), params.oracleTimeout);
    return {std::move(engine), Res::Ok()};
}

CDscEngine::CDscEngine(std::shared_ptr<CCollateralRegistry> registry)
    : registry(std::move(registry)), view(std::make_unique<CDscView>()) {}

CDscEngine::~CDscEngine() = default;

Res CDscEngine::Apply(const CEngineMessage& message, std::optional<CLiquidationResult>* liquidation)
{
    if (inFlight.load() == std::this_thread::get_id()) {
        auto res = DscErrors::ReentrantCall();
        LogPrint(BCLog::ENGINE, "%s rejected: %s (%s)\n", ToString(message), res.msg, ToString(res.Code()));
        return res;
    }

    std::lock_guard<std::mutex> lock(cs_engine);
    CInFlightScope scope(inFlight);

    const auto firstEvent = view->GetCollateralEventCount();
    CDscView mnview(*view);
    CInteractionQueue interactions(registry->GetEngineAddress());
    CEngineTxVisitor visitor(mnview, *registry, interactions);

    auto res = std::visit(visitor, message);
    if (res) {
        res = interactions.Execute();
    }
    if (!res) {
        LogPrint(BCLog::ENGINE, "%s rejected: %s (%s)\n", ToString(message), res.msg, ToString(res.Code()));
        mnview.Discard();
        return res;
    }

    {
        std::unique_lock<std::shared_mutex> stateLock(cs_state);
        if (!mnview.Flush()) {
            LogPrintf("ERROR: %s could not be committed\n", ToString(message));
            return Res::Err("failed to commit %s", ToString(message));
        }
    }

    if (liquidation) {
        *liquidation = visitor.LastLiquidation();
    }
    LogPrint(BCLog::ENGINE, "%s committed\n", ToString(message));

    NotifyListeners(firstEvent);
    return Res::Ok();
}

void CDscEngine::NotifyListeners(uint64_t firstEvent)
{
    std::vector<std::shared_ptr<CEngineEventListener>> current;
    {
        std::lock_guard<std::mutex> lock(cs_listeners);
        current = listeners;
    }
    if (current.empty()) {
        return;
    }

    std::vector<CCollateralEvent> events;
    {
        std::shared_lock<std::shared_mutex> stateLock(cs_state);
        view->ForEachCollateralEvent([&](uint64_t, const CCollateralEvent& event) {
            events.push_back(event);
            return true;
        }, firstEvent);
    }

    for (const auto& event : events) {
        for (const auto& listener : current) {
            try {
                if (event.type == CollateralEventType::Deposited) {
                    listener->CollateralDeposited(event.from, event.asset, event.amount);
                } else {
                    listener->CollateralRedeemed(event.from, event.to, event.asset, event.amount);
                }
            } catch (const std::exception& e) {
                LogPrintf("event listener failed on %s: %s\n", event.ToString(), e.what());
            } catch (...) {
                LogPrintf("event listener failed on %s: unknown exception\n", event.ToString());
            }
        }
    }
}

Res CDscEngine::DepositCollateral(const CAccountId& from, const CAssetId& asset, const CAmount& amount)
{
    return Apply(CDepositCollateralMessage{from, asset, amount});
}

Res CDscEngine::MintDsc(const CAccountId& from, const CAmount& amount)
{
    return Apply(CMintDscMessage{from, amount});
}

Res CDscEngine::DepositCollateralAndMintDsc(const CAccountId& from, const CAssetId& asset, const CAmount& amountCollateral, const CAmount& amountDsc)
{
    return Apply(CDepositAndMintMessage{from, asset, amountCollateral, amountDsc});
}

Res CDscEngine::RedeemCollateral(const CAccountId& from, const CAssetId& asset, const CAmount& amount)
{
    return Apply(CRedeemCollateralMessage{from, asset, amount});
}

Res CDscEngine::BurnDsc(const CAccountId& from, const CAmount& amount)
{
    return Apply(CBurnDscMessage{from, amount});
}

Res CDscEngine::RedeemCollateralForDsc(const CAccountId& from, const CAssetId& asset, const CAmount& amountCollateral, const CAmount& amountDsc)
{
    return Apply(CBurnAndRedeemMessage{from, asset, amountCollateral, amountDsc});
}

ResVal<CLiquidationResult> CDscEngine::Liquidate(const CAccountId& liquidator, const CAssetId& asset, const CAccountId& user, const CAmount& debtToCover)
{
    std::optional<CLiquidationResult> result;
    Require(Apply(CLiquidateMessage{liquidator, asset, user, debtToCover}, &result));
    return {*result, Res::Ok()};
}

ResVal<CAmount> CDscEngine::GetUsdValue(const CAssetId& asset, const CAmount& amount) const
{
    return registry->Oracle().GetUsdValue(asset, amount);
}

ResVal<CAmount> CDscEngine::GetTokenAmountFromUsd(const CAssetId& asset, const CAmount& usdAmount) const
{
    return registry->Oracle().GetTokenAmountFromUsd(asset, usdAmount);
}

ResVal<CAccountInformation> CDscEngine::GetAccountInformation(const CAccountId& account) const
{
    std::shared_lock<std::shared_mutex> lock(cs_state);
    auto value = ::GetAccountCollateralValue(*view, *registry, account);
    Require(value);
    return {CAccountInformation{view->GetDebt(account), *value}, Res::Ok()};
}

ResVal<CAmount> CDscEngine::GetAccountCollateralValue(const CAccountId& account) const
{
    std::shared_lock<std::shared_mutex> lock(cs_state);
    return ::GetAccountCollateralValue(*view, *registry, account);
}

CAmount CDscEngine::GetCollateralBalanceOfUser(const CAccountId& account, const CAssetId& asset) const
{
    std::shared_lock<std::shared_mutex> lock(cs_state);
    return view->GetCollateralBalance(account, asset);
}

CAmount CDscEngine::GetDscMinted(const CAccountId& account) const
{
    std::shared_lock<std::shared_mutex> lock(cs_state);
    return view->GetDebt(account);
}

ResVal<CAmount> CDscEngine::GetHealthFactor(const CAccountId& account) const
{
    auto info = GetAccountInformation(account);
    Require(info);
    return ::CalculateHealthFactor(info->totalDscMinted, info->collateralValueInUsd);
}

ResVal<CAmount> CDscEngine::CalculateHealthFactor(const CAmount& totalDscMinted, const CAmount& collateralValueInUsd) const
{
    return ::CalculateHealthFactor(totalDscMinted, collateralValueInUsd);
}

const std::vector<CAssetId>& CDscEngine::GetCollateralTokens() const
{
    return registry->GetCollateralTokens();
}

std::string CDscEngine::GetCollateralTokenPriceFeed(const CAssetId& asset) const
{
    return registry->Oracle().GetFeedRef(asset);
}

const std::string& CDscEngine::GetDebtToken() const
{
    return registry->GetDebtTokenRef();
}

const CAccountId& CDscEngine::GetEngineAddress() const
{
    return registry->GetEngineAddress();
}

int64_t CDscEngine::GetOracleTimeout() const
{
    return registry->Oracle().GetTimeout();
}

uint64_t CDscEngine::GetCollateralEventCount() const
{
    std::shared_lock<std::shared_mutex> lock(cs_state);
    return view->GetCollateralEventCount();
}

void CDscEngine::ForEachCollateralEvent(std::function<bool(uint64_t, const CCollateralEvent&)> callback, uint64_t start) const
{
    std::vector<std::pair<uint64_t, CCollateralEvent>> events;
    {
        std::shared_lock<std::shared_mutex> lock(cs_state);
        view->ForEachCollateralEvent([&](uint64_t id, const CCollateralEvent& event) {
            events.emplace_back(id, event);
            return true;
        }, start);
    }
    for (const auto& [id, event] : events) {
        if (!callback(id, event)) {
            break;
        }
    }
}

void CDscEngine::ForEachDebt(std::function<bool(const CAccountId&, const CAmount&)> callback) const
{
    std::vector<std::pair<CAccountId, CAmount>> debts;
    {
        std::shared_lock<std::shared_mutex> lock(cs_state);
        view->ForEachDebt([&](const CAccountId& account, const CAmount& debt) {
            debts.emplace_back(account, debt);
            return true;
        });
    }
    for (const auto& [account, debt] : debts) {
        if (!callback(account, debt)) {
            break;
        }
    }
}

void CDscEngine::RegisterListener(std::shared_ptr<CEngineEventListener> listener)
{
    std::lock_guard<std::mutex> lock(cs_listeners);
    listeners.push_back(std::move(listener));
}

void CDscEngine::UnregisterListener(const std::shared_ptr<CEngineEventListener>& listener)
{
    std::lock_guard<std::mutex> lock(cs_listeners);
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}
