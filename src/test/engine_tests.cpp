// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/engine.h>
#include <test/setup_common.h>
#include <util/time.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

class CRecordingListener : public CEngineEventListener {
public:
    std::vector<std::string> events;

    void CollateralDeposited(const CAccountId& user, const CAssetId& asset, const CAmount& amount) override
    {
        events.push_back(tfm::format("deposited:%s:%s:%s", user, asset, GetDecimalString(amount)));
    }
    void CollateralRedeemed(const CAccountId& from, const CAccountId& to, const CAssetId& asset, const CAmount& amount) override
    {
        events.push_back(tfm::format("redeemed:%s:%s:%s:%s", from, to, asset, GetDecimalString(amount)));
    }
};

class CThrowingListener : public CEngineEventListener {
public:
    void CollateralDeposited(const CAccountId&, const CAssetId&, const CAmount&) override
    {
        throw std::runtime_error("listener failure");
    }
};

class CUnknownThrowingListener : public CEngineEventListener {
public:
    void CollateralDeposited(const CAccountId&, const CAssetId&, const CAmount&) override
    {
        throw 42;
    }
};

/** Calls back into the engine from the notification */
class CReentrantListener : public CEngineEventListener {
public:
    CDscEngine* engine{nullptr};
    std::vector<Res> results;

    void CollateralDeposited(const CAccountId& user, const CAssetId&, const CAmount&) override
    {
        results.push_back(engine->MintDsc(user, COIN));
    }
};

void CheckInvariant(const CDscEngine& engine, const CAccountId& account)
{
    auto healthFactor = engine.GetHealthFactor(account);
    BOOST_REQUIRE(healthFactor);
    BOOST_CHECK(engine.GetDscMinted(account) == 0 || *healthFactor >= MIN_HEALTH_FACTOR);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(engine_tests, TestingSetup)

BOOST_AUTO_TEST_CASE(getters)
{
    BOOST_CHECK((engine->GetCollateralTokens() == std::vector<CAssetId>{WETH, WBTC}));
    BOOST_CHECK_EQUAL(engine->GetCollateralTokenPriceFeed(WETH), "eth-usd");
    BOOST_CHECK_EQUAL(engine->GetCollateralTokenPriceFeed(DSC), "");
    BOOST_CHECK_EQUAL(engine->GetDebtToken(), DSC);
    BOOST_CHECK_EQUAL(engine->GetEngineAddress(), ENGINE_ADDRESS);
    BOOST_CHECK_EQUAL(engine->GetOracleTimeout(), DEFAULT_ORACLE_TIMEOUT);

    BOOST_CHECK(CDscEngine::GetPrecision() == COIN);
    BOOST_CHECK(CDscEngine::GetAdditionalFeedPrecision() == CAmount(10000000000ULL));
    BOOST_CHECK_EQUAL(CDscEngine::GetLiquidationThreshold(), 50u);
    BOOST_CHECK_EQUAL(CDscEngine::GetLiquidationBonus(), 10u);
    BOOST_CHECK_EQUAL(CDscEngine::GetLiquidationPrecision(), 100u);
    BOOST_CHECK(CDscEngine::GetMinHealthFactor() == COIN);

    auto usd = engine->GetUsdValue(WETH, Coins(15));
    BOOST_REQUIRE(usd);
    BOOST_CHECK(*usd == Coins(30000));
    auto amount = engine->GetTokenAmountFromUsd(WETH, Coins(100));
    BOOST_REQUIRE(amount);
    BOOST_CHECK(*amount == COIN / 20);

    auto healthFactor = engine->CalculateHealthFactor(Coins(100), Coins(1000));
    BOOST_REQUIRE(healthFactor);
    BOOST_CHECK(*healthFactor == Coins(5));
    healthFactor = engine->GetHealthFactor(USER);
    BOOST_REQUIRE(healthFactor);
    BOOST_CHECK(*healthFactor == MaxAmount());
}

BOOST_AUTO_TEST_CASE(usd_round_trip)
{
    for (const CAmount& amount : {CAmount(1), CAmount(12345), Coins(1), Coins(3) / 7, Coins(1000000)}) {
        auto usd = engine->GetUsdValue(WBTC, amount);
        BOOST_REQUIRE(usd);
        auto back = engine->GetTokenAmountFromUsd(WBTC, *usd);
        BOOST_REQUIRE(back);
        BOOST_CHECK(amount - *back <= 1);
    }
}

BOOST_AUTO_TEST_CASE(deposit_collateral)
{
    auto listener = std::make_shared<CRecordingListener>();
    engine->RegisterListener(listener);

    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(10)));
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == Coins(10));
    BOOST_CHECK(weth->BalanceOf(USER) == STARTING_BALANCE - Coins(10));
    BOOST_CHECK(weth->BalanceOf(ENGINE_ADDRESS) == Coins(10));
    BOOST_CHECK_EQUAL(engine->GetCollateralEventCount(), 1u);
    BOOST_CHECK((listener->events == std::vector<std::string>{"deposited:user:weth:10.000000000000000000"}));

    auto info = engine->GetAccountInformation(USER);
    BOOST_REQUIRE(info);
    BOOST_CHECK(info->totalDscMinted == 0);
    BOOST_CHECK(info->collateralValueInUsd == Coins(20000));
    auto value = engine->GetAccountCollateralValue(USER);
    BOOST_REQUIRE(value);
    BOOST_CHECK(*value == Coins(20000));

    engine->UnregisterListener(listener);
    BOOST_CHECK(engine->DepositCollateral(USER, WBTC, Coins(1)));
    BOOST_CHECK_EQUAL(listener->events.size(), 1u);
}

BOOST_AUTO_TEST_CASE(deposit_boundaries)
{
    auto res = engine->DepositCollateral(USER, WETH, 0);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ValidationError);

    res = engine->DepositCollateral(USER, "link", COIN);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ValidationError);

    // no allowance, the pull is refused
    weth->Approve(USER, ENGINE_ADDRESS, 0);
    res = engine->DepositCollateral(USER, WETH, COIN);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ExternalTransferFailure);

    // more than the user holds
    weth->Approve(USER, ENGINE_ADDRESS, MaxAmount());
    res = engine->DepositCollateral(USER, WETH, STARTING_BALANCE + 1);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ExternalTransferFailure);

    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == 0);
    BOOST_CHECK_EQUAL(engine->GetCollateralEventCount(), 0u);
    BOOST_CHECK(weth->BalanceOf(USER) == STARTING_BALANCE);
}

BOOST_AUTO_TEST_CASE(deposit_then_redeem_has_no_effect)
{
    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(7)));
    BOOST_CHECK(engine->RedeemCollateral(USER, WETH, Coins(7)));

    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == 0);
    BOOST_CHECK(weth->BalanceOf(USER) == STARTING_BALANCE);
    BOOST_CHECK(weth->BalanceOf(ENGINE_ADDRESS) == 0);
    BOOST_CHECK_EQUAL(engine->GetCollateralEventCount(), 2u);

    std::vector<CCollateralEvent> events;
    engine->ForEachCollateralEvent([&](uint64_t, const CCollateralEvent& event) {
        events.push_back(event);
        return true;
    });
    BOOST_REQUIRE_EQUAL(events.size(), 2u);
    BOOST_CHECK((events[1] == CCollateralEvent{CollateralEventType::Redeemed, USER, USER, WETH, Coins(7)}));
}

BOOST_AUTO_TEST_CASE(iteration_callbacks_may_call_the_engine)
{
    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(2)));
    BOOST_CHECK(engine->DepositCollateralAndMintDsc(LIQUIDATOR, WBTC, Coins(1), Coins(10)));

    std::vector<Res> results;
    engine->ForEachCollateralEvent([&](uint64_t, const CCollateralEvent& event) {
        results.push_back(engine->DepositCollateral(event.from, event.asset, COIN));
        return true;
    });
    BOOST_REQUIRE_EQUAL(results.size(), 2u);
    BOOST_CHECK(results[0] && results[1]);
    BOOST_CHECK_EQUAL(engine->GetCollateralEventCount(), 4u);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == Coins(3));

    engine->ForEachDebt([&](const CAccountId& account, const CAmount&) {
        results.push_back(engine->BurnDsc(account, COIN));
        return false;
    });
    BOOST_REQUIRE_EQUAL(results.size(), 3u);
    BOOST_CHECK(results[2]);
    BOOST_CHECK(engine->GetDscMinted(LIQUIDATOR) == Coins(9));
}

BOOST_AUTO_TEST_CASE(mint_and_burn)
{
    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(10)));

    auto res = engine->MintDsc(USER, Coins(10001));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::SolvencyViolation);
    BOOST_CHECK(engine->GetDscMinted(USER) == 0);

    BOOST_CHECK(engine->MintDsc(USER, Coins(10000)));
    BOOST_CHECK(engine->GetDscMinted(USER) == Coins(10000));
    BOOST_CHECK(dsc->BalanceOf(USER) == Coins(10000));

    res = engine->BurnDsc(USER, 0);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ValidationError);

    res = engine->BurnDsc(USER, Coins(10001));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::InsufficientFunds);

    BOOST_CHECK(engine->BurnDsc(USER, Coins(4000)));
    BOOST_CHECK(engine->GetDscMinted(USER) == Coins(6000));
    BOOST_CHECK(dsc->BalanceOf(USER) == Coins(6000));
    BOOST_CHECK(dsc->TotalSupply() == Coins(6000));

    std::vector<CAccountId> debtors;
    engine->ForEachDebt([&](const CAccountId& account, const CAmount&) {
        debtors.push_back(account);
        return true;
    });
    BOOST_CHECK((debtors == std::vector<CAccountId>{USER}));
}

BOOST_AUTO_TEST_CASE(redeem_keeps_solvency)
{
    BOOST_CHECK(engine->DepositCollateralAndMintDsc(USER, WETH, Coins(10), Coins(5000)));

    auto res = engine->RedeemCollateral(USER, WETH, Coins(6));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::SolvencyViolation);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == Coins(10));

    res = engine->RedeemCollateral(USER, WETH, 0);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ValidationError);

    res = engine->RedeemCollateral(USER, WBTC, 1);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::InsufficientFunds);

    BOOST_CHECK(engine->RedeemCollateral(USER, WETH, Coins(5)));
    auto healthFactor = engine->GetHealthFactor(USER);
    BOOST_REQUIRE(healthFactor);
    BOOST_CHECK(*healthFactor == MIN_HEALTH_FACTOR);
}

BOOST_AUTO_TEST_CASE(redeem_collateral_for_dsc)
{
    BOOST_CHECK(engine->DepositCollateralAndMintDsc(USER, WETH, Coins(10), Coins(10000)));

    auto res = engine->RedeemCollateralForDsc(USER, WETH, Coins(1), 0);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ValidationError);
    res = engine->RedeemCollateralForDsc(USER, WETH, 0, Coins(1));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ValidationError);

    // burning too little for the collateral taken
    res = engine->RedeemCollateralForDsc(USER, WETH, Coins(5), Coins(4000));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::SolvencyViolation);

    BOOST_CHECK(engine->RedeemCollateralForDsc(USER, WETH, Coins(10), Coins(10000)));
    BOOST_CHECK(engine->GetDscMinted(USER) == 0);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == 0);
    BOOST_CHECK(weth->BalanceOf(USER) == STARTING_BALANCE);
    BOOST_CHECK(dsc->BalanceOf(USER) == 0);
    BOOST_CHECK(dsc->TotalSupply() == 0);
}

BOOST_AUTO_TEST_CASE(failed_mint_returns_collateral)
{
    dsc->SetRefusing(TokenCall::Mint, true);

    auto res = engine->DepositCollateralAndMintDsc(USER, WETH, Coins(10), Coins(100));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ExternalTransferFailure);

    // the pulled collateral went back and nothing was recorded
    BOOST_CHECK(weth->BalanceOf(USER) == STARTING_BALANCE);
    BOOST_CHECK(weth->BalanceOf(ENGINE_ADDRESS) == 0);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == 0);
    BOOST_CHECK(engine->GetDscMinted(USER) == 0);
    BOOST_CHECK_EQUAL(engine->GetCollateralEventCount(), 0u);

    dsc->SetRefusing(TokenCall::Mint, false);
    BOOST_CHECK(engine->DepositCollateralAndMintDsc(USER, WETH, Coins(10), Coins(100)));
}

BOOST_AUTO_TEST_CASE(throwing_token_is_contained)
{
    BOOST_CHECK(engine->DepositCollateralAndMintDsc(USER, WETH, Coins(10), Coins(100)));

    weth->SetThrowing(TokenCall::Transfer, true);
    auto res = engine->RedeemCollateralForDsc(USER, WETH, Coins(1), Coins(100));
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ExternalTransferFailure);
    BOOST_CHECK(res.msg.find("reverted") != std::string::npos);

    // the burn was undone by minting back to the engine, the DSC pull by returning it
    BOOST_CHECK(engine->GetDscMinted(USER) == Coins(100));
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == Coins(10));
    BOOST_CHECK(dsc->BalanceOf(USER) == Coins(100));
    BOOST_CHECK(dsc->TotalSupply() == Coins(100));
    BOOST_CHECK(dsc->BalanceOf(ENGINE_ADDRESS) == 0);
    weth->SetThrowing(TokenCall::Transfer, false);
}

BOOST_AUTO_TEST_CASE(unknown_exception_is_contained)
{
    dsc->SetHook([](TokenCall call) {
        if (call == TokenCall::Mint) {
            throw 42;
        }
    });

    Res res = Res::Ok();
    BOOST_CHECK_NO_THROW(res = engine->DepositCollateralAndMintDsc(USER, WETH, Coins(10), Coins(100)));
    dsc->SetHook(nullptr);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::ExternalTransferFailure);

    // the pulled collateral went back and nothing was recorded
    BOOST_CHECK(weth->BalanceOf(USER) == STARTING_BALANCE);
    BOOST_CHECK(weth->BalanceOf(ENGINE_ADDRESS) == 0);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == 0);
    BOOST_CHECK(engine->GetDscMinted(USER) == 0);

    auto listener = std::make_shared<CUnknownThrowingListener>();
    engine->RegisterListener(listener);
    BOOST_CHECK_NO_THROW(res = engine->DepositCollateral(USER, WETH, Coins(1)));
    BOOST_CHECK(res);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == Coins(1));
}

BOOST_AUTO_TEST_CASE(stale_prices_freeze_risk_operations)
{
    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(10)));
    SetMockTime(TEST_MOCK_TIME + DEFAULT_ORACLE_TIMEOUT + 1);

    // deposits need no price
    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(1)));

    auto res = engine->MintDsc(USER, COIN);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::StaleOracleData);

    res = engine->RedeemCollateral(USER, WETH, COIN);
    BOOST_CHECK(!res);
    BOOST_CHECK(res.Code() == DscErrCodes::StaleOracleData);

    BOOST_CHECK(!engine->GetHealthFactor(USER));
    BOOST_CHECK(!engine->GetAccountInformation(USER));

    SetEthPrice(ETH_USD_PRICE);
    btcUsd->UpdateAnswer(BTC_USD_PRICE);
    BOOST_CHECK(engine->MintDsc(USER, COIN));
}

BOOST_AUTO_TEST_CASE(reentrant_token_hook)
{
    std::vector<Res> nested;
    weth->SetHook([&](TokenCall call) {
        if (call == TokenCall::TransferFrom) {
            nested.push_back(engine->DepositCollateral(LIQUIDATOR, WETH, COIN));
        }
    });

    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(2)));
    weth->SetHook(nullptr);

    BOOST_REQUIRE_EQUAL(nested.size(), 1u);
    BOOST_CHECK(!nested[0]);
    BOOST_CHECK(nested[0].Code() == DscErrCodes::ReentrantCall);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WETH) == Coins(2));
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(LIQUIDATOR, WETH) == 0);

    // the guard is released afterwards
    BOOST_CHECK(engine->DepositCollateral(LIQUIDATOR, WETH, COIN));
}

BOOST_AUTO_TEST_CASE(listeners)
{
    auto recording = std::make_shared<CRecordingListener>();
    auto reentrant = std::make_shared<CReentrantListener>();
    reentrant->engine = engine.get();
    engine->RegisterListener(std::make_shared<CThrowingListener>());
    engine->RegisterListener(reentrant);
    engine->RegisterListener(recording);

    BOOST_CHECK(engine->DepositCollateral(USER, WETH, Coins(10)));
    BOOST_CHECK(engine->MintDsc(USER, Coins(100)));
    BOOST_CHECK(engine->RedeemCollateral(USER, WETH, Coins(1)));

    BOOST_CHECK((recording->events == std::vector<std::string>{
        "deposited:user:weth:10.000000000000000000",
        "redeemed:user:user:weth:1.000000000000000000",
    }));
    BOOST_REQUIRE_EQUAL(reentrant->results.size(), 1u);
    BOOST_CHECK(reentrant->results[0].Code() == DscErrCodes::ReentrantCall);
    BOOST_CHECK(engine->GetDscMinted(USER) == Coins(100));
}

BOOST_AUTO_TEST_CASE(solvency_invariant_holds)
{
    const std::vector<std::function<Res()>> operations = {
        [&] { return engine->DepositCollateralAndMintDsc(USER, WETH, Coins(5), Coins(4000)); },
        [&] { return engine->MintDsc(USER, Coins(1000)); },
        [&] { return engine->MintDsc(USER, Coins(1)); },
        [&] { return engine->RedeemCollateral(USER, WETH, COIN); },
        [&] { return engine->DepositCollateral(USER, WBTC, Coins(2)); },
        [&] { return engine->RedeemCollateral(USER, WETH, COIN); },
        [&] { SetEthPrice(2500 * 100000000LL); return engine->MintDsc(USER, Coins(500)); },
        [&] { return engine->BurnDsc(USER, Coins(2000)); },
        [&] { return engine->RedeemCollateralForDsc(USER, WBTC, Coins(2), Coins(3000)); },
        [&] { return engine->RedeemCollateralForDsc(USER, WETH, Coins(4), Coins(500)); },
        [&] { return engine->RedeemCollateral(USER, WETH, Coins(4)); },
    };

    size_t succeeded{0};
    for (const auto& operation : operations) {
        if (operation()) {
            ++succeeded;
        }
        CheckInvariant(*engine, USER);
    }
    BOOST_CHECK(succeeded > 0 && succeeded < operations.size());
}

BOOST_AUTO_TEST_CASE(concurrent_deposits)
{
    constexpr int THREADS = 4;
    constexpr int DEPOSITS = 25;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < DEPOSITS; ++j) {
                if (!engine->DepositCollateral(USER, WBTC, COIN / 100)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(failures.load(), 0);
    BOOST_CHECK(engine->GetCollateralBalanceOfUser(USER, WBTC) == Coins(1));
    BOOST_CHECK(wbtc->BalanceOf(ENGINE_ADDRESS) == Coins(1));
    BOOST_CHECK_EQUAL(engine->GetCollateralEventCount(), uint64_t(THREADS * DEPOSITS));
}

BOOST_AUTO_TEST_SUITE_END()
