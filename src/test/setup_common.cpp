// Copyright (c) 2011-2019 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <test/setup_common.h>

#include <logging.h>
#include <util/time.h>

#include <boost/test/unit_test.hpp>

const CAmount TestingSetup::STARTING_BALANCE = Coins(100);

BasicTestingSetup::BasicTestingSetup()
{
    SetMockTime(TEST_MOCK_TIME);
    auto& logger = LogInstance();
    logger.m_print_to_file = false;
    logger.m_print_to_console = false;
    logger.EnableCategory(BCLog::ALL);
    logger.StartLogging();
}

BasicTestingSetup::~BasicTestingSetup()
{
    LogInstance().DisconnectTestLogger();
    LogInstance().DisableCategory(BCLog::ALL);
    SetMockTime(0);
}

TestingSetup::TestingSetup()
{
    weth = std::make_shared<CMemoryToken>(WETH, "deployer");
    wbtc = std::make_shared<CMemoryToken>(WBTC, "deployer");
    dsc = std::make_shared<CMemoryToken>(DSC, ENGINE_ADDRESS);
    ethUsd = std::make_shared<CMemoryPriceFeed>(ETH_USD_PRICE);
    btcUsd = std::make_shared<CMemoryPriceFeed>(BTC_USD_PRICE);

    collaborators.AddToken(WETH, weth);
    collaborators.AddToken(WBTC, wbtc);
    collaborators.AddToken(DSC, dsc);
    collaborators.AddFeed("eth-usd", ethUsd);
    collaborators.AddFeed("btc-usd", btcUsd);

    params.collateralTokens = {WETH, WBTC};
    params.priceFeeds = {"eth-usd", "btc-usd"};
    params.debtToken = DSC;
    params.engineAddress = ENGINE_ADDRESS;

    auto created = CDscEngine::Create(params, collaborators);
    BOOST_REQUIRE_MESSAGE(created, created.msg);
    engine = std::move(*created);

    for (const auto& account : {USER, LIQUIDATOR}) {
        weth->Faucet(account, STARTING_BALANCE);
        wbtc->Faucet(account, STARTING_BALANCE);
        ApproveAll(account);
    }
}

void TestingSetup::ApproveAll(const CAccountId& account, const CAmount& amount)
{
    weth->Approve(account, ENGINE_ADDRESS, amount);
    wbtc->Approve(account, ENGINE_ADDRESS, amount);
    dsc->Approve(account, ENGINE_ADDRESS, amount);
}

void TestingSetup::SetEthPrice(CFeedPrice answer)
{
    ethUsd->UpdateAnswer(answer);
}
