// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/healthfactor.h>
#include <dsc/params.h>
#include <test/setup_common.h>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(healthfactor_tests, BasicTestingSetup)

static CAmount HealthFactor(const CAmount& debt, const CAmount& value)
{
    auto res = CalculateHealthFactor(debt, value);
    BOOST_REQUIRE(res);
    return *res;
}

BOOST_AUTO_TEST_CASE(debt_free_is_max)
{
    BOOST_CHECK(HealthFactor(0, 0) == MaxAmount());
    BOOST_CHECK(HealthFactor(0, Coins(20000)) == MaxAmount());
}

BOOST_AUTO_TEST_CASE(threshold_adjusted_ratio)
{
    // 10 ETH at $2000 against 100 DSC
    BOOST_CHECK(HealthFactor(Coins(100), Coins(20000)) == Coins(100));
    // exactly at the minimum
    BOOST_CHECK(HealthFactor(Coins(100), Coins(200)) == MIN_HEALTH_FACTOR);
    BOOST_CHECK(HealthFactor(Coins(100), Coins(200) - 1) < MIN_HEALTH_FACTOR);
    // 10 ETH at $1.80 against 10 DSC
    BOOST_CHECK(HealthFactor(Coins(10), Coins(18)) == COIN * 9 / 10);
    BOOST_CHECK(HealthFactor(MaxAmount(), 0) == 0);
}

BOOST_AUTO_TEST_CASE(saturates_instead_of_wrapping)
{
    BOOST_CHECK(HealthFactor(1, MaxAmount()) == MaxAmount());
    BOOST_CHECK(HealthFactor(1, MaxAmount() / COIN) == MaxAmount() / COIN / 2 * COIN);
}

BOOST_AUTO_TEST_CASE(constants)
{
    BOOST_CHECK_EQUAL(LIQUIDATION_THRESHOLD, 50u);
    BOOST_CHECK_EQUAL(LIQUIDATION_BONUS, 10u);
    BOOST_CHECK_EQUAL(LIQUIDATION_PRECISION, 100u);
    BOOST_CHECK(ADDITIONAL_FEED_PRECISION == CAmount(10000000000ULL));
    BOOST_CHECK(PRECISION == COIN);
    BOOST_CHECK(MIN_HEALTH_FACTOR == COIN);
    BOOST_CHECK_EQUAL(DEFAULT_ORACLE_TIMEOUT, 10800);
}

BOOST_AUTO_TEST_SUITE_END()
