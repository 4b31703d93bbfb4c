// Copyright (c) 2011-2019 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/params.h>
#include <fs.h>
#include <test/setup_common.h>
#include <util/system.h>
#include <util/time.h>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

static bool ParseArgs(ArgsManager& args, std::vector<const char*> argv, std::string& error)
{
    argv.insert(argv.begin(), "dsc-sim");
    return args.ParseParameters(argv.size(), argv.data(), error);
}

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    ArgsManager testArgs;
    std::string error;

    BOOST_CHECK(ParseArgs(testArgs, {"-debug=engine", "--printtoconsole", "-nodebuglogfile", "-debug=oracle", "ignored", "-after"}, error));
    BOOST_CHECK((testArgs.GetArgs("-debug") == std::vector<std::string>{"engine", "oracle"}));
    BOOST_CHECK(testArgs.GetBoolArg("-printtoconsole", false));
    BOOST_CHECK(testArgs.IsArgNegated("-debuglogfile"));
    BOOST_CHECK(!testArgs.GetBoolArg("-debuglogfile", true));
    // parsing stops at the first non-option
    BOOST_CHECK(!testArgs.IsArgSet("-after"));

    BOOST_CHECK(!ParseArgs(testArgs, {"-"}, error));
    BOOST_CHECK(!error.empty());
}

BOOST_AUTO_TEST_CASE(util_GetArg)
{
    ArgsManager testArgs;
    testArgs.ForceSetArg("-str", "string...");
    testArgs.ForceSetArg("-int", "42");
    testArgs.ForceSetArg("-bool", "0");

    BOOST_CHECK_EQUAL(testArgs.GetArg("-str", "default"), "string...");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-missing", "default"), "default");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-int", int64_t{0}), 42);
    BOOST_CHECK_EQUAL(testArgs.GetArg("-missing", int64_t{7}), 7);
    BOOST_CHECK(!testArgs.GetBoolArg("-bool", true));
    BOOST_CHECK(testArgs.GetBoolArg("-missing", true));

    BOOST_CHECK(!testArgs.SoftSetArg("-str", "other"));
    BOOST_CHECK(testArgs.SoftSetArg("-new", "value"));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-new", ""), "value");

    testArgs.ForceSetMultiArg("-multi", {"a", "b"});
    BOOST_CHECK((testArgs.GetArgs("-multi") == std::vector<std::string>{"a", "b"}));

    testArgs.ClearArgs();
    BOOST_CHECK(!testArgs.IsArgSet("-str"));
}

BOOST_AUTO_TEST_CASE(util_ReadConfigString)
{
    const std::string config =
        "# engine setup\n"
        "collateraltoken=weth\n"
        "collateraltoken = wbtc\n"
        "pricefeed=eth-usd # trailing comment\n"
        "pricefeed=btc-usd\n"
        "debttoken=dsc\n"
        "engineaddress=engine\n"
        "oracletimeout=60\n"
        "nodebuglogfile=1\n";

    ArgsManager testArgs;
    std::string error;
    BOOST_REQUIRE_MESSAGE(testArgs.ReadConfigString(config, error), error);
    BOOST_CHECK(testArgs.IsArgNegated("-debuglogfile"));

    auto params = EngineParamsFromArgs(testArgs);
    BOOST_REQUIRE_MESSAGE(params, params.msg);
    BOOST_CHECK((params->collateralTokens == std::vector<CAssetId>{"weth", "wbtc"}));
    BOOST_CHECK((params->priceFeeds == std::vector<std::string>{"eth-usd", "btc-usd"}));
    BOOST_CHECK_EQUAL(params->debtToken, "dsc");
    BOOST_CHECK_EQUAL(params->engineAddress, "engine");
    BOOST_CHECK_EQUAL(params->oracleTimeout, 60);

    // command line values win over the file
    BOOST_CHECK(ParseArgs(testArgs, {"-debttoken=usd"}, error));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-debttoken", ""), "usd");

    BOOST_CHECK(!testArgs.ReadConfigString("-debttoken=dsc\n", error));
    BOOST_CHECK(!testArgs.ReadConfigString("debttoken\n", error));
}

BOOST_AUTO_TEST_CASE(engine_params_defaults)
{
    ArgsManager testArgs;
    auto params = EngineParamsFromArgs(testArgs);
    BOOST_REQUIRE(params);
    BOOST_CHECK(params->collateralTokens.empty());
    BOOST_CHECK_EQUAL(params->oracleTimeout, DEFAULT_ORACLE_TIMEOUT);

    testArgs.ForceSetArg("-oracletimeout", "0");
    params = EngineParamsFromArgs(testArgs);
    BOOST_CHECK(!params);
}

BOOST_AUTO_TEST_CASE(util_ReadConfigFile)
{
    const fs::path path = fs::temp_directory_path() / fs::unique_path("dsc-%%%%-%%%%.conf");
    {
        fsbridge::ofstream file(path);
        file << "debttoken=fromfile\n";
    }

    ArgsManager testArgs;
    std::string error;
    BOOST_CHECK(ParseArgs(testArgs, {("-conf=" + path.string()).c_str()}, error));
    BOOST_CHECK_EQUAL(testArgs.GetConfigFile(), path);
    BOOST_CHECK(testArgs.ReadConfigFile(testArgs.GetConfigFile(), error));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-debttoken", ""), "fromfile");
    fs::remove(path);

    // an explicitly named file has to exist, the default one does not
    BOOST_CHECK(!testArgs.ReadConfigFile(testArgs.GetConfigFile(), error));
    ArgsManager defaultArgs;
    BOOST_CHECK(defaultArgs.ReadConfigFile(fs::temp_directory_path() / fs::unique_path("missing-%%%%.conf"), error));
}

BOOST_AUTO_TEST_CASE(util_mocktime)
{
    BOOST_CHECK_EQUAL(GetTime(), TEST_MOCK_TIME);
    SetMockTime(TEST_MOCK_TIME + 60);
    BOOST_CHECK_EQUAL(GetTime(), TEST_MOCK_TIME + 60);
    BOOST_CHECK_EQUAL(GetMockTime(), TEST_MOCK_TIME + 60);
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(1317425777), "2011-09-30T23:36:17Z");
    BOOST_CHECK_EQUAL(FormatISO8601Date(1317425777), "2011-09-30");
}

BOOST_AUTO_TEST_SUITE_END()
