// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/engine.h>
#include <dsc/memorytokens.h>
#include <dsc/params.h>
#include <fs.h>
#include <logging.h>
#include <util/system.h>
#include <util/time.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

static const char* const DEFAULT_DEBT_TOKEN = "dsc";
static const char* const DEFAULT_ENGINE_ADDRESS = "engine";
static const char* const DEFAULT_DEPLOYER = "deployer";

static bool HelpRequested(const ArgsManager& args)
{
    return args.IsArgSet("-?") || args.IsArgSet("-h") || args.IsArgSet("-help");
}

static std::string HelpMessage()
{
    return
        "Usage:  dsc-sim [options] < commands\n"
        "\n"
        "Options:\n"
        "  -conf=<file>              Configuration file (default: " + std::string(DSC_CONF_FILENAME) + ")\n"
        "  -collateraltoken=<ref>    Collateral token, repeat for every type (default: weth, wbtc)\n"
        "  -pricefeed=<ref>          Price feed of the collateral token at the same position\n"
        "  -initialprice=<price>     Starting USD price of the feed at the same position\n"
        "  -debttoken=<ref>          Debt token (default: " + std::string(DEFAULT_DEBT_TOKEN) + ")\n"
        "  -engineaddress=<account>  Custody account of the engine (default: " + std::string(DEFAULT_ENGINE_ADDRESS) + ")\n"
        "  -oracletimeout=<n>        Seconds before a price is stale (default: " + std::to_string(DEFAULT_ORACLE_TIMEOUT) + ")\n"
        "  -mocktime=<n>             Start the simulated clock at this unix time (default: now)\n"
        "  -debug=<category>         Log category, repeatable: " + ListLogCategories() + "\n"
        "  -printtoconsole           Send log output to the console\n"
        "  -debuglogfile=<file>      Log file (default: " + std::string(DEFAULT_DEBUGLOGFILE) + "), -nodebuglogfile disables it\n"
        "\n"
        "Commands:\n"
        "  deposit <account> <token> <amount>\n"
        "  mint <account> <amount>\n"
        "  depositmint <account> <token> <collateral> <dsc>\n"
        "  burn <account> <amount>\n"
        "  redeem <account> <token> <amount>\n"
        "  burnredeem <account> <token> <collateral> <dsc>\n"
        "  liquidate <liquidator> <token> <user> <debt>\n"
        "  setprice <token> <price>\n"
        "  approve <token> <owner> <amount>      allow the engine to pull\n"
        "  faucet <token> <account> <amount>\n"
        "  balance <token> <account>\n"
        "  info <account>\n"
        "  hf <account>\n"
        "  events [start]\n"
        "  warp <seconds>\n";
}

/** Applies dsc-sim defaults for keys neither the command line nor the config file set */
static void SoftSetSimulationArgs(ArgsManager& args)
{
    if (!args.IsArgSet("-collateraltoken") && !args.IsArgSet("-pricefeed")) {
        args.ForceSetMultiArg("-collateraltoken", {"weth", "wbtc"});
        args.ForceSetMultiArg("-pricefeed", {"weth-usd", "wbtc-usd"});
        if (!args.IsArgSet("-initialprice")) {
            args.ForceSetMultiArg("-initialprice", {"2000", "1000"});
        }
    }
    args.SoftSetArg("-debttoken", DEFAULT_DEBT_TOKEN);
    args.SoftSetArg("-engineaddress", DEFAULT_ENGINE_ADDRESS);
}

static ResVal<CFeedPrice> ParseFeedPrice(const std::string& str)
{
    auto value = ParseDecimalAmount(str);
    Require(value);
    const CAmount answer = *value / ADDITIONAL_FEED_PRECISION;
    Require(answer > 0 && answer <= CAmount(std::numeric_limits<CFeedPrice>::max()), "price <%s> out of range", str);
    return {static_cast<CFeedPrice>(answer), Res::Ok()};
}

static ResVal<int64_t> ParseInteger(const std::string& str)
{
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(str.c_str(), &end, 10);
    Require(!str.empty() && errno == 0 && *end == '\0', "invalid integer <%s>", str);
    return {static_cast<int64_t>(value), Res::Ok()};
}

class CSimulation
{
public:
    CSimulation(CMemoryCollaborators collaborators, std::unique_ptr<CDscEngine> engine)
        : collaborators(std::move(collaborators)), engine(std::move(engine)) {}

    /** Runs one command line, returns the text to print */
    ResVal<std::string> Execute(const std::vector<std::string>& words);

private:
    ResVal<CAmount> Amount(const std::string& str) const { return ParseDecimalAmount(str); }
    std::string FeedOf(const CAssetId& asset) const { return engine->GetCollateralTokenPriceFeed(asset); }

    CMemoryCollaborators collaborators;
    std::unique_ptr<CDscEngine> engine;
};

ResVal<std::string> CSimulation::Execute(const std::vector<std::string>& words)
{
    const auto& cmd = words[0];
    const auto argc = words.size() - 1;
    auto expect = [&](size_t n) -> Res {
        if (argc != n) {
            return Res::Err("%s expects %d arguments, got %d", cmd, n, argc);
        }
        return Res::Ok();
    };

    if (cmd == "deposit" || cmd == "redeem") {
        Require(expect(3));
        auto amount = Amount(words[3]);
        Require(amount);
        Require(cmd == "deposit" ? engine->DepositCollateral(words[1], words[2], *amount)
                                 : engine->RedeemCollateral(words[1], words[2], *amount));
        return {"ok", Res::Ok()};
    }
    if (cmd == "mint" || cmd == "burn") {
        Require(expect(2));
        auto amount = Amount(words[2]);
        Require(amount);
        Require(cmd == "mint" ? engine->MintDsc(words[1], *amount) : engine->BurnDsc(words[1], *amount));
        return {"ok", Res::Ok()};
    }
    if (cmd == "depositmint" || cmd == "burnredeem") {
        Require(expect(4));
        auto collateral = Amount(words[3]);
        Require(collateral);
        auto dsc = Amount(words[4]);
        Require(dsc);
        Require(cmd == "depositmint" ? engine->DepositCollateralAndMintDsc(words[1], words[2], *collateral, *dsc)
                                     : engine->RedeemCollateralForDsc(words[1], words[2], *collateral, *dsc));
        return {"ok", Res::Ok()};
    }
    if (cmd == "liquidate") {
        Require(expect(4));
        auto debt = Amount(words[4]);
        Require(debt);
        auto result = engine->Liquidate(words[1], words[2], words[3], *debt);
        Require(result);
        return {tfm::format("seized %s (bonus %s), health factor %s -> %s",
                            CTokenAmount{words[2], result->collateralSeized}.ToString(), GetDecimalString(result->bonus),
                            GetDecimalString(result->startHealthFactor), GetDecimalString(result->endHealthFactor)),
                Res::Ok()};
    }
    if (cmd == "setprice") {
        Require(expect(2));
        auto feed = collaborators.Feed(FeedOf(words[1]));
        Require(feed != nullptr, "no price feed for <%s>", words[1]);
        auto price = ParseFeedPrice(words[2]);
        Require(price);
        feed->UpdateAnswer(*price);
        return {"ok", Res::Ok()};
    }
    if (cmd == "approve" || cmd == "faucet" || cmd == "balance") {
        Require(expect(cmd == "balance" ? 2 : 3));
        auto token = collaborators.Token(words[1]);
        Require(token != nullptr, "unknown token <%s>", words[1]);
        if (cmd == "balance") {
            return {GetDecimalString(token->BalanceOf(words[2])), Res::Ok()};
        }
        auto amount = Amount(words[3]);
        Require(amount);
        if (cmd == "approve") {
            token->Approve(words[2], engine->GetEngineAddress(), *amount);
        } else {
            token->Faucet(words[2], *amount);
        }
        return {"ok", Res::Ok()};
    }
    if (cmd == "info") {
        Require(expect(1));
        auto info = engine->GetAccountInformation(words[1]);
        Require(info);
        std::string out = tfm::format("debt %s, collateral value %s", GetDecimalString(info->totalDscMinted), GetDecimalString(info->collateralValueInUsd));
        for (const auto& asset : engine->GetCollateralTokens()) {
            out += tfm::format(", %s", CTokenAmount{asset, engine->GetCollateralBalanceOfUser(words[1], asset)}.ToString());
        }
        return {out, Res::Ok()};
    }
    if (cmd == "hf") {
        Require(expect(1));
        auto healthFactor = engine->GetHealthFactor(words[1]);
        Require(healthFactor);
        return {*healthFactor == MaxAmount() ? std::string{"max"} : GetDecimalString(*healthFactor), Res::Ok()};
    }
    if (cmd == "events") {
        Require(argc <= 1, "events expects at most 1 argument, got %d", argc);
        auto start = ParseInteger(argc == 1 ? words[1] : "0");
        Require(start);
        Require(*start >= 0, "negative event index %d", *start);
        std::string out;
        engine->ForEachCollateralEvent([&](uint64_t seq, const CCollateralEvent& event) {
            out += tfm::format("%s#%d %s", out.empty() ? "" : "\n", seq, event.ToString());
            return true;
        }, static_cast<uint64_t>(*start));
        return {out, Res::Ok()};
    }
    if (cmd == "warp") {
        Require(expect(1));
        auto seconds = ParseInteger(words[1]);
        Require(seconds);
        SetMockTime(GetTime() + *seconds);
        return {tfm::format("time %s", FormatISO8601DateTime(GetTime())), Res::Ok()};
    }
    return Res::Err("unknown command <%s>", cmd);
}

static ResVal<std::unique_ptr<CSimulation>> AppInitSimulation(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        return Res::Err("Error parsing command line arguments: %s", error);
    }
    if (!gArgs.ReadConfigFile(gArgs.GetConfigFile(), error)) {
        return Res::Err("Error reading configuration file: %s", error);
    }
    SoftSetSimulationArgs(gArgs);
    if (!InitLogging(gArgs, error)) {
        return Res::Err("%s", error);
    }
    SetMockTime(gArgs.GetArg("-mocktime", GetSystemTimeInSeconds()));

    auto params = EngineParamsFromArgs(gArgs);
    Require(params);

    const auto prices = gArgs.GetArgs("-initialprice");
    CMemoryCollaborators collaborators(params->engineAddress);
    for (size_t i = 0; i < params->collateralTokens.size(); ++i) {
        collaborators.AddToken(params->collateralTokens[i], std::make_shared<CMemoryToken>(params->collateralTokens[i], DEFAULT_DEPLOYER));
        if (i < params->priceFeeds.size()) {
            auto price = ParseFeedPrice(i < prices.size() ? prices[i] : "1");
            Require(price, [&](const std::string& msg) { return "-initialprice: " + msg; });
            collaborators.AddFeed(params->priceFeeds[i], std::make_shared<CMemoryPriceFeed>(*price));
        }
    }
    collaborators.AddToken(params->debtToken, std::make_shared<CMemoryToken>(params->debtToken, params->engineAddress));

    auto engine = CDscEngine::Create(*params, collaborators);
    Require(engine);

    return {std::make_unique<CSimulation>(std::move(collaborators), std::move(*engine)), Res::Ok()};
}

int main(int argc, char* argv[])
{
    try {
        std::string error;
        if (gArgs.ParseParameters(argc, argv, error) && HelpRequested(gArgs)) {
            tfm::format(std::cout, "%s", HelpMessage());
            return EXIT_SUCCESS;
        }

        auto simulation = AppInitSimulation(argc, argv);
        if (!simulation) {
            tfm::format(std::cerr, "Error: %s\n", simulation.msg);
            return EXIT_FAILURE;
        }

        std::string line;
        while (std::getline(std::cin, line)) {
            std::vector<std::string> words;
            boost::split(words, line, boost::is_any_of(" \t"), boost::token_compress_on);
            words.erase(std::remove(words.begin(), words.end(), std::string{}), words.end());
            if (words.empty() || words[0][0] == '#') {
                continue;
            }
            auto res = (*simulation)->Execute(words);
            if (res) {
                tfm::format(std::cout, "%s\n", *res);
            } else {
                tfm::format(std::cout, "error %s: %s\n", ToString(res.Code()), res.msg);
            }
        }
    } catch (const std::exception& e) {
        tfm::format(std::cerr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
