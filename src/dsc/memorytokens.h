// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_MEMORYTOKENS_H
#define DSC_DSC_MEMORYTOKENS_H

#include <amount.h>
#include <dsc/interfaces.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

enum class TokenCall : uint8_t {
    Transfer,
    TransferFrom,
    Mint,
    Burn,
};

const char* ToString(TokenCall call);

/**
 * In-process token with balances and allowances. Only the minter may mint
 * and burn, burning takes from the minter's own balance.
 */
class CMemoryToken {
public:
    CMemoryToken(std::string symbol, CAccountId minter);

    bool Transfer(const CAccountId& caller, const CAccountId& to, const CAmount& amount);
    bool TransferFrom(const CAccountId& caller, const CAccountId& from, const CAccountId& to, const CAmount& amount);
    bool Mint(const CAccountId& caller, const CAccountId& to, const CAmount& amount);
    bool Burn(const CAccountId& caller, const CAmount& amount);
    void Approve(const CAccountId& owner, const CAccountId& spender, const CAmount& amount);

    /** Credits without a minter check, for funding test and simulation accounts */
    void Faucet(const CAccountId& to, const CAmount& amount);

    CAmount BalanceOf(const CAccountId& account) const;
    CAmount Allowance(const CAccountId& owner, const CAccountId& spender) const;
    CAmount TotalSupply() const;
    const std::string& Symbol() const { return symbol; }
    const CAccountId& Minter() const { return minter; }

    /** Refuse (return false) every call of this kind until cleared */
    void SetRefusing(TokenCall call, bool refuse);
    /** Throw std::runtime_error on every call of this kind until cleared */
    void SetThrowing(TokenCall call, bool fail);
    /** Invoked before every call, outside the token lock */
    void SetHook(std::function<void(TokenCall)> hook);

private:
    bool Enter(TokenCall call);

    const std::string symbol;
    const CAccountId minter;

    mutable std::mutex cs;
    std::map<CAccountId, CAmount> balances;
    std::map<std::pair<CAccountId, CAccountId>, CAmount> allowances;
    CAmount totalSupply{0};
    std::set<TokenCall> refusing;
    std::set<TokenCall> throwing;
    std::function<void(TokenCall)> hook;
};

/** A token seen through the account that calls it */
class CMemoryTokenHandle : public CCollateralToken, public CDebtTokenController {
public:
    CMemoryTokenHandle(std::shared_ptr<CMemoryToken> token, CAccountId caller)
        : token(std::move(token)), caller(std::move(caller)) {}

    bool Transfer(const CAccountId& to, const CAmount& amount) override;
    bool TransferFrom(const CAccountId& from, const CAccountId& to, const CAmount& amount) override;
    bool Mint(const CAccountId& to, const CAmount& amount) override;
    bool Burn(const CAmount& amount) override;

private:
    const std::shared_ptr<CMemoryToken> token;
    const CAccountId caller;
};

/** Settable feed with round bookkeeping, answers use 8 decimals */
class CMemoryPriceFeed : public CPriceFeed {
public:
    explicit CMemoryPriceFeed(CFeedPrice answer);

    CRoundData LatestRoundData() const override;

    /** Starts a new round answered now */
    void UpdateAnswer(CFeedPrice answer);
    void SetRoundData(const CRoundData& data);
    void SetThrowing(bool fail);

private:
    mutable std::mutex cs;
    CRoundData round;
    bool throwing{false};
};

/** Name based registry, tokens are handed out bound to the engine account */
class CMemoryCollaborators : public CCollaborators {
public:
    explicit CMemoryCollaborators(CAccountId engine) : engine(std::move(engine)) {}

    void AddToken(const std::string& ref, std::shared_ptr<CMemoryToken> token);
    void AddFeed(const std::string& ref, std::shared_ptr<CMemoryPriceFeed> feed);
    std::shared_ptr<CMemoryToken> Token(const std::string& ref) const;
    std::shared_ptr<CMemoryPriceFeed> Feed(const std::string& ref) const;

    std::shared_ptr<CCollateralToken> GetCollateralToken(const CAssetId& asset) override;
    std::shared_ptr<CPriceFeed> GetPriceFeed(const std::string& feed) override;
    std::shared_ptr<CDebtTokenController> GetDebtToken(const std::string& token) override;

private:
    const CAccountId engine;
    std::map<std::string, std::shared_ptr<CMemoryToken>> tokens;
    std::map<std::string, std::shared_ptr<CMemoryPriceFeed>> feeds;
};

#endif // DSC_DSC_MEMORYTOKENS_H
