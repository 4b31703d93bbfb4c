// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/memorytokens.h>

#include <util/time.h>

#include <stdexcept>

const char* ToString(TokenCall call)
{
    switch (call) {
        case TokenCall::Transfer:     return "transfer";
        case TokenCall::TransferFrom: return "transferFrom";
        case TokenCall::Mint:         return "mint";
        case TokenCall::Burn:         return "burn";
    }
    return "unknown";
}

CMemoryToken::CMemoryToken(std::string symbol, CAccountId minter)
    : symbol(std::move(symbol)), minter(std::move(minter)) {}

bool CMemoryToken::Enter(TokenCall call)
{
    std::function<void(TokenCall)> currentHook;
    {
        std::lock_guard<std::mutex> lock(cs);
        if (throwing.count(call)) {
            throw std::runtime_error(tfm::format("%s: %s reverted", symbol, ToString(call)));
        }
        if (refusing.count(call)) {
            return false;
        }
        currentHook = hook;
    }
    if (currentHook) {
        currentHook(call);
    }
    return true;
}

bool CMemoryToken::Transfer(const CAccountId& caller, const CAccountId& to, const CAmount& amount)
{
    if (!Enter(TokenCall::Transfer)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(cs);
    auto& fromBalance = balances[caller];
    if (fromBalance < amount) {
        return false;
    }
    fromBalance -= amount;
    balances[to] += amount;
    return true;
}

bool CMemoryToken::TransferFrom(const CAccountId& caller, const CAccountId& from, const CAccountId& to, const CAmount& amount)
{
    if (!Enter(TokenCall::TransferFrom)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(cs);
    auto& allowance = allowances[{from, caller}];
    auto& fromBalance = balances[from];
    if (allowance < amount || fromBalance < amount) {
        return false;
    }
    allowance -= amount;
    fromBalance -= amount;
    balances[to] += amount;
    return true;
}

bool CMemoryToken::Mint(const CAccountId& caller, const CAccountId& to, const CAmount& amount)
{
    if (!Enter(TokenCall::Mint)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(cs);
    if (caller != minter || amount == 0 || to.empty()) {
        return false;
    }
    balances[to] += amount;
    totalSupply += amount;
    return true;
}

bool CMemoryToken::Burn(const CAccountId& caller, const CAmount& amount)
{
    if (!Enter(TokenCall::Burn)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(cs);
    auto& balance = balances[caller];
    if (caller != minter || amount == 0 || balance < amount) {
        return false;
    }
    balance -= amount;
    totalSupply -= amount;
    return true;
}

void CMemoryToken::Approve(const CAccountId& owner, const CAccountId& spender, const CAmount& amount)
{
    std::lock_guard<std::mutex> lock(cs);
    allowances[{owner, spender}] = amount;
}

void CMemoryToken::Faucet(const CAccountId& to, const CAmount& amount)
{
    std::lock_guard<std::mutex> lock(cs);
    balances[to] += amount;
    totalSupply += amount;
}

CAmount CMemoryToken::BalanceOf(const CAccountId& account) const
{
    std::lock_guard<std::mutex> lock(cs);
    const auto it = balances.find(account);
    return it == balances.end() ? CAmount{0} : it->second;
}

CAmount CMemoryToken::Allowance(const CAccountId& owner, const CAccountId& spender) const
{
    std::lock_guard<std::mutex> lock(cs);
    const auto it = allowances.find({owner, spender});
    return it == allowances.end() ? CAmount{0} : it->second;
}

CAmount CMemoryToken::TotalSupply() const
{
    std::lock_guard<std::mutex> lock(cs);
    return totalSupply;
}

void CMemoryToken::SetRefusing(TokenCall call, bool refuse)
{
    std::lock_guard<std::mutex> lock(cs);
    if (refuse) {
        refusing.insert(call);
    } else {
        refusing.erase(call);
    }
}

void CMemoryToken::SetThrowing(TokenCall call, bool fail)
{
    std::lock_guard<std::mutex> lock(cs);
    if (fail) {
        throwing.insert(call);
    } else {
        throwing.erase(call);
    }
}

void CMemoryToken::SetHook(std::function<void(TokenCall)> newHook)
{
    std::lock_guard<std::mutex> lock(cs);
    hook = std::move(newHook);
}

bool CMemoryTokenHandle::Transfer(const CAccountId& to, const CAmount& amount)
{
    return token->Transfer(caller, to, amount);
}

bool CMemoryTokenHandle::TransferFrom(const CAccountId& from, const CAccountId& to, const CAmount& amount)
{
    return token->TransferFrom(caller, from, to, amount);
}

bool CMemoryTokenHandle::Mint(const CAccountId& to, const CAmount& amount)
{
    return token->Mint(caller, to, amount);
}

bool CMemoryTokenHandle::Burn(const CAmount& amount)
{
    return token->Burn(caller, amount);
}

CMemoryPriceFeed::CMemoryPriceFeed(CFeedPrice answer)
{
    UpdateAnswer(answer);
}

CRoundData CMemoryPriceFeed::LatestRoundData() const
{
    std::lock_guard<std::mutex> lock(cs);
    if (throwing) {
        throw std::runtime_error("price feed unavailable");
    }
    return round;
}

void CMemoryPriceFeed::UpdateAnswer(CFeedPrice answer)
{
    std::lock_guard<std::mutex> lock(cs);
    const auto now = GetTime();
    round.roundId += 1;
    round.answer = answer;
    round.startedAt = now;
    round.updatedAt = now;
    round.answeredInRound = round.roundId;
}

void CMemoryPriceFeed::SetRoundData(const CRoundData& data)
{
    std::lock_guard<std::mutex> lock(cs);
    round = data;
}

void CMemoryPriceFeed::SetThrowing(bool fail)
{
    std::lock_guard<std::mutex> lock(cs);
    throwing = fail;
}

void CMemoryCollaborators::AddToken(const std::string& ref, std::shared_ptr<CMemoryToken> token)
{
    tokens[ref] = std::move(token);
}

void CMemoryCollaborators::AddFeed(const std::string& ref, std::shared_ptr<CMemoryPriceFeed> feed)
{
    feeds[ref] = std::move(feed);
}

std::shared_ptr<CMemoryToken> CMemoryCollaborators::Token(const std::string& ref) const
{
    const auto it = tokens.find(ref);
    return it == tokens.end() ? nullptr : it->second;
}

std::shared_ptr<CMemoryPriceFeed> CMemoryCollaborators::Feed(const std::string& ref) const
{
    const auto it = feeds.find(ref);
    return it == feeds.end() ? nullptr : it->second;
}

std::shared_ptr<CCollateralToken> CMemoryCollaborators::GetCollateralToken(const CAssetId& asset)
{
    auto token = Token(asset);
    return token ? std::make_shared<CMemoryTokenHandle>(token, engine) : nullptr;
}

std::shared_ptr<CPriceFeed> CMemoryCollaborators::GetPriceFeed(const std::string& feed)
{
    return Feed(feed);
}

std::shared_ptr<CDebtTokenController> CMemoryCollaborators::GetDebtToken(const std::string& ref)
{
    auto token = Token(ref);
    return token ? std::make_shared<CMemoryTokenHandle>(token, engine) : nullptr;
}
