// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <dsc/interactions.h>

#include <dsc/errors.h>
#include <logging.h>

#include <algorithm>

void CInteractionQueue::PullCollateral(std::shared_ptr<CCollateralToken> token, const CAssetId &asset, const CAccountId &from, const CAmount &amount) {
    calls.push_back({InteractionPhase::Pull,
                     tfm::format("%s.transferFrom(%s, %s, %s)", asset, from, custody, GetDecimalString(amount)),
                     [=, custody = custody] { return token->TransferFrom(from, custody, amount); },
                     [=] { return token->Transfer(from, amount); }});
}

void CInteractionQueue::PushCollateral(std::shared_ptr<CCollateralToken> token, const CAssetId &asset, const CAccountId &to, const CAmount &amount) {
    calls.push_back({InteractionPhase::Push,
                     tfm::format("%s.transfer(%s, %s)", asset, to, GetDecimalString(amount)),
                     [=] { return token->Transfer(to, amount); },
                     {}});
}

void CInteractionQueue::PullDebtToken(std::shared_ptr<CDebtTokenController> token, const CAccountId &from, const CAmount &amount) {
    calls.push_back({InteractionPhase::Pull,
                     tfm::format("dsc.transferFrom(%s, %s, %s)", from, custody, GetDecimalString(amount)),
                     [=, custody = custody] { return token->TransferFrom(from, custody, amount); },
                     [=] { return token->Transfer(from, amount); }});
}

void CInteractionQueue::BurnDebtToken(std::shared_ptr<CDebtTokenController> token, const CAmount &amount) {
    calls.push_back({InteractionPhase::Burn,
                     tfm::format("dsc.burn(%s)", GetDecimalString(amount)),
                     [=] { return token->Burn(amount); },
                     [=, custody = custody] { return token->Mint(custody, amount); }});
}

void CInteractionQueue::MintDebtToken(std::shared_ptr<CDebtTokenController> token, const CAccountId &to, const CAmount &amount) {
    calls.push_back({InteractionPhase::Mint,
                     tfm::format("dsc.mint(%s, %s)", to, GetDecimalString(amount)),
                     [=] { return token->Mint(to, amount); },
                     {}});
}

Res CInteractionQueue::Execute() {
    std::stable_sort(calls.begin(), calls.end(), [](const CInteraction &a, const CInteraction &b) {
        return a.phase < b.phase;
    });

    std::vector<const CInteraction *> done;
    for (const auto &interaction : calls) {
        std::string detail;
        bool ok{false};
        try {
            ok = interaction.call();
        } catch (const std::exception &e) {
            detail = e.what();
        } catch (...) {
            detail = "unknown exception";
        }
        if (!ok) {
            LogPrint(BCLog::ENGINE, "%s refused%s\n", interaction.description, detail.empty() ? "" : ": " + detail);
            auto res = DscErrors::TransferFailed(interaction.description, detail);
            Revert(done);
            calls.clear();
            return res;
        }
        LogPrint(BCLog::ENGINE, "%s\n", interaction.description);
        done.push_back(&interaction);
    }
    calls.clear();
    return Res::Ok();
}

void CInteractionQueue::Revert(const std::vector<const CInteraction *> &done) const {
    for (auto it = done.rbegin(); it != done.rend(); ++it) {
        const auto &interaction = **it;
        bool reverted{false};
        if (interaction.revert) {
            try {
                reverted = interaction.revert();
            } catch (const std::exception &e) {
                LogPrintf("revert of %s threw: %s\n", interaction.description, e.what());
            } catch (...) {
                LogPrintf("revert of %s threw an unknown exception\n", interaction.description);
            }
        }
        if (!reverted) {
            LogPrintf("ERROR: could not revert %s\n", interaction.description);
        }
    }
}
