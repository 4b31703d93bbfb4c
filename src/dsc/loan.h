// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_LOAN_H
#define DSC_DSC_LOAN_H

#include <amount.h>
#include <flushablestorage.h>
#include <dsc/res.h>

#include <functional>

class CCollateralLedger;
class CCollateralRegistry;
class CDscView;
class CInteractionQueue;

/** DSC minted per account */
class CLoanView : public virtual CStorageView {
public:
    Res AddDebt(const CAccountId& account, const CAmount& amount);
    Res SubDebt(const CAccountId& account, const CAmount& amount);
    CAmount GetDebt(const CAccountId& account) const;
    void ForEachDebt(std::function<bool(const CAccountId&, const CAmount&)> callback, const CAccountId& start = {}) const;

    struct DebtKey { static constexpr uint8_t prefix() { return 'l'; } };
};

/** Debt issuance and repayment of one operation */
class CMintBurnController {
public:
    CMintBurnController(CDscView& view, const CCollateralRegistry& registry, const CCollateralLedger& ledger, CInteractionQueue& interactions)
        : view(view), registry(registry), ledger(ledger), interactions(interactions) {}

    Res Mint(const CAccountId& account, const CAmount& amount);
    /** Reduces the debt of onBehalfOf, the DSC is taken from dscFrom */
    Res Burn(const CAmount& amount, const CAccountId& onBehalfOf, const CAccountId& dscFrom);

    ResVal<CAmount> HealthFactor(const CAccountId& account) const;
    /** SolvencyViolation when the account is below MIN_HEALTH_FACTOR */
    Res RevertIfHealthFactorIsBroken(const CAccountId& account) const;

private:
    CDscView& view;
    const CCollateralRegistry& registry;
    const CCollateralLedger& ledger;
    CInteractionQueue& interactions;
};

#endif // DSC_DSC_LOAN_H
