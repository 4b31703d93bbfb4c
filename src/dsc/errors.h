// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_ERRORS_H
#define DSC_DSC_ERRORS_H

#include <amount.h>
#include <dsc/res.h>

class DscErrors {
public:
    static Res AmountMustBeMoreThanZero(const std::string &what = "amount") {
        return Res::Err("%s must be more than zero", what);
    }

    static Res TokenNotAllowed(const CAssetId &asset) {
        return Res::Err("collateral token <%s> is not allowed", asset);
    }

    static Res TokenAddressesAndPriceFeedsMismatch(const size_t tokens, const size_t feeds) {
        return Res::Err("token addresses and price feed addresses must be the same length (%d != %d)", tokens, feeds);
    }

    static Res TokenAddressDuplicated(const CAssetId &asset) {
        return Res::Err("collateral token <%s> is listed more than once", asset);
    }

    static Res EmptyReference(const std::string &what) {
        return Res::Err("%s reference must not be empty", what);
    }

    static Res UnresolvedReference(const std::string &what, const std::string &ref) {
        return Res::Err("cannot resolve %s <%s>", what, ref);
    }

    static Res AmountOverflow(const std::string &what) {
        return Res::Err("%s overflow", what);
    }

    static Res InsufficientCollateral(const CAssetId &asset, const CAmount &balance, const CAmount &amount) {
        return Res::ErrCode(DscErrCodes::InsufficientFunds, "collateral %s is less than %s",
                            CTokenAmount{asset, balance}.ToString(), CTokenAmount{asset, amount}.ToString());
    }

    static Res InsufficientDebt(const CAccountId &account, const CAmount &debt, const CAmount &amount) {
        return Res::ErrCode(DscErrCodes::InsufficientFunds, "cannot burn %s, account <%s> owes %s",
                            GetDecimalString(amount), account, GetDecimalString(debt));
    }

    static Res TransferFailed(const std::string &call, const std::string &detail = "") {
        return detail.empty()
                   ? Res::ErrCode(DscErrCodes::ExternalTransferFailure, "%s failed", call)
                   : Res::ErrCode(DscErrCodes::ExternalTransferFailure, "%s failed: %s", call, detail);
    }

    static Res BreaksHealthFactor(const CAccountId &account, const CAmount &healthFactor) {
        return Res::ErrCode(DscErrCodes::SolvencyViolation, "health factor of <%s> is broken (%s < %s)",
                            account, GetDecimalString(healthFactor), GetDecimalString(COIN));
    }

    static Res StalePrice(const std::string &feed, const std::string &reason) {
        return Res::ErrCode(DscErrCodes::StaleOracleData, "stale price on feed <%s>: %s", feed, reason);
    }

    static Res HealthFactorOk(const CAccountId &account, const CAmount &healthFactor) {
        return Res::ErrCode(DscErrCodes::LiquidationNotEligible, "health factor of <%s> is ok (%s)",
                            account, GetDecimalString(healthFactor));
    }

    static Res HealthFactorNotImproved(const CAmount &start, const CAmount &end) {
        return Res::ErrCode(DscErrCodes::LiquidationIneffective, "health factor not improved (%s -> %s)",
                            GetDecimalString(start), GetDecimalString(end));
    }

    static Res ReentrantCall() {
        return Res::ErrCode(DscErrCodes::ReentrantCall, "reentrant call");
    }
};

#endif // DSC_DSC_ERRORS_H
