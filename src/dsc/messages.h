// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_MESSAGES_H
#define DSC_DSC_MESSAGES_H

#include <amount.h>

#include <string>
#include <variant>

struct CDepositCollateralMessage {
    CAccountId from;
    CAssetId asset;
    CAmount amount;
};

struct CMintDscMessage {
    CAccountId from;
    CAmount amount;
};

struct CDepositAndMintMessage {
    CAccountId from;
    CAssetId asset;
    CAmount amountCollateral;
    CAmount amountDsc;
};

struct CRedeemCollateralMessage {
    CAccountId from;
    CAssetId asset;
    CAmount amount;
};

struct CBurnDscMessage {
    CAccountId from;
    CAmount amount;
};

struct CBurnAndRedeemMessage {
    CAccountId from;
    CAssetId asset;
    CAmount amountCollateral;
    CAmount amountDsc;
};

struct CLiquidateMessage {
    CAccountId liquidator;
    CAssetId asset;
    CAccountId user;
    CAmount debtToCover;
};

using CEngineMessage = std::variant<CDepositCollateralMessage,
                                    CMintDscMessage,
                                    CDepositAndMintMessage,
                                    CRedeemCollateralMessage,
                                    CBurnDscMessage,
                                    CBurnAndRedeemMessage,
                                    CLiquidateMessage>;

std::string ToString(const CEngineMessage& message);

#endif // DSC_DSC_MESSAGES_H
