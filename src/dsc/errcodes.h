// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_ERRCODES_H
#define DSC_DSC_ERRCODES_H

#include <cstdint>

enum class DscErrCodes : uint32_t {
    None                    = 0,
    ValidationError         = 1,
    InsufficientFunds       = 2,
    ExternalTransferFailure = 3,
    SolvencyViolation       = 4,
    StaleOracleData         = 5,
    LiquidationNotEligible  = 6,
    LiquidationIneffective  = 7,
    ReentrantCall           = 8,
};

inline const char* ToString(DscErrCodes code)
{
    switch (code) {
        case DscErrCodes::None:                    return "None";
        case DscErrCodes::ValidationError:         return "ValidationError";
        case DscErrCodes::InsufficientFunds:       return "InsufficientFunds";
        case DscErrCodes::ExternalTransferFailure: return "ExternalTransferFailure";
        case DscErrCodes::SolvencyViolation:       return "SolvencyViolation";
        case DscErrCodes::StaleOracleData:         return "StaleOracleData";
        case DscErrCodes::LiquidationNotEligible:  return "LiquidationNotEligible";
        case DscErrCodes::LiquidationIneffective:  return "LiquidationIneffective";
        case DscErrCodes::ReentrantCall:           return "ReentrantCall";
    }
    return "Unknown";
}

#endif // DSC_DSC_ERRCODES_H
