// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_AMOUNT_H
#define DSC_AMOUNT_H

#include <dsc/res.h>
#include <serialize.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <ostream>
#include <string>

/** Token amount or USD value with 18 decimals. Never negative. */
using CAmount = boost::multiprecision::uint256_t;

/** Intermediate width used for multiply-before-divide so products never wrap */
using CWideAmount = boost::multiprecision::uint512_t;

/** Raw price as reported by a feed, 8 decimals */
using CFeedPrice = int64_t;

using CAssetId = std::string;
using CAccountId = std::string;

static const CAmount COIN{1000000000000000000ULL};
static constexpr int AMOUNT_DECIMALS = 18;

inline const CAmount& MaxAmount()
{
    static const CAmount max = std::numeric_limits<CAmount>::max();
    return max;
}

//Converts the given value to decimal format string with COIN precision.
inline std::string GetDecimalString(const CAmount& nValue)
{
    const CAmount quotient = nValue / COIN;
    std::string remainder = CAmount(nValue % COIN).str();
    remainder.insert(0, AMOUNT_DECIMALS - remainder.size(), '0');
    return quotient.str() + "." + remainder;
}

/** Parses "12.5" or "12" into an 18 decimal amount */
inline ResVal<CAmount> ParseDecimalAmount(const std::string& str)
{
    const auto dot = str.find('.');
    const std::string whole = str.substr(0, dot);
    std::string fraction = dot == std::string::npos ? std::string{} : str.substr(dot + 1);
    if ((whole.empty() && fraction.empty()) || fraction.size() > AMOUNT_DECIMALS) {
        return Res::Err("invalid amount <%s>", str);
    }
    for (const auto c : whole + fraction) {
        if (c < '0' || c > '9') {
            return Res::Err("invalid amount <%s>", str);
        }
    }
    fraction.append(AMOUNT_DECIMALS - fraction.size(), '0');
    std::string digits = whole + fraction;
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));
    if (digits.size() > 78) {
        return Res::Err("amount <%s> out of range", str);
    }
    // a leading zero would switch the parser to octal
    const CWideAmount value = digits.empty() ? CWideAmount{0} : CWideAmount{digits.c_str()};
    if (value > CWideAmount(MaxAmount())) {
        return Res::Err("amount <%s> out of range", str);
    }
    return {static_cast<CAmount>(value), Res::Ok()};
}

inline ResVal<CAmount> SafeAdd(const CAmount& a, const CAmount& b)
{
    if (a > MaxAmount() - b) {
        return Res::Err("overflow");
    }
    return {a + b, Res::Ok()};
}

/** a * b / denominator, floor division, multiply first */
inline ResVal<CAmount> MulDiv(const CAmount& a, const CAmount& b, const CAmount& denominator)
{
    if (denominator == 0) {
        return Res::Err("division by zero");
    }
    const CWideAmount result = CWideAmount(a) * CWideAmount(b) / CWideAmount(denominator);
    if (result > CWideAmount(MaxAmount())) {
        return Res::Err("overflow");
    }
    return {static_cast<CAmount>(result), Res::Ok()};
}

inline ResVal<CAmount> MultiplyAmounts(const CAmount& a, const CAmount& b)
{
    return MulDiv(a, b, COIN);
}

inline ResVal<CAmount> DivideAmounts(const CAmount& a, const CAmount& b)
{
    return MulDiv(a, COIN, b);
}

struct CTokenAmount { // simple std::pair is less informative
    CAssetId nTokenId;
    CAmount nValue;

    std::string ToString() const {
        return tfm::format("%s@%s", GetDecimalString(nValue), nTokenId);
    }

    Res Add(const CAmount& amount) {
        auto sumRes = SafeAdd(this->nValue, amount);
        if (!sumRes) {
            return std::move(sumRes);
        }
        this->nValue = *sumRes;
        return Res::Ok();
    }
    Res Sub(const CAmount& amount) {
        if (this->nValue < amount) {
            return Res::ErrCode(DscErrCodes::InsufficientFunds, "amount %s is less than %s", GetDecimalString(this->nValue), GetDecimalString(amount));
        }
        this->nValue -= amount;
        return Res::Ok();
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(nTokenId);
        READWRITE(nValue);
    }

    friend bool operator==(const CTokenAmount& a, const CTokenAmount& b)
    {
        return a.nTokenId == b.nTokenId && a.nValue == b.nValue;
    }

    friend bool operator!=(const CTokenAmount& a, const CTokenAmount& b)
    {
        return !(a == b);
    }
};

inline std::ostream& operator << (std::ostream &os, const CTokenAmount &ta)
{
    return os << ta.ToString();
}

using TAmounts = std::map<CAssetId, CAmount>;

#endif //  DSC_AMOUNT_H
