// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_BALANCES_H
#define DSC_DSC_BALANCES_H

#include <amount.h>
#include <serialize.h>

#include <ios>
#include <string>

struct CBalances {
    TAmounts balances;

    Res Add(CTokenAmount amount) {
        if (amount.nValue == 0) {
            return Res::Ok();
        }
        auto current = CTokenAmount{amount.nTokenId, balances[amount.nTokenId]};
        if (auto res = current.Add(amount.nValue); !res) {
            return res;
        }
        balances[amount.nTokenId] = current.nValue;
        return Res::Ok();
    }

    Res Sub(CTokenAmount amount) {
        if (amount.nValue == 0) {
            return Res::Ok();
        }
        auto current = CTokenAmount{amount.nTokenId, Get(amount.nTokenId)};
        if (auto res = current.Sub(amount.nValue); !res) {
            return res;
        }

        if (current.nValue == 0) {
            balances.erase(amount.nTokenId);
        } else {
            balances[amount.nTokenId] = current.nValue;
        }
        return Res::Ok();
    }

    CAmount Get(const CAssetId &asset) const {
        const auto it = balances.find(asset);
        return it == balances.end() ? CAmount{0} : it->second;
    }

    std::string ToString() const {
        std::string str;
        str.reserve(100);
        for (const auto &kv : balances) {
            if (!str.empty()) {
                str += ",";
            }
            str += CTokenAmount{kv.first, kv.second}.ToString();
        }
        return str;
    }

    friend bool operator==(const CBalances &a, const CBalances &b) { return a.balances == b.balances; }

    friend bool operator!=(const CBalances &a, const CBalances &b) { return a.balances != b.balances; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream &s, Operation ser_action) {
        READWRITE(balances);
        if (ser_action.ForRead()) {
            // check that no zero values are written
            for (const auto &kv : balances) {
                if (kv.second == 0) {
                    throw std::ios_base::failure("non-canonical balances (zero amount)");
                }
            }
        }
    }
};

#endif // DSC_DSC_BALANCES_H
