// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_RES_H
#define DSC_DSC_RES_H

#include <dsc/errcodes.h>

#include <cassert>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <tinyformat.h>

struct Res {
    bool ok;
    std::string msg;
    uint32_t code;

    Res() = delete;

    operator bool() const { return ok; }

    DscErrCodes Code() const { return static_cast<DscErrCodes>(code); }

    template <typename... Args>
    static Res Err(const std::string &err, const Args &...args) {
        return Res{false, tfm::format(err.c_str(), args...), static_cast<uint32_t>(DscErrCodes::ValidationError)};
    }

    template <typename... Args>
    static Res ErrCode(DscErrCodes code, const std::string &err, const Args &...args) {
        return Res{false, tfm::format(err.c_str(), args...), static_cast<uint32_t>(code)};
    }

    template <typename T, size_t... I>
    static Res Err(const T &t, std::index_sequence<I...>) {
        using arg0 = std::tuple_element_t<0, std::decay_t<decltype(t)>>;
        if constexpr (std::is_same_v<std::decay_t<arg0>, DscErrCodes>) {
            return Res::ErrCode(std::get<I>(t)...);
        } else {
            return Res::Err(std::get<I>(t)...);
        }
    }

    template <typename... Args>
    static Res Ok(const std::string &msg, const Args &...args) {
        return Res{true, tfm::format(msg.c_str(), args...), 0};
    }

    static Res Ok() { return Res{true, {}, 0}; }

    // keeps the code, prefixes the message
    Res Prefixed(const std::string &prefix) const {
        return Res{ok, prefix + ": " + msg, code};
    }
};

template <typename T>
struct ResVal : public Res {
    std::optional<T> val{};

    ResVal() = delete;

    ResVal(const Res &errRes)
        : Res(errRes) {
        assert(!this->ok);  // if value is not provided, then it's always an error
    }
    ResVal(T value, const Res &okRes)
        : Res(okRes),
          val(std::move(value)) {
        assert(this->ok);  // if value if provided, then it's never an error
    }

    operator bool() const { return ok; }

    const T &operator*() const {
        assert(ok);
        return *val;
    }

    const T *operator->() const {
        assert(ok);
        return &(*val);
    }

    T &operator*() {
        assert(ok);
        return *val;
    }

    T ValOrDefault(T default_) const {
        if (!ok) {
            return std::move(default_);
        }
        return *val;
    }
};

template <typename T, typename... Args>
Res CheckRes(T &&res, std::tuple<Args...> &&args) {
    if (res) {
        return Res::Ok();
    }
    constexpr auto size = sizeof...(Args);
    if constexpr (size == 0) {
        static_assert(std::is_convertible_v<T, Res>);
        return std::forward<T>(res);
    } else if constexpr (std::is_invocable_r_v<std::string, std::tuple_element_t<0, std::tuple<Args...>>, std::string>) {
        static_assert(std::is_convertible_v<T, Res>);
        return Res{false, std::invoke(std::get<0>(args), res.msg), res.code};
    } else if constexpr (size == 1 && std::is_invocable_r_v<std::string, std::tuple_element_t<0, std::tuple<Args...>>>) {
        return Res::Err(std::invoke(std::get<0>(args)));
    } else {
        return Res::Err(args, std::make_index_sequence<size>{});
    }
}

/** Returns early from the enclosing function when x is a failed Res or a false condition.
 *  Optional trailing arguments build the error: (fmt, args...), (code, fmt, args...)
 *  or a callable receiving the original message. */
#define Require(x, ...)                                                       \
    do {                                                                      \
        if (auto __res = ::CheckRes(x, std::make_tuple(__VA_ARGS__)); !__res) \
            return __res;                                                     \
    } while (0)

#endif  // DSC_DSC_RES_H
