// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_SERIALIZE_H
#define DSC_SERIALIZE_H

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * Storage encoding. Integers are written big endian and strings are escaped
 * and terminated so that the byte order of an encoded key follows the
 * natural order of its fields.
 */

using TBytes = std::vector<unsigned char>;

struct CSerActionSerialize
{
    constexpr bool ForRead() const { return false; }
};
struct CSerActionUnserialize
{
    constexpr bool ForRead() const { return true; }
};

/** Appends to a byte vector */
class CVectorWriter
{
public:
    explicit CVectorWriter(TBytes& vchDataIn) : vchData(vchDataIn) {}

    void write(const char* pch, size_t nSize)
    {
        vchData.insert(vchData.end(), reinterpret_cast<const unsigned char*>(pch), reinterpret_cast<const unsigned char*>(pch) + nSize);
    }

    template <typename T>
    CVectorWriter& operator<<(const T& obj);

private:
    TBytes& vchData;
};

/** Reads from a byte vector, throws std::ios_base::failure past the end */
class VectorReader
{
public:
    explicit VectorReader(const TBytes& data) : m_data(data) {}

    void read(char* dst, size_t n)
    {
        if (n == 0) {
            return;
        }
        if (m_pos + n > m_data.size()) {
            throw std::ios_base::failure("VectorReader::read(): end of data");
        }
        std::memcpy(dst, m_data.data() + m_pos, n);
        m_pos += n;
    }

    size_t size() const { return m_data.size() - m_pos; }
    bool empty() const { return m_data.size() == m_pos; }

    template <typename T>
    VectorReader& operator>>(T& obj);

private:
    const TBytes& m_data;
    size_t m_pos{0};
};

template <typename Stream, typename I>
inline void WriteBE(Stream& s, I value)
{
    unsigned char buf[sizeof(I)];
    for (size_t i = 0; i < sizeof(I); ++i) {
        buf[sizeof(I) - 1 - i] = static_cast<unsigned char>(value & 0xff);
        value = static_cast<I>(value >> 8);
    }
    s.write(reinterpret_cast<const char*>(buf), sizeof(I));
}

template <typename Stream, typename I>
inline I ReadBE(Stream& s)
{
    unsigned char buf[sizeof(I)];
    s.read(reinterpret_cast<char*>(buf), sizeof(I));
    I value{0};
    for (size_t i = 0; i < sizeof(I); ++i) {
        value = static_cast<I>((value << 8) | buf[i]);
    }
    return value;
}

// Forward declarations, so that nested containers resolve every overload
template <typename Stream> inline void Serialize(Stream& s, char a);
template <typename Stream> inline void Serialize(Stream& s, bool a);
template <typename Stream> inline void Serialize(Stream& s, uint8_t a);
template <typename Stream> inline void Serialize(Stream& s, uint32_t a);
template <typename Stream> inline void Serialize(Stream& s, uint64_t a);
template <typename Stream> inline void Serialize(Stream& s, int64_t a);
template <typename Stream> inline void Unserialize(Stream& s, char& a);
template <typename Stream> inline void Unserialize(Stream& s, bool& a);
template <typename Stream> inline void Unserialize(Stream& s, uint8_t& a);
template <typename Stream> inline void Unserialize(Stream& s, uint32_t& a);
template <typename Stream> inline void Unserialize(Stream& s, uint64_t& a);
template <typename Stream> inline void Unserialize(Stream& s, int64_t& a);

template <typename Stream> void Serialize(Stream& os, const boost::multiprecision::uint256_t& v);
template <typename Stream> void Unserialize(Stream& is, boost::multiprecision::uint256_t& v);

template <typename Stream> void Serialize(Stream& os, const std::string& str);
template <typename Stream> void Unserialize(Stream& is, std::string& str);

template <typename Stream, typename K, typename T> void Serialize(Stream& os, const std::pair<K, T>& item);
template <typename Stream, typename K, typename T> void Unserialize(Stream& is, std::pair<K, T>& item);

template <typename Stream, typename T, typename A> void Serialize(Stream& os, const std::vector<T, A>& v);
template <typename Stream, typename T, typename A> void Unserialize(Stream& is, std::vector<T, A>& v);

template <typename Stream, typename K, typename T, typename Pred, typename A> void Serialize(Stream& os, const std::map<K, T, Pred, A>& m);
template <typename Stream, typename K, typename T, typename Pred, typename A> void Unserialize(Stream& is, std::map<K, T, Pred, A>& m);

// Objects providing ADD_SERIALIZE_METHODS
template <typename Stream, typename T>
inline void Serialize(Stream& os, const T& a)
{
    a.Serialize(os);
}

template <typename Stream, typename T>
inline void Unserialize(Stream& is, T&& a)
{
    a.Unserialize(is);
}

template <typename Stream> inline void Serialize(Stream& s, char a) { s.write(&a, 1); }
template <typename Stream> inline void Serialize(Stream& s, bool a) { char f = a ? 1 : 0; s.write(&f, 1); }
template <typename Stream> inline void Serialize(Stream& s, uint8_t a) { WriteBE<Stream, uint8_t>(s, a); }
template <typename Stream> inline void Serialize(Stream& s, uint32_t a) { WriteBE<Stream, uint32_t>(s, a); }
template <typename Stream> inline void Serialize(Stream& s, uint64_t a) { WriteBE<Stream, uint64_t>(s, a); }
template <typename Stream> inline void Serialize(Stream& s, int64_t a) { WriteBE<Stream, uint64_t>(s, static_cast<uint64_t>(a)); }

template <typename Stream> inline void Unserialize(Stream& s, char& a) { s.read(&a, 1); }
template <typename Stream> inline void Unserialize(Stream& s, bool& a) { char f; s.read(&f, 1); a = f != 0; }
template <typename Stream> inline void Unserialize(Stream& s, uint8_t& a) { a = ReadBE<Stream, uint8_t>(s); }
template <typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ReadBE<Stream, uint32_t>(s); }
template <typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ReadBE<Stream, uint64_t>(s); }
template <typename Stream> inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadBE<Stream, uint64_t>(s)); }

/** 256 bit amounts as 32 big endian bytes */
template <typename Stream>
void Serialize(Stream& os, const boost::multiprecision::uint256_t& v)
{
    unsigned char buf[32];
    boost::multiprecision::uint256_t tmp = v;
    for (int i = 31; i >= 0; --i) {
        buf[i] = static_cast<unsigned char>(tmp & 0xff);
        tmp >>= 8;
    }
    os.write(reinterpret_cast<const char*>(buf), sizeof(buf));
}

template <typename Stream>
void Unserialize(Stream& is, boost::multiprecision::uint256_t& v)
{
    unsigned char buf[32];
    is.read(reinterpret_cast<char*>(buf), sizeof(buf));
    v = 0;
    for (const auto b : buf) {
        v <<= 8;
        v |= b;
    }
}

/**
 * Strings are written byte by byte with 0x00 escaped as 0x00 0xff and end
 * with 0x00 0x01. Encoded strings compare like the strings themselves and a
 * string sorts before any longer string it prefixes.
 */
static constexpr char STRING_ESCAPE = '\x00';
static constexpr char STRING_ESCAPED_ZERO = '\xff';
static constexpr char STRING_TERMINATOR = '\x01';

template <typename Stream>
void Serialize(Stream& os, const std::string& str)
{
    size_t begin = 0;
    for (size_t pos = str.find(STRING_ESCAPE); pos != std::string::npos; pos = str.find(STRING_ESCAPE, begin)) {
        os.write(str.data() + begin, pos - begin);
        const char escaped[2] = {STRING_ESCAPE, STRING_ESCAPED_ZERO};
        os.write(escaped, sizeof(escaped));
        begin = pos + 1;
    }
    os.write(str.data() + begin, str.size() - begin);
    const char terminator[2] = {STRING_ESCAPE, STRING_TERMINATOR};
    os.write(terminator, sizeof(terminator));
}

template <typename Stream>
void Unserialize(Stream& is, std::string& str)
{
    str.clear();
    char c;
    while (true) {
        is.read(&c, 1);
        if (c != STRING_ESCAPE) {
            str.push_back(c);
            continue;
        }
        is.read(&c, 1);
        if (c == STRING_TERMINATOR) {
            return;
        }
        if (c != STRING_ESCAPED_ZERO) {
            throw std::ios_base::failure("invalid string escape");
        }
        str.push_back(STRING_ESCAPE);
    }
}

template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item)
{
    Serialize(os, item.first);
    Serialize(os, item.second);
}

template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item)
{
    Unserialize(is, item.first);
    Unserialize(is, item.second);
}

template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v)
{
    Serialize(os, static_cast<uint32_t>(v.size()));
    for (const auto& item : v) {
        Serialize(os, item);
    }
}

template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v)
{
    uint32_t nSize;
    Unserialize(is, nSize);
    v.clear();
    for (uint32_t i = 0; i < nSize; ++i) {
        T item{};
        Unserialize(is, item);
        v.push_back(std::move(item));
    }
}

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream& os, const std::map<K, T, Pred, A>& m)
{
    Serialize(os, static_cast<uint32_t>(m.size()));
    for (const auto& entry : m) {
        Serialize(os, entry);
    }
}

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream& is, std::map<K, T, Pred, A>& m)
{
    uint32_t nSize;
    Unserialize(is, nSize);
    m.clear();
    for (uint32_t i = 0; i < nSize; ++i) {
        std::pair<K, T> item;
        Unserialize(is, item);
        m.insert(m.end(), std::move(item));
    }
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionSerialize, const Args&... args)
{
    (::Serialize(s, args), ...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionUnserialize, Args&... args)
{
    (::Unserialize(s, args), ...);
}

#define READWRITE(...) (::SerReadWriteMany(s, ser_action, __VA_ARGS__))

/**
 * Implement Serialize and Unserialize by delegating to a single templated
 * SerializationOp method.
 */
#define ADD_SERIALIZE_METHODS                                                          \
    template <typename Stream>                                                         \
    void Serialize(Stream& s) const                                                    \
    {                                                                                  \
        const_cast<std::remove_const_t<std::remove_reference_t<decltype(*this)>>*>(this) \
            ->SerializationOp(s, CSerActionSerialize());                               \
    }                                                                                  \
    template <typename Stream>                                                         \
    void Unserialize(Stream& s)                                                        \
    {                                                                                  \
        SerializationOp(s, CSerActionUnserialize());                                   \
    }

template <typename T>
CVectorWriter& CVectorWriter::operator<<(const T& obj)
{
    ::Serialize(*this, obj);
    return *this;
}

template <typename T>
VectorReader& VectorReader::operator>>(T& obj)
{
    ::Unserialize(*this, obj);
    return *this;
}

#endif // DSC_SERIALIZE_H
