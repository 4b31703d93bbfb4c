// Copyright (c) 2019 The Wagerr developers
// Distributed under the MIT/X11 software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_FLUSHABLESTORAGE_H
#define DSC_FLUSHABLESTORAGE_H

#include <serialize.h>

#include <cassert>
#include <functional>
#include <map>
#include <memory>
#include <optional>

using MapKV = std::map<TBytes, std::optional<TBytes>>;

template<typename T>
static TBytes DbTypeToBytes(const T& value) {
    TBytes bytes;
    CVectorWriter stream(bytes);
    stream << value;
    return bytes;
}

template<typename T>
static bool BytesToDbType(const TBytes& bytes, T& value) {
    try {
        VectorReader stream(bytes);
        stream >> value;
    }
    catch (std::ios_base::failure&) {
        return false;
    }
    return true;
}

// Key-Value storage iterator interface, forward only
class CStorageKVIterator {
public:
    virtual ~CStorageKVIterator() = default;
    virtual void Seek(const TBytes& key) = 0;
    virtual void Next() = 0;
    virtual bool Valid() = 0;
    virtual TBytes Key() = 0;
    virtual TBytes Value() = 0;
};

// Key-Value storage interface
class CStorageKV {
public:
    virtual ~CStorageKV() = default;
    virtual bool Exists(const TBytes& key) const = 0;
    virtual bool Write(const TBytes& key, const TBytes& value) = 0;
    virtual bool Erase(const TBytes& key) = 0;
    virtual bool Read(const TBytes& key, TBytes& value) const = 0;
    virtual std::unique_ptr<CStorageKVIterator> NewIterator() = 0;
    virtual size_t SizeEstimate() const = 0;
    virtual void Discard() = 0;
    virtual bool Flush() = 0;
};

// In-memory backing store, the bottom layer of every engine
class CStorageKVMemory : public CStorageKV {
public:
    CStorageKVMemory() = default;
    CStorageKVMemory(const CStorageKVMemory&) = delete;
    ~CStorageKVMemory() override = default;

    bool Exists(const TBytes& key) const override;
    bool Write(const TBytes& key, const TBytes& value) override;
    bool Erase(const TBytes& key) override;
    bool Read(const TBytes& key, TBytes& value) const override;
    std::unique_ptr<CStorageKVIterator> NewIterator() override;
    size_t SizeEstimate() const override;
    // writes are immediate
    void Discard() override {}
    bool Flush() override { return true; }

private:
    std::map<TBytes, TBytes> data;
};

// Flushable Key-Value Storage Iterator
class CFlushableStorageKVIterator : public CStorageKVIterator {
public:
    explicit CFlushableStorageKVIterator(std::unique_ptr<CStorageKVIterator>&& pIt, const MapKV& map) : map(map), pIt(std::move(pIt)) {
        itState = Invalid;
    }
    CFlushableStorageKVIterator(const CFlushableStorageKVIterator&) = delete;
    ~CFlushableStorageKVIterator() override = default;

    void Seek(const TBytes& key) override;
    void Next() override;
    bool Valid() override {
        return itState != Invalid;
    }
    TBytes Key() override {
        assert(Valid());
        return itState == Map ? mIt->first : pIt->Key();
    }
    TBytes Value() override {
        assert(Valid());
        return itState == Map ? *mIt->second : pIt->Value();
    }
private:
    void Advance();

    const MapKV& map;
    MapKV::const_iterator mIt;
    std::unique_ptr<CStorageKVIterator> pIt;
    enum IteratorState { Invalid, Map, Parent } itState;
};

// Flushable Key-Value Storage
class CFlushableStorageKV : public CStorageKV {
public:
    explicit CFlushableStorageKV(CStorageKV& db_) : db(db_) {}
    CFlushableStorageKV(const CFlushableStorageKV&) = delete;
    ~CFlushableStorageKV() override = default;

    bool Exists(const TBytes& key) const override;
    bool Write(const TBytes& key, const TBytes& value) override {
        changed[key] = value;
        return true;
    }
    bool Erase(const TBytes& key) override {
        changed[key] = {};
        return true;
    }
    bool Read(const TBytes& key, TBytes& value) const override;
    bool Flush() override;
    void Discard() override {
        changed.clear();
    }
    size_t SizeEstimate() const override;
    std::unique_ptr<CStorageKVIterator> NewIterator() override {
        return std::make_unique<CFlushableStorageKVIterator>(db.NewIterator(), changed);
    }

private:
    CStorageKV& db;
    MapKV changed;
};

template<typename T>
class CLazySerialize {
    std::optional<T> value;
    std::unique_ptr<CStorageKVIterator>& it;

public:
    CLazySerialize(const CLazySerialize&) = default;
    explicit CLazySerialize(std::unique_ptr<CStorageKVIterator>& it) : it(it) {}

    operator T() & {
        return get();
    }
    operator T() && {
        get();
        return std::move(*value);
    }
    const T& get() {
        if (!value) {
            value = T{};
            BytesToDbType(it->Value(), *value);
        }
        return *value;
    }
};

template<typename By, typename KeyType>
class CStorageIteratorWrapper {
    bool valid = false;
    std::pair<uint8_t, KeyType> key;
    std::unique_ptr<CStorageKVIterator> it;

    void UpdateValidity() {
        valid = it->Valid() && BytesToDbType(it->Key(), key) && key.first == By::prefix();
    }

    struct Resolver {
        std::unique_ptr<CStorageKVIterator>& it;

        template<typename T>
        inline operator CLazySerialize<T>() {
            return CLazySerialize<T>{it};
        }
        template<typename T>
        inline T as() {
            return CLazySerialize<T>{it};
        }
        template<typename T>
        inline operator T() {
            return as<T>();
        }
    };

public:
    CStorageIteratorWrapper(CStorageIteratorWrapper&&) = default;
    CStorageIteratorWrapper(std::unique_ptr<CStorageKVIterator> it) : it(std::move(it)) {}

    bool Valid() {
        return valid;
    }
    const KeyType& Key() {
        assert(Valid());
        return key.second;
    }
    Resolver Value() {
        assert(Valid());
        return Resolver{it};
    }
    void Next() {
        assert(Valid());
        it->Next();
        UpdateValidity();
    }
    void Seek(const KeyType& newKey) {
        key = std::make_pair(By::prefix(), newKey);
        it->Seek(DbTypeToBytes(key));
        UpdateValidity();
    }
    template<typename T>
    bool Value(T& value) {
        assert(Valid());
        return BytesToDbType(it->Value(), value);
    }
};

class CStorageView {
public:
    CStorageView() = default;
    CStorageView(CStorageKV * st) : storage(st) {}
    virtual ~CStorageView() = default;

    template<typename KeyType>
    bool Exists(const KeyType& key) const {
        return DB().Exists(DbTypeToBytes(key));
    }
    template<typename By, typename KeyType>
    bool ExistsBy(const KeyType& key) const {
        return Exists(std::make_pair(By::prefix(), key));
    }

    template<typename KeyType, typename ValueType>
    bool Write(const KeyType& key, const ValueType& value) {
        auto vKey = DbTypeToBytes(key);
        auto vValue = DbTypeToBytes(value);
        return DB().Write(vKey, vValue);
    }
    template<typename By, typename KeyType, typename ValueType>
    bool WriteBy(const KeyType& key, const ValueType& value) {
        return Write(std::make_pair(By::prefix(), key), value);
    }

    template<typename KeyType>
    bool Erase(const KeyType& key) {
        auto vKey = DbTypeToBytes(key);
        return DB().Exists(vKey) && DB().Erase(vKey);
    }
    template<typename By, typename KeyType>
    bool EraseBy(const KeyType& key) {
        return Erase(std::make_pair(By::prefix(), key));
    }

    template<typename KeyType, typename ValueType>
    bool Read(const KeyType& key, ValueType& value) const {
        auto vKey = DbTypeToBytes(key);
        TBytes vValue;
        return DB().Read(vKey, vValue) && BytesToDbType(vValue, value);
    }
    template<typename By, typename KeyType, typename ValueType>
    bool ReadBy(const KeyType& key, ValueType& value) const {
        return Read(std::make_pair(By::prefix(), key), value);
    }
    template<typename By, typename ResultType, typename KeyType>
    std::optional<ResultType> ReadBy(KeyType const & id) const {
        ResultType result{};
        if (ReadBy<By>(id, result))
            return {result};
        return {};
    }
    template<typename By, typename KeyType>
    CStorageIteratorWrapper<By, KeyType> LowerBound(KeyType const & key) const {
        CStorageIteratorWrapper<By, KeyType> it{storage->NewIterator()};
        it.Seek(key);
        return it;
    }
    template<typename By, typename KeyType, typename ValueType>
    void ForEach(std::function<bool(KeyType const &, CLazySerialize<ValueType>)> callback, KeyType const & start = {}) const {
        for(auto it = LowerBound<By>(start); it.Valid(); it.Next()) {
            if (!callback(it.Key(), it.Value())) {
                break;
            }
        }
    }

    bool Flush() { return DB().Flush(); }
    void Discard() { DB().Discard(); }
    size_t SizeEstimate() const { return DB().SizeEstimate(); }

protected:
    CStorageKV & DB() { return *storage.get(); }
    CStorageKV const & DB() const { return *storage.get(); }
private:
    std::unique_ptr<CStorageKV> storage;
};

#endif // DSC_FLUSHABLESTORAGE_H
