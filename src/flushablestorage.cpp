// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <flushablestorage.h>

namespace {

class CStorageKVMemoryIterator : public CStorageKVIterator {
public:
    explicit CStorageKVMemoryIterator(const std::map<TBytes, TBytes>& data) : data(data), it(data.end()) {}
    ~CStorageKVMemoryIterator() override = default;

    void Seek(const TBytes& key) override {
        it = data.lower_bound(key);
    }
    void Next() override {
        assert(Valid());
        ++it;
    }
    bool Valid() override {
        return it != data.end();
    }
    TBytes Key() override {
        assert(Valid());
        return it->first;
    }
    TBytes Value() override {
        assert(Valid());
        return it->second;
    }

private:
    const std::map<TBytes, TBytes>& data;
    std::map<TBytes, TBytes>::const_iterator it;
};

size_t EntryUsage(const TBytes& key, const TBytes& value) {
    return key.capacity() + value.capacity() + sizeof(TBytes) * 2;
}

} // namespace

bool CStorageKVMemory::Exists(const TBytes& key) const {
    return data.count(key) != 0;
}

bool CStorageKVMemory::Write(const TBytes& key, const TBytes& value) {
    data[key] = value;
    return true;
}

bool CStorageKVMemory::Erase(const TBytes& key) {
    data.erase(key);
    return true;
}

bool CStorageKVMemory::Read(const TBytes& key, TBytes& value) const {
    auto it = data.find(key);
    if (it == data.end()) {
        return false;
    }
    value = it->second;
    return true;
}

std::unique_ptr<CStorageKVIterator> CStorageKVMemory::NewIterator() {
    return std::make_unique<CStorageKVMemoryIterator>(data);
}

size_t CStorageKVMemory::SizeEstimate() const {
    size_t size{0};
    for (const auto& [key, value] : data) {
        size += EntryUsage(key, value);
    }
    return size;
}

void CFlushableStorageKVIterator::Seek(const TBytes& key) {
    pIt->Seek(key);
    mIt = map.lower_bound(key);
    Advance();
}

void CFlushableStorageKVIterator::Next() {
    assert(Valid());
    if (itState == Map) {
        ++mIt;
    } else {
        pIt->Next();
    }
    Advance();
}

// Merges the staged changes over the parent in key order. A staged entry
// shadows the parent entry with the same key, an erased entry hides it.
void CFlushableStorageKVIterator::Advance() {
    while (mIt != map.end() || pIt->Valid()) {
        if (mIt != map.end() && (!pIt->Valid() || mIt->first <= pIt->Key())) {
            if (pIt->Valid() && mIt->first == pIt->Key()) {
                pIt->Next();
            }
            if (mIt->second) {
                itState = Map;
                return;
            }
            ++mIt;
            continue;
        }
        itState = Parent;
        return;
    }
    itState = Invalid;
}

bool CFlushableStorageKV::Exists(const TBytes& key) const {
    auto it = changed.find(key);
    if (it != changed.end()) {
        return bool(it->second);
    }
    return db.Exists(key);
}

bool CFlushableStorageKV::Read(const TBytes& key, TBytes& value) const {
    auto it = changed.find(key);
    if (it == changed.end()) {
        return db.Read(key, value);
    } else if (it->second) {
        value = it->second.value();
        return true;
    } else {
        return false;
    }
}

bool CFlushableStorageKV::Flush() {
    for (const auto& it : changed) {
        if (!it.second) {
            if (!db.Erase(it.first)) {
                return false;
            }
        } else if (!db.Write(it.first, it.second.value())) {
            return false;
        }
    }
    changed.clear();
    return true;
}

size_t CFlushableStorageKV::SizeEstimate() const {
    size_t size{0};
    for (const auto& [key, value] : changed) {
        size += EntryUsage(key, value ? *value : TBytes{});
    }
    return size;
}
