// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <any>
#include <string>
#include <unordered_map>
#include <utility>

namespace FSE {

/**
 * @brief String key statically bound to the value type stored under it
 *
 * @code
 * inline const FSE::DataKey<float> kJumpHeight{"JumpHeight"};
 * state->setData(kJumpHeight, 3.5f);
 * float h = state->getData(kJumpHeight, 1.0f);
 * @endcode
 */
template <typename T> struct DataKey {
    using ValueType = T;
    std::string name;
};

/**
 * @brief Free-form key/value annotation store
 *
 * Values are type-checked on retrieval: asking for a key with a type other
 * than the one stored reports it as absent.
 */
class DataStore {
public:
    /**
     * @brief Store a value
     * @return false if the key is empty (nothing stored)
     */
    template <typename T> bool set(const std::string &key, T value) {
        if (key.empty()) {
            return false;
        }
        entries_[key] = std::move(value);
        return true;
    }

    template <typename T> bool set(const DataKey<T> &key, T value) {
        return set<T>(key.name, std::move(value));
    }

    /**
     * @brief Typed lookup
     * @return Pointer to the stored value, nullptr if absent or of another type
     */
    template <typename T> const T *find(const std::string &key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    template <typename T> const T *find(const DataKey<T> &key) const {
        return find<T>(key.name);
    }

    template <typename T> T get(const std::string &key, T defaultValue = T{}) const {
        const T *value = find<T>(key);
        return value ? *value : defaultValue;
    }

    template <typename T> T get(const DataKey<T> &key, T defaultValue = T{}) const {
        return get<T>(key.name, std::move(defaultValue));
    }

    bool contains(const std::string &key) const {
        return entries_.find(key) != entries_.end();
    }

    bool remove(const std::string &key) {
        return entries_.erase(key) > 0;
    }

    void clear() {
        entries_.clear();
    }

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

private:
    std::unordered_map<std::string, std::any> entries_;
};

}  // namespace FSE
