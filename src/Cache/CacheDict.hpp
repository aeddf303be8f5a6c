#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>

#include "RecencyList.hpp"
#include "errors.hpp"

namespace Cache {

// Dictionary-like cache which holds at most max_size entries, evicting the least
// recently used one when a new key does not fit.
//
// Every map entry is paired with a node of the recency list; both are created,
// promoted and destroyed together. Lookups (try_get, get, at, get_or_set) count
// as use and move the key to the head. contains() and peek() don't.
//
// Not thread safe: guard an instance with a mutex, or keep one per thread.
template <typename Key, typename Value, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
class CacheDict {
public:
    using key_type = Key;
    using mapped_type = Value;
    using size_type = std::size_t;
    using list_type = RecencyList<Key>;

    // result of operator[]: assigning stores, reading behaves like at()
    class entry_proxy {
        public:
        entry_proxy& operator=(mapped_type value) {
            m_cache.set(m_key, std::move(value));
            return *this;
        }

        operator const mapped_type&() const { return m_cache.at(m_key); }
        const mapped_type& get() const { return m_cache.at(m_key); }

        private:
        friend class CacheDict;
        entry_proxy(CacheDict& cache, key_type key) : m_cache(cache), m_key(std::move(key)) {}

        CacheDict& m_cache;
        key_type m_key;
    };

    explicit CacheDict(size_type max_size) : m_max_size(max_size) {}

    CacheDict(const CacheDict&) = delete;
    CacheDict& operator=(const CacheDict&) = delete;
    CacheDict(CacheDict&&) = default;
    CacheDict& operator=(CacheDict&&) = default;

    // copy the value out and promote the key, returns false if key is absent
    bool try_get(const key_type& key, mapped_type& value) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return false;
        }
        promote(it->second.node);
        value = it->second.value;
        return true;
    }

    std::optional<mapped_type> get(const key_type& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return std::nullopt;
        }
        promote(it->second.node);
        return it->second.value;
    }

    // indexed read, throws KeyNotFoundError if key is absent
    const mapped_type& at(const key_type& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            throw KeyNotFoundError();
        }
        promote(it->second.node);
        return it->second.value;
    }

    entry_proxy operator[](const key_type& key) { return entry_proxy(*this, key); }

    // insert or replace; a replaced key becomes the most recent one, as if freshly inserted
    void set(const key_type& key, mapped_type value) {
        auto it = m_map.find(key);
        if (it != m_map.end()) {
            it->second.value = std::move(value);
            promote(it->second.node);
            return;
        }

        if (m_max_size > 0 && m_map.size() >= m_max_size) {
            evict_last();
        }

        typename list_type::Handle node = m_list.emplace(key);
        try {
            m_map.emplace(key, Entry{std::move(value), node});
        } catch (...) {
            m_list.release(node);
            throw;
        }
        m_list.add_first(node);

        // max_size 0: nothing is retained
        if (m_map.size() > m_max_size) {
            evict_last();
        }
    }

    // memoize: return the cached value, or compute it with make(), store and return it
    template <typename Factory>
    mapped_type get_or_set(const key_type& key, Factory&& make) {
        auto it = m_map.find(key);
        if (it != m_map.end()) {
            promote(it->second.node);
            return it->second.value;
        }
        mapped_type value = std::forward<Factory>(make)();
        set(key, value);
        return value;
    }

    bool remove(const key_type& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return false;
        }
        typename list_type::Handle node = it->second.node;
        m_list.remove(node);
        m_map.erase(it);
        m_list.release(node);
        return true;
    }

    bool contains(const key_type& key) const { return m_map.find(key) != m_map.end(); }

    // lookup without promotion, nullptr if absent
    const mapped_type* peek(const key_type& key) const {
        auto it = m_map.find(key);
        return it == m_map.end() ? nullptr : &it->second.value;
    }

    void clear() {
        m_map.clear();
        m_list.clear();
    }

    size_type size() const noexcept { return m_map.size(); }
    size_type max_size() const noexcept { return m_max_size; }
    bool empty() const noexcept { return m_map.empty(); }

    // keys from most to least recently used
    const list_type& recency() const { return m_list; }

    bool check_invariants() const {
        if (!m_list.check_invariants() || m_list.count() != m_map.size() || m_map.size() > m_max_size) {
            return false;
        }
        for (const auto& [key, entry] : m_map) {
            if (!m_list.contains(entry.node) || !m_map.key_eq()(m_list.key(entry.node), key)) {
                return false;
            }
        }
        return true;
    }

private:
    struct Entry {
        mapped_type value;
        typename list_type::Handle node;
    };

    void promote(typename list_type::Handle node) {
        if (m_list.first() == node) {
            return;
        }
        m_list.remove(node);
        m_list.add_first(node);
    }

    void evict_last() {
        typename list_type::Handle node = m_list.remove_last();
        size_type erased = m_map.erase(m_list.key(node));
        m_list.release(node);
        if (erased != 1) {
            throw InvalidStateError("CacheDict: evicted key has no map entry");
        }
    }

    std::unordered_map<key_type, Entry, Hash, KeyEqual> m_map;
    list_type m_list;
    size_type m_max_size;
};

} // namespace Cache
