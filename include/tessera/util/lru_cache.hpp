#ifndef TESSERA_UTIL_LRU_CACHE
#define TESSERA_UTIL_LRU_CACHE

#include <tessera/util/constants.hpp>
#include <tessera/util/exception.hpp>

#include <functional>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tessera {
namespace util {

// String keyed map that remembers the order of use. The high water mark is
// a soft limit: nothing is evicted until expireCache() is called.
template <typename T>
class LRUCache {
public:
    explicit LRUCache(std::size_t highWaterMark_ = DEFAULT_CACHE_SIZE)
        : highWaterMark(highWaterMark_) {}

    bool canExpireCache() const {
        return highWaterMark > 0 && getCount() > highWaterMark;
    }

    void expireCache() {
        while (canExpireCache()) {
            pop();
        }
    }

    void clear() {
        entries.clear();
        index.clear();
    }

    bool containsKey(const std::string& key) const {
        return index.find(key) != index.end();
    }

    // Oldest first.
    void forEach(const std::function<void(T&, const std::string&)>& fn) {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            fn(it->second, it->first);
        }
    }

    // Marks `key` as the most recently used. Throws MisuseException for
    // unknown keys.
    T& get(const std::string& key) {
        auto it = lookup(key);
        entries.splice(entries.begin(), entries, it);
        return it->second;
    }

    T remove(const std::string& key) {
        auto it = lookup(key);
        T value = std::move(it->second);
        index.erase(key);
        entries.erase(it);
        return value;
    }

    std::size_t getCount() const { return entries.size(); }

    // Newest first.
    std::vector<std::string> getKeys() const {
        std::vector<std::string> keys;
        keys.reserve(entries.size());
        for (const auto& entry : entries) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    // Newest first.
    std::vector<T> getValues() const {
        std::vector<T> values;
        values.reserve(entries.size());
        for (const auto& entry : entries) {
            values.push_back(entry.second);
        }
        return values;
    }

    T& peekLast() {
        nonEmpty();
        return entries.back().second;
    }

    const std::string& peekLastKey() const {
        return nonEmpty().back().first;
    }

    const std::string& peekFirstKey() const {
        return nonEmpty().front().first;
    }

    // Does not change the order of use. Null for unknown keys.
    T* peek(const std::string& key) {
        auto it = index.find(key);
        return it == index.end() ? nullptr : &it->second->second;
    }

    // Removes and returns the least recently used value.
    T pop() {
        nonEmpty();
        T value = std::move(entries.back().second);
        index.erase(entries.back().first);
        entries.pop_back();
        return value;
    }

    // Swaps the value stored for `key` without changing the order of use.
    void replace(const std::string& key, T value) {
        lookup(key)->second = std::move(value);
    }

    // Throws MisuseException when `key` is in use already.
    void set(const std::string& key, T value) {
        if (containsKey(key)) {
            throw MisuseException("Tried to set a value for a key that is used already: " + key);
        }
        entries.emplace_front(key, std::move(value));
        index.emplace(key, entries.begin());
    }

    void setSize(std::size_t size) { highWaterMark = size; }
    std::size_t getSize() const { return highWaterMark; }

private:
    using Entries = std::list<std::pair<std::string, T>>;

    typename Entries::iterator lookup(const std::string& key) {
        auto it = index.find(key);
        if (it == index.end()) {
            throw MisuseException("Tried to get a value for a key that does not exist in the cache: " + key);
        }
        return it->second;
    }

    const Entries& nonEmpty() const {
        if (entries.empty()) {
            throw MisuseException("cache is empty");
        }
        return entries;
    }

    std::size_t highWaterMark;

    // Front is the most recently used entry.
    Entries entries;
    std::unordered_map<std::string, typename Entries::iterator> index;
};

} // namespace util
} // namespace tessera

#endif
