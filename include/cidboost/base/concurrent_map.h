#ifndef CIDBOOST_BASE_CONCURRENT_MAP_H
#define CIDBOOST_BASE_CONCURRENT_MAP_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace cidboost {

// Copy-on-write map. Readers take an immutable snapshot without locking; writers
// serialise on a mutex, copy the table and publish it atomically. Values are
// replaced whole, never mutated in place. Suited to read-heavy caches.
template <typename K, typename V>
class ConcurrentMap {
public:
    using Table = std::unordered_map<K, std::shared_ptr<const V>>;

    ConcurrentMap() : table_(std::make_shared<const Table>()) {}

    std::shared_ptr<const V> load(const K& key) const {
        auto table = snapshot();
        auto it = table->find(key);
        return it == table->end() ? nullptr : it->second;
    }

    bool contains(const K& key) const {
        return load(key) != nullptr;
    }

    void store(const K& key, V value) {
        auto entry = std::make_shared<const V>(std::move(value));
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto next = std::make_shared<Table>(*table_.load());
        (*next)[key] = std::move(entry);
        table_.store(std::move(next));
    }

    // Replaces the entry with fn(current) where current is null when absent.
    // fn runs under the writer lock, so read-modify-write sequences are atomic.
    void update(const K& key, const std::function<V(const V*)>& fn) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = table_.load();
        auto it = current->find(key);
        auto entry = std::make_shared<const V>(fn(it == current->end() ? nullptr : it->second.get()));
        auto next = std::make_shared<Table>(*current);
        (*next)[key] = std::move(entry);
        table_.store(std::move(next));
    }

    bool erase(const K& key) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = table_.load();
        if (current->find(key) == current->end()) {
            return false;
        }
        auto next = std::make_shared<Table>(*current);
        next->erase(key);
        table_.store(std::move(next));
        return true;
    }

    // Removes the entry only while pred holds for it.
    bool erase_if(const K& key, const std::function<bool(const V&)>& pred) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = table_.load();
        auto it = current->find(key);
        if (it == current->end() || !pred(*it->second)) {
            return false;
        }
        auto next = std::make_shared<Table>(*current);
        next->erase(key);
        table_.store(std::move(next));
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        table_.store(std::make_shared<const Table>());
    }

    std::shared_ptr<const Table> snapshot() const {
        return table_.load();
    }

    size_t size() const {
        return snapshot()->size();
    }

private:
    std::atomic<std::shared_ptr<const Table>> table_;
    std::mutex write_mutex_;
};

} // namespace cidboost

#endif // CIDBOOST_BASE_CONCURRENT_MAP_H
