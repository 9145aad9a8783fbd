#include "SeenCache.hpp"

#include <stdexcept>

namespace lanchat {

    SeenCache::SeenCache(size_t capacity, std::chrono::milliseconds maxAge)
        : maxEntries(capacity), maxEntryAge(maxAge) {
        if (capacity == 0) throw std::invalid_argument("SeenCache capacity must be positive");
        if (maxAge.count() <= 0) throw std::invalid_argument("SeenCache max age must be positive");
    }

    bool SeenCache::expired(Clock::time_point insertedAt, Clock::time_point now) const {
        return now - insertedAt > maxEntryAge;
    }

    bool SeenCache::insert(const MessageId& id, Clock::time_point now) {
        std::lock_guard<std::mutex> lk(mtx);
        pruneLocked(now);

        if (entries.count(id) > 0) return false;

        entries.emplace(id, now);
        order.emplace_back(id, now);

        while (order.size() > maxEntries) {
            entries.erase(order.front().first);
            order.pop_front();
        }

        return true;
    }

    size_t SeenCache::pruneLocked(Clock::time_point now) {
        size_t removed = 0;

        while (!order.empty() && expired(order.front().second, now)) {
            entries.erase(order.front().first);
            order.pop_front();
            ++removed;
        }

        return removed;
    }

    size_t SeenCache::size() const {
        std::lock_guard<std::mutex> lk(mtx);
        return entries.size();
    }

    void SeenCache::clear() {
        std::lock_guard<std::mutex> lk(mtx);
        entries.clear();
        order.clear();
    }

} // namespace lanchat
