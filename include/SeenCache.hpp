#ifndef LANCHAT_SEEN_CACHE_HPP
#define LANCHAT_SEEN_CACHE_HPP

#include <unordered_map>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstddef>

#include "Types.hpp"
#include "Identity.hpp"

namespace lanchat {

    /**
     * Bounded set of recently observed message ids, used to suppress duplicate
     * display and forwarding loops. Entries leave in insertion order, either
     * when capacity is exceeded or when they are older than maxAge.
     */
    class SeenCache {
        public:
            SeenCache(size_t capacity, std::chrono::milliseconds maxAge);

            /**
             * Records the id. Returns true if it was not present, false for a
             * duplicate. Check and insert happen under one lock.
             */
            bool insert(const MessageId& id, Clock::time_point now = Clock::now());

            size_t size() const;
            size_t capacity() const { return maxEntries; }
            std::chrono::milliseconds maxAge() const { return maxEntryAge; }

            void clear();

        private:
            size_t pruneLocked(Clock::time_point now);
            bool expired(Clock::time_point insertedAt, Clock::time_point now) const;

            const size_t maxEntries;
            const std::chrono::milliseconds maxEntryAge;

            mutable std::mutex mtx;
            std::unordered_map<MessageId, Clock::time_point, IdHash> entries;
            std::deque<std::pair<MessageId, Clock::time_point>> order; // oldest first
    };

} // namespace lanchat

#endif // LANCHAT_SEEN_CACHE_HPP
