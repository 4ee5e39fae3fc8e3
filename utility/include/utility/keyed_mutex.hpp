#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace Utility
{
    /**
     * @brief A set of recursive mutexes addressed by key. Entries only exist while somebody holds or waits for
     * them, so the map does not grow with the number of keys ever seen.
     *
     * @tparam KeyT The key type.
     * @tparam HashT The hash for the key type.
     */
    template <typename KeyT, typename HashT = std::hash<KeyT>>
    class KeyedMutex
    {
      private:
        struct Entry
        {
            std::recursive_mutex mutex{};
            std::size_t users{0};
        };

      public:
        class Lock
        {
          public:
            Lock()
                : owner_{nullptr}
                , key_{}
                , entry_{}
            {}
            Lock(KeyedMutex* owner, KeyT key, std::shared_ptr<Entry> entry)
                : owner_{owner}
                , key_{std::move(key)}
                , entry_{std::move(entry)}
            {}
            ~Lock()
            {
                unlock();
            }
            Lock(Lock const&) = delete;
            Lock& operator=(Lock const&) = delete;
            Lock(Lock&& other) noexcept
                : owner_{std::exchange(other.owner_, nullptr)}
                , key_{std::move(other.key_)}
                , entry_{std::move(other.entry_)}
            {}
            Lock& operator=(Lock&& other) noexcept
            {
                if (this != &other)
                {
                    unlock();
                    owner_ = std::exchange(other.owner_, nullptr);
                    key_ = std::move(other.key_);
                    entry_ = std::move(other.entry_);
                }
                return *this;
            }

            bool ownsLock() const
            {
                return owner_ != nullptr && entry_ != nullptr;
            }

            void unlock()
            {
                if (!ownsLock())
                    return;
                entry_->mutex.unlock();
                owner_->releaseEntry(key_);
                entry_.reset();
                owner_ = nullptr;
            }

          private:
            KeyedMutex* owner_;
            KeyT key_;
            std::shared_ptr<Entry> entry_;
        };

        KeyedMutex() = default;
        KeyedMutex(KeyedMutex const&) = delete;
        KeyedMutex& operator=(KeyedMutex const&) = delete;
        KeyedMutex(KeyedMutex&&) = delete;
        KeyedMutex& operator=(KeyedMutex&&) = delete;

        [[nodiscard]] Lock lock(KeyT const& key)
        {
            auto entry = acquireEntry(key);
            entry->mutex.lock();
            return Lock{this, key, std::move(entry)};
        }

        /**
         * @brief Locks two keys in a globally consistent order. Locking the same key twice yields one real lock.
         */
        [[nodiscard]] std::pair<Lock, Lock> lock(KeyT const& first, KeyT const& second)
        {
            if (first == second)
                return {lock(first), Lock{}};

            if (second < first)
            {
                auto secondLock = lock(second);
                auto firstLock = lock(first);
                return {std::move(firstLock), std::move(secondLock)};
            }
            auto firstLock = lock(first);
            auto secondLock = lock(second);
            return {std::move(firstLock), std::move(secondLock)};
        }

        std::size_t activeKeys() const
        {
            std::scoped_lock guard{guard_};
            return entries_.size();
        }

      private:
        std::shared_ptr<Entry> acquireEntry(KeyT const& key)
        {
            std::scoped_lock guard{guard_};
            auto& entry = entries_[key];
            if (!entry)
                entry = std::make_shared<Entry>();
            ++entry->users;
            return entry;
        }

        void releaseEntry(KeyT const& key)
        {
            std::scoped_lock guard{guard_};
            auto iter = entries_.find(key);
            if (iter == entries_.end())
                return;
            if (--iter->second->users == 0)
                entries_.erase(iter);
        }

      private:
        mutable std::mutex guard_{};
        std::unordered_map<KeyT, std::shared_ptr<Entry>, HashT> entries_{};
    };
}
