#ifndef CHANNEL_HH
#define CHANNEL_HH

#include <condition_variable>
#include <deque>
#include <mutex>

#include "common.hh"

/**
 * One-way handoff between two worker threads. A producer push()es, a
 * consumer pop()s; close() wakes everybody up and makes further pushes fail.
 * Items pushed before close() can still be popped.
 */
template<typename T>
class Channel
{
public:
    /**
     * \param capacity
     *      Maximum number of queued items before push() blocks; 0 means
     *      unbounded.
     */
    explicit Channel(size_t capacity = 0)
        : capacity(capacity)
        , closed(false)
        , items()
        , mutex()
        , nonEmpty()
        , nonFull()
    {}

    /**
     * \return
     *      False if the channel was closed before the item could be queued.
     */
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mutex);
        nonFull.wait(lock, [this] {
            return closed || capacity == 0 || items.size() < capacity;
        });
        if (closed) {
            return false;
        }
        items.push_back(std::move(item));
        nonEmpty.notify_one();
        return true;
    }

    /**
     * Blocks until an item is available.
     *
     * \return
     *      False once the channel is closed and drained.
     */
    bool pop(T& item)
    {
        std::unique_lock<std::mutex> lock(mutex);
        nonEmpty.wait(lock, [this] { return closed || !items.empty(); });
        if (items.empty()) {
            return false;
        }
        item = std::move(items.front());
        items.pop_front();
        nonFull.notify_one();
        return true;
    }

    void close()
    {
        Guard _(mutex);
        closed = true;
        nonEmpty.notify_all();
        nonFull.notify_all();
    }

private:
    const size_t capacity;

    bool closed;

    std::deque<T> items;

    std::mutex mutex;

    std::condition_variable nonEmpty;

    std::condition_variable nonFull;

    DISALLOW_COPY_AND_ASSIGN(Channel)
};

#endif /* CHANNEL_HH */
