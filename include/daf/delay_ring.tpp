#ifndef DAF_DELAY_RING_TPP
#define DAF_DELAY_RING_TPP

#include "delay_ring.hpp"
#include <algorithm>
#include <stdexcept>

template <typename T>
DelayRing<T>::DelayRing(size_t capacity, size_t block_size)
    : head(0)
    , tail(0)
    , size_(capacity)
    , block_size_(block_size)
    , full(false)
{
    if (capacity == 0 || block_size == 0) {
        throw std::invalid_argument("DelayRing needs a non-zero capacity and block size");
    }
    arena = std::vector<T>(capacity * block_size, T {});
    stamps = std::vector<Clock::time_point>(capacity);
}

template <typename T>
T* DelayRing<T>::slot(size_t index)
{
    return arena.data() + index * block_size_;
}

template <typename T>
bool DelayRing<T>::push(const T* block, Clock::time_point stamp)
{
    bool overwrote = false;
    if (full) {
        tail = (tail + 1) % size_; // overwrite the oldest block
        overwrote = true;
    }

    std::copy(block, block + block_size_, slot(head));
    stamps[head] = stamp;
    head = (head + 1) % size_;
    full = head == tail;
    return !overwrote;
}

template <typename T>
bool DelayRing<T>::pop(T* out, float gain, Clock::time_point* stamp)
{
    if (is_empty()) {
        std::fill(out, out + block_size_, T {});
        return false;
    }
    const T* in = slot(tail);
    for (size_t i = 0; i < block_size_; i++) {
        T sample = static_cast<T>(in[i] * gain);
        out[i] = std::min(std::max(sample, T(-1)), T(1));
    }
    if (stamp != nullptr) {
        *stamp = stamps[tail];
    }
    tail = (tail + 1) % size_;
    full = false;
    return true;
}

template <typename T>
size_t DelayRing<T>::drop_oldest(size_t count)
{
    size_t dropped = std::min(count, queue_size());
    if (dropped > 0) {
        tail = (tail + dropped) % size_;
        full = false;
    }
    return dropped;
}

template <typename T>
void DelayRing<T>::clear()
{
    head = 0;
    tail = 0;
    full = false;
}

template <typename T>
size_t DelayRing<T>::queue_size() const
{
    if (full) {
        return size_;
    } else if (head >= tail) {
        return head - tail;
    } else {
        return size_ - tail + head;
    }
}

template <typename T>
size_t DelayRing<T>::capacity() const
{
    return size_;
}

template <typename T>
size_t DelayRing<T>::block_size() const
{
    return block_size_;
}

template <typename T>
bool DelayRing<T>::is_full() const
{
    return full;
}

template <typename T>
bool DelayRing<T>::is_empty() const
{
    return (!full && (head == tail));
}

#endif // DAF_DELAY_RING_TPP
