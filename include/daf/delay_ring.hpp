#ifndef DAF_DELAY_RING_HPP
#define DAF_DELAY_RING_HPP

#include <chrono>
#include <cstddef>
#include <vector>

/*
 * Fixed-capacity FIFO of audio blocks. All blocks live in one arena of
 * capacity * block_size samples, addressed through head (write) and tail
 * (read) cursors. Not synchronized: the audio thread owns it.
 */
template <typename T>
class DelayRing {
public:
    using Clock = std::chrono::steady_clock;

    DelayRing(size_t capacity, size_t block_size);

    DelayRing(const DelayRing&) = delete;
    DelayRing& operator=(const DelayRing&) = delete;

    // Returns false when the ring was full and the oldest block got overwritten.
    bool push(const T* block, Clock::time_point stamp = Clock::now());
    // Copies the oldest block scaled by gain into out, or silence when empty.
    bool pop(T* out, float gain, Clock::time_point* stamp = nullptr);
    size_t drop_oldest(size_t count);
    void clear();

    size_t queue_size() const;
    size_t capacity() const;
    size_t block_size() const;

    bool is_full() const;
    bool is_empty() const;

private:
    T* slot(size_t index);

    std::vector<T> arena;
    std::vector<Clock::time_point> stamps;
    size_t head;
    size_t tail;
    size_t size_;
    size_t block_size_;
    bool full;
};

#include "delay_ring.tpp"

#endif // DAF_DELAY_RING_HPP
