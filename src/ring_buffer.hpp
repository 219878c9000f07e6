#pragma once
#include "acq_config.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>
#include <mutex>
#include <atomic>
#include <condition_variable>

// ── RingBuffer ────────────────────────────────────────────────────────────
// Raw IQ bytes, one producer (capture callback) and one consumer (DSP).
// wp/rp are byte counters; physical index = counter % capacity.
// On overflow the oldest unread whole windows are dropped and counted,
// so write() never blocks the driver's I/O thread.
// A window being read is claimed under the lock and copied out without
// it; write() never overwrites the claimed region.
class RingBuffer {
public:
    RingBuffer() = default;
    explicit RingBuffer(const RingBufferConfig& cfg){ reset(cfg); }

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    // Reallocates storage and drops all content (waits for a read in
    // progress). overruns() and bytes_written() are cumulative over the
    // buffer's lifetime.
    void reset(const RingBufferConfig& cfg);

    // Copies n bytes in. Returns bytes stored (n, or capacity when n > capacity)
    size_t write(const uint8_t* data, size_t n);

    // Copies exactly n bytes out and advances the read cursor.
    // false (cursor untouched) while fewer than n unread bytes exist.
    bool read_window(size_t n, std::vector<uint8_t>& out);

    // read_window() that waits up to timeout_ms for n bytes
    bool wait_window(size_t n, std::vector<uint8_t>& out, int timeout_ms);

    // Discards unread data
    void clear();

    // Wakes a blocked wait_window() (shutdown / reconfigure)
    void wake();

    size_t   readable() const;
    size_t   capacity() const;
    size_t   window_bytes() const;
    uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }
    uint64_t bytes_written() const { return total_written_.load(std::memory_order_relaxed); }

private:
    void copy_in(const uint8_t* src, size_t n);   // mtx_ held
    void copy_out(uint64_t from, uint8_t* dst, size_t n);   // region claimed
    bool claim(size_t n, uint64_t& from);         // mtx_ held
    void release_claim();

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;             // claimed_ back to 0
    std::vector<uint8_t>    buf_;
    size_t   window_ = 0;
    uint64_t wp_ = 0, rp_ = 0;
    uint64_t wake_seq_ = 0;
    size_t   claimed_ = 0;                        // bytes behind rp_ still being copied
    std::atomic<uint64_t> overruns_{0};
    std::atomic<uint64_t> total_written_{0};
};
