#include "ring_buffer.hpp"
#include <cstring>
#include <chrono>

void RingBuffer::reset(const RingBufferConfig& cfg){
    std::unique_lock<std::mutex> lk(mtx_);
    idle_cv_.wait(lk, [&]{ return claimed_ == 0; });
    size_t cap = cfg.rb_size;
    if(cap < cfg.total_bytes) cap = cfg.total_bytes;
    buf_.assign(cap, 0);
    window_ = cfg.total_bytes;
    wp_ = rp_ = 0;
    wake_seq_++;
    cv_.notify_all();
}

void RingBuffer::copy_in(const uint8_t* src, size_t n){
    size_t cap = buf_.size();
    size_t pos = (size_t)(wp_ % cap);
    if(pos + n <= cap) memcpy(&buf_[pos], src, n);
    else{
        size_t p1 = cap - pos;
        memcpy(&buf_[pos], src, p1);
        memcpy(&buf_[0], src + p1, n - p1);
    }
    wp_ += n;
}

void RingBuffer::copy_out(uint64_t from, uint8_t* dst, size_t n){
    size_t cap = buf_.size();
    size_t pos = (size_t)(from % cap);
    if(pos + n <= cap) memcpy(dst, &buf_[pos], n);
    else{
        size_t p1 = cap - pos;
        memcpy(dst, &buf_[pos], p1);
        memcpy(dst + p1, &buf_[0], n - p1);
    }
}

bool RingBuffer::claim(size_t n, uint64_t& from){
    if(claimed_ || n > buf_.size() || wp_ - rp_ < n) return false;
    from = rp_;
    rp_ += n;
    claimed_ = n;
    return true;
}

void RingBuffer::release_claim(){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        claimed_ = 0;
    }
    idle_cv_.notify_all();
}

size_t RingBuffer::write(const uint8_t* data, size_t n){
    if(n == 0) return 0;
    std::lock_guard<std::mutex> lk(mtx_);
    size_t cap = buf_.size();
    if(cap == 0) return 0;

    // Larger than the whole buffer: only the newest cap bytes survive
    if(n > cap){
        data += n - cap;
        n = cap;
    }

    uint64_t used = wp_ - rp_;
    if(used + n > cap - claimed_){
        if(claimed_ == 0){
            // Drop-oldest in window units so the consumer stays window-aligned
            uint64_t need = used + n - cap;
            uint64_t step = window_ > 0 ? window_ : need;
            uint64_t drop = ((need + step - 1) / step) * step;
            if(drop > used) drop = used;
            rp_ += drop;
        }else{
            // The claimed window sits right behind rp_: the unread bytes
            // after it are the oldest that can go, and only cap - claimed_
            // bytes fit until the read finishes.
            wp_ = rp_;
            size_t room = cap - claimed_;
            if(n > room){
                data += n - room;
                n = room;
            }
        }
        overruns_.fetch_add(1, std::memory_order_relaxed);
    }
    if(n == 0) return 0;
    copy_in(data, n);
    total_written_.fetch_add(n, std::memory_order_relaxed);
    cv_.notify_one();
    return n;
}

// out is sized before the lock and filled after it; the capture callback
// only ever waits for the cursor update.
bool RingBuffer::read_window(size_t n, std::vector<uint8_t>& out){
    if(n == 0) return false;
    if(out.size() != n) out.resize(n);
    uint64_t from;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if(!claim(n, from)) return false;
    }
    copy_out(from, out.data(), n);
    release_claim();
    return true;
}

bool RingBuffer::wait_window(size_t n, std::vector<uint8_t>& out, int timeout_ms){
    if(n == 0) return false;
    if(out.size() != n) out.resize(n);
    uint64_t from;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        if(n > buf_.size()) return false;
        uint64_t seq = wake_seq_;
        cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&]{
            return wp_ - rp_ >= n || wake_seq_ != seq;
        });
        if(!claim(n, from)) return false;
    }
    copy_out(from, out.data(), n);
    release_claim();
    return true;
}

void RingBuffer::clear(){
    std::lock_guard<std::mutex> lk(mtx_);
    wp_ = rp_;      // keeps free space contiguous behind a claimed window
}

void RingBuffer::wake(){
    std::lock_guard<std::mutex> lk(mtx_);
    wake_seq_++;
    cv_.notify_all();
}

size_t RingBuffer::readable() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return (size_t)(wp_ - rp_);
}

size_t RingBuffer::capacity() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return buf_.size();
}

size_t RingBuffer::window_bytes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return window_;
}
