#ifndef BOUNDED_BUFFER_HPP
#define BOUNDED_BUFFER_HPP

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

enum class DequeueResult {
    Item,
    Timeout,
    Closed
};

// Bounded FIFO shared between producer threads and one consumer.
// enqueue() blocks while full, dequeue() blocks while empty. After close()
// producers are refused and the consumer drains what is left; after fail()
// the consumer drains what is left and then gets the failure rethrown.
template <typename T>
class BoundedBuffer {
public:
    explicit BoundedBuffer(size_t capacity)
        : capacity_(capacity), closed_(false) {
        if (capacity == 0) {
            throw std::invalid_argument("buffer capacity must be greater than 0");
        }
    }

    BoundedBuffer(const BoundedBuffer&) = delete;
    BoundedBuffer& operator=(const BoundedBuffer&) = delete;

    // Returns false if the buffer was closed before the item could be added.
    // A refused rvalue is left untouched.
    bool enqueue(const T& item) {
        return push(item);
    }

    bool enqueue(T&& item) {
        return push(std::move(item));
    }

    // Returns false once closed and drained
    bool dequeue(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] {
            return closed_ || !items_.empty();
        });
        return popLocked(lock, out);
    }

    DequeueResult dequeueUntil(T& out, std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait_until(lock, deadline, [this] {
            return closed_ || !items_.empty();
        });
        if (!ready) {
            return DequeueResult::Timeout;
        }
        return popLocked(lock, out) ? DequeueResult::Item : DequeueResult::Closed;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    void fail(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!error_ && !closed_) {
                error_ = error;
            }
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    // Close only if nothing is pending. Returns true if the buffer is closed
    // afterwards.
    bool closeIfEmpty() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!items_.empty()) {
                return false;
            }
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        return true;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    template <typename U>
    bool push(U&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || items_.size() < capacity_;
        });
        if (closed_) {
            return false;
        }
        items_.push_back(std::forward<U>(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool popLocked(std::unique_lock<std::mutex>& lock, T& out) {
        if (items_.empty()) {
            // closed
            if (error_) {
                std::rethrow_exception(error_);
            }
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    const size_t capacity_;
    std::deque<T> items_;
    bool closed_;
    std::exception_ptr error_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
};

#endif // BOUNDED_BUFFER_HPP
