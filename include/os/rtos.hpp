#pragma once
#include <cstddef> // size_t
#include <cstdint>

namespace Rtos {

// Block forever on take_for()/receive_for().
constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

// Monotonic clock in microseconds.
uint64_t NowUs();

//== Task abstraction ==//
// One joinable thread running fn(arg). Not copyable.
class Task {
public:
    Task();
    ~Task();
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Returns false if the thread could not be started.
    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
class Mutex {
public:
    Mutex();
    ~Mutex();
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

// Scoped lock for Mutex.
class LockGuard {
public:
    explicit LockGuard(Mutex& m) : m_(m) { m_.lock(); }
    ~LockGuard() { m_.unlock(); }
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

private:
    Mutex& m_;
};

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();
    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();                          // block until count > 0, then --count
    bool try_take();                      // non-blocking
    bool take_for(uint32_t timeout_ms);   // false on timeout
    void give();                          // ++count (capped at maxCount)

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Bounded FIFO over a fixed circular buffer.
// Producers wait on free slots, consumers on filled ones; the mutex only
// guards the ring indices. T must be default-constructible and copyable.
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue capacity must be non-zero");

public:
    Queue() = default;
    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    void send(const T& item) {
        slots_free_.take();
        push(item);
    }

    bool try_send(const T& item) {
        if (!slots_free_.try_take()) return false;
        push(item);
        return true;
    }

    void receive(T& item) {
        slots_used_.take();
        pop(item);
    }

    bool try_receive(T& item) {
        if (!slots_used_.try_take()) return false;
        pop(item);
        return true;
    }

    // Wait at most timeout_ms (MAX_TIMEOUT = forever).
    bool receive_for(T& item, uint32_t timeout_ms) {
        if (timeout_ms == MAX_TIMEOUT) {
            receive(item);
            return true;
        }
        if (!slots_used_.take_for(timeout_ms)) return false;
        pop(item);
        return true;
    }

private:
    void push(const T& item) {
        {
            LockGuard g(lock_);
            ring_[head_] = item;
            head_ = (head_ + 1) % Capacity;
        }
        slots_used_.give();
    }

    void pop(T& item) {
        {
            LockGuard g(lock_);
            item = ring_[tail_];
            tail_ = (tail_ + 1) % Capacity;
        }
        slots_free_.give();
    }

    T ring_[Capacity]{};
    size_t head_ = 0;
    size_t tail_ = 0;

    Mutex lock_;
    CountingSemaphore slots_free_{Capacity, Capacity};
    CountingSemaphore slots_used_{Capacity, 0};
};

} // namespace Rtos
