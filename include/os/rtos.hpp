#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Block forever
static constexpr int MAX_TIMEOUT = -1;

void SleepMs(int ms);

// Monotonic clock (µs since an arbitrary start point)
uint64_t NowUs();

// Sleep until the monotonic clock reaches t_us (returns immediately if in the past)
void SleepUntilUs(uint64_t t_us);

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper

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

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    // block until count>0 (or timeout_ms elapses), then --count
    bool take(int timeout_ms = MAX_TIMEOUT);
    bool try_take();  // non‐blocking: if count>0 then --count, else false
    void give();      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue
//
// Circular buffer synchronised with the OSAL Mutex and two counting
// semaphores (free slots / filled slots). Portable across POSIX and an
// RTOS port that provides the same primitives.
//
// Overwrite mode (freshest wins): send() never blocks; when the queue is
// full the oldest element is dropped. Used for state/telemetry taps where
// a stale value is worth less than a fresh one.
//
// Non-overwrite mode: send() blocks (up to timeout_ms) for free space, so
// nothing is ever dropped silently. Used for event streams whose order and
// completeness matter.
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue capacity must be non-zero");

public:
    explicit Queue(bool overwrite = false)
        : head(0), tail(0), m_overwrite(overwrite) {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    bool send(const T& item, int timeout_ms = MAX_TIMEOUT) {
        if (m_overwrite) {
            if (!spaceAvailable.try_take()) {
                // Full: replace the oldest element, counts stay unchanged
                lock.lock();
                buffer[head] = item;
                head = (head + 1) % Capacity;
                tail = (tail + 1) % Capacity;
                ++m_dropped;
                lock.unlock();
                return true;
            }
        } else if (!spaceAvailable.take(timeout_ms)) {
            return false; // timed out waiting for space
        }

        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
        return true;
    }

    bool try_send(const T& item) {
        if (m_overwrite) return send(item);

        if (!spaceAvailable.try_take()) return false;
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();
        return true;
    }

    bool receive(T& item, int timeout_ms = MAX_TIMEOUT) {
        if (!dataAvailable.take(timeout_ms)) return false;  // Wait for data
        lock.lock();
        item = buffer[tail];
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give(); // Signal space is available
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        lock.lock();
        item = buffer[tail];
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give();
        return true;
    }

    // Number of elements replaced in overwrite mode
    uint32_t dropped() {
        lock.lock();
        const uint32_t n = m_dropped;
        lock.unlock();
        return n;
    }

private:
    T buffer[Capacity];
    size_t head, tail;
    bool m_overwrite;
    uint32_t m_dropped = 0;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
