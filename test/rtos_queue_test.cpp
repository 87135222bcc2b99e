#include "os/rtos.hpp"
#include <iostream>

// Define the queue type with int messages and size 5
Rtos::Queue<int, 5> queue;

static int g_received[10] = {};
static int g_received_n = 0;

void Producer(void*) {
    std::cout << "[Producer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        if (!queue.send(i)) {  // blocks if queue is full
            std::cerr << "[Producer] send failed: " << i << "\n";
            return;
        }
        std::cout << "[Producer] Sent: " << i << std::endl;
        Rtos::SleepMs(5);  // Simulate slower production
    }
}

void Consumer(void*) {
    Rtos::SleepMs(100);
    std::cout << "[Consumer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        int value;
        if (!queue.receive(value, 2000)) {  // blocks until item is available
            std::cerr << "[Consumer] receive timed out\n";
            return;
        }
        std::cout << "[Consumer] Received: " << value << std::endl;
        g_received[g_received_n++] = value;
        Rtos::SleepMs(20);  // Simulate processing
    }
}

// Blocking FIFO: all items arrive, in order, nothing dropped
static bool test_fifo_threads() {
    Rtos::Task producerTask;
    Rtos::Task consumerTask;

    if (!producerTask.Create("Producer", Producer, nullptr) ||
        !consumerTask.Create("Consumer", Consumer, nullptr)) {
        std::cerr << "[TEST] FAIL: task create\n";
        return false;
    }

    std::cout << "[Main] Waiting for threads...\n";
    producerTask.Join();
    consumerTask.Join();

    if (g_received_n != 10) {
        std::cerr << "[TEST] FAIL: received " << g_received_n << " of 10\n";
        return false;
    }
    for (int i = 0; i < 10; ++i) {
        if (g_received[i] != i + 1) {
            std::cerr << "[TEST] FAIL: out of order at " << i << "\n";
            return false;
        }
    }
    std::cout << "[TEST] ok: FIFO order across threads\n";
    return true;
}

// Overwrite mode: freshest wins, oldest dropped
static bool test_overwrite() {
    Rtos::Queue<int, 3> q(/*overwrite=*/true);
    for (int i = 1; i <= 5; ++i) {
        if (!q.send(i)) {
            std::cerr << "[TEST] FAIL: overwrite send\n";
            return false;
        }
    }

    int v = 0;
    const int want[3] = {3, 4, 5};
    for (int i = 0; i < 3; ++i) {
        if (!q.try_receive(v) || v != want[i]) {
            std::cerr << "[TEST] FAIL: overwrite order got " << v << " want " << want[i] << "\n";
            return false;
        }
    }
    if (q.try_receive(v)) {
        std::cerr << "[TEST] FAIL: overwrite queue should be empty\n";
        return false;
    }
    if (q.dropped() != 2) {
        std::cerr << "[TEST] FAIL: dropped=" << q.dropped() << " want 2\n";
        return false;
    }

    // Single-slot state queue keeps only the latest
    Rtos::Queue<int, 1> latest(/*overwrite=*/true);
    latest.send(7);
    latest.send(8);
    if (!latest.try_receive(v) || v != 8) {
        std::cerr << "[TEST] FAIL: latest-only queue\n";
        return false;
    }

    std::cout << "[TEST] ok: overwrite mode\n";
    return true;
}

// Non-overwrite mode: full queue refuses instead of dropping
static bool test_timeouts() {
    Rtos::Queue<int, 2> q;
    int v = 0;

    if (q.receive(v, 20)) {
        std::cerr << "[TEST] FAIL: receive on empty queue\n";
        return false;
    }

    const uint64_t t0 = Rtos::NowUs();
    q.try_send(1);
    q.try_send(2);
    if (q.try_send(3) || q.send(3, 30)) {
        std::cerr << "[TEST] FAIL: send on full queue\n";
        return false;
    }
    const uint64_t waited_us = Rtos::NowUs() - t0;
    if (waited_us < 20000) {
        std::cerr << "[TEST] FAIL: send timeout returned after " << waited_us << " us\n";
        return false;
    }

    if (!q.receive(v, 0) || v != 1) {
        std::cerr << "[TEST] FAIL: head after full\n";
        return false;
    }
    if (q.dropped() != 0) {
        std::cerr << "[TEST] FAIL: blocking queue dropped items\n";
        return false;
    }

    Rtos::CountingSemaphore sem(1, 0);
    if (sem.try_take() || sem.take(10)) {
        std::cerr << "[TEST] FAIL: empty semaphore taken\n";
        return false;
    }
    sem.give();
    if (!sem.take(10)) {
        std::cerr << "[TEST] FAIL: semaphore give/take\n";
        return false;
    }

    std::cout << "[TEST] ok: timeouts\n";
    return true;
}

int main() {
    std::cout << "=== RTOS QUEUE TEST ===\n";

    if (!test_overwrite()) return 1;
    if (!test_timeouts()) return 1;
    if (!test_fifo_threads()) return 1;

    std::cout << "[Main] Test complete.\n";
    return 0;
}
