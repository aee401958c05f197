#include "os/rtos.hpp"
#include <pthread.h>
#include <semaphore.h>
#include <time.h>
#include <unistd.h>   // usleep
#include <cerrno>
#include <iostream>
#include <string>

namespace Rtos {

void SleepMs(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

uint64_t NowUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

// =======================
// Task
// =======================

namespace {

struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
};

void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    delete args;
    return nullptr;
}

} // anonymous namespace

struct Task::TaskHandle {
    pthread_t thread{};
    std::string name;
    bool created = false;
    bool joined = false;
};

Task::Task() : handle_(new TaskHandle{}) {}

Task::~Task() {
    if (handle_->created && !handle_->joined) {
        pthread_detach(handle_->thread);
    }
    delete handle_;
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    if (handle_->created && !handle_->joined) {
        std::cerr << "[RTOS] task '" << handle_->name << "' already running\n";
        return false;
    }

    handle_->name = name ? name : "";
    handle_->created = false;
    handle_->joined = false;

    auto* args = new ThreadArgs{fn, arg};
    const int rc = pthread_create(&handle_->thread, nullptr, threadEntryPoint, args);
    if (rc != 0) {
        std::cerr << "[RTOS] failed to create task '" << handle_->name << "' (rc=" << rc << ")\n";
        delete args;
        return false;
    }
    handle_->created = true;
    return true;
}

void Task::Join() {
    if (handle_->created && !handle_->joined) {
        pthread_join(handle_->thread, nullptr);
        handle_->joined = true;
    }
}

// =======================
// Mutex
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t native;
};

Mutex::Mutex() : handle_(new MutexHandle) {
    if (pthread_mutex_init(&handle_->native, nullptr) != 0) {
        std::cerr << "[RTOS] mutex init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->native);
    delete handle_;
}

void Mutex::lock() {
    pthread_mutex_lock(&handle_->native);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&handle_->native);
}

// =======================
// Counting Semaphore
// =======================

struct CountingSemaphore::CountingSemHandle {
    sem_t sem;
    unsigned maxCount;
};

CountingSemaphore::CountingSemaphore(size_t maxCount, size_t initialCount)
    : handle_(new CountingSemHandle) {
    handle_->maxCount = static_cast<unsigned>(maxCount);

    if (initialCount > maxCount) {
        std::cerr << "[RTOS] semaphore initial count > max count, clamping\n";
        initialCount = maxCount;
    }
    if (sem_init(&handle_->sem, 0, static_cast<unsigned>(initialCount)) != 0) {
        std::cerr << "[RTOS] sem_init failed\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&handle_->sem);
    delete handle_;
}

void CountingSemaphore::take() {
    while (sem_wait(&handle_->sem) != 0) {
        if (errno != EINTR) {
            std::cerr << "[RTOS] sem_wait failed\n";
            return;
        }
    }
}

bool CountingSemaphore::try_take() {
    return sem_trywait(&handle_->sem) == 0;
}

bool CountingSemaphore::take_for(uint32_t timeout_ms) {
    // sem_timedwait takes an absolute CLOCK_REALTIME deadline
    timespec deadline{};
    ::clock_gettime(CLOCK_REALTIME, &deadline);
    deadline.tv_sec  += static_cast<time_t>(timeout_ms / 1000u);
    deadline.tv_nsec += static_cast<long>(timeout_ms % 1000u) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec  += 1;
        deadline.tv_nsec -= 1000000000L;
    }

    while (sem_timedwait(&handle_->sem, &deadline) != 0) {
        if (errno == EINTR) continue;
        if (errno != ETIMEDOUT) {
            std::cerr << "[RTOS] sem_timedwait failed\n";
        }
        return false;
    }
    return true;
}

void CountingSemaphore::give() {
    int val = 0;
    sem_getvalue(&handle_->sem, &val);

    if (static_cast<unsigned>(val) < handle_->maxCount) {
        sem_post(&handle_->sem);
    } else {
        std::cerr << "[RTOS] semaphore give() called when full\n";
    }
}

} // namespace Rtos
