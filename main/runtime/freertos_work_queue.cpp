#include <main/runtime/freertos_work_queue.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "WorkQueue";

    // Wake at least this often to feed the task watchdog while idle
    static constexpr TickType_t kMaxIdleTicks = pdMS_TO_TICKS(Watchdog::TIMEOUT_MS / 4);

    // True if deadline a is strictly before b, tolerant of tick wrap-around
    static bool isBefore(TickType_t a, TickType_t b) {
        return static_cast<int32_t>(a - b) < 0;
    }
}

FreeRtosWorkQueue::FreeRtosWorkQueue(const char* task_name)
    : name(task_name),
      entries{},
      next_seq(0),
      accepting(false),
      quitting(false),
      mutex(nullptr),
      exited(nullptr),
      task(nullptr) {
    mutex = xSemaphoreCreateMutexStatic(&mutex_buffer);
    exited = xSemaphoreCreateBinaryStatic(&exited_buffer);
}

FreeRtosWorkQueue::~FreeRtosWorkQueue() {
    if (task != nullptr) {
        (void)shutdown();
    }
}

bool FreeRtosWorkQueue::begin() {
    if (task != nullptr) {
        return true;
    }
    if (quitting) {
        LOG_ERROR(TAG, "%s: cannot restart after shutdown", name);
        return false;
    }
    accepting = true;
    task = xTaskCreateStatic(&FreeRtosWorkQueue::taskEntry,
                             name,
                             sizeof(task_stack) / sizeof(StackType_t),
                             this,
                             Config::TaskPriorities::NORMAL,
                             task_stack,
                             &task_tcb);
    if (task == nullptr) {
        accepting = false;
        LOG_ERROR(TAG, "%s: task creation failed", name);
        return false;
    }
    LOG_INFO(TAG, "%s: worker started", name);
    return true;
}

bool FreeRtosWorkQueue::post(Job job, uint32_t delay_ms, uint32_t tag) {
    bool stored = false;
    xSemaphoreTake(mutex, portMAX_DELAY);
    const bool was_accepting = accepting;
    if (accepting) {
        for (auto& entry : entries) {
            if (!entry.used) {
                entry.used = true;
                entry.tag = tag;
                entry.seq = next_seq++;
                entry.due = xTaskGetTickCount() + pdMS_TO_TICKS(delay_ms);
                entry.job = std::move(job);
                stored = true;
                break;
            }
        }
    }
    // Notify under the mutex: shutdown() only deletes the task after
    // clearing the handle under the same mutex
    if (stored && task != nullptr) {
        xTaskNotifyGive(task);
    }
    xSemaphoreGive(mutex);

    if (!stored) {
        LOG_WARN(TAG, "%s: job rejected (%s)", name, was_accepting ? "queue full" : "not accepting");
        return false;
    }
    return true;
}

void FreeRtosWorkQueue::cancel(uint32_t tag) {
    if (tag == NO_TAG) {
        return;
    }
    xSemaphoreTake(mutex, portMAX_DELAY);
    for (auto& entry : entries) {
        if (entry.used && entry.tag == tag) {
            entry.used = false;
            entry.job = nullptr;
        }
    }
    xSemaphoreGive(mutex);
}

std::size_t FreeRtosWorkQueue::pendingCount() const {
    std::size_t count = 0;
    xSemaphoreTake(mutex, portMAX_DELAY);
    for (const auto& entry : entries) {
        if (entry.used) {
            ++count;
        }
    }
    xSemaphoreGive(mutex);
    return count;
}

bool FreeRtosWorkQueue::isWorkerContext() const {
    return task != nullptr && xTaskGetCurrentTaskHandle() == task;
}

bool FreeRtosWorkQueue::shutdown() {
    if (task == nullptr) {
        return true;
    }
    if (isWorkerContext()) {
        LOG_ERROR(TAG, "%s: shutdown() called from the worker itself", name);
        return false;
    }

    xSemaphoreTake(mutex, portMAX_DELAY);
    accepting = false;
    quitting = true;
    xSemaphoreGive(mutex);
    xTaskNotifyGive(task);

    if (xSemaphoreTake(exited, pdMS_TO_TICKS(Config::Tasks::Publisher::shutdown_timeout_ms)) != pdTRUE) {
        LOG_ERROR(TAG, "%s: worker did not drain within %lu ms", name,
                  static_cast<unsigned long>(Config::Tasks::Publisher::shutdown_timeout_ms));
        return false;
    }
    // Worker is parked after signalling; its stack is ours, so delete it here
    xSemaphoreTake(mutex, portMAX_DELAY);
    TaskHandle_t parked = task;
    task = nullptr;
    xSemaphoreGive(mutex);
    vTaskDelete(parked);
    LOG_INFO(TAG, "%s: worker stopped", name);
    return true;
}

FreeRtosWorkQueue::NextStep FreeRtosWorkQueue::takeNext(Job& out_job, TickType_t& out_wait) {
    const TickType_t now = xTaskGetTickCount();
    Entry* next = nullptr;
    NextStep step = NextStep::WAIT;

    xSemaphoreTake(mutex, portMAX_DELAY);
    for (auto& entry : entries) {
        if (!entry.used) {
            continue;
        }
        const bool due = !isBefore(now, entry.due);
        if (quitting && !due) {
            // Delayed work is discarded on shutdown
            entry.used = false;
            entry.job = nullptr;
            continue;
        }
        if (next == nullptr || isBefore(entry.due, next->due) ||
            (entry.due == next->due && static_cast<int32_t>(entry.seq - next->seq) < 0)) {
            next = &entry;
        }
    }

    if (next != nullptr && !isBefore(now, next->due)) {
        out_job = std::move(next->job);
        next->job = nullptr;
        next->used = false;
        step = NextStep::RUN;
    } else if (next != nullptr) {
        out_wait = next->due - now;
    } else if (quitting) {
        step = NextStep::EXIT;
    } else {
        out_wait = portMAX_DELAY;
    }
    xSemaphoreGive(mutex);
    return step;
}

void FreeRtosWorkQueue::taskEntry(void* arg) {
    static_cast<FreeRtosWorkQueue*>(arg)->run();
}

void FreeRtosWorkQueue::run() {
    const bool watched = Watchdog::subscribe();

    for (;;) {
        if (watched) {
            Watchdog::feed();
        }
        Job job;
        TickType_t wait = 0;
        NextStep step = takeNext(job, wait);
        if (step == NextStep::RUN) {
            if (job) {
                job();
            }
            continue;
        }
        if (step == NextStep::EXIT) {
            break;
        }
        (void)ulTaskNotifyTake(pdTRUE, wait < kMaxIdleTicks ? wait : kMaxIdleTicks);
    }

    if (watched) {
        Watchdog::unsubscribe();
    }
    xSemaphoreGive(exited);
    // Parked until shutdown() deletes this task
    vTaskSuspend(nullptr);
}
