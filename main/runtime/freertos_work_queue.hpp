#ifndef FREERTOS_WORK_QUEUE_HPP
#define FREERTOS_WORK_QUEUE_HPP

#include <array>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <main/config/config.hpp>
#include <main/runtime/work_queue.hpp>

// WorkQueue backed by one statically allocated FreeRTOS task.
// Pending jobs live in a fixed table; deadlines are in RTOS ticks.
// The object owns the task stack and must outlive shutdown().
class FreeRtosWorkQueue : public WorkQueue {
public:
    explicit FreeRtosWorkQueue(const char* task_name);
    ~FreeRtosWorkQueue() override;

    FreeRtosWorkQueue(const FreeRtosWorkQueue&) = delete;
    FreeRtosWorkQueue& operator=(const FreeRtosWorkQueue&) = delete;

    bool begin() override;
    bool post(Job job, uint32_t delay_ms, uint32_t tag) override;
    void cancel(uint32_t tag) override;
    bool shutdown() override;
    bool isWorkerContext() const override;

    std::size_t pendingCount() const;

private:
    struct Entry {
        bool       used;
        uint32_t   tag;
        uint32_t   seq;
        TickType_t due;
        Job        job;
    };

    enum class NextStep : uint8_t { RUN, WAIT, EXIT };

    static void taskEntry(void* arg);
    void run();
    NextStep takeNext(Job& out_job, TickType_t& out_wait);

    const char* name;
    std::array<Entry, Config::Tasks::Publisher::max_pending_jobs> entries;
    uint32_t next_seq;
    bool accepting;
    bool quitting;

    SemaphoreHandle_t mutex;
    StaticSemaphore_t mutex_buffer;
    SemaphoreHandle_t exited;
    StaticSemaphore_t exited_buffer;

    TaskHandle_t task;
    StaticTask_t task_tcb;
    StackType_t task_stack[Config::Tasks::Publisher::stack_size_bytes / sizeof(StackType_t)];
};

#endif // FREERTOS_WORK_QUEUE_HPP
