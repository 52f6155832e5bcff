#include <unity.h>

#include <memory>
#include <vector>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <main/runtime/freertos_work_queue.hpp>
#include "fakes/fake_watchdog.hpp"

namespace {
const TickType_t kWaitTicks = pdMS_TO_TICKS(2000);

// Jobs append to order; finish() releases the test task
class Recorder {
public:
  Recorder() : done(xSemaphoreCreateBinary()) {}
  ~Recorder() { vSemaphoreDelete(done); }

  Recorder(const Recorder&) = delete;
  Recorder& operator=(const Recorder&) = delete;

  WorkQueue::Job record(int id) {
    return [this, id]() { order.push_back(id); };
  }

  WorkQueue::Job finish() {
    return [this]() { xSemaphoreGive(done); };
  }

  bool waitDone() { return xSemaphoreTake(done, kWaitTicks) == pdTRUE; }

  std::vector<int> order;

private:
  SemaphoreHandle_t done;
};

std::unique_ptr<FreeRtosWorkQueue> startedQueue() {
  auto queue = std::make_unique<FreeRtosWorkQueue>("test_worker");
  TEST_ASSERT_TRUE(queue->begin());
  return queue;
}
} // namespace

void test_worker_runs_equal_deadline_jobs_in_post_order() {
  Recorder recorder;
  auto queue = startedQueue();

  TEST_ASSERT_TRUE(queue->post(recorder.record(1), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(queue->post(recorder.record(2), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(queue->post(recorder.record(3), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(queue->post(recorder.finish(), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(recorder.waitDone());

  TEST_ASSERT_EQUAL(3, recorder.order.size());
  TEST_ASSERT_EQUAL(1, recorder.order[0]);
  TEST_ASSERT_EQUAL(2, recorder.order[1]);
  TEST_ASSERT_EQUAL(3, recorder.order[2]);
  TEST_ASSERT_TRUE(queue->shutdown());
}

void test_worker_runs_delayed_job_after_its_delay() {
  Recorder recorder;
  auto queue = startedQueue();
  TickType_t ran_at = 0;
  const TickType_t posted_at = xTaskGetTickCount();

  TEST_ASSERT_TRUE(queue->post([&]() {
    ran_at = xTaskGetTickCount();
    recorder.order.push_back(1);
    recorder.finish()();
  }, 200, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(queue->post(recorder.record(2), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(recorder.waitDone());

  // Posted later but due earlier
  TEST_ASSERT_EQUAL(2, recorder.order.size());
  TEST_ASSERT_EQUAL(2, recorder.order[0]);
  TEST_ASSERT_EQUAL(1, recorder.order[1]);
  TEST_ASSERT_TRUE(static_cast<TickType_t>(ran_at - posted_at) >= pdMS_TO_TICKS(200));
  TEST_ASSERT_TRUE(queue->shutdown());
}

void test_worker_cancel_drops_tagged_jobs() {
  Recorder recorder;
  auto queue = startedQueue();

  TEST_ASSERT_TRUE(queue->post(recorder.record(7), 200, 7));
  TEST_ASSERT_TRUE(queue->post(recorder.record(8), 200, 8));
  queue->cancel(7);
  TEST_ASSERT_EQUAL(1, queue->pendingCount());

  TEST_ASSERT_TRUE(queue->post(recorder.finish(), 400, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(recorder.waitDone());
  TEST_ASSERT_EQUAL(1, recorder.order.size());
  TEST_ASSERT_EQUAL(8, recorder.order[0]);
  TEST_ASSERT_TRUE(queue->shutdown());
}

void test_worker_rejects_jobs_when_full() {
  auto queue = startedQueue();
  const std::size_t capacity = Config::Tasks::Publisher::max_pending_jobs;

  for (std::size_t i = 0; i < capacity; ++i) {
    TEST_ASSERT_TRUE(queue->post([]() {}, 60000, WorkQueue::NO_TAG));
  }
  TEST_ASSERT_FALSE(queue->post([]() {}, 0, WorkQueue::NO_TAG));
  TEST_ASSERT_EQUAL(capacity, queue->pendingCount());
  TEST_ASSERT_TRUE(queue->shutdown());
}

void test_worker_shutdown_runs_due_jobs_and_discards_delayed() {
  Recorder recorder;
  const int subscribed_before = FakeWatchdog::subscribed.load();
  const int unsubscribed_before = FakeWatchdog::unsubscribed.load();
  auto queue = startedQueue();

  // Same shape as close(): a delayed publish tick plus the final disconnect
  TEST_ASSERT_TRUE(queue->post(recorder.record(2), 5000, 42));
  TEST_ASSERT_TRUE(queue->post(recorder.record(1), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(queue->shutdown());

  TEST_ASSERT_EQUAL(1, recorder.order.size());
  TEST_ASSERT_EQUAL(1, recorder.order[0]);
  TEST_ASSERT_EQUAL(0, queue->pendingCount());
  TEST_ASSERT_FALSE(queue->post(recorder.record(3), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_FALSE(queue->begin());
  TEST_ASSERT_TRUE(queue->shutdown());

  // The worker left the watchdog before exiting
  TEST_ASSERT_EQUAL(1, FakeWatchdog::subscribed.load() - subscribed_before);
  TEST_ASSERT_EQUAL(1, FakeWatchdog::unsubscribed.load() - unsubscribed_before);
}

void test_worker_context_and_self_shutdown() {
  Recorder recorder;
  auto queue = startedQueue();
  bool inside = false;
  bool self_shutdown = true;

  TEST_ASSERT_FALSE(queue->isWorkerContext());
  TEST_ASSERT_TRUE(queue->post([&]() {
    inside = queue->isWorkerContext();
    self_shutdown = queue->shutdown();
    recorder.finish()();
  }, 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(recorder.waitDone());

  TEST_ASSERT_TRUE(inside);
  TEST_ASSERT_FALSE(self_shutdown);
  // Still usable after the refused call
  TEST_ASSERT_TRUE(queue->post(recorder.finish(), 0, WorkQueue::NO_TAG));
  TEST_ASSERT_TRUE(recorder.waitDone());
  TEST_ASSERT_TRUE(queue->shutdown());
}
