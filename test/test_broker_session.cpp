#include <unity.h>

#include <cstdio>
#include <cstring>
#include <main/network/broker_session.hpp>
#include "fakes/fake_transport.hpp"
#include "fakes/manual_work_queue.hpp"

namespace {
constexpr const char* kTopic = "weatherstation/telemetry";

esp_err_t publishText(BrokerSession& session, const char* text) {
  return session.publish(kTopic, text, std::strlen(text), 1);
}

esp_err_t publishNumbered(BrokerSession& session, int n) {
  char text[16];
  std::snprintf(text, sizeof(text), "m%d", n);
  return publishText(session, text);
}

void connectNow(FakeTransport& transport, ManualWorkQueue& queue, BrokerSession& session) {
  TEST_ASSERT_EQUAL(ESP_OK, session.connect());
  transport.fireConnected();
  queue.runDue();
}
} // namespace

void test_publish_before_first_connect_is_rejected() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);

  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, publishText(session, "early"));
  TEST_ASSERT_FALSE(session.isBufferEnabled());
  TEST_ASSERT_EQUAL_UINT32(0, session.stats().buffered);
  TEST_ASSERT_EQUAL(0, transport.sent.size());
}

void test_connect_and_publish_directly() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);

  TEST_ASSERT_EQUAL(ESP_OK, session.connect());
  TEST_ASSERT_EQUAL(SessionState::CONNECTING, session.state());
  TEST_ASSERT_EQUAL(1, transport.start_calls);

  transport.fireConnected();
  queue.runDue();
  TEST_ASSERT_EQUAL(SessionState::CONNECTED, session.state());
  TEST_ASSERT_TRUE(session.isBufferEnabled());

  TEST_ASSERT_EQUAL(ESP_OK, publishText(session, "hello"));
  TEST_ASSERT_EQUAL(1, transport.sent.size());
  TEST_ASSERT_EQUAL_STRING(kTopic, transport.sent[0].topic.c_str());
  TEST_ASSERT_EQUAL_STRING("hello", transport.sent[0].payload.c_str());
  TEST_ASSERT_EQUAL(1, transport.sent[0].qos);
  TEST_ASSERT_EQUAL_UINT32(1, session.stats().published);
}

void test_connect_start_failure_leaves_session_disconnected() {
  FakeTransport transport;
  transport.start_result = ESP_FAIL;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);

  TEST_ASSERT_EQUAL(ESP_FAIL, session.connect());
  TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, session.state());
}

void test_buffered_messages_flush_in_order_on_reconnect() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);
  connectNow(transport, queue, session);

  transport.fireDisconnected();
  TEST_ASSERT_EQUAL(SessionState::RECONNECT_PENDING, session.state());
  for (int i = 0; i < 5; ++i) {
    TEST_ASSERT_EQUAL(ESP_OK, publishNumbered(session, i));
  }
  TEST_ASSERT_EQUAL(0, transport.sent.size());
  TEST_ASSERT_EQUAL_UINT32(5, session.stats().buffered);

  transport.fireConnected();
  // Flush is handed to the worker, not done on the transport task
  TEST_ASSERT_EQUAL(0, transport.sent.size());
  queue.runDue();

  TEST_ASSERT_EQUAL(5, transport.sent.size());
  for (int i = 0; i < 5; ++i) {
    char expected[16];
    std::snprintf(expected, sizeof(expected), "m%d", i);
    TEST_ASSERT_EQUAL_STRING(expected, transport.sent[static_cast<std::size_t>(i)].payload.c_str());
  }
  const SessionStats stats = session.stats();
  TEST_ASSERT_EQUAL_UINT32(5, stats.flushed);
  TEST_ASSERT_EQUAL_UINT32(0, stats.buffered);
}

void test_full_buffer_keeps_oldest_and_rejects_newest() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);
  connectNow(transport, queue, session);
  transport.fireDisconnected();

  const int capacity = static_cast<int>(Config::Telemetry::disconnected_buffer_capacity);
  for (int i = 0; i < capacity; ++i) {
    TEST_ASSERT_EQUAL(ESP_OK, publishNumbered(session, i));
  }
  for (int i = capacity; i < capacity + 5; ++i) {
    TEST_ASSERT_EQUAL(ESP_ERR_NO_MEM, publishNumbered(session, i));
  }
  TEST_ASSERT_EQUAL_UINT32(capacity, session.stats().buffered);
  TEST_ASSERT_EQUAL_UINT32(5, session.stats().dropped);

  transport.fireConnected();
  queue.runDue();
  TEST_ASSERT_EQUAL(capacity, transport.sent.size());
  TEST_ASSERT_EQUAL_STRING("m0", transport.sent.front().payload.c_str());
  TEST_ASSERT_EQUAL_STRING("m99", transport.sent.back().payload.c_str());
}

void test_publish_while_connected_flushes_backlog_first() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);
  connectNow(transport, queue, session);

  transport.reject_enqueue = true;
  TEST_ASSERT_EQUAL(ESP_OK, publishText(session, "first"));
  TEST_ASSERT_EQUAL_UINT32(1, session.stats().buffered);

  transport.reject_enqueue = false;
  TEST_ASSERT_EQUAL(ESP_OK, publishText(session, "second"));
  TEST_ASSERT_EQUAL(2, transport.sent.size());
  TEST_ASSERT_EQUAL_STRING("first", transport.sent[0].payload.c_str());
  TEST_ASSERT_EQUAL_STRING("second", transport.sent[1].payload.c_str());
}

void test_oversized_message_is_rejected() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);
  connectNow(transport, queue, session);

  char big[Config::Telemetry::max_payload_len + 8];
  std::memset(big, 'x', sizeof(big));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, session.publish(kTopic, big, sizeof(big), 1));
  TEST_ASSERT_EQUAL(0, transport.sent.size());
}

void test_connect_error_and_reconnect_policy() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);

  TEST_ASSERT_EQUAL(ESP_OK, session.connect());
  transport.fireError(5);
  TEST_ASSERT_EQUAL(SessionState::RECONNECT_PENDING, session.state());

  session.setReconnectPolicy(false);
  TEST_ASSERT_FALSE(transport.auto_reconnect);
  TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, session.state());

  session.setReconnectPolicy(true);
  TEST_ASSERT_TRUE(transport.auto_reconnect);
  transport.fireConnecting();
  TEST_ASSERT_EQUAL(SessionState::CONNECTING, session.state());
}

void test_disconnect_is_terminal() {
  FakeTransport transport;
  ManualWorkQueue queue;
  BrokerSession session(transport, queue);
  connectNow(transport, queue, session);
  transport.fireDisconnected();
  TEST_ASSERT_EQUAL(ESP_OK, publishText(session, "pending"));

  session.disconnect();
  TEST_ASSERT_EQUAL(1, transport.stop_calls);
  TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, session.state());
  TEST_ASSERT_EQUAL_UINT32(0, session.stats().buffered);
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, publishText(session, "late"));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, session.connect());

  // Late broker events cannot revive it
  transport.fireConnected();
  queue.runDue();
  TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, session.state());
  TEST_ASSERT_EQUAL(0, transport.sent.size());

  session.disconnect();
  TEST_ASSERT_EQUAL(1, transport.stop_calls);
}
