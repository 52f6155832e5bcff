// Fixed-size copy of one publish request, held by the broker session
// while the link is down.
#ifndef OUTGOING_MESSAGE_HPP
#define OUTGOING_MESSAGE_HPP

#include <cstdint>
#include <main/config/config.hpp>

struct OutgoingMessage {
    char     topic[Config::Telemetry::max_topic_len];
    char     payload[Config::Telemetry::max_payload_len];
    uint16_t payload_len; // payload is not null-terminated on the wire
    uint8_t  qos;
};

#endif // OUTGOING_MESSAGE_HPP
