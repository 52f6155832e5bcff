#include <main/telemetry/payload_builder.hpp>
#include <main/config/config.hpp>

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mjson.h>

namespace {
    // Digits of the shortest round-tripping %e form, e.g. 21.5f -> "215", exponent 1
    struct Decimal {
        char digits[16];
        int  digit_count;
        int  exponent;
        bool negative;
    };

    static Decimal shortestDecimal(float value) {
        char sci[32];
        for (int precision = 0; precision < 9; ++precision) {
            std::snprintf(sci, sizeof(sci), "%.*e", precision, static_cast<double>(value));
            if (std::strtof(sci, nullptr) == value) {
                break;
            }
        }

        Decimal dec{};
        const char* p = sci;
        if (*p == '-') {
            dec.negative = true;
            ++p;
        }
        for (; *p != '\0' && *p != 'e'; ++p) {
            if (*p >= '0' && *p <= '9' && dec.digit_count < static_cast<int>(sizeof(dec.digits) - 1)) {
                dec.digits[dec.digit_count++] = *p;
            }
        }
        if (*p == 'e') {
            dec.exponent = std::atoi(p + 1);
        }
        while (dec.digit_count > 1 && dec.digits[dec.digit_count - 1] == '0') {
            --dec.digit_count;
        }
        dec.digits[dec.digit_count] = '\0';
        return dec;
    }

    // Adds a mjson_snprintf result to len; false once the buffer is exhausted.
    // mjson truncates silently, so a completely full buffer counts as overflow.
    static bool appendPayload(std::size_t out_size, int& len, int written) {
        if (written < 0) {
            return false;
        }
        len += written;
        return static_cast<std::size_t>(len) < out_size - 1;
    }
}

namespace PayloadBuilder {
    TelemetryMessage build(const MetricSnapshot& snapshot, const char* device_id, int64_t timestamp_ms) {
        TelemetryMessage message{};
        std::snprintf(message.device_id, sizeof(message.device_id), "%s", device_id != nullptr ? device_id : "");
        message.channel = Config::Telemetry::channel;
        message.timestamp_ms = timestamp_ms;
        message.has_data = snapshot.hasAny();
        message.data = snapshot;
        return message;
    }

    int formatValue(float value, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        int n;
        if (std::isnan(value)) {
            n = std::snprintf(out, out_size, "NaN");
        } else if (std::isinf(value)) {
            n = std::snprintf(out, out_size, "%s", value < 0.0f ? "-Infinity" : "Infinity");
        } else if (value == 0.0f) {
            n = std::snprintf(out, out_size, "%s", std::signbit(value) ? "-0.0" : "0.0");
        } else {
            const Decimal dec = shortestDecimal(value);
            const float magnitude = std::fabs(value);
            char text[48];
            int t = 0;
            if (dec.negative) {
                text[t++] = '-';
            }
            if (magnitude >= 1e-3f && magnitude < 1e7f) {
                if (dec.exponent >= 0) {
                    for (int i = 0; i <= dec.exponent; ++i) {
                        text[t++] = (i < dec.digit_count) ? dec.digits[i] : '0';
                    }
                    text[t++] = '.';
                    if (dec.exponent + 1 < dec.digit_count) {
                        for (int i = dec.exponent + 1; i < dec.digit_count; ++i) {
                            text[t++] = dec.digits[i];
                        }
                    } else {
                        text[t++] = '0';
                    }
                } else {
                    text[t++] = '0';
                    text[t++] = '.';
                    for (int i = 0; i < -dec.exponent - 1; ++i) {
                        text[t++] = '0';
                    }
                    for (int i = 0; i < dec.digit_count; ++i) {
                        text[t++] = dec.digits[i];
                    }
                }
                text[t] = '\0';
            } else {
                text[t++] = dec.digits[0];
                text[t++] = '.';
                if (dec.digit_count > 1) {
                    for (int i = 1; i < dec.digit_count; ++i) {
                        text[t++] = dec.digits[i];
                    }
                } else {
                    text[t++] = '0';
                }
                std::snprintf(text + t, sizeof(text) - static_cast<std::size_t>(t), "E%d", dec.exponent);
            }
            n = std::snprintf(out, out_size, "%s", text);
        }
        if (n < 0 || static_cast<std::size_t>(n) >= out_size) {
            return -1;
        }
        return n;
    }

    int render(const TelemetryMessage& message, char* out, std::size_t out_size) {
        if (out == nullptr || out_size < 2) {
            return -1;
        }
        out[0] = '\0';

        // mjson has no 64-bit integer conversion; pre-format the timestamp
        char timestamp[24];
        std::snprintf(timestamp, sizeof(timestamp), "%" PRId64, message.timestamp_ms);

        int len = 0;
        if (!appendPayload(out_size, len,
                           mjson_snprintf(out, out_size, "{%Q:%Q,%Q:%Q,%Q:%s",
                                          "deviceId", message.device_id,
                                          "channel", message.channel,
                                          "timestamp", timestamp))) {
            return -1;
        }

        if (message.has_data) {
            if (!appendPayload(out_size, len, mjson_snprintf(out + len, out_size - static_cast<std::size_t>(len), ",%Q:{", "data"))) {
                return -1;
            }
            bool first = true;
            for (std::size_t i = 0; i < kMetricCount; ++i) {
                const Metric metric = static_cast<Metric>(i);
                if (!message.data.has(metric)) {
                    continue;
                }
                char value[32];
                if (formatValue(message.data.get(metric), value, sizeof(value)) < 0) {
                    return -1;
                }
                if (!appendPayload(out_size, len,
                                   mjson_snprintf(out + len, out_size - static_cast<std::size_t>(len), "%s%Q:%Q",
                                                  first ? "" : ",", metricName(metric), value))) {
                    return -1;
                }
                first = false;
            }
            if (!appendPayload(out_size, len, mjson_snprintf(out + len, out_size - static_cast<std::size_t>(len), "}"))) {
                return -1;
            }
        }

        if (!appendPayload(out_size, len, mjson_snprintf(out + len, out_size - static_cast<std::size_t>(len), "}"))) {
            return -1;
        }
        return len;
    }
}
