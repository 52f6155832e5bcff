#ifndef FAKE_WIFI_LINK_HPP
#define FAKE_WIFI_LINK_HPP

#include <main/config/config.hpp>
#include <main/network/wifi_link.hpp>

// Station link with the driver's retry budget: each lost association is
// retried until max_retry_count, then the link goes idle until connect().
class FakeWifiLink : public WifiLink {
public:
    bool hasIp() const override { return got_ip; }
    bool isConnecting() const override { return connecting; }

    bool connect() override {
        ++connect_calls;
        retries = 0;
        connecting = connect_result;
        return connect_result;
    }

    void associationFailed() {
        got_ip = false;
        if (retries < Config::Wifi::max_retry_count) {
            ++retries;
            connecting = true;
        } else {
            connecting = false;
        }
    }

    void gotIp() {
        got_ip = true;
        connecting = false;
        retries = 0;
    }

    bool got_ip = false;
    bool connecting = true;
    bool connect_result = true;
    int retries = 0;
    int connect_calls = 0;
};

#endif // FAKE_WIFI_LINK_HPP
