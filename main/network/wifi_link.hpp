#ifndef WIFI_LINK_HPP
#define WIFI_LINK_HPP

// Station link control as seen by LinkSupervisor.
class WifiLink {
public:
    virtual ~WifiLink() = default;
    virtual bool hasIp() const = 0;
    virtual bool isConnecting() const = 0;
    // Start a fresh association attempt with a reset retry budget
    virtual bool connect() = 0;
};

#endif // WIFI_LINK_HPP
