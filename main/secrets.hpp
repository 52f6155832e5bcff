// Local credentials. Replace before flashing; keep real values out of version control.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "changeme";
    static constexpr const char* WIFI_PASSWORD = "changeme";
    static constexpr const char* DEVICE_ID = "weatherstation-01";
}

#endif // SECRETS_HPP
