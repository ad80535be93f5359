// Site credentials. Replace locally and keep real values out of version control.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "colorsorter-lab";
    static constexpr const char* WIFI_PASSWORD = "change-me";

    static constexpr const char* MQTT_HOST = "iwilr2-5.campus.fh-ludwigshafen.de";
    static constexpr int MQTT_PORT = 1883;
}

#endif // SECRETS_HPP
