#pragma once
/**
 * @file WifiModule.h
 * @brief Station link for the supervisor's broker connection.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include <WiFi.h>
#include <ESPmDNS.h>

/** @brief Station settings (`wifi` config module). */
struct WifiLinkConfig {
    bool enabled = true;
    char ssid[32] = "";
    char pass[64] = "";
    char mdns[32] = "thermio";
};

/**
 * @brief Active module joining the configured network.
 *
 * `WifiNetReady` is posted once an address is assigned and `WifiNetLost` when
 * that address goes away. `<mdns>.local` is advertised while connected.
 */
class WifiModule : public ActiveModule {
public:
    const char* moduleId() const override { return "wifi"; }
    TaskSpec taskSpec() const override { return TaskSpec{"wifi", 3072, 1, 0}; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    WifiLinkConfig cfg_;
    WifiState state_ = WifiState::Idle;
    uint32_t sinceMs_ = 0;
    uint32_t noSsidLogMs_ = 0;
    bool announced_ = false;       ///< WifiNetReady posted for the current link
    bool mdnsUp_ = false;
    volatile bool rejoin_ = false;
    EventBus* bus_ = nullptr;
    WifiService svc_{};

    ConfigVariable<bool> enabledVar_ {
        NVS_KEY(NvsKeys::Wifi::Enabled),"enabled","wifi",ConfigType::Bool,
        &cfg_.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> ssidVar_ {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",ConfigType::CharArray,
        cfg_.ssid,ConfigPersistence::Persistent,sizeof(cfg_.ssid)
    };
    ConfigVariable<char> passVar_ {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",ConfigType::CharArray,
        cfg_.pass,ConfigPersistence::Persistent,sizeof(cfg_.pass)
    };
    ConfigVariable<char> mdnsVar_ {
        NVS_KEY(NvsKeys::Wifi::Mdns),"mdns","wifi",ConfigType::CharArray,
        cfg_.mdns,ConfigPersistence::Persistent,sizeof(cfg_.mdns)
    };

    void enter_(WifiState s);
    void join_();
    bool announce_();
    void startMdns_();

    static WifiState svcState(void* ctx);
    static bool svcGetIP(void* ctx, char* out, size_t len);
    static int8_t svcRssi(void* ctx);

    static void onEventStatic(const Event& e, void* user);
};
