#pragma once
/**
 * @file MQTTModule.h
 * @brief Broker link of the supervisor: publishing, topic routes and the command channel.
 */
#include "Core/Module.h"
#include "Core/ErrorCodes.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include <AsyncMqttClient.h>
#include <freertos/semphr.h>

/** @brief Broker settings (`mqtt` config module). */
struct MqttLinkConfig {
    bool enabled = true;
    char host[Limits::Mqtt::Buffers::Host] = {0};
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = {0};
    char pass[Limits::Mqtt::Buffers::Pass] = {0};
    char baseTopic[Limits::Mqtt::Buffers::BaseTopic] = {0};
};

/** @brief Broker link state, advanced by the module task only. */
enum class LinkState : uint8_t { Off, AwaitNetwork, Connecting, Online, Backoff };

/**
 * @brief Active module owning the AsyncMqttClient connection.
 *
 * The client callbacks run on the network task: they only copy inbound messages
 * into a queue. The module task drains it and hands each message to every
 * matching route. The command channel `<base>/<id>/cmd` is one of those routes.
 */
class MQTTModule : public ActiveModule {
public:
    const char* moduleId() const override { return "mqtt"; }
    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        static const char* const kDeps[] = {"loghub", "eventbus", "wifi", "cmd", "time"};
        return (i < 5) ? kDeps[i] : nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Build the supervisor topics from the loaded config and register the command route. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;
    TaskSpec taskSpec() const override { return TaskSpec{"mqtt", Limits::Mqtt::TaskStackSize}; }

    /** @brief MQTT filter match (`+` one level, `#` trailing multi-level). */
    static bool topicMatches(const char* filter, const char* topic);

private:
    struct Route {
        char filter[Limits::Mqtt::Buffers::RouteFilter];
        uint8_t qos;
        MqttMessageHandler fn;
        void* ctx;
    };

    struct Inbound {
        char topic[Limits::Mqtt::Buffers::RxTopic];
        char payload[Limits::Mqtt::Buffers::RxPayload];
        uint16_t len;
        uint32_t at;
    };

    MqttLinkConfig cfg_;
    LinkState link_ = LinkState::Off;
    uint32_t linkSinceMs_ = 0;
    uint32_t backoffMs_ = Limits::Mqtt::Backoff::MinMs;   ///< base delay, doubled per failure
    uint32_t waitMs_ = 0;                                  ///< jittered delay of the current Backoff
    volatile bool netUp_ = false;
    volatile uint32_t netUpSinceMs_ = 0;
    volatile bool relink_ = false;
    volatile bool upPending_ = false;      ///< set by onLinkUp_, consumed by loop()
    volatile bool downPending_ = false;    ///< set by onLinkDown_, consumed by loop()
    volatile uint8_t downReason_ = 0;

    AsyncMqttClient client_;
    SemaphoreHandle_t txLock_ = nullptr;
    QueueHandle_t inbox_ = nullptr;
    Inbound rx_{};

    const CommandService* cmdSvc_ = nullptr;
    const TimeService* timeSvc_ = nullptr;
    EventBus* bus_ = nullptr;
    MqttService svc_{};

    char clientId_[Limits::Mqtt::Buffers::DeviceId] = {0};
    char statusTopic_[Limits::Mqtt::Buffers::Topic] = {0};
    char cmdTopic_[Limits::Mqtt::Buffers::Topic] = {0};
    char ackTopic_[Limits::Mqtt::Buffers::Topic] = {0};

    Route routes_[Limits::Mqtt::Capacity::MaxRoutes] = {};
    uint8_t routeCount_ = 0;

    char args_[Limits::Mqtt::Buffers::CmdArgs] = {0};
    char reply_[Limits::Mqtt::Buffers::Reply] = {0};
    char ack_[Limits::Mqtt::Buffers::Ack] = {0};

    volatile uint32_t dropped_ = 0;   ///< inbox full, fragmented or oversized
    uint32_t droppedLogged_ = 0;
    uint32_t unrouted_ = 0;

    ConfigVariable<bool> enabledVar_ {
        NVS_KEY(NvsKeys::Mqtt::Enabled),"enabled","mqtt",ConfigType::Bool,
        &cfg_.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> hostVar_ {
        NVS_KEY(NvsKeys::Mqtt::Host),"host","mqtt",ConfigType::CharArray,
        cfg_.host,ConfigPersistence::Persistent,sizeof(cfg_.host)
    };
    ConfigVariable<int32_t> portVar_ {
        NVS_KEY(NvsKeys::Mqtt::Port),"port","mqtt",ConfigType::Int32,
        &cfg_.port,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> userVar_ {
        NVS_KEY(NvsKeys::Mqtt::User),"user","mqtt",ConfigType::CharArray,
        cfg_.user,ConfigPersistence::Persistent,sizeof(cfg_.user)
    };
    ConfigVariable<char> passVar_ {
        NVS_KEY(NvsKeys::Mqtt::Pass),"pass","mqtt",ConfigType::CharArray,
        cfg_.pass,ConfigPersistence::Persistent,sizeof(cfg_.pass)
    };
    ConfigVariable<char> baseTopicVar_ {
        NVS_KEY(NvsKeys::Mqtt::BaseTopic),"baseTopic","mqtt",ConfigType::CharArray,
        cfg_.baseTopic,ConfigPersistence::Persistent,sizeof(cfg_.baseTopic)
    };

    void enter_(LinkState s);
    void connect_();
    void goOnline_();
    void retryLater_();
    void drainInbox_();
    bool deliver_(const Inbound& msg);

    bool publish_(const char* topic, const char* payload, int qos, bool retain);
    void topicFor_(const char* suffix, char* out, size_t outLen) const;
    bool addRoute_(const char* filter, uint8_t qos, MqttMessageHandler fn, void* ctx);

    void runCommand_(const char* payload);
    void ackError_(ErrorCode code);

    // AsyncMqttClient callbacks, network task.
    void onLinkUp_(bool sessionPresent);
    void onLinkDown_(AsyncMqttClientDisconnectReason reason);
    void onInbound_(char* topic, char* payload, size_t len, size_t index, size_t total);

    static void onCmdMsg(void* ctx, const char* topic, const char* payload, size_t len, uint32_t at);
    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    static void svcFormatTopic(void* ctx, const char* suffix, char* out, size_t outLen);
    static bool svcIsConnected(void* ctx);
    static bool svcSubscribe(void* ctx, const char* filter, uint8_t qos, MqttMessageHandler fn, void* fnCtx);
};
