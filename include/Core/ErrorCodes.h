#pragma once
/**
 * @file ErrorCodes.h
 * @brief Failure reasons shared by command handlers, config patches and the thermostat engine.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

/**
 * @brief Failure reason reported through `ErrorCode&` out-parameters and JSON replies.
 *
 * Values index the table in errorCodeInfo(); keep both in the same order.
 */
enum class ErrorCode : uint8_t {
    None = 0,
    // MQTT command channel
    UnknownCmd,
    BadCmdJson,
    MissingCmd,
    ArgsTooLarge,
    CmdServiceUnavailable,
    CmdHandlerFailed,
    ReplyOverflow,
    // configuration
    BadCfgJson,
    CfgServiceUnavailable,
    CfgApplyFailed,
    UnknownModule,
    // command arguments and runtime state
    MissingArgs,
    MissingValue,
    NotReady,
    Disabled,
    Busy,
    MqttUnavailable,
    Failed,
    // thermostat engine
    ParseError,
    UnknownType,
    UnknownDevice,
    InvalidConfig,
    CapacityExceeded,
    BufferTooSmall
};

/** @brief Wire name of a code and whether repeating the request may succeed. */
struct ErrorCodeInfo {
    const char* name;
    bool retryable;
};

static inline ErrorCodeInfo errorCodeInfo(ErrorCode code)
{
    static constexpr ErrorCodeInfo kInfo[] = {
        {"None", false},
        {"UnknownCmd", false},
        {"BadCmdJson", false},
        {"MissingCmd", false},
        {"ArgsTooLarge", false},
        {"CmdServiceUnavailable", true},
        {"CmdHandlerFailed", false},
        {"ReplyOverflow", true},
        {"BadCfgJson", false},
        {"CfgServiceUnavailable", true},
        {"CfgApplyFailed", false},
        {"UnknownModule", false},
        {"MissingArgs", false},
        {"MissingValue", false},
        {"NotReady", true},
        {"Disabled", false},
        {"Busy", true},
        {"MqttUnavailable", true},
        {"Failed", false},
        {"ParseError", false},
        {"UnknownType", false},
        {"UnknownDevice", false},
        {"InvalidConfig", false},
        {"CapacityExceeded", false},
        {"BufferTooSmall", false},
    };
    const size_t idx = (size_t)code;
    if (idx >= sizeof(kInfo) / sizeof(kInfo[0])) return ErrorCodeInfo{"Unknown", false};
    return kInfo[idx];
}

static inline const char* errorCodeStr(ErrorCode code) { return errorCodeInfo(code).name; }
static inline bool errorCodeRetryable(ErrorCode code) { return errorCodeInfo(code).retryable; }

/**
 * @brief Write `{"ok":false,"err":{"code":..,"where":..,"retryable":..}}`.
 * @return false when @p out is too small; its content is then unusable.
 */
static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const ErrorCodeInfo info = errorCodeInfo(code);
    const int n = snprintf(out, outLen, "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
                           info.name, (where && where[0]) ? where : "unknown",
                           info.retryable ? "true" : "false");
    return n > 0 && (size_t)n < outLen;
}
