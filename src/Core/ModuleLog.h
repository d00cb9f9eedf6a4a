#pragma once
/**
 * @file ModuleLog.h
 * @brief LOGD/LOGI/LOGW/LOGE bound to the including file's LOG_TAG.
 *
 * Define LOG_TAG before including. snprintf is also rerouted through
 * Log::formatChecked() in that file, so cut text shows up in the log.
 */
#include "Core/Log.h"

#ifndef LOG_TAG
#error "define LOG_TAG before including Core/ModuleLog.h"
#endif

#define LOGD(...) ::Log::debug(LOG_TAG, __VA_ARGS__)
#define LOGI(...) ::Log::info(LOG_TAG, __VA_ARGS__)
#define LOGW(...) ::Log::warn(LOG_TAG, __VA_ARGS__)
#define LOGE(...) ::Log::error(LOG_TAG, __VA_ARGS__)

#undef snprintf
#define snprintf(OUT, LEN, ...) ::Log::formatChecked(LOG_TAG, __FILE__, __LINE__, (OUT), (LEN), __VA_ARGS__)
