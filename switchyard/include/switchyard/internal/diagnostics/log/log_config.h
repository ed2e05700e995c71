#pragma once

/**
 * @file log_config.h
 * @brief Numeric log level values shared by the preprocessor and LogLevel.
 *
 * The build selects thresholds through `SWITCHYARD_LOG_LEVEL_GLOBAL_VALUE`
 * and the optional per-category `SWITCHYARD_LOG_LEVEL_<CATEGORY>_VALUE`.
 */

#define SWITCHYARD_LOG_LEVEL_TRACE_VAL 0
#define SWITCHYARD_LOG_LEVEL_DEBUG_VAL 1
#define SWITCHYARD_LOG_LEVEL_INFO_VAL 2
#define SWITCHYARD_LOG_LEVEL_WARN_VAL 3
#define SWITCHYARD_LOG_LEVEL_ERROR_VAL 4
#define SWITCHYARD_LOG_LEVEL_CRITICAL_VAL 5
#define SWITCHYARD_LOG_LEVEL_OFF_VAL 6
