#pragma once

/**
 * @file log.h
 * @brief Umbrella header for logging.
 *
 * - `log_config.h`: numeric level values
 * - `log_types.h`: `LogLevel`, `LogCategory`, constexpr helpers
 * - `log_sink.h`: sink installation
 * - `log_macros.h`: `SWITCHYARD_LOG_*`, `SWITCHYARD_ASSERT`
 */

#include "switchyard/internal/diagnostics/log/log_config.h"
#include "switchyard/internal/diagnostics/log/log_types.h"
#include "switchyard/internal/diagnostics/log/log_sink.h"
#include "switchyard/internal/diagnostics/log/log_macros.h"
