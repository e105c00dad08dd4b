#pragma once

#include <stdint.h>
#include "Logger.h"

// Device Info
#ifndef DEVICE_MODEL
#define DEVICE_MODEL "TrailNode CH32V203"
#endif
#ifndef DEVICE_VERSION
#define DEVICE_VERSION "0.1.0"
#endif

// Command retry configuration
// A command is tried at most 1 + NODE_RETRY_BUDGET times
#ifndef NODE_RETRY_BUDGET
#define NODE_RETRY_BUDGET 5
#endif
// PMTK314 races the NMEA stream it is turning off, so it gets more tries
#ifndef NODE_NMEA_RETRY_BUDGET
#define NODE_NMEA_RETRY_BUDGET 20
#endif
// Upper bound accepted for either budget
#define NODE_RETRY_BUDGET_MAX 50
#ifndef NODE_ACK_TIMEOUT_MS
#define NODE_ACK_TIMEOUT_MS 500
#endif
#ifndef NODE_BACKOFF_BASE_MS
#define NODE_BACKOFF_BASE_MS 80
#endif
#ifndef NODE_BACKOFF_JITTER_MS
#define NODE_BACKOFF_JITTER_MS 20
#endif
#define NODE_BACKOFF_JITTER_MAX_MS 60000
#ifndef NODE_BACKOFF_MAX_SHIFT
#define NODE_BACKOFF_MAX_SHIFT 4
#endif

// Control loop timing
#ifndef NODE_REPORT_INTERVAL_MS
#define NODE_REPORT_INTERVAL_MS 30000
#endif
#ifndef NODE_POLL_INTERVAL_MS
#define NODE_POLL_INTERVAL_MS 10
#endif

// Time allowed for both boot sentences after a restart command
#ifndef NODE_BOOT_TIMEOUT_MS
#define NODE_BOOT_TIMEOUT_MS 5000
#endif

// Restart issued when the user clears the ERROR state
#ifndef NODE_RECOVERY_RESTART
#define NODE_RECOVERY_RESTART RestartKind::HOT
#endif

// Dump and erase the flash once a status report is at least this full (0 = never)
#ifndef NODE_OFFLOAD_PERCENT
#define NODE_OFFLOAD_PERCENT 90
#endif

// LOCUS logging interval programmed into the module (PMTK187)
#ifndef NODE_LOGGER_INTERVAL_S
#define NODE_LOGGER_INTERVAL_S 15
#endif

#ifndef NODE_LOG_LEVEL
#define NODE_LOG_LEVEL LOG_LEVEL_INFO
#endif

// Module restart flavours, PMTK101..PMTK104
enum class RestartKind : uint8_t
{
    HOT,      // keep all saved data
    WARM,     // drop ephemeris
    COLD,     // drop time, position, almanac and ephemeris
    FACTORY   // cold start plus user configuration
};

/**
 * @brief Runtime configuration of Node_Logic.
 *
 * Timing fields are in clock ticks (milliseconds on the board).
 */
struct NodeConfig
{
    uint8_t retry_budget;
    uint8_t nmea_retry_budget;
    uint32_t ack_timeout;
    uint32_t boot_timeout;
    uint32_t backoff_base;
    uint32_t backoff_jitter;
    uint8_t backoff_max_shift;
    uint32_t report_interval;
    uint32_t poll_interval;
    uint32_t logger_interval_s;
    RestartKind recovery_restart;
    uint8_t offload_percent;

    /**
     * @brief Config built from the NODE_* build macros.
     */
    static NodeConfig Defaults();

    /**
     * @brief Check the values are usable.
     *
     * Logs the first offending field at error level.
     *
     * @return true if Node_Logic can run with this config.
     */
    bool Validate() const;
};
