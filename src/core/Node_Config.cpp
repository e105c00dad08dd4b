#include "Node_Config.h"

NodeConfig NodeConfig::Defaults() {
    NodeConfig cfg;
    cfg.retry_budget = NODE_RETRY_BUDGET;
    cfg.nmea_retry_budget = NODE_NMEA_RETRY_BUDGET;
    cfg.ack_timeout = NODE_ACK_TIMEOUT_MS;
    cfg.boot_timeout = NODE_BOOT_TIMEOUT_MS;
    cfg.backoff_base = NODE_BACKOFF_BASE_MS;
    cfg.backoff_jitter = NODE_BACKOFF_JITTER_MS;
    cfg.backoff_max_shift = NODE_BACKOFF_MAX_SHIFT;
    cfg.report_interval = NODE_REPORT_INTERVAL_MS;
    cfg.poll_interval = NODE_POLL_INTERVAL_MS;
    cfg.logger_interval_s = NODE_LOGGER_INTERVAL_S;
    cfg.recovery_restart = NODE_RECOVERY_RESTART;
    cfg.offload_percent = NODE_OFFLOAD_PERCENT;
    return cfg;
}

bool NodeConfig::Validate() const {
    // Node_State::attempts is 8 bit and must pass the budget without wrapping
    if (retry_budget > NODE_RETRY_BUDGET_MAX) {
        Logger::Error("config: retry_budget %u > %u", (unsigned)retry_budget, (unsigned)NODE_RETRY_BUDGET_MAX);
        return false;
    }
    if (nmea_retry_budget > NODE_RETRY_BUDGET_MAX) {
        Logger::Error("config: nmea_retry_budget %u > %u", (unsigned)nmea_retry_budget,
                      (unsigned)NODE_RETRY_BUDGET_MAX);
        return false;
    }
    if (ack_timeout == 0) {
        Logger::Error("config: ack_timeout must be > 0");
        return false;
    }
    if (boot_timeout == 0) {
        Logger::Error("config: boot_timeout must be > 0");
        return false;
    }
    if (backoff_jitter > NODE_BACKOFF_JITTER_MAX_MS) {
        Logger::Error("config: backoff_jitter %lu > %lu", (unsigned long)backoff_jitter,
                      (unsigned long)NODE_BACKOFF_JITTER_MAX_MS);
        return false;
    }
    if (poll_interval == 0) {
        Logger::Error("config: poll_interval must be > 0");
        return false;
    }
    if (report_interval == 0) {
        Logger::Error("config: report_interval must be > 0");
        return false;
    }
    // Shift is applied to a 32 bit base inside a 64 bit sum
    if (backoff_max_shift > 31) {
        Logger::Error("config: backoff_max_shift %u > 31", (unsigned)backoff_max_shift);
        return false;
    }
    // PMTK187 takes a 16 bit interval
    if (logger_interval_s == 0 || logger_interval_s > 65535) {
        Logger::Error("config: logger_interval_s %lu outside 1..65535", (unsigned long)logger_interval_s);
        return false;
    }
    if ((uint8_t)recovery_restart > (uint8_t)RestartKind::FACTORY) {
        Logger::Error("config: recovery_restart %u unknown", (unsigned)recovery_restart);
        return false;
    }
    if (offload_percent > 100) {
        Logger::Error("config: offload_percent %u > 100", (unsigned)offload_percent);
        return false;
    }
    return true;
}
