/// @file test_node_logic.cpp
/// @brief Node_Logic scenarios on the simulated board: sessions, retries, recovery

#include <unity.h>
#include "test_support.h"

void setUp() { Logger::SetSink(nullptr); }
void tearDown() {}

// ============================================================================
// Session flow
// ============================================================================

void test_init_starts_idle_with_leds_off() {
  NodeFixture fx;
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_FALSE(fx.board.status_led.IsHigh());
  TEST_ASSERT_FALSE(fx.board.fault_led.IsHigh());
  TEST_ASSERT_EQUAL(0, fx.SentCount());
  TEST_ASSERT_TRUE(fx.logic.ConfigValid());
}

void test_button_starts_logging_session() {
  NodeFixture fx;
  fx.PressButton();

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_TRUE(fx.board.status_led.IsHigh());
  TEST_ASSERT_EQUAL(1, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING(DISABLE_NMEA_FRAME, fx.LastSent().c_str());
  TEST_ASSERT_EQUAL(2, fx.state.queue_len);

  fx.Ack("314");
  TEST_ASSERT_EQUAL(2, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING("$PMTK187,1,15*09\r\n", fx.LastSent().c_str());

  fx.Ack("187");
  TEST_ASSERT_EQUAL(3, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING("$PMTK185,0*22\r\n", fx.LastSent().c_str());

  fx.Ack("185");
  TEST_ASSERT_EQUAL(3, fx.SentCount());
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.transitions);
}

void test_button_in_active_stops_logging() {
  NodeFixture fx;
  fx.StartSession();
  fx.PressButton();

  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_FALSE(fx.board.status_led.IsHigh());
  TEST_ASSERT_EQUAL_STRING("$PMTK185,1*23\r\n", fx.LastSent().c_str());

  fx.Ack("185");
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
}

void test_held_button_is_one_press() {
  NodeFixture fx;
  fx.board.button.SetLevel(PinLevel::HIGH);
  fx.Settle();
  fx.Settle();
  fx.Settle();
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.transitions);
}

void test_status_report_polls_logger() {
  NodeFixture fx;
  fx.StartSession();
  size_t before = fx.SentCount();

  fx.AdvanceTo(NODE_REPORT_INTERVAL_MS);
  TEST_ASSERT_EQUAL(before + 1, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING("$PMTK183*38\r\n", fx.LastSent().c_str());

  fx.Reply("PMTKLOG,456,0,11,31,2,0,0,0,3769,46");
  TEST_ASSERT_EQUAL_UINT32(2, fx.state.log_status.interval);
  TEST_ASSERT_TRUE(fx.state.log_status.is_on);
  TEST_ASSERT_EQUAL_UINT32(3769, fx.state.log_status.record_count);
  TEST_ASSERT_EQUAL_UINT8(46, fx.state.log_status.percent_full);
  // Query stays outstanding until its ack
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::AWAIT_REPLY), static_cast<uint8_t>(fx.state.phase));

  fx.Ack("183");
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL_UINT32(2 * NODE_REPORT_INTERVAL_MS, (uint32_t)fx.state.next_report);
}

void test_no_status_report_while_idle() {
  NodeFixture fx;
  fx.AdvanceTo(3 * NODE_REPORT_INTERVAL_MS);
  TEST_ASSERT_EQUAL(0, fx.SentCount());
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
}

void test_module_reboot_rearms_session_once() {
  NodeFixture fx;
  fx.StartSession();
  size_t before = fx.SentCount();

  fx.InjectBootSequence();
  fx.Settle();

  // PMTK011 re-arms, PMTK010,002 is chatter, PMTK010,001 finds START queued
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(before + 1, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING(DISABLE_NMEA_FRAME, fx.LastSent().c_str());
  TEST_ASSERT_EQUAL(3, fx.state.queue_len);
  TEST_ASSERT_EQUAL_UINT32(1, fx.state.chatter_frames);

  fx.Ack("314");
  TEST_ASSERT_EQUAL_STRING("$PMTK605*31\r\n", fx.LastSent().c_str());

  fx.Reply(RELEASE_REPLY);
  TEST_ASSERT_EQUAL_STRING("AXN_1.3", fx.state.firmware_release);
  TEST_ASSERT_EQUAL_STRING("$PMTK187,1,15*09\r\n", fx.LastSent().c_str());

  fx.Ack("187");
  TEST_ASSERT_EQUAL_STRING("$PMTK185,0*22\r\n", fx.LastSent().c_str());
  fx.Ack("185");
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_EQUAL(1, fx.state.transitions);
}

// ============================================================================
// NMEA output and stale replies
// ============================================================================

void test_nmea_output_in_idle_is_ignored() {
  NodeFixture fx;
  fx.Reply("GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W");
  fx.Reply("GPGGA,1");

  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_FALSE(fx.board.fault_led.IsHigh());
  TEST_ASSERT_EQUAL_UINT32(2, fx.state.chatter_frames);
  TEST_ASSERT_EQUAL(0, fx.state.transitions);
}

void test_nmea_output_does_not_disturb_pending_command() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();
  fx.Reply("GPGGA,1");

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(0, fx.state.attempts);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::AWAIT_REPLY), static_cast<uint8_t>(fx.state.phase));

  fx.Ack("314");
  TEST_ASSERT_EQUAL_STRING("$PMTK187,1,15*09\r\n", fx.LastSent().c_str());
}

void test_late_ack_during_backoff_completes_command() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();

  fx.Advance(NODE_ACK_TIMEOUT_MS);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::SEND_DUE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_EQUAL(1, fx.state.attempts);

  // The first PMTK314 went through, its ack was just slow
  fx.Reply("PMTK001,314,3");
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(2, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING("$PMTK187,1,15*09\r\n", fx.LastSent().c_str());
  TEST_ASSERT_EQUAL(0, fx.state.attempts);
}

void test_stale_ack_in_idle_is_ignored() {
  NodeFixture fx;
  fx.Reply("PMTK001,187,3");
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_FALSE(fx.board.fault_led.IsHigh());
  TEST_ASSERT_EQUAL_UINT32(1, fx.state.chatter_frames);
}

void test_late_log_status_is_ignored() {
  NodeFixture fx;
  fx.StartSession();
  fx.Reply("PMTKLOG,456,0,11,31,2,0,0,0,3769,95");
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL_UINT8(0, fx.state.log_status.percent_full);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
}

// ============================================================================
// Retries
// ============================================================================

static void run_send_failures(uint32_t failures, uint8_t budget) {
  NodeFixture fx(1, NoJitterConfig(budget));
  fx.board.transport.FailNextSends(failures, TransportError::BUSY);
  fx.PressButton();
  for (int i = 0; i < 32 && fx.state.phase == CommandPhase::SEND_DUE; i++) {
    fx.AdvanceTo(fx.state.deadline);
  }

  if (failures > budget) {
    TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
    TEST_ASSERT_TRUE(fx.board.fault_led.IsHigh());
    TEST_ASSERT_FALSE(fx.board.status_led.IsHigh());
    TEST_ASSERT_EQUAL_UINT32(budget + 1u, fx.board.transport.SendAttempts());
    TEST_ASSERT_EQUAL(0, fx.SentCount());
    TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  } else {
    TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
    TEST_ASSERT_FALSE(fx.board.fault_led.IsHigh());
    TEST_ASSERT_EQUAL_UINT32(failures + 1u, fx.board.transport.SendAttempts());
    TEST_ASSERT_EQUAL(1, fx.SentCount());
    TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::AWAIT_REPLY), static_cast<uint8_t>(fx.state.phase));
  }
}

void test_error_only_when_failures_exceed_budget() {
  const uint8_t budget = 3;
  for (uint32_t n = 0; n <= budget + 2u; n++) {
    run_send_failures(n, budget);
  }
}

void test_zero_budget_fails_on_first_error() {
  run_send_failures(0, 0);
  run_send_failures(1, 0);
}

void test_largest_budget_is_still_bounded() {
  NodeFixture fx(1, NoJitterConfig(NODE_RETRY_BUDGET_MAX));
  fx.board.transport.FailNextSends(1000, TransportError::BUSY);
  fx.PressButton();
  for (int i = 0; i < 200 && fx.state.phase == CommandPhase::SEND_DUE; i++) {
    fx.AdvanceTo(fx.state.deadline);
  }

  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_EQUAL_UINT32(NODE_RETRY_BUDGET_MAX + 1u, fx.board.transport.SendAttempts());
}

void test_disable_nmea_has_its_own_budget() {
  NodeConfig cfg = NoJitterConfig(1);
  cfg.nmea_retry_budget = 3;
  NodeFixture fx(1, cfg);
  fx.board.transport.FailNextSends(3);
  fx.PressButton();
  for (int i = 0; i < 8 && fx.state.phase == CommandPhase::SEND_DUE; i++) {
    fx.AdvanceTo(fx.state.deadline);
  }
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL_UINT32(4, fx.board.transport.SendAttempts());
  TEST_ASSERT_EQUAL_STRING(DISABLE_NMEA_FRAME, fx.LastSent().c_str());

  // PMTK187 falls back to retry_budget
  fx.board.transport.FailNextSends(2);
  fx.Ack("314");
  TEST_ASSERT_EQUAL(1, fx.state.attempts);
  fx.AdvanceTo(fx.state.deadline);
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
}

void test_backoff_doubles_between_tries() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.board.transport.FailNextSends(3);
  fx.PressButton();

  TEST_ASSERT_EQUAL_UINT32(80, (uint32_t)fx.state.deadline);
  fx.AdvanceTo(80);
  TEST_ASSERT_EQUAL_UINT32(80 + 160, (uint32_t)fx.state.deadline);
  fx.AdvanceTo(240);
  TEST_ASSERT_EQUAL_UINT32(240 + 320, (uint32_t)fx.state.deadline);
  fx.AdvanceTo(560);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::AWAIT_REPLY), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_EQUAL_UINT32(560 + NODE_ACK_TIMEOUT_MS, (uint32_t)fx.state.deadline);
}

void test_backoff_shift_is_capped() {
  NodeConfig cfg = NoJitterConfig(10);
  cfg.backoff_max_shift = 1;
  NodeFixture fx(1, cfg);
  fx.board.transport.FailNextSends(5);
  fx.PressButton();

  uint64_t prev = fx.board.clock.Now();
  for (int i = 0; i < 4; i++) {
    uint64_t wait = fx.state.deadline - prev;
    TEST_ASSERT_EQUAL_UINT32(i == 0 ? 80 : 160, (uint32_t)wait);
    prev = fx.state.deadline;
    fx.AdvanceTo(fx.state.deadline);
  }
}

void test_jitter_stays_in_range() {
  NodeConfig cfg = NodeConfig::Defaults();
  cfg.backoff_jitter = 20;
  cfg.retry_budget = 3;
  NodeFixture fx(7, cfg);
  fx.board.transport.FailNextSends(1);
  fx.PressButton();

  TEST_ASSERT_TRUE(fx.state.deadline >= 80);
  TEST_ASSERT_TRUE(fx.state.deadline <= 100);
}

void test_largest_jitter_stays_in_range() {
  NodeConfig cfg = NodeConfig::Defaults();
  cfg.backoff_jitter = NODE_BACKOFF_JITTER_MAX_MS;
  for (uint32_t seed = 1; seed <= 8; seed++) {
    NodeFixture fx(seed, cfg);
    TEST_ASSERT_TRUE(fx.logic.ConfigValid());
    fx.board.transport.FailNextSends(1);
    fx.PressButton();

    TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::SEND_DUE), static_cast<uint8_t>(fx.state.phase));
    TEST_ASSERT_TRUE(fx.state.deadline >= 80);
    TEST_ASSERT_TRUE(fx.state.deadline <= 80 + NODE_BACKOFF_JITTER_MAX_MS);
  }
}

void test_ack_timeout_retries_then_errors() {
  NodeFixture fx(1, NoJitterConfig(1));
  fx.PressButton();
  TEST_ASSERT_EQUAL(1, fx.SentCount());

  fx.AdvanceTo(NODE_ACK_TIMEOUT_MS);
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.attempts);

  fx.AdvanceTo(fx.state.deadline);
  TEST_ASSERT_EQUAL(2, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING(DISABLE_NMEA_FRAME, fx.LastSent().c_str());

  fx.AdvanceTo(fx.state.deadline);
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_EQUAL(2, fx.SentCount());
}

void test_negative_ack_is_retried() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();
  fx.Reply("PMTK001,314,2");

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.attempts);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::SEND_DUE), static_cast<uint8_t>(fx.state.phase));

  fx.AdvanceTo(fx.state.deadline);
  TEST_ASSERT_EQUAL(2, fx.SentCount());
}

void test_ack_for_other_command_is_retried() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();
  fx.Reply("PMTK001,185,3");

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.attempts);
}

void test_other_mtk_reply_while_waiting_is_retried() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();
  fx.Reply("PMTK999,1");

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.attempts);
}

void test_corrupt_reply_is_retried() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();
  const char* bad = "$PMTK001,314,3*00\r\n";
  fx.board.transport.Inject((const uint8_t*)bad, 19);
  fx.Settle();

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.attempts);
}

void test_disconnected_link_is_retried_without_sending() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.board.transport.SetConnected(false);
  fx.PressButton();
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.state.attempts);
  TEST_ASSERT_EQUAL_UINT32(0, fx.board.transport.SendAttempts());

  fx.board.transport.SetConnected(true);
  fx.AdvanceTo(fx.state.deadline);
  TEST_ASSERT_EQUAL(1, fx.SentCount());
  TEST_ASSERT_EQUAL_UINT32(1, fx.board.transport.SendAttempts());
}

void test_disconnected_link_exhausts_budget() {
  NodeFixture fx(1, NoJitterConfig(2));
  fx.board.transport.SetConnected(false);
  fx.PressButton();
  for (int i = 0; i < 8 && fx.state.phase == CommandPhase::SEND_DUE; i++) {
    fx.AdvanceTo(fx.state.deadline);
  }
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_EQUAL_UINT32(0, fx.board.transport.SendAttempts());
}

void test_invalid_arg_is_not_retried() {
  NodeFixture fx(1, NoJitterConfig(NODE_RETRY_BUDGET_MAX));
  fx.board.transport.FailNextSends(1, TransportError::INVALID_ARG);
  fx.PressButton();

  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_EQUAL_UINT32(1, fx.board.transport.SendAttempts());
}

void test_failures_in_idle_keep_idle() {
  NodeFixture fx(1, NoJitterConfig(3));
  fx.StartSession();
  fx.board.transport.FailNextSends(2);
  fx.PressButton();
  for (int i = 0; i < 8 && fx.state.phase == CommandPhase::SEND_DUE; i++) {
    fx.AdvanceTo(fx.state.deadline);
  }
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_EQUAL_STRING("$PMTK185,1*23\r\n", fx.LastSent().c_str());
}

// ============================================================================
// Unknown input and recovery
// ============================================================================

void test_unknown_mtk_sentence_goes_to_error() {
  NodeFixture fx;
  fx.StartSession();
  fx.Reply("PMTK999,1");
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_TRUE(fx.board.fault_led.IsHigh());
  TEST_ASSERT_EQUAL(0, fx.state.queue_len);
}

void test_garbage_while_idle_goes_to_error() {
  NodeFixture fx;
  const char* junk = "hello\r\n";
  fx.board.transport.Inject((const uint8_t*)junk, 7);
  fx.Settle();
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
}

void test_button_restarts_module_from_error() {
  NodeFixture fx;
  fx.Reply("PMTK999,1");
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);

  fx.PressButton();
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_FALSE(fx.board.fault_led.IsHigh());
  TEST_ASSERT_EQUAL(1, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING("$PMTK101*32\r\n", fx.LastSent().c_str());
  TEST_ASSERT_EQUAL_UINT32(NODE_BOOT_TIMEOUT_MS, (uint32_t)(fx.state.deadline - fx.board.clock.Now()));

  fx.InjectBootSequence();
  fx.Settle();
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_EQUAL(2, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING(DISABLE_NMEA_FRAME, fx.LastSent().c_str());

  fx.Ack("314");
  TEST_ASSERT_EQUAL_STRING("$PMTK605*31\r\n", fx.LastSent().c_str());
  fx.Reply(RELEASE_REPLY);
  TEST_ASSERT_EQUAL_STRING("AXN_1.3", fx.state.firmware_release);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_EQUAL(3, fx.SentCount());
}

void test_recovery_restart_kind_is_configurable() {
  NodeConfig cfg = NodeConfig::Defaults();
  cfg.recovery_restart = RestartKind::FACTORY;
  NodeFixture fx(1, cfg);
  fx.Reply("PMTK999,1");
  fx.PressButton();
  TEST_ASSERT_EQUAL_STRING("$PMTK104*37\r\n", fx.LastSent().c_str());
}

void test_restart_without_full_boot_times_out() {
  NodeFixture fx(1, NoJitterConfig(0));
  fx.Reply("PMTK999,1");
  fx.PressButton();
  fx.Reply("PMTK010,001");
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::AWAIT_REPLY), static_cast<uint8_t>(fx.state.phase));

  fx.Advance(NODE_BOOT_TIMEOUT_MS);
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_EQUAL(1, fx.SentCount());
}

void test_module_boot_recovers_from_error() {
  NodeFixture fx;
  fx.Reply("PMTK999,1");
  fx.Reply("PMTK011,MTKGPS");
  TEST_ASSERT_MODE(DeviceState::IDLE, fx.state.mode);
  TEST_ASSERT_FALSE(fx.board.fault_led.IsHigh());
}

void test_invalid_config_starts_in_error() {
  NodeConfig cfg = NodeConfig::Defaults();
  cfg.ack_timeout = 0;
  NodeFixture fx(1, cfg);

  TEST_ASSERT_FALSE(fx.logic.ConfigValid());
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_TRUE(fx.board.fault_led.IsHigh());
  TEST_ASSERT_EQUAL_UINT32(NODE_ACK_TIMEOUT_MS, fx.logic.Config().ack_timeout);
}

void test_out_of_range_budget_and_jitter_fall_back_to_defaults() {
  NodeConfig budget = NodeConfig::Defaults();
  budget.retry_budget = 255;
  NodeFixture a(1, budget);
  TEST_ASSERT_FALSE(a.logic.ConfigValid());
  TEST_ASSERT_EQUAL_UINT8(NODE_RETRY_BUDGET, a.logic.Config().retry_budget);

  NodeConfig jitter = NodeConfig::Defaults();
  jitter.backoff_jitter = UINT32_MAX;
  NodeFixture b(1, jitter);
  TEST_ASSERT_FALSE(b.logic.ConfigValid());
  TEST_ASSERT_MODE(DeviceState::ERROR, b.state.mode);
  TEST_ASSERT_EQUAL_UINT32(NODE_BACKOFF_JITTER_MS, b.logic.Config().backoff_jitter);
}

// ============================================================================
// Log offload
// ============================================================================

#define LOX_PACKET_0 "PMTKLOX,1,0,00E10B5E,02000036,420080F4,C21E006A,0FE10B5E,04008036,420040F4,C2F4FF36"
#define LOX_PACKET_1 "PMTKLOX,1,1,1EE10B5E,00000000,00000000,000000AA"
#define LOX_BAD_POINT "PMTKLOX,1,0,00E10B5E,02000036,420080F4,C21E0000"

static LoggedPoint captured[8];
static int captured_count = 0;

static void capture_point(const LoggedPoint& point) {
  if (captured_count < 8) captured[captured_count] = point;
  captured_count++;
}

// Full status poll reporting 95% and the ready check, up to the PMTK622 send
static void run_to_dump(NodeFixture& fx) {
  captured_count = 0;
  fx.logic.SetPointSink(capture_point);
  fx.StartSession();
  fx.AdvanceTo(NODE_REPORT_INTERVAL_MS);
  fx.Reply("PMTKLOG,456,0,11,31,2,0,0,0,3769,95");
  fx.Ack("183");
  TEST_ASSERT_EQUAL_STRING("$PMTK605*31\r\n", fx.LastSent().c_str());
  fx.Reply(RELEASE_REPLY);
  TEST_ASSERT_EQUAL_STRING("$PMTK622,0*28\r\n", fx.LastSent().c_str());
}

void test_full_flash_is_dumped_then_erased() {
  NodeFixture fx(1, NoJitterConfig(5));
  run_to_dump(fx);

  fx.Reply("PMTKLOX,0,2");
  TEST_ASSERT_TRUE(fx.state.dump.started);
  TEST_ASSERT_EQUAL_UINT16(2, fx.state.dump.packets);
  fx.Reply(LOX_PACKET_0);
  fx.Reply(LOX_PACKET_1);
  TEST_ASSERT_EQUAL_UINT16(2, fx.state.dump.received);
  TEST_ASSERT_FALSE(fx.WasSent("$PMTK184,1*22\r\n"));

  fx.Reply("PMTKLOX,2");
  TEST_ASSERT_EQUAL_STRING("$PMTK184,1*22\r\n", fx.LastSent().c_str());
  fx.Ack("184");

  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_EQUAL_UINT32(3, fx.state.dump.points);
  TEST_ASSERT_EQUAL_UINT32(0, fx.state.dump.bad_points);

  TEST_ASSERT_EQUAL(3, captured_count);
  TEST_ASSERT_EQUAL_UINT32(1577836800u, captured[0].utc);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(LocusFix::GPS), static_cast<uint8_t>(captured[0].fix));
  TEST_ASSERT_TRUE(captured[0].latitude == 45.5f);
  TEST_ASSERT_TRUE(captured[0].longitude == -122.25f);
  TEST_ASSERT_EQUAL_INT16(30, captured[0].height);
  TEST_ASSERT_EQUAL_UINT32(1577836815u, captured[1].utc);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(LocusFix::DGPS), static_cast<uint8_t>(captured[1].fix));
  TEST_ASSERT_EQUAL_INT16(-12, captured[1].height);
  TEST_ASSERT_EQUAL_UINT32(1577836830u, captured[2].utc);
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(LocusFix::NONE), static_cast<uint8_t>(captured[2].fix));
}

void test_missing_dump_packet_skips_erase() {
  NodeFixture fx(1, NoJitterConfig(5));
  run_to_dump(fx);

  fx.Reply("PMTKLOX,0,2");
  fx.Reply(LOX_PACKET_1);
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_EQUAL(0, fx.state.queue_len);
  TEST_ASSERT_FALSE(fx.WasSent("$PMTK184,1*22\r\n"));
  TEST_ASSERT_EQUAL(0, captured_count);
}

void test_bad_point_checksum_is_counted_and_skipped() {
  NodeFixture fx(1, NoJitterConfig(5));
  run_to_dump(fx);

  fx.Reply("PMTKLOX,0,1");
  fx.Reply(LOX_BAD_POINT);
  fx.Reply("PMTKLOX,2");

  TEST_ASSERT_EQUAL_UINT32(0, fx.state.dump.points);
  TEST_ASSERT_EQUAL_UINT32(1, fx.state.dump.bad_points);
  TEST_ASSERT_EQUAL(0, captured_count);
  TEST_ASSERT_EQUAL_STRING("$PMTK184,1*22\r\n", fx.LastSent().c_str());
}

void test_stalled_dump_times_out() {
  NodeFixture fx(1, NoJitterConfig(5));
  run_to_dump(fx);

  fx.Reply("PMTKLOX,0,2");
  fx.Advance(NODE_ACK_TIMEOUT_MS - 1);
  fx.Reply(LOX_PACKET_0);
  // Each packet re-arms the timeout
  fx.Advance(NODE_ACK_TIMEOUT_MS - 1);
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);

  fx.Advance(1);
  TEST_ASSERT_MODE(DeviceState::ERROR, fx.state.mode);
  TEST_ASSERT_FALSE(fx.WasSent("$PMTK184,1*22\r\n"));
}

void test_offload_can_be_disabled() {
  NodeConfig cfg = NoJitterConfig(5);
  cfg.offload_percent = 0;
  NodeFixture fx(1, cfg);
  fx.StartSession();
  fx.AdvanceTo(NODE_REPORT_INTERVAL_MS);
  fx.Reply("PMTKLOG,456,0,11,31,2,0,0,0,3769,100");
  fx.Ack("183");

  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_FALSE(fx.WasSent("$PMTK605*31\r\n"));
}

// ============================================================================
// Delivery order and suspension
// ============================================================================

void test_replies_are_handled_in_arrival_order() {
  NodeFixture fx;
  fx.PressButton();
  fx.board.transport.InjectSentence("PMTK001,314,3");
  fx.board.transport.InjectSentence("PMTK001,187,3");
  fx.board.transport.InjectSentence("PMTK001,185,3");
  fx.Settle();

  TEST_ASSERT_EQUAL(3, fx.SentCount());
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
  TEST_ASSERT_EQUAL(0, fx.state.attempts);
}

void test_reordered_replies_recover() {
  NodeFixture fx(1, NoJitterConfig(5));
  fx.PressButton();
  fx.Ack("314");
  fx.board.transport.InjectSentence("PMTK001,185,3");
  fx.board.transport.InjectSentence("PMTK001,187,3");
  fx.Settle();

  // 185 fails the pending 187, then the 187 ack lands during the backoff
  TEST_ASSERT_MODE(DeviceState::ACTIVE, fx.state.mode);
  TEST_ASSERT_EQUAL(3, fx.SentCount());
  TEST_ASSERT_EQUAL_STRING("$PMTK185,0*22\r\n", fx.LastSent().c_str());

  fx.Ack("185");
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(CommandPhase::NONE), static_cast<uint8_t>(fx.state.phase));
}

void test_idle_tick_suspends_at_poll_interval() {
  NodeFixture fx;
  fx.Tick();
  TEST_ASSERT_EQUAL(static_cast<uint8_t>(NodeEvent::NONE), static_cast<uint8_t>(fx.state.last_event));
  TEST_ASSERT_TRUE(fx.state.suspended);
  TEST_ASSERT_EQUAL_UINT32(NODE_POLL_INTERVAL_MS, (uint32_t)fx.state.wake_at);
  TEST_ASSERT_EQUAL_UINT32(NODE_POLL_INTERVAL_MS, (uint32_t)fx.board.clock.LastWakeRequest());
}

void test_suspension_wakes_at_earliest_deadline() {
  NodeConfig cfg = NodeConfig::Defaults();
  cfg.poll_interval = 1000;
  NodeFixture fx(1, cfg);
  fx.PressButton();

  // Waiting for the ack, which is due before the next poll
  TEST_ASSERT_TRUE(fx.state.suspended);
  TEST_ASSERT_EQUAL_UINT32(NODE_ACK_TIMEOUT_MS, (uint32_t)fx.state.wake_at);
}

void test_reached_wake_tick_is_not_suspended() {
  NodeFixture fx;
  fx.Tick();
  fx.board.clock.AdvanceTo(fx.state.wake_at);
  TEST_ASSERT_TRUE(fx.board.clock.DelayUntil(fx.state.wake_at));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_init_starts_idle_with_leds_off);
  RUN_TEST(test_button_starts_logging_session);
  RUN_TEST(test_button_in_active_stops_logging);
  RUN_TEST(test_held_button_is_one_press);
  RUN_TEST(test_status_report_polls_logger);
  RUN_TEST(test_no_status_report_while_idle);
  RUN_TEST(test_module_reboot_rearms_session_once);
  RUN_TEST(test_nmea_output_in_idle_is_ignored);
  RUN_TEST(test_nmea_output_does_not_disturb_pending_command);
  RUN_TEST(test_late_ack_during_backoff_completes_command);
  RUN_TEST(test_stale_ack_in_idle_is_ignored);
  RUN_TEST(test_late_log_status_is_ignored);
  RUN_TEST(test_error_only_when_failures_exceed_budget);
  RUN_TEST(test_zero_budget_fails_on_first_error);
  RUN_TEST(test_largest_budget_is_still_bounded);
  RUN_TEST(test_disable_nmea_has_its_own_budget);
  RUN_TEST(test_backoff_doubles_between_tries);
  RUN_TEST(test_backoff_shift_is_capped);
  RUN_TEST(test_jitter_stays_in_range);
  RUN_TEST(test_largest_jitter_stays_in_range);
  RUN_TEST(test_ack_timeout_retries_then_errors);
  RUN_TEST(test_negative_ack_is_retried);
  RUN_TEST(test_ack_for_other_command_is_retried);
  RUN_TEST(test_other_mtk_reply_while_waiting_is_retried);
  RUN_TEST(test_corrupt_reply_is_retried);
  RUN_TEST(test_disconnected_link_is_retried_without_sending);
  RUN_TEST(test_disconnected_link_exhausts_budget);
  RUN_TEST(test_invalid_arg_is_not_retried);
  RUN_TEST(test_failures_in_idle_keep_idle);
  RUN_TEST(test_unknown_mtk_sentence_goes_to_error);
  RUN_TEST(test_garbage_while_idle_goes_to_error);
  RUN_TEST(test_button_restarts_module_from_error);
  RUN_TEST(test_recovery_restart_kind_is_configurable);
  RUN_TEST(test_restart_without_full_boot_times_out);
  RUN_TEST(test_module_boot_recovers_from_error);
  RUN_TEST(test_invalid_config_starts_in_error);
  RUN_TEST(test_out_of_range_budget_and_jitter_fall_back_to_defaults);
  RUN_TEST(test_full_flash_is_dumped_then_erased);
  RUN_TEST(test_missing_dump_packet_skips_erase);
  RUN_TEST(test_bad_point_checksum_is_counted_and_skipped);
  RUN_TEST(test_stalled_dump_times_out);
  RUN_TEST(test_offload_can_be_disabled);
  RUN_TEST(test_replies_are_handled_in_arrival_order);
  RUN_TEST(test_reordered_replies_recover);
  RUN_TEST(test_idle_tick_suspends_at_poll_interval);
  RUN_TEST(test_suspension_wakes_at_earliest_deadline);
  RUN_TEST(test_reached_wake_tick_is_not_suspended);
  return UNITY_END();
}
