/// @file main.cpp
/// @brief Basic bringup example for SDS011
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include <optional>
#include <utility>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/SerialTransport.h"

#include "SDS011/SDS011.h"

// ============================================================================
// Globals
// ============================================================================

SDS011::Config gConfig;
const SDS011::Delay gDelay{transport::delayMs, nullptr};

std::optional<SDS011::PollingSensor> gPolling;
std::optional<SDS011::PeriodicSensor> gPeriodic;

bool verboseMode = false;
bool pendingRead = false;
uint32_t pendingStartMs = 0;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(SDS011::Err err) {
  using namespace SDS011;
  switch (err) {
    case Err::OK: return "OK";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::TIMEOUT: return "TIMEOUT";
    case Err::BUSY: return "BUSY";
    case Err::IN_PROGRESS: return "IN_PROGRESS";
    case Err::MEASUREMENT_NOT_READY: return "MEASUREMENT_NOT_READY";
    case Err::UNSUPPORTED: return "UNSUPPORTED";
    case Err::SERIAL_READ_ERROR: return "SERIAL_READ_ERROR";
    case Err::SERIAL_WRITE_ERROR: return "SERIAL_WRITE_ERROR";
    case Err::SHORT_READ: return "SHORT_READ";
    case Err::SHORT_WRITE: return "SHORT_WRITE";
    case Err::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
    case Err::FRAME_FORMAT: return "FRAME_FORMAT";
    case Err::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
    case Err::UNKNOWN_SUBCOMMAND: return "UNKNOWN_SUBCOMMAND";
    case Err::INVALID_BOOLEAN_FIELD: return "INVALID_BOOLEAN_FIELD";
    case Err::INVALID_TIME_FIELD: return "INVALID_TIME_FIELD";
    case Err::UNEXPECTED_REPLY: return "UNEXPECTED_REPLY";
    case Err::OPERATION_FAILED: return "OPERATION_FAILED";
    default: return "UNKNOWN";
  }
}

const char* phaseToStr() {
  if (gPeriodic) {
    return "PERIODIC";
  }
  if (gPolling) {
    return "POLLING";
  }
  return "UNINITIALIZED";
}

const char* reportingToStr(SDS011::ReportingMode mode) {
  return (mode == SDS011::ReportingMode::ACTIVE) ? "ACTIVE" : "QUERY";
}

void printStatus(const SDS011::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

void printHealth(const SDS011::HealthCounters& h) {
  Serial.printf("  Consecutive failures: %u\n", h.consecutiveFailures);
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(h.totalFailures));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(h.totalSuccess));
  if (!h.lastError.ok()) {
    Serial.printf("  Last error: %s\n", errToStr(h.lastError.code));
  }
}

void printIdentity(uint16_t id, const SDS011::FirmwareVersion& fw) {
  char buf[16] = {};
  fw.format(buf, sizeof(buf));
  Serial.printf("  Device id: 0x%04X\n", static_cast<unsigned>(id));
  Serial.printf("  Firmware: %s\n", buf);
}

void printDriverState() {
  Serial.println("=== Driver State ===");
  Serial.printf("  Library: %s\n", SDS011::VERSION);
  Serial.printf("  Phase: %s\n", phaseToStr());
  if (gPolling) {
    printIdentity(gPolling->id(), gPolling->version());
    printHealth(gPolling->health());
    if (!gPolling->lastRecovery().ok()) {
      Serial.printf("  Last recovery sleep: %s\n", errToStr(gPolling->lastRecovery().code));
    }
  } else if (gPeriodic) {
    printIdentity(gPeriodic->id(), gPeriodic->version());
    Serial.printf("  Working period: %u min\n", gPeriodic->periodMinutes());
    printHealth(gPeriodic->health());
  }
  Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
}

void printMeasurement(const SDS011::Measurement& m) {
  Serial.printf("PM2.5: %.1f ug/m3, PM10: %.1f ug/m3\n", m.pm25(), m.pm10());
  if (verboseMode) {
    Serial.printf("  Raw: pm25_x10=%u pm10_x10=%u\n", m.pm25_x10, m.pm10_x10);
  }
}

bool parseMinutes(const String& token, uint8_t& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  const unsigned long value = std::strtoul(str, &end, 10);
  if (end == str || *end != '\0' || value > 0xFFUL) {
    return false;
  }
  out = static_cast<uint8_t>(value);
  return true;
}

/// Transitions keep the source only when they fail before any I/O
bool transitionKeptSource(const SDS011::Status& st) {
  using SDS011::Err;
  return st.code == Err::INVALID_PARAM || st.code == Err::INVALID_CONFIG ||
         st.code == Err::BUSY;
}

void cancelPending() {
  pendingRead = false;
}

bool requirePolling() {
  if (!gPolling) {
    LOGW("Sensor not in polling phase (%s)", phaseToStr());
    return false;
  }
  return true;
}

// ============================================================================
// Operations
// ============================================================================

void runInit() {
  cancelPending();
  gPolling.reset();
  gPeriodic.reset();

  const size_t dropped = transport::drainInput(board::sdsPort());
  if (verboseMode && dropped > 0) {
    LOGI("Dropped %u stale bytes", static_cast<unsigned>(dropped));
  }

  LOGI("Initializing sensor...");
  SDS011::UninitializedSensor sensor(gConfig);
  SDS011::Status st = std::move(sensor).init(gDelay, gPolling);
  if (!st.ok()) {
    LOGE("Init failed");
    printStatus(st);
    return;
  }

  LOGI("Sensor in polling mode");
  printIdentity(gPolling->id(), gPolling->version());
}

void runMeasure() {
  cancelPending();
  SDS011::Measurement m;
  SDS011::Status st;

  if (gPolling) {
    LOGI("Measuring (spin-up %lu ms)...", static_cast<unsigned long>(gConfig.measureDelayMs));
    st = gPolling->measure(gDelay, m);
  } else if (gPeriodic) {
    LOGI("Waiting for next report...");
    st = gPeriodic->measure(m);
  } else {
    LOGW("Run init first");
    return;
  }

  if (!st.ok()) {
    printStatus(st);
    return;
  }
  printMeasurement(m);
}

void scheduleRead() {
  SDS011::Status st;
  if (gPolling) {
    st = gPolling->requestMeasurement();
  } else if (gPeriodic) {
    st = gPeriodic->requestMeasurement();
  } else {
    LOGW("Run init first");
    return;
  }

  if (st.code != SDS011::Err::IN_PROGRESS) {
    printStatus(st);
    return;
  }
  pendingRead = true;
  pendingStartMs = millis();
  if (verboseMode) {
    Serial.printf("Measurement requested at %lu ms\n",
                  static_cast<unsigned long>(pendingStartMs));
  }
}

void runPeriodic(uint8_t minutes) {
  if (!requirePolling()) {
    return;
  }
  cancelPending();

  LOGI("Switching to periodic mode (%u min)...", minutes);
  SDS011::Status st = std::move(*gPolling).makePeriodic(gDelay, minutes, gPeriodic);
  if (st.ok()) {
    gPolling.reset();
    LOGI("Sensor in periodic mode");
    return;
  }

  printStatus(st);
  if (!transitionKeptSource(st)) {
    gPolling.reset();
    LOGW("Sensor state unknown, run init");
  }
}

/// Collect a scheduled read once tick() reports its final status
void handleMeasurementReady(const SDS011::Status& tickStatus) {
  if (!pendingRead || tickStatus.code == SDS011::Err::IN_PROGRESS) {
    return;
  }
  pendingRead = false;

  if (!tickStatus.ok()) {
    LOGW("Measurement failed after %lu ms",
         static_cast<unsigned long>(millis() - pendingStartMs));
    printStatus(tickStatus);
    return;
  }

  SDS011::Measurement m;
  SDS011::Status st = gPolling ? gPolling->getMeasurement(m) : gPeriodic->getMeasurement(m);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  printMeasurement(m);
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  init                     - Initialize sensor (polling mode)");
  Serial.println("  measure                  - Blocking measurement");
  Serial.println("  read                     - Request measurement (non-blocking)");
  Serial.println("  fw                       - Read firmware version");
  Serial.println("  period                   - Read working period");
  Serial.println("  mode                     - Read reporting mode");
  Serial.println("  periodic <min>           - Switch to periodic mode (0-30 min)");
  Serial.println("  drv                      - Show driver state and health");
  Serial.println("  verbose [0|1]            - Enable/disable verbose output");
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();
  if (cmd.length() == 0) {
    return;
  }

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "init") {
    runInit();
    return;
  }

  if (cmd == "measure") {
    runMeasure();
    return;
  }

  if (cmd == "read") {
    cancelPending();
    scheduleRead();
    return;
  }

  if (cmd == "fw") {
    if (gPeriodic) {
      printIdentity(gPeriodic->id(), gPeriodic->version());
      return;
    }
    if (!requirePolling()) {
      return;
    }
    SDS011::FirmwareVersion fw;
    SDS011::Status st = gPolling->readFirmware(gDelay, fw);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printIdentity(gPolling->id(), fw);
    return;
  }

  if (cmd == "period") {
    if (gPeriodic) {
      Serial.printf("Working period: %u min\n", gPeriodic->periodMinutes());
      return;
    }
    if (!requirePolling()) {
      return;
    }
    uint8_t minutes = 0;
    SDS011::Status st = gPolling->readWorkingPeriod(gDelay, minutes);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Working period: %u min%s\n", minutes, minutes == 0 ? " (continuous)" : "");
    return;
  }

  if (cmd == "mode") {
    if (!requirePolling()) {
      return;
    }
    SDS011::ReportingMode mode;
    SDS011::Status st = gPolling->readReportingMode(gDelay, mode);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Reporting mode: %s\n", reportingToStr(mode));
    return;
  }

  if (cmd.startsWith("periodic")) {
    String arg = cmd.substring(8);
    arg.trim();
    uint8_t minutes = 0;
    if (!parseMinutes(arg, minutes)) {
      LOGW("Usage: periodic <min>");
      return;
    }
    runPeriodic(minutes);
    return;
  }

  if (cmd == "drv") {
    printDriverState();
    return;
  }

  if (cmd == "verbose") {
    Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("verbose ")) {
    const int val = cmd.substring(8).toInt();
    verboseMode = (val != 0);
    LOGI("Verbose mode: %s", verboseMode ? "ON" : "OFF");
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== SDS011 Bringup Example ===");

  if (!board::initSerial()) {
    LOGE("Failed to initialize UART");
    return;
  }
  LOGI("UART initialized (RX=%d, TX=%d, %lu baud)", board::SDS_RX, board::SDS_TX,
       static_cast<unsigned long>(board::SDS_BAUD));

  gConfig.serialWrite = transport::uartWrite;
  gConfig.serialRead = transport::uartRead;
  gConfig.serialAvailable = transport::uartAvailable;
  gConfig.serialUser = &board::sdsPort();
  gConfig.serialTimeoutMs = board::SDS_TIMEOUT_MS;

  runInit();
  printHelp();
  Serial.print("> ");
}

void loop() {
  const uint32_t now = millis();
  if (gPolling) {
    handleMeasurementReady(gPolling->tick(now));
  } else if (gPeriodic) {
    handleMeasurementReady(gPeriodic->tick(now));
  }

  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
