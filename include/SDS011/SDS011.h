/// @file SDS011.h
/// @brief Phase-typed driver classes for SDS011
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "SDS011/Status.h"
#include "SDS011/Config.h"
#include "SDS011/CommandTable.h"
#include "SDS011/Message.h"
#include "SDS011/Link.h"
#include "SDS011/Version.h"

namespace SDS011 {

class PollingSensor;
class PeriodicSensor;

/// Sensor in unknown state. Only init() is available.
///
/// Transitions are rvalue-qualified: call them as std::move(sensor).init(...).
/// Once a transition has started talking to the sensor, the source object
/// no longer owns the transport, whether the transition succeeded or not.
class UninitializedSensor {
public:
  /// Wrap a transport. No I/O is performed.
  explicit UninitializedSensor(const Config& config) : _link(config) {}

  UninitializedSensor(UninitializedSensor&&) noexcept = default;
  UninitializedSensor& operator=(UninitializedSensor&&) noexcept = default;

  // =========================================================================
  // Blocking
  // =========================================================================

  /// Bring the sensor into a known state: settle, wake, query reporting
  /// mode, read firmware (learns device id), sleep.
  /// @param delay Delay provider
  /// @param out   Receives the Polling-phase sensor on success
  /// @return Status::Ok() on success. INVALID_PARAM/INVALID_CONFIG/BUSY are
  ///         reported before any I/O and leave this object usable.
  Status init(const Delay& delay, std::optional<PollingSensor>& out) &&;

  // =========================================================================
  // Cooperative
  // =========================================================================

  /// Schedule init for tick()
  /// @return IN_PROGRESS if scheduled
  Status requestInit();

  /// Advance a pending init
  /// @return IN_PROGRESS while pending, the init result once finished
  Status tick(uint32_t nowMs) { return _link.tick(nowMs); }

  /// Check if a scheduled sequence is pending
  bool busy() const { return _link.busy(); }

  /// Collect a finished init
  /// @return IN_PROGRESS if still pending (object kept), otherwise the init
  ///         result; the transport is consumed either way
  Status finishInit(std::optional<PollingSensor>& out) &&;

private:
  Link _link;
};

/// Sensor in query reporting mode, asleep between measurements.
class PollingSensor {
public:
  PollingSensor(PollingSensor&&) noexcept = default;
  PollingSensor& operator=(PollingSensor&&) noexcept = default;

  // =========================================================================
  // Measurement API
  // =========================================================================

  /// Settle, wake, drain the stale reading, spin up, measure, sleep
  /// @param delay Delay provider
  /// @param out   Measurement, written only on success
  /// @note If a step after wake fails, one best-effort sleep is attempted
  ///       and the first failure is returned.
  Status measure(const Delay& delay, Measurement& out);

  /// Schedule a measurement for tick() (non-blocking)
  /// @return IN_PROGRESS if scheduled, BUSY if a sequence is pending
  Status requestMeasurement();

  /// Advance the pending sequence (call regularly from loop)
  /// @return IN_PROGRESS while pending, the final status once
  Status tick(uint32_t nowMs) { return _link.tick(nowMs); }

  /// Check if a scheduled sequence is pending
  bool busy() const { return _link.busy(); }

  /// Check if a scheduled measurement finished successfully
  bool measurementReady() const;

  /// Get the scheduled measurement result
  /// Returns MEASUREMENT_NOT_READY if not available; clears ready flag
  Status getMeasurement(Measurement& out);

  // =========================================================================
  // Periodic Mode
  // =========================================================================

  /// Settle, wake, set working period, switch to active reporting
  /// @param minutes Working period, 0 (continuous) to 30
  /// @return INVALID_PARAM for minutes > 30 before any I/O (object kept)
  Status makePeriodic(const Delay& delay, uint8_t minutes,
                      std::optional<PeriodicSensor>& out) &&;

  /// Schedule the periodic transition for tick()
  Status requestPeriodic(uint8_t minutes);

  /// Collect a finished periodic transition
  /// @return IN_PROGRESS if still pending (object kept), otherwise the
  ///         transition result; the transport is consumed either way
  Status finishPeriodic(std::optional<PeriodicSensor>& out) &&;

  // =========================================================================
  // Diagnostics
  // =========================================================================

  /// Re-read firmware version (also refreshes id())
  Status readFirmware(const Delay& delay, FirmwareVersion& out);

  /// Read the configured working period in minutes
  Status readWorkingPeriod(const Delay& delay, uint8_t& minutes);

  /// Read the configured reporting mode
  Status readReportingMode(const Delay& delay, ReportingMode& mode);

  // =========================================================================
  // Identity and Health
  // =========================================================================

  /// Device id learned during init
  uint16_t id() const { return _link.deviceId(); }

  /// Firmware version learned during init
  FirmwareVersion version() const { return _link.firmware(); }

  /// Serial exchange health counters
  const HealthCounters& health() const { return _link.health(); }

  /// Outcome of the best-effort sleep after the last failed sequence
  Status lastRecovery() const { return _link.lastRecovery(); }

private:
  friend class UninitializedSensor;
  explicit PollingSensor(Link&& link);

  Link _link;
};

/// Sensor in active reporting mode; pushes a measurement every working
/// period. There is no way back to polling without a new init().
class PeriodicSensor {
public:
  PeriodicSensor(PeriodicSensor&&) noexcept = default;
  PeriodicSensor& operator=(PeriodicSensor&&) noexcept = default;

  /// Block until the next pushed measurement arrives
  /// @note Times out after serial timeout + working period.
  Status measure(Measurement& out);

  /// Wait for the next pushed measurement via tick()
  Status requestMeasurement();

  /// Advance the pending wait (call regularly from loop)
  Status tick(uint32_t nowMs) { return _link.tick(nowMs); }

  bool busy() const { return _link.busy(); }
  bool measurementReady() const;
  Status getMeasurement(Measurement& out);

  uint16_t id() const { return _link.deviceId(); }
  FirmwareVersion version() const { return _link.firmware(); }

  /// Working period confirmed by the sensor
  uint8_t periodMinutes() const { return _link.periodMinutes(); }

  const HealthCounters& health() const { return _link.health(); }

private:
  friend class PollingSensor;
  explicit PeriodicSensor(Link&& link);

  Link _link;
};

} // namespace SDS011
