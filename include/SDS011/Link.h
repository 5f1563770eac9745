/// @file Link.h
/// @brief Protocol engine shared by all sensor phases
#pragma once

#include <cstddef>
#include <cstdint>
#include "SDS011/Status.h"
#include "SDS011/Config.h"
#include "SDS011/Message.h"

namespace SDS011 {

/// One protocol step. Exchange steps send a query (except AWAIT_MEASUREMENT)
/// and validate exactly one 10-byte reply.
enum class Step : uint8_t {
  WAIT_SLEEP_DELAY,     ///< Wait Config::sleepDelayMs
  WAIT_MEASURE_DELAY,   ///< Wait Config::measureDelayMs
  WAKE,                 ///< Set sleep mode WORK, expect WORK
  SLEEP,                ///< Set sleep mode SLEEP, expect SLEEP
  SET_QUERY_MODE,       ///< Set reporting mode QUERY, expect QUERY
  SET_ACTIVE_MODE,      ///< Set reporting mode ACTIVE, expect ACTIVE
  SET_PERIOD,           ///< Set working period (sequence parameter), expect same
  READ_FIRMWARE,        ///< Query firmware, learn version and device id
  READ_REPORTING_MODE,  ///< Query reporting mode
  READ_WORKING_PERIOD,  ///< Query working period
  DISCARD_MEASUREMENT,  ///< Query a measurement and drop it
  QUERY_MEASUREMENT,    ///< Query a measurement and keep it
  AWAIT_MEASUREMENT     ///< Receive an unsolicited measurement (no query)
};

/// Fixed step list behind one public operation
struct Sequence {
  const Step* steps;
  uint8_t count;
  bool sleepOnFailure;  ///< Put a woken sensor back to sleep if a later step fails
  const char* name;
};

namespace seq {
extern const Sequence INIT;                 ///< settle, wake, query mode, firmware, sleep
extern const Sequence MEASURE;              ///< settle, wake, drain, spin-up, query, sleep
extern const Sequence MAKE_PERIODIC;        ///< settle, wake, period, active mode
extern const Sequence PERIODIC_MEASURE;     ///< next pushed measurement
extern const Sequence READ_FIRMWARE;        ///< settle, wake, firmware, sleep
extern const Sequence READ_WORKING_PERIOD;  ///< settle, wake, period query, sleep
extern const Sequence READ_REPORTING_MODE;  ///< settle, wake, mode query, sleep
} // namespace seq

/// Suspension capability the engine runs against.
/// IN_PROGRESS from either call means "not yet, resume later".
class Runner {
public:
  virtual ~Runner() = default;

  /// Wait out a settle or spin-up delay
  virtual Status wait(uint32_t delayMs) = 0;

  /// Wait until a reply frame of len bytes can be read
  virtual Status awaitFrame(size_t len, uint32_t timeoutMs) = 0;
};

/// Runs a whole sequence in one call using the caller's delay provider.
/// The transport read blocks for the reply.
class BlockingRunner : public Runner {
public:
  explicit BlockingRunner(const Delay& delay) : _delay(delay) {}

  Status wait(uint32_t delayMs) override;
  Status awaitFrame(size_t len, uint32_t timeoutMs) override;

private:
  const Delay& _delay;
};

/// Deadline bookkeeping that survives between tick() calls
struct WaitState {
  bool armed = false;
  uint32_t startMs = 0;
};

/// Advances a sequence from tick(nowMs) without blocking
class CooperativeRunner : public Runner {
public:
  CooperativeRunner(uint32_t nowMs, WaitState& state,
                    SerialAvailableFn available, void* user)
      : _nowMs(nowMs), _state(state), _available(available), _user(user) {}

  Status wait(uint32_t delayMs) override;
  Status awaitFrame(size_t len, uint32_t timeoutMs) override;

private:
  uint32_t _elapsedMs();

  uint32_t _nowMs;
  WaitState& _state;
  SerialAvailableFn _available;
  void* _user;
};

/// Serial exchange health
struct HealthCounters {
  uint32_t totalSuccess = 0;         ///< Successful exchanges (lifetime)
  uint32_t totalFailures = 0;        ///< Failed exchanges (lifetime)
  uint8_t consecutiveFailures = 0;   ///< Failures since last success
  Status lastError = Status::Ok();   ///< Most recent failure
};

/// Owns the transport configuration, the learned sensor identity and the
/// state of the sequence in flight. Moving a Link transfers the transport;
/// the moved-from Link reports INVALID_CONFIG on further use.
class Link {
public:
  Link() = default;
  explicit Link(const Config& config) : _config(config) {}

  Link(Link&& other) noexcept;
  Link& operator=(Link&& other) noexcept;
  Link(const Link&) = delete;
  Link& operator=(const Link&) = delete;

  // =========================================================================
  // Sequencing
  // =========================================================================

  /// Run a sequence to completion (blocking)
  /// @param seq   Sequence to run
  /// @param param Sequence parameter (working period for MAKE_PERIODIC)
  /// @param delay Delay provider, required if the sequence contains waits
  Status run(const Sequence& seq, uint8_t param, const Delay& delay);

  /// Schedule a sequence for tick()
  /// @return IN_PROGRESS if scheduled, error otherwise
  Status start(const Sequence& seq, uint8_t param);

  /// Advance the scheduled sequence
  /// @return IN_PROGRESS while pending, final status once (OK if idle)
  Status tick(uint32_t nowMs);

  /// A scheduled sequence is pending
  bool busy() const { return _active; }

  /// The last scheduled run of seq has finished and not been collected
  bool completed(const Sequence& seq) const { return _completed && _seq == &seq; }

  /// Final status of the last finished sequence
  Status result() const { return _result; }

  /// Forget the finished sequence
  void clearCompleted() { _completed = false; }

  /// A finished INIT or MAKE_PERIODIC has moved the sensor to a new phase
  /// and waits for finishInit()/finishPeriodic(); nothing else may start
  bool transitionPending() const;

  /// Check the transport configuration
  Status validateConfig() const;

  // =========================================================================
  // Learned State
  // =========================================================================

  bool hasDeviceId() const { return _hasDeviceId; }
  uint16_t deviceId() const { return _deviceId; }
  bool hasFirmware() const { return _hasFirmware; }
  FirmwareVersion firmware() const { return _firmware; }
  Measurement measurement() const { return _measurement; }
  uint8_t periodMinutes() const { return _periodMinutes; }
  ReportingMode reportingMode() const { return _reportingMode; }

  /// Status of the best-effort sleep after the last failed sequence
  Status lastRecovery() const { return _lastRecovery; }

  const HealthCounters& health() const { return _health; }

  /// Blocking read timeout for a pushed measurement at the current period
  uint32_t periodicTimeoutMs() const;

private:
  Status _prepare(const Sequence& seq, uint8_t param);
  Status _resume(Runner& runner);
  Status _finish(const Status& st);
  Status _runStep(Step step, Runner& runner);
  Status _send(const Message& msg);
  Status _receive(Message& out, uint32_t timeoutMs);
  Status _accept(Step step, const Message& reply);
  Status _updateHealth(const Status& st);
  void _resetJob();

  static bool _requestFor(Step step, uint8_t param, Message& out);
  static bool _usesDelay(const Sequence& seq);

  Config _config;

  // Sequence in flight
  const Sequence* _seq = nullptr;
  uint8_t _param = 0;
  uint8_t _index = 0;
  bool _sent = false;
  bool _active = false;
  bool _completed = false;
  bool _awake = false;
  bool _recovering = false;
  Status _failure = Status::Ok();
  Status _result = Status::Ok();
  Status _lastRecovery = Status::Ok();
  WaitState _wait;

  // Learned from replies
  bool _hasDeviceId = false;
  uint16_t _deviceId = 0;
  bool _hasFirmware = false;
  FirmwareVersion _firmware;
  Measurement _measurement;
  uint8_t _periodMinutes = 0;
  ReportingMode _reportingMode = ReportingMode::QUERY;

  HealthCounters _health;
};

} // namespace SDS011
