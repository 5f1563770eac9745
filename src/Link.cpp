/**
 * @file Link.cpp
 * @brief SDS011 protocol engine: sequences, runners, serial exchange.
 */

#include "SDS011/Link.h"

#include <limits>
#include <utility>

#include "SDS011/Frame.h"

namespace SDS011 {
namespace {

static constexpr uint32_t CONTINUOUS_REPORT_MS = 1000;
static constexpr uint32_t MS_PER_MINUTE = 60000;

static constexpr Step INIT_STEPS[] = {
    Step::WAIT_SLEEP_DELAY, Step::WAKE, Step::SET_QUERY_MODE,
    Step::READ_FIRMWARE, Step::SLEEP};

// The sensor buffers one stale reading while asleep; drain it before spin-up.
static constexpr Step MEASURE_STEPS[] = {
    Step::WAIT_SLEEP_DELAY, Step::WAKE, Step::DISCARD_MEASUREMENT,
    Step::WAIT_MEASURE_DELAY, Step::QUERY_MEASUREMENT, Step::SLEEP};

static constexpr Step MAKE_PERIODIC_STEPS[] = {
    Step::WAIT_SLEEP_DELAY, Step::WAKE, Step::SET_PERIOD, Step::SET_ACTIVE_MODE};

static constexpr Step PERIODIC_MEASURE_STEPS[] = {Step::AWAIT_MEASUREMENT};

static constexpr Step READ_FIRMWARE_STEPS[] = {
    Step::WAIT_SLEEP_DELAY, Step::WAKE, Step::READ_FIRMWARE, Step::SLEEP};

static constexpr Step READ_WORKING_PERIOD_STEPS[] = {
    Step::WAIT_SLEEP_DELAY, Step::WAKE, Step::READ_WORKING_PERIOD, Step::SLEEP};

static constexpr Step READ_REPORTING_MODE_STEPS[] = {
    Step::WAIT_SLEEP_DELAY, Step::WAKE, Step::READ_REPORTING_MODE, Step::SLEEP};

template <size_t N>
constexpr uint8_t stepCount(const Step (&)[N]) {
  return static_cast<uint8_t>(N);
}

static Status expectKind(const Message& reply, Kind kind) {
  if (reply.kind != kind) {
    return Status::Error(Err::UNEXPECTED_REPLY, "Unexpected reply type",
                         static_cast<int32_t>(reply.kind));
  }
  return Status::Ok();
}

static Status expectSleepMode(const Message& reply, SleepMode mode) {
  Status st = expectKind(reply, Kind::SLEEP_MODE);
  if (!st.ok()) {
    return st;
  }
  if (reply.sleepMode != mode) {
    return Status::Error(Err::OPERATION_FAILED, "Sleep mode not confirmed",
                         static_cast<int32_t>(reply.sleepMode));
  }
  return Status::Ok();
}

static Status expectReportingMode(const Message& reply, ReportingMode mode) {
  Status st = expectKind(reply, Kind::REPORTING_MODE);
  if (!st.ok()) {
    return st;
  }
  if (reply.reportingMode != mode) {
    return Status::Error(Err::OPERATION_FAILED, "Reporting mode not confirmed",
                         static_cast<int32_t>(reply.reportingMode));
  }
  return Status::Ok();
}

}  // namespace

namespace seq {
const Sequence INIT = {INIT_STEPS, stepCount(INIT_STEPS), false, "init"};
const Sequence MEASURE = {MEASURE_STEPS, stepCount(MEASURE_STEPS), true, "measure"};
const Sequence MAKE_PERIODIC = {MAKE_PERIODIC_STEPS, stepCount(MAKE_PERIODIC_STEPS), false,
                                "make_periodic"};
const Sequence PERIODIC_MEASURE = {PERIODIC_MEASURE_STEPS, stepCount(PERIODIC_MEASURE_STEPS),
                                   false, "periodic_measure"};
const Sequence READ_FIRMWARE = {READ_FIRMWARE_STEPS, stepCount(READ_FIRMWARE_STEPS), true,
                                "read_firmware"};
const Sequence READ_WORKING_PERIOD = {READ_WORKING_PERIOD_STEPS,
                                      stepCount(READ_WORKING_PERIOD_STEPS), true,
                                      "read_working_period"};
const Sequence READ_REPORTING_MODE = {READ_REPORTING_MODE_STEPS,
                                      stepCount(READ_REPORTING_MODE_STEPS), true,
                                      "read_reporting_mode"};
} // namespace seq

// ============================================================================
// Runners
// ============================================================================

Status BlockingRunner::wait(uint32_t delayMs) {
  if (_delay.delayMs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Delay callback not set");
  }
  if (delayMs > 0) {
    _delay.delayMs(delayMs, _delay.user);
  }
  return Status::Ok();
}

Status BlockingRunner::awaitFrame(size_t len, uint32_t timeoutMs) {
  // The transport read blocks until len bytes or its timeout.
  (void)len;
  (void)timeoutMs;
  return Status::Ok();
}

uint32_t CooperativeRunner::_elapsedMs() {
  if (!_state.armed) {
    _state.armed = true;
    _state.startMs = _nowMs;
  }
  return _nowMs - _state.startMs;
}

Status CooperativeRunner::wait(uint32_t delayMs) {
  if (_elapsedMs() < delayMs) {
    return Status::Error(Err::IN_PROGRESS, "Waiting");
  }
  _state.armed = false;
  return Status::Ok();
}

Status CooperativeRunner::awaitFrame(size_t len, uint32_t timeoutMs) {
  if (_available == nullptr) {
    return Status::Error(Err::UNSUPPORTED, "Serial available callback not set");
  }

  const uint32_t elapsed = _elapsedMs();
  if (_available(_user) >= len) {
    _state.armed = false;
    return Status::Ok();
  }
  if (elapsed >= timeoutMs) {
    _state.armed = false;
    return Status::Error(Err::TIMEOUT, "Reply timeout", static_cast<int32_t>(elapsed));
  }
  return Status::Error(Err::IN_PROGRESS, "Awaiting reply");
}

// ============================================================================
// Link
// ============================================================================

Link::Link(Link&& other) noexcept {
  *this = std::move(other);
}

Link& Link::operator=(Link&& other) noexcept {
  if (this == &other) {
    return *this;
  }

  _config = other._config;
  _seq = other._seq;
  _param = other._param;
  _index = other._index;
  _sent = other._sent;
  _active = other._active;
  _completed = other._completed;
  _awake = other._awake;
  _recovering = other._recovering;
  _failure = other._failure;
  _result = other._result;
  _lastRecovery = other._lastRecovery;
  _wait = other._wait;
  _hasDeviceId = other._hasDeviceId;
  _deviceId = other._deviceId;
  _hasFirmware = other._hasFirmware;
  _firmware = other._firmware;
  _measurement = other._measurement;
  _periodMinutes = other._periodMinutes;
  _reportingMode = other._reportingMode;
  _health = other._health;

  // The transport now belongs to this Link.
  other._config = Config{};
  other._resetJob();
  other._active = false;
  other._completed = false;
  return *this;
}

Status Link::validateConfig() const {
  if (_config.serialWrite == nullptr || _config.serialRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "Serial callbacks not set");
  }
  if (_config.serialTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Serial timeout must be > 0");
  }
  return Status::Ok();
}

uint32_t Link::periodicTimeoutMs() const {
  if (_periodMinutes == 0) {
    return _config.serialTimeoutMs + CONTINUOUS_REPORT_MS;
  }
  return _config.serialTimeoutMs + static_cast<uint32_t>(_periodMinutes) * MS_PER_MINUTE;
}

bool Link::transitionPending() const {
  return _completed && (_seq == &seq::INIT || _seq == &seq::MAKE_PERIODIC);
}

Status Link::run(const Sequence& seq, uint8_t param, const Delay& delay) {
  if (_usesDelay(seq) && delay.delayMs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Delay callback not set");
  }

  Status st = _prepare(seq, param);
  if (!st.ok()) {
    return st;
  }

  BlockingRunner runner(delay);
  st = _resume(runner);
  _completed = false;
  return st;
}

Status Link::start(const Sequence& seq, uint8_t param) {
  Status st = _prepare(seq, param);
  if (!st.ok()) {
    return st;
  }
  if (_config.serialAvailable == nullptr) {
    _resetJob();
    return Status::Error(Err::UNSUPPORTED, "Serial available callback not set");
  }

  _active = true;
  return Status::Error(Err::IN_PROGRESS, "Sequence started");
}

Status Link::tick(uint32_t nowMs) {
  if (!_active) {
    return Status::Ok();
  }

  CooperativeRunner runner(nowMs, _wait, _config.serialAvailable, _config.serialUser);
  return _resume(runner);
}

Status Link::_prepare(const Sequence& seq, uint8_t param) {
  if (_active) {
    return Status::Error(Err::BUSY, "Sequence in progress");
  }
  if (transitionPending()) {
    return Status::Error(Err::BUSY, "Phase transition not collected");
  }

  Status st = validateConfig();
  if (!st.ok()) {
    return st;
  }

  _resetJob();
  _seq = &seq;
  _param = param;
  _completed = false;
  return Status::Ok();
}

void Link::_resetJob() {
  _seq = nullptr;
  _param = 0;
  _index = 0;
  _sent = false;
  _awake = false;
  _recovering = false;
  _failure = Status::Ok();
  _wait = WaitState{};
}

Status Link::_resume(Runner& runner) {
  while (true) {
    if (_recovering) {
      Status st = _runStep(Step::SLEEP, runner);
      if (st.code == Err::IN_PROGRESS) {
        return st;
      }
      _recovering = false;
      _lastRecovery = st;
      return _finish(_failure);
    }

    if (_index >= _seq->count) {
      return _finish(Status::Ok());
    }

    const Step step = _seq->steps[_index];
    Status st = _runStep(step, runner);
    if (st.code == Err::IN_PROGRESS) {
      return st;
    }

    if (!st.ok()) {
      if (_seq->sleepOnFailure && _awake && step != Step::SLEEP) {
        _failure = st;
        _recovering = true;
        _sent = false;
        continue;
      }
      return _finish(st);
    }

    _index++;
    _sent = false;
  }
}

Status Link::_finish(const Status& st) {
  _active = false;
  _completed = true;
  _result = st;
  _wait = WaitState{};
  return st;
}

Status Link::_runStep(Step step, Runner& runner) {
  if (step == Step::WAIT_SLEEP_DELAY) {
    return runner.wait(_config.sleepDelayMs);
  }
  if (step == Step::WAIT_MEASURE_DELAY) {
    return runner.wait(_config.measureDelayMs);
  }

  if (!_sent) {
    Message request;
    if (_requestFor(step, _param, request)) {
      Status st = validate(request);
      if (!st.ok()) {
        return st;
      }
      st = _send(request);
      if (!st.ok()) {
        return st;
      }
    }
    _sent = true;
  }

  const uint32_t timeoutMs =
      (step == Step::AWAIT_MEASUREMENT) ? periodicTimeoutMs() : _config.serialTimeoutMs;

  Status st = runner.awaitFrame(cmd::REPLY_FRAME_LEN, timeoutMs);
  if (st.code == Err::TIMEOUT) {
    return _updateHealth(st);
  }
  if (!st.ok()) {
    return st;
  }

  Message reply;
  st = _receive(reply, timeoutMs);
  if (!st.ok()) {
    return st;
  }

  return _updateHealth(_accept(step, reply));
}

Status Link::_send(const Message& msg) {
  uint8_t buf[cmd::QUERY_FRAME_LEN] = {};
  frame::encodeQuery(msg, cmd::BROADCAST_ID, buf);

  size_t written = 0;
  Status st = _config.serialWrite(buf, sizeof(buf), written, _config.serialTimeoutMs,
                                  _config.serialUser);
  if (!st.ok()) {
    return _updateHealth(Status::Error(Err::SERIAL_WRITE_ERROR, "Serial write failed",
                                       st.detail));
  }
  if (written != sizeof(buf)) {
    return _updateHealth(Status::Error(Err::SHORT_WRITE, "Short write",
                                       static_cast<int32_t>(written)));
  }
  return _updateHealth(Status::Ok());
}

Status Link::_receive(Message& out, uint32_t timeoutMs) {
  uint8_t buf[cmd::REPLY_FRAME_LEN] = {};
  size_t received = 0;

  Status st = _config.serialRead(buf, sizeof(buf), received, timeoutMs,
                                 _config.serialUser);
  if (!st.ok()) {
    return _updateHealth(Status::Error(Err::SERIAL_READ_ERROR, "Serial read failed",
                                       st.detail));
  }
  if (received != sizeof(buf)) {
    return _updateHealth(Status::Error(Err::SHORT_READ,
                                       received == 0 ? "Unexpected end of stream"
                                                     : "Short read",
                                       static_cast<int32_t>(received)));
  }

  // A decoded frame counts once its content is accepted.
  st = frame::decodeReply(buf, out);
  if (!st.ok()) {
    return _updateHealth(st);
  }
  return Status::Ok();
}

Status Link::_accept(Step step, const Message& reply) {
  Status st = Status::Ok();

  switch (step) {
    case Step::WAKE:
      st = expectSleepMode(reply, SleepMode::WORK);
      if (st.ok()) {
        _awake = true;
      }
      return st;

    case Step::SLEEP:
      st = expectSleepMode(reply, SleepMode::SLEEP);
      if (st.ok()) {
        _awake = false;
      }
      return st;

    case Step::SET_QUERY_MODE:
      st = expectReportingMode(reply, ReportingMode::QUERY);
      if (st.ok()) {
        _reportingMode = ReportingMode::QUERY;
      }
      return st;

    case Step::SET_ACTIVE_MODE:
      st = expectReportingMode(reply, ReportingMode::ACTIVE);
      if (st.ok()) {
        _reportingMode = ReportingMode::ACTIVE;
      }
      return st;

    case Step::SET_PERIOD:
      st = expectKind(reply, Kind::WORKING_PERIOD);
      if (!st.ok()) {
        return st;
      }
      if (reply.periodMinutes != _param) {
        return Status::Error(Err::OPERATION_FAILED, "Working period not confirmed",
                             reply.periodMinutes);
      }
      _periodMinutes = reply.periodMinutes;
      return Status::Ok();

    case Step::READ_FIRMWARE:
      st = expectKind(reply, Kind::FIRMWARE);
      if (!st.ok()) {
        return st;
      }
      _firmware = reply.firmware;
      _hasFirmware = true;
      _deviceId = reply.deviceId;
      _hasDeviceId = true;
      return Status::Ok();

    case Step::READ_REPORTING_MODE:
      st = expectKind(reply, Kind::REPORTING_MODE);
      if (st.ok()) {
        _reportingMode = reply.reportingMode;
      }
      return st;

    case Step::READ_WORKING_PERIOD:
      st = expectKind(reply, Kind::WORKING_PERIOD);
      if (st.ok()) {
        _periodMinutes = reply.periodMinutes;
      }
      return st;

    case Step::DISCARD_MEASUREMENT:
      return expectKind(reply, Kind::MEASUREMENT);

    case Step::QUERY_MEASUREMENT:
    case Step::AWAIT_MEASUREMENT:
      st = expectKind(reply, Kind::MEASUREMENT);
      if (st.ok()) {
        _measurement = reply.measurement;
      }
      return st;

    default:
      return Status::Error(Err::INVALID_PARAM, "Step has no reply");
  }
}

Status Link::_updateHealth(const Status& st) {
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (st.ok()) {
    if (_health.totalSuccess < maxU32) {
      _health.totalSuccess++;
    }
    _health.consecutiveFailures = 0;
    return st;
  }

  _health.lastError = st;
  if (_health.totalFailures < maxU32) {
    _health.totalFailures++;
  }
  if (_health.consecutiveFailures < maxU8) {
    _health.consecutiveFailures++;
  }
  return st;
}

bool Link::_requestFor(Step step, uint8_t param, Message& out) {
  switch (step) {
    case Step::WAKE: out = Message::setSleepMode(SleepMode::WORK); return true;
    case Step::SLEEP: out = Message::setSleepMode(SleepMode::SLEEP); return true;
    case Step::SET_QUERY_MODE: out = Message::setReportingMode(ReportingMode::QUERY); return true;
    case Step::SET_ACTIVE_MODE: out = Message::setReportingMode(ReportingMode::ACTIVE); return true;
    case Step::SET_PERIOD: out = Message::setWorkingPeriod(param); return true;
    case Step::READ_FIRMWARE: out = Message::queryFirmware(); return true;
    case Step::READ_REPORTING_MODE: out = Message::queryReportingMode(); return true;
    case Step::READ_WORKING_PERIOD: out = Message::queryWorkingPeriod(); return true;
    case Step::DISCARD_MEASUREMENT:
    case Step::QUERY_MEASUREMENT: out = Message::queryMeasurement(); return true;
    default: return false;
  }
}

bool Link::_usesDelay(const Sequence& seq) {
  for (uint8_t i = 0; i < seq.count; ++i) {
    if (seq.steps[i] == Step::WAIT_SLEEP_DELAY || seq.steps[i] == Step::WAIT_MEASURE_DELAY) {
      return true;
    }
  }
  return false;
}

} // namespace SDS011
