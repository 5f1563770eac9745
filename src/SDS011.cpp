/**
 * @file SDS011.cpp
 * @brief SDS011 phase-typed driver implementation.
 */

#include "SDS011/SDS011.h"

#include <utility>

namespace SDS011 {
namespace {

/// Checks shared by every transition, done before the transport is consumed
static Status checkTransition(const Link& link, const Delay& delay) {
  if (delay.delayMs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Delay callback not set");
  }
  Status st = link.validateConfig();
  if (!st.ok()) {
    return st;
  }
  if (link.busy()) {
    return Status::Error(Err::BUSY, "Sequence in progress");
  }
  if (link.transitionPending()) {
    return Status::Error(Err::BUSY, "Phase transition not collected");
  }
  return Status::Ok();
}

static Status checkFinish(const Link& link, const Sequence& seq) {
  if (link.busy()) {
    return Status::Error(Err::IN_PROGRESS, "Sequence in progress");
  }
  if (!link.completed(seq)) {
    return Status::Error(Err::INVALID_PARAM, "Sequence not requested");
  }
  return Status::Ok();
}

static Status checkPeriod(uint8_t minutes) {
  if (minutes > cmd::MAX_WORKING_PERIOD_MIN) {
    return Status::Error(Err::INVALID_PARAM, "Working period above 30 minutes", minutes);
  }
  return Status::Ok();
}

}  // namespace

// ============================================================================
// UninitializedSensor
// ============================================================================

Status UninitializedSensor::init(const Delay& delay, std::optional<PollingSensor>& out) && {
  Status st = checkTransition(_link, delay);
  if (!st.ok()) {
    return st;
  }

  Link link = std::move(_link);
  st = link.run(seq::INIT, 0, delay);
  if (!st.ok()) {
    return st;
  }

  out = PollingSensor(std::move(link));
  return Status::Ok();
}

Status UninitializedSensor::requestInit() {
  return _link.start(seq::INIT, 0);
}

Status UninitializedSensor::finishInit(std::optional<PollingSensor>& out) && {
  Status st = checkFinish(_link, seq::INIT);
  if (!st.ok()) {
    return st;
  }

  Link link = std::move(_link);
  st = link.result();
  link.clearCompleted();
  if (!st.ok()) {
    return st;
  }

  out = PollingSensor(std::move(link));
  return Status::Ok();
}

// ============================================================================
// PollingSensor
// ============================================================================

PollingSensor::PollingSensor(Link&& link) : _link(std::move(link)) {}

Status PollingSensor::measure(const Delay& delay, Measurement& out) {
  Status st = _link.run(seq::MEASURE, 0, delay);
  if (!st.ok()) {
    return st;
  }

  out = _link.measurement();
  return Status::Ok();
}

Status PollingSensor::requestMeasurement() {
  return _link.start(seq::MEASURE, 0);
}

bool PollingSensor::measurementReady() const {
  return _link.completed(seq::MEASURE) && _link.result().ok();
}

Status PollingSensor::getMeasurement(Measurement& out) {
  if (!measurementReady()) {
    return Status::Error(Err::MEASUREMENT_NOT_READY, "Measurement not ready");
  }

  out = _link.measurement();
  _link.clearCompleted();
  return Status::Ok();
}

Status PollingSensor::makePeriodic(const Delay& delay, uint8_t minutes,
                                   std::optional<PeriodicSensor>& out) && {
  Status st = checkPeriod(minutes);
  if (!st.ok()) {
    return st;
  }
  st = checkTransition(_link, delay);
  if (!st.ok()) {
    return st;
  }

  Link link = std::move(_link);
  st = link.run(seq::MAKE_PERIODIC, minutes, delay);
  if (!st.ok()) {
    return st;
  }

  out = PeriodicSensor(std::move(link));
  return Status::Ok();
}

Status PollingSensor::requestPeriodic(uint8_t minutes) {
  Status st = checkPeriod(minutes);
  if (!st.ok()) {
    return st;
  }
  return _link.start(seq::MAKE_PERIODIC, minutes);
}

Status PollingSensor::finishPeriodic(std::optional<PeriodicSensor>& out) && {
  Status st = checkFinish(_link, seq::MAKE_PERIODIC);
  if (!st.ok()) {
    return st;
  }

  Link link = std::move(_link);
  st = link.result();
  link.clearCompleted();
  if (!st.ok()) {
    return st;
  }

  out = PeriodicSensor(std::move(link));
  return Status::Ok();
}

Status PollingSensor::readFirmware(const Delay& delay, FirmwareVersion& out) {
  Status st = _link.run(seq::READ_FIRMWARE, 0, delay);
  if (!st.ok()) {
    return st;
  }

  out = _link.firmware();
  return Status::Ok();
}

Status PollingSensor::readWorkingPeriod(const Delay& delay, uint8_t& minutes) {
  Status st = _link.run(seq::READ_WORKING_PERIOD, 0, delay);
  if (!st.ok()) {
    return st;
  }

  minutes = _link.periodMinutes();
  return Status::Ok();
}

Status PollingSensor::readReportingMode(const Delay& delay, ReportingMode& mode) {
  Status st = _link.run(seq::READ_REPORTING_MODE, 0, delay);
  if (!st.ok()) {
    return st;
  }

  mode = _link.reportingMode();
  return Status::Ok();
}

// ============================================================================
// PeriodicSensor
// ============================================================================

PeriodicSensor::PeriodicSensor(Link&& link) : _link(std::move(link)) {}

Status PeriodicSensor::measure(Measurement& out) {
  // The sensor owns timing in this phase; nothing to wait for but the frame.
  const Delay noDelay;
  Status st = _link.run(seq::PERIODIC_MEASURE, 0, noDelay);
  if (!st.ok()) {
    return st;
  }

  out = _link.measurement();
  return Status::Ok();
}

Status PeriodicSensor::requestMeasurement() {
  return _link.start(seq::PERIODIC_MEASURE, 0);
}

bool PeriodicSensor::measurementReady() const {
  return _link.completed(seq::PERIODIC_MEASURE) && _link.result().ok();
}

Status PeriodicSensor::getMeasurement(Measurement& out) {
  if (!measurementReady()) {
    return Status::Error(Err::MEASUREMENT_NOT_READY, "Measurement not ready");
  }

  out = _link.measurement();
  _link.clearCompleted();
  return Status::Ok();
}

} // namespace SDS011
