/*
  OmixMeasurementSession.cpp - Measurement state machine fed by Omix events.
*/
#include "OmixMeasurementSession.h"
#include "OmixLog.h"
#include "OmixPlatform.h"

#include <utility>

namespace {
    OmixSessionState complete(OmixSessionState state) {
        state.phase = OmixSessionPhase::Complete;
        state.outcome = OmixSessionOutcome::Completed;
        state.awaitingWaterActivity = false;
        return state;
    }

    // One overload per event; a new event type fails to compile until handled here.
    struct SessionReducer {
        OmixSessionState state;

        OmixSessionState operator()(const MeasurementStartedEvent&) const {
            if (state.phase == OmixSessionPhase::Measuring) {
                return state;
            }
            return beginMeasurement(state, OmixCoffeeType::Auto);
        }

        OmixSessionState operator()(const MeasurementBusyEvent&) const {
            return abandonMeasurement(state, OmixSessionOutcome::Busy);
        }

        OmixSessionState operator()(const MeasurementFailedEvent&) const {
            return abandonMeasurement(state, OmixSessionOutcome::Failed);
        }

        OmixSessionState operator()(const BeanTypeEvent& event) const {
            OmixSessionState next = state;
            next.measurement.beanType = event.data.beanType;
            next.awaitingWaterActivity = event.data.detectWaterActivity;
            return next;
        }

        OmixSessionState operator()(const MoistureDensityEvent& event) const {
            OmixSessionState next = state;
            OmixPartialMeasurement& m = next.measurement;
            m.moisture = event.data.moisture;
            m.density = event.data.estimatedDensity;
            m.bulkDensity = event.data.bulkDensity;
            m.screenSizeGrade = event.data.screenSizeGrade;
            m.screenSizeDiameter = event.data.screenSizeDiameter;
            m.weight = event.data.weight;
            return next;
        }

        OmixSessionState operator()(const WaterActivityEvent& event) const {
            OmixSessionState next = state;
            OmixPartialMeasurement& m = next.measurement;
            if (event.data.success) {
                m.waterActivity = event.data.waterActivity;
            }
            m.mirrorTemperature = event.data.mirrorTemperature;
            m.beanTemperature = event.data.beanTemperature;
            return complete(next);
        }

        OmixSessionState operator()(const AgtronEvent& event) const {
            OmixSessionState next = state;
            OmixPartialMeasurement& m = next.measurement;
            m.agtronNumber = event.data.agtronMean;
            m.variance = event.data.variance;
            m.roastStandard = event.data.roastStandard;
            m.barChart31 = event.data.barChart31;
            m.pieChart8 = event.data.pieChart8;
            return next.awaitingWaterActivity ? next : complete(next);
        }

        OmixSessionState operator()(const EnvironmentEvent& event) const {
            OmixSessionState next = state;
            OmixPartialMeasurement& m = next.measurement;
            m.temperature = event.data.temperature;
            m.humidity = event.data.humidity;
            m.pressure = event.data.pressure;
            m.altitude = event.data.altitude;
            return next;
        }

        OmixSessionState operator()(const WaterActivityStartEvent&) const {
            OmixSessionState next = state;
            next.awaitingWaterActivity = true;
            return next;
        }

        OmixSessionState operator()(const SerialNumberEvent&) const { return state; }
        OmixSessionState operator()(const FirmwareVersionEvent&) const { return state; }
        OmixSessionState operator()(const DeviceModelEvent&) const { return state; }
        OmixSessionState operator()(const BatteryEvent&) const { return state; }
        OmixSessionState operator()(const UnknownEvent&) const { return state; }
    };
}

const char* sessionPhaseName(const OmixSessionPhase phase) {
    switch (phase) {
        case OmixSessionPhase::Idle:      return "idle";
        case OmixSessionPhase::Measuring: return "measuring";
        case OmixSessionPhase::Complete:  return "complete";
        default:                          return "unknown";
    }
}

const char* sessionOutcomeName(const OmixSessionOutcome outcome) {
    switch (outcome) {
        case OmixSessionOutcome::None:         return "none";
        case OmixSessionOutcome::Completed:    return "completed";
        case OmixSessionOutcome::Busy:         return "busy";
        case OmixSessionOutcome::Failed:       return "failed";
        case OmixSessionOutcome::Disconnected: return "disconnected";
        default:                               return "unknown";
    }
}

OmixSessionState beginMeasurement(const OmixSessionState& state, const OmixCoffeeType coffeeType) {
    OmixSessionState next;
    next.phase = OmixSessionPhase::Measuring;
    next.measurement.coffeeType = coffeeType;
    return next;
}

OmixSessionState applyEvent(const OmixSessionState& state, const OmixEvent& event) {
    const bool opensSession = std::holds_alternative<MeasurementStartedEvent>(event);

    if (state.phase != OmixSessionPhase::Measuring && !opensSession) {
        return state;
    }

    return std::visit(SessionReducer{state}, event);
}

OmixSessionState abandonMeasurement(const OmixSessionState& state, const OmixSessionOutcome outcome) {
    if (state.phase != OmixSessionPhase::Measuring) {
        return state;
    }

    OmixSessionState next;
    next.outcome = outcome;
    return next;
}

OmixMeasurementSession::OmixMeasurementSession(OmixEventChannel& channel)
    : _channel(channel),
      _transitions(0) {
    _subscription = _channel.subscribe([this](const OmixEvent& event) {
        handleEvent(event);
    });
}

OmixMeasurementSession::~OmixMeasurementSession() {
    _channel.unsubscribe(_subscription);
}

void OmixMeasurementSession::start(const OmixCoffeeType coffeeType) {
    OMIX_LOGI("Measurement started (%s)", coffeeTypeName(coffeeType));
    _result.reset();
    transition(beginMeasurement(_state, coffeeType));
}

void OmixMeasurementSession::handleEvent(const OmixEvent& event) {
    transition(applyEvent(_state, event));
}

void OmixMeasurementSession::abandon(const OmixSessionOutcome outcome) {
    transition(abandonMeasurement(_state, outcome));
}

void OmixMeasurementSession::clear() {
    _state = OmixSessionState();
    _result.reset();
}

void OmixMeasurementSession::transition(const OmixSessionState& next) {
    const OmixSessionPhase previous = _state.phase;
    _state = next;

    if (_state.phase == previous) {
        return;
    }

    const uint32_t sequence = ++_transitions;

    // Callbacks may clear the session before onPhaseChange runs
    const OmixSessionPhase phase = _state.phase;
    const OmixSessionOutcome outcome = _state.outcome;

    OMIX_LOGD("Session %s -> %s (%s)", sessionPhaseName(previous), sessionPhaseName(_state.phase),
              sessionOutcomeName(_state.outcome));

    if (_state.phase == OmixSessionPhase::Measuring) {
        _result.reset();
    }

    if (_state.phase == OmixSessionPhase::Complete) {
        OmixMeasurement record;
        record.id = generateMeasurementId(omix_platform_millis());
        record.deviceIdentifier = _deviceIdentifier;
        record.measuredAt = currentTimestamp();
        record.data = _state.measurement;
        _result = record;

        OMIX_LOGI("Measurement complete: %s", record.id.c_str());

        if (_onComplete) _onComplete(record);

        // A run started from the completion callback has already reported itself
        if (_transitions != sequence) {
            return;
        }
    }
    else if (_state.phase == OmixSessionPhase::Idle) {
        OMIX_LOGW("Measurement ended without result: %s", sessionOutcomeName(_state.outcome));
    }

    if (_onPhaseChange) _onPhaseChange(phase, outcome);
}
