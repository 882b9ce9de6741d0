/*
  OmixMeasurementSession.h - Measurement state machine fed by Omix events.

  A full run reports bean type, moisture/density, environment and Agtron,
  with water activity as an optional last step announced by the bean type
  result or by a water-activity-start marker.
*/
#pragma once

#include "OmixEventChannel.h"
#include "OmixEvents.h"
#include "OmixMeasurement.h"

#include <functional>
#include <optional>
#include <stddef.h>
#include <stdint.h>
#include <string>

enum class OmixSessionPhase {
    Idle,
    Measuring,
    Complete
};

enum class OmixSessionOutcome {
    None,
    Completed,
    Busy,
    Failed,
    Disconnected
};

const char* sessionPhaseName(OmixSessionPhase phase);
const char* sessionOutcomeName(OmixSessionOutcome outcome);

struct OmixSessionState {
    OmixSessionPhase phase = OmixSessionPhase::Idle;
    OmixPartialMeasurement measurement;
    bool awaitingWaterActivity = false;
    OmixSessionOutcome outcome = OmixSessionOutcome::None;
};

// Clears the accumulator and enters Measuring.
OmixSessionState beginMeasurement(const OmixSessionState& state, OmixCoffeeType coffeeType);

/**
 * Pure transition. A start acknowledgement while not measuring opens a
 * session for a run started from the device itself; any other data event
 * outside Measuring is ignored.
 */
OmixSessionState applyEvent(const OmixSessionState& state, const OmixEvent& event);

// Measuring -> Idle without a record
OmixSessionState abandonMeasurement(const OmixSessionState& state, OmixSessionOutcome outcome);

class OmixMeasurementSession {
    public:
        using CompleteCallback = std::function<void(const OmixMeasurement& measurement)>;
        using PhaseCallback = std::function<void(OmixSessionPhase phase, OmixSessionOutcome outcome)>;

        explicit OmixMeasurementSession(OmixEventChannel& channel);
        ~OmixMeasurementSession();

        OmixMeasurementSession(const OmixMeasurementSession&) = delete;
        OmixMeasurementSession& operator=(const OmixMeasurementSession&) = delete;

        void start(OmixCoffeeType coffeeType);
        void handleEvent(const OmixEvent& event);

        // Discards an in-flight run, e.g. when the link drops
        void abandon(OmixSessionOutcome outcome = OmixSessionOutcome::Disconnected);

        // Forgets the current partial or completed measurement
        void clear();

        void setDeviceIdentifier(const std::string& id) {
            _deviceIdentifier = id;
        }
        void onComplete(CompleteCallback callback) {
            _onComplete = std::move(callback);
        }
        void onPhaseChange(PhaseCallback callback) {
            _onPhaseChange = std::move(callback);
        }

        [[nodiscard]] const OmixSessionState& state() const {
            return _state;
        }
        [[nodiscard]] bool isMeasuring() const {
            return _state.phase == OmixSessionPhase::Measuring;
        }
        [[nodiscard]] const std::optional<OmixMeasurement>& result() const {
            return _result;
        }

    private:
        void transition(const OmixSessionState& next);

        OmixEventChannel& _channel;
        size_t _subscription;
        uint32_t _transitions;
        OmixSessionState _state;
        std::optional<OmixMeasurement> _result;
        std::string _deviceIdentifier;
        CompleteCallback _onComplete;
        PhaseCallback _onPhaseChange;
};
