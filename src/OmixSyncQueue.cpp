/*
  OmixSyncQueue.cpp - Local measurement history and the offline upload queue.
*/
#include "OmixSyncQueue.h"
#include "OmixLog.h"

#include <algorithm>
#include <set>
#include <utility>

OmixSyncQueue::OmixSyncQueue(OmixMeasurementUploader& uploader, const size_t maxHistory)
    : _uploader(uploader),
      _maxHistory(maxHistory),
      _syncing(false) {
}

bool OmixSyncQueue::save(OmixMeasurement measurement) {
    measurement.syncedAt.clear();
    addToHistory(measurement);

    if (_uploader.storeMeasurement(measurement)) {
        OmixMeasurement* local = findInHistory(measurement.id);
        if (local) {
            local->syncedAt = currentTimestamp();
        }

        OMIX_LOGI("Measurement %s uploaded", measurement.id.c_str());
        return true;
    }

    _pending.push_back(std::move(measurement));
    fail("Upload failed, measurement queued (" + std::to_string(_pending.size()) + " pending)");
    return false;
}

bool OmixSyncQueue::syncPending() {
    if (_pending.empty()) {
        return true;
    }

    if (_syncing) {
        fail("Sync already in progress");
        return false;
    }

    _syncing = true;

    // Records saved while the batch is in flight are not part of it
    const std::vector<OmixMeasurement> batch = _pending;
    const bool uploaded = _uploader.batchStoreMeasurements(batch);

    _syncing = false;

    if (!uploaded) {
        fail("Batch upload of " + std::to_string(batch.size()) + " measurement(s) failed");
        return false;
    }

    std::set<std::string> syncedIds;
    for (const auto& measurement : batch) {
        syncedIds.insert(measurement.id);
    }

    _pending.erase(std::remove_if(_pending.begin(), _pending.end(),
                                  [&syncedIds](const OmixMeasurement& m) {
                                      return syncedIds.count(m.id) > 0;
                                  }),
                   _pending.end());

    const std::string now = currentTimestamp();
    for (auto& measurement : _history) {
        if (syncedIds.count(measurement.id) > 0) {
            measurement.syncedAt = now;
        }
    }

    OMIX_LOGI("Synced %u pending measurement(s)", static_cast<unsigned>(batch.size()));
    return true;
}

bool OmixSyncQueue::linkMeasurement(const std::string& measurementId, const OmixLinkType type,
                                    const std::string& targetId) {
    if (type == OmixLinkType::None || targetId.empty()) {
        fail("Link needs a type and a target id");
        return false;
    }

    OmixMeasurementLink link;
    link.type = type;
    link.targetId = targetId;

    OmixMeasurement* local = findInHistory(measurementId);
    OmixMeasurement* queued = findPending(measurementId);

    if (queued) {
        queued->link = link;
        if (local) local->link = link;
        OMIX_LOGD("Updated pending link of %s", measurementId.c_str());
        return true;
    }

    if (!_uploader.linkMeasurement(measurementId, type, targetId)) {
        fail("Failed to link measurement " + measurementId);
        return false;
    }

    if (local) local->link = link;
    OMIX_LOGI("Linked %s to %s %s", measurementId.c_str(), linkTypeName(type), targetId.c_str());
    return true;
}

const OmixMeasurement* OmixSyncQueue::find(const std::string& measurementId) const {
    for (const auto& measurement : _history) {
        if (measurement.id == measurementId) {
            return &measurement;
        }
    }
    return nullptr;
}

OmixMeasurement* OmixSyncQueue::findInHistory(const std::string& measurementId) {
    for (auto& measurement : _history) {
        if (measurement.id == measurementId) {
            return &measurement;
        }
    }
    return nullptr;
}

OmixMeasurement* OmixSyncQueue::findPending(const std::string& measurementId) {
    for (auto& measurement : _pending) {
        if (measurement.id == measurementId) {
            return &measurement;
        }
    }
    return nullptr;
}

void OmixSyncQueue::addToHistory(const OmixMeasurement& measurement) {
    _history.insert(_history.begin(), measurement);

    // Pending records survive in the queue even when trimmed from history
    if (_history.size() > _maxHistory) {
        _history.resize(_maxHistory);
    }
}

void OmixSyncQueue::fail(const std::string& message) {
    _lastError = message;
    OMIX_LOGW("%s", message.c_str());
}
