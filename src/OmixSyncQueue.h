/*
  OmixSyncQueue.h - Local measurement history and the offline upload queue.
*/
#pragma once

#include "OmixConfig.h"
#include "OmixMeasurement.h"

#include <stddef.h>
#include <string>
#include <vector>

/**
 * Backend the queue persists to. Implementations return false on any
 * transport or server failure; the queue keeps the data and retries later.
 */
class OmixMeasurementUploader {
    public:
        virtual ~OmixMeasurementUploader() = default;

        virtual bool storeMeasurement(const OmixMeasurement& measurement) = 0;
        virtual bool batchStoreMeasurements(const std::vector<OmixMeasurement>& measurements) = 0;
        virtual bool linkMeasurement(const std::string& measurementId, OmixLinkType type,
                                     const std::string& targetId) = 0;
};

class OmixSyncQueue {
    public:
        explicit OmixSyncQueue(OmixMeasurementUploader& uploader, size_t maxHistory = OMIX_MAX_HISTORY);

        /**
         * Adds the record to history and uploads it. Returns false when the
         * upload failed and the record was queued instead.
         */
        bool save(OmixMeasurement measurement);

        /**
         * Uploads every queued record in one batch. On success exactly those
         * records leave the queue and are marked synced; on failure nothing
         * changes. Returns true when the queue was already empty.
         */
        bool syncPending();

        /**
         * Links a record to an inventory item or roast. A record that is
         * still queued only has its pending link updated.
         */
        bool linkMeasurement(const std::string& measurementId, OmixLinkType type, const std::string& targetId);

        [[nodiscard]] const OmixMeasurement* find(const std::string& measurementId) const;

        // Newest first
        [[nodiscard]] const std::vector<OmixMeasurement>& history() const {
            return _history;
        }
        [[nodiscard]] const std::vector<OmixMeasurement>& pending() const {
            return _pending;
        }
        [[nodiscard]] size_t pendingCount() const {
            return _pending.size();
        }
        [[nodiscard]] const std::string& lastError() const {
            return _lastError;
        }

    private:
        OmixMeasurement* findInHistory(const std::string& measurementId);
        OmixMeasurement* findPending(const std::string& measurementId);
        void addToHistory(const OmixMeasurement& measurement);
        void fail(const std::string& message);

        OmixMeasurementUploader& _uploader;
        size_t _maxHistory;
        bool _syncing;
        std::vector<OmixMeasurement> _history;
        std::vector<OmixMeasurement> _pending;
        std::string _lastError;
};
