/*
 * Reader for talon's TelStatShm shared memory segment
 *
 * The segment is owned and written by the talon real-time process. There
 * is no lock or generation counter shared with readers, so a decode can
 * observe a half-updated segment (e.g. a new MJD next to old coordinates).
 * This cannot be fixed from the reader side; callers that care compare
 * consecutive snapshots (see snapshotsConsistent) and re-read.
 */

#ifndef __TALON_SHM_H__
#define __TALON_SHM_H__

#include "talon-data.h"
#include "talon-layout.h"

#include <sys/types.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace talon
{

/**
 * Read-only SysV attachment of the TelStatShm segment. Only one should
 * exist per process; decoders borrow its memory for the duration of a
 * single decode call.
 */
class SharedSegment
{
    public:
        explicit SharedSegment(key_t _key = TELSTAT_SHM_KEY);
        ~SharedSegment();

        SharedSegment(const SharedSegment&) = delete;
        SharedSegment& operator=(const SharedSegment&) = delete;

        /**
         * Attaches the existing segment read-only. The segment is never
         * created from here.
         *
         * @return false on failure, with errno set by shmget/shmat/shmctl
         */
        bool attach();
        void detach();

        bool isAttached() const { return addr != nullptr; }

        /**
         * False once talon has removed the segment we are attached to
         * (talon restarted), in which case the caller should re-attach.
         */
        bool isCurrent() const;

        key_t getKey() const { return key; }
        const uint8_t *data() const { return addr; }
        size_t size() const { return segmentSize; }

    private:
        key_t key;
        int shmid;
        const uint8_t *addr;
        size_t segmentSize;
};

struct DecodeError
{
    FieldId field;
    size_t offset;
    size_t width;
    size_t available;
    // the layout kind disagrees with the snapshot member
    bool kindMismatch;

    DecodeError() : field(FIELD_COUNT), offset(0), width(0), available(0), kindMismatch(false) {}

    std::string describe() const;
};

/**
 * Applies a layout table to a segment image. Holds no reference to the
 * decoded memory; one instance may be used from several threads.
 */
class SnapshotDecoder
{
    public:
        SnapshotDecoder(const LayoutTable &_layout, bool _hasRoof, bool _hasCovers, bool _hasFocus);

        const LayoutTable &getLayout() const { return layout; }

        /**
         * Decodes one snapshot from size bytes at data.
         *
         * @return false if a field lies outside the region; error then names
         *         the first such field and snapshot is left untouched
         */
        bool decode(const uint8_t *data, size_t size, TelescopeSnapshot &snapshot, DecodeError *error = nullptr) const;

        bool decode(const SharedSegment &segment, TelescopeSnapshot &snapshot, DecodeError *error = nullptr) const;

    private:
        const LayoutTable &layout;
        bool hasRoof;
        bool hasCovers;
        bool hasFocus;

        bool enabled(FieldId id) const;
};

/**
 * Tear heuristic: the newer snapshot must not step back in time nor jump
 * further ahead than maxStepDays.
 */
bool snapshotsConsistent(const TelescopeSnapshot &previous, const TelescopeSnapshot &current, double maxStepDays);

/**
 * Largest MJD step (days) to accept from the snapshot read at host Julian
 * date nowJd, when the previous one was accepted at acceptedJd: the host
 * time elapsed in between plus toleranceSeconds.
 */
double consistencyWindow(double acceptedJd, double nowJd, double toleranceSeconds);

}

#endif // __TALON_SHM_H__
