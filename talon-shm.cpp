/*
 * Reader for talon's TelStatShm shared memory segment
 */

#include "talon-shm.h"

#include <sys/ipc.h>
#include <sys/shm.h>
#include <cerrno>
#include <cstring>
#include <sstream>

using namespace talon;

SharedSegment::SharedSegment(key_t _key)
    : key(_key), shmid(-1), addr(nullptr), segmentSize(0)
{
}

SharedSegment::~SharedSegment()
{
    detach();
}

bool SharedSegment::attach()
{
    detach();

    int id = shmget(key, 0, 0);
    if (id < 0)
        return false;

    struct shmid_ds ds;
    if (shmctl(id, IPC_STAT, &ds) < 0)
        return false;

    void *ptr = shmat(id, nullptr, SHM_RDONLY);
    if (ptr == reinterpret_cast<void *>(-1))
        return false;

    shmid = id;
    addr = static_cast<const uint8_t *>(ptr);
    segmentSize = ds.shm_segsz;
    return true;
}

void SharedSegment::detach()
{
    if (addr) {
        int err = errno;
        shmdt(addr);
        errno = err;
    }
    addr = nullptr;
    shmid = -1;
    segmentSize = 0;
}

bool SharedSegment::isCurrent() const
{
    if (!addr)
        return false;

    struct shmid_ds ds;
    if (shmctl(shmid, IPC_STAT, &ds) < 0)
        return false;
    if (ds.shm_perm.mode & SHM_DEST)
        return false;

    // talon may have recreated the key under a new id
    return shmget(key, 0, 0) == shmid;
}

std::string DecodeError::describe() const
{
    std::ostringstream os;
    if (kindMismatch) {
        os << "cannot read " << fieldName(field) << ": layout gives a " << width
           << " byte kind the snapshot has no member for";
        return os.str();
    }
    os << "cannot read " << fieldName(field) << ": " << width << " bytes at offset "
       << offset << " exceed the " << available << " byte segment";
    return os.str();
}

namespace
{

template <typename T>
bool readField(const uint8_t *data, size_t size, const FieldOffset &f, T &out, DecodeError *error)
{
    const size_t width = sizeof(T);
    if (f.offset > size || size - f.offset < width) {
        if (error) {
            error->field = f.id;
            error->offset = f.offset;
            error->width = width;
            error->available = size;
            error->kindMismatch = false;
        }
        return false;
    }
    memcpy(&out, data + f.offset, width);
    return true;
}

}

SnapshotDecoder::SnapshotDecoder(const LayoutTable &_layout, bool _hasRoof, bool _hasCovers, bool _hasFocus)
    : layout(_layout), hasRoof(_hasRoof), hasCovers(_hasCovers), hasFocus(_hasFocus)
{
}

bool SnapshotDecoder::enabled(FieldId id) const
{
    if (!layout.has(id))
        return false;

    switch (id) {
        case FIELD_ROOF_STATE:
            return hasRoof;
        case FIELD_COVER_STATE:
            return hasCovers;
        case FIELD_FOCUS_FLAGS:
        case FIELD_FOCUS_STEP:
        case FIELD_FOCUS_CPOS:
        case FIELD_FOCUS_DF:
            return hasFocus;
        default:
            return true;
    }
}

bool SnapshotDecoder::decode(const uint8_t *data, size_t size, TelescopeSnapshot &snapshot, DecodeError *error) const
{
    TelescopeSnapshot s;
    s.variant = layout.getVariant();

    int32_t *ints[FIELD_COUNT] = { nullptr };
    double *doubles[FIELD_COUNT] = { nullptr };
    uint16_t *ushorts[FIELD_COUNT] = { nullptr };

    ints[FIELD_PID] = &s.pid;
    doubles[FIELD_MJD] = &s.mjd;
    doubles[FIELD_LST] = &s.lst;
    doubles[FIELD_RA_J2000] = &s.raJ2000;
    doubles[FIELD_DEC_J2000] = &s.decJ2000;
    doubles[FIELD_HA_APPARENT] = &s.haApparent;
    doubles[FIELD_DEC_APPARENT] = &s.decApparent;
    doubles[FIELD_ALT] = &s.altitude;
    doubles[FIELD_AZ] = &s.azimuth;
    doubles[FIELD_LATITUDE] = &s.latitude;
    doubles[FIELD_LONGITUDE] = &s.longitude;
    doubles[FIELD_TEMPERATURE] = &s.temperature;
    doubles[FIELD_PRESSURE] = &s.pressure;
    doubles[FIELD_ELEVATION] = &s.elevation;
    ints[FIELD_TEL_STATE] = &s.telStateCode;
    ints[FIELD_TEL_STATE_IDX] = &s.telStateIdx;
    ints[FIELD_ROOF_STATE] = &s.roofStateCode;
    ints[FIELD_COVER_STATE] = &s.coverStateCode;
    ints[FIELD_HEARTBEAT_REMAINING] = &s.heartbeatRemaining;
    ushorts[FIELD_RA_FLAGS] = &s.axes[AXIS_RA].flags;
    doubles[FIELD_RA_POS_LIM] = &s.axes[AXIS_RA].posLimit;
    doubles[FIELD_RA_NEG_LIM] = &s.axes[AXIS_RA].negLimit;
    ushorts[FIELD_DEC_FLAGS] = &s.axes[AXIS_DEC].flags;
    doubles[FIELD_DEC_POS_LIM] = &s.axes[AXIS_DEC].posLimit;
    doubles[FIELD_DEC_NEG_LIM] = &s.axes[AXIS_DEC].negLimit;
    ushorts[FIELD_FOCUS_FLAGS] = &s.axes[AXIS_FOCUS].flags;
    ints[FIELD_FOCUS_STEP] = &s.focusStep;
    doubles[FIELD_FOCUS_CPOS] = &s.focusCurrentPosition;
    doubles[FIELD_FOCUS_DF] = &s.focusDf;

    for (int i = 0; i < FIELD_COUNT; i++) {
        FieldId id = static_cast<FieldId>(i);
        if (!enabled(id))
            continue;

        const FieldOffset &f = layout.field(id);
        bool mapped = false;
        bool ok = false;
        switch (f.kind) {
            case KIND_DOUBLE:
                mapped = doubles[i] != nullptr;
                ok = mapped && readField(data, size, f, *doubles[i], error);
                break;
            case KIND_INT32:
                mapped = ints[i] != nullptr;
                ok = mapped && readField(data, size, f, *ints[i], error);
                break;
            case KIND_UINT16:
                mapped = ushorts[i] != nullptr;
                ok = mapped && readField(data, size, f, *ushorts[i], error);
                break;
        }
        if (!ok) {
            if (!mapped && error) {
                error->field = id;
                error->offset = f.offset;
                error->width = kindWidth(f.kind);
                error->available = size;
                error->kindMismatch = true;
            }
            return false;
        }

        s.present.set(i);
    }

    if (s.has(FIELD_TEL_STATE))
        s.telState = telStateFromCode(s.telStateCode);
    else
        s.telState = TEL_UNKNOWN;

    s.coverState = s.has(FIELD_COVER_STATE) ? coverStateFromCode(s.coverStateCode) : COVER_ABSENT;
    s.roofState = s.has(FIELD_ROOF_STATE) ? roofStateFromCode(s.roofStateCode) : ROOF_ABSENT;

    s.axes[AXIS_RA].state = focusStateFromFlags(s.axes[AXIS_RA].flags);
    s.axes[AXIS_DEC].state = focusStateFromFlags(s.axes[AXIS_DEC].flags);
    s.axes[AXIS_FOCUS].state = s.has(FIELD_FOCUS_FLAGS) ? focusStateFromFlags(s.axes[AXIS_FOCUS].flags) : FOCUS_ABSENT;

    snapshot = s;
    return true;
}

bool SnapshotDecoder::decode(const SharedSegment &segment, TelescopeSnapshot &snapshot, DecodeError *error) const
{
    return decode(segment.data(), segment.isAttached() ? segment.size() : 0, snapshot, error);
}

bool talon::snapshotsConsistent(const TelescopeSnapshot &previous, const TelescopeSnapshot &current, double maxStepDays)
{
    double step = current.mjd - previous.mjd;
    return step >= 0 && step <= maxStepDays;
}

double talon::consistencyWindow(double acceptedJd, double nowJd, double toleranceSeconds)
{
    double elapsed = nowJd - acceptedJd;
    if (elapsed < 0)
        elapsed = 0;
    return elapsed + toleranceSeconds / 86400.0;
}
