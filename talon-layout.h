/*
 * Talon shared memory layout tables
 *
 * Byte offsets of the fields this daemon reads from talon's TelStatShm
 * segment. The numbers are reproduced from the writer's compiled structure
 * layout, e.g. by building the following into one of the talon utilities:
 *
 *   printf("Key = 0x%x\n", TELSTATSHMKEY);
 *   printf("PID = %zu\n", offsetof(TelStatShm, teld_pid));
 *   printf("LST = %zu\n", offsetof(TelStatShm, Clst));
 *   printf("TelState = %zu\n", offsetof(TelStatShm, telstate));
 *   printf("RAFlags = %zu\n", offsetof(TelStatShm, minfo) + 1);
 *   printf("RAPosLim = %zu\n", offsetof(TelStatShm, minfo) + offsetof(MotorInfo, poslim));
 *   ...
 *
 * Nothing here is computed at runtime. A talon build with a different
 * structure layout gets a new LayoutVariant; existing tables are never
 * edited in place, as a wrong offset silently reads garbage.
 */

#ifndef __TALON_LAYOUT_H__
#define __TALON_LAYOUT_H__

#include <cstddef>
#include <cstdint>
#include <string>

namespace talon
{

/** Default SysV key of the TelStatShm segment (TELSTATSHMKEY). */
const int32_t TELSTAT_SHM_KEY = 0x4e56361a;

enum LayoutVariant
{
    // Warwick one-metre / SuperWASP teld build
    LAYOUT_LEGACY,
    // later build, eight bytes shorter ahead of the motor table
    LAYOUT_COMPACT
};

/** Unit the writer uses for angle fields (coordinates, site, axis limits). */
enum AngleUnit
{
    ANGLE_RADIANS,
    ANGLE_DEGREES
};

enum FieldKind
{
    KIND_DOUBLE,
    KIND_INT32,
    KIND_UINT16
};

enum FieldId
{
    FIELD_PID = 0,
    FIELD_MJD,
    FIELD_LST,
    FIELD_RA_J2000,
    FIELD_DEC_J2000,
    FIELD_HA_APPARENT,
    FIELD_DEC_APPARENT,
    FIELD_ALT,
    FIELD_AZ,
    FIELD_LATITUDE,
    FIELD_LONGITUDE,
    FIELD_TEMPERATURE,
    FIELD_PRESSURE,
    FIELD_ELEVATION,
    FIELD_TEL_STATE,
    FIELD_TEL_STATE_IDX,
    FIELD_ROOF_STATE,
    FIELD_COVER_STATE,
    FIELD_HEARTBEAT_REMAINING,
    FIELD_RA_FLAGS,
    FIELD_RA_POS_LIM,
    FIELD_RA_NEG_LIM,
    FIELD_DEC_FLAGS,
    FIELD_DEC_POS_LIM,
    FIELD_DEC_NEG_LIM,
    FIELD_FOCUS_FLAGS,
    FIELD_FOCUS_STEP,
    FIELD_FOCUS_CPOS,
    FIELD_FOCUS_DF,
    FIELD_COUNT
};

struct FieldOffset
{
    FieldId id;
    const char *name;
    size_t offset;
    FieldKind kind;
    // false when the variant's writer does not export the field
    bool present;
};

/** Byte width of a primitive kind: 8, 4 or 2. */
size_t kindWidth(FieldKind kind);

const char *fieldName(FieldId id);

/**
 * Immutable offset table of one talon build.
 */
class LayoutTable
{
    public:
        LayoutVariant getVariant() const { return variant; }
        const char *getName() const { return name; }
        AngleUnit getAngleUnit() const { return angleUnit; }

        /** Converts an angle field of this layout to degrees. */
        double toDegrees(double angle) const;

        const FieldOffset &field(FieldId id) const { return fields[id]; }
        bool has(FieldId id) const { return fields[id].present; }

        /** Smallest segment that holds every present field. */
        size_t requiredSize() const;

        friend const LayoutTable &layoutFor(LayoutVariant variant);

    private:
        LayoutTable(LayoutVariant _variant, const char *_name, AngleUnit _angleUnit, const FieldOffset *_fields);

        LayoutVariant variant;
        const char *name;
        AngleUnit angleUnit;
        const FieldOffset *fields;
};

const LayoutTable &layoutFor(LayoutVariant variant);

/**
 * Resolves a configuration name ("legacy", "compact") to a variant.
 *
 * @return false for an unsupported name
 */
bool parseLayoutVariant(const std::string &name, LayoutVariant &variant);

const char *layoutVariantName(LayoutVariant variant);

}

#endif // __TALON_LAYOUT_H__
