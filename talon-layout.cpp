/*
 * Talon shared memory layout tables
 */

#include "talon-layout.h"

using namespace talon;

// MotorInfo records in TelStatShm.minfo[]: RA, Dec, (unused), Focus
#define MOTORINFO_SIZE     120
#define MOTORINFO_FLAGS    1
#define MOTORINFO_STEP     4
#define MOTORINFO_POSLIM   56
#define MOTORINFO_NEGLIM   64
#define MOTORINFO_DF       80
#define MOTORINFO_CPOS     96

#define LEGACY_MINFO       256
#define COMPACT_MINFO      248

#define RAD_TO_DEG         57.29577951308232

#define AXIS(base, n, field)   ((base) + (n) * MOTORINFO_SIZE + (field))

// Entries are listed in FieldId order; layoutFor() relies on that.
static const FieldOffset legacyFields[FIELD_COUNT] = {
    { FIELD_PID,                 "PID",                840, KIND_INT32,  true },
    { FIELD_MJD,                 "MJD",                0,   KIND_DOUBLE, true },
    { FIELD_LST,                 "LST",                152, KIND_DOUBLE, true },
    { FIELD_RA_J2000,            "RAJ2000",            88,  KIND_DOUBLE, true },
    { FIELD_DEC_J2000,           "DecJ2000",           96,  KIND_DOUBLE, true },
    { FIELD_HA_APPARENT,         "HAApparent",         112, KIND_DOUBLE, true },
    { FIELD_DEC_APPARENT,        "DecApparent",        120, KIND_DOUBLE, true },
    { FIELD_ALT,                 "Alt",                128, KIND_DOUBLE, true },
    { FIELD_AZ,                  "Az",                 136, KIND_DOUBLE, true },
    { FIELD_LATITUDE,            "Latitude",           8,   KIND_DOUBLE, true },
    { FIELD_LONGITUDE,           "Longitude",          16,  KIND_DOUBLE, true },
    { FIELD_TEMPERATURE,         "Temperature",        32,  KIND_DOUBLE, true },
    { FIELD_PRESSURE,            "Pressure",           40,  KIND_DOUBLE, true },
    { FIELD_ELEVATION,           "Elevation",          48,  KIND_DOUBLE, true },
    { FIELD_TEL_STATE,           "TelState",           808, KIND_INT32,  true },
    { FIELD_TEL_STATE_IDX,       "TelStateIdx",        812, KIND_INT32,  true },
    { FIELD_ROOF_STATE,          "RoofState",          820, KIND_INT32,  true },
    { FIELD_COVER_STATE,         "CoverState",         824, KIND_INT32,  true },
    { FIELD_HEARTBEAT_REMAINING, "HeartbeatRemaining", 836, KIND_INT32,  true },
    { FIELD_RA_FLAGS,            "RAFlags",            AXIS(LEGACY_MINFO, 0, MOTORINFO_FLAGS),  KIND_UINT16, true },
    { FIELD_RA_POS_LIM,          "RAPosLim",           AXIS(LEGACY_MINFO, 0, MOTORINFO_POSLIM), KIND_DOUBLE, true },
    { FIELD_RA_NEG_LIM,          "RANegLim",           AXIS(LEGACY_MINFO, 0, MOTORINFO_NEGLIM), KIND_DOUBLE, true },
    { FIELD_DEC_FLAGS,           "DecFlags",           AXIS(LEGACY_MINFO, 1, MOTORINFO_FLAGS),  KIND_UINT16, true },
    { FIELD_DEC_POS_LIM,         "DecPosLim",          AXIS(LEGACY_MINFO, 1, MOTORINFO_POSLIM), KIND_DOUBLE, true },
    { FIELD_DEC_NEG_LIM,         "DecNegLim",          AXIS(LEGACY_MINFO, 1, MOTORINFO_NEGLIM), KIND_DOUBLE, true },
    { FIELD_FOCUS_FLAGS,         "FocusFlags",         AXIS(LEGACY_MINFO, 3, MOTORINFO_FLAGS),  KIND_UINT16, true },
    { FIELD_FOCUS_STEP,          "FocusStep",          AXIS(LEGACY_MINFO, 3, MOTORINFO_STEP),   KIND_INT32,  true },
    { FIELD_FOCUS_CPOS,          "FocusCPos",          AXIS(LEGACY_MINFO, 3, MOTORINFO_CPOS),   KIND_DOUBLE, true },
    { FIELD_FOCUS_DF,            "FocusDF",            AXIS(LEGACY_MINFO, 3, MOTORINFO_DF),     KIND_DOUBLE, true },
};

// Only the fields documented for this build; the rest stay absent.
static const FieldOffset compactFields[FIELD_COUNT] = {
    { FIELD_PID,                 "PID",                0,   KIND_INT32,  false },
    { FIELD_MJD,                 "MJD",                0,   KIND_DOUBLE, true },
    { FIELD_LST,                 "LST",                0,   KIND_DOUBLE, false },
    { FIELD_RA_J2000,            "RAJ2000",            88,  KIND_DOUBLE, true },
    { FIELD_DEC_J2000,           "DecJ2000",           96,  KIND_DOUBLE, true },
    { FIELD_HA_APPARENT,         "HAApparent",         0,   KIND_DOUBLE, false },
    { FIELD_DEC_APPARENT,        "DecApparent",        0,   KIND_DOUBLE, false },
    { FIELD_ALT,                 "Alt",                0,   KIND_DOUBLE, false },
    { FIELD_AZ,                  "Az",                 0,   KIND_DOUBLE, false },
    { FIELD_LATITUDE,            "Latitude",           8,   KIND_DOUBLE, true },
    { FIELD_LONGITUDE,           "Longitude",          16,  KIND_DOUBLE, true },
    { FIELD_TEMPERATURE,         "Temperature",        32,  KIND_DOUBLE, true },
    { FIELD_PRESSURE,            "Pressure",           40,  KIND_DOUBLE, true },
    { FIELD_ELEVATION,           "Elevation",          48,  KIND_DOUBLE, true },
    { FIELD_TEL_STATE,           "TelState",           920, KIND_INT32,  true },
    { FIELD_TEL_STATE_IDX,       "TelStateIdx",        0,   KIND_INT32,  false },
    { FIELD_ROOF_STATE,          "RoofState",          0,   KIND_INT32,  false },
    { FIELD_COVER_STATE,         "CoverState",         976, KIND_INT32,  true },
    { FIELD_HEARTBEAT_REMAINING, "HeartbeatRemaining", 0,   KIND_INT32,  false },
    { FIELD_RA_FLAGS,            "RAFlags",            AXIS(COMPACT_MINFO, 0, MOTORINFO_FLAGS),  KIND_UINT16, true },
    { FIELD_RA_POS_LIM,          "RAPosLim",           AXIS(COMPACT_MINFO, 0, MOTORINFO_POSLIM), KIND_DOUBLE, true },
    { FIELD_RA_NEG_LIM,          "RANegLim",           AXIS(COMPACT_MINFO, 0, MOTORINFO_NEGLIM), KIND_DOUBLE, true },
    { FIELD_DEC_FLAGS,           "DecFlags",           AXIS(COMPACT_MINFO, 1, MOTORINFO_FLAGS),  KIND_UINT16, true },
    { FIELD_DEC_POS_LIM,         "DecPosLim",          AXIS(COMPACT_MINFO, 1, MOTORINFO_POSLIM), KIND_DOUBLE, true },
    { FIELD_DEC_NEG_LIM,         "DecNegLim",          AXIS(COMPACT_MINFO, 1, MOTORINFO_NEGLIM), KIND_DOUBLE, true },
    { FIELD_FOCUS_FLAGS,         "FocusFlags",         AXIS(COMPACT_MINFO, 3, MOTORINFO_FLAGS),  KIND_UINT16, true },
    { FIELD_FOCUS_STEP,          "FocusStep",          AXIS(COMPACT_MINFO, 3, MOTORINFO_STEP),   KIND_INT32,  true },
    { FIELD_FOCUS_CPOS,          "FocusCPos",          AXIS(COMPACT_MINFO, 3, MOTORINFO_CPOS),   KIND_DOUBLE, true },
    { FIELD_FOCUS_DF,            "FocusDF",            AXIS(COMPACT_MINFO, 3, MOTORINFO_DF),     KIND_DOUBLE, true },
};

size_t talon::kindWidth(FieldKind kind)
{
    switch (kind) {
        case KIND_DOUBLE: return 8;
        case KIND_INT32:  return 4;
        case KIND_UINT16: return 2;
    }
    return 0;
}

const char *talon::fieldName(FieldId id)
{
    if (id < 0 || id >= FIELD_COUNT)
        return "UNKNOWN";
    return legacyFields[id].name;
}

LayoutTable::LayoutTable(LayoutVariant _variant, const char *_name, AngleUnit _angleUnit, const FieldOffset *_fields)
    : variant(_variant), name(_name), angleUnit(_angleUnit), fields(_fields)
{
}

double LayoutTable::toDegrees(double angle) const
{
    if (angleUnit == ANGLE_DEGREES)
        return angle;
    return angle * RAD_TO_DEG;
}

size_t LayoutTable::requiredSize() const
{
    size_t size = 0;
    for (int i = 0; i < FIELD_COUNT; i++) {
        const FieldOffset &f = fields[i];
        if (!f.present)
            continue;
        size_t end = f.offset + kindWidth(f.kind);
        if (end > size)
            size = end;
    }
    return size;
}

const LayoutTable &talon::layoutFor(LayoutVariant variant)
{
    static const LayoutTable legacy(LAYOUT_LEGACY, "legacy", ANGLE_RADIANS, legacyFields);
    static const LayoutTable compact(LAYOUT_COMPACT, "compact", ANGLE_RADIANS, compactFields);

    if (variant == LAYOUT_COMPACT)
        return compact;
    return legacy;
}

bool talon::parseLayoutVariant(const std::string &name, LayoutVariant &variant)
{
    if (name == "legacy") {
        variant = LAYOUT_LEGACY;
        return true;
    }
    if (name == "compact") {
        variant = LAYOUT_COMPACT;
        return true;
    }
    return false;
}

const char *talon::layoutVariantName(LayoutVariant variant)
{
    return layoutFor(variant).getName();
}
