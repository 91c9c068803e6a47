/*
 * Data structures decoded from the talon shared memory segment
 */

#ifndef __TALON_DATA_H__
#define __TALON_DATA_H__

#include "talon-layout.h"
#include "talon-status.h"

#include <bitset>
#include <cstdint>

namespace talon
{

// libastro MJD epoch (1899 Dec 31 12h UT), as written by talon
const double TALON_MJD0 = 2415020.0;

enum AxisIndex
{
    AXIS_RA = 0,
    AXIS_DEC,
    AXIS_FOCUS,
    AXIS_COUNT
};

struct AxisStatus
{
    uint16_t flags;
    FocusState state;
    double posLimit;
    double negLimit;

    AxisStatus() :
        flags(0), state(FOCUS_ABSENT), posLimit(0), negLimit(0)
    {}

    bool operator==(const AxisStatus &o) const;
};

/**
 * One decode of the segment. Angles are in the units the writer uses
 * (radians for both known builds); elevation is in earth radii.
 *
 * Fields the layout variant does not carry keep their defaults and are
 * cleared in the present mask.
 */
struct TelescopeSnapshot
{
    LayoutVariant variant;
    std::bitset<FIELD_COUNT> present;

    int32_t pid;
    double mjd;
    double lst;

    // Site
    double latitude;
    double longitude;
    double elevation;
    double temperature;
    double pressure;

    // Coordinates
    double raJ2000;
    double decJ2000;
    double haApparent;
    double decApparent;
    double altitude;
    double azimuth;

    AxisStatus axes[AXIS_COUNT];
    int32_t focusStep;
    double focusCurrentPosition;
    double focusDf;

    TelState telState;
    int32_t telStateCode;
    int32_t telStateIdx;
    CoverState coverState;
    int32_t coverStateCode;
    RoofState roofState;
    int32_t roofStateCode;
    int32_t heartbeatRemaining;

    TelescopeSnapshot() :
        variant(LAYOUT_LEGACY),
        pid(0), mjd(0), lst(0),
        latitude(0), longitude(0), elevation(0), temperature(0), pressure(0),
        raJ2000(0), decJ2000(0), haApparent(0), decApparent(0), altitude(0), azimuth(0),
        focusStep(0), focusCurrentPosition(0), focusDf(0),
        telState(TEL_ABSENT), telStateCode(0), telStateIdx(0),
        coverState(COVER_ABSENT), coverStateCode(0),
        roofState(ROOF_ABSENT), roofStateCode(0),
        heartbeatRemaining(0)
    {}

    bool has(FieldId id) const { return present.test(id); }

    /** Julian date of the snapshot timestamp. */
    double jd() const { return mjd + TALON_MJD0; }

    bool operator==(const TelescopeSnapshot &o) const;
    bool operator!=(const TelescopeSnapshot &o) const { return !(*this == o); }
};

}

#endif // __TALON_DATA_H__
