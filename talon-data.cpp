/*
 * Data structures decoded from the talon shared memory segment
 */

#include "talon-data.h"

#include <cstring>

using namespace talon;

// bitwise, so that a NaN read twice from the same bytes still compares equal
static bool sameDouble(double a, double b)
{
    return memcmp(&a, &b, sizeof(double)) == 0;
}

bool AxisStatus::operator==(const AxisStatus &o) const
{
    return flags == o.flags && state == o.state
        && sameDouble(posLimit, o.posLimit) && sameDouble(negLimit, o.negLimit);
}

bool TelescopeSnapshot::operator==(const TelescopeSnapshot &o) const
{
    if (variant != o.variant || present != o.present)
        return false;

    for (int i = 0; i < AXIS_COUNT; i++)
        if (!(axes[i] == o.axes[i]))
            return false;

    return pid == o.pid
        && sameDouble(mjd, o.mjd)
        && sameDouble(lst, o.lst)
        && sameDouble(latitude, o.latitude)
        && sameDouble(longitude, o.longitude)
        && sameDouble(elevation, o.elevation)
        && sameDouble(temperature, o.temperature)
        && sameDouble(pressure, o.pressure)
        && sameDouble(raJ2000, o.raJ2000)
        && sameDouble(decJ2000, o.decJ2000)
        && sameDouble(haApparent, o.haApparent)
        && sameDouble(decApparent, o.decApparent)
        && sameDouble(altitude, o.altitude)
        && sameDouble(azimuth, o.azimuth)
        && focusStep == o.focusStep
        && sameDouble(focusCurrentPosition, o.focusCurrentPosition)
        && sameDouble(focusDf, o.focusDf)
        && telState == o.telState
        && telStateCode == o.telStateCode
        && telStateIdx == o.telStateIdx
        && coverState == o.coverState
        && coverStateCode == o.coverStateCode
        && roofState == o.roofState
        && roofStateCode == o.roofStateCode
        && heartbeatRemaining == o.heartbeatRemaining;
}
