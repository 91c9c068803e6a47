/*
 * Talon status vocabulary
 */

#include "talon-status.h"
#include "talon-data.h"

#include <map>
#include <sstream>

using namespace talon;

namespace
{

struct StateLabel
{
    const char *label;
    const char *format;
};

const StateLabel telStateLabels[] = {
    { "DISABLED", TFMT_RED TFMT_BOLD },
    { "STOPPED",  TFMT_RED TFMT_BOLD },
    { "HUNTING",  TFMT_YELLOW TFMT_BOLD },
    { "TRACKING", TFMT_GREEN TFMT_BOLD },
    { "SLEWING",  TFMT_YELLOW TFMT_BOLD },
    { "HOMING",   TFMT_YELLOW TFMT_BOLD },
    { "LIMITING", TFMT_YELLOW TFMT_BOLD },
};

const StateLabel focusStateLabels[] = {
    { "ABSENT",    TFMT_BOLD },
    { "NOT_HOMED", TFMT_BOLD },
    { "HOMING",    TFMT_BOLD },
    { "LIMITING",  TFMT_BOLD },
    { "READY",     TFMT_BOLD },
};

const StateLabel coverStateLabels[] = {
    { "ABSENT",  TFMT_RED TFMT_BOLD },
    { "IDLE",    TFMT_BOLD },
    { "OPENING", TFMT_YELLOW TFMT_BOLD },
    { "CLOSING", TFMT_YELLOW TFMT_BOLD },
    { "OPEN",    TFMT_GREEN TFMT_BOLD },
    { "CLOSED",  TFMT_RED TFMT_BOLD },
};

const StateLabel roofStateLabels[] = {
    { "ABSENT",  TFMT_RED TFMT_BOLD },
    { "UNKNOWN", TFMT_RED TFMT_BOLD },
    { "OPENING", TFMT_YELLOW TFMT_BOLD },
    { "CLOSING", TFMT_YELLOW TFMT_BOLD },
    { "OPEN",    TFMT_GREEN TFMT_BOLD },
    { "CLOSED",  TFMT_RED TFMT_BOLD },
};

template <size_t N>
std::string label(const StateLabel (&labels)[N], int code, bool formatting, const char *unknownFormat)
{
    bool known = code >= 0 && static_cast<size_t>(code) < N;
    if (!formatting)
        return known ? labels[code].label : "UNKNOWN";

    if (!known)
        return std::string(unknownFormat) + "UNKNOWN" + TFMT_CLEAR;
    return std::string(labels[code].format) + labels[code].label + TFMT_CLEAR;
}

template <size_t N>
bool inRange(const StateLabel (&)[N], int32_t code)
{
    return code >= 0 && static_cast<size_t>(code) < N;
}

const std::map<int, const char *> &commandMessages()
{
    static const std::map<int, const char *> messages = {
        // General error codes
        { STATUS_FAILED, "error: command failed" },
        { STATUS_BLOCKED, "error: another command is already running" },
        { STATUS_INVALID_CONTROL_IP, "error: command not accepted from this IP" },
        { STATUS_CANNOT_COMMUNICATE_WITH_SECURITY_SYSTEM, "error: telescope failed to communicate with security system daemon" },
        { STATUS_SECURITY_SYSTEM_TRIPPED, "error: hard limits (security system) have been tripped" },

        // Command-specific codes
        { STATUS_TELESCOPE_NOT_INITIALIZED, "error: telescope has not been initialized" },
        { STATUS_TELESCOPE_NOT_HOMED, "error: telescope has not been homed" },
        { STATUS_TELESCOPE_NOT_STOPPED, "error: telescope is not stopped" },
        { STATUS_TELESCOPE_NOT_UNINITIALIZED, "error: telescope has already been initialized" },

        { STATUS_OUTSIDE_HA_LIMITS, "error: requested coordinates outside HA limits" },
        { STATUS_OUTSIDE_DEC_LIMITS, "error: requested coordinates outside Dec limits" },

        // client side codes
        { STATUS_TERMINATED_BY_USER, "error: terminated by user" },
        { STATUS_CANNOT_COMMUNICATE_WITH_TELESCOPE, "error: unable to communicate with telescope daemon" },
        { STATUS_COMMAND_NOT_AVAILABLE, "error: command not available for this telescope" },
        { STATUS_CANNOT_COMMUNICATE_WITH_PIPELINE, "error: unable to communicate with data pipeline daemon" },
    };
    return messages;
}

}

TelState talon::telStateFromCode(int32_t code)
{
    return inRange(telStateLabels, code) ? static_cast<TelState>(code) : TEL_UNKNOWN;
}

CoverState talon::coverStateFromCode(int32_t code)
{
    return inRange(coverStateLabels, code) ? static_cast<CoverState>(code) : COVER_UNKNOWN;
}

RoofState talon::roofStateFromCode(int32_t code)
{
    return inRange(roofStateLabels, code) ? static_cast<RoofState>(code) : ROOF_UNKNOWN;
}

FocusState talon::focusStateFromFlags(uint16_t flags)
{
    if (!(flags & AXIS_HAVE))
        return FOCUS_ABSENT;
    if (flags & AXIS_LIMITING)
        return FOCUS_LIMITING;
    if (flags & AXIS_HOMING)
        return FOCUS_HOMING;
    if (!(flags & AXIS_ISHOMED))
        return FOCUS_NOT_HOMED;
    return FOCUS_READY;
}

std::string talon::telStateLabel(int code, bool formatting)
{
    return label(telStateLabels, code, formatting, TFMT_RED TFMT_BOLD);
}

std::string talon::focusStateLabel(int code, bool formatting)
{
    return label(focusStateLabels, code, formatting, TFMT_BOLD);
}

std::string talon::coverStateLabel(int code, bool formatting)
{
    return label(coverStateLabels, code, formatting, TFMT_RED TFMT_BOLD);
}

std::string talon::roofStateLabel(int code, bool formatting)
{
    return label(roofStateLabels, code, formatting, TFMT_RED TFMT_BOLD);
}

std::string talon::commandStatusMessage(int code)
{
    const std::map<int, const char *> &messages = commandMessages();
    std::map<int, const char *>::const_iterator it = messages.find(code);
    if (it != messages.end())
        return it->second;

    std::ostringstream os;
    os << "error: Unknown error code " << code;
    return os.str();
}

CommandStatus talon::readinessStatus(const TelescopeSnapshot &snapshot)
{
    if (snapshot.telState == TEL_ABSENT || snapshot.telState == TEL_UNKNOWN)
        return STATUS_TELESCOPE_NOT_INITIALIZED;

    for (int i = AXIS_RA; i <= AXIS_DEC; i++) {
        FocusState s = snapshot.axes[i].state;
        if (s == FOCUS_ABSENT || s == FOCUS_NOT_HOMED || s == FOCUS_HOMING)
            return STATUS_TELESCOPE_NOT_HOMED;
    }
    return STATUS_SUCCEEDED;
}
