/*
 * Talon status vocabulary
 *
 * State enums exported by talon, the focus state built from its motor
 * flags, and the numeric command status codes returned to clients.
 */

#ifndef __TALON_STATUS_H__
#define __TALON_STATUS_H__

#include <cstdint>
#include <string>

namespace talon
{

struct TelescopeSnapshot;

// ANSI terminal formatting
#define TFMT_BOLD     "\033[1m"
#define TFMT_RED      "\033[31m"
#define TFMT_GREEN    "\033[32m"
#define TFMT_YELLOW   "\033[33m"
#define TFMT_CLEAR    "\033[0m"

/** Talon TelState enum. */
enum TelState
{
    TEL_UNKNOWN = -1,
    TEL_ABSENT = 0,
    TEL_STOPPED,
    TEL_HUNTING,
    TEL_TRACKING,
    TEL_SLEWING,
    TEL_HOMING,
    TEL_LIMITING
};

/** Axis state built from talon motor flags. */
enum FocusState
{
    FOCUS_UNKNOWN = -1,
    FOCUS_ABSENT = 0,
    FOCUS_NOT_HOMED,
    FOCUS_HOMING,
    FOCUS_LIMITING,
    FOCUS_READY
};

/** Talon CoverState enum. */
enum CoverState
{
    COVER_UNKNOWN = -1,
    COVER_ABSENT = 0,
    COVER_IDLE,
    COVER_OPENING,
    COVER_CLOSING,
    COVER_OPEN,
    COVER_CLOSED
};

/** Talon DShState enum. Code 1 is talon's "idle", labelled UNKNOWN. */
enum RoofState
{
    ROOF_UNKNOWN = -1,
    ROOF_ABSENT = 0,
    ROOF_IDLE,
    ROOF_OPENING,
    ROOF_CLOSING,
    ROOF_OPEN,
    ROOF_CLOSED
};

// MotorInfo bitfields following the axis address byte, LSB first
#define AXIS_HAVE       0x0001
#define AXIS_HAVEENC    0x0002
#define AXIS_ENCHOME    0x0004
#define AXIS_HAVELIM    0x0008
#define AXIS_POSSIDE    0x0010
#define AXIS_HOMELOW    0x0020
#define AXIS_ISHOMED    0x0040
#define AXIS_HOMING     0x0080
#define AXIS_LIMITING   0x0100

/**
 * Exact match of a raw talon code; anything else becomes *_UNKNOWN.
 */
TelState telStateFromCode(int32_t code);
CoverState coverStateFromCode(int32_t code);
RoofState roofStateFromCode(int32_t code);

/**
 * Builds an axis state from the MotorInfo flag word.
 */
FocusState focusStateFromFlags(uint16_t flags);

/**
 * Returns a human readable string describing a status. With formatting
 * set, the label is wrapped in terminal formatting characters. Codes
 * outside the enum give "UNKNOWN".
 */
std::string telStateLabel(int code, bool formatting = false);
std::string focusStateLabel(int code, bool formatting = false);
std::string coverStateLabel(int code, bool formatting = false);
std::string roofStateLabel(int code, bool formatting = false);

/** Numeric return codes */
enum CommandStatus
{
    // General error codes
    STATUS_SUCCEEDED = 0,
    STATUS_FAILED = 1,
    STATUS_BLOCKED = 2,

    STATUS_INVALID_CONTROL_IP = 5,
    STATUS_CANNOT_COMMUNICATE_WITH_SECURITY_SYSTEM = 6,
    STATUS_SECURITY_SYSTEM_TRIPPED = 7,

    // Command-specific codes
    STATUS_TELESCOPE_NOT_INITIALIZED = 10,
    STATUS_TELESCOPE_NOT_HOMED = 11,
    STATUS_TELESCOPE_NOT_STOPPED = 12,
    STATUS_TELESCOPE_NOT_UNINITIALIZED = 14,

    STATUS_OUTSIDE_HA_LIMITS = 20,
    STATUS_OUTSIDE_DEC_LIMITS = 21,

    // client side codes
    STATUS_TERMINATED_BY_USER = -100,
    STATUS_CANNOT_COMMUNICATE_WITH_TELESCOPE = -101,
    STATUS_COMMAND_NOT_AVAILABLE = -102,
    STATUS_CANNOT_COMMUNICATE_WITH_PIPELINE = -103
};

std::string commandStatusMessage(int code);

/**
 * Precondition check used before accepting a telescope command.
 *
 * @return STATUS_TELESCOPE_NOT_INITIALIZED when talon reports no telescope,
 *         STATUS_TELESCOPE_NOT_HOMED when RA or Dec has not been homed,
 *         STATUS_SUCCEEDED otherwise
 */
CommandStatus readinessStatus(const TelescopeSnapshot &snapshot);

}

#endif // __TALON_STATUS_H__
