#include "talon-status.h"
#include "talon-data.h"

#include <gtest/gtest.h>

using namespace talon;

TEST(TelState, Labels)
{
    EXPECT_EQ("DISABLED", telStateLabel(TEL_ABSENT));
    EXPECT_EQ("TRACKING", telStateLabel(TEL_TRACKING));
    EXPECT_EQ("LIMITING", telStateLabel(TEL_LIMITING));
    EXPECT_EQ("UNKNOWN", telStateLabel(TEL_UNKNOWN));
    EXPECT_EQ("UNKNOWN", telStateLabel(42));
}

TEST(TelState, FormattedLabels)
{
    EXPECT_EQ("\033[32m\033[1mTRACKING\033[0m", telStateLabel(TEL_TRACKING, true));
    EXPECT_EQ("\033[31m\033[1mSTOPPED\033[0m", telStateLabel(TEL_STOPPED, true));
    EXPECT_EQ("\033[33m\033[1mSLEWING\033[0m", telStateLabel(TEL_SLEWING, true));
    EXPECT_EQ("\033[31m\033[1mUNKNOWN\033[0m", telStateLabel(-5, true));
}

TEST(TelState, FromCode)
{
    EXPECT_EQ(TEL_ABSENT, telStateFromCode(0));
    EXPECT_EQ(TEL_HUNTING, telStateFromCode(2));
    EXPECT_EQ(TEL_LIMITING, telStateFromCode(6));
    EXPECT_EQ(TEL_UNKNOWN, telStateFromCode(7));
    EXPECT_EQ(TEL_UNKNOWN, telStateFromCode(-1));
}

TEST(CoverState, LabelsAndCodes)
{
    EXPECT_EQ(COVER_OPEN, coverStateFromCode(4));
    EXPECT_EQ(COVER_UNKNOWN, coverStateFromCode(6));
    EXPECT_EQ("CLOSED", coverStateLabel(COVER_CLOSED));
    EXPECT_EQ("\033[1mIDLE\033[0m", coverStateLabel(COVER_IDLE, true));
    EXPECT_EQ("\033[32m\033[1mOPEN\033[0m", coverStateLabel(COVER_OPEN, true));
}

TEST(RoofState, IdleIsLabelledUnknown)
{
    EXPECT_EQ(ROOF_IDLE, roofStateFromCode(1));
    EXPECT_EQ("UNKNOWN", roofStateLabel(ROOF_IDLE));
    EXPECT_EQ("OPENING", roofStateLabel(ROOF_OPENING));
    EXPECT_EQ(ROOF_UNKNOWN, roofStateFromCode(100));
}

TEST(FocusState, FormatsBoldOnly)
{
    EXPECT_EQ("\033[1mREADY\033[0m", focusStateLabel(FOCUS_READY, true));
    EXPECT_EQ("\033[1mUNKNOWN\033[0m", focusStateLabel(17, true));
    EXPECT_EQ("NOT_HOMED", focusStateLabel(FOCUS_NOT_HOMED));
}

TEST(FocusState, FromFlags)
{
    EXPECT_EQ(FOCUS_ABSENT, focusStateFromFlags(0));
    EXPECT_EQ(FOCUS_ABSENT, focusStateFromFlags(AXIS_ISHOMED | AXIS_LIMITING));
    EXPECT_EQ(FOCUS_NOT_HOMED, focusStateFromFlags(AXIS_HAVE | AXIS_HAVEENC | AXIS_HAVELIM));
    EXPECT_EQ(FOCUS_HOMING, focusStateFromFlags(AXIS_HAVE | AXIS_HOMING));
    EXPECT_EQ(FOCUS_LIMITING, focusStateFromFlags(AXIS_HAVE | AXIS_HOMING | AXIS_LIMITING));
    EXPECT_EQ(FOCUS_READY, focusStateFromFlags(AXIS_HAVE | AXIS_ISHOMED));
    EXPECT_EQ(FOCUS_HOMING, focusStateFromFlags(AXIS_HAVE | AXIS_ISHOMED | AXIS_HOMING));
}

TEST(CommandStatus, Messages)
{
    EXPECT_EQ("error: telescope has not been homed", commandStatusMessage(STATUS_TELESCOPE_NOT_HOMED));
    EXPECT_EQ("error: command not available for this telescope", commandStatusMessage(-102));
    EXPECT_EQ("error: requested coordinates outside Dec limits", commandStatusMessage(21));
    EXPECT_EQ("error: Unknown error code 999", commandStatusMessage(999));
    EXPECT_EQ("error: Unknown error code 0", commandStatusMessage(STATUS_SUCCEEDED));
    EXPECT_EQ("error: Unknown error code -7", commandStatusMessage(-7));
}

TEST(CommandStatus, Readiness)
{
    TelescopeSnapshot s;
    EXPECT_EQ(STATUS_TELESCOPE_NOT_INITIALIZED, readinessStatus(s));

    s.telState = TEL_UNKNOWN;
    EXPECT_EQ(STATUS_TELESCOPE_NOT_INITIALIZED, readinessStatus(s));

    s.telState = TEL_STOPPED;
    s.axes[AXIS_RA].state = FOCUS_READY;
    s.axes[AXIS_DEC].state = FOCUS_NOT_HOMED;
    EXPECT_EQ(STATUS_TELESCOPE_NOT_HOMED, readinessStatus(s));

    s.axes[AXIS_DEC].state = FOCUS_READY;
    EXPECT_EQ(STATUS_SUCCEEDED, readinessStatus(s));

    // the focuser does not gate telescope commands
    s.axes[AXIS_FOCUS].state = FOCUS_NOT_HOMED;
    EXPECT_EQ(STATUS_SUCCEEDED, readinessStatus(s));
}

TEST(TelescopeSnapshot, DefaultReportsNothingPresent)
{
    TelescopeSnapshot s;
    EXPECT_EQ("DISABLED", telStateLabel(s.telState));
    EXPECT_EQ("ABSENT", coverStateLabel(s.coverState));
    EXPECT_EQ("ABSENT", roofStateLabel(s.roofState));
    for (int i = 0; i < AXIS_COUNT; i++)
        EXPECT_EQ("ABSENT", focusStateLabel(s.axes[i].state)) << i;
    EXPECT_TRUE(s.present.none());
}
