#include "talon-layout.h"

#include <gtest/gtest.h>

#include <cstring>

using namespace talon;

TEST(LayoutTable, FieldsListedInIdOrder)
{
    const LayoutVariant variants[] = { LAYOUT_LEGACY, LAYOUT_COMPACT };
    for (LayoutVariant variant : variants) {
        const LayoutTable &layout = layoutFor(variant);
        for (int i = 0; i < FIELD_COUNT; i++) {
            FieldId id = static_cast<FieldId>(i);
            EXPECT_EQ(id, layout.field(id).id) << layout.getName() << " " << fieldName(id);
            EXPECT_STREQ(fieldName(id), layout.field(id).name);
        }
    }
}

TEST(LayoutTable, LegacyOffsets)
{
    const LayoutTable &layout = layoutFor(LAYOUT_LEGACY);
    EXPECT_EQ(LAYOUT_LEGACY, layout.getVariant());
    EXPECT_STREQ("legacy", layout.getName());

    EXPECT_EQ(0u, layout.field(FIELD_MJD).offset);
    EXPECT_EQ(8u, layout.field(FIELD_LATITUDE).offset);
    EXPECT_EQ(16u, layout.field(FIELD_LONGITUDE).offset);
    EXPECT_EQ(48u, layout.field(FIELD_ELEVATION).offset);
    EXPECT_EQ(88u, layout.field(FIELD_RA_J2000).offset);
    EXPECT_EQ(96u, layout.field(FIELD_DEC_J2000).offset);
    EXPECT_EQ(152u, layout.field(FIELD_LST).offset);
    EXPECT_EQ(808u, layout.field(FIELD_TEL_STATE).offset);
    EXPECT_EQ(820u, layout.field(FIELD_ROOF_STATE).offset);
    EXPECT_EQ(824u, layout.field(FIELD_COVER_STATE).offset);
    EXPECT_EQ(840u, layout.field(FIELD_PID).offset);

    // minfo[] at 256, 120 byte records, focus is record 3
    EXPECT_EQ(257u, layout.field(FIELD_RA_FLAGS).offset);
    EXPECT_EQ(256u + 56, layout.field(FIELD_RA_POS_LIM).offset);
    EXPECT_EQ(256u + 120 + 1, layout.field(FIELD_DEC_FLAGS).offset);
    EXPECT_EQ(256u + 360 + 96, layout.field(FIELD_FOCUS_CPOS).offset);

    EXPECT_EQ(KIND_INT32, layout.field(FIELD_TEL_STATE).kind);
    EXPECT_EQ(KIND_UINT16, layout.field(FIELD_FOCUS_FLAGS).kind);

    for (int i = 0; i < FIELD_COUNT; i++)
        EXPECT_TRUE(layout.has(static_cast<FieldId>(i)));

    EXPECT_EQ(844u, layout.requiredSize());
}

TEST(LayoutTable, CompactOffsets)
{
    const LayoutTable &layout = layoutFor(LAYOUT_COMPACT);
    EXPECT_EQ(LAYOUT_COMPACT, layout.getVariant());

    EXPECT_EQ(920u, layout.field(FIELD_TEL_STATE).offset);
    EXPECT_EQ(976u, layout.field(FIELD_COVER_STATE).offset);
    EXPECT_EQ(249u, layout.field(FIELD_RA_FLAGS).offset);
    EXPECT_EQ(248u + 360 + 1, layout.field(FIELD_FOCUS_FLAGS).offset);

    EXPECT_FALSE(layout.has(FIELD_PID));
    EXPECT_FALSE(layout.has(FIELD_LST));
    EXPECT_FALSE(layout.has(FIELD_ROOF_STATE));
    EXPECT_FALSE(layout.has(FIELD_HEARTBEAT_REMAINING));
    EXPECT_TRUE(layout.has(FIELD_MJD));
    EXPECT_TRUE(layout.has(FIELD_COVER_STATE));

    EXPECT_EQ(980u, layout.requiredSize());
}

TEST(LayoutTable, PresentFieldsDoNotOverlap)
{
    const LayoutVariant variants[] = { LAYOUT_LEGACY, LAYOUT_COMPACT };
    for (LayoutVariant variant : variants) {
        const LayoutTable &layout = layoutFor(variant);
        for (int i = 0; i < FIELD_COUNT; i++) {
            const FieldOffset &a = layout.field(static_cast<FieldId>(i));
            if (!a.present)
                continue;
            for (int j = i + 1; j < FIELD_COUNT; j++) {
                const FieldOffset &b = layout.field(static_cast<FieldId>(j));
                if (!b.present)
                    continue;
                bool disjoint = a.offset + kindWidth(a.kind) <= b.offset
                    || b.offset + kindWidth(b.kind) <= a.offset;
                EXPECT_TRUE(disjoint) << layout.getName() << ": " << a.name << " overlaps " << b.name;
            }
        }
    }
}

TEST(LayoutVariant, ParseNames)
{
    LayoutVariant variant = LAYOUT_LEGACY;
    EXPECT_TRUE(parseLayoutVariant("compact", variant));
    EXPECT_EQ(LAYOUT_COMPACT, variant);
    EXPECT_TRUE(parseLayoutVariant("legacy", variant));
    EXPECT_EQ(LAYOUT_LEGACY, variant);

    variant = LAYOUT_COMPACT;
    EXPECT_FALSE(parseLayoutVariant("Legacy", variant));
    EXPECT_FALSE(parseLayoutVariant("", variant));
    EXPECT_EQ(LAYOUT_COMPACT, variant);

    EXPECT_STREQ("compact", layoutVariantName(LAYOUT_COMPACT));
}

TEST(LayoutTable, KindWidths)
{
    EXPECT_EQ(8u, kindWidth(KIND_DOUBLE));
    EXPECT_EQ(4u, kindWidth(KIND_INT32));
    EXPECT_EQ(2u, kindWidth(KIND_UINT16));
    EXPECT_STREQ("UNKNOWN", fieldName(FIELD_COUNT));
}

TEST(LayoutTable, AngleUnits)
{
    const LayoutTable &legacy = layoutFor(LAYOUT_LEGACY);
    const LayoutTable &compact = layoutFor(LAYOUT_COMPACT);
    EXPECT_EQ(ANGLE_RADIANS, legacy.getAngleUnit());
    EXPECT_EQ(ANGLE_RADIANS, compact.getAngleUnit());

    EXPECT_NEAR(180.0, legacy.toDegrees(3.14159265358979323846), 1e-12);
    EXPECT_NEAR(-90.0, compact.toDegrees(-1.57079632679489661923), 1e-12);
    EXPECT_DOUBLE_EQ(0.0, legacy.toDegrees(0.0));
}
