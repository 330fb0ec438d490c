// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "filterreactor/IoRegistry.hpp"

using namespace FilterReactor;

namespace {

SideIoDescriptor side(const QString& name, double height = 0.5, double diameter = 2.0)
{
    SideIoDescriptor d;
    d.name = name;
    d.heightFraction = height;
    d.diameter = diameter;
    return d;
}

TopInletDescriptor inlet(const QString& name, TopInletKind kind = TopInletKind::Custom)
{
    TopInletDescriptor d;
    d.name = name;
    d.kind = kind;
    d.diameter = 3.0;
    d.length = 8.0;
    d.wallThickness = 0.8;
    return d;
}

const QString kDefault = QString::fromLatin1(kDefaultOutputName);

} // namespace

TEST(IoRegistryTests, StartsWithOnlyTheDefaultOutput)
{
    IoRegistry io;

    EXPECT_EQ(io.rowCount(), 1);
    EXPECT_EQ(io.count(IoKind::SideOutput), 1);
    EXPECT_EQ(io.count(IoKind::SideInput), 0);
    EXPECT_EQ(io.defaultOutput().name, kDefault);
    EXPECT_DOUBLE_EQ(io.defaultOutput().heightFraction, kDefaultOutputHeightFraction);

    const auto rows = io.rows();
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].typeLabel, QStringLiteral("Default output"));
    EXPECT_FALSE(rows[0].selectable);
}

TEST(IoRegistryTests, NewNameAddsExactlyOneEntry)
{
    IoRegistry io;

    bool inserted = false;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1")), &inserted).ok());
    EXPECT_TRUE(inserted);
    EXPECT_EQ(io.count(IoKind::SideInput), 1);

    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in2")), &inserted).ok());
    EXPECT_TRUE(inserted);
    EXPECT_EQ(io.count(IoKind::SideInput), 2);
    EXPECT_EQ(io.rowCount(), 3);
}

TEST(IoRegistryTests, ExistingNameReplacesInPlace)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1"), 0.2)).ok());
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideOutput, side(QStringLiteral("out1"))).ok());

    bool inserted = true;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1"), 0.9, 3.0), &inserted).ok());
    EXPECT_FALSE(inserted);
    EXPECT_EQ(io.count(IoKind::SideInput), 1);

    const IoEntry* e = io.find(IoKind::SideInput, QStringLiteral("in1"));
    ASSERT_NE(e, nullptr);
    EXPECT_DOUBLE_EQ(std::get<SideIoDescriptor>(e->descriptor).heightFraction, 0.9);
    EXPECT_DOUBLE_EQ(std::get<SideIoDescriptor>(e->descriptor).diameter, 3.0);

    // The updated row keeps its place.
    const auto rows = io.rows();
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[1].name, QStringLiteral("in1"));
    EXPECT_EQ(rows[2].name, QStringLiteral("out1"));
}

TEST(IoRegistryTests, SameNameInDifferentKindsIsDistinct)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("port"))).ok());
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideOutput, side(QStringLiteral("port"))).ok());

    EXPECT_EQ(io.rowCount(), 3);
    EXPECT_TRUE(io.contains(IoKind::SideInput, QStringLiteral("port")));
    EXPECT_TRUE(io.contains(IoKind::SideOutput, QStringLiteral("port")));
    EXPECT_FALSE(io.contains(IoKind::TopInlet, QStringLiteral("port")));
}

TEST(IoRegistryTests, UpdateKeepsConnectedFlag)
{
    IoRegistry io;
    SideIoDescriptor connected = side(QStringLiteral("in1"));
    connected.connected = true;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, connected).ok());

    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1"), 0.7)).ok());

    const auto rows = io.rows();
    EXPECT_TRUE(rows[1].connected);
    EXPECT_EQ(rows[1].connectionLabel, QStringLiteral("Connected"));
}

TEST(IoRegistryTests, RejectsInvalidDescriptors)
{
    IoRegistry io;

    EXPECT_EQ(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("   "))).code(),
              ReactorErrorCode::InvalidArgument);
    EXPECT_EQ(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("hi"), 1.5)).code(),
              ReactorErrorCode::InvalidArgument);
    EXPECT_EQ(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("thin"), 0.5, 0.0)).code(),
              ReactorErrorCode::InvalidArgument);
    EXPECT_EQ(io.addOrUpdate(IoKind::TopInlet, side(QStringLiteral("mismatch"))).code(),
              ReactorErrorCode::InvalidArgument);
    EXPECT_EQ(io.addOrUpdate(IoKind::SideInput, inlet(QStringLiteral("mismatch"))).code(),
              ReactorErrorCode::InvalidArgument);

    TopInletDescriptor bad = inlet(QStringLiteral("bad"));
    bad.wallThickness = 0.0;
    EXPECT_EQ(io.addOrUpdate(IoKind::TopInlet, bad).code(), ReactorErrorCode::InvalidArgument);

    EXPECT_EQ(io.rowCount(), 1);
}

TEST(IoRegistryTests, NamesAreTrimmed)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("  in1 "))).ok());
    EXPECT_TRUE(io.contains(IoKind::SideInput, QStringLiteral("in1")));
}

TEST(IoRegistryTests, LuerInletsUseStandardDimensions)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::TopInlet, inlet(QStringLiteral("luer"), TopInletKind::Luer)).ok());

    const IoEntry* e = io.find(IoKind::TopInlet, QStringLiteral("luer"));
    ASSERT_NE(e, nullptr);
    const auto& d = std::get<TopInletDescriptor>(e->descriptor);
    EXPECT_DOUBLE_EQ(d.diameter, kLuerDiameter);
    EXPECT_DOUBLE_EQ(d.length, kLuerLength);
    EXPECT_DOUBLE_EQ(d.wallThickness, kLuerWallThickness);

    EXPECT_EQ(io.rows().back().typeLabel, QStringLiteral("Luer top inlet"));
}

TEST(IoRegistryTests, DefaultOutputCannotBeEditedOrDeleted)
{
    IoRegistry io;

    EXPECT_EQ(io.addOrUpdate(IoKind::SideOutput, side(kDefault, 0.9)).code(), ReactorErrorCode::InvalidArgument);
    EXPECT_DOUBLE_EQ(io.defaultOutput().heightFraction, kDefaultOutputHeightFraction);

    EXPECT_EQ(io.remove(IoKind::SideOutput, kDefault).code(), ReactorErrorCode::InvalidArgument);
    EXPECT_FALSE(io.select(IoKind::SideOutput, kDefault));
    EXPECT_EQ(io.removeSelected().code(), ReactorErrorCode::Selection);
    EXPECT_EQ(io.rowCount(), 1);

    // A same-named input is an ordinary entry.
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(kDefault)).ok());
    EXPECT_TRUE(io.remove(IoKind::SideInput, kDefault).ok());
}

TEST(IoRegistryTests, DeleteHappensExactlyOnce)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideOutput, side(QStringLiteral("out1"))).ok());

    EXPECT_TRUE(io.remove(IoKind::SideOutput, QStringLiteral("out1")).ok());
    EXPECT_EQ(io.remove(IoKind::SideOutput, QStringLiteral("out1")).code(), ReactorErrorCode::Selection);
    EXPECT_EQ(io.count(IoKind::SideOutput), 1);
}

TEST(IoRegistryTests, RemoveSelected)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::TopInlet, inlet(QStringLiteral("t1"))).ok());

    EXPECT_EQ(io.removeSelected().code(), ReactorErrorCode::Selection);

    ASSERT_TRUE(io.select(IoKind::TopInlet, QStringLiteral("t1")));
    IoKey removed;
    ASSERT_TRUE(io.removeSelected(&removed).ok());
    EXPECT_EQ(removed, (IoKey{IoKind::TopInlet, QStringLiteral("t1")}));
    EXPECT_FALSE(io.selection().has_value());

    const ReactorError again = io.removeSelected();
    EXPECT_EQ(again.code(), ReactorErrorCode::Selection);
    EXPECT_EQ(again.message(), QStringLiteral("No I/O selected, can't delete."));
}

TEST(IoRegistryTests, SelectingMissingEntryClearsSelection)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1"))).ok());
    ASSERT_TRUE(io.select(IoKind::SideInput, QStringLiteral("in1")));

    EXPECT_FALSE(io.select(IoKind::SideInput, QStringLiteral("nope")));
    EXPECT_FALSE(io.selection().has_value());
}

TEST(IoRegistryTests, RowsFollowInsertionOrderAcrossKinds)
{
    IoRegistry io;
    ASSERT_TRUE(io.addOrUpdate(IoKind::TopInlet, inlet(QStringLiteral("t1"))).ok());
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1"))).ok());
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideOutput, side(QStringLiteral("out1"))).ok());

    const auto rows = io.rows();
    ASSERT_EQ(rows.size(), 4);
    EXPECT_EQ(rows[0].name, kDefault);
    EXPECT_EQ(rows[1].typeLabel, QStringLiteral("Custom top inlet"));
    EXPECT_EQ(rows[2].typeLabel, QStringLiteral("Side input"));
    EXPECT_EQ(rows[3].typeLabel, QStringLiteral("Side output"));
    EXPECT_EQ(rows[3].connectionLabel, QStringLiteral("Not connected"));
}

TEST(IoRegistryTests, ClearKeepsDefaultOutput)
{
    IoRegistry io;
    SideIoDescriptor def = side(kDefault, 0.1, 5.0);
    io.setDefaultOutput(def);
    ASSERT_TRUE(io.addOrUpdate(IoKind::SideInput, side(QStringLiteral("in1"))).ok());
    ASSERT_TRUE(io.select(IoKind::SideInput, QStringLiteral("in1")));

    io.clear();

    EXPECT_EQ(io.rowCount(), 1);
    EXPECT_FALSE(io.selection().has_value());
    EXPECT_DOUBLE_EQ(io.defaultOutput().diameter, 5.0);
}
