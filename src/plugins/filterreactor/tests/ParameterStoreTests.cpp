// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "filterreactor/ParameterStore.hpp"

#include <QtTest/QSignalSpy>

using namespace FilterReactor;

namespace {

QVariant token(const char* t)
{
    return QVariant(QString::fromLatin1(t));
}

} // namespace

TEST(ParameterStoreTests, StartsFromGivenDefaults)
{
    ReactorParameters defaults;
    defaults.volume = 35.0;
    defaults.bottomType = BottomType::Conical;

    ParameterStore store(defaults);
    EXPECT_EQ(store.read(), defaults);
    EXPECT_FALSE(store.availability().pipeDiameter);
    EXPECT_FALSE(store.availability().radius);
}

TEST(ParameterStoreTests, ThreadedDefaultsAreForcedConstrained)
{
    ReactorParameters defaults;
    defaults.topType = TopType::Gl32;
    defaults.radiusConstrained = false;

    ParameterStore store(defaults);
    EXPECT_TRUE(store.read().radiusConstrained);
    EXPECT_TRUE(store.availability().radiusConstrainedForced);
}

TEST(ParameterStoreTests, NumericFieldsAreRangeChecked)
{
    ParameterStore store;

    EXPECT_TRUE(store.setField(ReactorField::Volume, 120.0));
    EXPECT_DOUBLE_EQ(store.read().volume, 120.0);

    EXPECT_FALSE(store.setField(ReactorField::Volume, 0.0));
    EXPECT_FALSE(store.setField(ReactorField::Volume, 200.5));
    EXPECT_FALSE(store.setField(ReactorField::Volume, QStringLiteral("lots")));
    EXPECT_DOUBLE_EQ(store.read().volume, 120.0);

    EXPECT_TRUE(store.setField(ReactorField::FilterHeight, 1000.0));
    EXPECT_FALSE(store.setField(ReactorField::FilterDiameter, 201.0));
    EXPECT_FALSE(store.setField(ReactorField::PipeDiameter, 100.0));
    EXPECT_TRUE(store.setField(ReactorField::PipeDiameter, 99.99));
}

TEST(ParameterStoreTests, EnumFieldsTakeTokens)
{
    ParameterStore store;

    EXPECT_TRUE(store.setField(ReactorField::BottomType, token("tapered")));
    EXPECT_EQ(store.read().bottomType, BottomType::Tapered);

    EXPECT_TRUE(store.setField(ReactorField::AlignTopStrategy, token("lift")));
    EXPECT_EQ(store.read().alignTopStrategy, AlignTopStrategy::Lift);

    EXPECT_TRUE(store.setField(ReactorField::AlignFilterStrategy, token("lift")));
    EXPECT_EQ(store.read().alignFilterStrategy, AlignFilterStrategy::Lift);

    const Utils::Result r = store.setField(ReactorField::TopType, token("Expand body"));
    EXPECT_FALSE(r);
    EXPECT_FALSE(r.errors.isEmpty());
    EXPECT_EQ(store.read().topType, TopType::Simple);
}

TEST(ParameterStoreTests, RoundBottomIsRejected)
{
    ParameterStore store;
    EXPECT_FALSE(store.setField(ReactorField::BottomType, token("round")));
    EXPECT_EQ(store.read().bottomType, BottomType::Flat);
}

TEST(ParameterStoreTests, RefusesFieldsThatAreNotEditable)
{
    ParameterStore store;

    // Radius needs the constraint first.
    EXPECT_FALSE(store.setField(ReactorField::Radius, 10.0));
    EXPECT_FALSE(store.read().radius.has_value());

    ASSERT_TRUE(store.setField(ReactorField::RadiusConstrained, true));
    EXPECT_TRUE(store.setField(ReactorField::Radius, 10.0));
    EXPECT_EQ(store.read().radius, std::optional<double>(10.0));

    ASSERT_TRUE(store.setField(ReactorField::BottomType, token("conical")));
    EXPECT_FALSE(store.setField(ReactorField::PipeDiameter, 3.0));
    EXPECT_DOUBLE_EQ(store.read().pipeDiameter, kDefaultPipeDiameter);

    ASSERT_TRUE(store.setField(ReactorField::TopType, token("gl45")));
    EXPECT_FALSE(store.setField(ReactorField::RadiusConstrained, false));
    EXPECT_FALSE(store.setField(ReactorField::Radius, 4.0));
    EXPECT_TRUE(store.read().radiusConstrained);
}

TEST(ParameterStoreTests, RadiusConstrainedNeedsABool)
{
    ParameterStore store;
    EXPECT_FALSE(store.setField(ReactorField::RadiusConstrained, 1));
    EXPECT_FALSE(store.read().radiusConstrained);
}

TEST(ParameterStoreTests, InvalidVariantClearsRadius)
{
    ParameterStore store;
    ASSERT_TRUE(store.setField(ReactorField::RadiusConstrained, true));
    ASSERT_TRUE(store.setField(ReactorField::Radius, 7.5));

    EXPECT_TRUE(store.setField(ReactorField::Radius, QVariant()));
    EXPECT_FALSE(store.read().radius.has_value());
}

TEST(ParameterStoreTests, ThreadedTopCascadesBeforeAvailability)
{
    ParameterStore store;

    QStringList order;
    QObject::connect(&store, &ParameterStore::fieldChanged, [&order](ReactorField f) {
        order.push_back(f == ReactorField::TopType ? QStringLiteral("top")
                        : f == ReactorField::RadiusConstrained ? QStringLiteral("constrained")
                                                               : QStringLiteral("other"));
    });
    QObject::connect(&store, &ParameterStore::availabilityChanged, [&order](const FieldAvailability&) {
        order.push_back(QStringLiteral("availability"));
    });
    QSignalSpy availabilitySpy(&store, &ParameterStore::availabilityChanged);

    ASSERT_TRUE(store.setField(ReactorField::TopType, token("gl18")));

    EXPECT_EQ(order, (QStringList{QStringLiteral("top"), QStringLiteral("constrained"),
                                  QStringLiteral("availability")}));
    ASSERT_EQ(availabilitySpy.count(), 1);
    const auto a = availabilitySpy.at(0).at(0).value<FieldAvailability>();
    EXPECT_FALSE(a.radius);
    EXPECT_TRUE(a.radiusConstrainedForced);
    EXPECT_TRUE(store.read().radiusConstrained);
}

TEST(ParameterStoreTests, SignalsOnlyOnChange)
{
    ParameterStore store;
    QSignalSpy fieldSpy(&store, &ParameterStore::fieldChanged);
    QSignalSpy availabilitySpy(&store, &ParameterStore::availabilityChanged);

    ASSERT_TRUE(store.setField(ReactorField::Volume, kDefaultVolume));
    EXPECT_EQ(fieldSpy.count(), 0);

    ASSERT_TRUE(store.setField(ReactorField::Volume, 42.0));
    EXPECT_EQ(fieldSpy.count(), 1);
    EXPECT_EQ(availabilitySpy.count(), 0);

    ASSERT_TRUE(store.setField(ReactorField::TopType, token("custom")));
    EXPECT_EQ(fieldSpy.count(), 2);
    EXPECT_EQ(availabilitySpy.count(), 0);

    ASSERT_TRUE(store.setField(ReactorField::BottomType, token("conical")));
    EXPECT_EQ(availabilitySpy.count(), 1);
}

TEST(ParameterStoreTests, ResetReplacesEverything)
{
    ParameterStore store;

    ReactorParameters restored;
    restored.volume = 80.0;
    restored.topType = TopType::Gl25;
    restored.radius = 12.5;
    restored.bottomType = BottomType::Conical;

    QSignalSpy availabilitySpy(&store, &ParameterStore::availabilityChanged);
    store.reset(restored);

    EXPECT_DOUBLE_EQ(store.read().volume, 80.0);
    EXPECT_TRUE(store.read().radiusConstrained);
    EXPECT_FALSE(store.availability().pipeDiameter);
    EXPECT_EQ(availabilitySpy.count(), 1);
}
