// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorConstants.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <optional>
#include <variant>

namespace FilterReactor {

enum class TopType : unsigned char {
    Simple,
    Custom,
    Gl18,
    Gl25,
    Gl32,
    Gl45
};

// Round is a valid geometry but never offered to the user.
enum class BottomType : unsigned char {
    Round,
    Flat,
    Conical,
    Tapered
};

enum class AlignTopStrategy : unsigned char {
    Expand,
    Lift
};

enum class AlignFilterStrategy : unsigned char {
    Adapt,
    Lift
};

enum class IoKind : unsigned char {
    SideInput,
    SideOutput,
    TopInlet
};

enum class TopInletKind : unsigned char {
    Custom,
    Luer
};

enum class ReactorField : unsigned char {
    Volume,
    TopType,
    BottomType,
    FilterHeight,
    FilterDiameter,
    PipeDiameter,
    Radius,
    RadiusConstrained,
    AlignTopStrategy,
    AlignFilterStrategy
};

struct ReactorParameters final {
    double volume = kDefaultVolume; // mL
    TopType topType = TopType::Simple;
    BottomType bottomType = BottomType::Flat;
    double filterHeight = kDefaultFilterHeight;
    double filterDiameter = kDefaultFilterDiameter;
    double pipeDiameter = kDefaultPipeDiameter;
    std::optional<double> radius;
    bool radiusConstrained = false;
    AlignTopStrategy alignTopStrategy = AlignTopStrategy::Expand;
    AlignFilterStrategy alignFilterStrategy = AlignFilterStrategy::Adapt;

    friend bool operator==(const ReactorParameters&, const ReactorParameters&) = default;
};

// Side input or side output. Height is a fraction of the module height.
struct SideIoDescriptor final {
    QString name;
    double heightFraction = 0.5;
    double angle = 0.0;
    double diameter = 2.0;
    bool external = false;
    bool connected = false;

    friend bool operator==(const SideIoDescriptor&, const SideIoDescriptor&) = default;
};

struct TopInletDescriptor final {
    QString name;
    TopInletKind kind = TopInletKind::Custom;
    double diameter = kLuerDiameter;
    double length = kLuerLength;
    double wallThickness = kLuerWallThickness;
    bool connected = false;

    friend bool operator==(const TopInletDescriptor&, const TopInletDescriptor&) = default;
};

using IoDescriptor = std::variant<SideIoDescriptor, TopInletDescriptor>;

inline const QString& descriptorName(const IoDescriptor& descriptor)
{
    return std::visit([](const auto& d) -> const QString& { return d.name; }, descriptor);
}

// Which fields of the form may currently be edited.
struct FieldAvailability final {
    bool radius = false;
    bool radiusConstrained = true;
    bool radiusConstrainedForced = false;
    bool pipeDiameter = true;

    bool isEditable(ReactorField field) const noexcept
    {
        switch (field) {
        case ReactorField::Radius:
            return radius;
        case ReactorField::RadiusConstrained:
            return radiusConstrained;
        case ReactorField::PipeDiameter:
            return pipeDiameter;
        default:
            return true;
        }
    }

    friend bool operator==(const FieldAvailability&, const FieldAvailability&) = default;
};

// Arguments of the geometry constructor. The radius is only present when the
// user constrains it on a top that does not fix it.
struct ReactorBuildRequest final {
    double volume = kDefaultVolume;
    TopType topType = TopType::Simple;
    BottomType bottomType = BottomType::Flat;
    double filterDiameter = kDefaultFilterDiameter;
    double filterHeight = kDefaultFilterHeight;
    double pipeDiameter = kDefaultPipeDiameter;
    std::optional<double> radius;
    AlignTopStrategy alignTopStrategy = AlignTopStrategy::Expand;
    AlignFilterStrategy alignFilterStrategy = AlignFilterStrategy::Adapt;
};

enum class CommitState : unsigned char {
    Idle,
    Validating,
    CommittingNew,
    CommittingUpdate,
    Done,
    Failed
};

} // namespace FilterReactor

Q_DECLARE_METATYPE(FilterReactor::FieldAvailability)
Q_DECLARE_METATYPE(FilterReactor::ReactorField)
Q_DECLARE_METATYPE(FilterReactor::CommitState)
