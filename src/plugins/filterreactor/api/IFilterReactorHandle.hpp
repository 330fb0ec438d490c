// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"
#include "filterreactor/api/ReactorError.hpp"

#include <QtCore/QVector>

namespace FilterReactor {

// A built filter reactor owned by the geometry library. Every setter
// recalculates the geometry. Setting a threaded top forces the radius
// constraint and derives the radius from the fitting.
class FILTERREACTOR_EXPORT IFilterReactorHandle {
public:
    virtual ~IFilterReactorHandle() = default;

    virtual ReactorParameters parameters() const = 0;

    virtual ReactorError setVolume(double volume) = 0;
    virtual ReactorError setTopType(TopType type) = 0;
    virtual ReactorError setBottomType(BottomType type) = 0;
    virtual ReactorError setFilterHeight(double height) = 0;
    virtual ReactorError setFilterDiameter(double diameter) = 0;
    virtual ReactorError setPipeDiameter(double diameter) = 0;
    // Also turns the radius constraint on.
    virtual ReactorError setRadius(double radius) = 0;
    virtual ReactorError setRadiusConstrained(bool constrained) = 0;
    virtual ReactorError setAlignTopStrategy(AlignTopStrategy strategy) = 0;
    virtual ReactorError setAlignFilterStrategy(AlignFilterStrategy strategy) = 0;

    // Attach calls add the I/O or replace the one with the same name.
    virtual ReactorError attachInput(const SideIoDescriptor& io) = 0;
    virtual ReactorError attachOutput(const SideIoDescriptor& io) = 0;
    virtual ReactorError attachTopInlet(const TopInletDescriptor& inlet) = 0;

    virtual ReactorError detachInput(const QString& name) = 0;
    virtual ReactorError detachOutput(const QString& name) = 0;
    virtual ReactorError detachTopInlet(const QString& name) = 0;

    virtual ReactorError autoPlaceTopInlets() = 0;

    // Read back, with the height fraction derived from the current geometry.
    virtual QVector<SideIoDescriptor> inputs() const = 0;
    virtual QVector<SideIoDescriptor> outputs() const = 0;
    virtual QVector<TopInletDescriptor> topInlets() const = 0;
};

} // namespace FilterReactor
