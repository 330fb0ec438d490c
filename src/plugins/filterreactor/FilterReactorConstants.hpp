// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace FilterReactor {

constexpr const char kDefaultOutputName[] = "default";

constexpr double kDefaultVolume = 20.0;
constexpr double kDefaultFilterHeight = 3.0;
constexpr double kDefaultFilterDiameter = 20.0;
constexpr double kDefaultPipeDiameter = 4.0;

constexpr double kMaxVolume = 200.0;
constexpr double kMaxFilterHeight = 1000.0;
constexpr double kMaxFilterDiameter = 200.0;
constexpr double kMaxPipeDiameter = 99.99;
constexpr double kMaxRadius = 99.99;

// Luer fittings are standard, the caller never sizes them.
constexpr double kLuerDiameter = 4.0;
constexpr double kLuerLength = 6.0;
constexpr double kLuerWallThickness = 1.0;

// Default output placed at the bottom of the body.
constexpr double kDefaultOutputHeightFraction = 0.0;
constexpr double kDefaultOutputDiameter = 2.0;

} // namespace FilterReactor
