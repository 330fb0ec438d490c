// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"
#include "filterreactor/api/ReactorError.hpp"

namespace FilterReactor {

// Threaded tops have their radius fixed by the fitting.
FILTERREACTOR_EXPORT bool isThreadedTop(TopType type) noexcept;
FILTERREACTOR_EXPORT bool hasInternalPipe(BottomType type) noexcept;

FILTERREACTOR_EXPORT FieldAvailability resolveConstraints(const ReactorParameters& params) noexcept;

// Constructor arguments for a parameter snapshot. The radius is only passed
// when it is constrained on a non threaded top.
FILTERREACTOR_EXPORT ReactorError makeBuildRequest(const ReactorParameters& params, ReactorBuildRequest& out);

} // namespace FilterReactor
