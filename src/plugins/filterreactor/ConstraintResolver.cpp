// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filterreactor/ConstraintResolver.hpp"

namespace FilterReactor {

bool isThreadedTop(TopType type) noexcept
{
    switch (type) {
    case TopType::Gl18:
    case TopType::Gl25:
    case TopType::Gl32:
    case TopType::Gl45:
        return true;
    case TopType::Simple:
    case TopType::Custom:
        return false;
    }
    return false;
}

bool hasInternalPipe(BottomType type) noexcept
{
    return type == BottomType::Flat || type == BottomType::Tapered;
}

FieldAvailability resolveConstraints(const ReactorParameters& params) noexcept
{
    FieldAvailability out;

    const bool threaded = isThreadedTop(params.topType);
    out.radiusConstrainedForced = threaded;
    out.radiusConstrained = !threaded;
    out.radius = !threaded && params.radiusConstrained;
    out.pipeDiameter = hasInternalPipe(params.bottomType);

    return out;
}

ReactorError makeBuildRequest(const ReactorParameters& params, ReactorBuildRequest& out)
{
    ReactorBuildRequest request;
    request.volume = params.volume;
    request.topType = params.topType;
    request.bottomType = params.bottomType;
    request.filterDiameter = params.filterDiameter;
    request.filterHeight = params.filterHeight;
    request.pipeDiameter = params.pipeDiameter;
    request.alignTopStrategy = params.alignTopStrategy;
    request.alignFilterStrategy = params.alignFilterStrategy;

    if (params.radiusConstrained && !isThreadedTop(params.topType)) {
        if (!params.radius || *params.radius <= 0.0) {
            return ReactorError(ReactorErrorCode::Construction,
                                QStringLiteral("radius is constrained but no radius was entered"));
        }
        request.radius = params.radius;
    }

    out = request;
    return ReactorError::none();
}

} // namespace FilterReactor
