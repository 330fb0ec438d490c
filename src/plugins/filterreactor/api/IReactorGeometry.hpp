// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"
#include "filterreactor/api/IFilterReactorHandle.hpp"
#include "filterreactor/api/ReactorError.hpp"

#include <memory>

namespace FilterReactor {

class FILTERREACTOR_EXPORT IReactorGeometry {
public:
    virtual ~IReactorGeometry() = default;

    virtual ReactorError construct(const ReactorBuildRequest& request,
                                   std::unique_ptr<IFilterReactorHandle>& out) const = 0;

    // Checks that the request can be built without touching any live module.
    // Geometry libraries without a dedicated check build a throw-away reactor.
    virtual ReactorError validate(const ReactorBuildRequest& request) const
    {
        std::unique_ptr<IFilterReactorHandle> scratch;
        return construct(request, scratch);
    }
};

} // namespace FilterReactor
