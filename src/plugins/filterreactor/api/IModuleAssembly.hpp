// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/IFilterReactorHandle.hpp"
#include "filterreactor/api/ReactorError.hpp"

#include <memory>

namespace FilterReactor {

// The assembly that owns modules once they are built.
class FILTERREACTOR_EXPORT IModuleAssembly {
public:
    virtual ~IModuleAssembly() = default;

    virtual ReactorError buildModule(std::unique_ptr<IFilterReactorHandle> module) = 0;
    virtual ReactorError deleteModule(IFilterReactorHandle* module) = 0;
    virtual ReactorError refresh() = 0;
};

} // namespace FilterReactor
