// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"

#include <utils/EnvironmentQtPolicy.hpp>

namespace FilterReactor {

// Values a new filter reactor starts from. Stored in the global settings so
// users can tune them once for their lab.
class FILTERREACTOR_EXPORT FilterReactorSettings final
{
public:
    FilterReactorSettings();
    explicit FilterReactorSettings(Utils::Environment environment);

    ReactorParameters defaults() const;
    void storeDefaults(const ReactorParameters& params);
    void clearDefaults();

    static Utils::Environment makeEnvironment();

private:
    Utils::Environment m_env;
};

} // namespace FilterReactor
