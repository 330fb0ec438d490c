// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QVariant>

namespace FilterReactor {

// Current values of the basic and advanced settings, plus which of them the
// user may edit right now.
class FILTERREACTOR_EXPORT ParameterStore final : public QObject {
    Q_OBJECT

public:
    explicit ParameterStore(ReactorParameters initial = {}, QObject* parent = nullptr);

    // Numeric fields take a number, enum fields their canonical token,
    // RadiusConstrained a bool. An invalid QVariant clears the radius.
    Utils::Result setField(ReactorField field, const QVariant& value);

    ReactorParameters read() const { return m_params; }
    const FieldAvailability& availability() const noexcept { return m_availability; }

    // Replaces every value at once, e.g. when reopening an existing module.
    void reset(const ReactorParameters& params);

signals:
    void fieldChanged(FilterReactor::ReactorField field);
    void availabilityChanged(const FilterReactor::FieldAvailability& availability);

private:
    Utils::Result applyField(ReactorField field, const QVariant& value, bool& changed);
    void applyTopCascade();
    void refreshAvailability();

    ReactorParameters m_params;
    FieldAvailability m_availability;
};

} // namespace FilterReactor
