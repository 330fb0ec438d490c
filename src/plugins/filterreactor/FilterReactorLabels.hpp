// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace FilterReactor::Labels {

// Canonical tokens are what settings and the geometry library speak.
// Display labels only exist at the UI boundary.

FILTERREACTOR_EXPORT QString token(TopType type);
FILTERREACTOR_EXPORT QString token(BottomType type);
FILTERREACTOR_EXPORT QString token(AlignTopStrategy strategy);
FILTERREACTOR_EXPORT QString token(AlignFilterStrategy strategy);
FILTERREACTOR_EXPORT QString token(TopInletKind kind);

FILTERREACTOR_EXPORT QString label(TopType type);
FILTERREACTOR_EXPORT QString label(BottomType type);
FILTERREACTOR_EXPORT QString label(AlignTopStrategy strategy);
FILTERREACTOR_EXPORT QString label(AlignFilterStrategy strategy);

FILTERREACTOR_EXPORT std::optional<TopType> topTypeFromToken(const QString& token);
FILTERREACTOR_EXPORT std::optional<BottomType> bottomTypeFromToken(const QString& token);
FILTERREACTOR_EXPORT std::optional<AlignTopStrategy> alignTopFromToken(const QString& token);
FILTERREACTOR_EXPORT std::optional<AlignFilterStrategy> alignFilterFromToken(const QString& token);
FILTERREACTOR_EXPORT std::optional<TopInletKind> topInletKindFromToken(const QString& token);

FILTERREACTOR_EXPORT std::optional<TopType> topTypeFromLabel(const QString& label);
FILTERREACTOR_EXPORT std::optional<BottomType> bottomTypeFromLabel(const QString& label);
FILTERREACTOR_EXPORT std::optional<AlignTopStrategy> alignTopFromLabel(const QString& label);
FILTERREACTOR_EXPORT std::optional<AlignFilterStrategy> alignFilterFromLabel(const QString& label);

// Choices offered in the form, in display order.
FILTERREACTOR_EXPORT QVector<TopType> topChoices();
FILTERREACTOR_EXPORT QVector<BottomType> bottomChoices();

// Type column of the I/O table.
FILTERREACTOR_EXPORT QString ioTypeLabel(IoKind kind, const IoDescriptor& descriptor);
FILTERREACTOR_EXPORT QString connectionLabel(bool connected);

FILTERREACTOR_EXPORT QString fieldName(ReactorField field);

} // namespace FilterReactor::Labels
