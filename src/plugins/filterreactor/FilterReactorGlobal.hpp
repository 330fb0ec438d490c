// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(FILTERREACTOR_BUILD_SHARED) && (FILTERREACTOR_BUILD_SHARED == 1)
#	if defined(FILTERREACTOR_LIBRARY)
#		define FILTERREACTOR_EXPORT Q_DECL_EXPORT
#	else
#		define FILTERREACTOR_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define FILTERREACTOR_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(filterreactorlog)

namespace FilterReactor {

// Accessor shape produced by Q_LOGGING_CATEGORY, so a category can be handed
// to an object and used with qCDebug(m_log).
using LoggingCategoryFn = const QLoggingCategory& (*)();

} // namespace FilterReactor
