// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <utility>

namespace FilterReactor {

enum class ReactorErrorCode : quint8 {
	None = 0,
	InvalidArgument,
	Construction,    // parameter combination cannot be built
	Incompatibility, // I/O kind not supported by the top/bottom
	Constraint,      // placement constraints cannot be satisfied
	Collision,       // placed I/O overlap
	Selection,       // nothing to act on
	Refresh
};

class FILTERREACTOR_EXPORT ReactorError final {
public:
	ReactorError() = default;
	ReactorError(ReactorErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == ReactorErrorCode::None; }
	ReactorErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	bool isPlacementFailure() const noexcept
	{
		return m_code == ReactorErrorCode::Constraint || m_code == ReactorErrorCode::Collision;
	}

	static ReactorError none() { return {}; }

private:
	ReactorErrorCode m_code{ReactorErrorCode::None};
	QString m_message;
};

} // namespace FilterReactor

Q_DECLARE_METATYPE(FilterReactor::ReactorErrorCode)
