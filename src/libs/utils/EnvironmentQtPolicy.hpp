// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Environment.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QSettings>

#include <memory>

namespace Utils {

class UTILS_EXPORT QtEnvironmentPersistencePolicy final {
public:
	struct SettingsHandle final {
		std::unique_ptr<QSettings> settings;
	};

	EnvironmentPaths resolvePaths(const EnvironmentConfig& cfg) const;

	SettingsHandle openSettings(EnvironmentScope scope, const EnvironmentPaths& paths) const;
	QVariant settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const;
	void setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const;
	void removeSettingsKey(SettingsHandle& h, QStringView key) const;
	bool settingsContains(const SettingsHandle& h, QStringView key) const;
	QStringList settingsKeys(const SettingsHandle& h, QStringView group) const;
	void syncSettings(SettingsHandle& h) const;

private:
	QString settingsFilePath(EnvironmentScope scope, const EnvironmentPaths& paths) const;
};

using Environment = BasicEnvironment<QtEnvironmentPersistencePolicy>;

} // namespace Utils
