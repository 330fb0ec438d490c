// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/EnvironmentQtPolicy.hpp"

#include <QtCore/QDir>
#include <QtCore/QStandardPaths>

Q_LOGGING_CATEGORY(chemscadUtilsLog, "chemscad.utils")

namespace Utils {

static QString sessionDirName(const QString& sessionName)
{
    const QString trimmed = sessionName.trimmed();
    return trimmed.isEmpty() ? QStringLiteral("default") : trimmed;
}

EnvironmentPaths QtEnvironmentPersistencePolicy::resolvePaths(const EnvironmentConfig& cfg) const
{
    EnvironmentPaths out;

    const QString appCfg =
        !cfg.globalConfigRootOverride.isEmpty()
            ? cfg.globalConfigRootOverride
            : QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);

    const QString globalBase = QDir(appCfg).filePath(cfg.applicationName.isEmpty()
                                                        ? QStringLiteral("ChemScad")
                                                        : cfg.applicationName);
    out.globalConfigDir = QDir(globalBase).absolutePath();

    out.sessionConfigDir = QDir(out.globalConfigDir)
                               .filePath(QStringLiteral("sessions/%1").arg(sessionDirName(cfg.sessionName)));
    out.sessionConfigDir = QDir(out.sessionConfigDir).absolutePath();

    return out;
}

QString QtEnvironmentPersistencePolicy::settingsFilePath(EnvironmentScope scope, const EnvironmentPaths& paths) const
{
    switch (scope) {
    case EnvironmentScope::Global:
        return QDir(paths.globalConfigDir).filePath(QStringLiteral("global.ini"));
    case EnvironmentScope::Session:
        return QDir(paths.sessionConfigDir).filePath(QStringLiteral("session.ini"));
    }
    return QDir(paths.globalConfigDir).filePath(QStringLiteral("global.ini"));
}

QtEnvironmentPersistencePolicy::SettingsHandle
QtEnvironmentPersistencePolicy::openSettings(EnvironmentScope scope, const EnvironmentPaths& paths) const
{
    auto h = SettingsHandle{};
    const QString path = settingsFilePath(scope, paths);
    h.settings = std::make_unique<QSettings>(path, QSettings::IniFormat);
    h.settings->setFallbacksEnabled(false);
    if (h.settings->status() != QSettings::NoError)
        qCWarning(chemscadUtilsLog) << "Settings file is not usable:" << path;
    return h;
}

QVariant QtEnvironmentPersistencePolicy::settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
{
    return h.settings ? h.settings->value(key.toString(), def) : def;
}

void QtEnvironmentPersistencePolicy::setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
{
    if (!h.settings) return;
    h.settings->setValue(key.toString(), value);
}

void QtEnvironmentPersistencePolicy::removeSettingsKey(SettingsHandle& h, QStringView key) const
{
    if (!h.settings) return;
    h.settings->remove(key.toString());
}

bool QtEnvironmentPersistencePolicy::settingsContains(const SettingsHandle& h, QStringView key) const
{
    return h.settings ? h.settings->contains(key.toString()) : false;
}

QStringList QtEnvironmentPersistencePolicy::settingsKeys(const SettingsHandle& h, QStringView group) const
{
    if (!h.settings)
        return {};

    h.settings->beginGroup(group.toString());
    const QStringList keys = h.settings->childKeys();
    h.settings->endGroup();
    return keys;
}

void QtEnvironmentPersistencePolicy::syncSettings(SettingsHandle& h) const
{
    if (!h.settings) return;
    h.settings->sync();
    if (h.settings->status() != QSettings::NoError)
        qCWarning(chemscadUtilsLog) << "Failed to write settings file:" << h.settings->fileName();
}

} // namespace Utils
