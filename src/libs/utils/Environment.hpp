// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <utility>

namespace Utils {

enum class EnvironmentScope : unsigned char {
    Global,
    Session
};

struct EnvironmentConfig final {
    QString organizationName;
    QString applicationName;

    // Replaces the platform config location, mostly for tests.
    QString globalConfigRootOverride;
    QString sessionName;
};

struct EnvironmentPaths final {
    QString globalConfigDir;  // resolved absolute
    QString sessionConfigDir; // resolved absolute
};

// Settings facade. Where and how values are stored is up to the policy,
// so tests can swap the Qt/INI policy for an in-memory one.
template <typename PersistencePolicy>
class BasicEnvironment final {
public:
    using Policy = PersistencePolicy;
    using SettingsHandle = typename Policy::SettingsHandle;

    explicit BasicEnvironment(EnvironmentConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const EnvironmentConfig& config() const noexcept { return m_config; }
    const EnvironmentPaths& paths() const noexcept { return m_paths; }
    const Policy& policy() const noexcept { return m_policy; }

    QVariant setting(EnvironmentScope scope, QStringView key, const QVariant& def = {}) const
    {
        auto h = m_policy.openSettings(scope, m_paths);
        return m_policy.settingsValue(h, key, def);
    }

    // Reads a double, falling back when the stored value is missing or not numeric.
    double numberSetting(EnvironmentScope scope, QStringView key, double def) const
    {
        const QVariant v = setting(scope, key);
        if (!v.isValid())
            return def;

        bool ok = false;
        const double d = v.toDouble(&ok);
        return ok ? d : def;
    }

    void setSetting(EnvironmentScope scope, QStringView key, const QVariant& value)
    {
        auto h = m_policy.openSettings(scope, m_paths);
        m_policy.setSettingsValue(h, key, value);
        m_policy.syncSettings(h);
    }

    void removeSetting(EnvironmentScope scope, QStringView key)
    {
        auto h = m_policy.openSettings(scope, m_paths);
        m_policy.removeSettingsKey(h, key);
        m_policy.syncSettings(h);
    }

    bool hasSetting(EnvironmentScope scope, QStringView key) const
    {
        auto h = m_policy.openSettings(scope, m_paths);
        return m_policy.settingsContains(h, key);
    }

    QStringList settingKeys(EnvironmentScope scope, QStringView group) const
    {
        auto h = m_policy.openSettings(scope, m_paths);
        return m_policy.settingsKeys(h, group);
    }

private:
    EnvironmentConfig m_config;
    Policy m_policy;
    EnvironmentPaths m_paths;
};

} // namespace Utils
