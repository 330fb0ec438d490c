// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filterreactor/state/FilterReactorSettings.hpp"

#include "filterreactor/ConstraintResolver.hpp"
#include "filterreactor/FilterReactorLabels.hpp"

Q_LOGGING_CATEGORY(filterreactorsettingslog, "chemscad.filterreactor.settings")

namespace FilterReactor {

namespace {

using namespace Qt::StringLiterals;
using Utils::EnvironmentScope;

const QString kGroup = u"filterReactor/defaults"_s;
const QString kVolumeKey = u"filterReactor/defaults/volume"_s;
const QString kTopKey = u"filterReactor/defaults/topType"_s;
const QString kBottomKey = u"filterReactor/defaults/bottomType"_s;
const QString kFilterHeightKey = u"filterReactor/defaults/filterHeight"_s;
const QString kFilterDiameterKey = u"filterReactor/defaults/filterDiameter"_s;
const QString kPipeDiameterKey = u"filterReactor/defaults/pipeDiameter"_s;
const QString kRadiusKey = u"filterReactor/defaults/radius"_s;
const QString kRadiusConstrainedKey = u"filterReactor/defaults/radiusConstrained"_s;
const QString kAlignTopKey = u"filterReactor/defaults/alignTopStrategy"_s;
const QString kAlignFilterKey = u"filterReactor/defaults/alignFilterStrategy"_s;

double boundedNumber(const Utils::Environment& env, const QString& key, double fallback, double max)
{
    const double v = env.numberSetting(EnvironmentScope::Global, key, fallback);
    if (v <= 0.0 || v > max) {
        qCWarning(filterreactorsettingslog) << "Ignoring out of range default" << key << v;
        return fallback;
    }
    return v;
}

template <typename Enum, typename Parser>
Enum tokenSetting(const Utils::Environment& env, const QString& key, Enum fallback, Parser parse)
{
    if (!env.hasSetting(EnvironmentScope::Global, key))
        return fallback;

    const QString token = env.setting(EnvironmentScope::Global, key).toString();
    const std::optional<Enum> parsed = parse(token);
    if (!parsed) {
        qCWarning(filterreactorsettingslog) << "Unknown value for" << key << token;
        return fallback;
    }
    return *parsed;
}

} // namespace

FilterReactorSettings::FilterReactorSettings()
    : m_env(makeEnvironment())
{
}

FilterReactorSettings::FilterReactorSettings(Utils::Environment environment)
    : m_env(std::move(environment))
{
}

Utils::Environment FilterReactorSettings::makeEnvironment()
{
    Utils::EnvironmentConfig cfg;
    cfg.organizationName = QStringLiteral("ChemScad");
    cfg.applicationName = QStringLiteral("ChemScad");
    return Utils::Environment(cfg);
}

ReactorParameters FilterReactorSettings::defaults() const
{
    const ReactorParameters builtIn;
    ReactorParameters out;

    out.volume = boundedNumber(m_env, kVolumeKey, builtIn.volume, kMaxVolume);
    out.filterHeight = boundedNumber(m_env, kFilterHeightKey, builtIn.filterHeight, kMaxFilterHeight);
    out.filterDiameter = boundedNumber(m_env, kFilterDiameterKey, builtIn.filterDiameter, kMaxFilterDiameter);
    out.pipeDiameter = boundedNumber(m_env, kPipeDiameterKey, builtIn.pipeDiameter, kMaxPipeDiameter);

    out.topType = tokenSetting(m_env, kTopKey, builtIn.topType, Labels::topTypeFromToken);
    out.bottomType = tokenSetting(m_env, kBottomKey, builtIn.bottomType, Labels::bottomTypeFromToken);
    if (out.bottomType == BottomType::Round)
        out.bottomType = builtIn.bottomType;
    out.alignTopStrategy = tokenSetting(m_env, kAlignTopKey, builtIn.alignTopStrategy, Labels::alignTopFromToken);
    out.alignFilterStrategy =
        tokenSetting(m_env, kAlignFilterKey, builtIn.alignFilterStrategy, Labels::alignFilterFromToken);

    if (m_env.hasSetting(EnvironmentScope::Global, kRadiusKey)) {
        const double r = boundedNumber(m_env, kRadiusKey, -1.0, kMaxRadius);
        if (r > 0.0)
            out.radius = r;
    }
    out.radiusConstrained =
        m_env.setting(EnvironmentScope::Global, kRadiusConstrainedKey, builtIn.radiusConstrained).toBool();
    if (isThreadedTop(out.topType))
        out.radiusConstrained = true;
    if (out.radiusConstrained && !out.radius && !isThreadedTop(out.topType))
        out.radiusConstrained = false;

    return out;
}

void FilterReactorSettings::storeDefaults(const ReactorParameters& params)
{
    m_env.setSetting(EnvironmentScope::Global, kVolumeKey, params.volume);
    m_env.setSetting(EnvironmentScope::Global, kTopKey, Labels::token(params.topType));
    m_env.setSetting(EnvironmentScope::Global, kBottomKey, Labels::token(params.bottomType));
    m_env.setSetting(EnvironmentScope::Global, kFilterHeightKey, params.filterHeight);
    m_env.setSetting(EnvironmentScope::Global, kFilterDiameterKey, params.filterDiameter);
    m_env.setSetting(EnvironmentScope::Global, kPipeDiameterKey, params.pipeDiameter);
    if (params.radius)
        m_env.setSetting(EnvironmentScope::Global, kRadiusKey, *params.radius);
    else
        m_env.removeSetting(EnvironmentScope::Global, kRadiusKey);
    m_env.setSetting(EnvironmentScope::Global, kRadiusConstrainedKey, params.radiusConstrained);
    m_env.setSetting(EnvironmentScope::Global, kAlignTopKey, Labels::token(params.alignTopStrategy));
    m_env.setSetting(EnvironmentScope::Global, kAlignFilterKey, Labels::token(params.alignFilterStrategy));

    qCDebug(filterreactorsettingslog) << "Stored filter reactor defaults";
}

void FilterReactorSettings::clearDefaults()
{
    const QStringList keys = m_env.settingKeys(EnvironmentScope::Global, kGroup);
    for (const QString& key : keys) {
        const QString fullKey = kGroup + QLatin1Char('/') + key;
        m_env.removeSetting(EnvironmentScope::Global, fullKey);
    }
}

} // namespace FilterReactor
