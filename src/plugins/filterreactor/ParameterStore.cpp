// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filterreactor/ParameterStore.hpp"

#include "filterreactor/ConstraintResolver.hpp"
#include "filterreactor/FilterReactorLabels.hpp"

namespace FilterReactor {

namespace {

Utils::Result readNumber(ReactorField field, const QVariant& value, double max, double& out)
{
    bool ok = false;
    const double d = value.toDouble(&ok);
    if (!ok)
        return Utils::Result::failure(QStringLiteral("%1 expects a number.").arg(Labels::fieldName(field)));
    if (d <= 0.0 || d > max) {
        return Utils::Result::failure(QStringLiteral("%1 must be in (0, %2], got %3.")
                                          .arg(Labels::fieldName(field))
                                          .arg(max)
                                          .arg(d));
    }
    out = d;
    return Utils::Result::success();
}

template <typename Enum, typename Parser>
Utils::Result readToken(ReactorField field, const QVariant& value, Parser parse, Enum& out)
{
    const QString token = value.toString();
    const std::optional<Enum> parsed = parse(token);
    if (!parsed)
        return Utils::Result::failure(QStringLiteral("%1: unknown value '%2'.").arg(Labels::fieldName(field), token));
    out = *parsed;
    return Utils::Result::success();
}

template <typename T>
void assign(T& dst, const T& src, bool& changed)
{
    if (dst == src)
        return;
    dst = src;
    changed = true;
}

} // namespace

ParameterStore::ParameterStore(ReactorParameters initial, QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<FilterReactor::ReactorField>("FilterReactor::ReactorField");
    qRegisterMetaType<FilterReactor::FieldAvailability>("FilterReactor::FieldAvailability");

    m_params = std::move(initial);
    if (isThreadedTop(m_params.topType))
        m_params.radiusConstrained = true;
    m_availability = resolveConstraints(m_params);
}

Utils::Result ParameterStore::setField(ReactorField field, const QVariant& value)
{
    if (!m_availability.isEditable(field)) {
        return Utils::Result::failure(QStringLiteral("%1 is not editable with the current top and bottom.")
                                          .arg(Labels::fieldName(field)));
    }

    bool changed = false;
    const Utils::Result r = applyField(field, value, changed);
    if (!r || !changed)
        return r;

    emit fieldChanged(field);

    if (field == ReactorField::TopType)
        applyTopCascade();

    refreshAvailability();
    return r;
}

Utils::Result ParameterStore::applyField(ReactorField field, const QVariant& value, bool& changed)
{
    Utils::Result r;

    switch (field) {
    case ReactorField::Volume: {
        double v = 0.0;
        r = readNumber(field, value, kMaxVolume, v);
        if (r)
            assign(m_params.volume, v, changed);
        break;
    }
    case ReactorField::FilterHeight: {
        double v = 0.0;
        r = readNumber(field, value, kMaxFilterHeight, v);
        if (r)
            assign(m_params.filterHeight, v, changed);
        break;
    }
    case ReactorField::FilterDiameter: {
        double v = 0.0;
        r = readNumber(field, value, kMaxFilterDiameter, v);
        if (r)
            assign(m_params.filterDiameter, v, changed);
        break;
    }
    case ReactorField::PipeDiameter: {
        double v = 0.0;
        r = readNumber(field, value, kMaxPipeDiameter, v);
        if (r)
            assign(m_params.pipeDiameter, v, changed);
        break;
    }
    case ReactorField::Radius: {
        if (!value.isValid()) {
            assign(m_params.radius, std::optional<double>{}, changed);
            break;
        }
        double v = 0.0;
        r = readNumber(field, value, kMaxRadius, v);
        if (r)
            assign(m_params.radius, std::optional<double>(v), changed);
        break;
    }
    case ReactorField::RadiusConstrained:
        if (value.metaType().id() != QMetaType::Bool) {
            r = Utils::Result::failure(QStringLiteral("%1 expects a bool.").arg(Labels::fieldName(field)));
            break;
        }
        assign(m_params.radiusConstrained, value.toBool(), changed);
        break;
    case ReactorField::TopType: {
        TopType t{};
        r = readToken(field, value, Labels::topTypeFromToken, t);
        if (r)
            assign(m_params.topType, t, changed);
        break;
    }
    case ReactorField::BottomType: {
        BottomType b{};
        r = readToken(field, value, Labels::bottomTypeFromToken, b);
        if (r && b == BottomType::Round)
            r = Utils::Result::failure(QStringLiteral("The round bottom cannot be chosen for a filter reactor."));
        if (r)
            assign(m_params.bottomType, b, changed);
        break;
    }
    case ReactorField::AlignTopStrategy: {
        AlignTopStrategy s{};
        r = readToken(field, value, Labels::alignTopFromToken, s);
        if (r)
            assign(m_params.alignTopStrategy, s, changed);
        break;
    }
    case ReactorField::AlignFilterStrategy: {
        AlignFilterStrategy s{};
        r = readToken(field, value, Labels::alignFilterFromToken, s);
        if (r)
            assign(m_params.alignFilterStrategy, s, changed);
        break;
    }
    }

    return r;
}

void ParameterStore::applyTopCascade()
{
    // The constraint has to be forced before availability is resolved again,
    // otherwise the radius would stay editable.
    if (!isThreadedTop(m_params.topType) || m_params.radiusConstrained)
        return;

    m_params.radiusConstrained = true;
    emit fieldChanged(ReactorField::RadiusConstrained);
}

void ParameterStore::reset(const ReactorParameters& params)
{
    m_params = params;
    if (isThreadedTop(m_params.topType))
        m_params.radiusConstrained = true;
    refreshAvailability();
}

void ParameterStore::refreshAvailability()
{
    const FieldAvailability next = resolveConstraints(m_params);
    if (next == m_availability)
        return;

    m_availability = next;
    emit availabilityChanged(m_availability);
}

} // namespace FilterReactor
