// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filterreactor/FilterReactorLabels.hpp"

#include <array>

namespace FilterReactor::Labels {

namespace {

template <typename Enum>
struct Entry final {
    Enum value;
    const char* token;
    const char* label;
};

constexpr std::array<Entry<TopType>, 6> kTops{{
    {TopType::Simple, "simple", "Simple"},
    {TopType::Custom, "custom", "Custom"},
    {TopType::Gl18, "gl18", "GL18"},
    {TopType::Gl25, "gl25", "GL25"},
    {TopType::Gl32, "gl32", "GL32"},
    {TopType::Gl45, "gl45", "GL45"},
}};

constexpr std::array<Entry<BottomType>, 4> kBottoms{{
    {BottomType::Round, "round", "Round"},
    {BottomType::Flat, "flat", "Flat"},
    {BottomType::Conical, "conical", "Conical"},
    {BottomType::Tapered, "tapered", "Tapered"},
}};

constexpr std::array<Entry<AlignTopStrategy>, 2> kAlignTop{{
    {AlignTopStrategy::Expand, "expand", "Expand body"},
    {AlignTopStrategy::Lift, "lift", "Lift reactor"},
}};

constexpr std::array<Entry<AlignFilterStrategy>, 2> kAlignFilter{{
    {AlignFilterStrategy::Adapt, "adapt", "Adapt"},
    {AlignFilterStrategy::Lift, "lift", "Lift reactor"},
}};

constexpr std::array<Entry<TopInletKind>, 2> kInletKinds{{
    {TopInletKind::Custom, "custom", "Custom top inlet"},
    {TopInletKind::Luer, "luer", "Luer top inlet"},
}};

template <typename Enum, std::size_t N>
const Entry<Enum>* findValue(const std::array<Entry<Enum>, N>& table, Enum value)
{
    for (const auto& e : table) {
        if (e.value == value)
            return &e;
    }
    return nullptr;
}

template <typename Enum, std::size_t N>
QString tokenOf(const std::array<Entry<Enum>, N>& table, Enum value)
{
    const auto* e = findValue(table, value);
    return e ? QString::fromLatin1(e->token) : QString{};
}

template <typename Enum, std::size_t N>
QString labelOf(const std::array<Entry<Enum>, N>& table, Enum value)
{
    const auto* e = findValue(table, value);
    return e ? QString::fromLatin1(e->label) : QString{};
}

template <typename Enum, std::size_t N>
std::optional<Enum> fromToken(const std::array<Entry<Enum>, N>& table, const QString& token)
{
    const QString t = token.trimmed();
    for (const auto& e : table) {
        if (t.compare(QLatin1String(e.token), Qt::CaseInsensitive) == 0)
            return e.value;
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
std::optional<Enum> fromLabel(const std::array<Entry<Enum>, N>& table, const QString& label)
{
    for (const auto& e : table) {
        if (label == QLatin1String(e.label))
            return e.value;
    }
    return std::nullopt;
}

} // namespace

QString token(TopType type) { return tokenOf(kTops, type); }
QString token(BottomType type) { return tokenOf(kBottoms, type); }
QString token(AlignTopStrategy strategy) { return tokenOf(kAlignTop, strategy); }
QString token(AlignFilterStrategy strategy) { return tokenOf(kAlignFilter, strategy); }
QString token(TopInletKind kind) { return tokenOf(kInletKinds, kind); }

QString label(TopType type) { return labelOf(kTops, type); }
QString label(BottomType type) { return labelOf(kBottoms, type); }
QString label(AlignTopStrategy strategy) { return labelOf(kAlignTop, strategy); }
QString label(AlignFilterStrategy strategy) { return labelOf(kAlignFilter, strategy); }

std::optional<TopType> topTypeFromToken(const QString& token) { return fromToken(kTops, token); }
std::optional<BottomType> bottomTypeFromToken(const QString& token) { return fromToken(kBottoms, token); }
std::optional<AlignTopStrategy> alignTopFromToken(const QString& token) { return fromToken(kAlignTop, token); }
std::optional<AlignFilterStrategy> alignFilterFromToken(const QString& token) { return fromToken(kAlignFilter, token); }
std::optional<TopInletKind> topInletKindFromToken(const QString& token) { return fromToken(kInletKinds, token); }

std::optional<TopType> topTypeFromLabel(const QString& label) { return fromLabel(kTops, label); }
std::optional<BottomType> bottomTypeFromLabel(const QString& label) { return fromLabel(kBottoms, label); }
std::optional<AlignTopStrategy> alignTopFromLabel(const QString& label) { return fromLabel(kAlignTop, label); }
std::optional<AlignFilterStrategy> alignFilterFromLabel(const QString& label) { return fromLabel(kAlignFilter, label); }

QVector<TopType> topChoices()
{
    QVector<TopType> out;
    out.reserve(static_cast<qsizetype>(kTops.size()));
    for (const auto& e : kTops)
        out.push_back(e.value);
    return out;
}

QVector<BottomType> bottomChoices()
{
    QVector<BottomType> out;
    for (const auto& e : kBottoms) {
        if (e.value != BottomType::Round)
            out.push_back(e.value);
    }
    return out;
}

QString ioTypeLabel(IoKind kind, const IoDescriptor& descriptor)
{
    switch (kind) {
    case IoKind::SideInput:
        return QStringLiteral("Side input");
    case IoKind::SideOutput:
        if (descriptorName(descriptor) == QLatin1String(kDefaultOutputName))
            return QStringLiteral("Default output");
        return QStringLiteral("Side output");
    case IoKind::TopInlet:
        if (const auto* inlet = std::get_if<TopInletDescriptor>(&descriptor))
            return labelOf(kInletKinds, inlet->kind);
        return labelOf(kInletKinds, TopInletKind::Custom);
    }
    return {};
}

QString connectionLabel(bool connected)
{
    return connected ? QStringLiteral("Connected") : QStringLiteral("Not connected");
}

QString fieldName(ReactorField field)
{
    switch (field) {
    case ReactorField::Volume:              return QStringLiteral("Reaction volume");
    case ReactorField::TopType:             return QStringLiteral("Top type");
    case ReactorField::BottomType:          return QStringLiteral("Bottom type");
    case ReactorField::FilterHeight:        return QStringLiteral("Filter thickness");
    case ReactorField::FilterDiameter:      return QStringLiteral("Filter diameter");
    case ReactorField::PipeDiameter:        return QStringLiteral("Diameter internal pipe");
    case ReactorField::Radius:              return QStringLiteral("Reactor radius");
    case ReactorField::RadiusConstrained:   return QStringLiteral("Radius constrained");
    case ReactorField::AlignTopStrategy:    return QStringLiteral("Align top strategy");
    case ReactorField::AlignFilterStrategy: return QStringLiteral("Align filter strategy");
    }
    return {};
}

} // namespace FilterReactor::Labels
