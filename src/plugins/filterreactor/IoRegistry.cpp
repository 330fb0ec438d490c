// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filterreactor/IoRegistry.hpp"

#include "filterreactor/FilterReactorLabels.hpp"

#include <algorithm>

namespace FilterReactor {

namespace {

QString defaultOutputName()
{
    return QString::fromLatin1(kDefaultOutputName);
}

SideIoDescriptor makeDefaultOutput()
{
    SideIoDescriptor d;
    d.name = defaultOutputName();
    d.heightFraction = kDefaultOutputHeightFraction;
    d.diameter = kDefaultOutputDiameter;
    return d;
}

ReactorError invalid(const QString& message)
{
    return ReactorError(ReactorErrorCode::InvalidArgument, message);
}

ReactorError checkSide(const SideIoDescriptor& d)
{
    if (d.heightFraction < 0.0 || d.heightFraction > 1.0)
        return invalid(QStringLiteral("I/O %1: height must be between 0 and 1.").arg(d.name));
    if (d.diameter <= 0.0)
        return invalid(QStringLiteral("I/O %1: diameter must be positive.").arg(d.name));
    return ReactorError::none();
}

ReactorError checkTopInlet(TopInletDescriptor& d)
{
    if (d.kind == TopInletKind::Luer) {
        d.diameter = kLuerDiameter;
        d.length = kLuerLength;
        d.wallThickness = kLuerWallThickness;
        return ReactorError::none();
    }

    if (d.diameter <= 0.0 || d.length <= 0.0 || d.wallThickness <= 0.0)
        return invalid(QStringLiteral("Top inlet %1: diameter, length and walls must be positive.").arg(d.name));
    return ReactorError::none();
}

} // namespace

IoRegistry::IoRegistry()
{
    setDefaultOutput(makeDefaultOutput());
}

bool IoRegistry::isReserved(IoKind kind, const QString& name)
{
    return kind == IoKind::SideOutput && name == QLatin1String(kDefaultOutputName);
}

QHash<QString, IoEntry>& IoRegistry::bucket(IoKind kind)
{
    switch (kind) {
    case IoKind::SideInput:  return m_inputs;
    case IoKind::SideOutput: return m_outputs;
    case IoKind::TopInlet:   return m_topInlets;
    }
    return m_inputs;
}

const QHash<QString, IoEntry>& IoRegistry::bucket(IoKind kind) const
{
    switch (kind) {
    case IoKind::SideInput:  return m_inputs;
    case IoKind::SideOutput: return m_outputs;
    case IoKind::TopInlet:   return m_topInlets;
    }
    return m_inputs;
}

ReactorError IoRegistry::addOrUpdate(IoKind kind, IoDescriptor descriptor, bool* inserted)
{
    if (inserted)
        *inserted = false;

    const QString name = descriptorName(descriptor).trimmed();
    if (name.isEmpty())
        return invalid(QStringLiteral("An I/O needs a name."));
    if (isReserved(kind, name))
        return invalid(QStringLiteral("The default output cannot be edited."));

    const bool topKind = kind == IoKind::TopInlet;
    if (topKind != std::holds_alternative<TopInletDescriptor>(descriptor))
        return invalid(QStringLiteral("I/O %1 does not match the kind it is stored under.").arg(name));

    ReactorError check;
    if (auto* side = std::get_if<SideIoDescriptor>(&descriptor)) {
        side->name = name;
        check = checkSide(*side);
    } else if (auto* inlet = std::get_if<TopInletDescriptor>(&descriptor)) {
        inlet->name = name;
        check = checkTopInlet(*inlet);
    }
    if (!check.ok())
        return check;

    auto& entries = bucket(kind);
    auto it = entries.find(name);
    if (it != entries.end()) {
        // Connection state belongs to the assembly, callers cannot change it.
        const bool connected = std::visit([](const auto& d) { return d.connected; }, it->descriptor);
        std::visit([connected](auto& d) { d.connected = connected; }, descriptor);
        it->descriptor = std::move(descriptor);
        return ReactorError::none();
    }

    IoEntry entry;
    entry.kind = kind;
    entry.descriptor = std::move(descriptor);
    entry.sequence = m_nextSequence++;
    entries.insert(name, std::move(entry));

    if (inserted)
        *inserted = true;
    return ReactorError::none();
}

ReactorError IoRegistry::remove(IoKind kind, const QString& name)
{
    if (isReserved(kind, name))
        return invalid(QStringLiteral("The default output cannot be deleted."));

    auto& entries = bucket(kind);
    if (entries.remove(name) == 0)
        return ReactorError(ReactorErrorCode::Selection, QStringLiteral("No I/O named %1.").arg(name));

    if (m_selection && m_selection->kind == kind && m_selection->name == name)
        m_selection.reset();
    return ReactorError::none();
}

bool IoRegistry::select(IoKind kind, const QString& name)
{
    if (isReserved(kind, name) || !contains(kind, name)) {
        m_selection.reset();
        return false;
    }

    m_selection = IoKey{kind, name};
    return true;
}

ReactorError IoRegistry::removeSelected(IoKey* removed)
{
    if (!m_selection)
        return ReactorError(ReactorErrorCode::Selection, QStringLiteral("No I/O selected, can't delete."));

    const IoKey key = *m_selection;
    const ReactorError r = remove(key.kind, key.name);
    if (r.ok() && removed)
        *removed = key;
    return r;
}

const IoEntry* IoRegistry::find(IoKind kind, const QString& name) const
{
    const auto& entries = bucket(kind);
    const auto it = entries.constFind(name);
    return it == entries.constEnd() ? nullptr : &*it;
}

QVector<IoEntry> IoRegistry::entries(IoKind kind) const
{
    const auto& bucketEntries = bucket(kind);
    QVector<IoEntry> out;
    out.reserve(bucketEntries.size());
    for (const auto& e : bucketEntries)
        out.push_back(e);

    std::ranges::sort(out, [](const IoEntry& a, const IoEntry& b) { return a.sequence < b.sequence; });
    return out;
}

qsizetype IoRegistry::count(IoKind kind) const
{
    return bucket(kind).size();
}

const SideIoDescriptor& IoRegistry::defaultOutput() const
{
    return std::get<SideIoDescriptor>(m_outputs.constFind(defaultOutputName())->descriptor);
}

void IoRegistry::setDefaultOutput(SideIoDescriptor descriptor)
{
    descriptor.name = defaultOutputName();

    auto it = m_outputs.find(descriptor.name);
    if (it != m_outputs.end()) {
        it->descriptor = std::move(descriptor);
        return;
    }

    IoEntry entry;
    entry.kind = IoKind::SideOutput;
    entry.descriptor = std::move(descriptor);
    entry.sequence = m_nextSequence++;
    m_outputs.insert(defaultOutputName(), std::move(entry));
}

QVector<IoRow> IoRegistry::rows() const
{
    QVector<IoEntry> all;
    all.reserve(rowCount());
    for (const IoKind kind : {IoKind::SideInput, IoKind::SideOutput, IoKind::TopInlet}) {
        for (const auto& e : bucket(kind))
            all.push_back(e);
    }
    std::ranges::sort(all, [](const IoEntry& a, const IoEntry& b) { return a.sequence < b.sequence; });

    QVector<IoRow> out;
    out.reserve(all.size());
    for (const IoEntry& e : all) {
        IoRow row;
        row.name = e.name();
        row.kind = e.kind;
        row.typeLabel = Labels::ioTypeLabel(e.kind, e.descriptor);
        row.connected = std::visit([](const auto& d) { return d.connected; }, e.descriptor);
        row.connectionLabel = Labels::connectionLabel(row.connected);
        row.selectable = !isReserved(e.kind, row.name);
        out.push_back(std::move(row));
    }
    return out;
}

qsizetype IoRegistry::rowCount() const
{
    return m_inputs.size() + m_outputs.size() + m_topInlets.size();
}

void IoRegistry::clear()
{
    const SideIoDescriptor def = defaultOutput();

    m_inputs.clear();
    m_outputs.clear();
    m_topInlets.clear();
    m_selection.reset();
    m_nextSequence = 0;

    setDefaultOutput(def);
}

} // namespace FilterReactor
