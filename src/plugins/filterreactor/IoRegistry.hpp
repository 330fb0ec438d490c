// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"
#include "filterreactor/api/ReactorError.hpp"

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace FilterReactor {

struct IoEntry final {
    IoKind kind = IoKind::SideInput;
    IoDescriptor descriptor;
    quint64 sequence = 0; // insertion order, drives the row order

    const QString& name() const { return descriptorName(descriptor); }
};

// One line of the I/O table. Derived from the registry, never stored.
struct IoRow final {
    QString name;
    IoKind kind = IoKind::SideInput;
    QString typeLabel;
    QString connectionLabel;
    bool connected = false;
    bool selectable = true;
};

struct IoKey final {
    IoKind kind = IoKind::SideInput;
    QString name;

    friend bool operator==(const IoKey&, const IoKey&) = default;
};

// Staging area for the I/O of one reactor until the next commit.
// Names are unique per kind. The default output always exists and can be
// neither selected, edited nor removed.
class FILTERREACTOR_EXPORT IoRegistry final {
public:
    IoRegistry();

    // Appends a new entry, or replaces the stored descriptor in place when
    // the name is already known for that kind. The connected flag of an
    // existing entry is kept.
    ReactorError addOrUpdate(IoKind kind, IoDescriptor descriptor, bool* inserted = nullptr);

    ReactorError remove(IoKind kind, const QString& name);

    bool select(IoKind kind, const QString& name);
    void clearSelection() noexcept { m_selection.reset(); }
    const std::optional<IoKey>& selection() const noexcept { return m_selection; }

    // Fails with a Selection error when nothing is selected.
    ReactorError removeSelected(IoKey* removed = nullptr);

    const IoEntry* find(IoKind kind, const QString& name) const;
    bool contains(IoKind kind, const QString& name) const { return find(kind, name) != nullptr; }

    QVector<IoEntry> entries(IoKind kind) const;
    qsizetype count(IoKind kind) const;

    const SideIoDescriptor& defaultOutput() const;
    void setDefaultOutput(SideIoDescriptor descriptor);

    // Rows in insertion order.
    QVector<IoRow> rows() const;
    qsizetype rowCount() const;

    // Drops every user entry. The default output stays.
    void clear();

    static bool isReserved(IoKind kind, const QString& name);

private:
    QHash<QString, IoEntry>& bucket(IoKind kind);
    const QHash<QString, IoEntry>& bucket(IoKind kind) const;

    QHash<QString, IoEntry> m_inputs;
    QHash<QString, IoEntry> m_outputs;
    QHash<QString, IoEntry> m_topInlets;

    std::optional<IoKey> m_selection;
    quint64 m_nextSequence = 0;
};

} // namespace FilterReactor
