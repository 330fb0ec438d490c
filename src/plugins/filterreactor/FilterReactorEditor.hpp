// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filterreactor/FilterReactorGlobal.hpp"
#include "filterreactor/IoRegistry.hpp"
#include "filterreactor/ParameterStore.hpp"
#include "filterreactor/api/FilterReactorTypes.hpp"
#include "filterreactor/api/IFilterReactorHandle.hpp"
#include "filterreactor/api/IModuleAssembly.hpp"
#include "filterreactor/api/IReactorGeometry.hpp"
#include "filterreactor/api/ReactorError.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace FilterReactor {

// Edits one filter reactor: collects parameters and I/O, then commits them
// either as a new module or onto the live module it was opened for.
//
// Creating is all or nothing. Updating first checks the new parameters on
// a throw-away build, so the live module is untouched when they cannot be
// built. Once that check passes, scalar parameters are applied even if
// attaching the I/O fails afterwards; the live module then keeps the new
// parameters without the failed I/O. That partial update is kept on purpose
// and is reported through errorReported().
class FILTERREACTOR_EXPORT FilterReactorEditor final : public QObject {
    Q_OBJECT

public:
    // liveModule is owned by the assembly; nullptr means a new module is
    // being created. New modules usually start from
    // FilterReactorSettings::defaults().
    FilterReactorEditor(const IReactorGeometry& geometry,
                        IModuleAssembly& assembly,
                        IFilterReactorHandle* liveModule = nullptr,
                        ReactorParameters defaults = {},
                        LoggingCategoryFn log = &filterreactorlog,
                        QObject* parent = nullptr);

    ParameterStore& parameters() noexcept { return m_store; }
    const ParameterStore& parameters() const noexcept { return m_store; }
    const IoRegistry& io() const noexcept { return m_io; }

    bool isEditing() const noexcept { return m_module != nullptr; }
    CommitState state() const noexcept { return m_state; }

    ReactorError addOrUpdateIo(IoKind kind, IoDescriptor descriptor);
    bool selectIo(IoKind kind, const QString& name);
    ReactorError deleteSelectedIo();
    ReactorError deleteIo(IoKind kind, const QString& name);

    // Stored descriptor, used to prefill the I/O dialog.
    std::optional<IoDescriptor> ioForEdit(IoKind kind, const QString& name) const;

    ReactorError commit();
    ReactorError deleteModule();

signals:
    void stateChanged(FilterReactor::CommitState state);
    void errorReported(FilterReactor::ReactorErrorCode code, const QString& title, const QString& message);
    void ioChanged();
    void moduleCommitted();
    void moduleDeleted();

private:
    void restoreParameters();
    void restoreIo();

    ReactorError buildNewModule(const ReactorParameters& params);
    ReactorError updateModule(const ReactorParameters& params);
    ReactorError applyParameters(const ReactorParameters& params);
    ReactorError applyPendingDetachments();

    ReactorError buildInputs(IFilterReactorHandle& reactor);
    ReactorError buildOutputs(IFilterReactorHandle& reactor);
    ReactorError buildTopInlets(IFilterReactorHandle& reactor);
    ReactorError buildIo(IFilterReactorHandle& reactor);

    void stagedDelete(const IoKey& key);
    void rememberLiveIo();
    void readBackLiveIo();

    ReactorError fail(const ReactorError& cause, const QString& title, const QString& message);
    void setState(CommitState state);

    const IReactorGeometry& m_geometry;
    IModuleAssembly& m_assembly;
    IFilterReactorHandle* m_module = nullptr;
    LoggingCategoryFn m_log;

    ParameterStore m_store;
    IoRegistry m_io;
    CommitState m_state = CommitState::Idle;

    // I/O present on the live module, and those the user deleted since.
    QVector<IoKey> m_liveIo;
    QVector<IoKey> m_pendingDetach;
};

} // namespace FilterReactor
