// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filterreactor/FilterReactorEditor.hpp"

#include "filterreactor/ConstraintResolver.hpp"
#include "filterreactor/FilterReactorLabels.hpp"

#include <functional>
#include <utility>

Q_LOGGING_CATEGORY(filterreactorlog, "chemscad.filterreactor")

namespace FilterReactor {

namespace {

const QString kCreationTitle = QStringLiteral("Creation error");
const QString kIoTitle = QStringLiteral("I/Os error");
const QString kPlacementTitle = QStringLiteral("Auto-placement error");
const QString kUpdateTitle = QStringLiteral("Update error");
const QString kRefreshTitle = QStringLiteral("Refresh error");
const QString kDeletionTitle = QStringLiteral("Deletion error");

QString describe(const ReactorParameters& p)
{
    return QStringLiteral("volume=%1 top=%2 bottom=%3 h_filter=%4 d_filter=%5 d_pipe=%6 r=%7 r_constrained=%8 "
                          "align_top=%9 align_filter=%10")
        .arg(p.volume)
        .arg(Labels::token(p.topType), Labels::token(p.bottomType))
        .arg(p.filterHeight)
        .arg(p.filterDiameter)
        .arg(p.pipeDiameter)
        .arg(p.radius ? QString::number(*p.radius) : QStringLiteral("-"))
        .arg(p.radiusConstrained ? QStringLiteral("true") : QStringLiteral("false"))
        .arg(Labels::token(p.alignTopStrategy), Labels::token(p.alignFilterStrategy));
}

} // namespace

FilterReactorEditor::FilterReactorEditor(const IReactorGeometry& geometry,
                                         IModuleAssembly& assembly,
                                         IFilterReactorHandle* liveModule,
                                         ReactorParameters defaults,
                                         LoggingCategoryFn log,
                                         QObject* parent)
    : QObject(parent)
    , m_geometry(geometry)
    , m_assembly(assembly)
    , m_module(liveModule)
    , m_log(log ? log : &filterreactorlog)
    , m_store(std::move(defaults))
{
    qRegisterMetaType<FilterReactor::CommitState>("FilterReactor::CommitState");
    qRegisterMetaType<FilterReactor::ReactorErrorCode>("FilterReactor::ReactorErrorCode");

    if (!m_module)
        return;

    restoreParameters();
    restoreIo();
}

void FilterReactorEditor::restoreParameters()
{
    const ReactorParameters params = m_module->parameters();
    m_store.reset(params);

    qCDebug(m_log) << "Filter reactor, restored reactor:" << describe(m_store.read());
}

void FilterReactorEditor::restoreIo()
{
    m_io.clear();

    for (const SideIoDescriptor& in : m_module->inputs()) {
        qCDebug(m_log) << "Filter reactor, restoring input" << in.name << in.heightFraction;
        const ReactorError r = m_io.addOrUpdate(IoKind::SideInput, in);
        if (!r.ok())
            qCWarning(m_log) << "Skipping input" << in.name << r.message();
    }

    for (const SideIoDescriptor& out : m_module->outputs()) {
        qCDebug(m_log) << "Filter reactor, restoring output" << out.name << out.heightFraction;
        if (IoRegistry::isReserved(IoKind::SideOutput, out.name)) {
            m_io.setDefaultOutput(out);
            continue;
        }
        const ReactorError r = m_io.addOrUpdate(IoKind::SideOutput, out);
        if (!r.ok())
            qCWarning(m_log) << "Skipping output" << out.name << r.message();
    }

    for (TopInletDescriptor inlet : m_module->topInlets()) {
        // Top inlets never report a connection.
        inlet.connected = false;
        qCDebug(m_log) << "Filter reactor, restoring top inlet" << inlet.name << Labels::token(inlet.kind);
        const ReactorError r = m_io.addOrUpdate(IoKind::TopInlet, inlet);
        if (!r.ok())
            qCWarning(m_log) << "Skipping top inlet" << inlet.name << r.message();
    }

    rememberLiveIo();
    m_pendingDetach.clear();

    qCDebug(m_log) << "Filter reactor, restored I/O";
    emit ioChanged();
}

void FilterReactorEditor::rememberLiveIo()
{
    m_liveIo.clear();
    for (const IoKind kind : {IoKind::SideInput, IoKind::SideOutput, IoKind::TopInlet}) {
        for (const IoEntry& e : m_io.entries(kind)) {
            if (!IoRegistry::isReserved(kind, e.name()))
                m_liveIo.push_back(IoKey{kind, e.name()});
        }
    }
}

void FilterReactorEditor::readBackLiveIo()
{
    m_liveIo.clear();
    for (const SideIoDescriptor& in : m_module->inputs())
        m_liveIo.push_back(IoKey{IoKind::SideInput, in.name});
    for (const SideIoDescriptor& out : m_module->outputs()) {
        if (!IoRegistry::isReserved(IoKind::SideOutput, out.name))
            m_liveIo.push_back(IoKey{IoKind::SideOutput, out.name});
    }
    for (const TopInletDescriptor& inlet : m_module->topInlets())
        m_liveIo.push_back(IoKey{IoKind::TopInlet, inlet.name});
}

ReactorError FilterReactorEditor::addOrUpdateIo(IoKind kind, IoDescriptor descriptor)
{
    const QString name = descriptorName(descriptor);

    bool inserted = false;
    const ReactorError r = m_io.addOrUpdate(kind, std::move(descriptor), &inserted);
    if (!r.ok()) {
        qCDebug(m_log) << "Filter reactor, rejected I/O" << name << r.message();
        return r;
    }

    m_pendingDetach.removeAll(IoKey{kind, name.trimmed()});

    if (inserted)
        qCDebug(m_log) << "Filter reactor, adding I/O" << name;
    else
        qCDebug(m_log) << "Filter reactor, updating I/O" << name;

    emit ioChanged();
    return r;
}

bool FilterReactorEditor::selectIo(IoKind kind, const QString& name)
{
    return m_io.select(kind, name);
}

ReactorError FilterReactorEditor::deleteSelectedIo()
{
    IoKey removed;
    const ReactorError r = m_io.removeSelected(&removed);
    if (r.code() == ReactorErrorCode::Selection) {
        qCDebug(m_log) << "No I/O selected, can't delete";
        return r;
    }
    if (!r.ok())
        return r;

    stagedDelete(removed);
    return r;
}

ReactorError FilterReactorEditor::deleteIo(IoKind kind, const QString& name)
{
    const ReactorError r = m_io.remove(kind, name);
    if (r.code() == ReactorErrorCode::Selection) {
        qCDebug(m_log) << "Nothing to delete for" << name;
        return r;
    }
    if (!r.ok())
        return r;

    stagedDelete(IoKey{kind, name});
    return r;
}

void FilterReactorEditor::stagedDelete(const IoKey& key)
{
    qCDebug(m_log) << "Filter reactor, deleting I/O" << key.name;

    // The live module keeps the I/O until the next successful commit.
    if (m_liveIo.contains(key) && !m_pendingDetach.contains(key))
        m_pendingDetach.push_back(key);

    emit ioChanged();
}

std::optional<IoDescriptor> FilterReactorEditor::ioForEdit(IoKind kind, const QString& name) const
{
    if (IoRegistry::isReserved(kind, name))
        return std::nullopt;

    const IoEntry* entry = m_io.find(kind, name);
    if (!entry)
        return std::nullopt;

    qCDebug(m_log) << "Filter reactor, opening I/O" << name;
    return entry->descriptor;
}

ReactorError FilterReactorEditor::commit()
{
    setState(CommitState::Validating);

    const ReactorParameters params = m_store.read();
    qCDebug(m_log) << "Filter reactor, read form" << describe(params);

    return isEditing() ? updateModule(params) : buildNewModule(params);
}

ReactorError FilterReactorEditor::buildNewModule(const ReactorParameters& params)
{
    qCDebug(m_log) << "Filter reactor, buildNewModule";

    ReactorBuildRequest request;
    ReactorError r = makeBuildRequest(params, request);
    if (!r.ok())
        return fail(r, kCreationTitle, QStringLiteral("Impossible to create filter reactor: %1").arg(r.message()));

    setState(CommitState::CommittingNew);

    std::unique_ptr<IFilterReactorHandle> reactor;
    r = m_geometry.construct(request, reactor);
    if (r.ok() && !reactor)
        r = ReactorError(ReactorErrorCode::Construction, QStringLiteral("the geometry library returned no reactor"));
    if (!r.ok())
        return fail(r, kCreationTitle, QStringLiteral("Impossible to create filter reactor: %1").arg(r.message()));

    // A fresh reactor with missing I/O is dropped here, never handed over.
    r = buildIo(*reactor);
    if (!r.ok())
        return fail(r, kIoTitle, QStringLiteral("Impossible to create I/Os: %1").arg(r.message()));

    r = m_assembly.buildModule(std::move(reactor));
    if (!r.ok())
        return fail(r, kCreationTitle, QStringLiteral("Impossible to create filter reactor: %1").arg(r.message()));

    setState(CommitState::Done);
    emit moduleCommitted();
    return ReactorError::none();
}

ReactorError FilterReactorEditor::updateModule(const ReactorParameters& params)
{
    qCDebug(m_log) << "Filter reactor, updateModule";

    ReactorBuildRequest request;
    ReactorError r = makeBuildRequest(params, request);
    if (r.ok())
        r = m_geometry.validate(request);
    if (!r.ok())
        return fail(r, kUpdateTitle, QStringLiteral("Impossible to update reactor: %1").arg(r.message()));

    setState(CommitState::CommittingUpdate);

    r = applyParameters(params);
    if (!r.ok())
        return fail(r, kUpdateTitle, QStringLiteral("Impossible to update reactor: %1").arg(r.message()));

    // From here on the new parameters stay, even if the I/O cannot be attached.
    r = applyPendingDetachments();
    if (r.ok())
        r = buildIo(*m_module);
    if (!r.ok()) {
        // Part of the I/O may be attached or detached by now.
        readBackLiveIo();
        return fail(r, kIoTitle, QStringLiteral("Impossible to create I/Os: %1").arg(r.message()));
    }

    rememberLiveIo();
    m_pendingDetach.clear();

    r = m_assembly.refresh();
    if (!r.ok()) {
        const ReactorError refreshError(ReactorErrorCode::Refresh, r.message());
        return fail(refreshError, kRefreshTitle,
                    QStringLiteral("Impossible to refresh filter reactor: %1").arg(r.message()));
    }

    setState(CommitState::Done);
    emit moduleCommitted();
    return ReactorError::none();
}

ReactorError FilterReactorEditor::applyParameters(const ReactorParameters& params)
{
    qCDebug(m_log) << "Filter reactor, applying parameters to the live reactor";

    // Radius goes first: releasing the constraint has to recalculate the
    // reactor before the other fields are applied.
    ReactorError r;
    if (params.radiusConstrained && !isThreadedTop(params.topType) && params.radius)
        r = m_module->setRadius(*params.radius);
    else
        r = m_module->setRadiusConstrained(false);
    if (!r.ok())
        return r;

    IFilterReactorHandle& reactor = *m_module;
    const QVector<std::function<ReactorError()>> setters{
        [&] { return reactor.setVolume(params.volume); },
        [&] { return reactor.setTopType(params.topType); },
        [&] { return reactor.setBottomType(params.bottomType); },
        [&] { return reactor.setPipeDiameter(params.pipeDiameter); },
        [&] { return reactor.setFilterHeight(params.filterHeight); },
        [&] { return reactor.setFilterDiameter(params.filterDiameter); },
        [&] { return reactor.setAlignTopStrategy(params.alignTopStrategy); },
        [&] { return reactor.setAlignFilterStrategy(params.alignFilterStrategy); },
    };

    for (const auto& set : setters) {
        r = set();
        if (!r.ok())
            return r;
    }
    return ReactorError::none();
}

ReactorError FilterReactorEditor::applyPendingDetachments()
{
    while (!m_pendingDetach.isEmpty()) {
        const IoKey key = m_pendingDetach.constFirst();
        ReactorError r;
        switch (key.kind) {
        case IoKind::SideInput:
            r = m_module->detachInput(key.name);
            break;
        case IoKind::SideOutput:
            r = m_module->detachOutput(key.name);
            break;
        case IoKind::TopInlet:
            r = m_module->detachTopInlet(key.name);
            break;
        }
        if (!r.ok())
            return r;
        m_pendingDetach.removeFirst();
        qCDebug(m_log) << "Filter reactor, detached I/O" << key.name;
    }
    return ReactorError::none();
}

ReactorError FilterReactorEditor::buildIo(IFilterReactorHandle& reactor)
{
    ReactorError r = buildInputs(reactor);
    if (r.ok())
        r = buildOutputs(reactor);
    if (r.ok())
        r = buildTopInlets(reactor);
    return r;
}

ReactorError FilterReactorEditor::buildInputs(IFilterReactorHandle& reactor)
{
    qCDebug(m_log) << "Filter reactor, building inputs";

    for (const IoEntry& e : m_io.entries(IoKind::SideInput)) {
        const ReactorError r = reactor.attachInput(std::get<SideIoDescriptor>(e.descriptor));
        if (!r.ok())
            return r;
    }
    return ReactorError::none();
}

ReactorError FilterReactorEditor::buildOutputs(IFilterReactorHandle& reactor)
{
    qCDebug(m_log) << "Filter reactor, building outputs";

    for (const IoEntry& e : m_io.entries(IoKind::SideOutput)) {
        // The geometry library creates the default output itself.
        if (IoRegistry::isReserved(IoKind::SideOutput, e.name()))
            continue;

        const ReactorError r = reactor.attachOutput(std::get<SideIoDescriptor>(e.descriptor));
        if (!r.ok())
            return r;
    }
    return ReactorError::none();
}

ReactorError FilterReactorEditor::buildTopInlets(IFilterReactorHandle& reactor)
{
    qCDebug(m_log) << "Filter reactor, building top inlets";

    for (const IoEntry& e : m_io.entries(IoKind::TopInlet)) {
        const ReactorError r = reactor.attachTopInlet(std::get<TopInletDescriptor>(e.descriptor));
        if (r.code() == ReactorErrorCode::Incompatibility) {
            qCDebug(m_log) << "can't build top inlet: no custom top";
            return ReactorError::none();
        }
        if (!r.ok())
            return r;
    }

    // Only auto-placement exists for now.
    const ReactorError r = reactor.autoPlaceTopInlets();
    if (r.code() == ReactorErrorCode::Incompatibility) {
        qCDebug(m_log) << "No top inlets to place on this top";
        return ReactorError::none();
    }
    if (r.isPlacementFailure()) {
        qCWarning(m_log) << "Can't auto-place top inlets, collision ?" << r.message();
        emit errorReported(r.code(), kPlacementTitle, QStringLiteral("Impossible to auto-place the top inlets. Collision ?"));
        return ReactorError::none();
    }
    return r;
}

ReactorError FilterReactorEditor::deleteModule()
{
    if (!m_module)
        return ReactorError(ReactorErrorCode::InvalidArgument, QStringLiteral("No module to delete."));

    qCDebug(m_log) << "Reactor, deleteModule";

    const ReactorError r = m_assembly.deleteModule(m_module);
    if (!r.ok()) {
        const QString message = QStringLiteral("Impossible to delete filter reactor: %1").arg(r.message());
        qCWarning(m_log) << message;
        emit errorReported(r.code(), kDeletionTitle, message);
        return r;
    }

    m_module = nullptr;
    m_liveIo.clear();
    m_pendingDetach.clear();
    emit moduleDeleted();
    return r;
}

ReactorError FilterReactorEditor::fail(const ReactorError& cause, const QString& title, const QString& message)
{
    qCWarning(m_log) << title << message;
    setState(CommitState::Failed);
    emit errorReported(cause.code(), title, message);
    return cause;
}

void FilterReactorEditor::setState(CommitState state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(m_state);
}

} // namespace FilterReactor
