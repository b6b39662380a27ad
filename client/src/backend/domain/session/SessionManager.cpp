#include "backend/domain/session/SessionManager.h"
#include "backend/managers/app/ConfigStore.h"
#include "backend/network/DeviceClient.h"
#include "backend/network/DeviceTransport.h"
#include <QtConcurrent/QtConcurrent>
#include <QFutureWatcher>
#include <QFileInfo>
#include <QDebug>

namespace {
const QString CONTEXT_CONNECT = QStringLiteral("connect");
const QString CONTEXT_REFRESH = QStringLiteral("refresh");

// Keepalive, refresh, both batch kinds, a handshake, plus stragglers from cancelled generations
constexpr int MAX_WORKER_THREADS = 16;
}

SessionManager::SessionManager(std::shared_ptr<DeviceTransport> transport, ConfigStore* configStore, QObject* parent)
    : QObject(parent)
    , m_transport(std::move(transport))
    , m_configStore(configStore)
    , m_statusText(QStringLiteral("Disconnected"))
    , m_generation(QSharedPointer<QAtomicInteger<quint64>>::create(0))
    , m_keepaliveTimer(new QTimer(this))
    , m_markerTimer(new QTimer(this))
{
    Q_ASSERT(m_transport);

    qRegisterMetaType<ConnectionState>("ConnectionState");
    qRegisterMetaType<BatchKind>("BatchKind");
    qRegisterMetaType<QList<RemoteFile>>("QList<RemoteFile>");
    qRegisterMetaType<QList<BatchItemResult>>("QList<BatchItemResult>");

    m_workers.setMaxThreadCount(MAX_WORKER_THREADS);

    m_keepaliveTimer->setInterval(m_options.keepaliveIntervalMs);
    connect(m_keepaliveTimer, &QTimer::timeout, this, &SessionManager::onKeepaliveTimeout);

    m_markerTimer->setInterval(m_options.markerTickMs);
    connect(m_markerTimer, &QTimer::timeout, this, &SessionManager::onMarkerTimeout);
}

SessionManager::~SessionManager() {
    m_generation->fetchAndAddOrdered(1);
    m_workers.clear();
    m_workers.waitForDone();
}

void SessionManager::setOptions(const SessionOptions& options) {
    const SessionOptions defaults;
    m_options = options;
    if (m_options.controlTimeoutMs <= 0) m_options.controlTimeoutMs = defaults.controlTimeoutMs;
    if (m_options.uploadTimeoutMs <= 0) m_options.uploadTimeoutMs = defaults.uploadTimeoutMs;
    if (m_options.keepaliveIntervalMs <= 0) m_options.keepaliveIntervalMs = defaults.keepaliveIntervalMs;
    if (m_options.markerTickMs <= 0) m_options.markerTickMs = defaults.markerTickMs;
    if (m_options.markerTicks <= 0) m_options.markerTicks = defaults.markerTicks;
    if (m_options.remotePath.isEmpty()) m_options.remotePath = defaults.remotePath;

    m_keepaliveTimer->setInterval(m_options.keepaliveIntervalMs);
    m_markerTimer->setInterval(m_options.markerTickMs);
}

bool SessionManager::isBatchRunning(BatchKind kind) const {
    return kind == BatchKind::Upload ? m_uploadRunning : m_deleteRunning;
}

template <typename Result, typename Work, typename Apply>
void SessionManager::runWorker(Work work, Apply apply) {
    const quint64 startedUnder = generation();
    auto* watcher = new QFutureWatcher<Result>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, startedUnder, apply]() {
        watcher->deleteLater();
        // Work dropped from the pool by shutdown() finishes without a result
        if (watcher->future().isCanceled() || watcher->future().resultCount() == 0) {
            return;
        }
        const Result result = watcher->result();
        if (startedUnder != generation()) {
            qDebug() << "SessionManager: Discarding result of cancelled generation" << startedUnder;
            return;
        }
        apply(result);
    });
    watcher->setFuture(QtConcurrent::run(&m_workers, std::move(work)));
}

// ---------------------------------------------------------------------------
// Connection lifecycle
// ---------------------------------------------------------------------------

void SessionManager::connectToDevice(const QString& address) {
    const QString trimmed = address.trimmed();
    if (!DeviceClient::isValidAddress(trimmed)) {
        qWarning() << "SessionManager: Invalid IP address:" << trimmed;
        setStatusText(QStringLiteral("Invalid IP"));
        const DeviceError error(DeviceErrorKind::InvalidAddress, QStringLiteral("Invalid address \"%1\"").arg(trimmed));
        emit operationError(CONTEXT_CONNECT, error.describe());
        return;
    }

    if (m_session.connectionState != ConnectionState::Disconnected) {
        teardownSession(QStringLiteral("replaced by a connection to %1").arg(trimmed));
    }

    m_generation->fetchAndAddOrdered(1);
    m_session = Session();
    m_session.deviceAddress = trimmed;

    DeviceClient::Timeouts timeouts;
    timeouts.controlMs = m_options.controlTimeoutMs;
    timeouts.uploadMs = m_options.uploadTimeoutMs;
    m_client = std::make_shared<DeviceClient>(m_transport, trimmed, m_options.port, timeouts);

    qInfo() << "SessionManager: Attempting to connect to" << trimmed;
    const quint64 current = generation();
    setConnectionState(ConnectionState::Connecting);
    if (generation() != current) return;
    setStatusText(QStringLiteral("Connecting..."));

    const std::shared_ptr<DeviceClient> client = m_client;
    runWorker<DeviceResult<DeviceIdentity>>(
        [client]() { return client->queryIdentity(); },
        [this](const DeviceResult<DeviceIdentity>& result) { onHandshakeFinished(result); });
}

void SessionManager::onHandshakeFinished(const DeviceResult<DeviceIdentity>& result) {
    const QString address = m_session.deviceAddress;
    const quint64 current = generation();

    if (!result.ok) {
        qWarning() << "SessionManager: Could not connect to device at" << address << "-" << result.error.describe();
        m_session.lastError = result.error;
        m_session.hasError = true;
        m_session.identity = DeviceIdentity();
        m_client.reset();

        setConnectionState(ConnectionState::Failed);
        if (generation() != current) return;
        emit operationError(CONTEXT_CONNECT, result.error.describe());
        if (generation() != current) return;
        setConnectionState(ConnectionState::Disconnected);
        setStatusText(QStringLiteral("Connection Failed"));
        return;
    }

    m_session.identity = result.value;
    m_session.hasError = false;
    m_session.lastError = DeviceError();

    if (m_configStore) {
        if (!m_configStore->save(DeviceConfig{result.value.hardwareAddress, address})) {
            qWarning() << "SessionManager: Could not persist last device" << address;
        }
    }

    qInfo() << "SessionManager: Connected to" << address << "(MAC:" << result.value.hardwareAddress << ")";
    m_keepaliveTimer->start(m_options.keepaliveIntervalMs);
    setConnectionState(ConnectionState::Connected);
    if (generation() != current) return;
    setStatusText(connectedStatusText());
    refreshCatalog();
}

void SessionManager::disconnect() {
    if (m_session.connectionState == ConnectionState::Disconnected) {
        qDebug() << "SessionManager: Already disconnected";
        return;
    }
    teardownSession(QStringLiteral("disconnected by user"));
}

void SessionManager::shutdown() {
    qInfo() << "SessionManager: Shutdown requested";
    if (m_session.connectionState != ConnectionState::Disconnected) {
        teardownSession(QStringLiteral("application shutdown"));
    } else {
        m_generation->fetchAndAddOrdered(1);
    }
    m_keepaliveTimer->stop();
    m_markerTimer->stop();
    m_workers.clear();
}

void SessionManager::teardownSession(const QString& reason) {
    // Everything in flight now belongs to a dead generation
    m_generation->fetchAndAddOrdered(1);
    m_keepaliveTimer->stop();
    m_markerTimer->stop();

    m_refreshInFlight = false;
    m_refreshQueued = false;
    m_queuedChangedNames.clear();
    m_uploadRunning = false;
    m_deleteRunning = false;
    m_heartbeatInFlight = false;

    const bool hadCatalog = !m_catalog.isEmpty() || m_catalog.hasActiveMarkers();
    m_catalog.clear();
    m_client.reset();

    const QString address = m_session.deviceAddress;
    m_session = Session();
    qInfo() << "SessionManager: Disconnected from" << address << "-" << reason;

    const quint64 current = generation();
    setConnectionState(ConnectionState::Disconnected);
    if (generation() != current) return;
    if (hadCatalog) {
        emit catalogUpdated(QList<RemoteFile>(), QStringList());
        if (generation() != current) return;
    }
    setStatusText(QStringLiteral("Disconnected"));
}

void SessionManager::setConnectionState(ConnectionState state) {
    if (m_session.connectionState == state) return;
    m_session.connectionState = state;
    qDebug() << "SessionManager: State ->" << connectionStateName(state);
    emit connectionStateChanged(state);
}

void SessionManager::setStatusText(const QString& text) {
    if (m_statusText == text) return;
    m_statusText = text;
    emit statusTextChanged(text);
}

QString SessionManager::connectedStatusText() const {
    return QStringLiteral("Connected: %1 (%2)").arg(m_session.deviceAddress, m_session.identity.hardwareAddress);
}

// ---------------------------------------------------------------------------
// Keepalive
// ---------------------------------------------------------------------------

void SessionManager::onKeepaliveTimeout() {
    if (!isConnected()) {
        m_keepaliveTimer->stop();
        return;
    }
    if (m_heartbeatInFlight) {
        qDebug() << "SessionManager: Previous keepalive still pending, skipping tick";
        return;
    }

    m_heartbeatInFlight = true;
    const std::shared_ptr<DeviceClient> client = m_client;
    runWorker<DeviceResult<QString>>(
        [client]() { return client->sendCommand(DeviceClient::STATUS_COMMAND); },
        [this](const DeviceResult<QString>& result) {
            m_heartbeatInFlight = false;
            if (!result.ok) {
                // A missed heartbeat is not a disconnection
                qDebug() << "SessionManager: Keepalive failed:" << result.error.describe();
                return;
            }
            if (result.value.contains(QStringLiteral("error"), Qt::CaseInsensitive)) {
                qDebug() << "SessionManager: Keepalive check reported an error:" << result.value.trimmed();
                return;
            }
            emit heartbeatObserved();
        });
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

void SessionManager::refreshCatalog() {
    requestRefresh(QStringList(), false);
}

void SessionManager::requestRefresh(const QStringList& changedNames, bool afterBatch) {
    if (!isConnected()) {
        qDebug() << "SessionManager: Refresh ignored - not connected";
        return;
    }
    if (m_refreshInFlight) {
        if (afterBatch) {
            // The in-flight listing may predate the batch
            m_refreshQueued = true;
            m_queuedChangedNames.append(changedNames);
            qDebug() << "SessionManager: Refresh in flight, follow-up queued";
        } else {
            qDebug() << "SessionManager: Refresh already in flight, request coalesced";
        }
        return;
    }
    startRefresh(changedNames);
}

void SessionManager::startRefresh(const QStringList& changedNames) {
    m_refreshInFlight = true;
    const std::shared_ptr<DeviceClient> client = m_client;
    const QString remotePath = m_options.remotePath;
    runWorker<DeviceResult<QList<RemoteFile>>>(
        [client, remotePath]() { return client->listFiles(remotePath); },
        [this, changedNames](const DeviceResult<QList<RemoteFile>>& result) { onRefreshFinished(result, changedNames); });
}

void SessionManager::onRefreshFinished(const DeviceResult<QList<RemoteFile>>& result, const QStringList& changedNames) {
    m_refreshInFlight = false;
    const quint64 current = generation();

    if (result.ok) {
        m_catalog = m_catalog.withFiles(result.value);
        const QStringList marked = m_catalog.markChanged(changedNames, m_options.markerTicks);
        restartMarkerTimer();
        qDebug() << "SessionManager: Catalog refreshed -" << m_catalog.size() << "files," << marked.size() << "newly marked";
        emit catalogUpdated(m_catalog.files(), marked);
    } else {
        // Never drop a good catalog over a failed fetch
        qWarning() << "SessionManager: Catalog refresh failed, keeping" << m_catalog.size() << "entries:" << result.error.describe();
        emit operationError(CONTEXT_REFRESH, result.error.describe());
    }

    if (generation() != current || !m_refreshQueued || m_refreshInFlight || !isConnected()) {
        return;
    }
    const QStringList queuedNames = m_queuedChangedNames;
    m_refreshQueued = false;
    m_queuedChangedNames.clear();
    startRefresh(queuedNames);
}

void SessionManager::restartMarkerTimer() {
    if (!m_catalog.hasActiveMarkers()) {
        m_markerTimer->stop();
    } else if (!m_markerTimer->isActive()) {
        m_markerTimer->start(m_options.markerTickMs);
    }
}

void SessionManager::onMarkerTimeout() {
    if (!m_catalog.hasActiveMarkers()) {
        m_markerTimer->stop();
        return;
    }
    const QStringList expired = m_catalog.tickMarkers();
    if (!expired.isEmpty()) {
        qDebug() << "SessionManager: Change markers expired for" << expired;
    }
    if (!m_catalog.hasActiveMarkers()) {
        m_markerTimer->stop();
    }
    emit changeMarkersTicked(m_catalog.markerCountdowns());
}

// ---------------------------------------------------------------------------
// Batches
// ---------------------------------------------------------------------------

void SessionManager::runUpload(const QStringList& localPaths) {
    if (!isConnected()) {
        qWarning() << "SessionManager: Upload ignored - not connected";
        return;
    }
    if (localPaths.isEmpty()) return;
    if (m_uploadRunning) {
        qWarning() << "SessionManager: Upload ignored - another upload batch is running";
        emit operationError(batchKindName(BatchKind::Upload), QStringLiteral("An upload batch is already running"));
        return;
    }

    m_uploadRunning = true;
    qInfo() << "SessionManager: Starting upload of" << localPaths.size() << "files";
    setStatusText(QStringLiteral("Uploading %1 file(s)...").arg(localPaths.size()));

    const std::shared_ptr<DeviceClient> client = m_client;
    const QString remotePath = m_options.remotePath;
    const QSharedPointer<QAtomicInteger<quint64>> epoch = m_generation;
    const quint64 startedUnder = generation();
    runWorker<QList<BatchItemResult>>(
        [client, remotePath, localPaths, epoch, startedUnder]() {
            QList<BatchItemResult> results;
            for (const QString& path : localPaths) {
                if (epoch->loadAcquire() != startedUnder) break;
                const QFileInfo info(path);
                if (info.isDir()) continue;

                BatchItemResult item;
                item.item = path;
                item.remoteName = info.fileName();
                item.outcome = client->uploadFile(path, remotePath);
                if (!item.outcome.success) {
                    qWarning() << "SessionManager: Failed to upload" << item.remoteName << ":" << item.outcome.message;
                }
                results.append(item);
            }
            return results;
        },
        [this](const QList<BatchItemResult>& results) { onBatchFinished(BatchKind::Upload, results); });
}

void SessionManager::runDelete(const QStringList& names) {
    if (!isConnected()) {
        qWarning() << "SessionManager: Delete ignored - not connected";
        return;
    }
    if (names.isEmpty()) return;
    if (m_deleteRunning) {
        qWarning() << "SessionManager: Delete ignored - another delete batch is running";
        emit operationError(batchKindName(BatchKind::Delete), QStringLiteral("A delete batch is already running"));
        return;
    }

    m_deleteRunning = true;
    qInfo() << "SessionManager: Deleting" << names.size() << "files";
    setStatusText(QStringLiteral("Deleting %1 file(s)...").arg(names.size()));

    const std::shared_ptr<DeviceClient> client = m_client;
    const QSharedPointer<QAtomicInteger<quint64>> epoch = m_generation;
    const quint64 startedUnder = generation();
    runWorker<QList<BatchItemResult>>(
        [client, names, epoch, startedUnder]() {
            QList<BatchItemResult> results;
            for (const QString& name : names) {
                if (epoch->loadAcquire() != startedUnder) break;
                if (name.isEmpty()) continue;

                BatchItemResult item;
                item.item = name;
                item.remoteName = name;
                item.outcome = client->deleteFile(name);
                if (!item.outcome.success) {
                    qWarning() << "SessionManager: Failed to delete" << name << ":" << item.outcome.message;
                }
                results.append(item);
            }
            return results;
        },
        [this](const QList<BatchItemResult>& results) { onBatchFinished(BatchKind::Delete, results); });
}

void SessionManager::onBatchFinished(BatchKind kind, const QList<BatchItemResult>& results) {
    if (kind == BatchKind::Upload) {
        m_uploadRunning = false;
    } else {
        m_deleteRunning = false;
    }

    QStringList succeeded;
    int failed = 0;
    for (const BatchItemResult& result : results) {
        if (result.outcome.success) {
            succeeded.append(result.remoteName);
        } else {
            ++failed;
        }
    }
    qInfo() << "SessionManager:" << batchKindName(kind) << "batch finished -"
            << succeeded.size() << "succeeded," << failed << "failed";

    const quint64 current = generation();
    emit batchCompleted(kind, results);
    if (generation() != current) return;

    if (!m_uploadRunning && !m_deleteRunning) {
        setStatusText(connectedStatusText());
    }
    requestRefresh(kind == BatchKind::Upload ? succeeded : QStringList(), true);
}
