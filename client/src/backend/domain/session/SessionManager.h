#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include <QObject>
#include <QAtomicInteger>
#include <QHash>
#include <QList>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QTimer>
#include <memory>
#include "backend/domain/catalog/FileCatalog.h"
#include "backend/domain/session/SessionTypes.h"

class ConfigStore;
class DeviceClient;
class DeviceTransport;

/**
 * SessionManager
 *
 * Owns the live session with one laser controller:
 * - Connection lifecycle (identity handshake, disconnect, session replacement)
 * - Keepalive polling while connected
 * - Upload/delete batches with per-item outcomes
 * - The reconciled FileCatalog and its decaying change markers
 *
 * Every intent returns immediately. Network calls run on the manager's own thread
 * pool and report back through QFutureWatcher, so results are applied on the thread
 * that owns the manager, one at a time, in completion order. All session and
 * catalog state is mutated there and nowhere else.
 *
 * Cancellation is a generation counter: disconnect() and connectToDevice() bump it,
 * each worker captures the value it started under, and a result whose generation
 * is no longer current is dropped at the point it would be applied.
 */
class SessionManager : public QObject {
    Q_OBJECT

public:
    SessionManager(std::shared_ptr<DeviceTransport> transport, ConfigStore* configStore, QObject* parent = nullptr);
    ~SessionManager() override;

    void setOptions(const SessionOptions& options);
    const SessionOptions& options() const { return m_options; }

    // Intents (non-blocking)
    void connectToDevice(const QString& address);
    void disconnect();
    void refreshCatalog();
    void runUpload(const QStringList& localPaths);
    // Caller must have obtained the user's confirmation already
    void runDelete(const QStringList& names);
    void shutdown();

    // State
    ConnectionState connectionState() const { return m_session.connectionState; }
    bool isConnected() const { return m_session.connectionState == ConnectionState::Connected; }
    const Session& session() const { return m_session; }
    const FileCatalog& catalog() const { return m_catalog; }
    QString statusText() const { return m_statusText; }
    quint64 generation() const { return m_generation->loadAcquire(); }
    bool isRefreshInFlight() const { return m_refreshInFlight; }
    bool isBatchRunning(BatchKind kind) const;

signals:
    void connectionStateChanged(ConnectionState state);
    void catalogUpdated(const QList<RemoteFile>& files, const QStringList& changedNames);
    void changeMarkersTicked(const QHash<QString, int>& remainingTicks);
    void heartbeatObserved();
    void operationError(const QString& context, const QString& message);
    void batchCompleted(BatchKind kind, const QList<BatchItemResult>& results);
    void statusTextChanged(const QString& text);

private:
    template <typename Result, typename Work, typename Apply>
    void runWorker(Work work, Apply apply);

    void onHandshakeFinished(const DeviceResult<DeviceIdentity>& result);
    void requestRefresh(const QStringList& changedNames, bool afterBatch);
    void startRefresh(const QStringList& changedNames);
    void onRefreshFinished(const DeviceResult<QList<RemoteFile>>& result, const QStringList& changedNames);
    void onBatchFinished(BatchKind kind, const QList<BatchItemResult>& results);
    void onKeepaliveTimeout();
    void onMarkerTimeout();

    void teardownSession(const QString& reason);
    void setConnectionState(ConnectionState state);
    void setStatusText(const QString& text);
    QString connectedStatusText() const;
    void restartMarkerTimer();

    std::shared_ptr<DeviceTransport> m_transport;
    ConfigStore* m_configStore;
    SessionOptions m_options;

    Session m_session;
    std::shared_ptr<DeviceClient> m_client; // bound to m_session.deviceAddress while a session exists
    FileCatalog m_catalog;
    QString m_statusText;

    // Read by workers to stop early; written only here
    QSharedPointer<QAtomicInteger<quint64>> m_generation;

    bool m_refreshInFlight = false;
    bool m_refreshQueued = false;        // one follow-up refresh after the in-flight one
    QStringList m_queuedChangedNames;    // markers to apply with the follow-up refresh
    bool m_uploadRunning = false;
    bool m_deleteRunning = false;
    bool m_heartbeatInFlight = false;

    QTimer* m_keepaliveTimer;
    QTimer* m_markerTimer;
    QThreadPool m_workers;
};

#endif // SESSIONMANAGER_H
