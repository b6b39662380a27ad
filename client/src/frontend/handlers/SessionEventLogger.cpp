#include "frontend/handlers/SessionEventLogger.h"
#include "backend/domain/session/SessionManager.h"
#include <QDebug>

SessionEventLogger::SessionEventLogger(QObject* parent)
    : QObject(parent)
{
}

void SessionEventLogger::attach(SessionManager* sessionManager)
{
    if (!sessionManager || m_sessionManager == sessionManager) return;
    if (m_sessionManager) {
        QObject::disconnect(m_sessionManager, nullptr, this, nullptr);
    }
    m_sessionManager = sessionManager;

    connect(sessionManager, &SessionManager::connectionStateChanged, this, [](ConnectionState state) {
        qInfo().noquote() << "[SESSION] state:" << connectionStateName(state);
    });

    connect(sessionManager, &SessionManager::statusTextChanged, this, [](const QString& text) {
        qInfo().noquote() << "[SESSION] status:" << text;
    });

    connect(sessionManager, &SessionManager::catalogUpdated, this,
            [](const QList<RemoteFile>& files, const QStringList& changedNames) {
        qInfo().noquote() << "[CATALOG]" << files.size() << "file(s) on device";
        for (const RemoteFile& file : files) {
            const QString flag = changedNames.contains(file.name) ? QStringLiteral(" *") : QString();
            qInfo().noquote() << "[CATALOG]  " << file.name << file.sizeBytes << "bytes" + flag;
        }
    });

    // Ticks are frequent; only log once every highlight has faded
    connect(sessionManager, &SessionManager::changeMarkersTicked, this, [](const QHash<QString, int>& remaining) {
        if (remaining.isEmpty()) {
            qDebug().noquote() << "[CATALOG] all change highlights faded";
        }
    });

    connect(sessionManager, &SessionManager::heartbeatObserved, this, [this]() {
        ++m_heartbeatCount;
        qDebug().noquote() << "[SESSION] heartbeat" << m_heartbeatCount;
    });

    connect(sessionManager, &SessionManager::operationError, this, [](const QString& context, const QString& message) {
        qWarning().noquote() << QString("[%1] FAILED: %2").arg(context.toUpper(), message);
    });

    connect(sessionManager, &SessionManager::batchCompleted, this,
            [](BatchKind kind, const QList<BatchItemResult>& results) {
        for (const BatchItemResult& result : results) {
            if (result.outcome.success) {
                qInfo().noquote() << QString("[%1] OK %2").arg(batchKindName(kind).toUpper(), result.remoteName);
            } else {
                qWarning().noquote() << QString("[%1] FAILED %2: %3")
                    .arg(batchKindName(kind).toUpper(), result.item, result.outcome.message);
            }
        }
    });
}
