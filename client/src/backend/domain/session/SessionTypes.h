#ifndef SESSIONTYPES_H
#define SESSIONTYPES_H

#include <QString>
#include <QList>
#include <QMetaType>
#include "backend/domain/models/DeviceTypes.h"
#include "backend/network/DeviceClient.h"

// Per connect attempt: Disconnected -> Connecting -> {Connected | Failed} -> Disconnected
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

inline QString connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return QStringLiteral("Disconnected");
        case ConnectionState::Connecting: return QStringLiteral("Connecting");
        case ConnectionState::Connected: return QStringLiteral("Connected");
        case ConnectionState::Failed: return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

struct Session {
    QString deviceAddress;
    DeviceIdentity identity;
    ConnectionState connectionState = ConnectionState::Disconnected;
    DeviceError lastError;
    bool hasError = false;
};

enum class BatchKind {
    Upload,
    Delete
};

inline QString batchKindName(BatchKind kind) {
    return kind == BatchKind::Upload ? QStringLiteral("upload") : QStringLiteral("delete");
}

struct BatchItemResult {
    QString item;        // local path (upload) or remote name (delete)
    QString remoteName;  // name the item has on the device
    ItemOutcome outcome;
};

struct SessionOptions {
    quint16 port = DeviceClient::DEFAULT_PORT;
    QString remotePath = QStringLiteral("/");
    int controlTimeoutMs = DeviceClient::DEFAULT_CONTROL_TIMEOUT_MS;
    int uploadTimeoutMs = DeviceClient::DEFAULT_UPLOAD_TIMEOUT_MS;
    int keepaliveIntervalMs = 2000;
    int markerTicks = 15;
    int markerTickMs = 1000;
};

Q_DECLARE_METATYPE(ConnectionState)
Q_DECLARE_METATYPE(BatchKind)
Q_DECLARE_METATYPE(BatchItemResult)

#endif // SESSIONTYPES_H
