#ifndef DEVICETYPES_H
#define DEVICETYPES_H

#include <QString>
#include <QList>
#include <QMetaType>
#include <utility>

// One entry of the device's file listing. The listing order is the device's order.
struct RemoteFile {
    QString name;
    qint64 sizeBytes = 0;

    RemoteFile() = default;
    RemoteFile(const QString& fileName, qint64 size) : name(fileName), sizeBytes(size) {}

    bool operator==(const RemoteFile& other) const { return name == other.name && sizeBytes == other.sizeBytes; }
    bool operator!=(const RemoteFile& other) const { return !(*this == other); }
};

// Identity reported by the device during the handshake.
struct DeviceIdentity {
    QString hardwareAddress; // e.g. "AA:BB:CC:DD:EE:FF", or "Unknown" when not reported
    QString firmwareInfo;    // raw handshake body, kept for diagnostics

    bool isEmpty() const { return hardwareAddress.isEmpty(); }
};

enum class DeviceErrorKind {
    InvalidAddress,
    Transport,   // network failure, timeout, refused connection, non-2xx status
    Protocol,    // 2xx but unexpected or unparseable body, or identity marker missing
    ItemFailure  // a single item of a batch
};

struct DeviceError {
    DeviceErrorKind kind = DeviceErrorKind::Transport;
    QString reason;
    QString rawResponse;

    DeviceError() = default;
    DeviceError(DeviceErrorKind k, const QString& r, const QString& raw = QString())
        : kind(k), reason(r), rawResponse(raw) {}

    QString kindName() const {
        switch (kind) {
            case DeviceErrorKind::InvalidAddress: return QStringLiteral("InvalidAddress");
            case DeviceErrorKind::Transport: return QStringLiteral("TransportError");
            case DeviceErrorKind::Protocol: return QStringLiteral("ProtocolError");
            case DeviceErrorKind::ItemFailure: return QStringLiteral("ItemFailure");
        }
        return QStringLiteral("Error");
    }

    // "<Kind>: <reason>" plus the raw response when there is one
    QString describe() const {
        QString text = kindName() + QStringLiteral(": ") + reason;
        if (!rawResponse.isEmpty()) {
            text += QStringLiteral(" (response: ") + rawResponse.trimmed() + QStringLiteral(")");
        }
        return text;
    }
};

// Result-or-error outcome returned by every DeviceClient query.
template <typename T>
struct DeviceResult {
    bool ok = false;
    T value{};
    DeviceError error;

    static DeviceResult success(T v) {
        DeviceResult r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static DeviceResult failure(DeviceError e) {
        DeviceResult r;
        r.error = std::move(e);
        return r;
    }
};

// Outcome of a single upload or delete.
struct ItemOutcome {
    bool success = false;
    QString message;

    static ItemOutcome succeeded(const QString& msg = QString()) { return {true, msg}; }
    static ItemOutcome failed(const QString& msg) { return {false, msg}; }
};

using UploadOutcome = ItemOutcome;
using DeleteOutcome = ItemOutcome;

Q_DECLARE_METATYPE(RemoteFile)
Q_DECLARE_METATYPE(DeviceIdentity)

#endif // DEVICETYPES_H
