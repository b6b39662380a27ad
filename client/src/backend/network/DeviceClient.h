#ifndef DEVICECLIENT_H
#define DEVICECLIENT_H

#include <QString>
#include <QList>
#include <QByteArray>
#include <QUrl>
#include <memory>
#include "backend/domain/models/DeviceTypes.h"

class DeviceTransport;

/**
 * DeviceClient
 *
 * Typed operations of the laser controller's HTTP API:
 *   GET  /files?path=<path>                     -> {"files":[{"name":..,"size":..}]}
 *   POST /upload?path=<path>  (form: path, size, file)
 *   GET  /command?commandText=$SD/Delete=<name>
 *   GET  /command?plain=<command>               -> raw text ([ESP400] status, [ESP420] identity)
 *
 * Every call blocks on the transport and returns an outcome; nothing throws and
 * nothing is retried here. Instances are immutable and safe to share between
 * worker threads.
 */
class DeviceClient {
public:
    static constexpr quint16 DEFAULT_PORT = 8848;
    static constexpr int DEFAULT_CONTROL_TIMEOUT_MS = 5000;
    static constexpr int DEFAULT_UPLOAD_TIMEOUT_MS = 60000;

    struct Timeouts {
        int controlMs = DEFAULT_CONTROL_TIMEOUT_MS; // listing, commands, deletes
        int uploadMs = DEFAULT_UPLOAD_TIMEOUT_MS;
    };

    DeviceClient(std::shared_ptr<DeviceTransport> transport,
                 const QString& address,
                 quint16 port = DEFAULT_PORT,
                 const Timeouts& timeouts = Timeouts());

    QString address() const { return m_address; }
    quint16 port() const { return m_port; }
    QString baseUrl() const;
    const Timeouts& timeouts() const { return m_timeouts; }

    DeviceResult<QList<RemoteFile>> listFiles(const QString& path = QStringLiteral("/")) const;
    UploadOutcome uploadFile(const QString& localPath, const QString& remotePath = QStringLiteral("/")) const;
    DeleteOutcome deleteFile(const QString& name) const;
    DeviceResult<QString> sendCommand(const QString& text) const;
    DeviceResult<DeviceIdentity> queryIdentity() const;

    // IPv4 dotted-quad literal
    static bool isValidAddress(const QString& address);

    static DeviceResult<QList<RemoteFile>> parseListing(const QByteArray& body);
    static DeviceResult<DeviceIdentity> parseIdentity(const QString& body);

    static inline const QString STATUS_COMMAND = QStringLiteral("[ESP400]");
    static inline const QString IDENTITY_COMMAND = QStringLiteral("[ESP420]");
    static inline const QString FIRMWARE_MARKER = QStringLiteral("FW version");
    static inline const QString UNKNOWN_HARDWARE_ADDRESS = QStringLiteral("Unknown");

private:
    QUrl endpoint(const QString& route, const QString& key, const QByteArray& encodedValue) const;

    std::shared_ptr<DeviceTransport> m_transport;
    QString m_address;
    quint16 m_port;
    Timeouts m_timeouts;
};

#endif // DEVICECLIENT_H
