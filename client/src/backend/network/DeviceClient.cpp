#include "backend/network/DeviceClient.h"
#include "backend/network/DeviceTransport.h"
#include <QFileInfo>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QSet>
#include <QVariant>
#include <QDebug>

namespace {
DeviceError transportError(const TransportReply& reply) {
    if (!reply.hasResponse()) {
        return DeviceError(DeviceErrorKind::Transport, reply.errorString);
    }
    return DeviceError(DeviceErrorKind::Transport,
                       QStringLiteral("HTTP %1").arg(reply.statusCode),
                       QString::fromUtf8(reply.body));
}
}

DeviceClient::DeviceClient(std::shared_ptr<DeviceTransport> transport,
                           const QString& address,
                           quint16 port,
                           const Timeouts& timeouts)
    : m_transport(std::move(transport))
    , m_address(address.trimmed())
    , m_port(port)
    , m_timeouts(timeouts)
{
}

QString DeviceClient::baseUrl() const {
    return QStringLiteral("http://%1:%2").arg(m_address).arg(m_port);
}

QUrl DeviceClient::endpoint(const QString& route, const QString& key, const QByteArray& encodedValue) const {
    const QByteArray raw = baseUrl().toUtf8() + route.toUtf8() + '?' + key.toUtf8() + '=' + encodedValue;
    return QUrl::fromEncoded(raw, QUrl::StrictMode);
}

DeviceResult<QList<RemoteFile>> DeviceClient::listFiles(const QString& path) const {
    const QUrl url = endpoint(QStringLiteral("/files"), QStringLiteral("path"), QUrl::toPercentEncoding(path, "/"));
    const TransportReply reply = m_transport->get(url, m_timeouts.controlMs);
    if (!reply.isSuccess()) {
        const DeviceError error = transportError(reply);
        qWarning() << "DeviceClient: Failed to list files:" << error.reason;
        return DeviceResult<QList<RemoteFile>>::failure(error);
    }

    auto result = parseListing(reply.body);
    if (!result.ok) {
        qWarning() << "DeviceClient: Unexpected listing body:" << result.error.reason;
    } else {
        qDebug() << "DeviceClient: Listed" << result.value.size() << "files under" << path;
    }
    return result;
}

UploadOutcome DeviceClient::uploadFile(const QString& localPath, const QString& remotePath) const {
    const QFileInfo info(localPath);
    if (!info.isFile() || !info.isReadable()) {
        qWarning() << "DeviceClient: Cannot upload" << localPath << "- not a readable file";
        return UploadOutcome::failed(QStringLiteral("Not a readable file: %1").arg(localPath));
    }

    const QUrl url = endpoint(QStringLiteral("/upload"), QStringLiteral("path"), QUrl::toPercentEncoding(remotePath, "/"));
    const QList<MultipartField> fields = {
        {QStringLiteral("path"), remotePath.toUtf8()},
        {QStringLiteral("size"), QByteArray::number(info.size())}
    };

    const TransportReply reply = m_transport->postMultipart(url, fields, QStringLiteral("file"), localPath, m_timeouts.uploadMs);
    if (!reply.hasResponse()) {
        qWarning() << "DeviceClient: Upload error for" << info.fileName() << ":" << reply.errorString;
        return UploadOutcome::failed(QStringLiteral("Upload error: %1").arg(reply.errorString));
    }
    if (reply.statusCode != 200) {
        qWarning() << "DeviceClient: Upload failed for" << info.fileName() << "HTTP" << reply.statusCode << reply.body;
        return UploadOutcome::failed(QStringLiteral("Upload failed: HTTP %1").arg(reply.statusCode));
    }

    qInfo() << "DeviceClient: Uploaded" << info.fileName() << "(" << info.size() << "bytes)";
    return UploadOutcome::succeeded(QStringLiteral("Upload successful"));
}

DeleteOutcome DeviceClient::deleteFile(const QString& name) const {
    // The controller only acknowledges the command; whether the file existed is not reported.
    const QString command = QStringLiteral("$SD/Delete=") + name;
    const QUrl url = endpoint(QStringLiteral("/command"), QStringLiteral("commandText"), QUrl::toPercentEncoding(command));
    const TransportReply reply = m_transport->get(url, m_timeouts.controlMs);
    if (!reply.hasResponse()) {
        qWarning() << "DeviceClient: Delete error for" << name << ":" << reply.errorString;
        return DeleteOutcome::failed(QStringLiteral("Delete error: %1").arg(reply.errorString));
    }
    if (reply.statusCode != 200) {
        qWarning() << "DeviceClient: Delete failed for" << name << "HTTP" << reply.statusCode;
        return DeleteOutcome::failed(QStringLiteral("Delete failed: HTTP %1").arg(reply.statusCode));
    }

    qInfo() << "DeviceClient: Deleted" << name;
    return DeleteOutcome::succeeded(QStringLiteral("Delete command sent"));
}

DeviceResult<QString> DeviceClient::sendCommand(const QString& text) const {
    const QUrl url = endpoint(QStringLiteral("/command"), QStringLiteral("plain"), QUrl::toPercentEncoding(text));
    const TransportReply reply = m_transport->get(url, m_timeouts.controlMs);
    if (!reply.isSuccess()) {
        const DeviceError error = transportError(reply);
        qDebug() << "DeviceClient: Command" << text << "failed:" << error.reason;
        return DeviceResult<QString>::failure(error);
    }
    return DeviceResult<QString>::success(QString::fromUtf8(reply.body));
}

DeviceResult<DeviceIdentity> DeviceClient::queryIdentity() const {
    const DeviceResult<QString> response = sendCommand(IDENTITY_COMMAND);
    if (!response.ok) {
        return DeviceResult<DeviceIdentity>::failure(response.error);
    }
    return parseIdentity(response.value);
}

bool DeviceClient::isValidAddress(const QString& address) {
    static const QRegularExpression dottedQuad(QStringLiteral("^\\d{1,3}(\\.\\d{1,3}){3}$"));
    if (!dottedQuad.match(address).hasMatch()) {
        return false;
    }
    QHostAddress host;
    return host.setAddress(address) && host.protocol() == QAbstractSocket::IPv4Protocol;
}

DeviceResult<QList<RemoteFile>> DeviceClient::parseListing(const QByteArray& body) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return DeviceResult<QList<RemoteFile>>::failure(
            DeviceError(DeviceErrorKind::Protocol, parseError.errorString(), QString::fromUtf8(body)));
    }
    if (!doc.isObject() || !doc.object().value(QStringLiteral("files")).isArray()) {
        return DeviceResult<QList<RemoteFile>>::failure(
            DeviceError(DeviceErrorKind::Protocol, QStringLiteral("Missing \"files\" array"), QString::fromUtf8(body)));
    }

    QList<RemoteFile> files;
    QSet<QString> seen;
    const QJsonArray entries = doc.object().value(QStringLiteral("files")).toArray();
    for (const QJsonValue& entry : entries) {
        const QJsonObject obj = entry.toObject();
        const QString name = obj.value(QStringLiteral("name")).toString();
        if (name.isEmpty()) {
            qWarning() << "DeviceClient: Skipping listing entry without a name";
            continue;
        }
        if (seen.contains(name)) {
            qWarning() << "DeviceClient: Duplicate listing entry" << name << "ignored";
            continue;
        }
        seen.insert(name);
        const QJsonValue size = obj.value(QStringLiteral("size"));
        if (!size.isDouble() && !size.isUndefined()) {
            qDebug() << "DeviceClient: Non-numeric size for" << name << ":" << size.toVariant().toString() << "- reading as 0";
        }
        files.append(RemoteFile(name, static_cast<qint64>(size.toDouble(0))));
    }
    return DeviceResult<QList<RemoteFile>>::success(files);
}

DeviceResult<DeviceIdentity> DeviceClient::parseIdentity(const QString& body) {
    if (!body.contains(FIRMWARE_MARKER)) {
        return DeviceResult<DeviceIdentity>::failure(
            DeviceError(DeviceErrorKind::Protocol, QStringLiteral("Firmware marker missing, not a supported device"), body));
    }

    static const QRegularExpression staPattern(QStringLiteral("STA \\(([0-9A-F:]+)\\)"));
    const QRegularExpressionMatch match = staPattern.match(body);

    DeviceIdentity identity;
    identity.hardwareAddress = match.hasMatch() ? match.captured(1) : UNKNOWN_HARDWARE_ADDRESS;
    identity.firmwareInfo = body;
    return DeviceResult<DeviceIdentity>::success(identity);
}
