#ifndef DEVICETRANSPORT_H
#define DEVICETRANSPORT_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QUrl>

struct TransportReply {
    int statusCode = 0;   // 0 when no HTTP response was received
    QByteArray body;
    QString errorString;  // set when the request never produced a response

    bool hasResponse() const { return statusCode != 0; }
    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    static TransportReply failure(const QString& error) {
        TransportReply reply;
        reply.errorString = error;
        return reply;
    }
};

struct MultipartField {
    QString name;
    QByteArray value;
};

/**
 * DeviceTransport
 *
 * Raw HTTP capability used by DeviceClient. Implementations block the calling
 * thread until the reply arrives or the timeout elapses, and must tolerate
 * concurrent calls from several worker threads.
 */
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual TransportReply get(const QUrl& url, int timeoutMs) = 0;

    // form-data POST: plain fields first, then the file part streamed from disk
    virtual TransportReply postMultipart(const QUrl& url,
                                         const QList<MultipartField>& fields,
                                         const QString& fileFieldName,
                                         const QString& localFilePath,
                                         int timeoutMs) = 0;
};

#endif // DEVICETRANSPORT_H
