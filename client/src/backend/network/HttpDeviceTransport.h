#ifndef HTTPDEVICETRANSPORT_H
#define HTTPDEVICETRANSPORT_H

#include "backend/network/DeviceTransport.h"

class QNetworkAccessManager;
class QNetworkReply;

// DeviceTransport over QNetworkAccessManager. Each call builds its own manager in the
// calling thread and spins a local event loop until the reply finishes.
class HttpDeviceTransport : public DeviceTransport {
public:
    HttpDeviceTransport() = default;
    ~HttpDeviceTransport() override = default;

    HttpDeviceTransport(const HttpDeviceTransport&) = delete;
    HttpDeviceTransport& operator=(const HttpDeviceTransport&) = delete;

    TransportReply get(const QUrl& url, int timeoutMs) override;
    TransportReply postMultipart(const QUrl& url,
                                 const QList<MultipartField>& fields,
                                 const QString& fileFieldName,
                                 const QString& localFilePath,
                                 int timeoutMs) override;

private:
    static TransportReply waitForReply(QNetworkReply* reply, int timeoutMs);
};

#endif // HTTPDEVICETRANSPORT_H
