#include "backend/network/HttpDeviceTransport.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QEventLoop>
#include <QTimer>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

namespace {
QNetworkRequest buildRequest(const QUrl& url, int timeoutMs) {
    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs > 0 ? timeoutMs : QNetworkRequest::DefaultTransferTimeoutConstant);
    // The controller closes sockets aggressively; never reuse them.
    request.setRawHeader("Connection", "close");
    return request;
}

QString contentDisposition(const QString& name, const QString& fileName = QString()) {
    QString value = QStringLiteral("form-data; name=\"%1\"").arg(name);
    if (!fileName.isEmpty()) {
        value += QStringLiteral("; filename=\"%1\"").arg(fileName);
    }
    return value;
}
}

TransportReply HttpDeviceTransport::get(const QUrl& url, int timeoutMs) {
    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.get(buildRequest(url, timeoutMs));
    return waitForReply(reply, timeoutMs);
}

TransportReply HttpDeviceTransport::postMultipart(const QUrl& url,
                                                  const QList<MultipartField>& fields,
                                                  const QString& fileFieldName,
                                                  const QString& localFilePath,
                                                  int timeoutMs) {
    auto* file = new QFile(localFilePath);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString error = QStringLiteral("Cannot open %1: %2").arg(localFilePath, file->errorString());
        delete file;
        qWarning() << "HttpDeviceTransport:" << error;
        return TransportReply::failure(error);
    }

    auto* multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    for (const MultipartField& field : fields) {
        QHttpPart part;
        part.setHeader(QNetworkRequest::ContentDispositionHeader, contentDisposition(field.name));
        part.setBody(field.value);
        multiPart->append(part);
    }

    QHttpPart filePart;
    filePart.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/octet-stream"));
    filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       contentDisposition(fileFieldName, QFileInfo(localFilePath).fileName()));
    filePart.setBodyDevice(file);
    file->setParent(multiPart); // streamed, deleted together with the multipart body
    multiPart->append(filePart);

    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.post(buildRequest(url, timeoutMs), multiPart);
    multiPart->setParent(reply);
    return waitForReply(reply, timeoutMs);
}

TransportReply HttpDeviceTransport::waitForReply(QNetworkReply* reply, int timeoutMs) {
    if (!reply->isFinished()) {
        // setTransferTimeout only catches stalls; this caps the whole call
        if (timeoutMs > 0) {
            QTimer::singleShot(timeoutMs, reply, &QNetworkReply::abort);
        }
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    TransportReply result;
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (reply->error() == QNetworkReply::OperationCanceledError) {
        // Both timeouts end here, even when headers already arrived; the body is incomplete
        result.errorString = QStringLiteral("Request timed out");
    } else if (status.isValid()) {
        result.statusCode = status.toInt();
        result.body = reply->readAll();
    } else {
        result.errorString = reply->errorString();
    }
    delete reply;
    return result;
}
