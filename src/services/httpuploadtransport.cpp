#include "httpuploadtransport.h"
#include "utils/logging.h"

#include <QFile>
#include <QHttpMultiPart>
#include <QNetworkRequest>
#include <QTimer>

#include <memory>

namespace {

QString quoted(QString value)
{
    value.replace('\\', QLatin1String("\\\\"));
    value.replace('"', QLatin1String("\\\""));
    return QLatin1Char('"') + value + QLatin1Char('"');
}

void appendHeader(ResponseHeaders &parsed, const QString &name, const QString &value)
{
    const QString key = name.trimmed().toLower();
    if (key.isEmpty()) {
        return;
    }
    const QString trimmedValue = value.trimmed();
    auto it = parsed.find(key);
    if (it != parsed.end() && !it.value().isEmpty()) {
        it.value() += QStringLiteral(", ") + trimmedValue;
    } else {
        parsed.insert(key, trimmedValue);
    }
}

} // namespace

HttpUploadTransport::HttpUploadTransport(QObject *parent)
    : IUploadTransport(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
}

HttpUploadTransport::HttpUploadTransport(QNetworkAccessManager *manager, QObject *parent)
    : IUploadTransport(parent)
    , networkManager_(manager)
{
}

HttpUploadTransport::~HttpUploadTransport()
{
    // Replies may outlive us when the network manager is shared, so stop
    // them reporting into a half-destroyed object before aborting.
    const QList<QNetworkReply*> replies = pendingUploads_.keys();
    pendingUploads_.clear();
    for (QNetworkReply *reply : replies) {
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }
}

QNetworkRequest HttpUploadTransport::createRequest(const UploadRequest &upload) const
{
    QNetworkRequest request(upload.url);

    const auto cookieControl = upload.withCredentials
        ? QNetworkRequest::Automatic : QNetworkRequest::Manual;
    request.setAttribute(QNetworkRequest::CookieLoadControlAttribute, cookieControl);
    request.setAttribute(QNetworkRequest::CookieSaveControlAttribute, cookieControl);
    request.setAttribute(QNetworkRequest::AuthenticationReuseAttribute, cookieControl);

    if (upload.timeoutMs > 0) {
        request.setTransferTimeout(upload.timeoutMs);
    }

    for (const UploadHeader &header : upload.headers) {
        request.setRawHeader(header.name.toUtf8(), header.value.toUtf8());
    }

    return request;
}

void HttpUploadTransport::send(const UploadRequest &upload)
{
    auto file = std::make_unique<QFile>(upload.filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString error = file->errorString();
        qWarning() << "HttpUploadTransport: cannot open" << upload.filePath << ":" << error;
        failLater(upload.itemId, error);
        return;
    }

    QNetworkRequest request = createRequest(upload);
    const QByteArray verb = upload.method.toUpper().toUtf8();
    QNetworkReply *reply = nullptr;

    if (!upload.disableMultipart) {
        auto *multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

        QHttpPart filePart;
        filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                           QStringLiteral("form-data; name=%1; filename=%2")
                               .arg(quoted(upload.alias), quoted(upload.fileName)));
        filePart.setHeader(QNetworkRequest::ContentTypeHeader,
                           upload.mimeType.isEmpty()
                               ? QStringLiteral("application/octet-stream") : upload.mimeType);
        filePart.setBodyDevice(file.get());
        file.release()->setParent(multiPart);
        multiPart->append(filePart);

        for (auto it = upload.params.cbegin(); it != upload.params.cend(); ++it) {
            QHttpPart paramPart;
            paramPart.setHeader(QNetworkRequest::ContentDispositionHeader,
                                QStringLiteral("form-data; name=%1").arg(quoted(it.key())));
            paramPart.setBody(it.value().toUtf8());
            multiPart->append(paramPart);
        }

        reply = networkManager_->sendCustomRequest(request, verb, multiPart);
        multiPart->setParent(reply);
    } else {
        if (!request.hasRawHeader("Content-Type")) {
            request.setHeader(QNetworkRequest::ContentTypeHeader,
                              upload.mimeType.isEmpty()
                                  ? QStringLiteral("application/octet-stream") : upload.mimeType);
        }
        reply = networkManager_->sendCustomRequest(request, verb, file.get());
        file.release()->setParent(reply);
    }

    pendingUploads_.insert(reply, upload.itemId);
    LOG_VERBOSE() << "HttpUploadTransport:" << verb << upload.url.toString()
                  << "item" << upload.itemId
                  << (upload.disableMultipart ? "(raw)" : "(multipart)");

    const quint64 itemId = upload.itemId;
    connect(reply, &QNetworkReply::uploadProgress,
            this, [this, itemId](qint64 sent, qint64 total) {
        emit uploadProgress(itemId, sent, total);
    });
    connect(reply, &QNetworkReply::finished,
            this, [this, reply]() { onReplyFinished(reply); });
}

void HttpUploadTransport::abort(quint64 itemId)
{
    for (auto it = pendingUploads_.cbegin(); it != pendingUploads_.cend(); ++it) {
        if (it.value() == itemId) {
            abortRequested_.insert(itemId);
            // abort() emits finished() before returning
            it.key()->abort();
            return;
        }
    }
    LOG_VERBOSE() << "HttpUploadTransport: abort for unknown item" << itemId;
}

bool HttpUploadTransport::isActive(quint64 itemId) const
{
    for (auto it = pendingUploads_.cbegin(); it != pendingUploads_.cend(); ++it) {
        if (it.value() == itemId) {
            return true;
        }
    }
    return false;
}

void HttpUploadTransport::failLater(quint64 itemId, const QString &error)
{
    QTimer::singleShot(0, this, [this, itemId, error]() {
        UploadResponse response;
        response.errorString = error;
        emit uploadFinished(itemId, TransferOutcome::Error, response);
    });
}

void HttpUploadTransport::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();

    auto it = pendingUploads_.find(reply);
    if (it == pendingUploads_.end()) {
        return;
    }
    const quint64 itemId = it.value();
    pendingUploads_.erase(it);
    const bool aborted = abortRequested_.remove(itemId);

    UploadResponse response;
    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.headers = parseHeaders(reply->rawHeaderPairs());
    response.body = reply->readAll();

    TransferOutcome outcome;
    if (aborted) {
        outcome = TransferOutcome::Cancelled;
    } else if (response.status == 0) {
        // No HTTP response at all: connection refused, DNS failure, timeout
        outcome = TransferOutcome::Error;
        response.errorString = reply->errorString();
    } else {
        outcome = isSuccessCode(response.status) ? TransferOutcome::Success
                                                 : TransferOutcome::Error;
        if (reply->error() != QNetworkReply::NoError) {
            response.errorString = reply->errorString();
        }
    }

    if (outcome == TransferOutcome::Error) {
        qWarning() << "HttpUploadTransport: item" << itemId << "failed with status"
                   << response.status << response.errorString;
    } else {
        LOG_VERBOSE() << "HttpUploadTransport: item" << itemId
                      << transferOutcomeToString(outcome) << "status" << response.status;
    }

    emit uploadFinished(itemId, outcome, response);
}

ResponseHeaders HttpUploadTransport::parseHeaders(const QList<QNetworkReply::RawHeaderPair> &pairs)
{
    ResponseHeaders parsed;
    for (const auto &pair : pairs) {
        appendHeader(parsed, QString::fromUtf8(pair.first), QString::fromUtf8(pair.second));
    }
    return parsed;
}

ResponseHeaders HttpUploadTransport::parseHeaders(const QByteArray &block)
{
    ResponseHeaders parsed;
    const QList<QByteArray> lines = block.split('\n');
    for (const QByteArray &line : lines) {
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            continue;
        }
        appendHeader(parsed, QString::fromUtf8(line.left(colon)),
                     QString::fromUtf8(line.mid(colon + 1)));
    }
    return parsed;
}
