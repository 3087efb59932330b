/**
 * @file httpuploadtransport.h
 * @brief HTTP upload transport built on QNetworkAccessManager.
 *
 * Sends files as multipart/form-data or as a raw request body and reports
 * progress and completion through the IUploadTransport signals.
 */

#ifndef HTTPUPLOADTRANSPORT_H
#define HTTPUPLOADTRANSPORT_H

#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QSet>

#include "iuploadtransport.h"

/**
 * @brief Default network transport for the upload queue.
 *
 * Each send() issues one request:
 * - multipart mode: a form-data part named after the configured alias
 *   carrying the file (with its original name and content type), followed
 *   by one part per static param
 * - raw mode: the file contents as the request body
 *
 * Static headers are applied in order. The credentials flag controls cookie
 * and authentication reuse. A non-zero timeout is passed to
 * QNetworkRequest::setTransferTimeout().
 *
 * @par Example usage:
 * @code
 * HttpUploadTransport *http = new HttpUploadTransport(this);
 *
 * connect(http, &IUploadTransport::uploadFinished,
 *         this, &MyClass::onFinished);
 *
 * UploadRequest request;
 * request.itemId = 1;
 * request.filePath = "/tmp/photo.png";
 * request.fileName = "photo.png";
 * request.url = QUrl("https://example.com/upload");
 * http->send(request);
 * @endcode
 */
class HttpUploadTransport : public IUploadTransport
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transport with its own network manager.
     * @param parent Optional parent QObject for memory management.
     */
    explicit HttpUploadTransport(QObject *parent = nullptr);

    /**
     * @brief Constructs a transport sharing an existing network manager.
     * @param manager Network manager to send requests with (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit HttpUploadTransport(QNetworkAccessManager *manager, QObject *parent = nullptr);

    /**
     * @brief Destructor. Aborts any transfer still in progress.
     */
    ~HttpUploadTransport() override;

    void send(const UploadRequest &request) override;
    void abort(quint64 itemId) override;
    [[nodiscard]] bool isActive(quint64 itemId) const override;

    /**
     * @brief Returns the number of transfers currently in progress.
     */
    [[nodiscard]] int activeCount() const { return pendingUploads_.size(); }

    /**
     * @brief Reassembles response headers into a case-insensitive map.
     * @param pairs Raw header pairs as received.
     * @return Map of lower-cased names to values, repeats joined with ", ".
     */
    [[nodiscard]] static ResponseHeaders parseHeaders(
        const QList<QNetworkReply::RawHeaderPair> &pairs);

    /**
     * @brief Parses a raw "Name: value" header block.
     * @param block Header lines separated by newlines.
     * @return Map of lower-cased names to values, repeats joined with ", ".
     *
     * Lines without a name are skipped.
     */
    [[nodiscard]] static ResponseHeaders parseHeaders(const QByteArray &block);

private:
    void onReplyFinished(QNetworkReply *reply);
    void failLater(quint64 itemId, const QString &error);
    [[nodiscard]] QNetworkRequest createRequest(const UploadRequest &upload) const;

    // Network
    QNetworkAccessManager *networkManager_ = nullptr;

    // Transfer tracking
    QHash<QNetworkReply*, quint64> pendingUploads_;
    QSet<quint64> abortRequested_;
};

#endif // HTTPUPLOADTRANSPORT_H
