/**
 * @file uploadtypes.h
 * @brief Value types exchanged between the upload queue and its transports.
 */

#ifndef UPLOADTYPES_H
#define UPLOADTYPES_H

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QUrl>

/**
 * @brief Parsed response headers.
 *
 * Header names are lower-cased. Repeated headers are joined with ", ".
 */
using ResponseHeaders = QMap<QString, QString>;

/**
 * @brief A static request header applied to every upload.
 */
struct UploadHeader {
    QString name;
    QString value;
};

/**
 * @brief Terminal result of a single transfer.
 */
enum class TransferOutcome {
    Success,    ///< 2xx or 304 response
    Error,      ///< Any other status, or a network-level failure
    Cancelled   ///< Transfer was aborted on request
};

/// @brief Convert TransferOutcome to string for logging
[[nodiscard]] inline const char* transferOutcomeToString(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Success: return "Success";
        case TransferOutcome::Error: return "Error";
        case TransferOutcome::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief What a transport reports back when a transfer ends.
 */
struct UploadResponse {
    QByteArray body;           ///< Raw response body
    int status = 0;            ///< HTTP status code (0 if none was received)
    ResponseHeaders headers;   ///< Parsed response headers
    QString errorString;       ///< Network error description, empty if none
};

/**
 * @brief Everything a transport needs to send one file.
 */
struct UploadRequest {
    quint64 itemId = 0;        ///< Queue item this transfer belongs to
    QString filePath;          ///< Local file to send
    QString fileName;          ///< Original file name reported to the server
    QString mimeType;          ///< Content type of the file part
    QUrl url;
    QString method = QStringLiteral("POST");
    QString alias = QStringLiteral("file");   ///< Multipart field name
    bool withCredentials = true;
    bool disableMultipart = false;
    QMap<QString, QString> params;   ///< Extra multipart form fields
    QList<UploadHeader> headers;
    int timeoutMs = 0;               ///< 0 disables the transfer timeout
};

Q_DECLARE_METATYPE(TransferOutcome)
Q_DECLARE_METATYPE(UploadResponse)

#endif // UPLOADTYPES_H
