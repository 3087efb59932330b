/**
 * @file uploaderoptions.h
 * @brief Layered configuration for the upload queue.
 *
 * Configuration is resolved from layers in increasing precedence:
 * built-in defaults < global options < instance options < call-site
 * options < per-item options. Each layer is an UploaderOptions where only
 * the fields that are set take part in the merge.
 */

#ifndef UPLOADEROPTIONS_H
#define UPLOADEROPTIONS_H

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <functional>
#include <optional>

#include "models/filecandidate.h"
#include "services/uploadtypes.h"

class UploadItem;
struct UploaderConfig;

/**
 * @brief What a filter gets to see besides the candidate itself.
 */
struct FilterContext {
    const UploaderConfig &config;   ///< Effective configuration of the admission
    int queueLength = 0;            ///< Queue length before the candidate is added
};

/// Predicate deciding whether a candidate may enter the queue
using FilterFunction = std::function<bool(const FileCandidate &, const FilterContext &)>;

/**
 * @brief A named admission filter.
 */
struct UploadFilter {
    QString name;
    FilterFunction fn;
};

using UploadFilterList = QList<UploadFilter>;

/// Per-item hook receiving the (transformed) response body, status and headers
using ItemResponseCallback = std::function<void(const UploadItem &item,
                                                const QByteArray &response,
                                                int status,
                                                const ResponseHeaders &headers)>;

/// One-shot completion handed to a caller-supplied transport
using UploadDoneCallback = std::function<void(const QByteArray &response)>;

/// Caller-supplied replacement for the network transport
using CustomTransportFunction = std::function<void(const UploadItem &item,
                                                   UploadDoneCallback done)>;

/// Hook applied to response bodies before they reach the item callbacks
using ResponseTransform = std::function<QByteArray(const QByteArray &response,
                                                   const ResponseHeaders &headers)>;

/**
 * @brief Optional lifecycle hooks.
 *
 * All hooks are invoked synchronously on the queue's thread. Unset hooks are
 * skipped.
 *
 * onFinished is the last step of a cascade and may delete the queue. Other
 * hooks run while the queue still uses its items and must not destroy it;
 * call deleteLater() on the queue instead.
 */
struct UploaderCallbacks {
    /// @name Queue hooks
    /// @{
    std::function<void(const UploadItem &item)> onFileQueued;
    std::function<void(const UploadItem *item)> onFileDequeued;   ///< nullptr after clearQueue()
    std::function<void()> onStart;
    std::function<void()> onCancel;
    std::function<void()> onFinished;
    std::function<void(const FileCandidate &candidate,
                       const UploadFilter &filter,
                       const UploaderConfig &config)> onError;   ///< Admission rejected
    /// @}

    /// @name Item hooks
    /// @{
    std::function<void(const UploadItem &item)> onUploadStart;
    std::function<void(const UploadItem &item, int progress, int totalProgress)> onUploadProgress;
    ItemResponseCallback onUploadSuccess;
    ItemResponseCallback onUploadError;
    ItemResponseCallback onUploadCancel;
    ItemResponseCallback onUploadComplete;
    /// @}

    /**
     * @brief Overrides hooks with those set in another layer.
     * @param overlay Hooks that take precedence where set.
     */
    void mergeFrom(const UploaderCallbacks &overlay);
};

/**
 * @brief One configuration layer. Unset fields defer to lower layers.
 */
struct UploaderOptions {
    std::optional<QUrl> url;
    std::optional<QString> method;
    std::optional<QString> alias;
    std::optional<bool> withCredentials;
    std::optional<bool> autoUpload;
    std::optional<int> limit;
    std::optional<qint64> size;
    std::optional<QStringList> mimes;
    std::optional<QStringList> types;
    std::optional<QMap<QString, QString>> params;
    std::optional<QList<UploadHeader>> headers;
    std::optional<bool> disableMultipart;
    std::optional<bool> removeAfterUpload;
    std::optional<int> timeoutMs;
    std::optional<UploadFilterList> filters;
    UploaderCallbacks callbacks;
    CustomTransportFunction uploadTransport;
    ResponseTransform transformResponse;

    /**
     * @brief Folds another layer on top of this one.
     * @param overlay Layer whose set fields win.
     * @return Reference to this layer.
     */
    UploaderOptions &mergeFrom(const UploaderOptions &overlay);
};

/**
 * @brief Fully resolved configuration used by the queue and its items.
 *
 * A default-constructed UploaderConfig holds the built-in defaults.
 */
struct UploaderConfig {
    QUrl url;
    QString method = QStringLiteral("POST");
    QString alias = QStringLiteral("file");
    bool withCredentials = true;
    bool autoUpload = false;            ///< Informational; the queue never starts on its own
    int limit = -1;                     ///< Queue length limit, -1 for none
    qint64 size = -1;                   ///< Per-file size limit in bytes, -1 for none
    std::optional<QStringList> mimes;   ///< Allowed mime types
    std::optional<QStringList> types;   ///< Allowed file-type classes
    QMap<QString, QString> params;
    QList<UploadHeader> headers;
    bool disableMultipart = false;
    bool removeAfterUpload = false;
    int timeoutMs = 0;
    UploaderCallbacks callbacks;
    CustomTransportFunction uploadTransport;
    ResponseTransform transformResponse;

    UploadFilterList userFilters;   ///< Filters as configured
    UploadFilterList filters;       ///< Built-in filters followed by userFilters

    /**
     * @brief Resolves a layer on top of this configuration.
     * @param layer The higher-precedence layer.
     * @return New configuration with built-in filters re-synthesized.
     */
    [[nodiscard]] UploaderConfig merged(const UploaderOptions &layer) const;

    /// @brief Looks up a filter by name in the effective filter list
    [[nodiscard]] const UploadFilter *findFilter(const QString &name) const;
};

#endif // UPLOADEROPTIONS_H
