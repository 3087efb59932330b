/**
 * @file uploadqueue.h
 * @brief Ordered upload queue with single in-flight transfer.
 */

#ifndef UPLOADQUEUE_H
#define UPLOADQUEUE_H

#include <QAbstractListModel>
#include <QFileInfo>
#include <QList>
#include <QPointer>
#include <QStringList>
#include <memory>
#include <vector>

#include "models/filterchain.h"
#include "models/uploaderoptions.h"
#include "models/uploaditem.h"  // Full include needed for UploadItem::State in signals
#include "services/iuploadtransport.h"  // Full include needed for QPointer

/**
 * @brief Admits files, uploads them one at a time and tracks progress.
 *
 * Files pass through the configured filters on admission and become
 * UploadItems in insertion order. uploadItem() and uploadAll() mark items
 * ready; the queue sends the earliest ready item and, each time a transfer
 * ends, fires the item's hooks and moves on to the next ready item until
 * none are left. At most one item is ever uploading.
 *
 * Configuration is layered: global options (constructor), instance options
 * (constructor and setOptions()), call-site options (add()). Each item keeps
 * the configuration it was admitted with.
 *
 * @par Example usage:
 * @code
 * UploaderOptions options;
 * options.url = QUrl("https://example.com/upload");
 * options.limit = 10;
 * options.callbacks.onUploadSuccess = [](const UploadItem &item, const QByteArray &body,
 *                                        int status, const ResponseHeaders &) {
 *     qInfo() << item.file().name << status << body;
 * };
 *
 * UploadQueue *queue = new UploadQueue(options, {}, this);
 * queue->add(QStringList{"/tmp/a.png", "/tmp/b.png"});
 * queue->uploadAll();
 * @endcode
 */
class UploadQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        FileNameRole,
        FilePathRole,
        FileSizeRole,
        MimeTypeRole,
        StateRole,
        ProgressRole,
        ReadyRole,
        StatusCodeRole,
        ErrorMessageRole
    };

    /**
     * @brief Constructs an empty queue with default configuration.
     *
     * No transport is set; call setTransport() before uploading.
     */
    explicit UploadQueue(QObject *parent = nullptr);

    /**
     * @brief Constructs a queue with configuration and an HTTP transport.
     * @param options Instance options.
     * @param globalOptions Application-wide options, overridden by @p options.
     * @param parent Optional parent QObject for memory management.
     */
    explicit UploadQueue(const UploaderOptions &options,
                         const UploaderOptions &globalOptions = UploaderOptions(),
                         QObject *parent = nullptr);

    /**
     * @brief Destructor. Aborts the transfer in flight, if any.
     */
    ~UploadQueue() override;

    /**
     * @brief Sets the transport used for network uploads.
     * @param transport Transport to use (not owned).
     */
    void setTransport(IUploadTransport *transport);
    [[nodiscard]] IUploadTransport *transport() const { return transport_; }

    /**
     * @brief Merges options into the instance layer.
     * @param options Layer whose set fields override the current ones.
     * @param includeExistingQueue Re-resolve the configuration of queued items.
     */
    void setOptions(const UploaderOptions &options, bool includeExistingQueue = true);

    /// @brief Effective queue configuration
    [[nodiscard]] const UploaderConfig &config() const { return config_; }

    /// @name Admission
    /// @{
    void add(const QList<QFileInfo> &files,
             const UploaderOptions &options = UploaderOptions(),
             const FilterSelection &filters = FilterSelection());
    void add(const QStringList &paths,
             const UploaderOptions &options = UploaderOptions(),
             const FilterSelection &filters = FilterSelection());
    /// @}

    /// @name Control
    /// @{
    /**
     * @brief Marks an item ready and sends it unless a transfer is running.
     * @throws InvalidFileError if the item's file can no longer be read.
     */
    void uploadItem(const ItemRef &ref);

    /**
     * @brief Marks every item not yet uploaded as ready and starts sending.
     * @throws InvalidFileError if the first item's file can no longer be read.
     */
    void uploadAll();

    void cancelItem(const ItemRef &ref);
    void cancelAll();
    void removeFromQueue(const ItemRef &ref);
    void clearQueue();
    /// @}

    /// @name Queries
    /// @{
    [[nodiscard]] QList<const UploadItem*> items() const;
    [[nodiscard]] const UploadItem *item(const ItemRef &ref) const;
    [[nodiscard]] int count() const { return static_cast<int>(items_.size()); }
    [[nodiscard]] int progress() const { return progress_; }
    [[nodiscard]] bool isUploading() const { return uploading_; }
    [[nodiscard]] int notUploadedCount() const;
    [[nodiscard]] int uploadedCount() const;
    [[nodiscard]] QList<const UploadItem*> readyItems() const;
    /// @}

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

signals:
    void queueChanged();
    void progressChanged(int progress);
    void itemStateChanged(quint64 itemId, UploadItem::State state);

private slots:
    void onUploadProgress(quint64 itemId, qint64 sent, qint64 total);
    void onUploadFinished(quint64 itemId, TransferOutcome outcome, const UploadResponse &response);

private:
    // Keeps removed items alive until the outermost cascade returns
    class CascadeScope
    {
    public:
        explicit CascadeScope(UploadQueue *queue);
        ~CascadeScope();

    private:
        QPointer<UploadQueue> queue_;  // Cleared if onFinished deletes the queue
    };

    void resolveConfig();
    void admit(const FileCandidate &candidate, const UploaderConfig &config,
               const UploaderOptions &callSiteOptions, const UploadFilterList &filters);
    [[nodiscard]] int resolveRow(const ItemRef &ref) const;
    [[nodiscard]] int rowForId(quint64 id) const;
    [[nodiscard]] UploadItem *findItem(quint64 id) const;
    [[nodiscard]] UploadItem *firstReadyItem() const;

    void ensureReadable(UploadItem *item);
    void dispatch(UploadItem *item);
    void sendWithCustomTransport(UploadItem *item);
    void abortTransfer(const UploadItem *item);
    void finishTransfer(quint64 itemId, TransferOutcome outcome, const UploadResponse &response);
    void completeItem(UploadItem *item, TransferOutcome outcome, const UploadResponse &response);
    void advance();

    void spliceRow(int row);
    void retire(std::unique_ptr<UploadItem> item);
    [[nodiscard]] int totalProgress(int current = 0) const;
    void setProgress(int progress);
    void notifyItemChanged(const UploadItem *item);

    QPointer<IUploadTransport> transport_;

    UploaderOptions globalOptions_;
    UploaderOptions options_;
    UploaderConfig config_;

    std::vector<std::unique_ptr<UploadItem>> items_;
    std::vector<std::unique_ptr<UploadItem>> retired_;
    int cascadeDepth_ = 0;

    quint64 nextIndex_ = 1;
    int progress_ = 0;
    bool uploading_ = false;
    quint64 inFlightId_ = 0;
    bool inFlightCustom_ = false;
};

#endif // UPLOADQUEUE_H
