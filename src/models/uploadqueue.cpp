#include "uploadqueue.h"
#include "services/httpuploadtransport.h"
#include "utils/logging.h"

#include <QDebug>
#include <QtMath>

UploadQueue::CascadeScope::CascadeScope(UploadQueue *queue)
    : queue_(queue)
{
    ++queue_->cascadeDepth_;
}

UploadQueue::CascadeScope::~CascadeScope()
{
    if (!queue_) {
        return;
    }
    if (--queue_->cascadeDepth_ == 0) {
        // Moved out first: destroying an item must not touch retired_
        std::vector<std::unique_ptr<UploadItem>> retired;
        retired.swap(queue_->retired_);
    }
}

UploadQueue::UploadQueue(QObject *parent)
    : QAbstractListModel(parent)
{
    resolveConfig();
}

UploadQueue::UploadQueue(const UploaderOptions &options, const UploaderOptions &globalOptions,
                         QObject *parent)
    : QAbstractListModel(parent)
    , globalOptions_(globalOptions)
    , options_(options)
{
    resolveConfig();
    setTransport(new HttpUploadTransport(this));
}

UploadQueue::~UploadQueue()
{
    // Disconnect before aborting: the abort may report back synchronously
    // and our members are already being torn down.
    if (transport_) {
        disconnect(transport_, nullptr, this, nullptr);
        if (uploading_ && !inFlightCustom_) {
            qDebug() << "UploadQueue: aborting item" << inFlightId_ << "on destruction";
            transport_->abort(inFlightId_);
        }
    }
}

void UploadQueue::setTransport(IUploadTransport *transport)
{
    if (transport_) {
        disconnect(transport_, nullptr, this, nullptr);
    }

    transport_ = transport;

    if (transport_) {
        connect(transport_, &IUploadTransport::uploadProgress,
                this, &UploadQueue::onUploadProgress);
        connect(transport_, &IUploadTransport::uploadFinished,
                this, &UploadQueue::onUploadFinished);
    }
}

void UploadQueue::resolveConfig()
{
    UploaderOptions layered = globalOptions_;
    layered.mergeFrom(options_);
    config_ = UploaderConfig().merged(layered);
}

void UploadQueue::setOptions(const UploaderOptions &options, bool includeExistingQueue)
{
    options_.mergeFrom(options);
    resolveConfig();

    if (includeExistingQueue) {
        for (const auto &item : items_) {
            item->setConfig(config_.merged(item->callSiteOptions()));
        }
    }

    LOG_VERBOSE() << "UploadQueue: options updated, filters:" << config_.filters.size()
                  << "existing items" << (includeExistingQueue ? "updated" : "kept");
}

// ============================================================================
// Admission
// ============================================================================

void UploadQueue::add(const QStringList &paths, const UploaderOptions &options,
                      const FilterSelection &filters)
{
    QList<QFileInfo> files;
    files.reserve(paths.size());
    for (const QString &path : paths) {
        files.append(QFileInfo(path));
    }
    add(files, options, filters);
}

void UploadQueue::add(const QList<QFileInfo> &files, const UploaderOptions &options,
                      const FilterSelection &filters)
{
    CascadeScope scope(this);

    const UploaderConfig config = config_.merged(options);
    const UploadFilterList selected = filters.resolve(config.filters);
    const int countBefore = count();

    for (const QFileInfo &info : files) {
        admit(FileCandidate::fromFileInfo(info), config, options, selected);
    }

    if (count() != countBefore) {
        emit queueChanged();
    }
}

void UploadQueue::admit(const FileCandidate &candidate, const UploaderConfig &config,
                        const UploaderOptions &callSiteOptions, const UploadFilterList &filters)
{
    const FilterContext context{config, count()};
    const FilterResult result = FilterChain::evaluate(candidate, filters, context);

    if (!result.passed) {
        const UploadFilter &filter = filters.at(result.failedIndex);
        qInfo() << "UploadQueue: rejected" << candidate.name << "by filter" << filter.name;
        if (config.callbacks.onError) {
            config.callbacks.onError(candidate, filter, config);
        }
        return;
    }

    auto created = std::make_unique<UploadItem>(nextIndex_++, candidate, callSiteOptions,
                                                config, this);
    UploadItem *item = created.get();

    const int row = count();
    beginInsertRows(QModelIndex(), row, row);
    items_.push_back(std::move(created));
    endInsertRows();

    LOG_VERBOSE() << "UploadQueue: queued" << candidate.name << "as item" << item->id();

    if (config.callbacks.onFileQueued) {
        config.callbacks.onFileQueued(*item);
    }
}

// ============================================================================
// Control
// ============================================================================

void UploadQueue::uploadItem(const ItemRef &ref)
{
    const int row = resolveRow(ref);
    if (row < 0) {
        return;
    }

    UploadItem *item = items_[row].get();
    ensureReadable(item);
    item->prepareToUpload();

    if (uploading_) {
        LOG_VERBOSE() << "UploadQueue: item" << item->id() << "waits for item" << inFlightId_;
        return;
    }
    dispatch(item);
}

void UploadQueue::uploadAll()
{
    QList<UploadItem*> pending;
    for (const auto &item : items_) {
        if (!item->isUploaded() && !item->isUploading()) {
            pending.append(item.get());
        }
    }
    if (pending.isEmpty()) {
        return;
    }

    for (UploadItem *item : pending) {
        item->prepareToUpload();
    }
    if (count() > 0) {
        emit dataChanged(index(0), index(count() - 1), {ReadyRole});
    }

    qDebug() << "UploadQueue: uploading" << pending.size() << "items";
    const auto onStart = config_.callbacks.onStart;
    if (onStart) {
        onStart();
    }

    if (uploading_) {
        return;
    }
    if (UploadItem *next = firstReadyItem()) {
        dispatch(next);
    }
}

void UploadQueue::cancelItem(const ItemRef &ref)
{
    const int row = resolveRow(ref);
    if (row < 0) {
        return;
    }

    const UploadItem *item = items_[row].get();
    if (!item->isUploading()) {
        LOG_VERBOSE() << "UploadQueue: item" << item->id() << "is not uploading, nothing to cancel";
        return;
    }
    abortTransfer(item);
}

void UploadQueue::cancelAll()
{
    // Waiting items lose their ready flag first so that the abort below
    // does not hand the transport the next item.
    for (const auto &item : items_) {
        if (!item->isUploading()) {
            item->clearReady();
        }
    }
    if (count() > 0) {
        emit dataChanged(index(0), index(count() - 1), {ReadyRole});
    }

    if (uploading_) {
        if (const UploadItem *current = findItem(inFlightId_)) {
            abortTransfer(current);
        }
    }

    qDebug() << "UploadQueue: cancelled all uploads";
    const auto onCancel = config_.callbacks.onCancel;
    if (onCancel) {
        onCancel();
    }
}

void UploadQueue::removeFromQueue(const ItemRef &ref)
{
    int row = resolveRow(ref);
    if (row < 0) {
        return;
    }

    const quint64 id = items_[row]->id();
    if (items_[row]->isUploading()) {
        abortTransfer(items_[row].get());
        // The abort may have run hooks that changed the queue
        row = rowForId(id);
        if (row < 0) {
            return;
        }
    }
    spliceRow(row);
}

void UploadQueue::clearQueue()
{
    CascadeScope scope(this);

    for (const auto &item : items_) {
        item->clearReady();
    }
    while (!items_.empty()) {
        removeFromQueue(ItemRef::atIndex(0));
    }

    setProgress(0);
    qDebug() << "UploadQueue: cleared";
    if (config_.callbacks.onFileDequeued) {
        config_.callbacks.onFileDequeued(nullptr);
    }
}

void UploadQueue::spliceRow(int row)
{
    beginRemoveRows(QModelIndex(), row, row);
    std::unique_ptr<UploadItem> removed = std::move(items_[row]);
    items_.erase(items_.begin() + row);
    endRemoveRows();

    removed->detach();
    LOG_VERBOSE() << "UploadQueue: removed item" << removed->id();

    setProgress(totalProgress());
    if (config_.callbacks.onFileDequeued) {
        config_.callbacks.onFileDequeued(removed.get());
    }
    emit queueChanged();

    retire(std::move(removed));
}

void UploadQueue::retire(std::unique_ptr<UploadItem> item)
{
    if (cascadeDepth_ > 0) {
        retired_.push_back(std::move(item));
    }
}

// ============================================================================
// Transfer
// ============================================================================

void UploadQueue::ensureReadable(UploadItem *item)
{
    if (item->config().uploadTransport) {
        return;
    }

    // A file missing at admission stays invalid even if it appears later
    const QFileInfo info(item->file().path);
    if (item->file().hasValidSize() && info.exists() && info.isFile() && info.isReadable()) {
        return;
    }

    item->clearReady();
    qWarning() << "UploadQueue: file of item" << item->id() << "is no longer valid:"
               << item->file().path;
    throw InvalidFileError(item->file().path);
}

void UploadQueue::dispatch(UploadItem *item)
{
    ensureReadable(item);

    CascadeScope scope(this);
    const quint64 id = item->id();

    uploading_ = true;
    inFlightId_ = id;
    inFlightCustom_ = static_cast<bool>(item->config().uploadTransport);

    item->beginUpload();
    notifyItemChanged(item);
    qDebug() << "UploadQueue: uploading item" << id << item->file().name;

    const auto onUploadStart = item->config().callbacks.onUploadStart;
    if (onUploadStart) {
        onUploadStart(*item);
        if (rowForId(id) < 0) {
            qDebug() << "UploadQueue: item" << id << "was removed before it was sent";
            advance();
            return;
        }
    }

    if (inFlightCustom_) {
        sendWithCustomTransport(item);
        return;
    }

    if (!transport_) {
        qWarning() << "UploadQueue: no transport set, cannot upload item" << id;
        UploadResponse response;
        response.errorString = QStringLiteral("No upload transport");
        finishTransfer(id, TransferOutcome::Error, response);
        return;
    }

    const UploaderConfig &config = item->config();
    UploadRequest request;
    request.itemId = id;
    request.filePath = item->file().path;
    request.fileName = item->file().name;
    request.mimeType = item->file().mimeType;
    request.url = config.url;
    request.method = config.method;
    request.alias = config.alias;
    request.withCredentials = config.withCredentials;
    request.disableMultipart = config.disableMultipart;
    request.params = config.params;
    request.headers = config.headers;
    request.timeoutMs = config.timeoutMs;

    transport_->send(request);
}

void UploadQueue::sendWithCustomTransport(UploadItem *item)
{
    const quint64 id = item->id();
    QPointer<UploadQueue> self(this);
    auto delivered = std::make_shared<bool>(false);

    UploadDoneCallback done = [self, delivered, id](const QByteArray &body) {
        if (*delivered) {
            LOG_VERBOSE() << "UploadQueue: ignoring repeated result for item" << id;
            return;
        }
        *delivered = true;
        if (!self) {
            return;
        }
        UploadResponse response;
        response.body = body;
        self->finishTransfer(id, TransferOutcome::Success, response);
    };

    const CustomTransportFunction transport = item->config().uploadTransport;
    transport(*item, done);
}

void UploadQueue::abortTransfer(const UploadItem *item)
{
    if (inFlightCustom_) {
        qWarning() << "UploadQueue: item" << item->id()
                   << "uses a caller-supplied transport and cannot be aborted";
        return;
    }
    if (!transport_) {
        return;
    }

    qDebug() << "UploadQueue: aborting item" << item->id();
    transport_->abort(item->id());
}

void UploadQueue::onUploadProgress(quint64 itemId, qint64 sent, qint64 total)
{
    if (!uploading_ || itemId != inFlightId_) {
        return;
    }
    UploadItem *item = findItem(itemId);
    if (!item) {
        return;
    }

    CascadeScope scope(this);
    const int percent = IUploadTransport::progressPercent(sent, total);
    item->setProgress(percent);
    setProgress(totalProgress(percent));

    const int row = rowForId(itemId);
    emit dataChanged(index(row), index(row), {ProgressRole});

    const auto onUploadProgress = item->config().callbacks.onUploadProgress;
    if (onUploadProgress) {
        onUploadProgress(*item, percent, progress_);
    }
}

void UploadQueue::onUploadFinished(quint64 itemId, TransferOutcome outcome,
                                   const UploadResponse &response)
{
    UploadResponse delivered = response;
    if (const UploadItem *item = findItem(itemId)) {
        if (item->config().transformResponse) {
            delivered.body = item->config().transformResponse(response.body, response.headers);
        }
    }
    finishTransfer(itemId, outcome, delivered);
}

void UploadQueue::finishTransfer(quint64 itemId, TransferOutcome outcome,
                                 const UploadResponse &response)
{
    if (!uploading_ || itemId != inFlightId_) {
        LOG_VERBOSE() << "UploadQueue: ignoring result for item" << itemId
                      << "(in flight:" << inFlightId_ << ")";
        return;
    }

    CascadeScope scope(this);
    if (UploadItem *item = findItem(itemId)) {
        completeItem(item, outcome, response);
    } else {
        qDebug() << "UploadQueue: item" << itemId << "left the queue during its transfer";
    }
    advance();
}

void UploadQueue::completeItem(UploadItem *item, TransferOutcome outcome,
                               const UploadResponse &response)
{
    item->finish(outcome, response);
    notifyItemChanged(item);

    if (outcome == TransferOutcome::Error) {
        qWarning() << "UploadQueue: item" << item->id() << item->file().name << "failed, status"
                   << response.status << response.errorString;
    } else {
        qDebug() << "UploadQueue: item" << item->id() << transferOutcomeToString(outcome)
                 << "status" << response.status;
    }

    // Copied: hooks may replace the item's configuration while they run
    const UploaderCallbacks hooks = item->config().callbacks;

    switch (outcome) {
    case TransferOutcome::Success:
        if (hooks.onUploadSuccess) {
            hooks.onUploadSuccess(*item, response.body, response.status, response.headers);
        }
        if (item->config().removeAfterUpload) {
            const int row = rowForId(item->id());
            if (row >= 0) {
                spliceRow(row);
            }
        }
        break;
    case TransferOutcome::Error:
        if (hooks.onUploadError) {
            hooks.onUploadError(*item, response.body, response.status, response.headers);
        }
        break;
    case TransferOutcome::Cancelled:
        if (hooks.onUploadCancel) {
            hooks.onUploadCancel(*item, response.body, response.status, response.headers);
        }
        break;
    }

    if (hooks.onUploadComplete) {
        hooks.onUploadComplete(*item, response.body, response.status, response.headers);
    }
}

void UploadQueue::advance()
{
    CascadeScope scope(this);

    uploading_ = false;
    inFlightId_ = 0;
    inFlightCustom_ = false;

    while (UploadItem *next = firstReadyItem()) {
        try {
            dispatch(next);
            return;
        } catch (const InvalidFileError &e) {
            // Hold the in-flight slot while the failure hooks run
            uploading_ = true;
            inFlightId_ = next->id();
            UploadResponse response;
            response.errorString = QString::fromUtf8(e.what());
            completeItem(next, TransferOutcome::Error, response);
            uploading_ = false;
            inFlightId_ = 0;
        }
    }

    setProgress(totalProgress());
    qDebug() << "UploadQueue: finished," << uploadedCount() << "of" << count() << "uploaded";
    const auto onFinished = config_.callbacks.onFinished;
    if (onFinished) {
        onFinished();
    }
}

// ============================================================================
// Queries
// ============================================================================

QList<const UploadItem*> UploadQueue::items() const
{
    QList<const UploadItem*> snapshot;
    snapshot.reserve(count());
    for (const auto &item : items_) {
        snapshot.append(item.get());
    }
    return snapshot;
}

const UploadItem *UploadQueue::item(const ItemRef &ref) const
{
    const int row = resolveRow(ref);
    return row < 0 ? nullptr : items_[row].get();
}

int UploadQueue::notUploadedCount() const
{
    int notUploaded = 0;
    for (const auto &item : items_) {
        if (!item->isUploaded()) {
            ++notUploaded;
        }
    }
    return notUploaded;
}

int UploadQueue::uploadedCount() const
{
    return count() - notUploadedCount();
}

QList<const UploadItem*> UploadQueue::readyItems() const
{
    // items_ is kept in insertion order, which is ascending index order
    QList<const UploadItem*> ready;
    for (const auto &item : items_) {
        if (item->isReady() && !item->isUploading()) {
            ready.append(item.get());
        }
    }
    return ready;
}

UploadItem *UploadQueue::firstReadyItem() const
{
    for (const auto &item : items_) {
        if (item->isReady() && !item->isUploading()) {
            return item.get();
        }
    }
    return nullptr;
}

int UploadQueue::resolveRow(const ItemRef &ref) const
{
    const int row = ref.isRow() ? ref.row() : rowForId(ref.id());
    if (row < 0 || row >= count()) {
        qWarning() << "UploadQueue: no item at" << qPrintable(ref.toString());
        return -1;
    }
    return row;
}

int UploadQueue::rowForId(quint64 id) const
{
    for (int i = 0; i < count(); ++i) {
        if (items_[i]->id() == id) {
            return i;
        }
    }
    return -1;
}

UploadItem *UploadQueue::findItem(quint64 id) const
{
    const int row = rowForId(id);
    return row < 0 ? nullptr : items_[row].get();
}

int UploadQueue::totalProgress(int current) const
{
    if (config_.removeAfterUpload) {
        return current;
    }
    const int total = count();
    if (total == 0) {
        return 100;
    }

    const int uploaded = total - notUploadedCount();
    const double ratio = 100.0 / total;
    return qRound(uploaded * ratio + current * ratio / 100.0);
}

void UploadQueue::setProgress(int progress)
{
    if (progress_ == progress) {
        return;
    }
    progress_ = progress;
    emit progressChanged(progress_);
}

void UploadQueue::notifyItemChanged(const UploadItem *item)
{
    const int row = rowForId(item->id());
    if (row >= 0) {
        emit dataChanged(index(row), index(row));
    }
    emit itemStateChanged(item->id(), item->state());
}

// ============================================================================
// QAbstractListModel interface
// ============================================================================

int UploadQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return count();
}

QVariant UploadQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= count()) {
        return QVariant();
    }

    const UploadItem &item = *items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return item.file().name;
    case IdRole:
        return item.id();
    case FilePathRole:
        return item.file().path;
    case FileSizeRole:
        return item.file().size;
    case MimeTypeRole:
        return item.file().mimeType;
    case StateRole:
        return static_cast<int>(item.state());
    case ProgressRole:
        return item.progress();
    case ReadyRole:
        return item.isReady();
    case StatusCodeRole:
        return item.status();
    case ErrorMessageRole:
        return item.response().errorString;
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> UploadQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[IdRole] = "itemId";
    roles[FileNameRole] = "fileName";
    roles[FilePathRole] = "filePath";
    roles[FileSizeRole] = "fileSize";
    roles[MimeTypeRole] = "mimeType";
    roles[StateRole] = "state";
    roles[ProgressRole] = "progress";
    roles[ReadyRole] = "ready";
    roles[StatusCodeRole] = "statusCode";
    roles[ErrorMessageRole] = "errorMessage";
    return roles;
}
