#include "uploaditem.h"
#include "uploadqueue.h"

#include <QDebug>

UploadItem::UploadItem(quint64 index, const FileCandidate &file,
                       const UploaderOptions &callSiteOptions,
                       const UploaderConfig &config, UploadQueue *queue)
    : index_(index)
    , file_(file)
    , callSiteOptions_(callSiteOptions)
    , config_(config)
    , queue_(queue)
{
}

UploadQueue *UploadItem::queue() const
{
    return queue_.data();
}

void UploadItem::upload() const
{
    if (!queue_) {
        qWarning() << "UploadItem: item" << index_ << "is not in a queue, cannot upload";
        return;
    }
    queue_->uploadItem(ItemRef(*this));
}

void UploadItem::cancel() const
{
    if (!queue_) {
        qWarning() << "UploadItem: item" << index_ << "is not in a queue, cannot cancel";
        return;
    }
    queue_->cancelItem(ItemRef(*this));
}

void UploadItem::remove() const
{
    if (!queue_) {
        qWarning() << "UploadItem: item" << index_ << "is not in a queue, cannot remove";
        return;
    }
    queue_->removeFromQueue(ItemRef(*this));
}

void UploadItem::detach()
{
    queue_.clear();
}

void UploadItem::beginUpload()
{
    state_ = State::Uploading;
    progress_ = 0;
    response_ = UploadResponse();
}

void UploadItem::finish(TransferOutcome outcome, const UploadResponse &response)
{
    response_ = response;
    ready_ = false;

    switch (outcome) {
    case TransferOutcome::Success:
        state_ = State::Success;
        progress_ = 100;
        break;
    case TransferOutcome::Error:
        state_ = State::Error;
        progress_ = 0;
        break;
    case TransferOutcome::Cancelled:
        state_ = State::Cancelled;
        progress_ = 0;
        break;
    }
}

QString ItemRef::toString() const
{
    return isRow() ? QStringLiteral("row %1").arg(row_)
                   : QStringLiteral("id %1").arg(id_);
}
