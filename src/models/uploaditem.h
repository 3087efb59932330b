/**
 * @file uploaditem.h
 * @brief A single file tracked by the upload queue.
 */

#ifndef UPLOADITEM_H
#define UPLOADITEM_H

#include <QMetaType>
#include <QPointer>
#include <QString>

#include "models/filecandidate.h"
#include "models/uploaderoptions.h"
#include "services/uploadtypes.h"

class UploadQueue;

/**
 * @brief One file's lifecycle from admission to a terminal state.
 *
 * Items are created and owned by UploadQueue. They keep a non-owning
 * reference back to the queue so that upload(), cancel() and remove() can be
 * called on the item directly; once the item leaves the queue these calls
 * log a warning and do nothing.
 *
 * State changes are driven by the queue only:
 * - Queued -> Uploading when the queue dispatches the item
 * - Uploading -> Success / Error / Cancelled when the transfer ends
 * - any terminal state -> Uploading again when the item is retried
 */
class UploadItem
{
public:
    enum class State {
        Queued,      ///< Admitted, never sent
        Uploading,   ///< Transfer in flight
        Success,     ///< Server answered 2xx or 304
        Error,       ///< Server error or network failure
        Cancelled    ///< Transfer aborted on request
    };

    UploadItem(quint64 index, const FileCandidate &file, const UploaderOptions &callSiteOptions,
               const UploaderConfig &config, UploadQueue *queue);

    UploadItem(const UploadItem &) = delete;
    UploadItem &operator=(const UploadItem &) = delete;

    /// @name Identity
    /// @{
    [[nodiscard]] quint64 index() const { return index_; }
    [[nodiscard]] quint64 id() const { return index_; }
    [[nodiscard]] const FileCandidate &file() const { return file_; }
    [[nodiscard]] UploadQueue *queue() const;
    /// @}

    /// @name Configuration
    /// @{
    [[nodiscard]] const UploaderConfig &config() const { return config_; }
    [[nodiscard]] const UploaderOptions &callSiteOptions() const { return callSiteOptions_; }
    /// @}

    /// @name State
    /// @{
    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isReady() const { return ready_; }
    [[nodiscard]] bool isUploading() const { return state_ == State::Uploading; }
    [[nodiscard]] bool isUploaded() const { return state_ == State::Success; }
    [[nodiscard]] bool isSuccess() const { return state_ == State::Success; }
    [[nodiscard]] bool isError() const { return state_ == State::Error; }
    [[nodiscard]] bool isCancelled() const { return state_ == State::Cancelled; }
    [[nodiscard]] int progress() const { return progress_; }
    /// @}

    /// @name Last response
    /// @{
    [[nodiscard]] const UploadResponse &response() const { return response_; }
    [[nodiscard]] int status() const { return response_.status; }
    /// @}

    /**
     * @brief Asks the owning queue to upload this item.
     * @throws InvalidFileError if the file can no longer be read.
     */
    void upload() const;

    /// @brief Asks the owning queue to abort this item's transfer
    void cancel() const;

    /// @brief Asks the owning queue to remove this item
    void remove() const;

private:
    friend class UploadQueue;

    void prepareToUpload() { ready_ = true; }
    void clearReady() { ready_ = false; }
    void beginUpload();
    void setProgress(int progress) { progress_ = progress; }
    void finish(TransferOutcome outcome, const UploadResponse &response);
    void setConfig(const UploaderConfig &config) { config_ = config; }
    void detach();

    quint64 index_;
    FileCandidate file_;
    UploaderOptions callSiteOptions_;
    UploaderConfig config_;
    QPointer<UploadQueue> queue_;

    State state_ = State::Queued;
    bool ready_ = false;
    int progress_ = 0;
    UploadResponse response_;
};

Q_DECLARE_METATYPE(UploadItem::State)

/// @brief Convert UploadItem::State to string for logging
[[nodiscard]] inline const char* itemStateToString(UploadItem::State state) {
    switch (state) {
        case UploadItem::State::Queued: return "Queued";
        case UploadItem::State::Uploading: return "Uploading";
        case UploadItem::State::Success: return "Success";
        case UploadItem::State::Error: return "Error";
        case UploadItem::State::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Refers to a queue item either by its row or by its id.
 *
 * Rows shift as items are removed; ids never change. A reference is
 * resolved once when it is passed to an UploadQueue operation.
 */
class ItemRef
{
public:
    /// @brief Reference by current position in the queue
    [[nodiscard]] static ItemRef atIndex(int row) { return ItemRef(Kind::Row, row, 0); }

    /// @brief Reference by stable item id
    [[nodiscard]] static ItemRef forId(quint64 id) { return ItemRef(Kind::Id, -1, id); }

    ItemRef(const UploadItem &item) : ItemRef(Kind::Id, -1, item.id()) {}

    [[nodiscard]] bool isRow() const { return kind_ == Kind::Row; }
    [[nodiscard]] int row() const { return row_; }
    [[nodiscard]] quint64 id() const { return id_; }

    [[nodiscard]] QString toString() const;

private:
    enum class Kind { Row, Id };

    ItemRef(Kind kind, int row, quint64 id) : kind_(kind), row_(row), id_(id) {}

    Kind kind_;
    int row_;
    quint64 id_;
};

#endif // UPLOADITEM_H
