/**
 * @file iuploadtransport.h
 * @brief Interface for upload transport implementations.
 *
 * This interface allows dependency injection of transports, enabling
 * runtime swapping between the HTTP implementation and mocks for testing.
 */

#ifndef IUPLOADTRANSPORT_H
#define IUPLOADTRANSPORT_H

#include <QObject>

#include "uploadtypes.h"

/**
 * @brief Abstract interface for sending a file over the network.
 *
 * A transport sends one file per send() call and reports back through
 * signals. For every send() it emits uploadFinished() exactly once, whether
 * the transfer succeeded, failed or was aborted.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IUploadTransport *transport = new HttpUploadTransport(this);
 *
 * // Test code
 * IUploadTransport *transport = new MockUploadTransport(this);
 *
 * // Both can be used identically
 * queue->setTransport(transport);
 * @endcode
 */
class IUploadTransport : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transport interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IUploadTransport(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~IUploadTransport() override = default;

    /**
     * @brief Starts sending a file.
     * @param request Target, payload and options for the transfer.
     */
    virtual void send(const UploadRequest &request) = 0;

    /**
     * @brief Requests cancellation of an active transfer.
     * @param itemId The item whose transfer should be aborted.
     *
     * Cancellation completes when uploadFinished() is emitted with
     * TransferOutcome::Cancelled. Unknown ids are ignored.
     */
    virtual void abort(quint64 itemId) = 0;

    /**
     * @brief Checks whether a transfer is still running.
     * @param itemId The item to look up.
     * @return True between send() and the matching uploadFinished().
     */
    [[nodiscard]] virtual bool isActive(quint64 itemId) const = 0;

    /**
     * @brief Converts byte counts to a 0-100 percentage.
     * @param sent Bytes sent so far.
     * @param total Total bytes, or a value <= 0 when unknown.
     * @return Rounded percentage, 0 when the total is not computable.
     */
    [[nodiscard]] static int progressPercent(qint64 sent, qint64 total);

    /**
     * @brief Classifies an HTTP status code.
     * @return True for 2xx and 304.
     */
    [[nodiscard]] static bool isSuccessCode(int status);

signals:
    /**
     * @brief Emitted while the request body is being sent.
     * @param itemId The item being transferred.
     * @param sent Bytes sent so far.
     * @param total Total bytes (-1 or 0 if unknown).
     */
    void uploadProgress(quint64 itemId, qint64 sent, qint64 total);

    /**
     * @brief Emitted once when a transfer ends.
     * @param itemId The item that was transferred.
     * @param outcome Success, Error or Cancelled.
     * @param response Status, headers and body received.
     */
    void uploadFinished(quint64 itemId, TransferOutcome outcome,
                        const UploadResponse &response);
};

#endif // IUPLOADTRANSPORT_H
