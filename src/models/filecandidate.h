/**
 * @file filecandidate.h
 * @brief Snapshot of a file proposed for the upload queue.
 */

#ifndef FILECANDIDATE_H
#define FILECANDIDATE_H

#include <QFileInfo>
#include <QString>

#include <stdexcept>

/**
 * @brief Read-only description of a file taken at admission time.
 *
 * Filters and transports work from this snapshot so later changes to the
 * file on disk do not affect admission decisions.
 */
struct FileCandidate {
    QString path;             ///< Absolute path of the local file
    QString name;             ///< File name without directory
    qint64 size = -1;         ///< Size in bytes, -1 if the file could not be read
    QString mimeType;         ///< Detected mime type (e.g., "image/png")

    [[nodiscard]] bool hasValidSize() const { return size >= 0; }

    /**
     * @brief Builds a candidate from a file on disk.
     * @param info The file to describe.
     * @return Snapshot with size -1 when the file does not exist.
     */
    [[nodiscard]] static FileCandidate fromFileInfo(const QFileInfo &info);
};

/**
 * @brief Thrown when a queued file can no longer be read at dispatch time.
 */
class InvalidFileError : public std::runtime_error
{
public:
    explicit InvalidFileError(const QString &path);

    [[nodiscard]] QString path() const { return path_; }

private:
    QString path_;
};

#endif // FILECANDIDATE_H
