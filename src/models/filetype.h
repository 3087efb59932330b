/**
 * @file filetype.h
 * @brief Derives a coarse file-type class from a mime type or file name.
 */

#ifndef FILETYPE_H
#define FILETYPE_H

#include <QString>

struct FileCandidate;

/**
 * @brief Maps files to the type classes accepted by the "fileType" filter.
 *
 * Classes: "image", "video", "audio", "pdf", "compress", "doc", "xls",
 * "ppt" and the fallback "application".
 */
class FileType
{
public:
    /**
     * @brief Returns the type class of a candidate.
     *
     * The mime type is consulted first; when it only yields "application"
     * the file name extension decides.
     */
    [[nodiscard]] static QString mimeClass(const FileCandidate &candidate);

    /// @brief Type class from a mime type alone ("application" if unknown)
    [[nodiscard]] static QString classForMimeType(const QString &mimeType);

    /// @brief Type class from a file name extension ("application" if unknown)
    [[nodiscard]] static QString classForFileName(const QString &fileName);
};

#endif // FILETYPE_H
