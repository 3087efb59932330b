#include "filetype.h"
#include "filecandidate.h"

#include <QStringList>

namespace {

const QString kApplication = QStringLiteral("application");

bool isPhotoshop(const QString &mime)
{
    static const QStringList types = {
        "image/photoshop", "image/x-photoshop", "image/psd", "image/vnd.adobe.photoshop",
        "application/photoshop", "application/psd", "zz-application/zz-winassoc-psd"
    };
    return types.contains(mime);
}

bool isCompressed(const QString &mime)
{
    static const QStringList types = {
        "application/x-gtar", "application/x-gcompress", "application/compress",
        "application/x-tar", "application/x-rar-compressed", "application/vnd.rar",
        "application/zip", "application/x-zip-compressed", "application/zip-compressed",
        "application/x-7z-compressed", "application/gzip", "application/x-gzip",
        "application/x-bzip2", "application/x-xz"
    };
    return types.contains(mime);
}

bool isDocument(const QString &mime)
{
    static const QStringList types = {
        "application/msword",
        "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
        "application/vnd.openxmlformats-officedocument.wordprocessingml.template",
        "application/vnd.ms-word.document.macroEnabled.12",
        "application/vnd.ms-word.template.macroEnabled.12",
        "application/vnd.oasis.opendocument.text"
    };
    return types.contains(mime);
}

bool isSpreadsheet(const QString &mime)
{
    static const QStringList types = {
        "application/vnd.ms-excel",
        "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
        "application/vnd.openxmlformats-officedocument.spreadsheetml.template",
        "application/vnd.ms-excel.sheet.macroEnabled.12",
        "application/vnd.ms-excel.template.macroEnabled.12",
        "application/vnd.ms-excel.addin.macroEnabled.12",
        "application/vnd.ms-excel.sheet.binary.macroEnabled.12",
        "application/vnd.oasis.opendocument.spreadsheet"
    };
    return types.contains(mime);
}

bool isPresentation(const QString &mime)
{
    static const QStringList types = {
        "application/vnd.ms-powerpoint",
        "application/vnd.openxmlformats-officedocument.presentationml.presentation",
        "application/vnd.openxmlformats-officedocument.presentationml.template",
        "application/vnd.openxmlformats-officedocument.presentationml.slideshow",
        "application/vnd.ms-powerpoint.addin.macroEnabled.12",
        "application/vnd.ms-powerpoint.presentation.macroEnabled.12",
        "application/vnd.ms-powerpoint.slideshow.macroEnabled.12",
        "application/vnd.oasis.opendocument.presentation"
    };
    return types.contains(mime);
}

} // namespace

QString FileType::mimeClass(const FileCandidate &candidate)
{
    QString mimeClass = classForMimeType(candidate.mimeType);
    if (mimeClass == kApplication) {
        mimeClass = classForFileName(candidate.name);
    }
    return mimeClass;
}

QString FileType::classForMimeType(const QString &mimeType)
{
    const QString mime = mimeType.trimmed().toLower();

    if (isPhotoshop(mime) || mime.startsWith("image/")) {
        return QStringLiteral("image");
    } else if (mime.startsWith("video/")) {
        return QStringLiteral("video");
    } else if (mime.startsWith("audio/")) {
        return QStringLiteral("audio");
    } else if (mime == "application/pdf") {
        return QStringLiteral("pdf");
    } else if (isCompressed(mime)) {
        return QStringLiteral("compress");
    } else if (isDocument(mime)) {
        return QStringLiteral("doc");
    } else if (isSpreadsheet(mime)) {
        return QStringLiteral("xls");
    } else if (isPresentation(mime)) {
        return QStringLiteral("ppt");
    }

    return kApplication;
}

QString FileType::classForFileName(const QString &fileName)
{
    if (!fileName.contains('.')) {
        return kApplication;
    }
    QString ext = fileName.section('.', -1).toLower();

    if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" || ext == "bmp"
        || ext == "tif" || ext == "tiff" || ext == "psd" || ext == "nef" || ext == "cr2"
        || ext == "ai" || ext == "svg" || ext == "webp") {
        return QStringLiteral("image");
    } else if (ext == "mp4" || ext == "avi" || ext == "wmv" || ext == "mpg" || ext == "mpeg"
               || ext == "mts" || ext == "m2ts" || ext == "flv" || ext == "3gp" || ext == "vob"
               || ext == "m4v" || ext == "mov" || ext == "mkv" || ext == "webm") {
        return QStringLiteral("video");
    } else if (ext == "mp3" || ext == "wav" || ext == "wma" || ext == "m4a" || ext == "flac"
               || ext == "ogg" || ext == "aac") {
        return QStringLiteral("audio");
    } else if (ext == "pdf") {
        return QStringLiteral("pdf");
    } else if (ext == "zip" || ext == "rar" || ext == "7z" || ext == "gz" || ext == "bz2"
               || ext == "xz" || ext == "tar" || ext == "tgz" || ext == "lz" || ext == "z01") {
        return QStringLiteral("compress");
    } else if (ext == "doc" || ext == "docx" || ext == "odt" || ext == "rtf" || ext == "txt"
               || ext == "eps") {
        return QStringLiteral("doc");
    } else if (ext == "xls" || ext == "xlsx" || ext == "ods" || ext == "csv") {
        return QStringLiteral("xls");
    } else if (ext == "ppt" || ext == "pptx" || ext == "pps" || ext == "ppsx" || ext == "odp") {
        return QStringLiteral("ppt");
    }

    return kApplication;
}
