#include "filecandidate.h"

#include <QMimeDatabase>

FileCandidate FileCandidate::fromFileInfo(const QFileInfo &info)
{
    FileCandidate candidate;
    candidate.path = info.absoluteFilePath();
    candidate.name = info.fileName();

    const bool readable = info.exists() && info.isFile();
    candidate.size = readable ? info.size() : -1;

    QMimeDatabase mimeDb;
    candidate.mimeType = readable ? mimeDb.mimeTypeForFile(info).name()
                                  : mimeDb.mimeTypeForFile(info.fileName(),
                                                           QMimeDatabase::MatchExtension).name();
    return candidate;
}

InvalidFileError::InvalidFileError(const QString &path)
    : std::runtime_error(QStringLiteral("The file specified is no longer valid: %1")
                             .arg(path).toStdString())
    , path_(path)
{
}
