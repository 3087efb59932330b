#include "optionsloader.h"

#include <QDebug>
#include <QFileInfo>
#include <QRegularExpression>

#include <limits>

namespace {

// QSettings turns unquoted comma separated values into string lists
QString readString(const QVariant &value)
{
    if (value.typeId() == QMetaType::QStringList) {
        return value.toStringList().join(QStringLiteral(", "));
    }
    return value.toString().trimmed();
}

void reportInvalid(QString *error, const QString &key, const QString &value)
{
    const QString message = QStringLiteral("Invalid value for %1: \"%2\"").arg(key, value);
    qWarning() << "OptionsLoader:" << message;
    if (error && error->isEmpty()) {
        *error = message;
    }
}

} // namespace

UploaderOptions OptionsLoader::fromSettings(QSettings &settings, QString *error)
{
    UploaderOptions options;

    auto readBool = [&settings, error](const QString &key, std::optional<bool> &target) {
        if (!settings.contains(key)) {
            return;
        }
        const QString text = readString(settings.value(key));
        bool ok = false;
        const bool value = parseBool(text, &ok);
        if (ok) {
            target = value;
        } else {
            reportInvalid(error, settings.group() + QLatin1Char('/') + key, text);
        }
    };

    auto readInt = [&settings, error](const QString &key, std::optional<int> &target) {
        if (!settings.contains(key)) {
            return;
        }
        const QString text = readString(settings.value(key));
        bool ok = false;
        const int value = text.toInt(&ok);
        if (ok) {
            target = value;
        } else {
            reportInvalid(error, settings.group() + QLatin1Char('/') + key, text);
        }
    };

    settings.beginGroup(QStringLiteral("upload"));
    if (settings.contains(QStringLiteral("url"))) {
        const QString text = readString(settings.value(QStringLiteral("url")));
        const QUrl url(text, QUrl::StrictMode);
        if (url.isValid() && !url.scheme().isEmpty()) {
            options.url = url;
        } else {
            reportInvalid(error, QStringLiteral("upload/url"), text);
        }
    }
    if (settings.contains(QStringLiteral("method"))) {
        options.method = readString(settings.value(QStringLiteral("method"))).toUpper();
    }
    if (settings.contains(QStringLiteral("alias"))) {
        options.alias = readString(settings.value(QStringLiteral("alias")));
    }
    readBool(QStringLiteral("withCredentials"), options.withCredentials);
    readBool(QStringLiteral("auto"), options.autoUpload);
    readBool(QStringLiteral("removeAfterUpload"), options.removeAfterUpload);
    readBool(QStringLiteral("disableMultipart"), options.disableMultipart);
    readInt(QStringLiteral("timeoutMs"), options.timeoutMs);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("limits"));
    readInt(QStringLiteral("queue"), options.limit);
    if (settings.contains(QStringLiteral("size"))) {
        const QString text = readString(settings.value(QStringLiteral("size")));
        bool ok = false;
        const qint64 size = parseSize(text, &ok);
        if (ok) {
            options.size = size;
        } else {
            reportInvalid(error, QStringLiteral("limits/size"), text);
        }
    }
    if (settings.contains(QStringLiteral("mimes"))) {
        options.mimes = parseList(settings.value(QStringLiteral("mimes")));
    }
    if (settings.contains(QStringLiteral("types"))) {
        options.types = parseList(settings.value(QStringLiteral("types")));
    }
    settings.endGroup();

    settings.beginGroup(QStringLiteral("params"));
    const QStringList paramKeys = settings.childKeys();
    if (!paramKeys.isEmpty()) {
        QMap<QString, QString> params;
        for (const QString &key : paramKeys) {
            params.insert(key, readString(settings.value(key)));
        }
        options.params = params;
    }
    settings.endGroup();

    settings.beginGroup(QStringLiteral("headers"));
    const QStringList headerKeys = settings.childKeys();
    if (!headerKeys.isEmpty()) {
        QList<UploadHeader> headers;
        for (const QString &key : headerKeys) {
            headers.append({key, readString(settings.value(key))});
        }
        options.headers = headers;
    }
    settings.endGroup();

    return options;
}

bool OptionsLoader::loadFile(const QString &path, UploaderOptions *options, QString *error)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        if (error) {
            *error = QStringLiteral("Cannot read options file: %1").arg(path);
        }
        qWarning() << "OptionsLoader: cannot read" << path;
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (error) {
            *error = QStringLiteral("Malformed options file: %1").arg(path);
        }
        qWarning() << "OptionsLoader: malformed" << path;
        return false;
    }

    QString valueError;
    const UploaderOptions loaded = fromSettings(settings, &valueError);
    if (options) {
        options->mergeFrom(loaded);
    }
    if (!valueError.isEmpty()) {
        if (error) {
            *error = valueError;
        }
        return false;
    }

    qDebug() << "OptionsLoader: loaded" << path;
    return true;
}

qint64 OptionsLoader::parseSize(const QString &text, bool *ok)
{
    static const QRegularExpression sizeRx(QStringLiteral("^(\\d+)\\s*([kKmMgG]?)[bB]?$"));

    const QRegularExpressionMatch match = sizeRx.match(text.trimmed());
    if (!match.hasMatch()) {
        if (ok) *ok = false;
        return -1;
    }

    bool numberOk = false;
    qint64 bytes = match.captured(1).toLongLong(&numberOk);
    if (!numberOk) {
        if (ok) *ok = false;
        return -1;
    }

    const QString unit = match.captured(2).toUpper();
    qint64 multiplier = 1;
    if (unit == QLatin1String("K")) {
        multiplier = 1024;
    } else if (unit == QLatin1String("M")) {
        multiplier = 1024LL * 1024;
    } else if (unit == QLatin1String("G")) {
        multiplier = 1024LL * 1024 * 1024;
    }

    // A wrapped value would read as "no limit"
    if (bytes > std::numeric_limits<qint64>::max() / multiplier) {
        if (ok) *ok = false;
        return -1;
    }

    if (ok) *ok = true;
    return bytes * multiplier;
}

QStringList OptionsLoader::parseList(const QVariant &value)
{
    static const QRegularExpression separators(QStringLiteral("[\\s,]+"));

    const QStringList parts = value.typeId() == QMetaType::QStringList
        ? value.toStringList()
        : QStringList{value.toString()};

    QStringList entries;
    for (const QString &part : parts) {
        const QStringList pieces = part.split(separators, Qt::SkipEmptyParts);
        for (const QString &piece : pieces) {
            entries.append(piece.trimmed());
        }
    }
    return entries;
}

bool OptionsLoader::parseBool(const QString &text, bool *ok)
{
    const QString value = text.trimmed().toLower();
    if (value == QLatin1String("true") || value == QLatin1String("yes")
        || value == QLatin1String("on") || value == QLatin1String("1")) {
        if (ok) *ok = true;
        return true;
    }
    if (value == QLatin1String("false") || value == QLatin1String("no")
        || value == QLatin1String("off") || value == QLatin1String("0")) {
        if (ok) *ok = true;
        return false;
    }
    if (ok) *ok = false;
    return false;
}
