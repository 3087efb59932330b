#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QTimer>
#include "models/uploadqueue.h"
#include "services/optionsloader.h"
#include "utils/logging.h"
#include "version.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

bool parseHeader(const QString &text, UploadHeader *header)
{
    const int colon = text.indexOf(':');
    if (colon <= 0) {
        return false;
    }
    header->name = text.left(colon).trimmed();
    header->value = text.mid(colon + 1).trimmed();
    return !header->name.isEmpty();
}

bool parseParam(const QString &text, QString *key, QString *value)
{
    const int equals = text.indexOf('=');
    if (equals <= 0) {
        return false;
    }
    *key = text.left(equals).trimmed();
    *value = text.mid(equals + 1);
    return !key->isEmpty();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("ferry-upload");
    app.setApplicationVersion(FERRY_VERSION);
    app.setOrganizationName("ferry");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Upload files one at a time to an HTTP endpoint");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Read upload options from an INI <file>", "file");
    QCommandLineOption urlOption(
        QStringList() << "u" << "url",
        "Upload endpoint <url>", "url");
    QCommandLineOption methodOption(
        QStringList() << "m" << "method",
        "HTTP <method> (default POST)", "method");
    QCommandLineOption fieldOption(
        QStringList() << "f" << "field",
        "Multipart form field <name> for the file (default \"file\")", "name");
    QCommandLineOption headerOption(
        QStringList() << "H" << "header",
        "Add a request header, repeatable", "name: value");
    QCommandLineOption paramOption(
        QStringList() << "p" << "param",
        "Add a multipart form field, repeatable", "key=value");
    QCommandLineOption limitOption(
        "limit", "Admit at most <count> files", "count");
    QCommandLineOption sizeOption(
        "max-size", "Reject files larger than <size> (e.g. 512K, 5M)", "size");
    QCommandLineOption mimeOption(
        "mime", "Only admit these comma separated mime <types>", "types");
    QCommandLineOption typeOption(
        "type", "Only admit these comma separated file <classes> (image, video, audio, pdf, "
                "compress, doc, xls, ppt, application)", "classes");
    QCommandLineOption rawOption(
        "raw", "Send the file as the raw request body instead of multipart");
    QCommandLineOption noCredentialsOption(
        "no-credentials", "Do not send or store cookies and credentials");
    QCommandLineOption timeoutOption(
        "timeout", "Abort a transfer after <ms> milliseconds", "ms");

    parser.addOptions({verboseOption, configOption, urlOption, methodOption, fieldOption,
                       headerOption, paramOption, limitOption, sizeOption, mimeOption,
                       typeOption, rawOption, noCredentialsOption, timeoutOption});
    parser.addPositionalArgument("files", "Files to upload, in order", "files...");

    parser.process(app);

    ferry::configureLogging(parser.isSet(verboseOption));
    LOG_VERBOSE() << "Verbose logging enabled," << app.applicationName() << FERRY_VERSION;

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        err() << "No files given\n";
        parser.showHelp(2);
    }

    // Instance layer: options file
    UploaderOptions options;
    if (parser.isSet(configOption)) {
        QString error;
        if (!OptionsLoader::loadFile(parser.value(configOption), &options, &error)) {
            err() << error << "\n";
            return 2;
        }
    }

    // Call-site layer: command line
    UploaderOptions overrides;
    if (parser.isSet(urlOption)) {
        const QUrl url = QUrl::fromUserInput(parser.value(urlOption));
        if (!url.isValid()) {
            err() << "Invalid URL: " << parser.value(urlOption) << "\n";
            return 2;
        }
        overrides.url = url;
    }
    if (parser.isSet(methodOption)) {
        overrides.method = parser.value(methodOption).toUpper();
    }
    if (parser.isSet(fieldOption)) {
        overrides.alias = parser.value(fieldOption);
    }
    if (parser.isSet(headerOption)) {
        QList<UploadHeader> headers = options.headers.value_or(QList<UploadHeader>());
        for (const QString &text : parser.values(headerOption)) {
            UploadHeader header;
            if (!parseHeader(text, &header)) {
                err() << "Invalid header: " << text << "\n";
                return 2;
            }
            headers.append(header);
        }
        overrides.headers = headers;
    }
    if (parser.isSet(paramOption)) {
        QMap<QString, QString> params = options.params.value_or(QMap<QString, QString>());
        for (const QString &text : parser.values(paramOption)) {
            QString key;
            QString value;
            if (!parseParam(text, &key, &value)) {
                err() << "Invalid param: " << text << "\n";
                return 2;
            }
            params.insert(key, value);
        }
        overrides.params = params;
    }
    if (parser.isSet(limitOption)) {
        bool ok = false;
        const int limit = parser.value(limitOption).toInt(&ok);
        if (!ok) {
            err() << "Invalid limit: " << parser.value(limitOption) << "\n";
            return 2;
        }
        overrides.limit = limit;
    }
    if (parser.isSet(sizeOption)) {
        bool ok = false;
        const qint64 size = OptionsLoader::parseSize(parser.value(sizeOption), &ok);
        if (!ok) {
            err() << "Invalid size: " << parser.value(sizeOption) << "\n";
            return 2;
        }
        overrides.size = size;
    }
    if (parser.isSet(mimeOption)) {
        overrides.mimes = OptionsLoader::parseList(parser.value(mimeOption));
    }
    if (parser.isSet(typeOption)) {
        overrides.types = OptionsLoader::parseList(parser.value(typeOption));
    }
    if (parser.isSet(rawOption)) {
        overrides.disableMultipart = true;
    }
    if (parser.isSet(noCredentialsOption)) {
        overrides.withCredentials = false;
    }
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int timeout = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeout < 0) {
            err() << "Invalid timeout: " << parser.value(timeoutOption) << "\n";
            return 2;
        }
        overrides.timeoutMs = timeout;
    }

    int failures = 0;

    options.callbacks.onError = [&failures](const FileCandidate &candidate,
                                            const UploadFilter &filter,
                                            const UploaderConfig &) {
        ++failures;
        err() << "REJECTED " << candidate.name << " (" << filter.name << ")\n";
        err().flush();
    };
    options.callbacks.onUploadProgress = [](const UploadItem &item, int progress, int total) {
        LOG_VERBOSE() << item.file().name << progress << "% (total" << total << "%)";
    };
    options.callbacks.onUploadSuccess = [](const UploadItem &item, const QByteArray &,
                                           int status, const ResponseHeaders &) {
        out() << "OK " << status << " " << item.file().name << "\n";
        out().flush();
    };
    options.callbacks.onUploadError = [&failures](const UploadItem &item, const QByteArray &,
                                                  int status, const ResponseHeaders &) {
        ++failures;
        err() << "FAILED " << status << " " << item.file().name;
        if (!item.response().errorString.isEmpty()) {
            err() << ": " << item.response().errorString;
        }
        err() << "\n";
        err().flush();
    };
    options.callbacks.onUploadCancel = [&failures](const UploadItem &item, const QByteArray &,
                                                   int, const ResponseHeaders &) {
        ++failures;
        err() << "CANCELLED " << item.file().name << "\n";
        err().flush();
    };
    options.callbacks.onFinished = [&failures]() {
        QCoreApplication::exit(failures > 0 ? 1 : 0);
    };

    UploadQueue queue(options);

    if (queue.config().merged(overrides).url.isEmpty()) {
        err() << "No upload URL given (use --url or [upload] url=)\n";
        return 2;
    }

    queue.add(files, overrides);
    if (queue.count() == 0) {
        err() << "Nothing to upload\n";
        return 1;
    }

    // Start once the event loop runs
    QTimer::singleShot(0, &queue, [&queue]() {
        try {
            queue.uploadAll();
        } catch (const InvalidFileError &e) {
            err() << e.what() << "\n";
            QCoreApplication::exit(1);
        }
    });

    return app.exec();
}
