/**
 * @file optionsloader.h
 * @brief Reads upload options from INI files.
 */

#ifndef OPTIONSLOADER_H
#define OPTIONSLOADER_H

#include <QSettings>
#include <QString>
#include <QStringList>
#include <QVariant>

#include "models/uploaderoptions.h"

/**
 * @brief Builds an UploaderOptions layer from QSettings.
 *
 * Recognised groups and keys:
 * @code
 * [upload]
 * url=https://example.com/upload
 * method=PUT
 * alias=attachment
 * withCredentials=false
 * auto=true
 * removeAfterUpload=true
 * disableMultipart=false
 * timeoutMs=30000
 *
 * [limits]
 * queue=10
 * size=5M
 * mimes=image/png, image/jpeg
 * types=image, pdf
 *
 * [params]
 * album=holidays
 *
 * [headers]
 * X-Token=secret
 * @endcode
 *
 * Only keys present in the file are set on the layer. Headers are applied
 * in key order.
 */
class OptionsLoader
{
public:
    /**
     * @brief Reads a layer from already opened settings.
     * @param settings Settings to read from.
     * @param error Receives a description of the first invalid value, if any.
     * @return The options found. Invalid values are skipped.
     */
    [[nodiscard]] static UploaderOptions fromSettings(QSettings &settings, QString *error = nullptr);

    /**
     * @brief Reads a layer from an INI file.
     * @param path Path of the INI file.
     * @param options Receives the options found (merged on top of its contents).
     * @param error Receives a description of the failure.
     * @return True if the file was read and every value was valid.
     */
    static bool loadFile(const QString &path, UploaderOptions *options, QString *error = nullptr);

    /**
     * @brief Parses a byte count with an optional K, M or G suffix.
     * @param text Text such as "512", "64K" or "5M" (binary multiples).
     * @param ok Set to false when the text is not a valid size.
     * @return Number of bytes, or -1 on failure.
     */
    [[nodiscard]] static qint64 parseSize(const QString &text, bool *ok = nullptr);

    /// @brief Splits a comma/whitespace separated value into trimmed entries
    [[nodiscard]] static QStringList parseList(const QVariant &value);

    /**
     * @brief Parses true/false, yes/no, on/off and 1/0 (case-insensitive).
     * @param ok Set to false when the text is not a boolean.
     */
    [[nodiscard]] static bool parseBool(const QString &text, bool *ok = nullptr);
};

#endif // OPTIONSLOADER_H
