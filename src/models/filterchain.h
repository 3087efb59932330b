/**
 * @file filterchain.h
 * @brief Ordered admission filters for the upload queue.
 */

#ifndef FILTERCHAIN_H
#define FILTERCHAIN_H

#include <QString>
#include <QStringList>

#include "models/uploaderoptions.h"

/**
 * @brief Result of running a candidate through a filter list.
 */
struct FilterResult {
    bool passed = true;
    int failedIndex = -1;    ///< Position of the failing filter, -1 if passed
    QString failedFilter;    ///< Name of the failing filter, empty if passed
};

/**
 * @brief Chooses which filters an admission runs.
 *
 * - default constructed: every configured filter
 * - from a filter list: exactly those filters, in the given order
 * - from a string: configured filters whose names appear in the
 *   whitespace/comma separated list, in configuration order; unknown
 *   names are ignored, and a string naming nothing selects every
 *   configured filter
 */
class FilterSelection
{
public:
    FilterSelection() = default;
    FilterSelection(UploadFilterList filters);
    FilterSelection(const QString &names);
    FilterSelection(const char *names);

    /**
     * @brief Resolves the selection against the configured filters.
     * @param configured Effective filter list of the admission.
     */
    [[nodiscard]] UploadFilterList resolve(const UploadFilterList &configured) const;

private:
    enum class Kind { Configured, Explicit, Named };

    Kind kind_ = Kind::Configured;
    UploadFilterList filters_;
    QStringList names_;
};

/**
 * @brief Evaluates candidates against ordered filters and builds the
 *        built-in filters.
 *
 * Filters run in list order and evaluation stops at the first failure, so
 * the reported filter is always the earliest one that rejects.
 *
 * @par Example usage:
 * @code
 * UploaderConfig config = UploaderConfig().merged(options);
 * FilterContext context{config, queueLength};
 * FilterResult result = FilterChain::evaluate(candidate, config.filters, context);
 * if (!result.passed) {
 *     qInfo() << "Rejected by" << result.failedFilter;
 * }
 * @endcode
 */
class FilterChain
{
public:
    /// @name Built-in filter names
    /// @{
    static constexpr const char* QueueLimit = "queueLimit";
    static constexpr const char* FileSize = "fileSize";
    static constexpr const char* MimeType = "mimeType";
    static constexpr const char* FileTypeClass = "fileType";
    /// @}

    /**
     * @brief Runs a candidate through filters until one rejects it.
     * @param candidate The file proposed for admission.
     * @param filters Filters in evaluation order.
     * @param context Configuration and queue length for the filters.
     * @return Pass, or the first failing filter. Filters without a
     *         function pass.
     */
    [[nodiscard]] static FilterResult evaluate(const FileCandidate &candidate,
                                               const UploadFilterList &filters,
                                               const FilterContext &context);

    /**
     * @brief Builds the built-in filters enabled by a configuration.
     *
     * Order: fileType, mimeType, fileSize, queueLimit. A filter is present
     * only when its threshold is set.
     */
    [[nodiscard]] static UploadFilterList builtinFilters(const UploaderConfig &config);

    /// @brief Splits a whitespace/comma separated list of filter names
    [[nodiscard]] static QStringList parseNames(const QString &names);

    /// @name Built-in predicates
    /// @{
    [[nodiscard]] static bool queueLimitFilter(const FileCandidate &candidate, const FilterContext &context);
    [[nodiscard]] static bool fileSizeFilter(const FileCandidate &candidate, const FilterContext &context);
    [[nodiscard]] static bool mimeTypeFilter(const FileCandidate &candidate, const FilterContext &context);
    [[nodiscard]] static bool fileTypeFilter(const FileCandidate &candidate, const FilterContext &context);
    /// @}
};

#endif // FILTERCHAIN_H
