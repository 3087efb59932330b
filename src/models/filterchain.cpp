#include "filterchain.h"
#include "filetype.h"

#include <QRegularExpression>

FilterSelection::FilterSelection(UploadFilterList filters)
    : kind_(Kind::Explicit)
    , filters_(std::move(filters))
{
}

FilterSelection::FilterSelection(const QString &names)
    : kind_(Kind::Named)
    , names_(FilterChain::parseNames(names))
{
    // An empty name list means no selection was given
    if (names_.isEmpty()) {
        kind_ = Kind::Configured;
    }
}

FilterSelection::FilterSelection(const char *names)
    : FilterSelection(QString::fromUtf8(names))
{
}

UploadFilterList FilterSelection::resolve(const UploadFilterList &configured) const
{
    switch (kind_) {
    case Kind::Configured:
        return configured;
    case Kind::Explicit:
        return filters_;
    case Kind::Named: {
        UploadFilterList selected;
        for (const UploadFilter &filter : configured) {
            if (names_.contains(filter.name)) {
                selected.append(filter);
            }
        }
        return selected;
    }
    }
    return configured;
}

FilterResult FilterChain::evaluate(const FileCandidate &candidate,
                                   const UploadFilterList &filters,
                                   const FilterContext &context)
{
    FilterResult result;
    for (int i = 0; i < filters.size(); ++i) {
        const UploadFilter &filter = filters.at(i);
        if (filter.fn && !filter.fn(candidate, context)) {
            result.passed = false;
            result.failedIndex = i;
            result.failedFilter = filter.name;
            break;
        }
    }
    return result;
}

UploadFilterList FilterChain::builtinFilters(const UploaderConfig &config)
{
    // Each enabled filter is prepended, so the last one added runs first.
    UploadFilterList builtins;
    if (config.limit != -1) {
        builtins.prepend({QString::fromLatin1(QueueLimit), &FilterChain::queueLimitFilter});
    }
    if (config.size != -1) {
        builtins.prepend({QString::fromLatin1(FileSize), &FilterChain::fileSizeFilter});
    }
    if (config.mimes) {
        builtins.prepend({QString::fromLatin1(MimeType), &FilterChain::mimeTypeFilter});
    }
    if (config.types) {
        builtins.prepend({QString::fromLatin1(FileTypeClass), &FilterChain::fileTypeFilter});
    }
    return builtins;
}

QStringList FilterChain::parseNames(const QString &names)
{
    static const QRegularExpression separators(QStringLiteral("[\\s,]+"));
    return names.split(separators, Qt::SkipEmptyParts);
}

bool FilterChain::queueLimitFilter(const FileCandidate &candidate, const FilterContext &context)
{
    Q_UNUSED(candidate)
    const int limit = context.config.limit;
    return limit < 0 || context.queueLength < limit;
}

bool FilterChain::fileSizeFilter(const FileCandidate &candidate, const FilterContext &context)
{
    const qint64 maxSize = context.config.size;
    return maxSize <= 0 || candidate.size <= maxSize;
}

bool FilterChain::mimeTypeFilter(const FileCandidate &candidate, const FilterContext &context)
{
    const auto &mimes = context.config.mimes;
    return !mimes || mimes->contains(candidate.mimeType);
}

bool FilterChain::fileTypeFilter(const FileCandidate &candidate, const FilterContext &context)
{
    const auto &types = context.config.types;
    return !types || types->contains(FileType::mimeClass(candidate));
}
