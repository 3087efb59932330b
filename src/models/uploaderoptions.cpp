#include "uploaderoptions.h"
#include "filterchain.h"

namespace {

template <typename T>
void overlayField(std::optional<T> &target, const std::optional<T> &overlay)
{
    if (overlay) {
        target = overlay;
    }
}

template <typename T>
void resolveField(T &target, const std::optional<T> &layer)
{
    if (layer) {
        target = *layer;
    }
}

template <typename Fn>
void overlayHook(Fn &target, const Fn &overlay)
{
    if (overlay) {
        target = overlay;
    }
}

} // namespace

void UploaderCallbacks::mergeFrom(const UploaderCallbacks &overlay)
{
    overlayHook(onFileQueued, overlay.onFileQueued);
    overlayHook(onFileDequeued, overlay.onFileDequeued);
    overlayHook(onStart, overlay.onStart);
    overlayHook(onCancel, overlay.onCancel);
    overlayHook(onFinished, overlay.onFinished);
    overlayHook(onError, overlay.onError);
    overlayHook(onUploadStart, overlay.onUploadStart);
    overlayHook(onUploadProgress, overlay.onUploadProgress);
    overlayHook(onUploadSuccess, overlay.onUploadSuccess);
    overlayHook(onUploadError, overlay.onUploadError);
    overlayHook(onUploadCancel, overlay.onUploadCancel);
    overlayHook(onUploadComplete, overlay.onUploadComplete);
}

UploaderOptions &UploaderOptions::mergeFrom(const UploaderOptions &overlay)
{
    overlayField(url, overlay.url);
    overlayField(method, overlay.method);
    overlayField(alias, overlay.alias);
    overlayField(withCredentials, overlay.withCredentials);
    overlayField(autoUpload, overlay.autoUpload);
    overlayField(limit, overlay.limit);
    overlayField(size, overlay.size);
    overlayField(mimes, overlay.mimes);
    overlayField(types, overlay.types);
    overlayField(params, overlay.params);
    overlayField(headers, overlay.headers);
    overlayField(disableMultipart, overlay.disableMultipart);
    overlayField(removeAfterUpload, overlay.removeAfterUpload);
    overlayField(timeoutMs, overlay.timeoutMs);
    overlayField(filters, overlay.filters);
    callbacks.mergeFrom(overlay.callbacks);
    overlayHook(uploadTransport, overlay.uploadTransport);
    overlayHook(transformResponse, overlay.transformResponse);
    return *this;
}

UploaderConfig UploaderConfig::merged(const UploaderOptions &layer) const
{
    UploaderConfig config = *this;

    resolveField(config.url, layer.url);
    resolveField(config.method, layer.method);
    resolveField(config.alias, layer.alias);
    resolveField(config.withCredentials, layer.withCredentials);
    resolveField(config.autoUpload, layer.autoUpload);
    resolveField(config.limit, layer.limit);
    resolveField(config.size, layer.size);
    if (layer.mimes) {
        config.mimes = layer.mimes;
    }
    if (layer.types) {
        config.types = layer.types;
    }
    resolveField(config.params, layer.params);
    resolveField(config.headers, layer.headers);
    resolveField(config.disableMultipart, layer.disableMultipart);
    resolveField(config.removeAfterUpload, layer.removeAfterUpload);
    resolveField(config.timeoutMs, layer.timeoutMs);
    resolveField(config.userFilters, layer.filters);
    config.callbacks.mergeFrom(layer.callbacks);
    overlayHook(config.uploadTransport, layer.uploadTransport);
    overlayHook(config.transformResponse, layer.transformResponse);

    // Built-ins are rebuilt from the thresholds on every resolution so they
    // are never duplicated and always reflect the current limits.
    config.filters = FilterChain::builtinFilters(config) + config.userFilters;
    return config;
}

const UploadFilter *UploaderConfig::findFilter(const QString &name) const
{
    for (const UploadFilter &filter : filters) {
        if (filter.name == name) {
            return &filter;
        }
    }
    return nullptr;
}
