#include "core/overlay/PresentationModeSelector.hpp"
#include "core/cache/ILayoutCache.hpp"
#include "core/overlay/StatusOverlay.hpp"
#include <QDebug>

namespace dsc {

PresentationModeSelector::PresentationModeSelector(StatusOverlay* overlay, ILayoutCache* cache,
                                                   bool showCachedOnDisconnect, QObject* parent)
    : QObject(parent)
    , overlay_(overlay)
    , cache_(cache)
    , showCachedOnDisconnect_(showCachedOnDisconnect)
{
}

void PresentationModeSelector::setShowCachedOnDisconnect(bool enabled)
{
    showCachedOnDisconnect_ = enabled;
}

void PresentationModeSelector::onConnectionLost()
{
    overlay_->cancelNoLayoutAssigned();
    if (showCachedOnDisconnect_) {
        auto cached = cache_ ? cache_->currentLayout() : std::nullopt;
        if (cached) {
            qInfo() << "[PresentationMode] offline, keeping cached layout"
                    << cached->layout.value("Name").toString();
            overlay_->setSuppressed(true);
            overlay_->clear();
            setMode(Mode::CachedContent);
            emit cachedContentRequested(cached->layout, cached->data);
            return;
        }
        qInfo() << "[PresentationMode] offline and no cached layout, using status overlay";
    }

    overlay_->setSuppressed(false);
    setMode(Mode::Overlay);
    emit contentHidden();
}

void PresentationModeSelector::onConnectionRestored()
{
    overlay_->setSuppressed(false);
    overlay_->markStartupComplete();
    overlay_->clear();
    setMode(Mode::Live);
}

void PresentationModeSelector::setMode(Mode mode)
{
    if (mode_ == mode) return;
    mode_ = mode;
    emit modeChanged(mode);
}

} // namespace dsc
