#pragma once

#include <QJsonObject>
#include <QObject>

namespace dsc {

class ILayoutCache;
class StatusOverlay;

/// Decides what the screen shows while the server is unreachable: the
/// cached layout (overlay suppressed, reconnect silently) or the status
/// overlay. Driven by display.show_cached_layout_on_disconnect.
class PresentationModeSelector : public QObject {
    Q_OBJECT
public:
    enum class Mode { Live, CachedContent, Overlay };
    Q_ENUM(Mode)

    PresentationModeSelector(StatusOverlay* overlay, ILayoutCache* cache,
                             bool showCachedOnDisconnect, QObject* parent = nullptr);

    void setShowCachedOnDisconnect(bool enabled);

    /// Session lost, or first connection could not be made.
    void onConnectionLost();
    /// Session (re)opened; leaves cached mode and clears the overlay.
    void onConnectionRestored();

    Mode mode() const { return mode_; }
    bool overlayAllowed() const { return mode_ != Mode::CachedContent; }

signals:
    void cachedContentRequested(const QJsonObject& layout, const QJsonObject& data);
    void contentHidden();
    void modeChanged(dsc::PresentationModeSelector::Mode mode);

private:
    void setMode(Mode mode);

    StatusOverlay* overlay_;
    ILayoutCache* cache_;
    bool showCachedOnDisconnect_;
    Mode mode_ = Mode::Live;
};

} // namespace dsc
