#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/cache/FileLayoutCache.hpp"
#include "core/overlay/PresentationModeSelector.hpp"
#include "core/overlay/StatusOverlay.hpp"

namespace {

class CountingRenderer : public dsc::IOverlayRenderer {
public:
    void render(const dsc::OverlayParams&) override { ++renders; }
    void hide() override { ++hides; }
    void raise() override {}

    int renders = 0;
    int hides = 0;
};

QJsonObject lobbyLayout()
{
    QJsonObject layout;
    layout["Id"] = "lobby";
    layout["Name"] = "Lobby";
    return layout;
}

} // namespace

class TestPresentationMode : public QObject {
    Q_OBJECT
private slots:
    void testCachedLayoutShownWhenEnabled()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        dsc::FileLayoutCache cache(dir.path());
        QVERIFY(cache.saveLayout(lobbyLayout(), QJsonObject{{"Temp", 21}}, true));

        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        dsc::PresentationModeSelector selector(&overlay, &cache, true);
        QSignalSpy cachedSpy(&selector, &dsc::PresentationModeSelector::cachedContentRequested);

        selector.onConnectionLost();

        QCOMPARE(selector.mode(), dsc::PresentationModeSelector::Mode::CachedContent);
        QVERIFY(!selector.overlayAllowed());
        QVERIFY(overlay.isSuppressed());
        QCOMPARE(cachedSpy.count(), 1);
        QCOMPARE(cachedSpy.at(0).at(0).toJsonObject().value("Name").toString(), QString("Lobby"));
        QCOMPARE(cachedSpy.at(0).at(1).toJsonObject().value("Temp").toInt(), 21);

        overlay.showConnecting("10.0.0.5", 1);
        QCOMPARE(renderer.renders, 0);
    }

    void testOverlayWhenCacheEmpty()
    {
        QTemporaryDir dir;
        dsc::FileLayoutCache cache(dir.path());
        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        dsc::PresentationModeSelector selector(&overlay, &cache, true);
        QSignalSpy hiddenSpy(&selector, &dsc::PresentationModeSelector::contentHidden);

        selector.onConnectionLost();

        QCOMPARE(selector.mode(), dsc::PresentationModeSelector::Mode::Overlay);
        QVERIFY(selector.overlayAllowed());
        QCOMPARE(hiddenSpy.count(), 1);
        overlay.showConnecting("10.0.0.5", 1);
        QCOMPARE(renderer.renders, 1);
    }

    void testOverlayWhenCachedModeDisabled()
    {
        QTemporaryDir dir;
        dsc::FileLayoutCache cache(dir.path());
        QVERIFY(cache.saveLayout(lobbyLayout(), {}, true));
        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        dsc::PresentationModeSelector selector(&overlay, &cache, false);
        QSignalSpy cachedSpy(&selector, &dsc::PresentationModeSelector::cachedContentRequested);

        selector.onConnectionLost();
        QCOMPARE(selector.mode(), dsc::PresentationModeSelector::Mode::Overlay);
        QCOMPARE(cachedSpy.count(), 0);
    }

    void testRestoreReturnsToLive()
    {
        QTemporaryDir dir;
        dsc::FileLayoutCache cache(dir.path());
        QVERIFY(cache.saveLayout(lobbyLayout(), {}, true));
        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        dsc::PresentationModeSelector selector(&overlay, &cache, true);
        QSignalSpy modeSpy(&selector, &dsc::PresentationModeSelector::modeChanged);

        selector.onConnectionLost();
        selector.onConnectionRestored();

        QCOMPARE(selector.mode(), dsc::PresentationModeSelector::Mode::Live);
        QVERIFY(!overlay.isSuppressed());
        QCOMPARE(modeSpy.count(), 2);

        // Startup is over once a session has been restored
        overlay.showAutoDiscovery("client-1", "192.168.1.77");
        QCOMPARE(overlay.state(), dsc::OverlayState::None);
    }

    void testRestoreClearsVisibleOverlay()
    {
        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        dsc::PresentationModeSelector selector(&overlay, nullptr, false);

        selector.onConnectionLost();
        overlay.showServerOffline("10.0.0.5", 1, 10, false);
        QCOMPARE(overlay.state(), dsc::OverlayState::ServerOffline);

        selector.onConnectionRestored();
        QCOMPARE(overlay.state(), dsc::OverlayState::None);
        QCOMPARE(renderer.hides, 1);
    }

    void testConnectionLossCancelsNoLayoutWindow()
    {
        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        overlay.setNoLayoutGraceMs(50);
        dsc::PresentationModeSelector selector(&overlay, nullptr, false);

        overlay.showNoLayoutAssigned("10.0.0.5", "client-1");
        selector.onConnectionLost();
        QVERIFY(!overlay.isNoLayoutGracePending());

        overlay.showConnecting("10.0.0.5", 1);
        QTest::qWait(150);
        QCOMPARE(overlay.state(), dsc::OverlayState::Connecting);
        QCOMPARE(renderer.renders, 1);
    }

    void testToggleAtRuntime()
    {
        QTemporaryDir dir;
        dsc::FileLayoutCache cache(dir.path());
        QVERIFY(cache.saveLayout(lobbyLayout(), {}, true));
        CountingRenderer renderer;
        dsc::StatusOverlay overlay(&renderer);
        dsc::PresentationModeSelector selector(&overlay, &cache, false);

        selector.setShowCachedOnDisconnect(true);
        selector.onConnectionLost();
        QCOMPARE(selector.mode(), dsc::PresentationModeSelector::Mode::CachedContent);
    }
};

QTEST_MAIN(TestPresentationMode)
#include "test_presentation_mode.moc"
