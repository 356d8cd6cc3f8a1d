#include <QtTest/QtTest>
#include <QSignalSpy>
#include "core/overlay/StatusOverlay.hpp"
#include "ui/OverlayViewModel.hpp"

class TestOverlayViewModel : public QObject {
    Q_OBJECT
private slots:
    void testInitiallyHidden()
    {
        dsc::OverlayViewModel vm;
        QCOMPARE(vm.state(), QString("None"));
        QVERIFY(!vm.isVisible());
        QVERIFY(vm.title().isEmpty());
    }

    void testTexts()
    {
        dsc::OverlayParams p;
        p.state = dsc::OverlayState::Connecting;
        p.address = "10.0.0.5";
        p.attempt = 5;
        QCOMPARE(dsc::OverlayViewModel::titleFor(p), QString("Connecting to Server"));
        QCOMPARE(dsc::OverlayViewModel::detailFor(p), QString("10.0.0.5\nAttempt 5"));

        p.state = dsc::OverlayState::ServerOffline;
        p.retryIn = 20;
        QCOMPARE(dsc::OverlayViewModel::titleFor(p), QString("Server Offline"));
        QVERIFY(dsc::OverlayViewModel::detailFor(p).endsWith("Retrying in 20 s"));

        p.discoveryActive = true;
        QVERIFY(dsc::OverlayViewModel::detailFor(p).contains("Searching the network"));

        p.state = dsc::OverlayState::NoLayoutAssigned;
        p.clientId = "display-9";
        QVERIFY(dsc::OverlayViewModel::detailFor(p).contains("Client ID: display-9"));
    }

    void testAutoDiscoveryShowsDeviceIdentity()
    {
        dsc::OverlayParams p;
        p.state = dsc::OverlayState::AutoDiscovery;
        p.clientId = "display-9";
        p.deviceAddress = "192.168.1.77";
        const QString detail = dsc::OverlayViewModel::detailFor(p);
        QVERIFY(detail.contains("Client ID: display-9"));
        QVERIFY(detail.contains("IP: 192.168.1.77"));
    }

    void testRenderAndHide()
    {
        dsc::OverlayViewModel vm;
        QSignalSpy changedSpy(&vm, &dsc::OverlayViewModel::changed);
        QSignalSpy visibleSpy(&vm, &dsc::OverlayViewModel::visibleChanged);

        dsc::OverlayParams p;
        p.state = dsc::OverlayState::AutoDiscovery;
        vm.render(p);
        QCOMPARE(vm.state(), QString("AutoDiscovery"));
        QCOMPARE(vm.title(), QString("Searching for Server"));
        QVERIFY(vm.isVisible());
        QCOMPARE(changedSpy.count(), 1);
        QCOMPARE(visibleSpy.count(), 1);

        vm.hide();
        QVERIFY(!vm.isVisible());
        QCOMPARE(vm.state(), QString("None"));
        QCOMPARE(changedSpy.count(), 2);
        QCOMPARE(visibleSpy.count(), 2);

        vm.hide();
        QCOMPARE(changedSpy.count(), 2);
    }

    void testRaiseOnlyWhileVisible()
    {
        dsc::OverlayViewModel vm;
        QSignalSpy raiseSpy(&vm, &dsc::OverlayViewModel::raiseRequested);

        vm.raise();
        QCOMPARE(raiseSpy.count(), 0);

        dsc::OverlayParams p;
        p.state = dsc::OverlayState::ServerOffline;
        vm.render(p);
        vm.raise();
        QCOMPARE(raiseSpy.count(), 1);
    }

    void testDrivenByStatusOverlay()
    {
        dsc::OverlayViewModel vm;
        dsc::StatusOverlay overlay(&vm);

        overlay.showConnecting("signage.lan", 1);
        QCOMPARE(vm.title(), QString("Connecting to Server"));
        QVERIFY(vm.detail().startsWith("signage.lan"));

        overlay.clear();
        QVERIFY(!vm.isVisible());
    }
};

QTEST_MAIN(TestOverlayViewModel)
#include "test_overlay_view_model.moc"
