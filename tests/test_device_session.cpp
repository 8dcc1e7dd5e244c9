#include <QtTest/QtTest>
#include <QBuffer>
#include <QImage>
#include <QtEndian>
#include <QSignalSpy>
#include "core/deck/DeviceSession.hpp"
#include "core/deck/SessionRegistry.hpp"
#include "support/RecordingHostLink.hpp"
#include <odk/Catalog/DeviceCatalog.hpp>
#include <odk/Transport/ReplayHidBackend.hpp>
#include <memory>
#include <thread>

using odb::CloseReason;
using odb::DeviceSession;
using odb::SessionState;

namespace {

// Session plumbing: replay backend, registry, host and one io_service worker.
struct Rig {
    odk::DeviceCatalog catalog;
    odk::ReplayHidBackend backend;
    odb::SessionRegistry registry;
    RecordingHostLink host;
    boost::asio::io_service ioService;
    std::unique_ptr<boost::asio::io_service::work> work;
    std::thread worker;

    Rig()
        : work(std::make_unique<boost::asio::io_service::work>(ioService))
    {
        worker = std::thread([this]() { ioService.run(); });
    }

    ~Rig()
    {
        registry.cancelAll(odb::CancelReason::Shutdown);
        QTest::qWaitFor([this]() { return registry.isEmpty(); }, 3000);
        work.reset();
        ioService.stop();
        worker.join();
    }

    DeviceSession::Pointer addSession(uint16_t vid, uint16_t pid, const QString& path)
    {
        odk::HidDeviceInfo info;
        info.path = path;
        info.vendorId = vid;
        info.productId = pid;
        info.usagePage = odk::DECK_USAGE_PAGE;
        info.usage = odk::DECK_USAGE;
        backend.addDevice(info);

        odb::CandidateDevice candidate;
        candidate.info = info;
        candidate.variant = *catalog.lookupByVidPid(vid, pid);
        candidate.id = odb::deviceIdFor("n3", info, candidate.variant);

        DeviceSession::Options options;
        options.readTimeoutMs = 10;

        odb::CancellationToken token;
        auto session = DeviceSession::create(ioService, &backend, candidate, token,
                                             &registry, &host, options);
        registry.insert(candidate.id, {token, session});
        return session;
    }

    DeviceSession::Pointer addAkp03(const QString& path = QStringLiteral("/dev/hidraw1"))
    {
        return addSession(odk::AJAZZ_VID, odk::AKP03_PID, path);
    }
};

bool isCommand(const QByteArray& packet, const char* command)
{
    return packet.mid(1, 5) == QByteArray("CRT\0\0", 5) && packet.mid(6, 3) == command;
}

int countCommand(const QList<QByteArray>& written, const char* command)
{
    int n = 0;
    for (const auto& p : written) {
        if (isCommand(p, command))
            ++n;
    }
    return n;
}

QByteArray pngBytes(const QColor& color)
{
    QImage image(72, 72, QImage::Format_RGB888);
    image.fill(color);
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");
    return bytes;
}

odb::ImageSetRequest imageRequest(const odk::Surface& surface, const QByteArray& bytes)
{
    odb::ImageSetRequest request;
    request.surface = surface;
    request.bytes = bytes;
    request.encoding = QStringLiteral("png");
    return request;
}

} // namespace

class TestDeviceSession : public QObject {
    Q_OBJECT
private slots:
    void testConnectResetsAndRegisters()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy stateSpy(session.get(), &DeviceSession::stateChanged);
        session->start();

        QTRY_COMPARE(session->state(), SessionState::Streaming);
        QCOMPARE(stateSpy.count(), 2);
        QCOMPARE(stateSpy.at(0).at(0).value<SessionState>(), SessionState::Registering);
        QCOMPARE(stateSpy.at(1).at(0).value<SessionState>(), SessionState::Streaming);

        QCOMPARE(rig.host.registrations.size(), 1);
        const auto& reg = rig.host.registrations.first();
        QCOMPARE(reg.id, session->id());
        QCOMPARE(reg.rows, 3);
        QCOMPARE(reg.columns, 3);
        QCOMPARE(reg.encoders, 3);
        QVERIFY(session->isRegistered());

        const auto written = rig.backend.endpoint("/dev/hidraw1")->writtenData();
        QVERIFY(written.size() >= 4);
        QVERIFY(isCommand(written.at(0), "DIS"));
        QVERIFY(isCommand(written.at(1), "LIG"));
        QCOMPARE(static_cast<uint8_t>(written.at(1).at(11)), uint8_t(50));
        QVERIFY(isCommand(written.at(2), "CLE"));
        QCOMPARE(static_cast<uint8_t>(written.at(2).at(12)), uint8_t(0xFF));
        QVERIFY(isCommand(written.at(3), "STP"));
        QVERIFY(rig.registry.contains(session->id()));
    }

    void testConnectFailure()
    {
        Rig rig;
        rig.backend.setOpenFails("/dev/hidraw1", true);
        auto session = rig.addAkp03();
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        session->start();

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::ConnectFailed);
        QCOMPARE(session->state(), SessionState::Closed);
        QVERIFY(rig.host.registrations.isEmpty());
        QVERIFY(rig.host.disconnects.isEmpty());
        QVERIFY(!rig.registry.contains(session->id()));
    }

    void testRegistrationRejected()
    {
        Rig rig;
        rig.host.acceptRegistration = false;
        auto session = rig.addAkp03();
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        session->start();

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::RegistrationRejected);
        QCOMPARE(rig.host.registrations.size(), 1);
        QVERIFY(rig.host.disconnects.isEmpty());
        QVERIFY(rig.backend.endpoint("/dev/hidraw1")->wasClosed());
        QVERIFY(!rig.registry.contains(session->id()));
    }

    void testCancelledBeforeConnect()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        QVERIFY(session->cancel(odb::CancelReason::Evicted));
        session->start();

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::Evicted);
        QCOMPARE(rig.backend.openCount("/dev/hidraw1"), 0);
        QVERIFY(rig.host.registrations.isEmpty());
    }

    void testPressOnlyInputGetsRelease()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy inputSpy(session.get(), &DeviceSession::inputDecoded);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->feedInput(0x25, 1);
        QTRY_COMPARE(rig.host.inputs.size(), 2);
        QCOMPARE(rig.host.inputs.at(0).first, session->id());
        QCOMPARE(rig.host.inputs.at(0).second, odk::InputEvent::buttonPress(6, true));
        QCOMPARE(rig.host.inputs.at(1).second, odk::InputEvent::buttonPress(6, false));

        // Unknown codes are dropped, encoder twists get no release
        endpoint->feedInput(0xEE, 1);
        endpoint->feedInput(0x91, 0);
        QTRY_COMPARE(rig.host.inputs.size(), 3);
        QCOMPARE(rig.host.inputs.at(2).second, odk::InputEvent::encoderTwist(0, 1));
        QCOMPARE(inputSpy.count(), 3);
    }

    void testBothStatesInput()
    {
        Rig rig;
        auto session = rig.addSession(odk::MIRABOX_VID, odk::N3EN_PID, "/dev/hidraw4");
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw4");
        endpoint->feedInput(0x01, 1);
        endpoint->feedInput(0x01, 0);
        QTRY_COMPARE(rig.host.inputs.size(), 2);
        QCOMPARE(rig.host.inputs.at(0).second, odk::InputEvent::buttonPress(0, true));
        QCOMPARE(rig.host.inputs.at(1).second, odk::InputEvent::buttonPress(0, false));
        QTest::qWait(50);
        QCOMPARE(rig.host.inputs.size(), 2);
    }

    void testTouchTapForwardedOncePerTouch()
    {
        Rig rig;
        auto session = rig.addSession(odk::AJAZZ_VID, odk::AKP05_PID, "/dev/hidraw5");
        QSignalSpy inputSpy(session.get(), &DeviceSession::inputDecoded);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        // Finger down then up on zone 0, then key 1 as a marker
        auto endpoint = rig.backend.endpoint("/dev/hidraw5");
        endpoint->feedInput(0x40, 1);
        endpoint->feedInput(0x40, 0);
        endpoint->feedInput(0x01, 1);

        QTRY_COMPARE(rig.host.inputs.size(), 2);
        QCOMPARE(rig.host.inputs.at(0).second, odk::InputEvent::touchTap(0));
        QCOMPARE(rig.host.inputs.at(1).second, odk::InputEvent::buttonPress(1, true));
        QTest::qWait(50);
        QCOMPARE(rig.host.inputs.size(), 2);
        QCOMPARE(inputSpy.count(), 2);
    }

    void testSetImageWritesOnceForSameContent()
    {
        Rig rig;
        auto session = rig.addAkp03();
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->clearWritten();

        session->submitImage(imageRequest(odk::Surface::button(2), pngBytes(Qt::red)));
        QTRY_COMPARE(countCommand(endpoint->writtenData(), "STP"), 1);

        auto written = endpoint->writtenData();
        QVERIFY(isCommand(written.first(), "BAT"));
        QCOMPARE(static_cast<uint8_t>(written.first().at(13)), uint8_t(3));
        QVERIFY(written.size() >= 3);
        QVERIFY(isCommand(written.last(), "STP"));

        // Identical content: nothing goes out before the brightness marker
        endpoint->clearWritten();
        session->submitImage(imageRequest(odk::Surface::button(2), pngBytes(Qt::red)));
        session->submitBrightness(30);
        QTRY_COMPARE(countCommand(endpoint->writtenData(), "LIG"), 1);
        QCOMPARE(countCommand(endpoint->writtenData(), "BAT"), 0);

        // Different content is written again
        endpoint->clearWritten();
        session->submitImage(imageRequest(odk::Surface::button(2), pngBytes(Qt::blue)));
        QTRY_COMPARE(countCommand(endpoint->writtenData(), "BAT"), 1);
    }

    void testCorruptImageKeepsStreaming()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy rejectedSpy(session.get(), &DeviceSession::imageRejected);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->clearWritten();

        const QByteArray png = pngBytes(Qt::green);
        session->submitImage(imageRequest(odk::Surface::button(0), png.left(png.size() / 2)));
        QTRY_COMPARE(rejectedSpy.count(), 1);
        QCOMPARE(rejectedSpy.at(0).at(1).value<odk::ImageError>(), odk::ImageError::Decode);
        QCOMPARE(session->state(), SessionState::Streaming);
        QCOMPARE(countCommand(endpoint->writtenData(), "BAT"), 0);

        session->submitImage(imageRequest(odk::Surface::button(0), png));
        QTRY_COMPARE(countCommand(endpoint->writtenData(), "BAT"), 1);
        QCOMPARE(rejectedSpy.count(), 1);
    }

    void testUnsupportedSurfaceRejected()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy rejectedSpy(session.get(), &DeviceSession::imageRejected);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        // Key 7 has no display
        session->submitImage(imageRequest(odk::Surface::button(7), pngBytes(Qt::red)));
        session->submitImage(imageRequest(odk::Surface::all(), pngBytes(Qt::red)));
        QTRY_COMPARE(rejectedSpy.count(), 2);
        QCOMPARE(rejectedSpy.at(0).at(1).value<odk::ImageError>(), odk::ImageError::UnsupportedSurface);
        QCOMPARE(rejectedSpy.at(1).at(1).value<odk::ImageError>(), odk::ImageError::UnsupportedSurface);
        QCOMPARE(session->state(), SessionState::Streaming);
    }

    void testClearRequests()
    {
        Rig rig;
        auto session = rig.addAkp03();
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->clearWritten();

        odb::ImageSetRequest one;
        one.surface = odk::Surface::button(2);
        session->submitImage(one);
        odb::ImageSetRequest all;
        all.surface = odk::Surface::all();
        session->submitImage(all);

        QTRY_COMPARE(countCommand(endpoint->writtenData(), "STP"), 2);
        const auto written = endpoint->writtenData();
        QVERIFY(isCommand(written.at(0), "CLE"));
        QCOMPARE(static_cast<uint8_t>(written.at(0).at(12)), uint8_t(3));
        QVERIFY(isCommand(written.at(2), "CLE"));
        QCOMPARE(static_cast<uint8_t>(written.at(2).at(12)), uint8_t(0xFF));
    }

    void testTouchZoneClearPaintsBlack()
    {
        Rig rig;
        auto session = rig.addSession(odk::AJAZZ_VID, odk::AKP05_PID, "/dev/hidraw5");
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw5");
        endpoint->clearWritten();

        odb::ImageSetRequest zone;
        zone.surface = odk::Surface::touchZone(2);
        session->submitImage(zone);

        QTRY_COMPARE(countCommand(endpoint->writtenData(), "STP"), 1);
        const auto written = endpoint->writtenData();
        QCOMPARE(countCommand(written, "CLE"), 0);
        QVERIFY(isCommand(written.first(), "BAT"));
        // 10 keys, then zone 2; protocol 3 puts the key after a 4 byte length
        QCOMPARE(static_cast<uint8_t>(written.first().at(15)), uint8_t(13));

        // Payload is a black 176x112 JPEG
        QByteArray payload;
        for (int i = 1; i < written.size() - 1; ++i)
            payload.append(written.at(i).mid(1));
        payload.truncate(static_cast<int>(qFromBigEndian<quint32>(written.first().constData() + 11)));
        const QImage image = QImage::fromData(payload, "JPEG");
        QCOMPARE(image.size(), QSize(176, 112));
        QVERIFY(image.pixelColor(88, 56).value() < 16);
    }

    void testBrightnessClamped()
    {
        Rig rig;
        auto session = rig.addAkp03();
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);
        QCOMPARE(session->brightness(), 50);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->clearWritten();
        session->submitBrightness(150);
        QTRY_COMPARE(session->brightness(), 100);
        QCOMPARE(static_cast<uint8_t>(endpoint->writtenData().first().at(11)), uint8_t(100));
    }

    void testDisconnectReportsAndEvicts()
    {
        Rig rig;
        auto first = rig.addAkp03("/dev/hidraw1");
        auto second = rig.addAkp03("/dev/hidraw2");
        QSignalSpy firstStates(first.get(), &DeviceSession::stateChanged);
        QSignalSpy secondStates(second.get(), &DeviceSession::stateChanged);
        QSignalSpy closedSpy(first.get(), &DeviceSession::closed);
        first->start();
        second->start();
        QTRY_COMPARE(first->state(), SessionState::Streaming);
        QTRY_COMPARE(second->state(), SessionState::Streaming);
        const int secondBefore = secondStates.count();

        rig.backend.endpoint("/dev/hidraw1")->simulateDisconnect();
        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::Disconnected);
        QCOMPARE(rig.host.disconnects, QStringList{first->id()});
        QVERIFY(!rig.registry.contains(first->id()));

        // No Draining for hardware-side loss
        for (const auto& args : firstStates)
            QVERIFY(args.at(0).value<SessionState>() != SessionState::Draining);

        QTest::qWait(50);
        QCOMPARE(second->state(), SessionState::Streaming);
        QCOMPARE(secondStates.count(), secondBefore);
        QVERIFY(rig.registry.contains(second->id()));
    }

    void testReadErrorCloses()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        rig.backend.endpoint("/dev/hidraw1")->simulateReadError();
        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::IoError);
        QCOMPARE(rig.host.disconnects.size(), 1);
    }

    void testWriteErrorCloses()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        rig.backend.endpoint("/dev/hidraw1")->setFailWrites(true);
        session->submitBrightness(20);
        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::IoError);
        QVERIFY(rig.backend.endpoint("/dev/hidraw1")->wasClosed());
    }

    void testShutdownBlanksDevice()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy stateSpy(session.get(), &DeviceSession::stateChanged);
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->clearWritten();
        QVERIFY(session->cancel(odb::CancelReason::Shutdown));

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::Shutdown);

        const auto written = endpoint->writtenData();
        QCOMPARE(written.size(), 3);
        QVERIFY(isCommand(written.at(0), "CLE"));
        QVERIFY(isCommand(written.at(1), "STP"));
        QVERIFY(isCommand(written.at(2), "HAN"));
        QVERIFY(endpoint->wasClosed());

        QCOMPARE(stateSpy.at(stateSpy.count() - 2).at(0).value<SessionState>(), SessionState::Draining);
        QCOMPARE(stateSpy.last().at(0).value<SessionState>(), SessionState::Closed);
        QCOMPARE(rig.host.disconnects, QStringList{session->id()});
    }

    void testCancelIsIdempotent()
    {
        Rig rig;
        auto session = rig.addAkp03();
        QSignalSpy closedSpy(session.get(), &DeviceSession::closed);
        session->start();
        QTRY_COMPARE(session->state(), SessionState::Streaming);

        auto endpoint = rig.backend.endpoint("/dev/hidraw1");
        endpoint->clearWritten();
        QVERIFY(session->cancel(odb::CancelReason::Removed));
        QVERIFY(!session->cancel(odb::CancelReason::Shutdown));
        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::Removed);

        // Removed devices are gone, nothing to blank
        QCOMPARE(countCommand(endpoint->writtenData(), "HAN"), 0);

        session->submitBrightness(10);
        QVERIFY(!session->cancel(odb::CancelReason::Removed));
        QTest::qWait(50);
        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(rig.host.disconnects.size(), 1);
    }
};

QTEST_GUILESS_MAIN(TestDeviceSession)
#include "test_device_session.moc"
