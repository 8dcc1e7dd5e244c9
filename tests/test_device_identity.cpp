#include <QtTest/QtTest>
#include "core/deck/DeviceIdentity.hpp"
#include <odk/Catalog/DeviceCatalog.hpp>

namespace {

odk::HidDeviceInfo makeInfo(const QString& serial, const QString& path = QStringLiteral("/dev/hidraw2"))
{
    odk::HidDeviceInfo info;
    info.path = path;
    info.vendorId = odk::AJAZZ_VID;
    info.productId = odk::AKP03_PID;
    info.usagePage = odk::DECK_USAGE_PAGE;
    info.usage = odk::DECK_USAGE;
    info.serialNumber = serial;
    return info;
}

} // namespace

class TestDeviceIdentity : public QObject {
    Q_OBJECT
private slots:
    void testSanitize()
    {
        QCOMPARE(odb::sanitizeIdentifier("AB-12 cd_34", 32), QString("AB12cd34"));
        QCOMPARE(odb::sanitizeIdentifier("0123456789", 4), QString("6789"));
        QCOMPARE(odb::sanitizeIdentifier(QString::fromUtf8("é-ü/ /"), 8), QString());
    }

    void testSerialId()
    {
        odk::DeviceCatalog catalog;
        const auto& v = *catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        QCOMPARE(odb::deviceIdFor("n3", makeInfo("  355499441494\n"), v), QString("n3-355499441494"));

        const QString longSerial = QString(40, QLatin1Char('A')) + QStringLiteral("XYZ");
        const QString id = odb::deviceIdFor("n3", makeInfo(longSerial), v);
        QCOMPARE(id.size(), 3 + odb::SERIAL_MAX_LENGTH);
        QVERIFY(id.endsWith("XYZ"));
    }

    void testFallbackWithoutSerial()
    {
        odk::DeviceCatalog catalog;
        const auto& v = *catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);

        const QString id = odb::deviceIdFor("n3", makeInfo(QString(), "/dev/hidraw2"), v);
        QCOMPARE(id, QString("n3-03001001AKP03devhidraw2"));

        // Nothing usable in the serial behaves like no serial
        QCOMPARE(odb::deviceIdFor("n3", makeInfo("--", "/dev/hidraw2"), v), id);
    }

    void testFallbackTruncatesPath()
    {
        odk::DeviceCatalog catalog;
        const auto& v = *catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        const QString path = QStringLiteral("/sys/devices/pci0000:00/0000:00:14.0/usb1/1-4/1-4:1.0");
        const QString fallback = odb::fallbackSerial(makeInfo(QString(), path), v);
        QCOMPARE(fallback.left(13), QString("03001001AKP03"));
        QCOMPARE(fallback.size(), 13 + odb::FALLBACK_PATH_LENGTH);
        QVERIFY(fallback.endsWith("usb1141410"));
    }

    void testDistinctDevicesGetDistinctIds()
    {
        odk::DeviceCatalog catalog;
        const auto& v = *catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        QVERIFY(odb::deviceIdFor("n3", makeInfo(QString(), "/dev/hidraw2"), v)
                != odb::deviceIdFor("n3", makeInfo(QString(), "/dev/hidraw3"), v));
        QVERIFY(odb::deviceIdFor("n3", makeInfo("A1"), v) != odb::deviceIdFor("n3", makeInfo("A2"), v));
    }
};

QTEST_GUILESS_MAIN(TestDeviceIdentity)
#include "test_device_identity.moc"
