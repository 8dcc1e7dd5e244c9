#include <QtTest/QtTest>
#include <QBuffer>
#include <QImage>
#include <odk/Catalog/DeviceCatalog.hpp>
#include <odk/Image/ImageAdapter.hpp>

namespace {

QByteArray encodeImage(const QImage& image, const char* format)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, format);
    return bytes;
}

// Red left half, blue right half
QImage splitImage(int w, int h)
{
    QImage image(w, h, QImage::Format_RGB888);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x)
            image.setPixelColor(x, y, x < w / 2 ? Qt::red : Qt::blue);
    }
    return image;
}

odk::DeviceVariant testVariant(odk::ImageRotation rotation, odk::ImageMirroring mirroring)
{
    odk::DeviceVariant v;
    v.rows = 1;
    v.columns = 2;
    v.lcdButtonCount = 2;
    v.buttonImage = {40, 20, odk::ImageEncoding::Bmp, rotation, mirroring};
    return v;
}

bool isReddish(const QColor& c) { return c.red() > 200 && c.blue() < 60; }
bool isBluish(const QColor& c) { return c.blue() > 200 && c.red() < 60; }

} // namespace

class TestImageAdapter : public QObject {
    Q_OBJECT
private slots:
    void testScalesToButtonSize()
    {
        odk::DeviceCatalog catalog;
        const auto* akp03 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03E_PID);
        QVERIFY(akp03);

        odk::ImageAdapter adapter;
        const auto result = adapter.adapt(*akp03, odk::Surface::button(0),
                                          encodeImage(splitImage(144, 144), "PNG"),
                                          QStringLiteral("png"));
        QVERIFY(result.ok());

        QImage out;
        QVERIFY(out.loadFromData(result.payload, "JPEG"));
        QCOMPARE(out.size(), QSize(60, 60));
    }

    void testRotationAndMirroring()
    {
        odk::ImageAdapter adapter;
        const QByteArray source = encodeImage(splitImage(40, 20), "BMP");

        auto plain = adapter.adapt(testVariant(odk::ImageRotation::Rot0, odk::ImageMirroring::None),
                                   odk::Surface::button(0), source, QStringLiteral("bmp"));
        QVERIFY(plain.ok());
        QImage img = QImage::fromData(plain.payload, "BMP");
        QCOMPARE(img.size(), QSize(40, 20));
        QVERIFY(isReddish(img.pixelColor(2, 10)));
        QVERIFY(isBluish(img.pixelColor(37, 10)));

        auto mirrored = adapter.adapt(testVariant(odk::ImageRotation::Rot0, odk::ImageMirroring::Horizontal),
                                      odk::Surface::button(0), source, QStringLiteral("bmp"));
        img = QImage::fromData(mirrored.payload, "BMP");
        QVERIFY(isBluish(img.pixelColor(2, 10)));
        QVERIFY(isReddish(img.pixelColor(37, 10)));

        auto rotated = adapter.adapt(testVariant(odk::ImageRotation::Rot90, odk::ImageMirroring::None),
                                     odk::Surface::button(1), source, QStringLiteral("image/bmp"));
        QVERIFY(rotated.ok());
        img = QImage::fromData(rotated.payload, "BMP");
        // Scaled to 40x20 first, then turned on its side
        QCOMPARE(img.size(), QSize(20, 40));
        QVERIFY(isReddish(img.pixelColor(10, 2)));
        QVERIFY(isBluish(img.pixelColor(10, 37)));
    }

    void testTouchZoneUsesOwnSpec()
    {
        odk::DeviceCatalog catalog;
        const auto* akp05 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP05_PID);
        QVERIFY(akp05);

        odk::ImageAdapter adapter;
        const QByteArray source = encodeImage(splitImage(64, 64), "JPEG");
        const auto result = adapter.adapt(*akp05, odk::Surface::touchZone(3), source,
                                          QStringLiteral("jpg"));
        QVERIFY(result.ok());
        QCOMPARE(QImage::fromData(result.payload, "JPEG").size(), QSize(176, 112));
    }

    void testSameInputSamePayload()
    {
        odk::DeviceCatalog catalog;
        const auto* akp03 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        const auto* akp05 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP05_PID);
        QVERIFY(akp03 && akp05);

        const QByteArray png = encodeImage(splitImage(96, 96), "PNG");
        const QByteArray jpeg = encodeImage(splitImage(96, 96), "JPEG");

        odk::ImageAdapter adapter;
        for (const auto* variant : {akp03, akp05}) {
            for (const auto& source : {qMakePair(png, QStringLiteral("png")),
                                       qMakePair(jpeg, QStringLiteral("jpeg"))}) {
                const auto a = adapter.adapt(*variant, odk::Surface::button(0), source.first, source.second);
                const auto b = adapter.adapt(*variant, odk::Surface::button(0), source.first, source.second);
                QVERIFY(a.ok());
                QVERIFY(!a.payload.isEmpty());
                QCOMPARE(a.payload, b.payload);
            }
        }

        // A second adapter with the same quality agrees too
        const auto zone = odk::ImageAdapter().adapt(*akp05, odk::Surface::touchZone(1), png, "png");
        QCOMPARE(zone.payload, adapter.adapt(*akp05, odk::Surface::touchZone(1), png, "png").payload);
    }

    void testUnsupportedSurface()
    {
        odk::DeviceCatalog catalog;
        const auto* akp03 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        odk::ImageAdapter adapter;
        const QByteArray source = encodeImage(splitImage(60, 60), "PNG");

        // Keys 6..8 have no display, the AKP03 has no touch strip
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(6), source, "png").error,
                 odk::ImageError::UnsupportedSurface);
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(-1), source, "png").error,
                 odk::ImageError::UnsupportedSurface);
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::touchZone(0), source, "png").error,
                 odk::ImageError::UnsupportedSurface);
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::all(), source, "png").error,
                 odk::ImageError::UnsupportedSurface);
    }

    void testCorruptSource()
    {
        odk::DeviceCatalog catalog;
        const auto* akp03 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        odk::ImageAdapter adapter;

        const QByteArray jpeg = encodeImage(splitImage(60, 60), "JPEG");
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(0), jpeg.left(jpeg.size() / 2), "jpeg").error,
                 odk::ImageError::Decode);

        const QByteArray png = encodeImage(splitImage(60, 60), "PNG");
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(0), png.left(png.size() - 10), "png").error,
                 odk::ImageError::Decode);

        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(0), QByteArray(), "png").error,
                 odk::ImageError::Decode);
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(0), QByteArray("garbage"), "bmp").error,
                 odk::ImageError::Decode);

        // Header claims more bytes than arrived
        const QByteArray bmp = encodeImage(splitImage(60, 60), "BMP");
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(0), bmp.left(bmp.size() / 2), "bmp").error,
                 odk::ImageError::Decode);
        QVERIFY(adapter.adapt(*akp03, odk::Surface::button(0), bmp, "bmp").ok());

        // Still usable afterwards
        QVERIFY(adapter.adapt(*akp03, odk::Surface::button(0), jpeg, "jpeg").ok());
    }

    void testUnsupportedEncoding()
    {
        odk::DeviceCatalog catalog;
        const auto* akp03 = catalog.lookupByVidPid(odk::AJAZZ_VID, odk::AKP03_PID);
        odk::ImageAdapter adapter;
        QCOMPARE(adapter.adapt(*akp03, odk::Surface::button(0), QByteArray("<svg/>"), "svg+xml").error,
                 odk::ImageError::UnsupportedEncoding);
    }

    void testBlank()
    {
        odk::ImageAdapter adapter;
        const auto v = testVariant(odk::ImageRotation::Rot0, odk::ImageMirroring::None);
        const auto result = adapter.blank(v, odk::Surface::button(1));
        QVERIFY(result.ok());
        const QImage img = QImage::fromData(result.payload, "BMP");
        QCOMPARE(img.size(), QSize(40, 20));
        QCOMPARE(img.pixelColor(5, 5), QColor(Qt::black));

        QCOMPARE(adapter.blank(v, odk::Surface::button(2)).error, odk::ImageError::UnsupportedSurface);
    }

    void testQualityClamped()
    {
        QCOMPARE(odk::ImageAdapter(0).jpegQuality(), 1);
        QCOMPARE(odk::ImageAdapter(250).jpegQuality(), 100);
        QCOMPARE(odk::ImageAdapter().jpegQuality(), odk::ImageAdapter::DEFAULT_JPEG_QUALITY);
    }
};

QTEST_GUILESS_MAIN(TestImageAdapter)
#include "test_image_adapter.moc"
