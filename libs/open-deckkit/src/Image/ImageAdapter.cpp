#include <odk/Image/ImageAdapter.hpp>

#include <QBuffer>
#include <QDebug>
#include <QImageWriter>
#include <QTransform>
#include <QtEndian>

namespace odk {

namespace {

QByteArray normalisedFormat(const QString& encoding) {
    QString e = encoding.trimmed().toLower();
    if (e.startsWith(QLatin1String("image/")))
        e = e.mid(6);
    if (e == QLatin1String("jpg"))
        e = QStringLiteral("jpeg");
    return e.toLatin1();
}

// libjpeg happily decodes a truncated stream and pads the rest with grey, so
// check the container is complete before handing it to Qt.
bool looksComplete(const QByteArray& bytes, const QByteArray& format) {
    if (format == "jpeg") {
        return bytes.size() >= 4
            && static_cast<uchar>(bytes[0]) == 0xFF && static_cast<uchar>(bytes[1]) == 0xD8
            && static_cast<uchar>(bytes[bytes.size() - 2]) == 0xFF
            && static_cast<uchar>(bytes[bytes.size() - 1]) == 0xD9;
    }
    if (format == "png") {
        static const QByteArray iend("IEND\xAE\x42\x60\x82", 8);
        return bytes.startsWith("\x89PNG") && bytes.endsWith(iend);
    }
    if (format == "bmp") {
        // BITMAPFILEHEADER: "BM", then the file size as little-endian uint32
        if (bytes.size() < 14 || !bytes.startsWith("BM"))
            return false;
        const quint32 fileSize = qFromLittleEndian<quint32>(bytes.constData() + 2);
        return static_cast<quint32>(bytes.size()) >= fileSize;
    }
    return !bytes.isEmpty();
}

int rotationDegrees(ImageRotation rotation) {
    switch (rotation) {
    case ImageRotation::Rot0: return 0;
    case ImageRotation::Rot90: return 90;
    case ImageRotation::Rot180: return 180;
    case ImageRotation::Rot270: return 270;
    }
    return 0;
}

} // namespace

const char* imageErrorName(ImageError error) {
    switch (error) {
    case ImageError::None: return "None";
    case ImageError::Decode: return "Decode";
    case ImageError::UnsupportedSurface: return "UnsupportedSurface";
    case ImageError::UnsupportedEncoding: return "UnsupportedEncoding";
    }
    return "?";
}

ImageAdapter::ImageAdapter(int jpegQuality)
    : jpegQuality_(qBound(1, jpegQuality, 100))
{
}

const ImageSpec* ImageAdapter::specFor(const DeviceVariant& variant, const Surface& surface) {
    switch (surface.kind) {
    case Surface::Kind::Button:
        if (surface.index >= 0 && surface.index < variant.lcdButtonCount
            && variant.buttonImage.isValid())
            return &variant.buttonImage;
        return nullptr;
    case Surface::Kind::TouchZone:
        if (surface.index >= 0 && surface.index < variant.touchZoneCount
            && variant.touchZoneImage.isValid())
            return &variant.touchZoneImage;
        return nullptr;
    case Surface::Kind::All:
        return nullptr;
    }
    return nullptr;
}

AdaptResult ImageAdapter::adapt(const DeviceVariant& variant, const Surface& surface,
                                const QByteArray& sourceBytes, const QString& sourceEncoding) const {
    AdaptResult result;

    const ImageSpec* spec = specFor(variant, surface);
    if (!spec) {
        result.error = ImageError::UnsupportedSurface;
        return result;
    }

    const QByteArray format = normalisedFormat(sourceEncoding);
    if (format != "jpeg" && format != "png" && format != "bmp") {
        result.error = ImageError::UnsupportedEncoding;
        return result;
    }

    if (!looksComplete(sourceBytes, format)) {
        result.error = ImageError::Decode;
        return result;
    }

    QImage image;
    if (!image.loadFromData(sourceBytes, format.constData()) || image.isNull()) {
        result.error = ImageError::Decode;
        return result;
    }

    return encode(*spec, image);
}

AdaptResult ImageAdapter::blank(const DeviceVariant& variant, const Surface& surface) const {
    const ImageSpec* spec = specFor(variant, surface);
    if (!spec) {
        AdaptResult result;
        result.error = ImageError::UnsupportedSurface;
        return result;
    }

    QImage black(spec->width, spec->height, QImage::Format_RGB888);
    black.fill(Qt::black);
    return encode(*spec, black);
}

AdaptResult ImageAdapter::encode(const ImageSpec& spec, const QImage& source) const {
    AdaptResult result;

    QImage image = source.convertToFormat(QImage::Format_RGB888)
                       .scaled(spec.width, spec.height,
                               Qt::IgnoreAspectRatio, Qt::SmoothTransformation);

    const int degrees = rotationDegrees(spec.rotation);
    if (degrees != 0)
        image = image.transformed(QTransform().rotate(degrees));

    switch (spec.mirroring) {
    case ImageMirroring::None:
        break;
    case ImageMirroring::Horizontal:
        image = image.mirrored(true, false);
        break;
    case ImageMirroring::Vertical:
        image = image.mirrored(false, true);
        break;
    case ImageMirroring::Both:
        image = image.mirrored(true, true);
        break;
    }

    QBuffer buffer(&result.payload);
    buffer.open(QIODevice::WriteOnly);

    const char* wireFormat = spec.encoding == ImageEncoding::Jpeg ? "jpeg" : "bmp";
    QImageWriter writer(&buffer, wireFormat);
    if (spec.encoding == ImageEncoding::Jpeg)
        writer.setQuality(jpegQuality_);

    if (!writer.write(image)) {
        qWarning() << "[ImageAdapter] encode failed:" << writer.errorString();
        result.payload.clear();
        result.error = ImageError::Decode;
    }

    return result;
}

} // namespace odk
