#pragma once

#include <odk/Catalog/DeviceVariant.hpp>
#include <odk/Image/Surface.hpp>
#include <QByteArray>
#include <QImage>
#include <QString>

namespace odk {

enum class ImageError {
    None,
    Decode,               // source bytes empty, truncated or corrupt
    UnsupportedSurface,   // surface out of range for the variant
    UnsupportedEncoding   // source encoding we don't decode
};

const char* imageErrorName(ImageError error);

struct AdaptResult {
    QByteArray payload;   // device-native image bytes, no transport framing
    ImageError error = ImageError::None;

    bool ok() const { return error == ImageError::None; }
};

/// Converts host images into what the device firmware expects: scaled to the
/// surface size, rotated/mirrored to match the panel mounting, re-encoded in
/// the variant's wire format. Pure; never touches hardware.
class ImageAdapter {
public:
    static constexpr int DEFAULT_JPEG_QUALITY = 90;

    explicit ImageAdapter(int jpegQuality = DEFAULT_JPEG_QUALITY);

    /// sourceEncoding is a MIME subtype or file suffix: "jpeg", "jpg", "png", "bmp".
    AdaptResult adapt(const DeviceVariant& variant, const Surface& surface,
                      const QByteArray& sourceBytes, const QString& sourceEncoding) const;

    /// Black image in the surface's native format.
    AdaptResult blank(const DeviceVariant& variant, const Surface& surface) const;

    /// Image spec for a surface, nullptr if the variant has no such surface.
    static const ImageSpec* specFor(const DeviceVariant& variant, const Surface& surface);

    int jpegQuality() const { return jpegQuality_; }

private:
    AdaptResult encode(const ImageSpec& spec, const QImage& source) const;

    int jpegQuality_;
};

} // namespace odk

Q_DECLARE_METATYPE(odk::ImageError)
