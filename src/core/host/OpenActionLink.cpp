#include "core/host/OpenActionLink.hpp"
#include <odk/Input/InputDecoder.hpp>
#include <QJsonDocument>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace odb {

OpenActionLink::OpenActionLink(quint16 port, const QString& pluginUuid,
                               const QString& registerEvent, QObject* parent)
    : IHostLink(parent)
    , port_(port)
    , pluginUuid_(pluginUuid)
    , registerEvent_(registerEvent)
{
    connect(&socket_, &QWebSocket::connected, this, &OpenActionLink::onConnected);
    connect(&socket_, &QWebSocket::disconnected, this, &OpenActionLink::onDisconnected);
    connect(&socket_, &QWebSocket::textMessageReceived, this, &OpenActionLink::handleTextMessage);
    connect(&socket_, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        BOOST_LOG_TRIVIAL(error) << "[OpenAction] Socket error: " << socket_.errorString().toStdString();
        // A failed connect never reaches disconnected()
        if (!connected_ && !closing_)
            emit hostDisconnected();
    });
}

OpenActionLink::~OpenActionLink()
{
    close();
}

void OpenActionLink::open()
{
    const QUrl url(QStringLiteral("ws://localhost:%1").arg(port_));
    BOOST_LOG_TRIVIAL(info) << "[OpenAction] Connecting to " << url.toString().toStdString();
    socket_.open(url);
}

void OpenActionLink::close()
{
    closing_ = true;
    socket_.close();
}

bool OpenActionLink::isOpen() const
{
    return connected_;
}

void OpenActionLink::onConnected()
{
    connected_ = true;
    BOOST_LOG_TRIVIAL(info) << "[OpenAction] Connected, registering plugin";

    QJsonObject hello;
    hello["event"] = registerEvent_;
    hello["uuid"] = pluginUuid_;
    socket_.sendTextMessage(QString::fromUtf8(QJsonDocument(hello).toJson(QJsonDocument::Compact)));

    const auto pending = queued_;
    queued_.clear();
    for (const auto& message : pending)
        send(message);
}

void OpenActionLink::onDisconnected()
{
    connected_ = false;
    if (closing_)
        return;

    BOOST_LOG_TRIVIAL(error) << "[OpenAction] Lost connection to host: "
                             << socket_.errorString().toStdString();
    emit hostDisconnected();
}

void OpenActionLink::send(const QJsonObject& message)
{
    if (!connected_) {
        queued_.append(message);
        return;
    }
    socket_.sendTextMessage(QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact)));
}

void OpenActionLink::sendEvent(const QString& event, const QJsonValue& payload)
{
    QJsonObject message;
    message["event"] = event;
    message["payload"] = payload;
    send(message);
}

// --- Outbound ---

bool OpenActionLink::registerDevice(const DeviceRegistration& registration)
{
    if (registration.id.isEmpty())
        return false;

    devices_.insert(registration.id, registration);

    QJsonObject payload;
    payload["id"] = registration.id;
    payload["name"] = registration.name;
    payload["rows"] = registration.rows;
    payload["columns"] = registration.columns;
    payload["encoders"] = registration.encoders;
    payload["type"] = registration.type;
    sendEvent(QStringLiteral("registerDevice"), payload);

    BOOST_LOG_TRIVIAL(info) << "[OpenAction] Registering device " << registration.id.toStdString();
    return true;
}

void OpenActionLink::reportDisconnect(const QString& deviceId)
{
    devices_.remove(deviceId);
    sendEvent(QStringLiteral("deregisterDevice"), deviceId);
    BOOST_LOG_TRIVIAL(info) << "[OpenAction] Removing device " << deviceId.toStdString();
}

void OpenActionLink::forwardInput(const QString& deviceId, const odk::InputEvent& event)
{
    QJsonObject payload;
    payload["device"] = deviceId;

    switch (event.type) {
    case odk::InputEvent::Type::ButtonPress:
        payload["position"] = event.index;
        sendEvent(event.pressed ? QStringLiteral("keyDown") : QStringLiteral("keyUp"), payload);
        break;
    case odk::InputEvent::Type::TouchTap: {
        // Touch zones are addressed as the keys after the grid
        const int buttons = devices_.value(deviceId).buttonCount();
        payload["position"] = buttons + event.index;
        sendEvent(QStringLiteral("keyDown"), payload);
        sendEvent(QStringLiteral("keyUp"), payload);
        break;
    }
    case odk::InputEvent::Type::EncoderTwist:
        payload["position"] = event.index;
        payload["ticks"] = event.delta;
        sendEvent(QStringLiteral("encoderChange"), payload);
        break;
    case odk::InputEvent::Type::EncoderPress:
        payload["position"] = event.index;
        sendEvent(event.pressed ? QStringLiteral("encoderDown") : QStringLiteral("encoderUp"), payload);
        break;
    case odk::InputEvent::Type::TouchSwipe:
    case odk::InputEvent::Type::Unknown:
        BOOST_LOG_TRIVIAL(debug) << "[OpenAction] Not forwarding "
                                 << odk::InputDecoder::describe(event).toStdString();
        break;
    }
}

// --- Inbound ---

void OpenActionLink::handleTextMessage(const QString& message)
{
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8());
    if (!doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[OpenAction] Ignoring malformed message";
        return;
    }

    const QJsonObject obj = doc.object();
    const QString event = obj.value("event").toString();

    if (event == QLatin1String("setImage"))
        handleSetImage(obj);
    else if (event == QLatin1String("setBrightness"))
        handleSetBrightness(obj);
    else
        BOOST_LOG_TRIVIAL(trace) << "[OpenAction] Unhandled event " << event.toStdString();
}

odk::Surface OpenActionLink::surfaceForPosition(const QString& deviceId, int position) const
{
    auto it = devices_.constFind(deviceId);
    if (it != devices_.constEnd() && it->touchZones > 0 && position >= it->buttonCount())
        return odk::Surface::touchZone(position - it->buttonCount());
    return odk::Surface::button(position);
}

void OpenActionLink::handleSetImage(const QJsonObject& message)
{
    const QString deviceId = message.value("device").toString();
    const QJsonValue position = message.value("position");
    const QJsonValue image = message.value("image");
    const bool hasPosition = position.isDouble();
    const bool hasImage = image.isString() && !image.toString().isEmpty();

    ImageSetRequest request;

    if (!hasPosition && !hasImage) {
        request.surface = odk::Surface::all();
    } else if (hasPosition && !hasImage) {
        request.surface = surfaceForPosition(deviceId, position.toInt());
    } else if (hasPosition && hasImage) {
        const DataUrl url = parseDataUrl(image.toString());
        if (!url.valid) {
            BOOST_LOG_TRIVIAL(error) << "[OpenAction] Bad image data URL for " << deviceId.toStdString();
            return;
        }
        request.surface = surfaceForPosition(deviceId, position.toInt());
        request.bytes = url.bytes;
        request.encoding = url.subtype();
    } else {
        // image without a position has no meaning
        return;
    }

    emit setImageRequested(deviceId, request);
}

void OpenActionLink::handleSetBrightness(const QJsonObject& message)
{
    const QString deviceId = message.value("device").toString();
    const int level = message.value("brightness").toInt(-1);
    if (level < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[OpenAction] setBrightness without a level";
        return;
    }
    emit brightnessRequested(deviceId, level);
}

DataUrl OpenActionLink::parseDataUrl(const QString& url)
{
    DataUrl result;
    if (!url.startsWith(QLatin1String("data:"), Qt::CaseInsensitive))
        return result;

    const int comma = url.indexOf(QLatin1Char(','));
    if (comma < 0)
        return result;

    const QStringList params = url.mid(5, comma - 5).split(QLatin1Char(';'));
    const QByteArray body = url.mid(comma + 1).toLatin1();

    result.mimeType = params.value(0).trimmed().toLower();
    if (result.mimeType.isEmpty())
        result.mimeType = QStringLiteral("text/plain");

    const bool base64 = params.size() > 1
        && params.last().trimmed().compare(QLatin1String("base64"), Qt::CaseInsensitive) == 0;

    if (base64) {
        auto decoded = QByteArray::fromBase64Encoding(QByteArray::fromPercentEncoding(body),
                                                      QByteArray::AbortOnBase64DecodingErrors);
        if (!decoded)
            return result;
        result.bytes = *decoded;
    } else {
        result.bytes = QByteArray::fromPercentEncoding(body);
    }

    result.valid = true;
    return result;
}

} // namespace odb
