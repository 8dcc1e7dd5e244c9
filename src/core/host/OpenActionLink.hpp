#pragma once

#include "core/host/IHostLink.hpp"
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QWebSocket>

namespace odb {

/// Decoded "data:" URL.
struct DataUrl {
    bool valid = false;
    QString mimeType;       // e.g. "image/jpeg"
    QByteArray bytes;

    /// MIME subtype ("jpeg" for image/jpeg), the encoding ImageAdapter expects.
    QString subtype() const { return mimeType.section(QLatin1Char('/'), 1); }
};

/// OpenAction plugin side of the host connection.
///
/// The host launches the plugin with a port, a plugin UUID and a register
/// event name; the plugin connects to ws://localhost:<port>, announces
/// itself, then exchanges JSON events. Outbound events sent before the
/// socket is open are queued and flushed on connect.
class OpenActionLink : public IHostLink {
    Q_OBJECT

public:
    OpenActionLink(quint16 port, const QString& pluginUuid, const QString& registerEvent,
                   QObject* parent = nullptr);
    ~OpenActionLink() override;

    void open();
    void close();
    bool isOpen() const;

    // IHostLink
    bool registerDevice(const DeviceRegistration& registration) override;
    void forwardInput(const QString& deviceId, const odk::InputEvent& event) override;
    void reportDisconnect(const QString& deviceId) override;

    /// Inbound host event (one WebSocket text frame).
    void handleTextMessage(const QString& message);

    /// Messages waiting for the socket to open.
    QList<QJsonObject> queuedMessages() const { return queued_; }

    static DataUrl parseDataUrl(const QString& url);

private:
    void onConnected();
    void onDisconnected();
    void send(const QJsonObject& message);
    void sendEvent(const QString& event, const QJsonValue& payload);
    void handleSetImage(const QJsonObject& message);
    void handleSetBrightness(const QJsonObject& message);
    odk::Surface surfaceForPosition(const QString& deviceId, int position) const;

    quint16 port_;
    QString pluginUuid_;
    QString registerEvent_;
    QWebSocket socket_;
    bool connected_ = false;
    bool closing_ = false;
    QList<QJsonObject> queued_;
    QHash<QString, DeviceRegistration> devices_;
};

} // namespace odb
