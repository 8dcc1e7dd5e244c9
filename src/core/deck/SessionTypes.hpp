#pragma once

#include <odk/Image/Surface.hpp>
#include <QByteArray>
#include <QMetaType>
#include <QString>

namespace odb {

enum class SessionState {
    Connecting,
    Registering,
    Streaming,
    Draining,
    Closed
};

enum class CancelReason {
    None,
    Removed,
    Shutdown,
    Evicted
};

enum class CloseReason {
    ConnectFailed,
    RegistrationRejected,
    IoError,
    Disconnected,
    Removed,
    Shutdown,
    Evicted
};

inline const char* sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Connecting: return "Connecting";
    case SessionState::Registering: return "Registering";
    case SessionState::Streaming: return "Streaming";
    case SessionState::Draining: return "Draining";
    case SessionState::Closed: return "Closed";
    }
    return "?";
}

inline const char* closeReasonName(CloseReason reason)
{
    switch (reason) {
    case CloseReason::ConnectFailed: return "ConnectFailed";
    case CloseReason::RegistrationRejected: return "RegistrationRejected";
    case CloseReason::IoError: return "IoError";
    case CloseReason::Disconnected: return "Disconnected";
    case CloseReason::Removed: return "Removed";
    case CloseReason::Shutdown: return "Shutdown";
    case CloseReason::Evicted: return "Evicted";
    }
    return "?";
}

inline CloseReason closeReasonFor(CancelReason reason)
{
    switch (reason) {
    case CancelReason::Removed: return CloseReason::Removed;
    case CancelReason::Shutdown: return CloseReason::Shutdown;
    case CancelReason::Evicted:
    case CancelReason::None:
        break;
    }
    return CloseReason::Evicted;
}

/// Host request to draw on (or clear) one surface. Empty bytes clear the
/// surface; Surface::all() with empty bytes clears the whole device.
struct ImageSetRequest {
    odk::Surface surface;
    QByteArray bytes;
    QString encoding;   // "jpeg", "png" or "bmp"

    bool isClear() const { return bytes.isEmpty(); }
};

/// What the host needs to know to show a device.
struct DeviceRegistration {
    QString id;
    QString name;
    int rows = 0;
    int columns = 0;
    int encoders = 0;
    int touchZones = 0;
    int type = 0;
    int protocolVersion = 1;

    int buttonCount() const { return rows * columns; }
};

} // namespace odb

Q_DECLARE_METATYPE(odb::SessionState)
Q_DECLARE_METATYPE(odb::CloseReason)
Q_DECLARE_METATYPE(odb::ImageSetRequest)
