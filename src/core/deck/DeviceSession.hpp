#pragma once

#include "core/deck/CancellationToken.hpp"
#include "core/deck/DeviceIdentity.hpp"
#include "core/deck/SessionTypes.hpp"
#include <odk/Image/ImageAdapter.hpp>
#include <odk/Input/InputEvent.hpp>
#include <odk/Protocol/PacketFramer.hpp>
#include <odk/Transport/IHidBackend.hpp>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <atomic>
#include <functional>
#include <memory>
#include <boost/asio.hpp>

namespace odb {

class IHostLink;
class SessionRegistry;

// One connected deck. Blocking HID work runs on the shared io_service,
// serialised by a per-session strand; host calls, state changes and signals
// happen on the Qt main thread.
//
// Lifecycle: Connecting -> Registering -> Streaming -> Draining -> Closed.
// Closed is reached exactly once, after which the registry entry is gone
// and, if the host knew the device, a disconnect has been reported.
class DeviceSession
    : public QObject
    , public std::enable_shared_from_this<DeviceSession>
{
    Q_OBJECT

public:
    using Pointer = std::shared_ptr<DeviceSession>;

    struct Options {
        int defaultBrightness = 50;
        int readTimeoutMs = 100;
        int jpegQuality = odk::ImageAdapter::DEFAULT_JPEG_QUALITY;
    };

    /// Sessions are always owned by a shared_ptr; the object itself is
    /// deleted on its own thread via deleteLater().
    static Pointer create(boost::asio::io_service& ioService,
                          odk::IHidBackend* backend,
                          const CandidateDevice& candidate,
                          const CancellationToken& token,
                          SessionRegistry* registry,
                          IHostLink* host,
                          const Options& options);

    ~DeviceSession() override;

    void start();

    /// Idempotent, callable from any thread. Returns true for the call that
    /// actually cancelled.
    bool cancel(CancelReason reason);

    /// Queue host requests; applied in order by the pump. Ignored once the
    /// session is draining.
    void submitImage(const ImageSetRequest& request);
    void submitBrightness(int level);

    SessionState state() const { return state_.load(); }
    const QString& id() const { return candidate_.id; }
    const odk::DeviceVariant& variant() const { return candidate_.variant; }
    const CancellationToken& token() const { return token_; }
    int brightness() const { return brightness_.load(); }
    bool isRegistered() const { return registered_; }
    DeviceRegistration registration() const;

signals:
    void stateChanged(odb::SessionState state);
    void inputDecoded(const odk::InputEvent& event);
    void imageRejected(const odk::Surface& surface, odk::ImageError error);
    void closed(const QString& id, odb::CloseReason reason);

private:
    struct PendingRequest {
        enum class Kind { Image, Brightness };
        Kind kind = Kind::Image;
        ImageSetRequest image;
        int brightness = 0;
    };

    DeviceSession(boost::asio::io_service& ioService,
                  odk::IHidBackend* backend,
                  const CandidateDevice& candidate,
                  const CancellationToken& token,
                  SessionRegistry* registry,
                  IHostLink* host,
                  const Options& options);

    // Strand side
    void doConnect();
    bool resetDevice();
    void pump();
    void handleReport(const QByteArray& report);
    bool applyRequest(const PendingRequest& request);
    bool applyImage(const ImageSetRequest& request);
    bool clearSurface(const odk::Surface& surface);
    bool writeAll(const QList<QByteArray>& packets);
    bool write(const QByteArray& packet);
    void teardown(CloseReason reason);
    bool takeRequest(PendingRequest& out);
    bool hasPendingRequests() const;

    // Main-thread side
    void onConnected();
    void finish(CloseReason reason);
    void setState(SessionState state);
    void postToMain(std::function<void()> fn);

    boost::asio::io_service::strand strand_;
    odk::IHidBackend* backend_;
    CandidateDevice candidate_;
    CancellationToken token_;
    QPointer<SessionRegistry> registry_;
    QPointer<IHostLink> host_;
    Options options_;

    odk::PacketFramer framer_;
    odk::ImageAdapter adapter_;
    std::unique_ptr<odk::IHidDevice> device_;       // strand only
    QHash<odk::Surface, QByteArray> renderCache_;   // strand only, payload digests

    mutable QMutex requestMutex_;
    QQueue<PendingRequest> requests_;

    std::atomic<SessionState> state_{SessionState::Connecting};
    std::atomic<int> brightness_;
    std::atomic<bool> tearingDown_{false};
    bool registered_ = false;   // main thread only
    bool started_ = false;
};

} // namespace odb
