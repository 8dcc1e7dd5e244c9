#include "core/deck/DeviceSession.hpp"
#include "core/deck/SessionRegistry.hpp"
#include "core/host/IHostLink.hpp"
#include <odk/Input/InputDecoder.hpp>
#include <QCryptographicHash>
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace odb {

namespace {

bool isCancelReason(CloseReason reason)
{
    return reason == CloseReason::Removed
        || reason == CloseReason::Shutdown
        || reason == CloseReason::Evicted;
}

} // namespace

DeviceSession::Pointer DeviceSession::create(boost::asio::io_service& ioService,
                                             odk::IHidBackend* backend,
                                             const CandidateDevice& candidate,
                                             const CancellationToken& token,
                                             SessionRegistry* registry,
                                             IHostLink* host,
                                             const Options& options)
{
    // Last reference may drop on a worker thread; the QObject must die on its own.
    return Pointer(new DeviceSession(ioService, backend, candidate, token, registry, host, options),
                   [](DeviceSession* session) { session->deleteLater(); });
}

DeviceSession::DeviceSession(boost::asio::io_service& ioService,
                             odk::IHidBackend* backend,
                             const CandidateDevice& candidate,
                             const CancellationToken& token,
                             SessionRegistry* registry,
                             IHostLink* host,
                             const Options& options)
    : strand_(ioService)
    , backend_(backend)
    , candidate_(candidate)
    , token_(token)
    , registry_(registry)
    , host_(host)
    , options_(options)
    , framer_(candidate.variant)
    , adapter_(options.jpegQuality)
    , brightness_(qBound(0, options.defaultBrightness, 100))
{
    qRegisterMetaType<odb::SessionState>();
    qRegisterMetaType<odb::CloseReason>();
    qRegisterMetaType<odk::InputEvent>();
    qRegisterMetaType<odk::Surface>();
    qRegisterMetaType<odk::ImageError>();
}

DeviceSession::~DeviceSession()
{
    BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString() << " destroyed";
}

DeviceRegistration DeviceSession::registration() const
{
    const auto& v = candidate_.variant;

    DeviceRegistration r;
    r.id = candidate_.id;
    r.name = v.name;
    r.rows = v.rows;
    r.columns = v.columns;
    r.encoders = v.encoderCount;
    r.touchZones = v.touchZoneCount;
    r.type = v.hostDeviceType;
    r.protocolVersion = v.protocolVersion;
    return r;
}

void DeviceSession::start()
{
    if (started_)
        return;
    started_ = true;

    BOOST_LOG_TRIVIAL(info) << "[DeviceSession] Starting " << candidate_.id.toStdString()
                            << " (" << candidate_.variant.name.toStdString()
                            << " at " << candidate_.info.path.toStdString() << ")";

    strand_.post([this, self = shared_from_this()]() { doConnect(); });
}

bool DeviceSession::cancel(CancelReason reason)
{
    const bool first = token_.cancel(reason);
    if (first) {
        BOOST_LOG_TRIVIAL(info) << "[DeviceSession] Cancel requested for "
                                << candidate_.id.toStdString() << ": "
                                << closeReasonName(closeReasonFor(reason));
    }
    return first;
}

void DeviceSession::submitImage(const ImageSetRequest& request)
{
    if (token_.isCancelled() || tearingDown_) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString()
                                 << " draining, image request dropped";
        return;
    }

    PendingRequest pending;
    pending.kind = PendingRequest::Kind::Image;
    pending.image = request;

    QMutexLocker lock(&requestMutex_);
    requests_.enqueue(pending);
}

void DeviceSession::submitBrightness(int level)
{
    if (token_.isCancelled() || tearingDown_) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString()
                                 << " draining, brightness request dropped";
        return;
    }

    PendingRequest pending;
    pending.kind = PendingRequest::Kind::Brightness;
    pending.brightness = qBound(0, level, 100);

    QMutexLocker lock(&requestMutex_);
    requests_.enqueue(pending);
}

bool DeviceSession::takeRequest(PendingRequest& out)
{
    QMutexLocker lock(&requestMutex_);
    if (requests_.isEmpty())
        return false;
    out = requests_.dequeue();
    return true;
}

bool DeviceSession::hasPendingRequests() const
{
    QMutexLocker lock(&requestMutex_);
    return !requests_.isEmpty();
}

// --- Strand side ---

void DeviceSession::doConnect()
{
    if (token_.isCancelled()) {
        teardown(closeReasonFor(token_.reason()));
        return;
    }

    QString error;
    device_ = backend_->open(candidate_.info, &error);
    if (!device_) {
        BOOST_LOG_TRIVIAL(error) << "[DeviceSession] Failed to open "
                                 << candidate_.id.toStdString() << ": " << error.toStdString();
        teardown(CloseReason::ConnectFailed);
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[DeviceSession] Connected to " << candidate_.id.toStdString()
                            << ", resetting device";

    if (!resetDevice()) {
        teardown(CloseReason::IoError);
        return;
    }

    postToMain([this]() { onConnected(); });
}

bool DeviceSession::resetDevice()
{
    return write(framer_.wake())
        && write(framer_.brightness(brightness_))
        && write(framer_.clear(odk::CLEAR_ALL_KEY))
        && write(framer_.flush());
}

void DeviceSession::pump()
{
    if (token_.isCancelled()) {
        teardown(closeReasonFor(token_.reason()));
        return;
    }

    PendingRequest request;
    if (takeRequest(request) && !applyRequest(request)) {
        teardown(CloseReason::IoError);
        return;
    }

    if (token_.isCancelled()) {
        teardown(closeReasonFor(token_.reason()));
        return;
    }

    // Don't sit on the read while host requests are waiting
    const int timeoutMs = hasPendingRequests() ? 0 : options_.readTimeoutMs;

    QByteArray report;
    switch (device_->read(report, timeoutMs)) {
    case odk::HidIoStatus::Ok:
        handleReport(report);
        break;
    case odk::HidIoStatus::Timeout:
        break;
    case odk::HidIoStatus::Disconnected:
        BOOST_LOG_TRIVIAL(info) << "[DeviceSession] " << candidate_.id.toStdString()
                                << " disconnected";
        teardown(CloseReason::Disconnected);
        return;
    case odk::HidIoStatus::IoError:
        BOOST_LOG_TRIVIAL(error) << "[DeviceSession] " << candidate_.id.toStdString()
                                 << " read failed: " << device_->lastError().toStdString();
        teardown(CloseReason::IoError);
        return;
    }

    strand_.post([this, self = shared_from_this()]() { pump(); });
}

void DeviceSession::handleReport(const QByteArray& report)
{
    const auto raw = odk::PacketFramer::parseInputReport(report);
    if (!raw) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString()
                                 << " short report (" << report.size() << " bytes)";
        return;
    }

    const odk::InputEvent event = odk::InputDecoder::decode(candidate_.variant, raw->code, raw->state);
    if (event.isUnknown()) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString() << " "
                                 << odk::InputDecoder::describe(event).toStdString();
        return;
    }

    // Both-state firmware also reports the finger lifting; a tap is the touch-down only
    if (candidate_.variant.reportsBothStates
        && event.type == odk::InputEvent::Type::TouchTap && raw->state == 0)
        return;

    QList<odk::InputEvent> events{event};
    // Press-only firmware never reports the release
    if (!candidate_.variant.reportsBothStates
        && event.type == odk::InputEvent::Type::ButtonPress && event.pressed)
        events.append(odk::InputEvent::buttonPress(event.index, false));

    postToMain([this, events]() {
        if (state_ == SessionState::Closed)
            return;
        for (const auto& e : events) {
            emit inputDecoded(e);
            if (host_ && registered_)
                host_->forwardInput(candidate_.id, e);
        }
    });
}

bool DeviceSession::applyRequest(const PendingRequest& request)
{
    switch (request.kind) {
    case PendingRequest::Kind::Brightness:
        if (!write(framer_.brightness(request.brightness)))
            return false;
        brightness_ = request.brightness;
        return true;
    case PendingRequest::Kind::Image:
        return applyImage(request.image);
    }
    return true;
}

bool DeviceSession::applyImage(const ImageSetRequest& request)
{
    const auto reject = [this](const odk::Surface& surface, odk::ImageError error) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceSession] " << candidate_.id.toStdString()
                                   << " image rejected: " << odk::imageErrorName(error);
        postToMain([this, surface, error]() { emit imageRejected(surface, error); });
    };

    if (request.surface.kind == odk::Surface::Kind::All) {
        if (!request.isClear()) {
            reject(request.surface, odk::ImageError::UnsupportedSurface);
            return true;
        }
        renderCache_.clear();
        return write(framer_.clear(odk::CLEAR_ALL_KEY)) && write(framer_.flush());
    }

    if (!odk::ImageAdapter::specFor(candidate_.variant, request.surface)) {
        reject(request.surface, odk::ImageError::UnsupportedSurface);
        return true;
    }

    if (request.isClear())
        return clearSurface(request.surface);

    const odk::AdaptResult result = adapter_.adapt(candidate_.variant, request.surface,
                                                   request.bytes, request.encoding);
    if (!result.ok()) {
        reject(request.surface, result.error);
        return true;
    }

    const QByteArray digest = QCryptographicHash::hash(result.payload, QCryptographicHash::Sha1);
    auto cached = renderCache_.constFind(request.surface);
    if (cached != renderCache_.constEnd() && cached.value() == digest) {
        BOOST_LOG_TRIVIAL(trace) << "[DeviceSession] " << candidate_.id.toStdString()
                                 << " surface unchanged, skipping write";
        return true;
    }

    const auto key = framer_.wireKey(request.surface);
    if (!writeAll(framer_.imageWrite(*key, result.payload)) || !write(framer_.flush()))
        return false;

    renderCache_.insert(request.surface, digest);
    return true;
}

bool DeviceSession::clearSurface(const odk::Surface& surface)
{
    const auto key = framer_.wireKey(surface);
    renderCache_.remove(surface);

    // CLE only addresses key displays; the touch strip is painted black instead
    if (surface.kind == odk::Surface::Kind::TouchZone) {
        const odk::AdaptResult black = adapter_.blank(candidate_.variant, surface);
        if (!black.ok()) {
            BOOST_LOG_TRIVIAL(warning) << "[DeviceSession] " << candidate_.id.toStdString()
                                       << " could not blank touch zone " << surface.index;
            return true;
        }
        return writeAll(framer_.imageWrite(*key, black.payload)) && write(framer_.flush());
    }

    return write(framer_.clear(*key)) && write(framer_.flush());
}

bool DeviceSession::writeAll(const QList<QByteArray>& packets)
{
    for (const auto& packet : packets) {
        if (!write(packet))
            return false;
    }
    return true;
}

bool DeviceSession::write(const QByteArray& packet)
{
    if (device_->write(packet))
        return true;

    BOOST_LOG_TRIVIAL(error) << "[DeviceSession] " << candidate_.id.toStdString()
                             << " write failed: " << device_->lastError().toStdString();
    return false;
}

void DeviceSession::teardown(CloseReason reason)
{
    if (tearingDown_.exchange(true))
        return;

    if (isCancelReason(reason))
        postToMain([this]() { setState(SessionState::Draining); });

    if (device_) {
        if (reason == CloseReason::Shutdown) {
            // Best effort: leave the deck dark
            if (!write(framer_.clear(odk::CLEAR_ALL_KEY)) || !write(framer_.flush())
                || !write(framer_.sleep())) {
                BOOST_LOG_TRIVIAL(warning) << "[DeviceSession] " << candidate_.id.toStdString()
                                           << " could not blank device on shutdown";
            }
        }
        device_.reset();
        BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString()
                                 << " handle released";
    }

    {
        QMutexLocker lock(&requestMutex_);
        requests_.clear();
    }

    postToMain([this, reason]() { finish(reason); });
}

// --- Main-thread side ---

void DeviceSession::onConnected()
{
    if (token_.isCancelled()) {
        strand_.post([this, self = shared_from_this()]() {
            teardown(closeReasonFor(token_.reason()));
        });
        return;
    }

    setState(SessionState::Registering);

    if (!host_ || !host_->registerDevice(registration())) {
        BOOST_LOG_TRIVIAL(error) << "[DeviceSession] Host rejected " << candidate_.id.toStdString();
        strand_.post([this, self = shared_from_this()]() {
            teardown(CloseReason::RegistrationRejected);
        });
        return;
    }

    registered_ = true;
    BOOST_LOG_TRIVIAL(info) << "[DeviceSession] Registered " << candidate_.id.toStdString()
                            << " with host";

    setState(SessionState::Streaming);
    strand_.post([this, self = shared_from_this()]() { pump(); });
}

void DeviceSession::finish(CloseReason reason)
{
    if (state_ == SessionState::Closed)
        return;

    if (registered_) {
        registered_ = false;
        if (host_)
            host_->reportDisconnect(candidate_.id);
    }

    if (registry_)
        registry_->remove(candidate_.id, this);

    setState(SessionState::Closed);

    BOOST_LOG_TRIVIAL(info) << "[DeviceSession] " << candidate_.id.toStdString()
                            << " closed: " << closeReasonName(reason);
    emit closed(candidate_.id, reason);
}

void DeviceSession::setState(SessionState state)
{
    const SessionState current = state_.load();
    if (current == state || current == SessionState::Closed)
        return;

    state_ = state;
    BOOST_LOG_TRIVIAL(debug) << "[DeviceSession] " << candidate_.id.toStdString() << " "
                             << sessionStateName(current) << " -> " << sessionStateName(state);
    emit stateChanged(state);
}

void DeviceSession::postToMain(std::function<void()> fn)
{
    QMetaObject::invokeMethod(this, [self = shared_from_this(), fn = std::move(fn)]() {
        fn();
    }, Qt::QueuedConnection);
}

} // namespace odb
