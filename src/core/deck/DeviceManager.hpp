#pragma once

#include "core/deck/DeviceSession.hpp"
#include "core/deck/DeviceWatcher.hpp"
#include "core/deck/SessionRegistry.hpp"
#include <odk/Catalog/DeviceCatalog.hpp>
#include <QObject>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

namespace odb {

class IHostLink;

// Owns the worker pool, the registry and the watcher, and routes host
// requests to the live session for each device.
class DeviceManager : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_WORKER_THREADS = 4;
    static constexpr int DEFAULT_SHUTDOWN_TIMEOUT_MS = 3000;

    struct Options {
        QString deviceNamespace = QStringLiteral("n3");
        int workerThreads = DEFAULT_WORKER_THREADS;
        DeviceSession::Options session;
    };

    DeviceManager(odk::IHidBackend* backend, IHostLink* host, const Options& options,
                  QObject* parent = nullptr);
    /// Custom catalog (tests, new hardware).
    DeviceManager(odk::IHidBackend* backend, IHostLink* host, const Options& options,
                  odk::DeviceCatalog catalog, QObject* parent = nullptr);
    ~DeviceManager() override;

    void start();

    /// Cancels every live session and waits (processing events) until they
    /// have all closed or timeoutMs expires. Returns true if all drained.
    /// The worker pool is stopped either way.
    bool shutdown(int timeoutMs = DEFAULT_SHUTDOWN_TIMEOUT_MS);

    bool isRunning() const { return !workers_.empty(); }

    SessionRegistry* registry() const { return registry_; }
    DeviceWatcher* watcher() const { return watcher_; }
    const odk::DeviceCatalog& catalog() const { return catalog_; }

private:
    void onSetImageRequested(const QString& deviceId, const ImageSetRequest& request);
    void onBrightnessRequested(const QString& deviceId, int level);
    DeviceSession::Pointer createSession(const CandidateDevice& candidate,
                                         const CancellationToken& token);
    void stopWorkers();

    odk::IHidBackend* backend_;
    IHostLink* host_;
    Options options_;
    odk::DeviceCatalog catalog_;

    SessionRegistry* registry_;
    DeviceWatcher* watcher_;

    std::unique_ptr<boost::asio::io_service> ioService_;
    std::unique_ptr<boost::asio::io_service::work> ioWork_;
    std::vector<std::thread> workers_;
};

} // namespace odb
