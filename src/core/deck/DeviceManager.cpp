#include "core/deck/DeviceManager.hpp"
#include "core/host/IHostLink.hpp"
#include <QEventLoop>
#include <QTimer>
#include <boost/log/trivial.hpp>

namespace odb {

DeviceManager::DeviceManager(odk::IHidBackend* backend, IHostLink* host, const Options& options,
                             QObject* parent)
    : DeviceManager(backend, host, options, odk::DeviceCatalog(), parent)
{
}

DeviceManager::DeviceManager(odk::IHidBackend* backend, IHostLink* host, const Options& options,
                             odk::DeviceCatalog catalog, QObject* parent)
    : QObject(parent)
    , backend_(backend)
    , host_(host)
    , options_(options)
    , catalog_(std::move(catalog))
    , registry_(new SessionRegistry(this))
{
    qRegisterMetaType<odb::ImageSetRequest>();

    watcher_ = new DeviceWatcher(backend_, &catalog_, registry_, options_.deviceNamespace,
                                 [this](const CandidateDevice& candidate, const CancellationToken& token) {
                                     return createSession(candidate, token);
                                 },
                                 this);

    connect(host_, &IHostLink::setImageRequested, this, &DeviceManager::onSetImageRequested);
    connect(host_, &IHostLink::brightnessRequested, this, &DeviceManager::onBrightnessRequested);
}

DeviceManager::~DeviceManager()
{
    watcher_->stop();
    stopWorkers();
}

void DeviceManager::start()
{
    if (!workers_.empty())
        return;

    const int threads = qMax(1, options_.workerThreads);

    if (ioService_)
        ioService_->restart();
    else
        ioService_ = std::make_unique<boost::asio::io_service>();
    ioWork_ = std::make_unique<boost::asio::io_service::work>(*ioService_);

    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back([this, i]() {
            BOOST_LOG_TRIVIAL(debug) << "[DeviceManager] Worker " << i << " started";
            ioService_->run();
            BOOST_LOG_TRIVIAL(debug) << "[DeviceManager] Worker " << i << " stopped";
        });
    }

    BOOST_LOG_TRIVIAL(info) << "[DeviceManager] Running with " << threads << " worker threads";

    watcher_->start();
}

DeviceSession::Pointer DeviceManager::createSession(const CandidateDevice& candidate,
                                                    const CancellationToken& token)
{
    if (workers_.empty())
        return nullptr;
    return DeviceSession::create(*ioService_, backend_, candidate, token, registry_, host_,
                                 options_.session);
}

bool DeviceManager::shutdown(int timeoutMs)
{
    BOOST_LOG_TRIVIAL(info) << "[DeviceManager] Shutting down " << registry_->size() << " sessions";

    watcher_->stop();
    registry_->cancelAll(CancelReason::Shutdown);

    if (!registry_->isEmpty()) {
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        connect(registry_, &SessionRegistry::entryRemoved, &loop, [this, &loop]() {
            if (registry_->isEmpty())
                loop.quit();
        });
        timer.start(timeoutMs);
        loop.exec();
    }

    const bool drained = registry_->isEmpty();
    if (!drained) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceManager] Abandoning " << registry_->size()
                                   << " sessions after " << timeoutMs << " ms";
    }

    stopWorkers();
    return drained;
}

void DeviceManager::stopWorkers()
{
    if (workers_.empty())
        return;

    ioWork_.reset();
    ioService_->stop();
    for (auto& worker : workers_) {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
    // ioService_ stays alive: abandoned sessions still hold strands on it
}

void DeviceManager::onSetImageRequested(const QString& deviceId, const ImageSetRequest& request)
{
    auto session = registry_->session(deviceId);
    if (!session) {
        BOOST_LOG_TRIVIAL(error) << "[DeviceManager] Image for unknown device " << deviceId.toStdString();
        return;
    }
    session->submitImage(request);
}

void DeviceManager::onBrightnessRequested(const QString& deviceId, int level)
{
    auto session = registry_->session(deviceId);
    if (!session) {
        BOOST_LOG_TRIVIAL(error) << "[DeviceManager] Brightness for unknown device " << deviceId.toStdString();
        return;
    }
    session->submitBrightness(level);
}

} // namespace odb
