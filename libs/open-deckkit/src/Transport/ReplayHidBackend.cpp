#include <odk/Transport/ReplayHidBackend.hpp>

#include <odk/Protocol/PacketFramer.hpp>
#include <QMutexLocker>
#include <climits>

namespace odk {

// --- ReplayHidEndpoint ---

void ReplayHidEndpoint::feedReport(const QByteArray& report)
{
    QMutexLocker lock(&mutex_);
    pending_.enqueue(report);
    available_.wakeAll();
}

void ReplayHidEndpoint::feedInput(uint8_t code, uint8_t state)
{
    QByteArray report("ACK\0\0OK\0\0", INPUT_CODE_OFFSET);
    report.append(static_cast<char>(code));
    report.append(static_cast<char>(state));
    report.append(QByteArray(512 - report.size(), '\0'));
    feedReport(report);
}

void ReplayHidEndpoint::simulateDisconnect()
{
    QMutexLocker lock(&mutex_);
    disconnected_ = true;
    available_.wakeAll();
}

void ReplayHidEndpoint::simulateReadError()
{
    QMutexLocker lock(&mutex_);
    readError_ = true;
    available_.wakeAll();
}

void ReplayHidEndpoint::setFailWrites(bool fail)
{
    QMutexLocker lock(&mutex_);
    failWrites_ = fail;
}

QList<QByteArray> ReplayHidEndpoint::writtenData() const
{
    QMutexLocker lock(&mutex_);
    return written_;
}

void ReplayHidEndpoint::clearWritten()
{
    QMutexLocker lock(&mutex_);
    written_.clear();
}

int ReplayHidEndpoint::readCount() const
{
    QMutexLocker lock(&mutex_);
    return reads_;
}

bool ReplayHidEndpoint::isOpen() const
{
    QMutexLocker lock(&mutex_);
    return open_;
}

bool ReplayHidEndpoint::wasClosed() const
{
    QMutexLocker lock(&mutex_);
    return closed_;
}

HidIoStatus ReplayHidEndpoint::take(QByteArray& buffer, int timeoutMs)
{
    QMutexLocker lock(&mutex_);
    ++reads_;

    if (pending_.isEmpty() && !disconnected_ && !readError_ && timeoutMs != 0)
        available_.wait(&mutex_, timeoutMs < 0 ? ULONG_MAX : static_cast<unsigned long>(timeoutMs));

    // Queued reports drain before a disconnect is reported, as on real hardware.
    if (!pending_.isEmpty()) {
        buffer = pending_.dequeue();
        return HidIoStatus::Ok;
    }
    buffer.clear();
    if (disconnected_)
        return HidIoStatus::Disconnected;
    if (readError_)
        return HidIoStatus::IoError;
    return HidIoStatus::Timeout;
}

bool ReplayHidEndpoint::record(const QByteArray& report)
{
    QMutexLocker lock(&mutex_);
    if (failWrites_ || disconnected_)
        return false;
    written_.append(report);
    return true;
}

void ReplayHidEndpoint::markOpened()
{
    QMutexLocker lock(&mutex_);
    open_ = true;
}

void ReplayHidEndpoint::markClosed()
{
    QMutexLocker lock(&mutex_);
    open_ = false;
    closed_ = true;
}

// --- ReplayHidDevice ---

ReplayHidDevice::ReplayHidDevice(std::shared_ptr<ReplayHidEndpoint> endpoint)
    : endpoint_(std::move(endpoint))
{
    endpoint_->markOpened();
}

ReplayHidDevice::~ReplayHidDevice()
{
    endpoint_->markClosed();
}

HidIoStatus ReplayHidDevice::read(QByteArray& buffer, int timeoutMs)
{
    const HidIoStatus status = endpoint_->take(buffer, timeoutMs);
    if (status == HidIoStatus::Disconnected || status == HidIoStatus::IoError)
        lastError_ = QStringLiteral("replay: %1").arg(QLatin1String(hidIoStatusName(status)));
    return status;
}

bool ReplayHidDevice::write(const QByteArray& report)
{
    if (!endpoint_->record(report)) {
        lastError_ = QStringLiteral("replay: write failed");
        return false;
    }
    return true;
}

// --- ReplayHidBackend ---

ReplayHidBackend::ReplayHidBackend(QObject* parent)
    : IHidBackend(parent)
{
    qRegisterMetaType<odk::HidDeviceInfo>();
}

ReplayHidBackend::~ReplayHidBackend() = default;

QList<HidDeviceInfo> ReplayHidBackend::enumerate()
{
    QMutexLocker lock(&mutex_);
    return devices_;
}

std::unique_ptr<IHidDevice> ReplayHidBackend::open(const HidDeviceInfo& info, QString* error)
{
    QMutexLocker lock(&mutex_);
    auto it = endpoints_.constFind(info.path);
    if (it == endpoints_.constEnd() || openFails_.contains(info.path)) {
        if (error)
            *error = QStringLiteral("replay: cannot open %1").arg(info.path);
        return nullptr;
    }
    openCounts_[info.path] += 1;
    return std::make_unique<ReplayHidDevice>(it.value());
}

void ReplayHidBackend::startHotplug()
{
    hotplugActive_ = true;
}

void ReplayHidBackend::stopHotplug()
{
    hotplugActive_ = false;
}

std::shared_ptr<ReplayHidEndpoint> ReplayHidBackend::addDevice(const HidDeviceInfo& info)
{
    QMutexLocker lock(&mutex_);
    auto endpoint = std::make_shared<ReplayHidEndpoint>();
    for (int i = 0; i < devices_.size(); ++i) {
        if (devices_[i].path == info.path) {
            devices_.removeAt(i);
            break;
        }
    }
    devices_.append(info);
    endpoints_.insert(info.path, endpoint);
    return endpoint;
}

std::shared_ptr<ReplayHidEndpoint> ReplayHidBackend::endpoint(const QString& path) const
{
    QMutexLocker lock(&mutex_);
    return endpoints_.value(path);
}

std::shared_ptr<ReplayHidEndpoint> ReplayHidBackend::simulateArrival(const HidDeviceInfo& info)
{
    auto endpoint = addDevice(info);
    emit deviceArrived(info);
    return endpoint;
}

void ReplayHidBackend::simulateRemoval(const QString& path)
{
    HidDeviceInfo removed;
    std::shared_ptr<ReplayHidEndpoint> endpoint;
    {
        QMutexLocker lock(&mutex_);
        for (int i = 0; i < devices_.size(); ++i) {
            if (devices_[i].path == path) {
                removed = devices_.takeAt(i);
                break;
            }
        }
        endpoint = endpoints_.take(path);
    }
    if (!endpoint)
        return;

    endpoint->simulateDisconnect();
    emit deviceRemoved(removed);
}

void ReplayHidBackend::setOpenFails(const QString& path, bool fail)
{
    QMutexLocker lock(&mutex_);
    if (fail)
        openFails_.insert(path);
    else
        openFails_.remove(path);
}

int ReplayHidBackend::openCount(const QString& path) const
{
    QMutexLocker lock(&mutex_);
    return openCounts_.value(path);
}

} // namespace odk
