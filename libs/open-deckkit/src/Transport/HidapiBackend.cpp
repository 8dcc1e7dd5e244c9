#include <odk/Transport/HidapiBackend.hpp>

#include <hidapi/hidapi.h>
#include <QDebug>
#include <QFileInfo>

namespace odk {

namespace {

QString fromWide(const wchar_t* s) {
    return s ? QString::fromWCharArray(s) : QString();
}

} // namespace

// --- HidapiDevice ---

HidapiDevice::HidapiDevice(hid_device* handle, const HidDeviceInfo& info)
    : handle_(handle)
    , info_(info)
{
}

HidapiDevice::~HidapiDevice() {
    if (handle_)
        hid_close(handle_);
}

QString HidapiDevice::errorString() const {
    return fromWide(hid_error(handle_));
}

HidIoStatus HidapiDevice::read(QByteArray& buffer, int timeoutMs) {
    buffer.resize(MAX_REPORT_SIZE);
    const int n = hid_read_timeout(handle_, reinterpret_cast<unsigned char*>(buffer.data()),
                                   static_cast<size_t>(buffer.size()), timeoutMs);
    if (n > 0) {
        buffer.resize(n);
        return HidIoStatus::Ok;
    }
    buffer.clear();
    if (n == 0)
        return HidIoStatus::Timeout;

    lastError_ = errorString();
    // hidraw reports unplug as a generic poll error; the node vanishing is
    // the reliable signal.
    if (!QFileInfo::exists(info_.path))
        return HidIoStatus::Disconnected;
    return HidIoStatus::IoError;
}

bool HidapiDevice::write(const QByteArray& report) {
    const int n = hid_write(handle_, reinterpret_cast<const unsigned char*>(report.constData()),
                            static_cast<size_t>(report.size()));
    if (n != report.size()) {
        lastError_ = n < 0 ? errorString()
                           : QStringLiteral("short write (%1 of %2)").arg(n).arg(report.size());
        return false;
    }
    return true;
}

// --- HidapiHotplugMonitor ---

HidapiHotplugMonitor::HidapiHotplugMonitor(Enumerator enumerate,
                                           const QList<HidDeviceInfo>& baseline,
                                           int intervalMs, QObject* parent)
    : QThread(parent)
    , enumerate_(std::move(enumerate))
    , intervalMs_(qMax(50, intervalMs))
{
    for (const auto& info : baseline)
        known_.insert(info.path, info);
}

void HidapiHotplugMonitor::run() {
    qDebug() << "[HidHotplug] monitoring" << known_.size() << "interfaces every"
             << intervalMs_ << "ms";

    while (!stopRequested_) {
        for (int slept = 0; slept < intervalMs_ && !stopRequested_; slept += 50)
            QThread::msleep(50);
        if (stopRequested_)
            break;

        QHash<QString, HidDeviceInfo> current;
        for (const auto& info : enumerate_())
            current.insert(info.path, info);

        for (auto it = known_.cbegin(); it != known_.cend(); ++it) {
            if (!current.contains(it.key()))
                emit deviceRemoved(it.value());
        }
        for (auto it = current.cbegin(); it != current.cend(); ++it) {
            if (!known_.contains(it.key()))
                emit deviceArrived(it.value());
        }
        known_ = current;
    }
}

// --- HidapiBackend ---

HidapiBackend::HidapiBackend(int pollIntervalMs, QObject* parent)
    : IHidBackend(parent)
    , pollIntervalMs_(pollIntervalMs)
{
    qRegisterMetaType<odk::HidDeviceInfo>();
    if (hid_init() != 0) {
        qCritical() << "[HidapiBackend] hid_init failed";
        return;
    }
    initialized_ = true;
}

HidapiBackend::~HidapiBackend() {
    stopHotplug();
    if (initialized_)
        hid_exit();
}

QList<HidDeviceInfo> HidapiBackend::enumerateAll() {
    QList<HidDeviceInfo> result;

    hid_device_info* devs = hid_enumerate(0, 0);
    for (hid_device_info* cur = devs; cur; cur = cur->next) {
        HidDeviceInfo info;
        info.path = QString::fromLocal8Bit(cur->path);
        info.vendorId = cur->vendor_id;
        info.productId = cur->product_id;
        info.usagePage = cur->usage_page;
        info.usage = cur->usage;
        info.serialNumber = fromWide(cur->serial_number);
        info.product = fromWide(cur->product_string);
        result.append(info);
    }
    hid_free_enumeration(devs);

    return result;
}

QList<HidDeviceInfo> HidapiBackend::enumerate() {
    if (!initialized_)
        return {};
    lastEnumerated_ = enumerateAll();
    return lastEnumerated_;
}

std::unique_ptr<IHidDevice> HidapiBackend::open(const HidDeviceInfo& info, QString* error) {
    if (!initialized_) {
        if (error)
            *error = QStringLiteral("hidapi not initialised");
        return nullptr;
    }

    const QByteArray path = info.path.toLocal8Bit();
    hid_device* handle = hid_open_path(path.constData());
    if (!handle) {
        if (error)
            *error = fromWide(hid_error(nullptr));
        return nullptr;
    }

    return std::make_unique<HidapiDevice>(handle, info);
}

void HidapiBackend::startHotplug() {
    if (monitor_ || !initialized_)
        return;

    // Diff against what the caller already saw, so a device plugged in since
    // that enumeration still shows up as an arrival
    monitor_ = new HidapiHotplugMonitor(&HidapiBackend::enumerateAll, lastEnumerated_,
                                        pollIntervalMs_, this);
    connect(monitor_, &HidapiHotplugMonitor::deviceArrived,
            this, &IHidBackend::deviceArrived, Qt::QueuedConnection);
    connect(monitor_, &HidapiHotplugMonitor::deviceRemoved,
            this, &IHidBackend::deviceRemoved, Qt::QueuedConnection);
    monitor_->start();
}

void HidapiBackend::stopHotplug() {
    if (!monitor_)
        return;

    monitor_->requestStop();
    monitor_->wait();
    delete monitor_;
    monitor_ = nullptr;
}

} // namespace odk
