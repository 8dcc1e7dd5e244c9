#pragma once

#include <odk/Transport/IHidBackend.hpp>
#include <QHash>
#include <QThread>
#include <atomic>
#include <functional>

struct hid_device_;

namespace odk {

class HidapiDevice : public IHidDevice {
public:
    HidapiDevice(hid_device_* handle, const HidDeviceInfo& info);
    ~HidapiDevice() override;

    HidIoStatus read(QByteArray& buffer, int timeoutMs) override;
    bool write(const QByteArray& report) override;
    QString lastError() const override { return lastError_; }

    static constexpr int MAX_REPORT_SIZE = 1025;

private:
    QString errorString() const;

    hid_device_* handle_;
    HidDeviceInfo info_;
    QString lastError_;
};

// Re-enumerates at a fixed interval and diffs the result by HID path against
// the previous scan, starting from `baseline`. Anything present at the first
// scan but missing from the baseline is reported as an arrival.
// Signals are emitted from the monitor thread; receivers get them queued.
class HidapiHotplugMonitor : public QThread {
    Q_OBJECT
public:
    using Enumerator = std::function<QList<HidDeviceInfo>()>;

    HidapiHotplugMonitor(Enumerator enumerate, const QList<HidDeviceInfo>& baseline,
                         int intervalMs, QObject* parent = nullptr);

    void requestStop() { stopRequested_ = true; }

signals:
    void deviceArrived(const odk::HidDeviceInfo& info);
    void deviceRemoved(const odk::HidDeviceInfo& info);

protected:
    void run() override;

private:
    Enumerator enumerate_;
    int intervalMs_;
    std::atomic<bool> stopRequested_{false};
    QHash<QString, HidDeviceInfo> known_;
};

class HidapiBackend : public IHidBackend {
    Q_OBJECT
public:
    static constexpr int DEFAULT_POLL_INTERVAL_MS = 1000;

    explicit HidapiBackend(int pollIntervalMs = DEFAULT_POLL_INTERVAL_MS, QObject* parent = nullptr);
    ~HidapiBackend() override;

    bool isInitialized() const { return initialized_; }

    QList<HidDeviceInfo> enumerate() override;
    std::unique_ptr<IHidDevice> open(const HidDeviceInfo& info, QString* error = nullptr) override;
    void startHotplug() override;
    void stopHotplug() override;

    static QList<HidDeviceInfo> enumerateAll();

private:
    int pollIntervalMs_;
    bool initialized_ = false;
    QList<HidDeviceInfo> lastEnumerated_;
    HidapiHotplugMonitor* monitor_ = nullptr;
};

} // namespace odk
