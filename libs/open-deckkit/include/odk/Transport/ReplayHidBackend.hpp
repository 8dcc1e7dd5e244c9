#pragma once

#include <odk/Transport/IHidBackend.hpp>
#include <QHash>
#include <QMutex>
#include <QQueue>
#include <QSet>
#include <QWaitCondition>

namespace odk {

/// Scripted device state shared between a ReplayHidBackend and the handles
/// it opens. Thread safe: tests feed reports from the main thread while a
/// session reads on a worker.
class ReplayHidEndpoint {
public:
    void feedReport(const QByteArray& report);
    /// Convenience: builds an "ACK\0\0OK\0\0" input report carrying code/state.
    void feedInput(uint8_t code, uint8_t state);
    void simulateDisconnect();
    void simulateReadError();
    void setFailWrites(bool fail);

    QList<QByteArray> writtenData() const;
    void clearWritten();
    int readCount() const;
    bool isOpen() const;
    bool wasClosed() const;

    // Used by ReplayHidDevice
    HidIoStatus take(QByteArray& buffer, int timeoutMs);
    bool record(const QByteArray& report);
    void markOpened();
    void markClosed();

private:
    mutable QMutex mutex_;
    QWaitCondition available_;
    QQueue<QByteArray> pending_;
    QList<QByteArray> written_;
    bool disconnected_ = false;
    bool readError_ = false;
    bool failWrites_ = false;
    bool open_ = false;
    bool closed_ = false;
    int reads_ = 0;
};

class ReplayHidDevice : public IHidDevice {
public:
    explicit ReplayHidDevice(std::shared_ptr<ReplayHidEndpoint> endpoint);
    ~ReplayHidDevice() override;

    HidIoStatus read(QByteArray& buffer, int timeoutMs) override;
    bool write(const QByteArray& report) override;
    QString lastError() const override { return lastError_; }

private:
    std::shared_ptr<ReplayHidEndpoint> endpoint_;
    QString lastError_;
};

class ReplayHidBackend : public IHidBackend {
    Q_OBJECT
public:
    explicit ReplayHidBackend(QObject* parent = nullptr);
    ~ReplayHidBackend() override;

    // IHidBackend interface
    QList<HidDeviceInfo> enumerate() override;
    std::unique_ptr<IHidDevice> open(const HidDeviceInfo& info, QString* error = nullptr) override;
    void startHotplug() override;
    void stopHotplug() override;

    // Test API
    std::shared_ptr<ReplayHidEndpoint> addDevice(const HidDeviceInfo& info);
    std::shared_ptr<ReplayHidEndpoint> endpoint(const QString& path) const;
    std::shared_ptr<ReplayHidEndpoint> simulateArrival(const HidDeviceInfo& info);
    void simulateRemoval(const QString& path);
    void setOpenFails(const QString& path, bool fail);
    int openCount(const QString& path) const;
    bool isHotplugActive() const { return hotplugActive_; }

private:
    mutable QMutex mutex_;
    QList<HidDeviceInfo> devices_;
    QHash<QString, std::shared_ptr<ReplayHidEndpoint>> endpoints_;
    QHash<QString, int> openCounts_;
    QSet<QString> openFails_;
    bool hotplugActive_ = false;
};

} // namespace odk
