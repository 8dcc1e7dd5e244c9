#include "core/deck/DeviceWatcher.hpp"
#include "core/deck/SessionRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace odb {

DeviceWatcher::DeviceWatcher(odk::IHidBackend* backend,
                             const odk::DeviceCatalog* catalog,
                             SessionRegistry* registry,
                             const QString& deviceNamespace,
                             SessionFactory factory,
                             QObject* parent)
    : QObject(parent)
    , backend_(backend)
    , catalog_(catalog)
    , registry_(registry)
    , deviceNamespace_(deviceNamespace)
    , factory_(std::move(factory))
{
}

DeviceWatcher::~DeviceWatcher()
{
    stop();
}

void DeviceWatcher::start()
{
    if (running_)
        return;
    running_ = true;

    BOOST_LOG_TRIVIAL(info) << "[DeviceWatcher] Looking for connected devices";

    for (const auto& info : backend_->enumerate())
        admit(info);

    connect(backend_, &odk::IHidBackend::deviceArrived, this, [this](const odk::HidDeviceInfo& info) {
        admit(info);
    });
    connect(backend_, &odk::IHidBackend::deviceRemoved, this, [this](const odk::HidDeviceInfo& info) {
        remove(info);
    });
    backend_->startHotplug();

    BOOST_LOG_TRIVIAL(info) << "[DeviceWatcher] Watcher is ready";
}

void DeviceWatcher::stop()
{
    if (!running_)
        return;
    running_ = false;

    disconnect(backend_, nullptr, this, nullptr);
    backend_->stopHotplug();

    BOOST_LOG_TRIVIAL(info) << "[DeviceWatcher] Stopped";
}

std::optional<CandidateDevice> DeviceWatcher::resolve(const odk::HidDeviceInfo& info) const
{
    const odk::DeviceVariant* variant = nullptr;
    if (info.usagePage != 0)
        variant = catalog_->lookup(info.vendorId, info.productId, info.usagePage, info.usage);
    else
        variant = catalog_->lookupByVidPid(info.vendorId, info.productId);

    if (!variant)
        return std::nullopt;

    CandidateDevice candidate;
    candidate.id = deviceIdFor(deviceNamespace_, info, *variant);
    candidate.info = info;
    candidate.variant = *variant;
    return candidate;
}

bool DeviceWatcher::admit(const odk::HidDeviceInfo& info)
{
    const auto candidate = resolve(info);
    if (!candidate) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceWatcher] Ignoring "
                                 << QStringLiteral("%1:%2").arg(info.vendorId, 4, 16, QLatin1Char('0'))
                                        .arg(info.productId, 4, 16, QLatin1Char('0')).toStdString()
                                 << " at " << info.path.toStdString();
        return false;
    }

    if (registry_->contains(candidate->id)) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceWatcher] " << candidate->id.toStdString()
                                 << " already live";
        return false;
    }

    CancellationToken token;
    DeviceSession::Pointer session = factory_(*candidate, token);
    if (!session) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceWatcher] No session for " << candidate->id.toStdString();
        return false;
    }

    if (!registry_->insert(candidate->id, {token, session})) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceWatcher] Lost admission race for "
                                 << candidate->id.toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[DeviceWatcher] New device " << candidate->id.toStdString()
                            << " (" << candidate->variant.name.toStdString() << ")";
    session->start();
    emit deviceAdmitted(candidate->id);
    return true;
}

void DeviceWatcher::remove(const odk::HidDeviceInfo& info)
{
    const auto candidate = resolve(info);
    if (!candidate) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceWatcher] Removal of unknown device at "
                                 << info.path.toStdString();
        return;
    }

    if (registry_->cancel(candidate->id, CancelReason::Removed)) {
        BOOST_LOG_TRIVIAL(info) << "[DeviceWatcher] Sending cancel request for "
                                << candidate->id.toStdString();
    }
}

} // namespace odb
