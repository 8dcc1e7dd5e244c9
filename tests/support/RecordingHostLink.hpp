#pragma once

#include "core/host/IHostLink.hpp"
#include <QList>
#include <QPair>
#include <QStringList>

// IHostLink that records every call; registration can be made to fail.
class RecordingHostLink : public odb::IHostLink {
public:
    bool acceptRegistration = true;
    QList<odb::DeviceRegistration> registrations;
    QList<QPair<QString, odk::InputEvent>> inputs;
    QStringList disconnects;

    bool registerDevice(const odb::DeviceRegistration& registration) override
    {
        registrations.append(registration);
        return acceptRegistration;
    }

    void forwardInput(const QString& deviceId, const odk::InputEvent& event) override
    {
        inputs.append(qMakePair(deviceId, event));
    }

    void reportDisconnect(const QString& deviceId) override
    {
        disconnects.append(deviceId);
    }
};
