#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace odb {

class YamlConfig {
public:
    YamlConfig();

    /// ~/.config/opendeck-bridge/config.yaml
    static QString defaultPath();

    /// Throws YAML::Exception if the file is missing or malformed; the
    /// defaults stay in place in that case.
    void load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Plugin
    QString deviceNamespace() const;
    void setDeviceNamespace(const QString& v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Session
    int defaultBrightness() const;
    void setDefaultBrightness(int v);
    int readTimeoutMs() const;
    void setReadTimeoutMs(int v);
    int workerThreads() const;
    void setWorkerThreads(int v);
    int shutdownTimeoutMs() const;
    void setShutdownTimeoutMs(int v);

    // Watcher
    int pollIntervalMs() const;
    void setPollIntervalMs(int v);

    // Image
    int jpegQuality() const;
    void setJpegQuality(int v);

    // Generic dot-path access (e.g. "session.read_timeout_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace odb
