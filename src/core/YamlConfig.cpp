#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <fstream>

namespace odb {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["plugin"]["device_namespace"] = "n3";

    root_["logging"]["level"] = "debug";

    root_["session"]["default_brightness"] = 50;
    root_["session"]["read_timeout_ms"] = 100;
    root_["session"]["worker_threads"] = 4;
    root_["session"]["shutdown_timeout_ms"] = 3000;

    root_["watcher"]["poll_interval_ms"] = 1000;

    root_["image"]["jpeg_quality"] = 90;
}

QString YamlConfig::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        + QStringLiteral("/opendeck-bridge/config.yaml");
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    std::ofstream fout(filePath.toStdString());
    if (!fout)
        return false;
    fout << root_;
    return static_cast<bool>(fout);
}

// --- Plugin ---

QString YamlConfig::deviceNamespace() const
{
    return QString::fromStdString(root_["plugin"]["device_namespace"].as<std::string>("n3"));
}

void YamlConfig::setDeviceNamespace(const QString& v)
{
    root_["plugin"]["device_namespace"] = v.toStdString();
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("debug"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Session ---

int YamlConfig::defaultBrightness() const
{
    return root_["session"]["default_brightness"].as<int>(50);
}

void YamlConfig::setDefaultBrightness(int v)
{
    root_["session"]["default_brightness"] = v;
}

int YamlConfig::readTimeoutMs() const
{
    return root_["session"]["read_timeout_ms"].as<int>(100);
}

void YamlConfig::setReadTimeoutMs(int v)
{
    root_["session"]["read_timeout_ms"] = v;
}

int YamlConfig::workerThreads() const
{
    return root_["session"]["worker_threads"].as<int>(4);
}

void YamlConfig::setWorkerThreads(int v)
{
    root_["session"]["worker_threads"] = v;
}

int YamlConfig::shutdownTimeoutMs() const
{
    return root_["session"]["shutdown_timeout_ms"].as<int>(3000);
}

void YamlConfig::setShutdownTimeoutMs(int v)
{
    root_["session"]["shutdown_timeout_ms"] = v;
}

// --- Watcher ---

int YamlConfig::pollIntervalMs() const
{
    return root_["watcher"]["poll_interval_ms"].as<int>(1000);
}

void YamlConfig::setPollIntervalMs(int v)
{
    root_["watcher"]["poll_interval_ms"] = v;
}

// --- Image ---

int YamlConfig::jpegQuality() const
{
    return root_["image"]["jpeg_quality"].as<int>(90);
}

void YamlConfig::setJpegQuality(int v)
{
    root_["image"]["jpeg_quality"] = v;
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = QString::fromStdString(s).toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only leaves that exist in the defaults tree are writable
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
        node[leafKey] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leafKey] = value.toDouble();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace odb
