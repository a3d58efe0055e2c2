#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace srt {

// Recursive overlay: maps merge key by key, anything else in the overlay
// replaces the base. Null overlay values keep the default.
static YAML::Node overlayNode(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        merged[key] = overlayNode(merged[key], it->second);
    }
    return merged;
}

static QString readString(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["ai"]["provider"] = "gemini";
    root_["ai"]["api_key"] = "";
    root_["ai"]["endpoint"] = "https://generativelanguage.googleapis.com/v1beta";
    root_["ai"]["models"] = YAML::Node(YAML::NodeType::Sequence);
    root_["ai"]["models"].push_back("gemini-2.5-pro");
    root_["ai"]["models"].push_back("gemini-2.0-flash");
    root_["ai"]["timeout_ms"] = 120000;

    root_["vcs"]["git_binary"] = "git";
    root_["vcs"]["repository"] = ".";

    root_["release"]["output_dir"] = "release-notes";
    root_["release"]["template"] = "scripts/plantilla.md";
    root_["release"]["responsible"] = "";
    root_["release"]["npx_binary"] = "npx";
    root_["release"]["dry_run"] = true;

    root_["orchestrator"]["event_buffer"] = 256;
    root_["orchestrator"]["history_max_age_s"] = 600;
    root_["orchestrator"]["tick_ms"] = 50;

    root_["logging"]["level"] = "info";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    if (!QFile::exists(filePath)) {
        BOOST_LOG_TRIVIAL(info) << "[YamlConfig] " << filePath.toStdString()
                                << " not found, using defaults";
        return false;
    }

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = overlayNode(root_, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Failed to parse " << filePath.toStdString()
                                 << ": " << e.what();
        initDefaults();
        return false;
    }
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Cannot write " << filePath.toStdString();
        return false;
    }
    fout << root_;
    return static_cast<bool>(fout);
}

QString YamlConfig::defaultPath()
{
    return QDir::homePath() + "/.config/semrel-tui/config.yaml";
}

// --- AI provider ---

QString YamlConfig::aiProvider() const
{
    return readString(root_["ai"]["provider"], "gemini");
}

void YamlConfig::setAiProvider(const QString& v)
{
    root_["ai"]["provider"] = v.toStdString();
}

QString YamlConfig::aiApiKey() const
{
    QString key = readString(root_["ai"]["api_key"], "");
    if (key.isEmpty())
        key = qEnvironmentVariable("GEMINI_TOKEN");
    return key;
}

void YamlConfig::setAiApiKey(const QString& v)
{
    root_["ai"]["api_key"] = v.toStdString();
}

QString YamlConfig::aiEndpoint() const
{
    return readString(root_["ai"]["endpoint"], "https://generativelanguage.googleapis.com/v1beta");
}

void YamlConfig::setAiEndpoint(const QString& v)
{
    root_["ai"]["endpoint"] = v.toStdString();
}

QStringList YamlConfig::aiModels() const
{
    QStringList models;
    const YAML::Node node = root_["ai"]["models"];
    if (node.IsSequence()) {
        for (const auto& m : node)
            models.append(QString::fromStdString(m.as<std::string>("")));
    } else if (node.IsScalar()) {
        models.append(QString::fromStdString(node.as<std::string>("")));
    }
    models.removeAll(QString());
    return models;
}

void YamlConfig::setAiModels(const QStringList& models)
{
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& m : models)
        seq.push_back(m.toStdString());
    root_["ai"]["models"] = seq;
}

int YamlConfig::aiTimeoutMs() const
{
    return root_["ai"]["timeout_ms"].as<int>(120000);
}

void YamlConfig::setAiTimeoutMs(int v)
{
    root_["ai"]["timeout_ms"] = v;
}

// --- VCS ---

QString YamlConfig::gitBinary() const
{
    return readString(root_["vcs"]["git_binary"], "git");
}

void YamlConfig::setGitBinary(const QString& v)
{
    root_["vcs"]["git_binary"] = v.toStdString();
}

QString YamlConfig::repositoryPath() const
{
    return readString(root_["vcs"]["repository"], ".");
}

void YamlConfig::setRepositoryPath(const QString& v)
{
    root_["vcs"]["repository"] = v.toStdString();
}

// --- Release ---

QString YamlConfig::releaseOutputDir() const
{
    return readString(root_["release"]["output_dir"], "release-notes");
}

void YamlConfig::setReleaseOutputDir(const QString& v)
{
    root_["release"]["output_dir"] = v.toStdString();
}

QString YamlConfig::releaseTemplatePath() const
{
    return readString(root_["release"]["template"], "scripts/plantilla.md");
}

void YamlConfig::setReleaseTemplatePath(const QString& v)
{
    root_["release"]["template"] = v.toStdString();
}

QString YamlConfig::releaseResponsible() const
{
    return readString(root_["release"]["responsible"], "");
}

void YamlConfig::setReleaseResponsible(const QString& v)
{
    root_["release"]["responsible"] = v.toStdString();
}

QString YamlConfig::npxBinary() const
{
    return readString(root_["release"]["npx_binary"], "npx");
}

void YamlConfig::setNpxBinary(const QString& v)
{
    root_["release"]["npx_binary"] = v.toStdString();
}

bool YamlConfig::releaseDryRun() const
{
    return root_["release"]["dry_run"].as<bool>(true);
}

void YamlConfig::setReleaseDryRun(bool v)
{
    root_["release"]["dry_run"] = v;
}

// --- Orchestrator ---

int YamlConfig::eventBufferCapacity() const
{
    return root_["orchestrator"]["event_buffer"].as<int>(256);
}

void YamlConfig::setEventBufferCapacity(int v)
{
    root_["orchestrator"]["event_buffer"] = v;
}

int YamlConfig::historyMaxAgeSec() const
{
    return root_["orchestrator"]["history_max_age_s"].as<int>(600);
}

void YamlConfig::setHistoryMaxAgeSec(int v)
{
    root_["orchestrator"]["history_max_age_s"] = v;
}

int YamlConfig::tickMs() const
{
    return root_["orchestrator"]["tick_ms"].as<int>(50);
}

void YamlConfig::setTickMs(int v)
{
    root_["orchestrator"]["tick_ms"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return readString(root_["logging"]["level"], "info");
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool ok = false;
    const int i = s.toInt(&ok);
    if (ok) return QVariant(i);

    const double d = s.toDouble(&ok);
    if (ok) return QVariant(d);

    return QVariant(s);
}

static bool walk(YAML::Node& node, const QStringList& parts)
{
    for (const auto& part : parts) {
        if (!node.IsMap()) return false;
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined()) return false;
    }
    return true;
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    if (!walk(node, dottedKey.split('.')) || node.IsNull())
        return {};

    if (node.IsSequence()) {
        QStringList items;
        for (const auto& item : node)
            items.append(QString::fromStdString(item.as<std::string>("")));
        return items;
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

    // Only scalar keys that exist in the defaults are writable.
    {
        YAML::Node defaults = buildDefaultsNode();
        if (!walk(defaults, parts) || !defaults.IsScalar())
            return false;
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
    case QMetaType::LongLong:
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

AppConfig YamlConfig::snapshot() const
{
    AppConfig c;
    c.aiProvider = aiProvider();
    c.aiApiKey = aiApiKey();
    c.aiEndpoint = aiEndpoint();
    c.aiModels = aiModels();
    c.aiTimeoutMs = aiTimeoutMs();
    c.gitBinary = gitBinary();
    c.repositoryPath = repositoryPath();
    c.releaseOutputDir = releaseOutputDir();
    c.releaseTemplatePath = releaseTemplatePath();
    c.releaseResponsible = releaseResponsible();
    c.npxBinary = npxBinary();
    c.releaseDryRun = releaseDryRun();
    c.eventBufferCapacity = eventBufferCapacity();
    c.historyMaxAgeSec = historyMaxAgeSec();
    c.tickMs = tickMs();
    c.logLevel = logLevel();
    return c;
}

} // namespace srt
