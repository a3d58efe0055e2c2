#pragma once

#include "AppConfig.hpp"
#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace srt {

class YamlConfig {
public:
    YamlConfig();

    /// Overlay a YAML file on the built-in defaults.
    /// Returns false (defaults kept) if the file is missing or malformed.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    static QString defaultPath();

    // AI provider
    QString aiProvider() const;
    void setAiProvider(const QString& v);
    /// Configured key, or GEMINI_TOKEN from the environment when empty.
    QString aiApiKey() const;
    void setAiApiKey(const QString& v);
    QString aiEndpoint() const;
    void setAiEndpoint(const QString& v);
    QStringList aiModels() const;
    void setAiModels(const QStringList& models);
    int aiTimeoutMs() const;
    void setAiTimeoutMs(int v);

    // VCS
    QString gitBinary() const;
    void setGitBinary(const QString& v);
    QString repositoryPath() const;
    void setRepositoryPath(const QString& v);

    // Release
    QString releaseOutputDir() const;
    void setReleaseOutputDir(const QString& v);
    QString releaseTemplatePath() const;
    void setReleaseTemplatePath(const QString& v);
    QString releaseResponsible() const;
    void setReleaseResponsible(const QString& v);
    QString npxBinary() const;
    void setNpxBinary(const QString& v);
    bool releaseDryRun() const;
    void setReleaseDryRun(bool v);

    // Orchestrator
    int eventBufferCapacity() const;
    void setEventBufferCapacity(int v);
    int historyMaxAgeSec() const;
    void setHistoryMaxAgeSec(int v);
    int tickMs() const;
    void setTickMs(int v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Generic dot-path access (e.g. "ai.timeout_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

    /// Immutable copy of every typed value, handed to operations at start.
    AppConfig snapshot() const;

private:
    YAML::Node root_;  // Single source of truth

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace srt
