#pragma once

#include <QString>
#include <QStringList>

namespace srt {

// Immutable configuration snapshot taken by YamlConfig::snapshot().
// Copied into every operation at start time; workers never read the live
// YamlConfig.
struct AppConfig {
    // AI provider
    QString aiProvider = QStringLiteral("gemini");
    QString aiApiKey;
    QString aiEndpoint = QStringLiteral("https://generativelanguage.googleapis.com/v1beta");
    QStringList aiModels = {QStringLiteral("gemini-2.5-pro"), QStringLiteral("gemini-2.0-flash")};
    int aiTimeoutMs = 120000;

    // VCS
    QString gitBinary = QStringLiteral("git");
    QString repositoryPath = QStringLiteral(".");

    // Release
    QString releaseOutputDir = QStringLiteral("release-notes");
    QString releaseTemplatePath = QStringLiteral("scripts/plantilla.md");
    QString releaseResponsible;
    QString npxBinary = QStringLiteral("npx");
    bool releaseDryRun = true;

    // Orchestrator
    int eventBufferCapacity = 256;
    int historyMaxAgeSec = 600;
    int tickMs = 50;

    QString logLevel = QStringLiteral("info");
};

} // namespace srt
