#include "WorkflowFactory.hpp"
#include "AiAnalysisWorkflow.hpp"
#include "ReleaseNotesWorkflow.hpp"
#include "SemanticReleaseWorkflow.hpp"
#include "core/ai/GeminiClient.hpp"
#include "core/operations/OperationParams.hpp"
#include "core/release/FileArtifactStore.hpp"
#include "core/release/SemanticReleaseCli.hpp"
#include "core/vcs/GitCliClient.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace srt {

std::unique_ptr<IAiProvider> WorkflowFactory::createAiProvider(const AppConfig& config)
{
    if (config.aiProvider.compare(QStringLiteral("gemini"), Qt::CaseInsensitive) == 0) {
        GeminiClient::Settings s;
        s.apiKey = config.aiApiKey;
        s.endpoint = config.aiEndpoint;
        s.models = config.aiModels;
        s.timeoutMs = config.aiTimeoutMs;
        return std::make_unique<GeminiClient>(s);
    }
    BOOST_LOG_TRIVIAL(error) << "[WorkflowFactory] Unsupported AI provider '"
                             << config.aiProvider.toStdString() << "'";
    return nullptr;
}

int WorkflowFactory::aiWaitMs(const AppConfig& config)
{
    const int models = qMax(1, static_cast<int>(config.aiModels.size()));
    return config.aiTimeoutMs * models + 5000;
}

QString WorkflowFactory::resolvePath(const AppConfig& config, const QString& path)
{
    if (path.isEmpty() || QFileInfo(path).isAbsolute())
        return path;
    return QDir(config.repositoryPath).filePath(path);
}

std::unique_ptr<IOperationWorkflow> WorkflowFactory::create(OperationKind kind,
                                                            const OperationParams& params)
{
    const AppConfig& cfg = params.config;

    switch (kind) {
    case OperationKind::AiAnalysis:
        return std::make_unique<AiAnalysisWorkflow>(
            std::make_unique<GitCliClient>(cfg.gitBinary, cfg.repositoryPath),
            createAiProvider(cfg), params.diff, aiWaitMs(cfg));

    case OperationKind::ReleaseNotesGeneration: {
        ReleaseNotesWorkflow::Settings s;
        s.version = params.version;
        s.templatePath = resolvePath(cfg, cfg.releaseTemplatePath);
        s.responsible = cfg.releaseResponsible;
        s.presetCommits = params.commits;
        s.aiWaitMs = aiWaitMs(cfg);
        return std::make_unique<ReleaseNotesWorkflow>(
            std::make_unique<GitCliClient>(cfg.gitBinary, cfg.repositoryPath),
            createAiProvider(cfg),
            std::make_unique<FileArtifactStore>(resolvePath(cfg, cfg.releaseOutputDir)),
            s);
    }

    case OperationKind::SemanticRelease:
        return std::make_unique<SemanticReleaseWorkflow>(
            std::make_unique<SemanticReleaseCli>(cfg.npxBinary, cfg.repositoryPath),
            params.dryRun);
    }
    return nullptr;
}

} // namespace srt
