#include "AiAnalysisWorkflow.hpp"
#include "AiRequest.hpp"
#include "core/operations/OperationContext.hpp"
#include "core/operations/OperationError.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <boost/log/trivial.hpp>

namespace srt {

static const QStringList ANALYSIS_FIELDS = {
    "title", "commitType", "description", "scope", "securityAnalysis", "breakingChanges"
};

AiAnalysisWorkflow::AiAnalysisWorkflow(std::unique_ptr<IVcsClient> vcs,
                                       std::unique_ptr<IAiProvider> ai,
                                       const QString& presetDiff,
                                       int aiWaitMs)
    : vcs_(std::move(vcs))
    , ai_(std::move(ai))
    , presetDiff_(presetDiff)
    , aiWaitMs_(aiWaitMs)
{
}

QVariant AiAnalysisWorkflow::run(OperationContext& context)
{
    const QString changes = context.step(QStringLiteral("Analyzing git repository changes..."), [&]() {
        QString text = presetDiff_;
        if (text.trimmed().isEmpty() && vcs_) {
            QString error;
            if (!vcs_->changes(&text, &error))
                throw OperationError::collaborator(error);
        }
        if (text.trimmed().isEmpty())
            throw OperationError::user(QStringLiteral("No git changes found to analyze"));
        return text;
    });

    const QString prompt = context.step(QStringLiteral("Connecting to AI provider..."), [&]() {
        return buildPrompt(changes);
    });

    return context.step(QStringLiteral("Generating commit analysis..."), [&]() {
        const QString reply = requestAiText(context, ai_.get(), prompt, aiWaitMs_);
        return QVariant(analysisFromReply(reply));
    });
}

QString AiAnalysisWorkflow::buildPrompt(const QString& changes)
{
    QString p;
    p += "You are an expert developer and semantic release specialist. Analyze the "
         "following code changes thoroughly and produce a complete commit analysis.\n\n";
    p += "Fields:\n";
    p += "1. title: concise imperative summary, lowercase, no trailing period, at most 50 characters.\n";
    p += "2. commitType: one of feat, fix, docs, style, refactor, perf, test, chore, revert.\n";
    p += "3. description: exhaustive technical description of what changed and why.\n";
    p += "4. scope: affected module or area; use \"general\" when there is no clear scope.\n";
    p += "5. securityAnalysis: security implications, or an empty string when there are none.\n";
    p += "6. breakingChanges: incompatible changes, or an empty string when there are none.\n\n";
    p += "Reply with a single JSON object with exactly these keys and no text before or after it:\n";
    p += "{\"title\": \"\", \"commitType\": \"\", \"description\": \"\", \"scope\": \"\", "
         "\"securityAnalysis\": \"\", \"breakingChanges\": \"\"}\n\n";
    p += "Changes:\n\n";
    p += changes;
    return p;
}

QString AiAnalysisWorkflow::extractJson(const QString& reply)
{
    const QString jsonFence = QStringLiteral("```json");
    int start = reply.indexOf(jsonFence);
    if (start >= 0) {
        const int from = start + jsonFence.size();
        const int end = reply.indexOf(QStringLiteral("```"), from);
        if (end > from)
            return reply.mid(from, end - from).trimmed();
    }

    start = reply.indexOf(QStringLiteral("```"));
    if (start >= 0) {
        const int from = start + 3;
        const int end = reply.indexOf(QStringLiteral("```"), from);
        if (end > from)
            return reply.mid(from, end - from).trimmed();
    }

    const int open = reply.indexOf('{');
    const int close = reply.lastIndexOf('}');
    if (open >= 0 && close > open)
        return reply.mid(open, close - open + 1);

    return reply.trimmed();
}

static QVariantMap fallbackAnalysis(const QString& description)
{
    QVariantMap m;
    m["title"] = QStringLiteral("update project code");
    m["commitType"] = QStringLiteral("chore");
    m["description"] = description;
    m["scope"] = QStringLiteral("general");
    m["securityAnalysis"] = QString();
    m["breakingChanges"] = QString();
    return m;
}

QVariantMap AiAnalysisWorkflow::analysisFromReply(const QString& reply)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(extractJson(reply).toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[AiAnalysis] Reply is not JSON: "
                                   << err.errorString().toStdString();
        return fallbackAnalysis(QStringLiteral(
            "Changes were made to the project code. A detailed analysis could not be generated."));
    }

    const QJsonObject obj = doc.object();
    for (const QString& field : ANALYSIS_FIELDS) {
        if (!obj.contains(field)) {
            BOOST_LOG_TRIVIAL(warning) << "[AiAnalysis] Reply missing field " << field.toStdString();
            return fallbackAnalysis(QStringLiteral(
                "Changes were made to the project code. The AI reply was incomplete."));
        }
    }

    QVariantMap m;
    for (const QString& field : ANALYSIS_FIELDS)
        m[field] = obj[field].toString();
    if (m["scope"].toString().trimmed().isEmpty())
        m["scope"] = QStringLiteral("general");
    return m;
}

} // namespace srt
