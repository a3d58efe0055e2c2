#include <QtTest>
#include "TestFakes.hpp"
#include "core/workflows/AiAnalysisWorkflow.hpp"

using namespace srt;
using srt::test::FakeAi;
using srt::test::FakeVcs;
using srt::test::HarnessRun;

static const char* FULL_JSON =
    "{\"title\": \"add retry\", \"commitType\": \"fix\", \"description\": \"retries uploads\", "
    "\"scope\": \"net\", \"securityAnalysis\": \"\", \"breakingChanges\": \"\"}";

class TestAnalysisWorkflow : public QObject {
    Q_OBJECT
private slots:
    void testExtractJsonFromJsonFence()
    {
        const QString reply = QString("Here you go:\n```json\n%1\n```\nThanks").arg(FULL_JSON);
        QCOMPARE(AiAnalysisWorkflow::extractJson(reply), QString(FULL_JSON));
    }

    void testExtractJsonFromPlainFence()
    {
        const QString reply = QString("```\n%1\n```").arg(FULL_JSON);
        QCOMPARE(AiAnalysisWorkflow::extractJson(reply), QString(FULL_JSON));
    }

    void testExtractJsonEmbedded()
    {
        const QString reply = QString("Sure! %1 Hope that helps.").arg(FULL_JSON);
        QCOMPARE(AiAnalysisWorkflow::extractJson(reply), QString(FULL_JSON));
    }

    void testExtractJsonRawFallback()
    {
        QCOMPARE(AiAnalysisWorkflow::extractJson("  no json here \n"), QString("no json here"));
    }

    void testAnalysisFromReply()
    {
        const QVariantMap m = AiAnalysisWorkflow::analysisFromReply(QString("```json\n%1\n```").arg(FULL_JSON));
        QCOMPARE(m.value("title").toString(), QString("add retry"));
        QCOMPARE(m.value("commitType").toString(), QString("fix"));
        QCOMPARE(m.value("scope").toString(), QString("net"));
        QCOMPARE(m.size(), 6);
    }

    void testIncompleteReplyFallsBack()
    {
        const QVariantMap m = AiAnalysisWorkflow::analysisFromReply("{\"title\": \"x\"}");
        QCOMPARE(m.value("commitType").toString(), QString("chore"));
        QCOMPARE(m.value("scope").toString(), QString("general"));
        QVERIFY(!m.value("description").toString().isEmpty());
    }

    void testInvalidJsonFallsBack()
    {
        const QVariantMap m = AiAnalysisWorkflow::analysisFromReply("{ not json at all");
        QCOMPARE(m.value("commitType").toString(), QString("chore"));
        QCOMPARE(m.value("scope").toString(), QString("general"));
    }

    void testPresetDiffSkipsVcs()
    {
        auto vcs = std::make_unique<FakeVcs>();
        auto ai = std::make_unique<FakeAi>();
        FakeVcs* vcsPtr = vcs.get();
        FakeAi* aiPtr = ai.get();
        ai->reply = FULL_JSON;

        AiAnalysisWorkflow wf(std::move(vcs), std::move(ai), "diff --git a/x b/x\n+1\n", 5000);
        HarnessRun run(OperationKind::AiAnalysis, wf);

        QCOMPARE(run.outcome, OperationState::Completed);
        QCOMPARE(vcsPtr->calls, 0);
        QCOMPARE(aiPtr->prompts.size(), 1);
        QVERIFY(aiPtr->prompts.first().contains("diff --git a/x b/x"));
        QCOMPARE(run.status().result.toMap().value("title").toString(), QString("add retry"));
        QCOMPARE(run.progress, QStringList({"Analyzing git repository changes...",
                                            "Connecting to AI provider...",
                                            "Generating commit analysis..."}));
    }

    void testWorkingTreeChangesFromVcs()
    {
        auto vcs = std::make_unique<FakeVcs>();
        auto ai = std::make_unique<FakeAi>();
        vcs->diff = "=== UNSTAGED CHANGES ===\n+line\n";
        ai->reply = FULL_JSON;
        FakeAi* aiPtr = ai.get();

        AiAnalysisWorkflow wf(std::move(vcs), std::move(ai), QString(), 5000);
        HarnessRun run(OperationKind::AiAnalysis, wf);

        QCOMPARE(run.outcome, OperationState::Completed);
        QVERIFY(aiPtr->prompts.first().contains("=== UNSTAGED CHANGES ==="));
    }

    void testCleanTreeIsUserError()
    {
        auto ai = std::make_unique<FakeAi>();
        FakeAi* aiPtr = ai.get();
        AiAnalysisWorkflow wf(std::make_unique<FakeVcs>(), std::move(ai), QString(), 5000);
        HarnessRun run(OperationKind::AiAnalysis, wf);

        QCOMPARE(run.outcome, OperationState::Failed);
        QCOMPARE(run.status().message, QString("No git changes found to analyze"));
        QVERIFY(aiPtr->prompts.isEmpty());
    }

    void testVcsFailureIsReported()
    {
        auto vcs = std::make_unique<FakeVcs>();
        vcs->failure = "git diff could not be started";
        AiAnalysisWorkflow wf(std::move(vcs), std::make_unique<FakeAi>(), QString(), 5000);
        HarnessRun run(OperationKind::AiAnalysis, wf);

        QCOMPARE(run.outcome, OperationState::Failed);
        QCOMPARE(run.status().message, QString("git diff could not be started"));
    }

    void testProviderErrorIsReported()
    {
        auto ai = std::make_unique<FakeAi>();
        ai->error = "rate limited";
        AiAnalysisWorkflow wf(nullptr, std::move(ai), "diff", 5000);
        HarnessRun run(OperationKind::AiAnalysis, wf);

        QCOMPARE(run.outcome, OperationState::Failed);
        QCOMPARE(run.status().message, QString("rate limited"));
    }

    void testSilentProviderTimesOut()
    {
        auto ai = std::make_unique<FakeAi>();
        ai->silent = true;
        AiAnalysisWorkflow wf(nullptr, std::move(ai), "diff", 50);
        HarnessRun run(OperationKind::AiAnalysis, wf);

        QCOMPARE(run.outcome, OperationState::Failed);
        QCOMPARE(run.status().message, QString("AI request timed out"));
    }

    void testMissingProvider()
    {
        AiAnalysisWorkflow wf(nullptr, nullptr, "diff", 50);
        HarnessRun run(OperationKind::AiAnalysis, wf);
        QCOMPARE(run.outcome, OperationState::Failed);
        QCOMPARE(run.status().message, QString("AI provider not available"));
    }
};

QTEST_GUILESS_MAIN(TestAnalysisWorkflow)
#include "test_analysis_workflow.moc"
