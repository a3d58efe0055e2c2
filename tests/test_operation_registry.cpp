#include <QtTest>
#include "core/operations/OperationRegistry.hpp"

using srt::OperationKind;
using srt::OperationRegistry;
using srt::OperationState;

class TestOperationRegistry : public QObject {
    Q_OBJECT
private slots:
    void testReserveIsSingleFlightPerKind();
    void testDifferentKindsRunTogether();
    void testLifecycleStamps();
    void testTerminalIsFinal();
    void testPendingCanOnlyBeCancelled();
    void testProgressMessageOnlyWhileRunning();
    void testDiscardOnlyPending();
    void testUnknownIdIsInvalid();
    void testRemoveRefusesInFlight();
    void testSweepByAge();
    void testKindHeldUntilReleased();
    void testReleaseOnlyFreesOwnReservation();
    void testSweepKeepsListedIds();
};

void TestOperationRegistry::testReserveIsSingleFlightPerKind()
{
    OperationRegistry reg;
    QVERIFY(reg.reserve(OperationKind::AiAnalysis, "a"));
    QVERIFY(!reg.reserve(OperationKind::AiAnalysis, "b"));
    QVERIFY(reg.isInFlight(OperationKind::AiAnalysis));
    QCOMPARE(reg.size(), 1);
    QVERIFY(!reg.status("b").isValid());
}

void TestOperationRegistry::testDifferentKindsRunTogether()
{
    OperationRegistry reg;
    QVERIFY(reg.reserve(OperationKind::AiAnalysis, "a"));
    QVERIFY(reg.reserve(OperationKind::SemanticRelease, "s"));
    QVERIFY(reg.reserve(OperationKind::ReleaseNotesGeneration, "r"));

    const auto running = reg.inFlight();
    QCOMPARE(running.size(), 3);
    QVERIFY(running.contains(srt::RunningOperation(OperationKind::SemanticRelease, "s")));
}

void TestOperationRegistry::testLifecycleStamps()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    QCOMPARE(reg.status("a").state, OperationState::Pending);
    QVERIFY(!reg.status("a").startedAt.isValid());

    QVERIFY(reg.markRunning("a"));
    QCOMPARE(reg.status("a").state, OperationState::Running);
    QVERIFY(reg.status("a").startedAt.isValid());
    QVERIFY(!reg.markRunning("a"));

    QVERIFY(reg.complete("a", QVariant(42)));
    const auto s = reg.status("a");
    QCOMPARE(s.state, OperationState::Completed);
    QCOMPARE(s.result.toInt(), 42);
    QVERIFY(s.finishedAt.isValid());
    QVERIFY(s.finishedAt >= s.startedAt);
}

void TestOperationRegistry::testTerminalIsFinal()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    reg.markRunning("a");
    QVERIFY(reg.fail("a", "boom"));

    QVERIFY(!reg.complete("a", QVariant(1)));
    QVERIFY(!reg.cancel("a"));
    QVERIFY(!reg.fail("a", "again"));
    QVERIFY(!reg.markRunning("a"));
    QVERIFY(!reg.updateMessage("a", "late"));

    const auto s = reg.status("a");
    QCOMPARE(s.state, OperationState::Failed);
    QCOMPARE(s.message, QString("boom"));
}

void TestOperationRegistry::testPendingCanOnlyBeCancelled()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    QVERIFY(!reg.complete("a", {}));
    QVERIFY(!reg.fail("a", "x"));
    QVERIFY(reg.cancel("a"));
    QCOMPARE(reg.status("a").state, OperationState::Cancelled);
    QVERIFY(reg.inFlight().isEmpty());
}

void TestOperationRegistry::testProgressMessageOnlyWhileRunning()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    QVERIFY(!reg.updateMessage("a", "too early"));
    reg.markRunning("a");
    QVERIFY(reg.updateMessage("a", "step 1"));
    QCOMPARE(reg.status("a").message, QString("step 1"));
}

void TestOperationRegistry::testDiscardOnlyPending()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    QVERIFY(reg.discard("a"));
    QVERIFY(!reg.status("a").isValid());
    QVERIFY(reg.reserve(OperationKind::AiAnalysis, "b"));
    reg.markRunning("b");
    QVERIFY(!reg.discard("b"));
}

void TestOperationRegistry::testUnknownIdIsInvalid()
{
    OperationRegistry reg;
    QVERIFY(!reg.status("nope").isValid());
    QVERIFY(!reg.markRunning("nope"));
    QVERIFY(!reg.cancel("nope"));
    QVERIFY(!reg.remove("nope"));
}

void TestOperationRegistry::testRemoveRefusesInFlight()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    reg.markRunning("a");
    QVERIFY(!reg.remove("a"));
    reg.complete("a", {});
    QVERIFY(reg.remove("a"));
    QCOMPARE(reg.size(), 0);
}

void TestOperationRegistry::testSweepByAge()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "old");
    reg.markRunning("old");
    reg.complete("old", {});
    reg.reserve(OperationKind::SemanticRelease, "live");
    reg.markRunning("live");

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QCOMPARE(reg.sweep(60000, now), 0);
    QCOMPARE(reg.sweep(60000, now.addSecs(120)), 1);
    QVERIFY(!reg.status("old").isValid());
    QVERIFY(reg.status("live").isValid());
    QCOMPARE(reg.sweep(0, now.addSecs(3600)), 0);
}

void TestOperationRegistry::testKindHeldUntilReleased()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    reg.markRunning("a");
    QVERIFY(reg.cancel("a"));

    // Cancelled, but its worker may still be inside a step.
    QCOMPARE(reg.status("a").state, OperationState::Cancelled);
    QVERIFY(reg.isInFlight(OperationKind::AiAnalysis));
    QVERIFY(reg.inFlight().isEmpty());
    QVERIFY(!reg.reserve(OperationKind::AiAnalysis, "b"));

    QVERIFY(reg.release("a"));
    QVERIFY(!reg.release("a"));
    QVERIFY(!reg.isInFlight(OperationKind::AiAnalysis));
    QVERIFY(reg.reserve(OperationKind::AiAnalysis, "b"));
    QCOMPARE(reg.status("a").state, OperationState::Cancelled);
}

void TestOperationRegistry::testReleaseOnlyFreesOwnReservation()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    reg.markRunning("a");
    reg.complete("a", {});
    reg.release("a");
    reg.reserve(OperationKind::AiAnalysis, "b");

    QVERIFY(!reg.release("a"));
    QVERIFY(reg.isInFlight(OperationKind::AiAnalysis));
}

void TestOperationRegistry::testSweepKeepsListedIds()
{
    OperationRegistry reg;
    reg.reserve(OperationKind::AiAnalysis, "a");
    reg.markRunning("a");
    reg.complete("a", {});
    reg.reserve(OperationKind::SemanticRelease, "s");
    reg.markRunning("s");
    reg.fail("s", "boom");

    const QDateTime later = QDateTime::currentDateTimeUtc().addSecs(60);
    QCOMPARE(reg.sweep(0, later, {QStringLiteral("a")}), 1);
    QVERIFY(reg.status("a").isValid());
    QVERIFY(!reg.status("s").isValid());
    QCOMPARE(reg.sweep(0, later), 1);
}

QTEST_GUILESS_MAIN(TestOperationRegistry)
#include "test_operation_registry.moc"
