#include <QtTest>
#include <QPointer>
#include "TestFakes.hpp"
#include "core/operations/AsyncBridge.hpp"
#include "core/operations/OperationChannel.hpp"
#include "core/operations/OperationError.hpp"
#include "core/operations/OperationRegistry.hpp"
#include "core/operations/OperationWorker.hpp"
#include "core/services/EventBus.hpp"
#include "core/services/EventReceiver.hpp"

using namespace srt;
using srt::test::LambdaWorkflow;

namespace {

// One operation wired to a fresh registry and bus.
struct Harness {
    OperationRegistry registry;
    EventBus bus;
    std::shared_ptr<EventReceiver> rx = bus.subscribe(1000);
    std::shared_ptr<OperationChannel> channel;

    Harness()
    {
        registry.reserve(OperationKind::AiAnalysis, "op");
        channel = std::make_shared<OperationChannel>("op", OperationKind::AiAnalysis, &registry, &bus);
    }

    OperationState execute(test::WorkflowFn fn)
    {
        LambdaWorkflow wf(std::move(fn));
        return OperationHarness::execute(*channel, registry, wf);
    }

    QList<OperationEvent> events()
    {
        QList<OperationEvent> out;
        OperationEvent e;
        while (rx->tryNext(&e))
            out.append(e);
        return out;
    }
};

} // namespace

class TestWorkerHarness : public QObject {
    Q_OBJECT
private slots:
    void testStepsThenCompleted()
    {
        Harness h;
        const auto state = h.execute([](OperationContext& ctx) {
            ctx.step("one", [] {});
            ctx.step("two", [] {});
            return QVariant(QStringLiteral("result"));
        });

        QCOMPARE(state, OperationState::Completed);
        const auto events = h.events();
        QCOMPARE(events.size(), 3);
        QCOMPARE(events[0].text, QString("one"));
        QCOMPARE(events[1].text, QString("two"));
        QCOMPARE(events[2].type, OperationEvent::Type::Completed);
        QCOMPARE(events[2].result.toString(), QString("result"));
        QCOMPARE(h.registry.status("op").result.toString(), QString("result"));
        QVERIFY(h.channel->isClosed());
    }

    void testOperationErrorBecomesFailed()
    {
        Harness h;
        const auto state = h.execute([](OperationContext& ctx) -> QVariant {
            ctx.step("collect", [] {
                throw OperationError::user("No git changes found to analyze");
            });
            return {};
        });

        QCOMPARE(state, OperationState::Failed);
        const auto s = h.registry.status("op");
        QCOMPARE(s.message, QString("No git changes found to analyze"));
        const auto events = h.events();
        QCOMPARE(events.last().type, OperationEvent::Type::Failed);
        QCOMPARE(events.last().text, s.message);
    }

    void testForeignExceptionBecomesInternalError()
    {
        Harness h;
        const auto state = h.execute([](OperationContext&) -> QVariant {
            throw std::runtime_error("index out of range");
        });
        QCOMPARE(state, OperationState::Failed);
        QCOMPARE(h.registry.status("op").message, OperationHarness::INTERNAL_ERROR_MESSAGE);
    }

    void testNonStdExceptionBecomesInternalError()
    {
        Harness h;
        const auto state = h.execute([](OperationContext&) -> QVariant {
            throw 42;
        });
        QCOMPARE(state, OperationState::Failed);
        QCOMPARE(h.registry.status("op").message, QString("internal error"));
    }

    void testSelfCancelStopsBeforeNextStep()
    {
        Harness h;
        bool secondRan = false;
        auto channel = h.channel;
        const auto state = h.execute([&](OperationContext& ctx) {
            ctx.step("first", [&] { channel->token().cancel(); });
            ctx.step("second", [&] { secondRan = true; });
            return QVariant();
        });

        QCOMPARE(state, OperationState::Cancelled);
        QVERIFY(!secondRan);
        const auto events = h.events();
        QCOMPARE(events.size(), 2);
        QCOMPARE(events[0].text, QString("first"));
        QCOMPARE(events[1].type, OperationEvent::Type::Cancelled);
    }

    void testCancelBeforeFirstStep()
    {
        Harness h;
        QVERIFY(h.channel->cancel());
        int steps = 0;
        const auto state = h.execute([&](OperationContext& ctx) {
            ctx.step("never", [&] { ++steps; });
            return QVariant();
        });

        QCOMPARE(state, OperationState::Cancelled);
        QCOMPARE(steps, 0);
        const auto events = h.events();
        QCOMPARE(events.size(), 1);
        QCOMPARE(events[0].type, OperationEvent::Type::Cancelled);
    }

    void testLateCancelLosesToCompletion()
    {
        Harness h;
        QCOMPARE(h.execute([](OperationContext&) { return QVariant(1); }), OperationState::Completed);
        QVERIFY(!h.channel->cancel());
        QVERIFY(!h.channel->progress("late"));
        QCOMPARE(h.registry.status("op").state, OperationState::Completed);
        QCOMPARE(h.events().size(), 1);
    }

    void testBridgeAwaitReturnsCallbackValue()
    {
        Harness h;
        const auto state = h.execute([](OperationContext& ctx) {
            AsyncBridge& bridge = ctx.bridge();
            int value = 0;
            const bool ok = bridge.await<int>([&bridge](std::function<void(const int&)> done) {
                QTimer::singleShot(5, bridge.scope(), [done]() { done(7); });
            }, &value, 5000);
            if (!ok)
                throw OperationError::collaborator("no answer");
            return QVariant(value);
        });

        QCOMPARE(state, OperationState::Completed);
        QCOMPARE(h.registry.status("op").result.toInt(), 7);
    }

    void testBridgeAwaitTimesOut()
    {
        AsyncBridge bridge;
        int value = -1;
        const bool ok = bridge.await<int>([](std::function<void(const int&)>) {}, &value, 20);
        QVERIFY(!ok);
        QCOMPARE(value, -1);
        QCOMPARE(bridge.completedCalls(), 0);
    }

    void testBridgeScopeDestroyedWithOperation()
    {
        Harness h;
        QPointer<QObject> leftover;
        h.execute([&](OperationContext& ctx) -> QVariant {
            leftover = new QObject(ctx.bridge().scope());
            throw OperationError::collaborator("failed mid-request");
        });
        QVERIFY(leftover.isNull());
    }

    void testWorkerRunsOnItsOwnThread()
    {
        OperationRegistry registry;
        EventBus bus;
        auto rx = bus.subscribe();
        registry.reserve(OperationKind::SemanticRelease, "w");
        auto channel = std::make_shared<OperationChannel>("w", OperationKind::SemanticRelease,
                                                          &registry, &bus);

        QThread* mainThread = QThread::currentThread();
        QThread* ranOn = nullptr;
        auto wf = std::make_unique<LambdaWorkflow>([&](OperationContext& ctx) {
            ranOn = QThread::currentThread();
            AsyncBridge& bridge = ctx.bridge();
            QString reply;
            bridge.await<QString>([&bridge](std::function<void(const QString&)> done) {
                QTimer::singleShot(0, bridge.scope(), [done]() { done(QStringLiteral("pong")); });
            }, &reply, 5000);
            return QVariant(reply);
        });

        OperationWorker worker(channel, &registry, std::move(wf));
        worker.start();
        QVERIFY(worker.wait(10000));

        QVERIFY(ranOn != nullptr);
        QVERIFY(ranOn != mainThread);
        QCOMPARE(worker.outcome(), OperationState::Completed);
        QCOMPARE(registry.status("w").result.toString(), QString("pong"));
        QVERIFY(!registry.isInFlight(OperationKind::SemanticRelease));
    }
};

QTEST_GUILESS_MAIN(TestWorkerHarness)
#include "test_worker_harness.moc"
