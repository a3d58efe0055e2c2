#include <QtTest>
#include "core/vcs/ConventionalCommit.hpp"

using namespace srt;

class TestConventionalCommit : public QObject {
    Q_OBJECT
private slots:
    void testParseTypeScopeDescription()
    {
        CommitInfo c;
        QVERIFY(ConventionalCommit::parseSubject("feat(parser): accept tabs", &c));
        QCOMPARE(c.type, QString("feat"));
        QCOMPARE(c.scope, QString("parser"));
        QCOMPARE(c.description, QString("accept tabs"));
        QVERIFY(c.breakingChanges.isEmpty());
    }

    void testParseWithoutScope()
    {
        CommitInfo c;
        QVERIFY(ConventionalCommit::parseSubject("fix:   trim trailing space", &c));
        QCOMPARE(c.type, QString("fix"));
        QVERIFY(c.scope.isEmpty());
        QCOMPARE(c.description, QString("trim trailing space"));
    }

    void testBangMarksBreaking()
    {
        CommitInfo c;
        QVERIFY(ConventionalCommit::parseSubject("refactor(api)!: drop v1 endpoints", &c));
        QCOMPARE(c.type, QString("refactor"));
        QCOMPARE(c.breakingChanges, QStringList({"drop v1 endpoints"}));
    }

    void testNonConventionalSubject()
    {
        CommitInfo c;
        QVERIFY(!ConventionalCommit::parseSubject("Merge branch 'main'", &c));
        QVERIFY(c.type.isEmpty());
        QCOMPARE(c.description, QString("Merge branch 'main'"));

        QVERIFY(!ConventionalCommit::parseSubject("wip: not a known type", &c));
        QVERIFY(c.type.isEmpty());
    }

    void testBreakingChangesFromBody()
    {
        const QString body =
            "Rework the config loader.\n"
            "\n"
            "BREAKING CHANGE: config keys are now snake_case\n"
            "BREAKING-CHANGE: the ini format is gone\n"
            "BREAKING CHANGE:\n";
        QCOMPARE(ConventionalCommit::breakingChangesFromBody(body),
                 QStringList({"config keys are now snake_case", "the ini format is gone"}));
    }

    void testParseLog()
    {
        const QChar fs(0x1f), rs(0x1e);
        QString log;
        log += "aaaaaaaaaaaa" + QString(fs) + "Ana" + fs + "ana@example.com" + fs
             + "2024-05-01T10:00:00+02:00" + fs + "feat(ui): add board" + fs
             + "Adds the board.\n\nBREAKING CHANGE: old view removed\n" + rs + '\n';
        log += "bbbbbbbbbbbb" + QString(fs) + "Luis" + fs + "luis@example.com" + fs
             + "2024-04-30T09:00:00+00:00" + fs + "update readme" + fs + "" + rs + '\n';

        const CommitList commits = ConventionalCommit::parseLog(log);
        QCOMPARE(commits.size(), 2);

        QCOMPARE(commits[0].hash, QString("aaaaaaaaaaaa"));
        QCOMPARE(commits[0].shortHash(), QString("aaaaaaa"));
        QCOMPARE(commits[0].authorName, QString("Ana"));
        QCOMPARE(commits[0].type, QString("feat"));
        QCOMPARE(commits[0].scope, QString("ui"));
        QCOMPARE(commits[0].breakingChanges, QStringList({"old view removed"}));
        QVERIFY(commits[0].date.isValid());

        QVERIFY(commits[1].type.isEmpty());
        QCOMPARE(commits[1].description, QString("update readme"));
        QVERIFY(commits[1].body.isEmpty());
    }

    void testParseLogSkipsGarbage()
    {
        QCOMPARE(ConventionalCommit::parseLog(QString()).size(), 0);
        QCOMPARE(ConventionalCommit::parseLog("not a log line\n").size(), 0);
    }

    void testTypeTitle()
    {
        QCOMPARE(ConventionalCommit::typeTitle("feat"), QString("New Features"));
        QCOMPARE(ConventionalCommit::typeTitle("fix"), QString("Bug Fixes"));
        QCOMPARE(ConventionalCommit::typeTitle("other"), QString("Other Changes"));
    }
};

QTEST_GUILESS_MAIN(TestConventionalCommit)
#include "test_conventional_commit.moc"
