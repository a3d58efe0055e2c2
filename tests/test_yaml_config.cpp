#include <QtTest>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void init();
    void testLoadDefaults();
    void testLoadFromFile();
    void testMissingFileKeepsDefaults();
    void testMalformedFileKeepsDefaults();
    void testSaveAndReload();
    void testApiKeyFallsBackToEnvironment();
    void testModelsAsScalar();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
    void testSnapshot();
};

void TestYamlConfig::init()
{
    qunsetenv("GEMINI_TOKEN");
}

void TestYamlConfig::testLoadDefaults()
{
    srt::YamlConfig config;
    QCOMPARE(config.aiProvider(), QString("gemini"));
    QCOMPARE(config.aiEndpoint(), QString("https://generativelanguage.googleapis.com/v1beta"));
    QCOMPARE(config.aiModels(), QStringList({"gemini-2.5-pro", "gemini-2.0-flash"}));
    QCOMPARE(config.aiTimeoutMs(), 120000);
    QCOMPARE(config.gitBinary(), QString("git"));
    QCOMPARE(config.repositoryPath(), QString("."));
    QCOMPARE(config.releaseOutputDir(), QString("release-notes"));
    QCOMPARE(config.releaseTemplatePath(), QString("scripts/plantilla.md"));
    QCOMPARE(config.npxBinary(), QString("npx"));
    QCOMPARE(config.releaseDryRun(), true);
    QCOMPARE(config.eventBufferCapacity(), 256);
    QCOMPARE(config.historyMaxAgeSec(), 600);
    QCOMPARE(config.tickMs(), 50);
    QCOMPARE(config.logLevel(), QString("info"));
    QVERIFY(config.aiApiKey().isEmpty());
}

void TestYamlConfig::testLoadFromFile()
{
    srt::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.aiApiKey(), QString("test-key-123"));
    QCOMPARE(config.aiModels(), QStringList({"gemini-test-pro", "gemini-test-flash"}));
    QCOMPARE(config.aiTimeoutMs(), 30000);
    QCOMPARE(config.repositoryPath(), QString("/srv/repos/project"));
    QCOMPARE(config.releaseOutputDir(), QString("notes"));
    QCOMPARE(config.releaseResponsible(), QString("Release Bot"));
    QCOMPARE(config.releaseDryRun(), false);
    QCOMPARE(config.eventBufferCapacity(), 64);
    QCOMPARE(config.logLevel(), QString("debug"));

    // Untouched keys keep their defaults after the merge
    QCOMPARE(config.aiProvider(), QString("gemini"));
    QCOMPARE(config.gitBinary(), QString("git"));
    QCOMPARE(config.tickMs(), 50);
}

void TestYamlConfig::testMissingFileKeepsDefaults()
{
    srt::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/does_not_exist.yaml"));
    QCOMPARE(config.eventBufferCapacity(), 256);
}

void TestYamlConfig::testMalformedFileKeepsDefaults()
{
    srt::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/malformed_config.yaml"));
    QCOMPARE(config.aiModels().size(), 2);
    QCOMPARE(config.aiTimeoutMs(), 120000);
}

void TestYamlConfig::testSaveAndReload()
{
    srt::YamlConfig config;
    config.setAiModels({"only-model"});
    config.setTickMs(16);
    config.setReleaseDryRun(false);

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("nested/config.yaml");
    QVERIFY(config.save(path));

    srt::YamlConfig loaded;
    QVERIFY(loaded.load(path));
    QCOMPARE(loaded.aiModels(), QStringList({"only-model"}));
    QCOMPARE(loaded.tickMs(), 16);
    QCOMPARE(loaded.releaseDryRun(), false);
}

void TestYamlConfig::testApiKeyFallsBackToEnvironment()
{
    srt::YamlConfig config;
    qputenv("GEMINI_TOKEN", "from-env");
    QCOMPARE(config.aiApiKey(), QString("from-env"));

    config.setAiApiKey("from-file");
    QCOMPARE(config.aiApiKey(), QString("from-file"));
    qunsetenv("GEMINI_TOKEN");
}

void TestYamlConfig::testModelsAsScalar()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("scalar.yaml");
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("ai:\n  models: gemini-solo\n");
    f.close();

    srt::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.aiModels(), QStringList({"gemini-solo"}));
}

void TestYamlConfig::testValueByPath()
{
    srt::YamlConfig config;
    QCOMPARE(config.valueByPath("ai.provider").toString(), QString("gemini"));
    QCOMPARE(config.valueByPath("ai.timeout_ms").toInt(), 120000);
    QCOMPARE(config.valueByPath("release.dry_run").toBool(), true);
    QCOMPARE(config.valueByPath("ai.models").toStringList().size(), 2);
}

void TestYamlConfig::testValueByPathMissing()
{
    srt::YamlConfig config;
    QVERIFY(!config.valueByPath("ai.nonexistent").isValid());
    QVERIFY(!config.valueByPath("nope.deeper.key").isValid());
    QVERIFY(!config.valueByPath("").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    srt::YamlConfig config;
    QVERIFY(config.setValueByPath("orchestrator.tick_ms", 33));
    QCOMPARE(config.tickMs(), 33);
    QVERIFY(config.setValueByPath("release.dry_run", false));
    QCOMPARE(config.releaseDryRun(), false);
    QVERIFY(config.setValueByPath("logging.level", QString("warning")));
    QCOMPARE(config.logLevel(), QString("warning"));
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    srt::YamlConfig config;
    QVERIFY(!config.setValueByPath("ai.unknown_key", 1));
    QVERIFY(!config.setValueByPath("ai", 1));
    QVERIFY(!config.setValueByPath("ai.models", QString("x")));
    QVERIFY(!config.valueByPath("ai.unknown_key").isValid());
}

void TestYamlConfig::testSnapshot()
{
    srt::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    const srt::AppConfig snap = config.snapshot();

    QCOMPARE(snap.aiApiKey, QString("test-key-123"));
    QCOMPARE(snap.aiModels.first(), QString("gemini-test-pro"));
    QCOMPARE(snap.releaseDryRun, false);
    QCOMPARE(snap.eventBufferCapacity, 64);

    // Later edits do not reach an existing snapshot
    config.setTickMs(1);
    QCOMPARE(snap.tickMs, 50);
}

QTEST_GUILESS_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
