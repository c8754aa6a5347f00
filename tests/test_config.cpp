#include <QtTest/QtTest>
#include <QtCore/QSettings>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Config.hpp"

using namespace Scribe;
using namespace Scribe::Test;

class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsWhenKeysMissing() {
        TEST_SCOPE("config_defaults");
        const QString iniPath = _testScope.getTempDirectory() + "/empty.ini";

        Config::instance().initializeWithFile(iniPath);
        QVERIFY(Config::instance().isInitialized());

        const ModelSettings settings = Config::instance().getModelSettings();
        QCOMPARE(settings.storageRoot, Config::instance().getDefaultStorageRoot());
        QCOMPARE(settings.progressIntervalMs, 30);
        QCOMPARE(settings.persistIntervalMs, 1000);
        QCOMPARE(settings.readTimeoutMs, 30000);
        QCOMPARE(settings.userAgent, QString("ScribeDesktop/1.0"));
        QVERIFY(settings.urlOverrides.isEmpty());
    }

    void testReadsIniFile() {
        TEST_SCOPE("config_ini");
        const QString dir = _testScope.getTempDirectory();
        const QString content =
            "[models]\n"
            "storageRoot=" + dir + "/store\n"
            "progressIntervalMs=50\n"
            "persistIntervalMs=250\n"
            "readTimeoutMs=1000\n"
            "userAgent=Custom/2.0\n"
            "urls\\base=http://mirror.example/ggml-base.bin\n";
        const QString iniPath = TestUtils::createTestTextFile(dir, content, "scribe.ini");
        QVERIFY(!iniPath.isEmpty());

        Config::instance().initializeWithFile(iniPath);
        const ModelSettings settings = Config::instance().getModelSettings();

        QCOMPARE(settings.storageRoot, dir + "/store");
        QCOMPARE(settings.progressIntervalMs, 50);
        QCOMPARE(settings.persistIntervalMs, 250);
        QCOMPARE(settings.readTimeoutMs, 1000);
        QCOMPARE(settings.userAgent, QString("Custom/2.0"));
        QCOMPARE(settings.urlOverrides.size(), qsizetype(1));
        QCOMPARE(settings.urlOverrides.value("base"), QString("http://mirror.example/ggml-base.bin"));
        QVERIFY(QDir(dir + "/store").exists());
    }

    void testInvalidNumbersFallBack() {
        TEST_SCOPE("config_invalid");
        const QString dir = _testScope.getTempDirectory();
        const QString iniPath = TestUtils::createTestTextFile(
            dir, "[models]\nprogressIntervalMs=fast\nreadTimeoutMs=-10\n", "bad.ini");

        Config::instance().initializeWithFile(iniPath);
        const ModelSettings settings = Config::instance().getModelSettings();

        QCOMPARE(settings.progressIntervalMs, 30);
        QCOMPARE(settings.readTimeoutMs, 0);
    }

    void testModelSettingsRoundTrip() {
        TEST_SCOPE("config_roundtrip");
        const QString dir = _testScope.getTempDirectory();
        const QString iniPath = dir + "/roundtrip.ini";
        Config::instance().initializeWithFile(iniPath);

        ModelSettings settings;
        settings.storageRoot = dir + "/models-root";
        settings.progressIntervalMs = 15;
        settings.urlOverrides.insert("tiny", "http://127.0.0.1/tiny.bin");
        Config::instance().setModelSettings(settings);
        Config::instance().sync();

        QSettings raw(iniPath, QSettings::IniFormat);
        QCOMPARE(raw.value("models/progressIntervalMs").toInt(), 15);
        QCOMPARE(raw.value("models/urls/tiny").toString(), QString("http://127.0.0.1/tiny.bin"));

        const ModelSettings reread = Config::instance().getModelSettings();
        QCOMPARE(reread.storageRoot, settings.storageRoot);
        QCOMPARE(reread.urlOverrides.value("tiny"), QString("http://127.0.0.1/tiny.bin"));
    }

    void testGenericAccessors() {
        TEST_SCOPE("config_accessors");
        Config::instance().initializeWithFile(_testScope.getTempDirectory() + "/generic.ini");

        Config::instance().setValue("test/flag", true);
        Config::instance().setValue("test/count", 7);
        Config::instance().setValue("test/name", "scribe");

        QVERIFY(Config::instance().getBool("test/flag"));
        QCOMPARE(Config::instance().getInt("test/count"), 7);
        QCOMPARE(Config::instance().getString("test/name"), QString("scribe"));
        QCOMPARE(Config::instance().getString("test/missing", "fallback"), QString("fallback"));

        Config::instance().remove("test/count");
        QCOMPARE(Config::instance().getInt("test/count", -1), -1);
    }
};

int runTestConfig(int argc, char** argv) {
    TestConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
