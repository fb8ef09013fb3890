#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/VarCli.hpp"
#include "common/logging.hpp"
#include "daemon/cascade_store.hpp"
#include "daemon/variable_manager.hpp"

class VarCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testSetThenGet();
    void testGetMissing();
    void testSetRejectsBadJson();
    void testList();
    void testExplicitDatabase();
    void testUsage();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::filesystem::path dbPath() const;
    int runCli(const QStringList &args, std::string &out);
};

void VarCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    cascade::logging::initLogging(QStringLiteral("cascade-test"), false);
}

void VarCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path VarCliTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/cascade/cascade.db";
}

void VarCliTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

int VarCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    cascade::VarCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void VarCliTests::testSetThenGet()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"cascade-var", "set", "thermostat", R"({"ignored":1})"}, output), 1);
    QCOMPARE(runCli({"cascade-var", "set", "thermostat", "[21.5, \"eco\"]"}, output), 0);

    QCOMPARE(runCli({"cascade-var", "get", "thermostat"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.is_array());
    QCOMPARE(parsed.at(0).get<double>(), 21.5);
    QCOMPARE(QString::fromStdString(parsed.at(1).get<std::string>()), QStringLiteral("eco"));

    // The value is visible to anything reading the same store.
    cascade::CascadeStore store;
    const auto record = store.get(cascade::VariableManager::storageKey("thermostat"));
    QVERIFY(record.has_value());
    QVERIFY(cascade::VariableManager::decodeRecord(*record).isList());
}

void VarCliTests::testGetMissing()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"cascade-var", "get", "nothing"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("undefined symbol: nothing")));
}

void VarCliTests::testSetRejectsBadJson()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"cascade-var", "set", "x", "{not json"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("not valid JSON")));
}

void VarCliTests::testList()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"cascade-var", "set", "b", "true"}, output), 0);
    QCOMPARE(runCli({"cascade-var", "set", "a", "3"}, output), 0);

    QCOMPARE(runCli({"cascade-var", "list"}, output), 0);
    QCOMPARE(QString::fromStdString(output), QStringLiteral("a = 3\nb = true\n"));

    {
        cascade::CascadeStore store;
        store.set(cascade::VariableManager::storageKey("c"), "garbage");
    }
    QCOMPARE(runCli({"cascade-var", "list"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("c = <")));
}

void VarCliTests::testExplicitDatabase()
{
    resetDb();

    const QString path = m_tempDir.path() + QStringLiteral("/other/vars.db");
    std::string output;
    QCOMPARE(runCli({"cascade-var", "--db", path, "set", "x", "\"here\""}, output), 0);
    QVERIFY(std::filesystem::exists(path.toStdString()));

    QCOMPARE(runCli({"cascade-var", "get", "x"}, output), 1);
    QCOMPARE(runCli({"cascade-var", "--db", path, "get", "x"}, output), 0);
    QCOMPARE(QString::fromStdString(output).trimmed(), QStringLiteral("\"here\""));
}

void VarCliTests::testUsage()
{
    std::string output;
    QCOMPARE(runCli({"cascade-var"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Usage")));
    QCOMPARE(runCli({"cascade-var", "frobnicate"}, output), 1);
    QCOMPARE(runCli({"cascade-var", "get"}, output), 1);
}

QTEST_MAIN(VarCliTests)
#include "test_var_cli.moc"
