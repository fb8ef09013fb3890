#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <optional>

#include "daemon/cascade_store.hpp"

class StoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testDefaultPathUsesHome();
    void testSetAndGet();
    void testPersistsAcrossHandles();
    void testKeysWithPrefix();
    void testIntegrityCheck();
    void testInMemoryStore();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::filesystem::path dbPath() const;
};

void StoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path StoreTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/cascade/cascade.db";
}

void StoreTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

void StoreTests::testDefaultPathUsesHome()
{
    QCOMPARE(QString::fromStdString(cascade::CascadeStore::defaultPath().string()),
             QString::fromStdString(dbPath().string()));

    resetDb();
    cascade::CascadeStore store;
    QVERIFY(std::filesystem::exists(dbPath()));
}

void StoreTests::testSetAndGet()
{
    resetDb();
    cascade::CascadeStore store;

    QVERIFY(!store.get("var~missing").has_value());

    store.set("var~lamp", "{\"value\":true}");
    const auto value = store.get("var~lamp");
    QVERIFY(value.has_value());
    QCOMPARE(QString::fromStdString(*value), QStringLiteral("{\"value\":true}"));

    store.set("var~lamp", "{\"value\":false}");
    QCOMPARE(QString::fromStdString(store.get("var~lamp").value()),
             QStringLiteral("{\"value\":false}"));
}

void StoreTests::testPersistsAcrossHandles()
{
    resetDb();
    {
        cascade::CascadeStore store;
        store.set("var~count", "{\"value\":3}");
    }

    cascade::CascadeStore reopened;
    QCOMPARE(QString::fromStdString(reopened.get("var~count").value_or(std::string())),
             QStringLiteral("{\"value\":3}"));
}

void StoreTests::testKeysWithPrefix()
{
    resetDb();
    cascade::CascadeStore store;
    store.set("var~b", "1");
    store.set("var~a", "2");
    store.set("other~c", "3");
    store.set("var%x", "4");

    const auto keys = store.keysWithPrefix("var~");
    QCOMPARE(keys.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(keys[0]), QStringLiteral("var~a"));
    QCOMPARE(QString::fromStdString(keys[1]), QStringLiteral("var~b"));

    // Wildcard characters in the prefix are matched literally.
    const auto literal = store.keysWithPrefix("var%");
    QCOMPARE(literal.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(literal[0]), QStringLiteral("var%x"));

    QVERIFY(store.keysWithPrefix("none~").empty());
}

void StoreTests::testIntegrityCheck()
{
    resetDb();
    cascade::CascadeStore store;
    std::string message;
    QVERIFY(store.integrityCheck(&message));
    QCOMPARE(QString::fromStdString(message), QStringLiteral("ok"));
}

void StoreTests::testInMemoryStore()
{
    cascade::CascadeStore first(":memory:");
    cascade::CascadeStore second(":memory:");
    first.set("var~x", "1");
    QVERIFY(first.get("var~x").has_value());
    QVERIFY(!second.get("var~x").has_value());
}

QTEST_MAIN(StoreTests)
#include "test_store.moc"
