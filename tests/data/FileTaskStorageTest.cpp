#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "tickoff/core/TaskStore.hpp"
#include "tickoff/data/FileTaskStorage.hpp"

using namespace tickoff;

namespace {

void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(file.write(content), static_cast<qint64>(content.size()));
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

} // namespace

class FileTaskStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void missingFileIsEmpty();
    void blankFileIsEmpty_data();
    void blankFileIsEmpty();
    void malformedFileWarns_data();
    void malformedFileWarns();
    void roundTripThroughStore();
    void writesDocumentedFormat();
    void acceptsCompletedWithoutTimestamp();
    void createsParentDirectory();
    void saveFailureReported();
};

void FileTaskStorageTest::missingFileIsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileTaskStorage storage(dir.filePath(QStringLiteral("tasks.txt")));

    QString warning;
    QVERIFY(storage.load(&warning).empty());
    QVERIFY(warning.isEmpty());
}

void FileTaskStorageTest::blankFileIsEmpty_data()
{
    QTest::addColumn<QByteArray>("content");
    QTest::newRow("empty") << QByteArray();
    QTest::newRow("whitespace") << QByteArray(" \n\t\n");
    QTest::newRow("empty array") << QByteArray("[]");
}

void FileTaskStorageTest::blankFileIsEmpty()
{
    QFETCH(QByteArray, content);
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.txt"));
    writeFile(path, content);

    data::FileTaskStorage storage(path);
    QString warning;
    QVERIFY(storage.load(&warning).empty());
    QVERIFY(warning.isEmpty());
}

void FileTaskStorageTest::malformedFileWarns_data()
{
    QTest::addColumn<QByteArray>("content");
    QTest::newRow("not json") << QByteArray("this is not json");
    QTest::newRow("truncated") << QByteArray("[{\"id\": 1, \"description\": \"a\"");
    QTest::newRow("object root") << QByteArray("{\"id\": 1}");
    QTest::newRow("missing description")
        << QByteArray("[{\"id\": 1, \"completed\": false, \"created_at\": \"2026-10-19 09:00:00\"}]");
    QTest::newRow("string id")
        << QByteArray("[{\"id\": \"1\", \"description\": \"a\", \"completed\": false, "
                      "\"created_at\": \"2026-10-19 09:00:00\"}]");
    QTest::newRow("fractional id")
        << QByteArray("[{\"id\": 1.5, \"description\": \"a\", \"completed\": false, "
                      "\"created_at\": \"2026-10-19 09:00:00\"}]");
    QTest::newRow("bad timestamp")
        << QByteArray("[{\"id\": 1, \"description\": \"a\", \"completed\": false, \"created_at\": \"yesterday\"}]");
    QTest::newRow("completed not bool")
        << QByteArray("[{\"id\": 1, \"description\": \"a\", \"completed\": \"yes\", "
                      "\"created_at\": \"2026-10-19 09:00:00\"}]");
}

void FileTaskStorageTest::malformedFileWarns()
{
    QFETCH(QByteArray, content);
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.txt"));
    writeFile(path, content);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Could not load tasks")));
    core::TaskStore store(std::make_shared<data::FileTaskStorage>(path));
    QVERIFY(store.tasks().empty());
    QVERIFY(store.loadWarning().contains(path));
    QCOMPARE(readFile(path), content);
}

void FileTaskStorageTest::roundTripThroughStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.txt"));

    std::vector<data::Task> expected;
    {
        core::TaskStore store(std::make_shared<data::FileTaskStorage>(path));
        QVERIFY(store.add(QStringLiteral("buy milk")).ok());
        QVERIFY(store.add(QStringLiteral("café ☕ \"quoted\", with\nnewline")).ok());
        QVERIFY(store.add(QStringLiteral("pay bills")).ok());
        QVERIFY(store.complete(QStringLiteral("2")).ok());
        QVERIFY(store.remove(QStringLiteral("1")).ok());
        expected = store.tasks();
    }

    core::TaskStore reloaded(std::make_shared<data::FileTaskStorage>(path));
    QVERIFY(reloaded.loadWarning().isEmpty());
    QCOMPARE(reloaded.tasks().size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        QVERIFY(reloaded.tasks()[i] == expected[i]);
    }
    QVERIFY(reloaded.tasks()[0].completed);
    QVERIFY(reloaded.tasks()[0].completedAt.isValid());
    QVERIFY(!reloaded.tasks()[1].completedAt.isValid());
}

void FileTaskStorageTest::writesDocumentedFormat()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.txt"));

    data::Task pending;
    pending.id = 1;
    pending.description = QStringLiteral("buy milk");
    pending.createdAt = QDateTime(QDate(2026, 10, 19), QTime(9, 58, 0));

    data::Task done;
    done.id = 2;
    done.description = QStringLiteral("pay bills");
    done.completed = true;
    done.createdAt = QDateTime(QDate(2026, 10, 19), QTime(10, 0, 0));
    done.completedAt = QDateTime(QDate(2026, 10, 19), QTime(10, 4, 11));

    data::FileTaskStorage storage(path);
    QString error;
    QVERIFY(storage.save({ pending, done }, &error));
    QVERIFY(error.isEmpty());

    const QByteArray content = readFile(path);
    QVERIFY(content.contains("\n    "));
    const QJsonArray records = QJsonDocument::fromJson(content).array();
    QCOMPARE(records.size(), 2);

    const QJsonObject first = records.at(0).toObject();
    QCOMPARE(first.value(QStringLiteral("id")).toInt(), 1);
    QCOMPARE(first.value(QStringLiteral("description")).toString(), QStringLiteral("buy milk"));
    QCOMPARE(first.value(QStringLiteral("completed")).toBool(), false);
    QCOMPARE(first.value(QStringLiteral("created_at")).toString(), QStringLiteral("2026-10-19 09:58:00"));
    QVERIFY(!first.contains(QStringLiteral("completed_at")));

    const QJsonObject second = records.at(1).toObject();
    QVERIFY(second.value(QStringLiteral("completed")).isBool());
    QCOMPARE(second.value(QStringLiteral("completed_at")).toString(), QStringLiteral("2026-10-19 10:04:11"));
}

void FileTaskStorageTest::acceptsCompletedWithoutTimestamp()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.txt"));
    writeFile(path,
              "[\n  {\n    \"id\": 3,\n    \"description\": \"legacy\",\n    \"completed\": true,\n"
              "    \"created_at\": \"2025-01-02 03:04:05\"\n  }\n]\n");

    data::FileTaskStorage storage(path);
    QString warning;
    const auto tasks = storage.load(&warning);
    QVERIFY(warning.isEmpty());
    QCOMPARE(tasks.size(), static_cast<size_t>(1));
    QCOMPARE(tasks.front().id, 3);
    QVERIFY(tasks.front().completed);
    QVERIFY(!tasks.front().completedAt.isValid());
    QCOMPARE(tasks.front().createdAt, QDateTime(QDate(2025, 1, 2), QTime(3, 4, 5)));
}

void FileTaskStorageTest::createsParentDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/deeper/tasks.txt"));

    core::TaskStore store(std::make_shared<data::FileTaskStorage>(path));
    const auto result = store.add(QStringLiteral("first"));
    QVERIFY(result.ok());
    QVERIFY(result->persistence.saved);
    QVERIFY(QFile::exists(path));
}

void FileTaskStorageTest::saveFailureReported()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // A directory where the file should be makes every save fail.
    const QString path = dir.filePath(QStringLiteral("blocked"));
    QVERIFY(QDir(dir.path()).mkdir(QStringLiteral("blocked")));

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Could not load tasks")));
    core::TaskStore store(std::make_shared<data::FileTaskStorage>(path));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Error saving tasks")));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("changes kept in memory only")));
    const auto result = store.add(QStringLiteral("kept anyway"));
    QVERIFY(result.ok());
    QVERIFY(!result->persistence.saved);
    QVERIFY(result->persistence.warning.contains(QStringLiteral("Error saving tasks")));
    QCOMPARE(store.tasks().size(), static_cast<size_t>(1));
}

QTEST_GUILESS_MAIN(FileTaskStorageTest)
#include "FileTaskStorageTest.moc"
