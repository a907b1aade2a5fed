#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>
#include <limits>

#include "todostore/core/AppContext.hpp"
#include "todostore/core/StoreSettings.hpp"
#include "todostore/data/TodoRepository.hpp"

using namespace todostore;

class StoreSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void saveAndLoad();
    void invalidValuesFallBack();
    void largestFirstIdIsRejected();
    void contextUsesSettings();

private:
    QString settingsPath(const QTemporaryDir &dir) const;
};

QString StoreSettingsTest::settingsPath(const QTemporaryDir &dir) const
{
    return dir.filePath(QStringLiteral("todo-store.ini"));
}

void StoreSettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(settingsPath(dir), QSettings::IniFormat);

    const auto loaded = core::StoreSettings::load(settings);
    QCOMPARE(loaded.firstId, quint64(0));
    QCOMPARE(loaded.defaultPageSize, quint64(10));
}

void StoreSettingsTest::saveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    {
        QSettings settings(settingsPath(dir), QSettings::IniFormat);
        core::StoreSettings stored;
        stored.firstId = 1;
        stored.defaultPageSize = 25;
        stored.save(settings);
        settings.sync();
        QCOMPARE(settings.status(), QSettings::NoError);
    }

    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    const auto loaded = core::StoreSettings::load(settings);
    QCOMPARE(loaded.firstId, quint64(1));
    QCOMPARE(loaded.defaultPageSize, quint64(25));
}

void StoreSettingsTest::invalidValuesFallBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    settings.setValue(QStringLiteral("store/firstId"), QStringLiteral("not a number"));
    settings.setValue(QStringLiteral("store/defaultPageSize"), 0);

    const auto loaded = core::StoreSettings::load(settings);
    QCOMPARE(loaded.firstId, quint64(0));
    QCOMPARE(loaded.defaultPageSize, quint64(10));
}

void StoreSettingsTest::largestFirstIdIsRejected()
{
    const quint64 largest = std::numeric_limits<quint64>::max();
    QVERIFY(!core::StoreSettings::isValidFirstId(largest));
    QVERIFY(core::StoreSettings::isValidFirstId(largest - 1));

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    settings.setValue(QStringLiteral("store/firstId"), largest);

    const auto loaded = core::StoreSettings::load(settings);
    QCOMPARE(loaded.firstId, quint64(0));

    core::StoreSettings unchecked;
    unchecked.firstId = largest;
    core::AppContext context(unchecked);
    QCOMPARE(context.todoRepository().createTodo(QStringLiteral("a"), QString()).value(), quint64(0));
}

void StoreSettingsTest::contextUsesSettings()
{
    core::StoreSettings settings;
    settings.firstId = 1;
    settings.defaultPageSize = 2;
    core::AppContext context(settings);

    auto &repository = context.todoRepository();
    QCOMPARE(repository.createTodo(QStringLiteral("a"), QString()).value(), quint64(1));
    repository.createTodo(QStringLiteral("b"), QString());
    repository.createTodo(QStringLiteral("c"), QString());

    QCOMPARE(context.settings().defaultPageSize, quint64(2));
    QCOMPARE(repository.fetchPage(1, std::nullopt).size(), static_cast<size_t>(2));
    QCOMPARE(repository.fetchPage(2, std::nullopt).front().name, QStringLiteral("c"));
}

QTEST_GUILESS_MAIN(StoreSettingsTest)
#include "StoreSettingsTest.moc"
