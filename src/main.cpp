#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "todostore/core/AppContext.hpp"
#include "todostore/core/Logging.hpp"
#include "todostore/core/StoreSettings.hpp"
#include "todostore/shell/CommandShell.hpp"

namespace {

bool applyNumberOption(const QCommandLineParser &parser, const QCommandLineOption &option, quint64 &target)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const quint64 value = parser.value(option).toULongLong(&ok);
    if (!ok) {
        return false;
    }
    target = value;
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("todo-store"));
    QCoreApplication::setApplicationName(QStringLiteral("todo-shell"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoStoreVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Interactive shell over an in-memory todo store"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption firstIdOption(QStringLiteral("first-id"),
                                           QObject::tr("First id the store issues."),
                                           QStringLiteral("n"));
    const QCommandLineOption pageSizeOption(QStringLiteral("page-size"),
                                            QObject::tr("Default page size for the page command."),
                                            QStringLiteral("n"));
    parser.addOption(firstIdOption);
    parser.addOption(pageSizeOption);
    parser.process(app);

    QSettings settings;
    auto storeSettings = todostore::core::StoreSettings::load(settings);
    if (!applyNumberOption(parser, firstIdOption, storeSettings.firstId)
        || !todostore::core::StoreSettings::isValidFirstId(storeSettings.firstId)) {
        qCCritical(todostore::core::lcShell) << "Invalid --first-id" << parser.value(firstIdOption);
        return 1;
    }
    if (!applyNumberOption(parser, pageSizeOption, storeSettings.defaultPageSize)
        || storeSettings.defaultPageSize == 0) {
        qCCritical(todostore::core::lcShell) << "Invalid --page-size" << parser.value(pageSizeOption);
        return 1;
    }

    todostore::core::AppContext context(storeSettings);
    todostore::shell::CommandShell shell(context.todoRepository());

    QTextStream in(stdin);
    QTextStream out(stdout);
    QString line;
    while (in.readLineInto(&line)) {
        const QString trimmed = line.trimmed();
        if (trimmed == QLatin1String("quit") || trimmed == QLatin1String("exit")) {
            break;
        }
        const QString response = shell.execute(trimmed);
        if (!response.isEmpty()) {
            out << response << '\n';
            out.flush();
        }
    }

    return 0;
}
