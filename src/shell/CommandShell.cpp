#include "todostore/shell/CommandShell.hpp"

#include <QProcess>
#include <algorithm>
#include <optional>

#include "todostore/core/Logging.hpp"
#include "todostore/data/TodoRepository.hpp"

namespace todostore {
namespace shell {

namespace {

std::optional<quint64> parseNumber(const QString &text)
{
    bool ok = false;
    const quint64 value = text.toULongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBool(const QString &text)
{
    const QString lowered = text.toLower();
    if (lowered == QLatin1String("true") || lowered == QLatin1String("yes") || lowered == QLatin1String("1")) {
        return true;
    }
    if (lowered == QLatin1String("false") || lowered == QLatin1String("no") || lowered == QLatin1String("0")) {
        return false;
    }
    return std::nullopt;
}

QString errorLine(const QString &message)
{
    return QStringLiteral("error: %1").arg(message);
}

QString formatList(const std::vector<data::TodoItem> &todos)
{
    if (todos.empty()) {
        return QStringLiteral("(empty)");
    }
    QStringList lines;
    lines.reserve(static_cast<int>(todos.size()));
    for (const auto &todo : todos) {
        lines << CommandShell::formatTodo(todo);
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace

CommandShell::CommandShell(data::TodoRepository &repository)
    : m_repository(repository)
{
    m_commands.insert(QStringLiteral("create"),
                      { QStringLiteral("create <name> <description>"), false,
                        [this](const QStringList &args) { return create(args); } });
    m_commands.insert(QStringLiteral("get"),
                      { QStringLiteral("get <id>"), true, [this](const QStringList &args) { return get(args); } });
    m_commands.insert(QStringLiteral("list"),
                      { QStringLiteral("list [offset] [limit]"), true,
                        [this](const QStringList &args) { return list(args); } });
    m_commands.insert(QStringLiteral("page"),
                      { QStringLiteral("page [page] [size]"), true,
                        [this](const QStringList &args) { return page(args); } });
    m_commands.insert(QStringLiteral("update"),
                      { QStringLiteral("update <id> [name=<text>] [description=<text>] [completed=true|false]"),
                        false, [this](const QStringList &args) { return update(args); } });
    m_commands.insert(QStringLiteral("delete"),
                      { QStringLiteral("delete <id>"), false,
                        [this](const QStringList &args) { return remove(args); } });
    m_commands.insert(QStringLiteral("help"),
                      { QStringLiteral("help"), true, [this](const QStringList &args) { return help(args); } });
}

QString CommandShell::execute(const QString &line)
{
    QStringList args = QProcess::splitCommand(line);
    if (args.isEmpty()) {
        return QString();
    }
    const QString name = args.takeFirst().toLower();
    const auto it = m_commands.constFind(name);
    if (it == m_commands.constEnd()) {
        return errorLine(QStringLiteral("unknown command '%1', try 'help'").arg(name));
    }
    if (!it->readOnly) {
        qCInfo(core::lcShell) << "Executing" << name << args;
    } else {
        qCDebug(core::lcShell) << "Executing" << name << args;
    }
    return it->handler(args);
}

bool CommandShell::isReadOnly(const QString &command) const
{
    const auto it = m_commands.constFind(command);
    return it != m_commands.constEnd() && it->readOnly;
}

QStringList CommandShell::commands() const
{
    QStringList names = m_commands.keys();
    std::sort(names.begin(), names.end());
    return names;
}

QString CommandShell::formatTodo(const data::TodoItem &todo)
{
    return QStringLiteral("#%1 [%2] %3: %4")
        .arg(todo.id)
        .arg(todo.completed ? QChar('x') : QChar(' '))
        .arg(todo.name, todo.description);
}

QString CommandShell::create(const QStringList &args)
{
    if (args.size() != 2) {
        return usageError(QStringLiteral("create"));
    }
    const auto result = m_repository.createTodo(args.at(0), args.at(1));
    if (!result) {
        return errorLine(result.error().message());
    }
    return QStringLiteral("created %1").arg(result.value());
}

QString CommandShell::get(const QStringList &args)
{
    const auto id = args.size() == 1 ? parseNumber(args.at(0)) : std::nullopt;
    if (!id) {
        return usageError(QStringLiteral("get"));
    }
    const auto result = m_repository.findById(*id);
    if (!result) {
        return errorLine(result.error().message());
    }
    return formatTodo(result.value());
}

QString CommandShell::list(const QStringList &args)
{
    if (args.size() > 2) {
        return usageError(QStringLiteral("list"));
    }
    quint64 offset = 0;
    std::optional<quint64> limit;
    if (!args.isEmpty()) {
        const auto parsed = parseNumber(args.at(0));
        if (!parsed) {
            return usageError(QStringLiteral("list"));
        }
        offset = *parsed;
    }
    if (args.size() == 2) {
        limit = parseNumber(args.at(1));
        if (!limit) {
            return usageError(QStringLiteral("list"));
        }
    }
    return formatList(m_repository.fetchTodos(offset, limit));
}

QString CommandShell::page(const QStringList &args)
{
    if (args.size() > 2) {
        return usageError(QStringLiteral("page"));
    }
    quint64 pageNumber = 1;
    std::optional<quint64> size;
    if (!args.isEmpty()) {
        const auto parsed = parseNumber(args.at(0));
        if (!parsed) {
            return usageError(QStringLiteral("page"));
        }
        pageNumber = *parsed;
    }
    if (args.size() == 2) {
        size = parseNumber(args.at(1));
        if (!size) {
            return usageError(QStringLiteral("page"));
        }
    }
    return formatList(m_repository.fetchPage(pageNumber, size));
}

QString CommandShell::update(const QStringList &args)
{
    const auto id = args.isEmpty() ? std::nullopt : parseNumber(args.at(0));
    if (!id) {
        return usageError(QStringLiteral("update"));
    }

    data::TodoPatch patch;
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        const int separator = arg.indexOf(QLatin1Char('='));
        if (separator <= 0) {
            return usageError(QStringLiteral("update"));
        }
        const QString field = arg.left(separator);
        const QString value = arg.mid(separator + 1);
        if (field == QLatin1String("name")) {
            patch.name = value;
        } else if (field == QLatin1String("description")) {
            patch.description = value;
        } else if (field == QLatin1String("completed")) {
            patch.completed = parseBool(value);
            if (!patch.completed) {
                return errorLine(QStringLiteral("completed expects true or false, got '%1'").arg(value));
            }
        } else {
            return errorLine(QStringLiteral("unknown field '%1'").arg(field));
        }
    }

    // An empty patch still goes through the store so unknown ids are reported.
    const auto result = m_repository.updateTodo(*id, patch);
    if (!result) {
        return errorLine(result.error().message());
    }
    if (patch.isEmpty()) {
        return QStringLiteral("unchanged %1").arg(*id);
    }
    return QStringLiteral("updated %1").arg(*id);
}

QString CommandShell::remove(const QStringList &args)
{
    const auto id = args.size() == 1 ? parseNumber(args.at(0)) : std::nullopt;
    if (!id) {
        return usageError(QStringLiteral("delete"));
    }
    const auto result = m_repository.removeTodo(*id);
    if (!result) {
        return errorLine(result.error().message());
    }
    return QStringLiteral("deleted %1").arg(*id);
}

QString CommandShell::help(const QStringList &)
{
    QStringList lines;
    for (const QString &name : commands()) {
        lines << m_commands.value(name).usage;
    }
    return lines.join(QLatin1Char('\n'));
}

QString CommandShell::usageError(const QString &command) const
{
    return errorLine(QStringLiteral("usage: %1").arg(m_commands.value(command).usage));
}

} // namespace shell
} // namespace todostore
