#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <functional>

namespace todostore {
namespace data {
class TodoRepository;
struct TodoItem;
}

namespace shell {

class CommandShell
{
public:
    explicit CommandShell(data::TodoRepository &repository);

    CommandShell(const CommandShell &) = delete;
    CommandShell &operator=(const CommandShell &) = delete;

    // Runs a single command line and returns the response text.
    QString execute(const QString &line);

    bool isReadOnly(const QString &command) const;
    QStringList commands() const;

    static QString formatTodo(const data::TodoItem &todo);

private:
    struct Command
    {
        QString usage;
        bool readOnly = true;
        std::function<QString(const QStringList &)> handler;
    };

    QString create(const QStringList &args);
    QString get(const QStringList &args);
    QString list(const QStringList &args);
    QString page(const QStringList &args);
    QString update(const QStringList &args);
    QString remove(const QStringList &args);
    QString help(const QStringList &args);

    QString usageError(const QString &command) const;

    data::TodoRepository &m_repository;
    QHash<QString, Command> m_commands;
};

} // namespace shell
} // namespace todostore
