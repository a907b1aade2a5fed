#include "todostore/data/TodoStore.hpp"

#include <QReadLocker>
#include <QWriteLocker>
#include <algorithm>
#include <limits>

#include "todostore/data/Logging.hpp"

namespace todostore {
namespace data {

TodoStore::TodoStore(quint64 firstId, quint64 defaultPageSize)
    : m_nextId(firstId)
    , m_defaultPageSize(defaultPageSize > 0 ? defaultPageSize : kDefaultPageSize)
{
    if (m_nextId == std::numeric_limits<quint64>::max()) {
        qCWarning(lcStore) << "First id" << firstId << "leaves no ids to assign, starting at 0";
        m_nextId = 0;
    }
}

TodoStore::~TodoStore() = default;

Result<quint64> TodoStore::createTodo(const QString &name, const QString &description)
{
    QWriteLocker locker(&m_lock);

    // The largest quint64 is never issued, so m_nextId stays above every id.
    if (m_nextId == std::numeric_limits<quint64>::max()) {
        qCWarning(lcStore) << "Id space exhausted at" << m_nextId;
        return Result<quint64>::fail(TodoError::idSpaceExhausted(m_nextId));
    }

    TodoItem todo;
    todo.id = m_nextId++;
    todo.name = name;
    todo.description = description;
    todo.completed = false;

    m_records.insert(todo.id, todo);
    m_order.append(todo.id);

    qCDebug(lcStore) << "Created todo" << todo.id;
    return Result<quint64>::ok(todo.id);
}

Result<TodoItem> TodoStore::findById(quint64 id) const
{
    QReadLocker locker(&m_lock);

    const auto it = m_records.constFind(id);
    if (it == m_records.constEnd()) {
        qCDebug(lcStore) << "Lookup of missing todo" << id;
        return Result<TodoItem>::fail(TodoError::notFound(id));
    }
    return Result<TodoItem>::ok(it.value());
}

std::vector<TodoItem> TodoStore::fetchTodos(quint64 offset, std::optional<quint64> limit) const
{
    QReadLocker locker(&m_lock);
    return sliceLocked(offset, limit);
}

std::vector<TodoItem> TodoStore::fetchPage(quint64 page, std::optional<quint64> pageSize) const
{
    const quint64 size = pageSize.value_or(m_defaultPageSize);
    if (size == 0) {
        return {};
    }
    // Pages are 1-based; page 0 reads the first page.
    const quint64 index = page > 0 ? page - 1 : 0;
    if (index > std::numeric_limits<quint64>::max() / size) {
        return {};
    }

    QReadLocker locker(&m_lock);
    return sliceLocked(index * size, size);
}

Result<bool> TodoStore::updateTodo(quint64 id, const TodoPatch &patch)
{
    QWriteLocker locker(&m_lock);

    auto it = m_records.find(id);
    if (it == m_records.end()) {
        qCWarning(lcStore) << "Update of missing todo" << id;
        return Result<bool>::fail(TodoError::notFound(id));
    }

    TodoItem updated = it.value();
    patch.applyTo(updated);
    it.value() = std::move(updated);

    qCInfo(lcStore) << "Updated todo" << id;
    return Result<bool>::ok(true);
}

Result<bool> TodoStore::removeTodo(quint64 id)
{
    QWriteLocker locker(&m_lock);

    if (m_records.remove(id) == 0) {
        qCWarning(lcStore) << "Removal of missing todo" << id;
        return Result<bool>::fail(TodoError::notFound(id));
    }
    const auto pos = std::find(m_order.begin(), m_order.end(), id);
    if (pos != m_order.end()) {
        m_order.erase(pos);
    }

    qCInfo(lcStore) << "Removed todo" << id;
    return Result<bool>::ok(true);
}

int TodoStore::count() const
{
    QReadLocker locker(&m_lock);
    return m_records.size();
}

quint64 TodoStore::nextId() const
{
    QReadLocker locker(&m_lock);
    return m_nextId;
}

std::vector<TodoItem> TodoStore::sliceLocked(quint64 offset, std::optional<quint64> limit) const
{
    std::vector<TodoItem> todos;
    const auto total = static_cast<quint64>(m_order.size());
    if (offset >= total) {
        return todos;
    }
    const quint64 remaining = total - offset;
    const quint64 take = limit ? std::min(*limit, remaining) : remaining;

    todos.reserve(static_cast<size_t>(take));
    const auto first = static_cast<int>(offset);
    const auto last = static_cast<int>(offset + take);
    for (int i = first; i < last; ++i) {
        todos.push_back(m_records.value(m_order.at(i)));
    }
    return todos;
}

} // namespace data
} // namespace todostore
