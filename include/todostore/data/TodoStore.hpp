#pragma once

#include <QHash>
#include <QReadWriteLock>
#include <QVector>

#include "todostore/data/TodoRepository.hpp"

namespace todostore {
namespace data {

// In-memory todo table. Records and the creation-order index are kept in
// lockstep under one lock; ids are never reissued.
class TodoStore : public TodoRepository
{
public:
    static constexpr quint64 kDefaultPageSize = 10;

    // firstId must leave room for at least one id; the largest quint64 is
    // reserved so the counter can never wrap.
    explicit TodoStore(quint64 firstId = 0, quint64 defaultPageSize = kDefaultPageSize);
    ~TodoStore() override;

    TodoStore(const TodoStore &) = delete;
    TodoStore &operator=(const TodoStore &) = delete;

    Result<quint64> createTodo(const QString &name, const QString &description) override;
    Result<TodoItem> findById(quint64 id) const override;
    std::vector<TodoItem> fetchTodos(quint64 offset, std::optional<quint64> limit) const override;
    std::vector<TodoItem> fetchPage(quint64 page, std::optional<quint64> pageSize) const override;
    Result<bool> updateTodo(quint64 id, const TodoPatch &patch) override;
    Result<bool> removeTodo(quint64 id) override;
    int count() const override;

    quint64 nextId() const;

private:
    std::vector<TodoItem> sliceLocked(quint64 offset, std::optional<quint64> limit) const;

    mutable QReadWriteLock m_lock;
    QHash<quint64, TodoItem> m_records;
    QVector<quint64> m_order;
    quint64 m_nextId = 0;
    quint64 m_defaultPageSize = kDefaultPageSize;
};

} // namespace data
} // namespace todostore
