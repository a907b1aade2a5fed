#pragma once

#include <optional>
#include <vector>

#include "todostore/data/Result.hpp"
#include "todostore/data/Todo.hpp"

namespace todostore {
namespace data {

class TodoRepository
{
public:
    virtual ~TodoRepository() = default;

    virtual Result<quint64> createTodo(const QString &name, const QString &description) = 0;
    virtual Result<TodoItem> findById(quint64 id) const = 0;
    // offset indexes creation order, not ids. An absent limit reads to the end.
    virtual std::vector<TodoItem> fetchTodos(quint64 offset, std::optional<quint64> limit) const = 0;
    virtual std::vector<TodoItem> fetchPage(quint64 page, std::optional<quint64> pageSize) const = 0;
    virtual Result<bool> updateTodo(quint64 id, const TodoPatch &patch) = 0;
    virtual Result<bool> removeTodo(quint64 id) = 0;
    virtual int count() const = 0;
};

} // namespace data
} // namespace todostore
