#include "todostore/data/Todo.hpp"

namespace todostore {
namespace data {

bool TodoPatch::isEmpty() const
{
    return !name && !description && !completed;
}

void TodoPatch::applyTo(TodoItem &todo) const
{
    if (name) {
        todo.name = *name;
    }
    if (description) {
        todo.description = *description;
    }
    if (completed) {
        todo.completed = *completed;
    }
}

} // namespace data
} // namespace todostore
