#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

namespace todostore {
namespace data {

struct TodoItem
{
    quint64 id = 0;
    QString name;
    QString description;
    bool completed = false;
};

// Unset fields leave the stored value untouched.
struct TodoPatch
{
    std::optional<QString> name;
    std::optional<QString> description;
    std::optional<bool> completed;

    bool isEmpty() const;
    void applyTo(TodoItem &todo) const;
};

inline bool operator==(const TodoItem &lhs, const TodoItem &rhs)
{
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.description == rhs.description
        && lhs.completed == rhs.completed;
}

inline bool operator!=(const TodoItem &lhs, const TodoItem &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace todostore
