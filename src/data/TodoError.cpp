#include "todostore/data/TodoError.hpp"

namespace todostore {
namespace data {

TodoError::TodoError(Kind kind, quint64 id)
    : m_kind(kind)
    , m_id(id)
{
}

TodoError TodoError::notFound(quint64 id)
{
    return TodoError(Kind::NotFound, id);
}

TodoError TodoError::idSpaceExhausted(quint64 nextId)
{
    return TodoError(Kind::IdSpaceExhausted, nextId);
}

TodoError::Kind TodoError::kind() const
{
    return m_kind;
}

quint64 TodoError::id() const
{
    return m_id;
}

QString TodoError::message() const
{
    switch (m_kind) {
    case Kind::NotFound:
        return QStringLiteral("Todo %1 not found").arg(m_id);
    case Kind::IdSpaceExhausted:
        return QStringLiteral("No todo ids left to assign after %1").arg(m_id);
    }
    return QString();
}

} // namespace data
} // namespace todostore
