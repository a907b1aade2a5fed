#pragma once

#include <QString>
#include <QtGlobal>

namespace todostore {
namespace data {

class TodoError
{
public:
    enum class Kind
    {
        NotFound,
        IdSpaceExhausted,
    };

    static TodoError notFound(quint64 id);
    static TodoError idSpaceExhausted(quint64 nextId);

    Kind kind() const;
    quint64 id() const;
    QString message() const;

private:
    TodoError(Kind kind, quint64 id);

    Kind m_kind;
    quint64 m_id;
};

} // namespace data
} // namespace todostore
