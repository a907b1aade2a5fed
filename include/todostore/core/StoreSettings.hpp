#pragma once

#include <QtGlobal>

#include "todostore/data/TodoStore.hpp"

class QSettings;

namespace todostore {
namespace core {

struct StoreSettings
{
    static constexpr quint64 kDefaultPageSize = data::TodoStore::kDefaultPageSize;

    // The largest quint64 is reserved by the store and never accepted.
    static bool isValidFirstId(quint64 firstId);

    quint64 firstId = 0;
    quint64 defaultPageSize = kDefaultPageSize;

    static StoreSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace todostore
