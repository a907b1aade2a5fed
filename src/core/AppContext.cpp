#include "todostore/core/AppContext.hpp"

#include "todostore/data/TodoStore.hpp"

namespace todostore {
namespace core {

AppContext::AppContext(const StoreSettings &settings)
    : m_settings(settings)
    , m_store(std::make_unique<data::TodoStore>(m_settings.firstId, m_settings.defaultPageSize))
{
}

AppContext::~AppContext() = default;

data::TodoRepository &AppContext::todoRepository()
{
    return *m_store;
}

const StoreSettings &AppContext::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace todostore
