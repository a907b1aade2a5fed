#pragma once

#include <memory>

#include "todostore/core/StoreSettings.hpp"

namespace todostore {
namespace data {
class TodoRepository;
class TodoStore;
}

namespace core {

class AppContext
{
public:
    explicit AppContext(const StoreSettings &settings = StoreSettings());
    ~AppContext();

    data::TodoRepository &todoRepository();
    const StoreSettings &settings() const;

private:
    StoreSettings m_settings;
    std::unique_ptr<data::TodoStore> m_store;
};

} // namespace core
} // namespace todostore
