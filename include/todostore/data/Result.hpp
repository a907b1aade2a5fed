#pragma once

#include <cstddef>
#include <utility>
#include <variant>

#include "todostore/data/TodoError.hpp"

namespace todostore {
namespace data {

template<typename T>
class Result
{
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result fail(TodoError error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isOk() const { return m_storage.index() == 0; }
    explicit operator bool() const { return isOk(); }

    // Both accessors throw std::bad_variant_access on the wrong alternative.
    const T &value() const { return std::get<0>(m_storage); }
    T &value() { return std::get<0>(m_storage); }
    const TodoError &error() const { return std::get<1>(m_storage); }

private:
    template<std::size_t Index, typename Arg>
    Result(std::in_place_index_t<Index> tag, Arg &&arg)
        : m_storage(tag, std::forward<Arg>(arg))
    {
    }

    std::variant<T, TodoError> m_storage;
};

} // namespace data
} // namespace todostore
