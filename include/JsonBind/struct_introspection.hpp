#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <pfr.hpp>

namespace JsonBind {

namespace introspection {

template<class T>
concept Aggregate = std::is_class_v<T> && std::is_aggregate_v<T>;

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    return (pfr::get<Index>(s));
}

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
    return (pfr::get<Index>(s));
}

template<class StructT>
static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = pfr::tuple_element_t<Index, std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, std::remove_cv_t<StructT>>();

} // namespace introspection

} // namespace JsonBind
