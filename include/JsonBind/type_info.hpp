#pragma once

#include <cstdlib>
#include <cxxabi.h>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace JsonBind {

struct Descriptor;

namespace detail {

inline std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void(*)(void*)> res{
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free};
    return (status == 0 && res) ? std::string(res.get()) : std::string(mangled);
}

} // namespace detail

// One per C++ type, created on first use by type_id<T>().
struct TypeInfo {
    std::type_index index;
    std::string name;             // demangled, fully qualified
    Descriptor (*describe)();     // one-level structural description
};

// Cheap comparable handle; equality and hashing follow std::type_index so
// handles taken in different shared objects still agree.
class TypeId {
public:
    TypeId() = default;
    explicit TypeId(const TypeInfo* info): m_info(info) {}

    bool valid() const { return m_info != nullptr; }
    const TypeInfo& info() const { return *m_info; }
    const std::string& name() const { return m_info->name; }
    std::type_index index() const { return m_info->index; }

    friend bool operator==(const TypeId& a, const TypeId& b) {
        if (a.m_info == b.m_info) return true;
        if (!a.m_info || !b.m_info) return false;
        return a.m_info->index == b.m_info->index;
    }

private:
    const TypeInfo* m_info = nullptr;
};

template<class T>
TypeId type_id();

template<class T>
const std::string& type_name() {
    return type_id<T>().name();
}

} // namespace JsonBind

template<>
struct std::hash<JsonBind::TypeId> {
    std::size_t operator()(const JsonBind::TypeId& t) const noexcept {
        return t.valid() ? std::hash<std::type_index>{}(t.index()) : 0;
    }
};
