#pragma once

#include <concepts>
#include <memory>
#include <utility>

namespace JsonBind {

namespace transformers {

// A type that decodes through another wire type.
template<class T>
concept ParseTransformer = requires (T& t, const typename T::wire_type& w) {
    typename T::wire_type;
    { t.transform_from(w) } -> std::convertible_to<bool>;
};

// A type that encodes through another wire type.
template<class T>
concept SerializeTransformer = requires (const T& t, typename T::wire_type& w) {
    typename T::wire_type;
    { t.transform_to(w) } -> std::convertible_to<bool>;
};

template<class T>
concept TransformerLike = ParseTransformer<T> || SerializeTransformer<T>;

template<
    class StoredT,
    class WireT,
    auto FromFn,   // bool(StoredT&, const WireT&)
    auto ToFn      // bool(const StoredT&, WireT&)
>
struct Transformed {
    using stored_type = StoredT;
    using wire_type   = WireT;

    StoredT value{};

    bool transform_from(const WireT& wire) {
        return FromFn(value, wire);
    }

    bool transform_to(WireT& wire) const {
        return ToFn(value, wire);
    }

    Transformed() = default;
    Transformed(const Transformed&) = default;
    Transformed(Transformed&&) = default;
    Transformed& operator=(const Transformed&) = default;
    Transformed& operator=(Transformed&&) = default;

    template<class U>
        requires std::convertible_to<U, StoredT>
    Transformed(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, StoredT>
    Transformed& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    operator StoredT&()             { return value; }
    operator const StoredT&() const { return value; }

    StoredT*       operator->()       { return std::addressof(value); }
    const StoredT* operator->() const { return std::addressof(value); }

    StoredT&       get()       { return value; }
    const StoredT& get() const { return value; }
};

template<class S, class W, auto F1, auto T1, auto F2, auto T2>
bool operator==(const Transformed<S, W, F1, T1>& lhs, const Transformed<S, W, F2, T2>& rhs) {
    return lhs.value == rhs.value;
}

} // namespace transformers

} // namespace JsonBind
