#pragma once

#include <memory>
#include <type_traits>
#include <utility>

namespace labelkit {
namespace base {

// ObjectFactory - enforces the create pattern for shared_ptr objects.
// Subclass implements: static Result<Ptr> createImpl(Args...)
template<typename T>
class ObjectFactory {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

private:
    template<typename FType, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename U>
        static auto check(int) -> decltype(U::createImpl(std::declval<Args>()...), std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value = std::is_same_v<decltype(check<FType>(0)), std::true_type>;
    };

public:
    template<typename... Args>
    static auto create(Args&&... args) {
        static_assert(HasCreateImpl<T, Args...>::value,
            "ObjectFactory requires static createImpl(...) matching the create() arguments");
        return T::createImpl(std::forward<Args>(args)...);
    }
};

} // namespace base
} // namespace labelkit
