#pragma once

#include <memory>
#include <utility>
#include <cardview/result.hpp>

namespace cardview {
namespace base {

// ObjectFactory - single entry point for creating shared_ptr objects
//
// A header declares the interface type (e.g. TransportClient) deriving from
// ObjectFactory<TransportClient>. The cpp defines a private Impl subclass with
// init(), and createImpl(Args...) builds the Impl, runs init() and returns it.
// Callers only ever use T::create(args...).
template<typename T>
class ObjectFactory {
public:
    using Ptr = std::shared_ptr<T>;

    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        static_assert(requires { T::createImpl(std::declval<Args>()...); },
                      "ObjectFactory: T must declare static Result<Ptr> createImpl(Args...)");
        return T::createImpl(std::forward<Args>(args)...);
    }
};

} // namespace base
} // namespace cardview
