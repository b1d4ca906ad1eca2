#pragma once
#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include "../runtime/coro/task.h"
#include "run_to_completion.h"

namespace tether {
    namespace details {
        template<class M>
        struct async_method_traits : std::false_type {};

        template<class C, class R, class... Args>
        struct async_method_traits<task<R> (C::*)(Args...)> : std::true_type {
            using class_type = C;
            using value_type = R;
        };

        template<class C, class R, class... Args>
        struct async_method_traits<task<R> (C::*)(Args...) const> : std::true_type {
            using class_type = C;
            using value_type = R;
        };

        template<class C, class R, class... Args>
        struct async_method_traits<task<R> (C::*)(Args...) noexcept> : std::true_type {
            using class_type = C;
            using value_type = R;
        };

        template<class C, class R, class... Args>
        struct async_method_traits<task<R> (C::*)(Args...) const noexcept> : std::true_type {
            using class_type = C;
            using value_type = R;
        };
    }

    // A non-static member function that produces a task.
    template<auto Method>
    concept async_instance_method = details::async_method_traits<decltype(Method)>::value;

    /**
    * @brief Blocking twin of the scheduled member function @p Method.
    *
    * Calling the twin with an object and arguments invokes Method on them and runs the resulting
    * task through run_to_completion, so it returns what awaiting Method would produce, or throws
    * what awaiting it would throw. Method itself is unaffected.
    *
    * @code
    * struct counter {
    *     task<int> next_async(int x);
    *     TETHER_SYNC_TWIN(next, next_async)
    * };
    *
    * counter c;
    * int n = c.next(41);
    * @endcode
    */
    template<auto Method>
    requires async_instance_method<Method>
    struct sync_twin {
        using class_type = typename details::async_method_traits<decltype(Method)>::class_type;
        using value_type = typename details::async_method_traits<decltype(Method)>::value_type;

        template<class Self, class... Args>
        requires std::derived_from<std::remove_cvref_t<Self>, class_type>
                 && std::invocable<decltype(Method), Self&, Args...>
        value_type operator()(Self& self, Args&&... args) const {
            return run_to_completion(std::invoke(Method, self, std::forward<Args>(args)...));
        }
    };
}

/**
* Declares, inside a class body, the blocking member @p twin for the scheduled member @p async.
* @p async must not be overloaded. A class declaring the same twin name twice fails to compile;
* a derived class declaring it again hides the base class twin.
*/
#define TETHER_SYNC_TWIN(twin, async)                                                                  \
    template<class... TetherArgs>                                                                      \
    auto twin(TetherArgs&&... tetherArgs) {                                                            \
        using tether_self_type = std::remove_cvref_t<decltype(*this)>;                                 \
        return ::tether::sync_twin<&tether_self_type::async>{}(*this, std::forward<TetherArgs>(tetherArgs)...); \
    }                                                                                                  \
    template<class... TetherArgs>                                                                      \
    auto twin(TetherArgs&&... tetherArgs) const {                                                      \
        using tether_self_type = std::remove_cvref_t<decltype(*this)>;                                 \
        return ::tether::sync_twin<&tether_self_type::async>{}(*this, std::forward<TetherArgs>(tetherArgs)...); \
    }
