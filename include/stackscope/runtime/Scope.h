/***
 * Name: stackscope::rt scope controller
 * Purpose: Bind a Context to the dynamic extent of a call and look it up from anywhere inside it.
 * Inputs: The value to bind and the continuation to run.
 * Outputs: The continuation's result; lookups return the innermost binding.
 * Theory of Operation:
 *   bind_scope draws a fresh identifier, records identifier -> value in the
 *   process-wide BindingStore, and runs the continuation under encode_start.
 *   The store entry is erased on every exit path, including exceptions.
 *   lookup_context decodes the identifier from the calling thread's stack and
 *   loads it from the store. Bindings do not follow work handed to other
 *   threads: a new thread starts with no enclosing scope.
 */
#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "stackscope/runtime/Context.h"
#include "stackscope/runtime/Relay.h"

namespace stackscope::rt {
    void bind_scope(ContextPtr value, const Continuation &fn);

    // Found with the bound value (which may itself be null), or std::nullopt.
    std::optional<ContextPtr> lookup_context();

    // nullptr when no scope encloses the caller.
    ContextPtr get_context();

    // bind_scope for any callable, forwarding its return value.
    template <typename Fn>
    auto with_context(ContextPtr value, Fn &&fn) -> std::invoke_result_t<Fn &> {
        using Result = std::invoke_result_t<Fn &>;
        if constexpr (std::is_void_v<Result>) {
            bind_scope(std::move(value), Continuation{[&fn]() { std::invoke(fn); }});
        } else {
            static_assert(!std::is_reference_v<Result>, "with_context: continuation must return by value");
            std::optional<Result> result;
            bind_scope(std::move(value), Continuation{[&fn, &result]() { result.emplace(std::invoke(fn)); }});
            return std::move(*result);
        }
    }
} // namespace stackscope::rt
