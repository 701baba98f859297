/// @file Concepts.hpp
/// @brief Capability concepts satisfied by the Corral containers.
#pragma once

#include <Corral/Containers/Iteration.hpp>
#include <Corral/Primitives.hpp>

#include <concepts>

namespace Corral::Containers
{
    template<typename C>
    concept SizedContainerConcept = requires(const C container) {
        { container.Size() } -> std::convertible_to<UIntSize>;
        { container.IsEmpty() } -> std::convertible_to<bool>;
        { container.GetGeneration() } -> std::same_as<Generation>;
    };

    /// @brief Keyed lookup/removal with optional-returning reads.
    template<typename C>
    concept AssociativeContainerConcept =
            SizedContainerConcept<C> && requires(C container, const typename C::key_type& key) {
                { container.Contains(key) } -> std::convertible_to<bool>;
                container.Remove(key);
                container.Clear();
            };

    /// @brief Push/pop/peek at both ends, each in a throwing and a sentinel form.
    template<typename C>
    concept DoubleEndedSequenceConcept =
            SizedContainerConcept<C> && requires(C container, const typename C::value_type& value) {
                container.PushFront(value);
                container.PushBack(value);
                { container.TryPushFront(value) } -> std::convertible_to<bool>;
                { container.TryPushBack(value) } -> std::convertible_to<bool>;
                container.PopFront();
                container.PopBack();
                container.TryPopFront();
                container.TryPopBack();
                container.PeekFront();
                container.PeekBack();
                container.TryPeekFront();
                container.TryPeekBack();
                { container.IsFull() } -> std::convertible_to<bool>;
            };
}// namespace Corral::Containers
