#pragma once
#include <Corral/Containers/Concepts.hpp>
#include <Corral/Containers/Deque.hpp>
#include <Corral/Containers/HashMap.hpp>
#include <Corral/Containers/HashSet.hpp>
#include <Corral/Containers/HashTable.hpp>
#include <Corral/Containers/Iteration.hpp>
#include <Corral/Containers/NullTraits.hpp>
#include <Corral/Defines.hpp>
#include <Corral/Exceptions/ContainerExceptions.hpp>
#include <Corral/Exceptions/Exception.hpp>
#include <Corral/Memory/AllocatorConcept.hpp>
#include <Corral/Memory/StorageFor.hpp>
#include <Corral/Memory/SystemAllocator.hpp>
#include <Corral/Memory/TrackingAllocator.hpp>
#include <Corral/Primitives.hpp>
#include <Corral/Utilities/Expected.hpp>
#include <Corral/Utilities/Optional.hpp>
