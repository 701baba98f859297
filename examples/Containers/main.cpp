// main.cpp
#include <iostream>
#include <string>

#include <Corral/Corral.hpp>

using namespace Corral::Containers;
using Corral::Utilities::Optional;

// Word counts with the compute family
void CountWords()
{
    HashMap<std::string, int> counts;
    for (const char* word: {"deque", "map", "set", "map", "deque", "map"})
        counts.Merge(word, 1, [](const int& existing, const int& one) { return Optional<int> {existing + one}; });

    std::cout << "[CountWords] " << counts.Size() << " distinct words\n";
    counts.ForEach([](const std::string& word, const int& count) {
        std::cout << "  " << word << " = " << count << "\n";
    });

    counts.Compute("set", [](const std::string&, const int*) { return Optional<int> {}; });
    std::cout << "[CountWords] after dropping 'set': " << counts.Size() << " words\n";
}

// A cursor that notices a foreign removal, then a fresh one that finishes the walk
void FailFastIteration()
{
    HashMap<std::string, int> map {{"a", 1}, {"b", 2}, {"c", 3}};

    auto cursor = map.Keys().Iterate();
    auto first  = cursor.Next();
    if (!first || !first.Value())
        return;
    std::cout << "[FailFast] first key: " << *first.Value() << "\n";

    map.Remove(*first.Value() == "c" ? "a" : "c");
    auto next = cursor.Next();
    if (!next)
        std::cout << "[FailFast] cursor reports " << ToString(next.Error()) << "\n";

    int remaining = 0;
    for (const std::string& key: map.Keys())
    {
        std::cout << "  fresh cursor sees " << key << "\n";
        ++remaining;
    }
    std::cout << "[FailFast] " << remaining << " keys remain\n";
}

// Queue and stack usage, plus a bounded buffer that saturates
void Queues()
{
    Deque<int> queue;
    for (int i = 1; i <= 3; ++i)
        queue.PushBack(i);
    std::cout << "[Queues] FIFO:";
    while (auto value = queue.TryPopFront())
        std::cout << " " << value.Value();
    std::cout << "\n";

    Deque<int> stack;
    for (int i = 1; i <= 3; ++i)
        stack.PushFront(i);
    std::cout << "[Queues] LIFO:";
    while (!stack.IsEmpty())
        std::cout << " " << stack.PopFront();
    std::cout << "\n";

    Deque<int> bounded {DequeOptions {.initialCapacity = 2, .capacity = DequeCapacity::Bounded}};
    for (int i = 1; i <= 3; ++i)
        std::cout << "[Queues] bounded TryPushBack(" << i << ") = " << std::boolalpha << bounded.TryPushBack(i) << "\n";

    Deque<const char*> names;
    try
    {
        names.PushBack(nullptr);
    }
    catch (const Corral::Exceptions::InvalidElementException& e)
    {
        std::cout << "[Queues] rejected: " << e.GetMessage() << "\n";
    }
}

void Sets()
{
    HashSet<std::string> seen;
    for (const char* name: {"alpha", "beta", "alpha", "gamma"})
    {
        if (!seen.Add(name))
            std::cout << "[Sets] duplicate " << name << "\n";
    }
    const auto removed = seen.RemoveIf([](const std::string& name) { return name.front() == 'g'; });
    std::cout << "[Sets] removed " << removed << ", " << seen.Size() << " left\n";
}

int main()
{
    CountWords();
    FailFastIteration();
    Queues();
    Sets();
    return 0;
}
