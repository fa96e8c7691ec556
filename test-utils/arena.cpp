#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <type_traits>

#include "../src/memory/arena.hpp"

struct Tracker
{
    static inline int live_count = 0;
    int id;
    std::string payload;

    Tracker(int id) : id(id), payload(std::string(64, 'x'))
    {
        ++live_count;
        std::cout << "Tracker(" << id << ") constructed\n";
    }

    ~Tracker()
    {
        --live_count;
        std::cout << "Tracker(" << id << ") destroyed\n";
    }
};

struct alignas(32) Wide
{
    char bytes[40];
};

// ------------------------------
// Test cases
// ------------------------------

void test_create_and_destroy()
{
    std::cout << "\n--- test_create_and_destroy ---\n";
    {
        lox::mem::Arena arena;
        Tracker *a = arena.create<Tracker>(1);
        Tracker *b = lox::mem::Arena::alloc<Tracker>(arena, 2);
        assert(a->id == 1);
        assert(b->id == 2);
        assert(Tracker::live_count == 2);
        assert(arena.live_objects() == 2);
    }
    assert(Tracker::live_count == 0);  // destroyed with the arena
}

void test_trivial_types_are_not_tracked()
{
    std::cout << "\n--- test_trivial_types_are_not_tracked ---\n";
    lox::mem::Arena arena;
    int *n = arena.create<int>(42);
    double *d = lox::mem::Arena::alloc(arena, 2.5);
    assert(*n == 42);
    assert(*d == 2.5);
    assert(arena.live_objects() == 0);
}

void test_alignment()
{
    std::cout << "\n--- test_alignment ---\n";
    lox::mem::Arena arena;
    arena.create<char>('a');
    for (int i = 0; i < 200; ++i)
    {
        Wide *w = arena.create<Wide>();
        assert(reinterpret_cast<std::uintptr_t>(w) % alignof(Wide) == 0);
        arena.create<char>('b');
    }
}

void test_large_allocation_gets_own_block()
{
    std::cout << "\n--- test_large_allocation_gets_own_block ---\n";
    lox::mem::Arena arena;
    char *big = arena.allocate<char>(64 * 1024);
    big[0] = 'a';
    big[64 * 1024 - 1] = 'z';
    int *after = arena.create<int>(7);
    assert(*after == 7);
    assert(big[0] == 'a' && big[64 * 1024 - 1] == 'z');
}

void test_reset()
{
    std::cout << "\n--- test_reset ---\n";
    lox::mem::Arena arena;
    arena.create<Tracker>(3);
    arena.create<Tracker>(4);
    assert(Tracker::live_count == 2);

    arena.reset();
    assert(Tracker::live_count == 0);
    assert(arena.live_objects() == 0);

    Tracker *again = arena.create<Tracker>(5);
    assert(again->id == 5);
    assert(Tracker::live_count == 1);
}

void test_not_copyable_or_movable()
{
    std::cout << "\n--- test_not_copyable_or_movable ---\n";
    // Nodes point into the arena's blocks, so an arena never changes hands.
    static_assert(!std::is_copy_constructible_v<lox::mem::Arena>);
    static_assert(!std::is_copy_assignable_v<lox::mem::Arena>);
    static_assert(!std::is_move_constructible_v<lox::mem::Arena>);
    static_assert(!std::is_move_assignable_v<lox::mem::Arena>);
}

int main()
{
    test_create_and_destroy();
    test_trivial_types_are_not_tracked();
    test_alignment();
    test_large_allocation_gets_own_block();
    test_reset();
    test_not_copyable_or_movable();

    std::cout << "\nAll tests passed!\n";
}
