#ifndef ARENA_HPP_
#define ARENA_HPP_
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

namespace lox::mem
{
/**
 * @brief Bump allocator for AST nodes.
 *
 * Nodes are placement-constructed into large blocks and live until the arena
 * is destroyed or reset. Objects that are not trivially destructible are
 * remembered so their destructors run (newest first) before the blocks go.
 */
class Arena
{
    static constexpr std::size_t DEF_BLOCK_SIZE = 6 * 1024;

    struct _block
    {
        char *data;
        std::size_t size;
        std::size_t capacity;

        _block(std::size_t sz) : size(0), capacity(sz) { data = new char[sz]; }

        ~_block() { delete[] data; }
    };

    struct _dtor
    {
        void *object;
        void (*destroy)(void *);
    };

    std::vector<_block *> blocks_;
    std::vector<_dtor> dtors_;

    void add_block(std::size_t min_sz)
    {
        std::size_t block_size = std::max(this->DEF_BLOCK_SIZE, min_sz);
        this->blocks_.emplace_back(new _block(block_size));
    }

    // First offset in `b` at or after its fill mark whose address is a multiple of `align`.
    static std::size_t aligned_offset(const _block *b, std::size_t align)
    {
        auto base = reinterpret_cast<std::uintptr_t>(b->data);
        auto pos = (base + b->size + align - 1) & ~(static_cast<std::uintptr_t>(align) - 1);
        return static_cast<std::size_t>(pos - base);
    }

    void run_dtors()
    {
        for (auto it = dtors_.rbegin(); it != dtors_.rend(); ++it) it->destroy(it->object);
        dtors_.clear();
    }

    template <typename T>
    void track(T *obj)
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
            dtors_.push_back({obj, [](void *p) { static_cast<T *>(p)->~T(); }});
    }

public:
    ~Arena()
    {
        run_dtors();
        for (auto &block : blocks_) delete block;
        blocks_.clear();
    }

    Arena() { add_block(this->DEF_BLOCK_SIZE); }

    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;

    Arena(Arena &&) = delete;
    Arena &operator=(Arena &&) = delete;

    template <typename T>
    T *allocate(std::size_t count = 1)
    {
        std::size_t bytes = sizeof(T) * count;

        _block *back = this->blocks_.back();
        std::size_t offset = aligned_offset(back, alignof(T));
        if (offset + bytes > back->capacity)
        {
            add_block(bytes + alignof(T));
            back = this->blocks_.back();
            offset = aligned_offset(back, alignof(T));
        }

        char *ptr = back->data + offset;
        back->size = offset + bytes;
        return reinterpret_cast<T *>(ptr);
    }

    template <typename T, typename... Args>
    T *create(Args &&...args)
    {
        T *mem = allocate<T>();
        T *obj = new (mem) T(std::forward<Args>(args)...);
        track(obj);
        return obj;
    }

    // Destroys every object and keeps the blocks for reuse.
    void reset()
    {
        run_dtors();
        for (auto *b : blocks_) b->size = 0;
    }

    std::size_t live_objects() const { return dtors_.size(); }

    // Static method for creating objects with constructor arguments
    template <typename T, typename... Args>
    static T *alloc(Arena &arena, Args &&...args)
    {
        return arena.create<T>(std::forward<Args>(args)...);
    }

    // Static method for move/copy constructing from an existing object
    template <typename T>
    static std::decay_t<T> *alloc(Arena &arena, T &&obj)
    {
        return arena.create<std::decay_t<T>>(std::forward<T>(obj));
    }
};

}  // namespace lox::mem
#endif  // ARENA_HPP_
