#pragma once
#include <cstddef>
#include <limits>
#include <vector>

using size_t = std::size_t;

/// @brief  Index used as the "no node" link.
constexpr size_t NIL_SLOT = std::numeric_limits<size_t>::max();

/// @brief  A single cell of the arena. A free slot has no links.
struct ListSlot {
    size_t prev;
    size_t next;
    bool in_use;

    /// @brief  Remove dangling links.
    void
    sanitize()
    {
        prev = next = NIL_SLOT;
    }
};

/// @brief  An index-based doubly linked list over a dense array of slots.
///         Slots are never destroyed once allocated; they are marked free
///         on removal and relinked when reused.
/// @example    Here is an example of the arena after appending slots 2,
///             0, and 1 in that order.
///         |---------|    |---------|    |---------|
///         | slot_2  |    | slot_0  |    | slot_1  |
///         | p: nil  |<---| p: 2    |<---| p: 0    |
///         | n: 0    |--->| n: 1    |--->| n: nil  |
///         |---------|    |---------|    |---------|
///              ^                             ^
///              |                             |
///             HEAD                         TAIL (append)
class NodeArena {
private:
    /// @brief  Run validate() after each mutation if DEBUG is enabled.
    void
    check() const;

    ListSlot &
    slot(size_t const idx);

    ListSlot const &
    slot(size_t const idx) const;

public:
    NodeArena() = default;

    NodeArena(NodeArena const &) = delete;
    NodeArena &
    operator=(NodeArena const &) = delete;

    /// @brief  The source is left as an empty arena with no slots.
    NodeArena(NodeArena &&src) noexcept;
    NodeArena &
    operator=(NodeArena &&src) noexcept;

    /// @brief  Create a new free slot. Use append() to link it in.
    size_t
    allocate();

    /// @brief  Attach a slot to the tail and mark it in use.
    /// @note   The slot must not currently be linked into the list.
    void
    append(size_t const idx);

    /// @brief  Splice a slot out of the list and mark it free.
    /// @return false if the slot was already free.
    bool
    unlink(size_t const idx);

    /// @brief  Swap a slot with its predecessor. No-op at the head.
    ///         A <-> B <-> C <-> D becomes A <-> C <-> B <-> D
    void
    swap_with_prev(size_t const idx);

    /// @brief  Swap a slot with its successor. No-op at the tail.
    void
    swap_with_next(size_t const idx);

    /// @brief  Mark every linked slot free and empty the list. The slots
    ///         themselves are kept for reuse.
    void
    clear();

    /// @brief  Drop all slots, including the free ones.
    void
    reset();

    size_t
    head() const;

    size_t
    tail() const;

    size_t
    next(size_t const idx) const;

    size_t
    prev(size_t const idx) const;

    bool
    in_use(size_t const idx) const;

    /// @brief  Number of linked (in use) slots.
    size_t
    size() const;

    /// @brief  Number of slots ever allocated, whether in use or free.
    size_t
    capacity() const;

    /// @brief  Check the structural invariants of the list.
    /// @return false (and log the first broken condition) on corruption.
    bool
    validate() const;

private:
    std::vector<ListSlot> slots_;
    size_t head_ = NIL_SLOT;
    size_t tail_ = NIL_SLOT;
    size_t length_ = 0;
};
