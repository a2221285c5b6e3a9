#include <cstddef>
#include <cstdio>
#include <utility>

#include "cached_list/node_arena.hpp"
#include "invariants/implies.h"
#include "logger/logger.h"
#include <glib.h>

constexpr bool DEBUG = false;

static inline char const *
slot2str(size_t const idx, char *const buf, size_t const len)
{
    if (idx == NIL_SLOT) {
        return "nil";
    }
    std::snprintf(buf, len, "%zu", idx);
    return buf;
}

void
NodeArena::check() const
{
    if (!DEBUG) {
        return;
    }
    g_assert_true(validate());
}

ListSlot &
NodeArena::slot(size_t const idx)
{
    g_assert_cmpuint(idx, <, slots_.size());
    return slots_[idx];
}

ListSlot const &
NodeArena::slot(size_t const idx) const
{
    g_assert_cmpuint(idx, <, slots_.size());
    return slots_[idx];
}

NodeArena::NodeArena(NodeArena &&src) noexcept
    : slots_(std::exchange(src.slots_, {})),
      head_(std::exchange(src.head_, NIL_SLOT)),
      tail_(std::exchange(src.tail_, NIL_SLOT)),
      length_(std::exchange(src.length_, 0))
{
}

NodeArena &
NodeArena::operator=(NodeArena &&src) noexcept
{
    if (this != &src) {
        slots_ = std::exchange(src.slots_, {});
        head_ = std::exchange(src.head_, NIL_SLOT);
        tail_ = std::exchange(src.tail_, NIL_SLOT);
        length_ = std::exchange(src.length_, 0);
    }
    return *this;
}

size_t
NodeArena::allocate()
{
    size_t const idx = slots_.size();
    slots_.push_back(ListSlot{NIL_SLOT, NIL_SLOT, false});
    LOGGER_TRACE("allocate() -> %zu", idx);
    return idx;
}

void
NodeArena::append(size_t const idx)
{
    LOGGER_TRACE("append(%zu)", idx);
    ListSlot &s = slot(idx);
    g_assert_false(s.in_use);
    // Reusing a slot, so we clean up whatever links it had.
    s.sanitize();
    s.in_use = true;
    if (head_ == NIL_SLOT) {
        head_ = tail_ = idx;
        ++length_;
        check();
        return;
    }
    // A non-empty list without a tail is a corrupted list.
    g_assert_cmpuint(tail_, !=, NIL_SLOT);
    g_assert_cmpuint(slot(tail_).next, ==, NIL_SLOT);
    g_assert_cmpuint(length_, !=, 0);
    slot(tail_).next = idx;
    s.prev = tail_;
    tail_ = idx;
    ++length_;
    check();
}

bool
NodeArena::unlink(size_t const idx)
{
    LOGGER_TRACE("unlink(%zu)", idx);
    ListSlot &s = slot(idx);
    if (!s.in_use) {
        return false;
    }
    if (s.prev != NIL_SLOT) {
        slot(s.prev).next = s.next;
    } else {
        head_ = s.next;
    }
    if (s.next != NIL_SLOT) {
        slot(s.next).prev = s.prev;
    } else {
        tail_ = s.prev;
    }
    s.sanitize();
    s.in_use = false;
    --length_;
    check();
    return true;
}

void
NodeArena::swap_with_prev(size_t const idx)
{
    char buf[32];
    LOGGER_TRACE("swap_with_prev(%zu) with prev %s",
                 idx,
                 slot2str(slot(idx).prev, buf, sizeof(buf)));
    ListSlot &c = slot(idx);
    g_assert_true(c.in_use);
    if (c.prev == NIL_SLOT) {
        // Already first
        return;
    }
    size_t const b_idx = c.prev;
    ListSlot &b = slot(b_idx);
    size_t const a_idx = b.prev;
    size_t const d_idx = c.next;

    // A <-> B <-> C <-> D
    // A <-> C <-> B <-> D
    if (a_idx != NIL_SLOT) {
        slot(a_idx).next = idx;
    } else {
        head_ = idx;
    }
    if (d_idx != NIL_SLOT) {
        slot(d_idx).prev = b_idx;
    } else {
        tail_ = b_idx;
    }
    c.prev = a_idx;
    c.next = b_idx;
    b.prev = idx;
    b.next = d_idx;
    check();
}

void
NodeArena::swap_with_next(size_t const idx)
{
    LOGGER_TRACE("swap_with_next(%zu)", idx);
    ListSlot const &b = slot(idx);
    g_assert_true(b.in_use);
    if (b.next == NIL_SLOT) {
        // Already last
        return;
    }
    swap_with_prev(b.next);
}

void
NodeArena::clear()
{
    LOGGER_TRACE("clear() of %zu slots", length_);
    size_t next = NIL_SLOT;
    for (size_t p = head_; p != NIL_SLOT; p = next) {
        ListSlot &s = slot(p);
        next = s.next;
        s.sanitize();
        s.in_use = false;
    }
    head_ = tail_ = NIL_SLOT;
    length_ = 0;
    check();
}

void
NodeArena::reset()
{
    LOGGER_TRACE("reset() of %zu slots", slots_.size());
    slots_.clear();
    head_ = tail_ = NIL_SLOT;
    length_ = 0;
}

size_t
NodeArena::head() const
{
    return head_;
}

size_t
NodeArena::tail() const
{
    return tail_;
}

size_t
NodeArena::next(size_t const idx) const
{
    return slot(idx).next;
}

size_t
NodeArena::prev(size_t const idx) const
{
    return slot(idx).prev;
}

bool
NodeArena::in_use(size_t const idx) const
{
    return slot(idx).in_use;
}

size_t
NodeArena::size() const
{
    return length_;
}

size_t
NodeArena::capacity() const
{
    return slots_.size();
}

bool
NodeArena::validate() const
{
    // Sanity checks on the boundaries
    if (!iff(length_ == 0, head_ == NIL_SLOT) ||
        !iff(length_ == 0, tail_ == NIL_SLOT)) {
        LOGGER_ERROR("length %zu inconsistent with head %s, tail %s",
                     length_,
                     head_ == NIL_SLOT ? "nil" : "set",
                     tail_ == NIL_SLOT ? "nil" : "set");
        return false;
    }
    if (length_ > slots_.size()) {
        LOGGER_ERROR("length %zu exceeds %zu slots", length_, slots_.size());
        return false;
    }
    if (length_ == 0) {
        for (auto const &s : slots_) {
            if (s.in_use || s.prev != NIL_SLOT || s.next != NIL_SLOT) {
                LOGGER_ERROR("empty list has a linked slot");
                return false;
            }
        }
        return true;
    }
    if (head_ >= slots_.size() || tail_ >= slots_.size()) {
        LOGGER_ERROR("boundary out of range: head %zu, tail %zu, slots %zu",
                     head_,
                     tail_,
                     slots_.size());
        return false;
    }
    if (slots_[head_].prev != NIL_SLOT || slots_[tail_].next != NIL_SLOT) {
        LOGGER_ERROR("boundary slots are linked past the ends");
        return false;
    }

    // Check internal consistency of the links.
    size_t cnt = 0;
    for (size_t p = head_; p != NIL_SLOT; p = slots_[p].next) {
        if (p >= slots_.size() || cnt >= length_) {
            LOGGER_ERROR("walk from head left the list after %zu slots", cnt);
            return false;
        }
        ListSlot const &s = slots_[p];
        ++cnt;
        if (!s.in_use) {
            LOGGER_ERROR("free slot %zu is linked", p);
            return false;
        }
        if (!implies(s.prev != NIL_SLOT,
                     s.prev < slots_.size() && slots_[s.prev].next == p) ||
            !implies(s.prev == NIL_SLOT, p == head_)) {
            LOGGER_ERROR("bad back-link at slot %zu", p);
            return false;
        }
        if (!implies(s.next != NIL_SLOT,
                     s.next < slots_.size() && slots_[s.next].prev == p) ||
            !implies(s.next == NIL_SLOT, p == tail_)) {
            LOGGER_ERROR("bad forward-link at slot %zu", p);
            return false;
        }
    }
    if (cnt != length_) {
        LOGGER_ERROR("reached %zu slots but length is %zu", cnt, length_);
        return false;
    }

    // Free slots must be fully detached.
    size_t nr_in_use = 0;
    for (auto const &s : slots_) {
        if (s.in_use) {
            ++nr_in_use;
        } else if (s.prev != NIL_SLOT || s.next != NIL_SLOT) {
            LOGGER_ERROR("free slot has dangling links");
            return false;
        }
    }
    if (nr_in_use != length_) {
        LOGGER_ERROR("%zu slots in use but length is %zu", nr_in_use, length_);
        return false;
    }
    return true;
}
