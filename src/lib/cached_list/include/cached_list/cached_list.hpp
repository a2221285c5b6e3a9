#pragma once

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cached_list/member_unique_id.hpp"
#include "cached_list/node_arena.hpp"
#include "logger/logger.h"
#include <glib.h>

using size_t = std::size_t;

template <typename K>
static inline std::string
cached_list_key2str(K const &key)
{
    std::stringstream ss;
    ss << key;
    return ss.str();
}

/// @brief  Walks the payloads of a CachedList from head to tail.
template <typename T>
class CachedListIterator {
public:
    CachedListIterator(NodeArena const *const arena,
                       std::vector<T *> const *const payloads,
                       size_t const idx)
        : arena_(arena),
          payloads_(payloads),
          idx_(idx)
    {
    }

    T &
    operator*() const
    {
        return *(*payloads_)[idx_];
    }

    void
    operator++()
    {
        idx_ = arena_->next(idx_);
    }

    bool
    operator==(CachedListIterator const &rhs) const
    {
        return idx_ == rhs.idx_;
    }

    bool
    operator!=(CachedListIterator const &rhs) const
    {
        return idx_ != rhs.idx_;
    }

private:
    NodeArena const *arena_;
    std::vector<T *> const *payloads_;
    size_t idx_;
};

/// @brief  A doubly linked list of objects with an identity-indexed node
///         cache. Each object may appear at most once; adding an object
///         that is already a member is a silent no-op. Nodes of removed
///         objects stay cached and are reused when the same identity is
///         added again, so a bounded set of objects moving on and off the
///         list never allocates after warm-up.
///
///         The list does not own the objects. It stores non-owning
///         pointers, so the caller must keep every member alive until it
///         is removed (or the list is cleared or destroyed).
///
/// @example    Iterating a list:
///             for (auto &obj : list) { obj.update(); }
///             or, link by link:
///             for (T *p = list.first(); p; p = list.next_of(*p)) { ... }
template <typename T, typename Identity = MemberUniqueId<T>>
class CachedList {
public:
    using key_type =
        std::decay_t<std::invoke_result_t<Identity const &, T const &>>;

private:
    static std::string
    make_uid()
    {
        // Milliseconds since the epoch followed by a suffix in [0, 1000).
        return std::to_string(g_get_real_time() / 1000) +
               std::to_string(g_random_int_range(0, 1000));
    }

    /// @return the cached slot for this identity, or NIL_SLOT.
    size_t
    cached_slot(T const &obj) const
    {
        auto it = identity_to_slot_.find(identity_(obj));
        if (it == identity_to_slot_.end()) {
            return NIL_SLOT;
        }
        return it->second;
    }

    /// @return the slot of a current member, or NIL_SLOT.
    size_t
    member_slot(T const &obj) const
    {
        size_t const idx = cached_slot(obj);
        if (idx == NIL_SLOT || !arena_.in_use(idx)) {
            return NIL_SLOT;
        }
        return idx;
    }

    /// @brief  Get the slot for an object, allocating one if this is the
    ///         first time we have seen its identity.
    size_t
    get_or_allocate_slot(key_type const &key)
    {
        auto it = identity_to_slot_.find(key);
        if (it != identity_to_slot_.end()) {
            return it->second;
        }
        size_t const idx = arena_.allocate();
        g_assert_cmpuint(idx, ==, payloads_.size());
        payloads_.push_back(nullptr);
        identity_to_slot_.emplace(key, idx);
        return idx;
    }

    T *
    payload_at(size_t const idx) const
    {
        if (idx == NIL_SLOT) {
            return nullptr;
        }
        return payloads_[idx];
    }

    /// @brief  Unlink a member's slot and hand back its object.
    T *
    detach(size_t const idx)
    {
        T *const obj = payloads_[idx];
        bool const ok = arena_.unlink(idx);
        g_assert_true(ok);
        payloads_[idx] = nullptr;
        return obj;
    }

    bool
    refuse_if_destroyed(char const *const op) const
    {
        if (destroyed_) {
            LOGGER_WARN("%s() on destroyed list %s", op, uid_.c_str());
            return true;
        }
        return false;
    }

    std::string
    describe(size_t const idx) const
    {
        if (idx == NIL_SLOT) {
            return "NULL";
        }
        return cached_list_key2str(identity_(*payloads_[idx]));
    }

public:
    explicit CachedList(Identity identity = Identity())
        : identity_(std::move(identity)),
          uid_(make_uid())
    {
    }

    // My list hands out pointers into the payload table, so copying
    // it would alias the caller's objects in two caches.
    CachedList(CachedList const &) = delete;
    CachedList &
    operator=(CachedList const &) = delete;

    /// @brief  The source is left as an empty, usable list with an
    ///         empty node cache and a fresh uid.
    CachedList(CachedList &&src)
        : arena_(std::move(src.arena_)),
          payloads_(std::exchange(src.payloads_, {})),
          identity_to_slot_(std::exchange(src.identity_to_slot_, {})),
          identity_(src.identity_),
          uid_(std::exchange(src.uid_, make_uid())),
          show_debug_(src.show_debug_),
          destroyed_(std::exchange(src.destroyed_, false))
    {
    }

    CachedList &
    operator=(CachedList &&src)
    {
        if (this != &src) {
            arena_ = std::move(src.arena_);
            payloads_ = std::exchange(src.payloads_, {});
            identity_to_slot_ = std::exchange(src.identity_to_slot_, {});
            identity_ = src.identity_;
            uid_ = std::exchange(src.uid_, make_uid());
            show_debug_ = src.show_debug_;
            destroyed_ = std::exchange(src.destroyed_, false);
        }
        return *this;
    }

    ~CachedList() = default;

    /// @brief  Append an object to the tail.
    /// @return false if the object is already a member (or the list has
    ///         been destroyed), in which case nothing changes.
    bool
    add(T &obj)
    {
        if (refuse_if_destroyed("add")) {
            return false;
        }
        key_type const key = identity_(obj);
        size_t const idx = get_or_allocate_slot(key);
        if (arena_.in_use(idx)) {
            return false;
        }
        // This caching of slot/object pairs is the reason an object can
        // only be in the list once.
        payloads_[idx] = &obj;
        arena_.append(idx);
        if (show_debug_) {
            dump("after add");
        }
        return true;
    }

    /// @brief  Check whether the object is currently a member. A cached
    ///         but free node does not count.
    bool
    has(T const &obj) const
    {
        if (destroyed_) {
            return false;
        }
        return member_slot(obj) != NIL_SLOT;
    }

    /// @return true if the object was removed, false if it was not on the
    ///         list.
    bool
    remove(T const &obj)
    {
        if (refuse_if_destroyed("remove")) {
            return false;
        }
        size_t const idx = member_slot(obj);
        if (idx == NIL_SLOT) {
            return false;
        }
        detach(idx);
        return true;
    }

    /// @brief  Move the object one place towards the head.
    /// @return false if the object is not on the list. Moving the head
    ///         succeeds without changing anything.
    bool
    move_up(T const &obj)
    {
        if (refuse_if_destroyed("move_up")) {
            return false;
        }
        size_t const idx = member_slot(obj);
        if (idx == NIL_SLOT) {
            LOGGER_ERROR("move_up() of object {%s} that isn't in list %s",
                         cached_list_key2str(identity_(obj)).c_str(),
                         uid_.c_str());
            return false;
        }
        if (show_debug_) {
            dump("before move up");
        }
        arena_.swap_with_prev(idx);
        return true;
    }

    /// @brief  Move the object one place towards the tail.
    /// @return false if the object is not on the list. Moving the tail
    ///         succeeds without changing anything.
    bool
    move_down(T const &obj)
    {
        if (refuse_if_destroyed("move_down")) {
            return false;
        }
        size_t const idx = member_slot(obj);
        if (idx == NIL_SLOT) {
            LOGGER_ERROR("move_down() of object {%s} that isn't in list %s",
                         cached_list_key2str(identity_(obj)).c_str(),
                         uid_.c_str());
            return false;
        }
        if (show_debug_) {
            dump("before move down");
        }
        arena_.swap_with_next(idx);
        return true;
    }

    /// @brief  Take everything off the list, sort it, then put it back.
    /// @param  compare three-way comparator: compare(a, b) is negative if
    ///         a goes before b, zero if equal, positive if after. The
    ///         order of equal elements is unspecified.
    template <typename Compare>
    void
    sort(Compare compare)
    {
        if (refuse_if_destroyed("sort")) {
            return;
        }
        std::vector<T *> sorted;
        sorted.reserve(arena_.size());
        for (size_t p = arena_.head(); p != NIL_SLOT; p = arena_.next(p)) {
            sorted.push_back(payloads_[p]);
        }

        // NOTE Sort before touching the list, so a comparator that throws
        //      leaves the members where they were.
        std::sort(sorted.begin(),
                  sorted.end(),
                  [&compare](T const *const a, T const *const b) {
                      return compare(*a, *b) < 0;
                  });

        // NOTE The identity cache survives the clear, so every add()
        //      below reuses the object's old slot.
        clear();
        for (T *const obj : sorted) {
            add(*obj);
        }
    }

    /// @brief  Remove the head and return its object.
    /// @return nullptr if the list is empty.
    T *
    shift()
    {
        if (refuse_if_destroyed("shift")) {
            return nullptr;
        }
        size_t const idx = arena_.head();
        if (idx == NIL_SLOT) {
            return nullptr;
        }
        return detach(idx);
    }

    /// @brief  Remove the tail and return its object.
    /// @return nullptr if the list is empty.
    T *
    pop()
    {
        if (refuse_if_destroyed("pop")) {
            return nullptr;
        }
        size_t const idx = arena_.tail();
        if (idx == NIL_SLOT) {
            return nullptr;
        }
        return detach(idx);
    }

    /// @brief  Remove every object. Cached nodes are kept for reuse.
    void
    clear()
    {
        if (refuse_if_destroyed("clear")) {
            return;
        }
        for (size_t p = arena_.head(); p != NIL_SLOT; p = arena_.next(p)) {
            payloads_[p] = nullptr;
        }
        arena_.clear();
    }

    /// @brief  Release every object reference and the node cache. The
    ///         list refuses all further work.
    void
    destroy()
    {
        LOGGER_DEBUG("destroy() list %s with %zu members, %zu cached nodes",
                     uid_.c_str(),
                     arena_.size(),
                     arena_.capacity());
        payloads_.clear();
        payloads_.shrink_to_fit();
        identity_to_slot_.clear();
        arena_.reset();
        destroyed_ = true;
    }

    T *
    first() const
    {
        return payload_at(arena_.head());
    }

    T *
    last() const
    {
        return payload_at(arena_.tail());
    }

    /// @return the member after obj, or nullptr at the tail or if obj is
    ///         not a member.
    T *
    next_of(T const &obj) const
    {
        if (destroyed_) {
            return nullptr;
        }
        size_t const idx = member_slot(obj);
        if (idx == NIL_SLOT) {
            return nullptr;
        }
        return payload_at(arena_.next(idx));
    }

    /// @return the member before obj, or nullptr at the head or if obj is
    ///         not a member.
    T *
    prev_of(T const &obj) const
    {
        if (destroyed_) {
            return nullptr;
        }
        size_t const idx = member_slot(obj);
        if (idx == NIL_SLOT) {
            return nullptr;
        }
        return payload_at(arena_.prev(idx));
    }

    CachedListIterator<T>
    begin() const
    {
        return CachedListIterator<T>{&arena_, &payloads_, arena_.head()};
    }

    CachedListIterator<T>
    end() const
    {
        return CachedListIterator<T>{&arena_, &payloads_, NIL_SLOT};
    }

    size_t
    size() const
    {
        return arena_.size();
    }

    bool
    empty() const
    {
        return arena_.size() == 0;
    }

    /// @brief  Number of nodes in the identity cache, in use or free.
    size_t
    cached_nodes() const
    {
        return identity_to_slot_.size();
    }

    std::string const &
    uid() const
    {
        return uid_;
    }

    bool
    is_destroyed() const
    {
        return destroyed_;
    }

    bool
    show_debug() const
    {
        return show_debug_;
    }

    /// @brief  Dump the list after every add() and before every move_up().
    void
    set_show_debug(bool const show_debug)
    {
        show_debug_ = show_debug;
    }

    /// @brief  Write the members and their back-links to the logger at
    ///         DEBUG level.
    void
    dump(char const *const msg) const
    {
        if (!logger_enabled(LOGGER_LEVEL_DEBUG)) {
            return;
        }
        LOGGER_DEBUG("====================%s=====================", msg);
        for (size_t p = arena_.head(); p != NIL_SLOT; p = arena_.next(p)) {
            LOGGER_DEBUG("{%s} previous=%s",
                         describe(p).c_str(),
                         describe(arena_.prev(p)).c_str());
        }
        LOGGER_DEBUG("===================================");
        LOGGER_DEBUG("Last: {%s} First: {%s}",
                     describe(arena_.tail()).c_str(),
                     describe(arena_.head()).c_str());
    }

    /// @brief  Check the link structure and that every member maps back
    ///         to its own slot.
    bool
    validate() const
    {
        if (!arena_.validate()) {
            return false;
        }
        if (payloads_.size() != arena_.capacity() ||
            identity_to_slot_.size() != arena_.capacity()) {
            LOGGER_ERROR("cache sizes disagree: %zu payloads, %zu keys, "
                         "%zu slots",
                         payloads_.size(),
                         identity_to_slot_.size(),
                         arena_.capacity());
            return false;
        }
        for (auto const &[key, idx] : identity_to_slot_) {
            if (idx >= arena_.capacity()) {
                LOGGER_ERROR("key {%s} maps to missing slot %zu",
                             cached_list_key2str(key).c_str(),
                             idx);
                return false;
            }
            if (!arena_.in_use(idx)) {
                continue;
            }
            if (payloads_[idx] == nullptr ||
                !(identity_(*payloads_[idx]) == key)) {
                LOGGER_ERROR("slot %zu does not hold key {%s}",
                             idx,
                             cached_list_key2str(key).c_str());
                return false;
            }
        }
        return true;
    }

private:
    NodeArena arena_;
    // Indexed by slot, parallel to the arena.
    std::vector<T *> payloads_;
    std::unordered_map<key_type, size_t> identity_to_slot_;
    Identity identity_;
    std::string uid_;
    bool show_debug_ = false;
    bool destroyed_ = false;
};
