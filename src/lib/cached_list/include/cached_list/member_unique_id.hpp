#pragma once

/// @brief  Default identity for objects stored in a CachedList. The
///         payload type must provide a `unique_id() const` method that
///         returns a hashable key which never changes while the object
///         lives and is unique within the process.
template <typename T>
struct MemberUniqueId {
    auto
    operator()(T const &obj) const
    {
        return obj.unique_id();
    }
};
