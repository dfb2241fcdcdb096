#pragma once

#include <ankerl/unordered_dense.h>

namespace csrfguard::core {

// Container aliases backed by ankerl::unordered_dense
// Dense storage (contiguous key-value pairs), faster lookups and iteration than
// std::unordered_map. Iterators are invalidated on insertion, like std::vector.
//
// Usage:
//   csrfguard::core::fast_map<std::string, std::string> values;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

}  // namespace csrfguard::core
