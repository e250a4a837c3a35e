#pragma once

#include <bytell_hash_map.hpp>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

namespace bolt {

template <typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>,
          typename A = std::allocator<std::pair<K, V> > >
using flat_hash_map = ska::bytell_hash_map<K, V, H, E, A>;

// Map keyed by views. The owner of the map guarantees that the viewed characters outlive their entry.
template <typename V>
using string_view_hash_map = flat_hash_map<std::string_view, V>;

}  // namespace bolt
