#pragma once

#include <amc/allocator.hpp>
#include <amc/vector.hpp>

namespace bolt {

// Default dynamic array of the project.
template <class T, class Alloc = amc::allocator<T>>
using vector = amc::vector<T, Alloc>;

}  // namespace bolt
