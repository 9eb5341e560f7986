#pragma once

#include <vector>

namespace tessera::memory {

template <typename T> using vector = std::vector<T>;

}
