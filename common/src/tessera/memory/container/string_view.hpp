#pragma once

#include <string_view>

namespace tessera::memory {

using string_view = std::string_view;

}
