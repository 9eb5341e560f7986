#pragma once

#include <string>

namespace tessera::memory {

using string = std::string;

}
