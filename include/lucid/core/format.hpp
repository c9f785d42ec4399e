#pragma once

#include <fmt/core.h>

namespace lucid::compat {
    using fmt::format;
}
