#pragma once

#include <fmt/format.h>

namespace contextvm::compat {
    using fmt::format;
    using fmt::join;
}
