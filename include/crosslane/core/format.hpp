#pragma once

#include <fmt/format.h>

namespace crosslane::compat {
    using fmt::format;
}
