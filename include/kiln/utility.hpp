#pragma once

#include <expected>
#include <string>

namespace kiln {

template <typename T>
using Result = std::expected<T, std::string>;

} // namespace kiln
