#pragma once

#include <expected>
#include <string>

namespace bootpack {

template <typename T>
using Result = std::expected<T, std::string>;

} // namespace bootpack
