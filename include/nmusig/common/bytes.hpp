#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace nmusig {

using Bytes = std::vector<uint8_t>;

std::string ToHex(std::span<const uint8_t> data);

}  // namespace nmusig
