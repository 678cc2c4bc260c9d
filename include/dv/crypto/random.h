#pragma once

#include <span>

#include "dv/common.h"

namespace dv::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace dv::crypto
