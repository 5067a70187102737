#pragma once

#include <cstdint>

namespace clearledger {
namespace common {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

}  // namespace common
}  // namespace clearledger
