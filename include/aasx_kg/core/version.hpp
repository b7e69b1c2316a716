#pragma once

namespace aasx_kg {

constexpr const char* kVersion = "0.3.0";

} // namespace aasx_kg
