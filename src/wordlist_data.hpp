#pragma once
#include <array>
#include <cstddef>
#include <string_view>

inline constexpr size_t kSlip39WordCount = 1024;

extern const std::array<std::string_view, kSlip39WordCount> kSlip39Words;
