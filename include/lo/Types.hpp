#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pglo::lo {

using Oid = uint32_t;
using Descriptor = int32_t;
using Bytes = std::vector<uint8_t>;

// Flag bits from libpq/libpq-fs.h
constexpr uint32_t INV_READ = 0x00040000;
constexpr uint32_t INV_WRITE = 0x00020000;

constexpr size_t DEFAULT_BUFFER_SIZE = 1024 * 1024;   // 1 MiB
constexpr size_t DEFAULT_TRANSFER_BUFFER_SIZE = 64 * 1024;   // 64 KiB

enum class Mode { Read, Write, ReadWrite, Append };

enum class Whence : int32_t { Start = 0, Current = 1, End = 2 };

// Throws lo::Error(InvalidMode) for values outside the enum.
[[nodiscard]] uint32_t flagsFor(Mode mode);

[[nodiscard]] bool isWritable(Mode mode);

[[nodiscard]] Mode parseMode(std::string_view name);
[[nodiscard]] std::string_view modeName(Mode mode);

[[nodiscard]] std::string_view whenceName(Whence whence);

}
