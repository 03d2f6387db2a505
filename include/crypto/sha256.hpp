#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <string>

namespace winusb {

std::string Sha256Hex(std::span<const std::uint8_t> data);

// Hashes the reader to EOF. on_bytes, when set, receives the running byte count
// after each block and may return false to stop hashing early.
std::string Sha256Hex(IReader& reader,
                      const std::function<bool(std::uint64_t)>& on_bytes = {});

Result Sha256HexFile(const std::string& path,
                     std::string& out_hex,
                     const std::function<bool(std::uint64_t)>& on_bytes = {});

// Case-insensitive comparison of two hex digests.
bool DigestEquals(const std::string& a, const std::string& b);

} // namespace winusb
