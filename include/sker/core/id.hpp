#pragma once

/// @file id.hpp
/// @brief Identifier generation for sker_core

#include "fwd.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace sker_core {

// =============================================================================
// IdGenerator
// =============================================================================

/// Thread-safe monotonically increasing id source. Zero is never issued.
class IdGenerator {
public:
    IdGenerator() noexcept = default;

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    [[nodiscard]] std::uint64_t next() noexcept {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_next{1};
};

// =============================================================================
// Random Identifiers
// =============================================================================

/// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-9a4d-4e7f-b2c1-0d5e6f7a8b9c"
[[nodiscard]] std::string generate_uuid();

} // namespace sker_core
