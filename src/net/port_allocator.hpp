#pragma once

#include <cstdint>
#include <string>
#include "core/errors/task_errors.hpp"

namespace taskwarden::net {

class PortAllocator {
public:
    virtual ~PortAllocator() = default;
    virtual core::errors::Result<std::uint16_t> allocate() = 0;
};

// Binds an ephemeral loopback port, reads the number back and releases it.
// The port is free at the moment of return; nothing reserves it afterwards.
class LoopbackPortAllocator : public PortAllocator {
public:
    explicit LoopbackPortAllocator(std::string host = "127.0.0.1");

    core::errors::Result<std::uint16_t> allocate() override;

private:
    std::string host_;
};

}  // namespace taskwarden::net
