#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "TCPServer.hpp"
#include "compile_service.hpp"
#include "engine_config.hpp"
#include "logger.hpp"

namespace texbox {

// Client-supplied file names are only checked, never used on disk.
bool has_source_extension(const std::string& filename);

// Serves one connection: reads a single command, replies, closes client_fd.
void handle_client(int client_fd, CompileService& service, const EngineConfig& config, Logger& logger);

}  // namespace texbox
