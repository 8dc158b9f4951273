#pragma once

#include <powgiver/config/types.hpp>
#include <powgiver/logging/logger.hpp>

namespace powgiver::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
powgiver::config::ParseResult parse(int argc, char** argv, powgiver::logging::Logger& log);

} // namespace powgiver::cli
