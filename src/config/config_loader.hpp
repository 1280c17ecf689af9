/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: YAML configuration loader

**************************************************/

#ifndef FIRETV_CONFIG_CONFIG_LOADER_HPP
#define FIRETV_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "configuration.hpp"

namespace firetv::config {

/**
 * @brief Reads a YAML document into a Configuration
 *
 * Every failure (unreadable file, malformed YAML, invalid device entry,
 * duplicate name) is reported as a ParseError result; nothing throws out
 * of the loader.
 */
class ConfigLoader {
public:
    /**
     * @brief Load and validate a configuration file
     * @param families Device families a definition may name
     */
    [[nodiscard]] static auto load(
        const std::filesystem::path& path,
        const std::vector<std::string>& families = {DEFAULT_FAMILY})
        -> Result<Configuration>;

    /**
     * @brief Parse YAML text
     * @param source Name used in error messages
     */
    [[nodiscard]] static auto parse(
        const std::string& yaml, std::string_view source = "<memory>",
        const std::vector<std::string>& families = {DEFAULT_FAMILY})
        -> Result<Configuration>;
};

}  // namespace firetv::config

#endif  // FIRETV_CONFIG_CONFIG_LOADER_HPP
