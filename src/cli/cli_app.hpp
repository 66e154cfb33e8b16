/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @license MIT
 */

#pragma once

#include <filesystem>
#include <string>

namespace wit::cli {

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success)
 */
int run(int argc, char** argv);

/**
 * Output path used when none is given: "<stem><suffix><ext>" beside the input
 */
[[nodiscard]] std::filesystem::path default_output_path(
    const std::filesystem::path& input,
    const std::string& suffix
);

/**
 * Whether a file extension is one the batch mode processes
 */
[[nodiscard]] bool is_supported_image(const std::filesystem::path& path);

}  // namespace wit::cli
