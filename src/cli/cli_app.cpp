/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for Web Image Tool.
 * Supports single file processing, batch processing of a directory and
 * reading options from a config file.
 */

#include "cli/cli_app.hpp"
#include "core/geometry.hpp"
#include "core/watermark_engine.hpp"
#include "utils/byte_format.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace wit::cli {

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  Web Image Tool");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n", kVersion);
    fmt::print("\n");
}

// =============================================================================
// Processing helpers
// =============================================================================

struct BatchResult {
    int success = 0;
    int fail = 0;

    void print() const {
        if (success + fail > 1) {
            fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", success);
            if (fail > 0) {
                fmt::print(fmt::fg(fmt::color::red), ", {} failed", fail);
            }
            fmt::print("\n");
        }
    }
};

void print_summary(
    const fs::path& input,
    const fs::path& output,
    const ProcessResult& r,
    double elapsed_ms)
{
    const auto in_bytes = static_cast<std::int64_t>(r.input_bytes);
    const auto out_bytes = static_cast<std::int64_t>(r.output_bytes);
    const std::int64_t reduction = in_bytes - out_bytes;
    const double reduction_pct = in_bytes > 0 ? 100.0 * static_cast<double>(reduction) / in_bytes : 0.0;

    std::vector<std::array<std::string, 3>> rows = {
        {"File Name:", to_utf8(input.filename()), to_utf8(output.filename())},
        {"File Dimensions:",
         fmt::format("{}x{}", r.input_size.width, r.input_size.height),
         fmt::format("{}x{}", r.output_size.width, r.output_size.height)},
        {"File Size:", format_bytes(in_bytes), format_bytes(out_bytes)},
        {"Size Reduction:", fmt::format("{} ({:.1f}%)", format_bytes(reduction), reduction_pct), ""},
        {"Processing Time:", fmt::format("{:.1f} ms", elapsed_ms), ""},
    };
    if (r.watermark) {
        const cv::Rect& box = r.watermark->region;
        rows.push_back({"Watermark:",
                        fmt::format("{} ({},{})-({},{})", to_string(r.watermark->position),
                                    box.x, box.y, box.br().x, box.br().y),
                        ""});
    }
    if (r.text && r.text->applied) {
        rows.push_back({"Text:", fmt::format("\"{}\" at {}px", r.text->text, r.text->font_size), ""});
    }

    size_t w0 = 0, w1 = 0, w2 = 0;
    for (const auto& row : rows) {
        w0 = std::max(w0, row[0].size());
        w1 = std::max(w1, row[1].size());
        w2 = std::max(w2, row[2].size());
    }
    const size_t total = w0 + w1 + w2 + 8;

    fmt::print(fmt::fg(fmt::color::cyan), "{:-^{}}\n", " Processing Summary ", total);
    for (const auto& row : rows) {
        // Unchanged values are shown once
        const bool changed = !row[2].empty() && row[2] != row[1];
        fmt::print("{:<{}}  {:<{}}  {:<2}  {}\n",
                   row[0], w0, row[1], w1, changed ? "->" : "", changed ? row[2] : "");
    }
    fmt::print(fmt::fg(fmt::color::cyan), "{:-^{}}\n", " End ", total);
}

void process_single(
    const fs::path& input,
    const fs::path& output,
    const ProcessOptions& options,
    const WatermarkEngine& engine,
    bool show_summary,
    BatchResult& batch)
{
    const auto start = std::chrono::steady_clock::now();
    const ProcessResult result = process_image(input, output, options, engine);
    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (result.success) {
        batch.success++;
        if (show_summary) {
            print_summary(input, output, result, elapsed_ms);
        }
    } else {
        batch.fail++;
    }
}

// Supported images in a directory, sorted, minus earlier outputs ending in skip_suffix
std::vector<fs::path> collect_inputs(const fs::path& dir, const std::string& skip_suffix) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || !is_supported_image(entry.path())) continue;

        const std::string stem = to_utf8(entry.path().stem());
        if (!skip_suffix.empty() && stem.size() > skip_suffix.size() &&
            stem.compare(stem.size() - skip_suffix.size(), skip_suffix.size(), skip_suffix) == 0) {
            spdlog::debug("Skipping earlier output: {}", entry.path().filename());
            continue;
        }
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// Validates position names while the command line is parsed
const CLI::Validator kPositionName(
    [](std::string& value) -> std::string {
        try {
            (void)parse_position(value);
            return {};
        } catch (const InvalidPositionError& e) {
            return e.what();
        }
    },
    "POSITION");

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

fs::path default_output_path(const fs::path& input, const std::string& suffix) {
    fs::path name = input.stem();
    name += suffix;
    name += input.extension();
    return input.parent_path() / name;
}

bool is_supported_image(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    static constexpr std::array<const char*, 7> kExtensions = {
        ".jpg", ".jpeg", ".png", ".webp", ".bmp", ".tif", ".tiff"
    };
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

int run(int argc, char** argv) {
    setup_console();

    CLI::App app{"Web Image Tool - Resize and watermark images for web publishing"};
    app.footer("\nValid positions: top-left, top-right, bottom-left, bottom-right, bottom-center, center"
               "\nWithout --position the watermark goes where the image is flattest.");
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from an INI or TOML file");

    // Input/Output paths
    std::string input_path;
    std::string output_path;
    std::string suffix = "_edited";

    app.add_option("-i,--input", input_path, "Input image file or directory")
        ->required()
        ->check(CLI::ExistingPath);
    app.add_option("-o,--output", output_path, "Output image file or directory");
    app.add_option("--suffix", suffix, "Suffix appended to the input name when no output is given")
        ->capture_default_str();

    // Resize
    double resize_scale = 1.0;
    int width = 0;
    int height = 0;
    int longest = 0;
    int shortest = 0;

    auto* scale_opt = app.add_option("-s,--scale", resize_scale, "Scale output size (0.5 = half)")
        ->check(CLI::PositiveNumber)->group("Resize");
    auto* width_opt = app.add_option("-W,--width", width, "Absolute width of output")
        ->check(CLI::PositiveNumber)->group("Resize");
    auto* height_opt = app.add_option("-H,--height", height, "Absolute height of output")
        ->check(CLI::PositiveNumber)->group("Resize");
    auto* longest_opt = app.add_option("-L,--longest", longest, "Longest dimension of output")
        ->check(CLI::PositiveNumber)->group("Resize");
    auto* shortest_opt = app.add_option("-S,--shortest", shortest, "Shortest dimension of output")
        ->check(CLI::PositiveNumber)->group("Resize");

    // Image watermark
    std::string watermark_path;
    std::string position_name;
    std::string mask_name = "color";
    WatermarkOptions watermark;

    app.add_option("-w,--watermark", watermark_path, "Image file to use as watermark")
        ->check(CLI::ExistingFile)->group("Watermark");
    app.add_option("--wm-scale", watermark.scale, "Maximum watermark size relative to the image")
        ->capture_default_str()->check(CLI::Range(0.001, 1.0))->group("Watermark");
    app.add_option("--opacity", watermark.opacity, "Watermark opacity")
        ->capture_default_str()->check(CLI::Range(0.0, 1.0))->group("Watermark");
    app.add_option("-m,--margin", watermark.padding, "Padding around watermark as a fraction of the image")
        ->capture_default_str()->check(CLI::Range(0.0, 0.5))->group("Watermark");
    app.add_flag("--invert", watermark.invert, "Invert watermark colors")->group("Watermark");
    app.add_option("-p,--position", position_name, "Watermark position (automatic if omitted)")
        ->check(kPositionName)->group("Watermark");
    app.add_option("--mask", mask_name, "Blend weight source: color or alpha")
        ->capture_default_str()->check(CLI::IsMember({"color", "alpha"}))->group("Watermark");

    // Text watermark
    std::string text;
    std::string capture_date;
    std::string text_position_name;
    TextOptions text_options;

    auto* text_opt = app.add_option("-t,--text", text, "Text to display on image")->group("Text");
    app.add_flag("-c,--copyright", text_options.copyright,
                 "Display text as a copyright message after © and the capture year")->group("Text");
    app.add_option("--capture-date", capture_date,
                   "Capture date for the copyright year (YYYY:MM:DD HH:MM:SS or YYYY-MM-DD)")->group("Text");
    app.add_option("--font", text_options.font,
                   "Font file or fontconfig pattern (default: sans-serif)")->group("Text");
    app.add_option("--text-scale", text_options.scale, "Text width relative to image width")
        ->capture_default_str()->check(CLI::Range(0.001, 1.0))->group("Text");
    app.add_option("--text-opacity", text_options.opacity, "Opacity of text layer")
        ->capture_default_str()->check(CLI::Range(0.0, 1.0))->group("Text");
    app.add_option("--text-padding", text_options.padding, "Text offset from the top-left corner in pixels")
        ->capture_default_str()->check(CLI::NonNegativeNumber)->group("Text");
    app.add_option("--text-position", text_position_name, "Anchor the text instead of using the fixed offset")
        ->check(kPositionName)->group("Text");

    // Output
    ProcessOptions options;
    app.add_option("--quality", options.jpeg_quality, "Quality for JPEG/WebP output (1-100)")
        ->capture_default_str()->check(CLI::Range(1, 100))->group("Output");
    app.add_flag("-f,--force", options.force, "Force overwrite of existing file")->group("Output");
    app.add_flag("-n,--no-op", options.no_op, "Display results only; don't save file")->group("Output");

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    auto logger = spdlog::get("wit");
    if (!logger) {
        logger = spdlog::stdout_color_mt("wit");
    }
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (!quiet) {
        print_banner();
    }

    // Resize options
    if (*scale_opt) options.resize.scale = resize_scale;
    if (*width_opt) options.resize.width = width;
    if (*height_opt) options.resize.height = height;
    if (*longest_opt) options.resize.longest = longest;
    if (*shortest_opt) options.resize.shortest = shortest;

    // Watermark options
    if (!position_name.empty()) {
        watermark.position = parse_position(position_name);
        spdlog::info("Watermark position forced to {}", to_string(*watermark.position));
    }
    watermark.mask_source = (mask_name == "alpha") ? MaskSource::AlphaChannel : MaskSource::ColorMagnitude;
    options.watermark = watermark;

    // Text options
    if (*text_opt || text_options.copyright) {
        text_options.text = text;
        if (!text_position_name.empty()) {
            text_options.position = parse_position(text_position_name);
            text_options.margin = watermark.padding;
        }
        if (!capture_date.empty()) {
            text_options.capture_date = parse_capture_date(capture_date);
            if (!text_options.capture_date) {
                spdlog::error("Invalid capture date: {}", capture_date);
                return 1;
            }
        }
        options.text = text_options;
    }

    try {
        WatermarkEngine engine(logger);
        if (!watermark_path.empty()) {
            engine.load_overlay(watermark_path);
        }

        fs::path input(input_path);
        fs::path output(output_path);

        BatchResult batch;

        if (fs::is_directory(input)) {
            if (!output.empty() && !fs::exists(output)) {
                fs::create_directories(output);
            }

            spdlog::info("Batch processing directory: {}", input);

            // Outputs may land in the same directory; list inputs before writing any
            const std::vector<fs::path> files = collect_inputs(input, output.empty() ? suffix : std::string{});
            spdlog::debug("Found {} images", files.size());

            for (const auto& file : files) {
                const fs::path out_file = output.empty()
                    ? default_output_path(file, suffix)
                    : output / file.filename();
                process_single(file, out_file, options, engine, false, batch);
            }

            batch.print();
        } else {
            if (output.empty()) {
                output = default_output_path(input, suffix);
            }
            process_single(input, output, options, engine, !quiet, batch);
        }

        return (batch.fail > 0) ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace wit::cli
