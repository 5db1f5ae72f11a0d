// ============================================================================
// Imseries - image series writer
// ============================================================================
// Reads a raw frame stack described by a TOML configuration file and writes
// it in one of the registered formats.
//
//   imseries-write <config.toml>
//   imseries-write --list-formats
//
// Configuration:
//   [input]    file, dtype, shape = [rows, cols], header_bytes (optional)
//   [output]   file, format, [output.options] (format keyword options)
//   [metadata] arbitrary scalars and numeric arrays (optional)
//   [log]      level, file (optional)
// ============================================================================

#include "core/Log.hpp"
#include "core/Config.hpp"
#include "core/DType.hpp"
#include "core/Error.hpp"
#include "series/RawFileSeries.hpp"
#include "writers/WriterRegistry.hpp"
#include "writers/Save.hpp"

#include <iostream>
#include <filesystem>
#include <stdexcept>

using namespace imseries;

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " <config.toml>\n"
              << "       " << program << " --list-formats\n"
              << "       " << program << " --help\n";
}

// ============================================================================
// Input Helper
// ============================================================================

static Result<RawFileSeries, String> OpenInputFromConfig(const Config& config) {
    using R = Result<RawFileSeries, String>;

    auto file = config.GetRequired<String>("input.file");
    if (!file) {
        return R::Err(file.error());
    }

    auto dtypeName = config.GetRequired<String>("input.dtype");
    if (!dtypeName) {
        return R::Err(dtypeName.error());
    }
    Optional<DType> dtype = ParseDType(*dtypeName);
    if (!dtype) {
        return R::Err("Unknown input.dtype: " + *dtypeName);
    }

    auto shapeList = config.GetRequiredArray<u64>("input.shape");
    if (!shapeList) {
        return R::Err(shapeList.error() + " (expected 2 non-negative integers)");
    }
    const Vector<u64> shape = *shapeList;
    if (shape.size() != 2) {
        return R::Err("input.shape must be an array of 2 non-negative integers, got " +
                      std::to_string(shape.size()) + " elements");
    }

    Metadata metadata;
    if (config.Has("metadata")) {
        auto table = config.GetTable("metadata");
        if (!table) {
            return R::Err(table.error());
        }
        auto parsed = MetadataFromToml(table.value().GetRoot());
        if (!parsed) {
            return R::Err("Invalid [metadata]: " + parsed.error());
        }
        metadata = std::move(parsed).value();
    }

    const u64 headerBytes = config.Get<u64>("input.header_bytes", 0);
    return RawFileSeries(*file, FrameShape{shape[0], shape[1]}, *dtype, headerBytes, std::move(metadata));
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    const String arg = argv[1];
    if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
    }
    if (arg == "--list-formats") {
        for (const String& format : WriterRegistry::Global().Formats()) {
            std::cout << format << "\n";
        }
        return 0;
    }

    // ========================================================================
    // Load Configuration
    // ========================================================================
    std::filesystem::path configPath(arg);
    auto configResult = Config::Load(configPath);
    if (!configResult.has_value()) {
        IMS_LOG_ERROR("Failed to load configuration: {}", configResult.error());
        return 1;
    }
    Config config = std::move(configResult).value();

    // ========================================================================
    // Initialize Logging
    // ========================================================================
    const String levelName = config.Get<String>("log.level", "info");
    Optional<Log::Level> level = Log::ParseLevel(levelName);
    const String logFile = config.Get<String>("log.file", "imseries.log");
    Log::Init(logFile.c_str(), level.value_or(Log::Level::Info));
    if (!level) {
        IMS_LOG_WARN("Unknown log.level '{}', using info", levelName);
    }

    IMS_LOG_INFO("========================================");
    IMS_LOG_INFO("  Imseries Writer");
    IMS_LOG_INFO("========================================");
    IMS_LOG_INFO("Configuration: {}", configPath.string());

    try {
        // ====================================================================
        // Open Input
        // ====================================================================
        auto seriesResult = OpenInputFromConfig(config);
        if (!seriesResult) {
            IMS_LOG_ERROR("Invalid input: {}", seriesResult.error());
            Log::Shutdown();
            return 1;
        }
        const RawFileSeries& series = *seriesResult;

        // ====================================================================
        // Write
        // ====================================================================
        auto outputFile = config.GetRequired<String>("output.file");
        auto format = config.GetRequired<String>("output.format");
        if (!outputFile || !format) {
            IMS_LOG_ERROR("Invalid output: {}", !outputFile ? outputFile.error() : format.error());
            Log::Shutdown();
            return 1;
        }

        Config options;
        if (config.Has("output.options")) {
            auto table = config.GetTable("output.options");
            if (!table) {
                IMS_LOG_ERROR("Invalid output.options: {}", table.error());
                Log::Shutdown();
                return 1;
            }
            options = std::move(table).value();
        }

        IMS_LOG_INFO("Input:  {} ({} frames, {}x{}, {})", series.GetPath().string(), series.Length(),
                     series.Shape().rows, series.Shape().cols, DTypeName(series.GetDType()));
        IMS_LOG_INFO("Output: {} as '{}'", *outputFile, *format);

        Write(series, *outputFile, *format, options);

        IMS_LOG_INFO("========================================");
        IMS_LOG_INFO("  Write COMPLETED");
        IMS_LOG_INFO("========================================");

    } catch (const WriteError& e) {
        IMS_LOG_ERROR("Write failed (error {}): {}", static_cast<u32>(e.Code()), e.what());
        Log::Shutdown();
        return 1;
    } catch (const std::exception& e) {
        IMS_LOG_ERROR("FATAL ERROR: {}", e.what());
        Log::Shutdown();
        return 1;
    }

    Log::Shutdown();
    return 0;
}
