#include "macros.hh"
#include "writer.config.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

namespace {
[[nodiscard]]
bool
validate_output_directory(const fs::path& output_directory)
{
    if (output_directory.empty()) {
        LOG_ERROR("Output directory is empty");
        return false;
    }

    // output directory must exist and be a directory
    std::error_code ec;
    const auto status = fs::status(output_directory, ec);
    if (ec || !fs::exists(status)) {
        LOG_ERROR("Output directory ", output_directory, " does not exist");
        return false;
    }

    if (!fs::is_directory(status)) {
        LOG_ERROR("Output directory ", output_directory, " is not a directory");
        return false;
    }

    // output directory must be writable
    const auto perms = status.permissions();
    const bool is_writable =
      (perms & (fs::perms::owner_write | fs::perms::group_write |
                fs::perms::others_write)) != fs::perms::none;

    if (!is_writable) {
        LOG_ERROR("Output directory ", output_directory, " is not writable");
        return false;
    }

    return true;
}

[[nodiscard]]
bool
validate_naming_scheme(std::string_view naming_scheme)
{
    if (chunked::is_empty_string(naming_scheme, "Naming scheme is empty")) {
        return false;
    }

    if (naming_scheme.find_first_of("/\\") != std::string_view::npos) {
        LOG_ERROR("Naming scheme '",
                  naming_scheme,
                  "' must not contain a path separator");
        return false;
    }

    return true;
}

[[nodiscard]]
bool
validate_compression(const chunked::CompressionMode& mode)
{
    if (const auto* gzip = std::get_if<chunked::compression::Gzip>(&mode)) {
        if (gzip->level < -1 || gzip->level > 9) {
            LOG_ERROR("Invalid compression level: ",
                      gzip->level,
                      ". Must be between 0 and 9, or -1 for the default");
            return false;
        }
    }

    return true;
}

template<typename T>
T
required_value(const nlohmann::json& doc, const char* key)
{
    EXPECT_CONFIG(doc.contains(key), "Missing required key '", key, "'");
    try {
        return doc.at(key).get<T>();
    } catch (const nlohmann::json::exception& exc) {
        EXPECT_CONFIG(false, "Invalid value for '", key, "': ", exc.what());
    }
    return {};
}
} // namespace

void
chunked::validate_writer_config(const WriterConfig& config)
{
    EXPECT_CONFIG(validate_output_directory(config.output_directory),
                  "Invalid output directory: ",
                  config.output_directory);

    EXPECT_CONFIG(config.max_chunk_size_mb > 0,
                  "Maximum chunk size must be positive");

    EXPECT_CONFIG(validate_naming_scheme(trim(config.naming_scheme)),
                  "Invalid naming scheme: '",
                  config.naming_scheme,
                  "'");

    EXPECT_CONFIG(validate_compression(config.compression),
                  "Invalid compression settings");
}

chunked::WriterConfig
chunked::writer_config_from_json(std::string_view json)
{
    auto doc = nlohmann::json::parse(json.begin(),
                                     json.end(),
                                     nullptr, // callback
                                     false,   // allow exceptions
                                     true     // ignore comments
    );

    EXPECT_CONFIG(!doc.is_discarded(), "Invalid JSON: ", json);
    EXPECT_CONFIG(doc.is_object(), "Writer configuration must be an object");

    WriterConfig config;
    config.output_directory =
      required_value<std::string>(doc, "output_directory");
    config.naming_scheme = required_value<std::string>(doc, "naming_scheme");

    const auto max_chunk_size_mb =
      required_value<nlohmann::json>(doc, "max_chunk_size_mb");
    EXPECT_CONFIG(max_chunk_size_mb.is_number_unsigned() &&
                    max_chunk_size_mb.get<uint64_t>() <= UINT32_MAX,
                  "Invalid value for 'max_chunk_size_mb': ",
                  max_chunk_size_mb.dump());
    config.max_chunk_size_mb = max_chunk_size_mb.get<uint32_t>();

    std::string compression = "gzip";
    if (doc.contains("compression")) {
        compression = required_value<std::string>(doc, "compression");
    }

    int level = 0;
    if (doc.contains("compression_level")) {
        const auto value =
          required_value<nlohmann::json>(doc, "compression_level");
        EXPECT_CONFIG(value.is_number_integer(),
                      "Invalid value for 'compression_level': ",
                      value.dump());

        // unsigned values above INT64_MAX are rejected by the range check
        const bool in_range =
          value.is_number_unsigned()
            ? value.get<uint64_t>() <= 9
            : value.get<int64_t>() >= 0 && value.get<int64_t>() <= 9;
        EXPECT_CONFIG(in_range,
                      "Invalid compression level: ",
                      value.dump(),
                      ". Must be between 0 and 9");
        level = value.get<int>();
    }

    if (compression == "gzip") {
        config.compression = compression::Gzip{ level == 0 ? -1 : level };
    } else if (compression == "none") {
        config.compression = compression::Plain{};
    } else {
        EXPECT_CONFIG(false, "Unknown compression: '", compression, "'");
    }

    return config;
}
