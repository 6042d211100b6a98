#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>

#include "constants.h"
#include "codec_options.h"

namespace sctp
{

struct config
{
    struct log_t
    {
        std::string level = "info";
        std::string file = "sctp_inspect.log";
    } log;

    struct codec_t
    {
        bool tolerate_nonzero_padding = false;
        bool retain_unrecognized = false;
        std::uint32_t max_packet_size = constants::limits::DEFAULT_MAX_PACKET_SIZE;
        // Treat a checksum mismatch as a failure instead of an advisory.
        bool require_valid_checksum = false;
        // Run packet validation after a successful decode.
        bool validate = true;
    } codec;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> parse_config_text_with_error(const std::string& text);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

[[nodiscard]] codec_options to_codec_options(const config& cfg);

}    // namespace sctp

#endif
