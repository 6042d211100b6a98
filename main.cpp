#include <cerrno>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <optional>

#include "log.h"
#include "config.h"
#include "hex_util.h"
#include "codec_error.h"
#include "sctp_packet.h"
#include "codec_options.h"
#include "packet_format.h"
#include "packet_validation.h"

namespace
{

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s -c <config> <file>     Decode a raw packet file\n", prog);
    std::fprintf(stdout, "%s -c <config> -x <hex>   Decode a packet given as hex text\n", prog);
    std::fprintf(stdout, "%s config                 Dump default configuration\n", prog);
}

int parse_config_from_file(const std::string& file, sctp::config& cfg)
{
    const auto parsed = sctp::parse_config_with_error(file);
    if (!parsed)
    {
        const auto& error = parsed.error();
        std::fprintf(stderr, "parse config failed path %s reason %s\n", error.path.c_str(), error.reason.c_str());
        return -1;
    }
    cfg = *parsed;
    return 0;
}

std::optional<std::vector<std::uint8_t>> read_packet_file(const char* filename)
{
    FILE* f = std::fopen(filename, "rb");
    if (f == nullptr)
    {
        LOG_ERROR("open {} failed {}", filename, std::strerror(errno));
        return std::nullopt;
    }
    std::vector<std::uint8_t> data;
    std::uint8_t buf[16 * 1024];
    for (;;)
    {
        const std::size_t n = std::fread(buf, 1, sizeof buf, f);
        data.insert(data.end(), buf, buf + n);
        if (n < sizeof buf)
        {
            if (std::ferror(f) != 0)
            {
                LOG_ERROR("read {} failed {}", filename, std::strerror(errno));
                std::fclose(f);
                return std::nullopt;
            }
            break;
        }
    }
    std::fclose(f);
    return data;
}

int inspect(const sctp::config& cfg, const std::vector<std::uint8_t>& data)
{
    const auto opts = sctp::to_codec_options(cfg);
    sctp::decode_report report;
    const auto decoded = sctp::decode_packet(data, opts, &report);
    if (!decoded)
    {
        const auto text = sctp::describe(decoded.error());
        std::fprintf(stdout, "decode failed %s\n", text.c_str());
        LOG_WARN("decode of {} bytes failed {}", data.size(), text);
        return 1;
    }

    const auto dump = sctp::format_packet(*decoded);
    std::fprintf(stdout, "%s\n", dump.c_str());
    for (const auto& advisory : report.advisories)
    {
        std::fprintf(stdout, "advisory %s\n", sctp::describe(advisory).c_str());
    }

    int rc = 0;
    if (!report.checksum_ok())
    {
        LOG_WARN("checksum mismatch on {} byte packet", data.size());
        if (cfg.codec.require_valid_checksum)
        {
            rc = 1;
        }
    }
    if (cfg.codec.validate)
    {
        if (const auto valid = sctp::validate_packet(*decoded); !valid)
        {
            std::fprintf(stdout, "validation failed %s\n", sctp::describe(valid.error()).c_str());
            rc = 1;
        }
    }
    LOG_INFO("inspected {} bytes chunks {} advisories {} result {}", data.size(), decoded->chunks.size(), report.advisories.size(), rc);
    return rc;
}

int run_with_config(const char* prog, const char* config_path, const bool hex_input, const char* input)
{
    sctp::config cfg;
    if (parse_config_from_file(config_path, cfg) != 0)
    {
        print_usage(prog);
        return -1;
    }

    init_log(cfg.log.file);
    set_level(cfg.log.level);

    std::optional<std::vector<std::uint8_t>> data;
    if (hex_input)
    {
        data = sctp::hex_to_bytes(input);
        if (!data.has_value())
        {
            LOG_ERROR("invalid hex input");
        }
    }
    else
    {
        data = read_packet_file(input);
    }
    if (!data.has_value())
    {
        shutdown_log();
        return 1;
    }

    const int rc = inspect(cfg, *data);
    shutdown_log();
    return rc;
}

}    // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    const char* mode = argv[1];
    if (std::strcmp(mode, "config") == 0)
    {
        const std::string default_config = sctp::dump_default_config();
        std::fputs(default_config.c_str(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }

    if (std::strcmp(mode, "-c") != 0 || argc <= 3)
    {
        print_usage(argv[0]);
        return -1;
    }

    if (std::strcmp(argv[3], "-x") == 0)
    {
        if (argc <= 4)
        {
            print_usage(argv[0]);
            return -1;
        }
        return run_with_config(argv[0], argv[2], true, argv[4]);
    }
    return run_with_config(argv[0], argv[2], false, argv[3]);
}
