#include <cerrno>
#include <cstdio>
#include <string>
#include <cstdint>
#include <cstring>
#include <utility>
#include <expected>
#include <optional>

#include "config.h"
#include "constants.h"
#include "codec_options.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include "rapidjson/error/error.h"

namespace sctp
{

namespace
{

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

[[nodiscard]] std::expected<void, config_error> read_string(const rapidjson::Value& obj, const char* name, const std::string& parent, std::string& out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return {};
    }
    if (!it->value.IsString())
    {
        return std::unexpected(make_config_error(parent + "/" + name, "invalid type or value"));
    }
    out.assign(it->value.GetString(), it->value.GetStringLength());
    return {};
}

[[nodiscard]] std::expected<void, config_error> read_bool(const rapidjson::Value& obj, const char* name, const std::string& parent, bool& out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return {};
    }
    if (!it->value.IsBool())
    {
        return std::unexpected(make_config_error(parent + "/" + name, "invalid type or value"));
    }
    out = it->value.GetBool();
    return {};
}

[[nodiscard]] std::expected<void, config_error> read_u32(const rapidjson::Value& obj, const char* name, const std::string& parent, std::uint32_t& out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return {};
    }
    if (!it->value.IsUint())
    {
        return std::unexpected(make_config_error(parent + "/" + name, "invalid type or value"));
    }
    out = it->value.GetUint();
    return {};
}

[[nodiscard]] std::expected<const rapidjson::Value*, config_error> find_object(const rapidjson::Value& obj, const char* name)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return nullptr;
    }
    if (!it->value.IsObject())
    {
        return std::unexpected(make_config_error(std::string("/") + name, "invalid type or value"));
    }
    return &it->value;
}

[[nodiscard]] std::expected<void, config_error> read_log_section(const rapidjson::Value& doc, config::log_t& log)
{
    const auto section = find_object(doc, "log");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**section, "level", "/log", log.level); !r)
    {
        return r;
    }
    return read_string(**section, "file", "/log", log.file);
}

[[nodiscard]] std::expected<void, config_error> read_codec_section(const rapidjson::Value& doc, config::codec_t& codec)
{
    const auto section = find_object(doc, "codec");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    if (*section == nullptr)
    {
        return {};
    }
    const auto& obj = **section;
    if (auto r = read_bool(obj, "tolerate_nonzero_padding", "/codec", codec.tolerate_nonzero_padding); !r)
    {
        return r;
    }
    if (auto r = read_bool(obj, "retain_unrecognized", "/codec", codec.retain_unrecognized); !r)
    {
        return r;
    }
    if (auto r = read_u32(obj, "max_packet_size", "/codec", codec.max_packet_size); !r)
    {
        return r;
    }
    if (auto r = read_bool(obj, "require_valid_checksum", "/codec", codec.require_valid_checksum); !r)
    {
        return r;
    }
    return read_bool(obj, "validate", "/codec", codec.validate);
}

[[nodiscard]] bool is_known_level(const std::string& level)
{
    for (const char* name : {"trace", "debug", "info", "warn", "warning", "err", "error", "off"})
    {
        if (level == name)
        {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (!is_known_level(cfg.log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be trace, debug, info, warn, error or off"));
    }
    if (cfg.log.file.find('\0') != std::string::npos)
    {
        return std::unexpected(make_config_error("/log/file", "must not contain nul"));
    }
    if (cfg.codec.max_packet_size < constants::limits::MIN_PACKET_SIZE || cfg.codec.max_packet_size > constants::limits::DEFAULT_MAX_PACKET_SIZE)
    {
        return std::unexpected(make_config_error("/codec/max_packet_size", "must be between 12 and 65535"));
    }
    return {};
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024] = {0};
    std::string result;
    FILE* f = fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (ferror(f) != 0)
            {
                fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    fclose(f);
    return result;
}

}    // namespace

std::expected<config, config_error> parse_config_text_with_error(const std::string& text)
{
    if (const auto nul_pos = text.find('\0'); nul_pos != std::string::npos)
    {
        return std::unexpected(make_config_error("/", "json parse error at offset " + std::to_string(nul_pos) + ": embedded nul byte"));
    }
    rapidjson::Document doc;
    const rapidjson::ParseResult parse_result = doc.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }
    if (!doc.IsObject())
    {
        return std::unexpected(make_config_error("/", "invalid type or value"));
    }

    config cfg;
    if (const auto log_result = read_log_section(doc, cfg.log); !log_result)
    {
        return std::unexpected(log_result.error());
    }
    if (const auto codec_result = read_codec_section(doc, cfg.codec); !codec_result)
    {
        return std::unexpected(codec_result.error());
    }
    if (const auto validate_result = validate_config(cfg); !validate_result)
    {
        return std::unexpected(validate_result.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return parse_config_text_with_error(*file_content);
}

std::optional<config> parse_config(const std::string& filename)
{
    const auto parsed = parse_config_with_error(filename);
    if (!parsed)
    {
        return std::nullopt;
    }
    return *parsed;
}

std::string dump_config(const config& cfg)
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();

    writer.Key("log");
    writer.StartObject();
    writer.Key("level");
    writer.String(cfg.log.level.c_str(), static_cast<rapidjson::SizeType>(cfg.log.level.size()));
    writer.Key("file");
    writer.String(cfg.log.file.c_str(), static_cast<rapidjson::SizeType>(cfg.log.file.size()));
    writer.EndObject();

    writer.Key("codec");
    writer.StartObject();
    writer.Key("tolerate_nonzero_padding");
    writer.Bool(cfg.codec.tolerate_nonzero_padding);
    writer.Key("retain_unrecognized");
    writer.Bool(cfg.codec.retain_unrecognized);
    writer.Key("max_packet_size");
    writer.Uint(cfg.codec.max_packet_size);
    writer.Key("require_valid_checksum");
    writer.Bool(cfg.codec.require_valid_checksum);
    writer.Key("validate");
    writer.Bool(cfg.codec.validate);
    writer.EndObject();

    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

std::string dump_default_config() { return dump_config(config{}); }

codec_options to_codec_options(const config& cfg)
{
    codec_options opts;
    opts.tolerate_nonzero_padding = cfg.codec.tolerate_nonzero_padding;
    opts.retain_unrecognized = cfg.codec.retain_unrecognized;
    opts.max_packet_size = cfg.codec.max_packet_size;
    return opts;
}

}    // namespace sctp
