#include <cstdio>
#include <string>
#include <fstream>
#include <unistd.h>

#include <gtest/gtest.h>

#include "config.h"
#include "constants.h"
#include "codec_options.h"

namespace
{

class config_test : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmp_file_ = std::string("test_config_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(::getpid()) + ".json";
    }

    void TearDown() override { std::remove(tmp_file_.c_str()); }

    void write_config_file(const std::string& content)
    {
        std::ofstream out(tmp_file_);
        out << content;
        out.close();
    }

    const std::string& tmp_file() const { return tmp_file_; }

   private:
    std::string tmp_file_;
};

TEST_F(config_test, DefaultConfigRoundTrips)
{
    const auto json = sctp::dump_default_config();
    ASSERT_FALSE(json.empty());
    EXPECT_NE(json.find("\"codec\""), std::string::npos);
    EXPECT_NE(json.find("\"max_packet_size\": 65535"), std::string::npos);

    write_config_file(json);
    const auto cfg = sctp::parse_config(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log.level, "info");
    EXPECT_FALSE(cfg->codec.tolerate_nonzero_padding);
    EXPECT_FALSE(cfg->codec.retain_unrecognized);
    EXPECT_FALSE(cfg->codec.require_valid_checksum);
    EXPECT_TRUE(cfg->codec.validate);
    EXPECT_EQ(cfg->codec.max_packet_size, constants::limits::DEFAULT_MAX_PACKET_SIZE);
}

TEST_F(config_test, ParseValues)
{
    write_config_file(R"({
        "log": {"level": "debug", "file": "inspect.log"},
        "codec": {
            "tolerate_nonzero_padding": true,
            "retain_unrecognized": true,
            "max_packet_size": 1500,
            "require_valid_checksum": true,
            "validate": false
        }
    })");

    const auto cfg = sctp::parse_config_with_error(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log.level, "debug");
    EXPECT_EQ(cfg->log.file, "inspect.log");
    EXPECT_TRUE(cfg->codec.tolerate_nonzero_padding);
    EXPECT_TRUE(cfg->codec.retain_unrecognized);
    EXPECT_EQ(cfg->codec.max_packet_size, 1500U);
    EXPECT_TRUE(cfg->codec.require_valid_checksum);
    EXPECT_FALSE(cfg->codec.validate);

    const auto opts = sctp::to_codec_options(*cfg);
    EXPECT_TRUE(opts.tolerate_nonzero_padding);
    EXPECT_TRUE(opts.retain_unrecognized);
    EXPECT_EQ(opts.max_packet_size, 1500U);
}

TEST_F(config_test, MissingFieldsUseDefaults)
{
    const auto cfg = sctp::parse_config_text_with_error(R"({"codec": {"retain_unrecognized": true}})");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->codec.retain_unrecognized);
    EXPECT_EQ(cfg->log.file, "sctp_inspect.log");
    EXPECT_EQ(cfg->codec.max_packet_size, 65535U);

    EXPECT_TRUE(sctp::parse_config_text_with_error("{}").has_value());
}

TEST_F(config_test, MissingFile)
{
    const auto cfg = sctp::parse_config_with_error("non_existent_file.json");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().path, "/");
    EXPECT_NE(cfg.error().reason.find("open file failed"), std::string::npos);
    EXPECT_FALSE(sctp::parse_config("non_existent_file.json").has_value());
}

TEST_F(config_test, InvalidJsonReportsOffset)
{
    const auto cfg = sctp::parse_config_text_with_error("{\"log\": ");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().path, "/");
    EXPECT_NE(cfg.error().reason.find("json parse error"), std::string::npos);

    const auto nul = sctp::parse_config_text_with_error(std::string("{}\0", 3));
    ASSERT_FALSE(nul.has_value());
    EXPECT_NE(nul.error().reason.find("embedded nul"), std::string::npos);

    const auto array = sctp::parse_config_text_with_error("[]");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().path, "/");
}

TEST_F(config_test, WrongTypeReportsPath)
{
    const auto bool_as_string = sctp::parse_config_text_with_error(R"({"codec": {"validate": "yes"}})");
    ASSERT_FALSE(bool_as_string.has_value());
    EXPECT_EQ(bool_as_string.error().path, "/codec/validate");

    const auto negative = sctp::parse_config_text_with_error(R"({"codec": {"max_packet_size": -1}})");
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().path, "/codec/max_packet_size");

    const auto section = sctp::parse_config_text_with_error(R"({"log": 3})");
    ASSERT_FALSE(section.has_value());
    EXPECT_EQ(section.error().path, "/log");

    const auto level = sctp::parse_config_text_with_error(R"({"log": {"level": 1}})");
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().path, "/log/level");
}

TEST_F(config_test, ValidationReportsPath)
{
    const auto too_small = sctp::parse_config_text_with_error(R"({"codec": {"max_packet_size": 11}})");
    ASSERT_FALSE(too_small.has_value());
    EXPECT_EQ(too_small.error().path, "/codec/max_packet_size");

    const auto too_large = sctp::parse_config_text_with_error(R"({"codec": {"max_packet_size": 65536}})");
    ASSERT_FALSE(too_large.has_value());
    EXPECT_EQ(too_large.error().path, "/codec/max_packet_size");

    EXPECT_TRUE(sctp::parse_config_text_with_error(R"({"codec": {"max_packet_size": 12}})").has_value());

    const auto level = sctp::parse_config_text_with_error(R"({"log": {"level": "verbose"}})");
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().path, "/log/level");
}

TEST_F(config_test, DumpReflectsValues)
{
    sctp::config cfg;
    cfg.log.level = "warn";
    cfg.codec.retain_unrecognized = true;
    const auto json = sctp::dump_config(cfg);
    const auto parsed = sctp::parse_config_text_with_error(json);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->log.level, "warn");
    EXPECT_TRUE(parsed->codec.retain_unrecognized);
}

}    // namespace
