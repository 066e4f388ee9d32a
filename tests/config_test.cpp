#include <gtest/gtest.h>
#include <algorithm>
#include <yaml-cpp/yaml.h>

#include "infra/config/config.hpp"
#include "infra/config/document.hpp"
#include "test_support.hpp"

using dirshift::infra::ConfigDocument;
using dirshift::infra::ErrorCode;
using dirshift::infra::Settings;
using dirshift::testing::TempDir;
using dirshift::testing::write_file;

TEST(ConfigDocumentTest, QueryFollowsKeysAndIndices)
{
    ConfigDocument doc{YAML::Load(R"(
transfer_groups:
  - destination_base: /base
    sources: [/a, /b]
)")};
    EXPECT_EQ(doc.query_string("transfer_groups[0].destination_base"), "/base");
    EXPECT_EQ(doc.query_string("transfer_groups[0].sources[1]"), "/b");
    EXPECT_EQ(doc.length("transfer_groups[0].sources"), 2u);
}

TEST(ConfigDocumentTest, AbsentValuesReadAsAbsent)
{
    ConfigDocument doc{YAML::Load(R"(
transfers:
  - source: /a
    destination: ~
)")};
    EXPECT_FALSE(doc.query("transfers[0].destination").has_value());
    EXPECT_FALSE(doc.query("transfers[3].source").has_value());
    EXPECT_FALSE(doc.query("transfer_groups").has_value());
    EXPECT_FALSE(doc.query("transfers[0].source.deeper").has_value());
    EXPECT_FALSE(doc.query("transfers[x]").has_value());
    EXPECT_EQ(doc.length("transfer_groups"), 0u);
}

TEST(ConfigDocumentTest, QueryDoesNotModifyTheTree)
{
    ConfigDocument doc{YAML::Load("transfers: [{source: /a, destination: /b}]")};
    (void)doc.query("transfers[0].missing");
    (void)doc.query("other");
    EXPECT_FALSE(doc.root()["other"].IsDefined());
    EXPECT_EQ(doc.root()["transfers"][0].size(), 2u);
}

TEST(ConfigDocumentTest, MissingFileIsConfigError)
{
    TempDir tmp;
    auto doc = dirshift::infra::load_transfer_document(tmp / "absent.yaml");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().code, ErrorCode::ConfigError);
}

TEST(ConfigDocumentTest, MalformedYamlIsConfigError)
{
    TempDir tmp;
    write_file(tmp / "bad.yaml", "transfers: [ {source: /a\n");
    auto doc = dirshift::infra::load_transfer_document(tmp / "bad.yaml");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().code, ErrorCode::ConfigError);
}

TEST(ConfigDocumentTest, CsvFilesAreCompiled)
{
    TempDir tmp;
    write_file(tmp / "jobs.csv", "source,destination\n/a,/b\n");
    auto doc = dirshift::infra::load_transfer_document(tmp / "jobs.csv");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->query_string("transfers[0].destination"), "/b");
}

TEST(SettingsTest, MissingFileGivesDefaults)
{
    TempDir tmp;
    auto settings = dirshift::infra::load_settings_from({tmp / "none.yaml"});
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->rsync(), "rsync");
    EXPECT_FALSE(settings->checksum);
}

TEST(SettingsTest, FileValuesAreRead)
{
    TempDir tmp;
    write_file(tmp / "config.yaml", R"(
rsync_binary: /opt/bin/rsync
rsync_args: [--bwlimit=5000]
exclude: ["*.tmp"]
checksum: true
)");
    auto settings = dirshift::infra::load_settings_from({tmp / "none.yaml", tmp / "config.yaml"});
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->rsync(), "/opt/bin/rsync");
    EXPECT_EQ(settings->rsync_args, std::vector<std::string>{"--bwlimit=5000"});
    EXPECT_TRUE(settings->checksum);
}

TEST(SettingsTest, MalformedFileIsReported)
{
    TempDir tmp;
    write_file(tmp / "config.yaml", "checksum: [not, a, bool]\n");
    auto settings = dirshift::infra::load_settings_from({tmp / "config.yaml"});
    EXPECT_FALSE(settings.has_value());
}

TEST(SettingsTest, CliOverridesFile)
{
    Settings file;
    file.rsync_binary = "/usr/bin/rsync";
    file.exclude_patterns = {"*.tmp"};

    Settings cli;
    cli.rsync_binary = "/custom/rsync";
    cli.exclude_patterns = {"*.bak"};
    cli.verbose = true;

    file.merge_with(cli);
    EXPECT_EQ(file.rsync(), "/custom/rsync");
    EXPECT_EQ(file.exclude_patterns, (std::vector<std::string>{"*.tmp", "*.bak"}));
    EXPECT_TRUE(file.verbose);
}

TEST(SettingsTest, DefaultExcludesAlwaysApply)
{
    Settings settings;
    settings.exclude_patterns = {"*.tmp", ".DS_Store"};
    const auto patterns = settings.effective_excludes();

    EXPECT_EQ(patterns.size(), dirshift::infra::default_excludes().size() + 1);
    EXPECT_NE(std::find(patterns.begin(), patterns.end(), "*.tmp"), patterns.end());
    EXPECT_NE(std::find(patterns.begin(), patterns.end(), "._*"), patterns.end());
}

TEST(ConfigDocumentTest, MissingKeysNeverThrow)
{
    ConfigDocument doc{YAML::Load("transfers: [{source: /s, destination: /d}]")};
    EXPECT_NO_THROW({
        EXPECT_FALSE(doc.query("transfer_groups").has_value());
        EXPECT_FALSE(doc.query("transfers[0].preserve_source_name").has_value());
        EXPECT_FALSE(doc.query_string("transfer_groups[0].destination_base").has_value());
    });
}
