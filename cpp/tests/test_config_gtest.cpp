// ==============================================================================
// test_config_gtest.cpp - Тесты загрузки YAML-конфигурации (GoogleTest)
// ==============================================================================

#include "fontlist/config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fontlist::config::test {

namespace {

platform::EnvLookup make_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        auto it = vars.find(std::string(name));
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

ConfigResult parse(const std::string& yaml) {
    return parse_config(yaml, "test.yml", std::filesystem::path(), make_env({}));
}

}  // namespace

// ==============================================================================
// Формат вывода
// ==============================================================================

TEST(ConfigFormatTest, FromString_KnownNames) {
    EXPECT_EQ(format_from_string("table"), output::Format::Std);
    EXPECT_EQ(format_from_string("json"), output::Format::Json);
    EXPECT_EQ(format_from_string("JSONL"), output::Format::Jsonl);
    EXPECT_EQ(format_from_string("Csv"), output::Format::Csv);
    EXPECT_FALSE(format_from_string("xml").has_value());
}

// ==============================================================================
// parse_config
// ==============================================================================

TEST(ConfigTest, EmptyDocument_EmptyConfig) {
    auto result = parse("");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_FALSE(result.config.names.has_value());
    EXPECT_FALSE(result.config.scopes.has_value());
    EXPECT_FALSE(result.config.format.has_value());
    EXPECT_FALSE(result.config.skip_errors.has_value());
    EXPECT_TRUE(result.config.directories.empty());
}

TEST(ConfigTest, FullDocument) {
    // Arrange
    const std::string yaml = R"(
names: ["Arial*", "*.otf"]
scopes: [AllUsers, currentuser]
format: json
skip_errors: true
)";

    // Act
    auto result = parse(yaml);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    const Config& cfg = result.config;
    ASSERT_TRUE(cfg.names.has_value());
    std::vector<std::string> names = {"Arial*", "*.otf"};
    EXPECT_EQ(*cfg.names, names);
    ASSERT_TRUE(cfg.scopes.has_value());
    std::vector<Scope> scopes = {Scope::AllUsers, Scope::CurrentUser};
    EXPECT_EQ(*cfg.scopes, scopes);
    EXPECT_EQ(cfg.format, output::Format::Json);
    EXPECT_EQ(cfg.skip_errors, true);
}

TEST(ConfigTest, ScalarInsteadOfList) {
    auto result = parse("names: Arial*\nscopes: AllUsers\n");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(*result.config.names, std::vector<std::string>{"Arial*"});
    EXPECT_EQ(*result.config.scopes, std::vector<Scope>{Scope::AllUsers});
}

TEST(ConfigTest, UnknownKeys_Ignored) {
    auto result = parse("color: always\nformat: csv\n");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.format, output::Format::Csv);
}

TEST(ConfigTest, InvalidScope_Error) {
    auto result = parse("scopes: [CurrentUser, System]\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "invalid scope 'System', must be: CurrentUser or AllUsers");
    EXPECT_FALSE(result.config.scopes.has_value());
}

TEST(ConfigTest, InvalidFormat_Error) {
    auto result = parse("format: xml\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "invalid format 'xml', must be: table, json, jsonl or csv");
}

TEST(ConfigTest, TopLevelNotMapping_Error) {
    auto result = parse("- a\n- b\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "top level must be a mapping");
}

TEST(ConfigTest, NamesNotStrings_Error) {
    auto result = parse("names:\n  nested: value\n");

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("'names'"), std::string::npos);
}

TEST(ConfigTest, SkipErrorsNotBool_Error) {
    auto result = parse("skip_errors: sometimes\n");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.message.empty());
}

TEST(ConfigTest, SyntaxError_ReportedWithSource) {
    auto result = parse("names: [unterminated\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.path, "test.yml");
    EXPECT_EQ(result.error.format().rfind("failed to load config 'test.yml' - ", 0), 0u);
}

// ==============================================================================
// directories
// ==============================================================================

TEST(ConfigTest, Directories_ExpandedAndResolved) {
    // Arrange
    auto env = make_env({{platform::home_env_name(), "/home/alice"}, {"FONTS", "/opt/fonts"}});
    const std::string yaml = R"(
directories:
  CurrentUser: ~/my-fonts
  AllUsers: "%FONTS%/shared"
)";

    // Act
    auto result = parse_config(yaml, "cfg.yml", std::filesystem::path("/etc/fontlist"), env);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    const auto& dirs = result.config.directories;
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(platform::path_to_utf8(dirs.at(Scope::CurrentUser)), "/home/alice/my-fonts");
    EXPECT_EQ(platform::path_to_utf8(dirs.at(Scope::AllUsers)), "/opt/fonts/shared");
}

TEST(ConfigTest, Directories_RelativeToConfigDirectory) {
    auto base = std::filesystem::path("base") / "dir";

    auto result = parse_config("directories:\n  CurrentUser: fonts\n", "cfg.yml", base,
                               make_env({}));

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(result.config.directories.at(Scope::CurrentUser) == base / "fonts");
}

TEST(ConfigTest, Directories_UnknownScope_Error) {
    auto result = parse("directories:\n  Everyone: /fonts\n");

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("invalid scope 'Everyone'"), std::string::npos);
}

TEST(ConfigTest, Directories_UnexpandableVariable_Error) {
    auto result = parse("directories:\n  AllUsers: \"%MISSING%/fonts\"\n");

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("could not be expanded"), std::string::npos);
}

TEST(ConfigTest, Directories_NotMapping_Error) {
    auto result = parse("directories: /fonts\n");

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("'directories'"), std::string::npos);
}

// ==============================================================================
// load_config (файл)
// ==============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("fontlist_config_") + test_info->name() + "_" +
                     std::to_string(
#ifdef _WIN32
                         GetCurrentProcessId()
#else
                         getpid()
#endif
                             ));
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

TEST_F(ConfigFileTest, LoadConfig_ReadsFile) {
    auto path = write_file("fontlist.yml", "names: [\"*.ttf\"]\ndirectories:\n  AllUsers: shared\n");

    auto result = load_config(path, make_env({}));

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(*result.config.names, std::vector<std::string>{"*.ttf"});
    EXPECT_TRUE(result.config.directories.at(Scope::AllUsers) == test_dir_ / "shared");
}

TEST_F(ConfigFileTest, LoadConfig_MissingFile_Error) {
    auto path = test_dir_ / "missing.yml";

    auto result = load_config(path, make_env({}));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "file could not be opened");
    EXPECT_EQ(result.error.path, platform::path_to_utf8(path));
}

TEST_F(ConfigFileTest, LoadConfig_EmptyFile_Ok) {
    auto path = write_file("empty.yml", "");

    auto result = load_config(path, make_env({}));

    EXPECT_TRUE(result.ok);
}

}  // namespace fontlist::config::test
