// tests/test_config.cpp
//
// RegistryConfig layering: defaults, config file, environment, validation.

#include "test_preamble.h"

#include <cstdlib>
#include <optional>

#include "simpaths/registry/config.hpp"

using simpaths::registry::RegistryConfig;

namespace
{

// Sets an environment variable for the lifetime of the object.
class ScopedEnv
{
  public:
    ScopedEnv(const char *name, const char *value) : m_name(name)
    {
        if (const char *old = std::getenv(name))
            m_old = old;
        ::setenv(name, value, 1);
    }
    ~ScopedEnv()
    {
        if (m_old)
            ::setenv(m_name, m_old->c_str(), 1);
        else
            ::unsetenv(m_name);
    }
    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    const char *m_name;
    std::optional<std::string> m_old;
};

} // namespace

class ConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        for (const char *v : {"SIMPATHS_CONFIG_FILE", "SIMPATHS_PATHS_DIR", "SIMPATHS_SIMS_DIR",
                              "SIMPATHS_LOCK_TIMEOUT_MS", "SIMPATHS_LOG_LEVEL"})
            ::unsetenv(v);
        dir_ = fs::temp_directory_path() / ("simpaths_config_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write_config(const json &doc)
    {
        const auto p = dir_ / "simpaths.json";
        std::ofstream os(p, std::ios::trunc);
        os << doc.dump(2);
        return p;
    }

    fs::path dir_;
};

TEST_F(ConfigTest, DefaultsNeedDirectories)
{
    RegistryConfig cfg;
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.fetch_endpoint, "/fetch");
    EXPECT_EQ(cfg.log_level, "info");

    auto st = cfg.validate();
    EXPECT_FALSE(st.ok);
    EXPECT_NE(st.message.find("registry directory"), std::string::npos);

    auto loaded = RegistryConfig::load();
    EXPECT_FALSE(loaded.ok);
}

TEST_F(ConfigTest, LoadsFileRelativeToItsDirectory)
{
    const auto file = write_config({{"registry",
                                     {{"paths_dir", "paths"},
                                      {"sims_dir", "/data/sims"},
                                      {"lock_timeout_ms", 250},
                                      {"fetch_endpoint", "/files"}}},
                                    {"logging", {{"level", "debug"}, {"file", "simpaths.log"}}}});
    auto r = RegistryConfig::load(file);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.message, "Configuration loaded");
    const auto &cfg = r.content();
    EXPECT_EQ(cfg.registry_dir, fs::weakly_canonical(dir_ / "paths"));
    EXPECT_EQ(cfg.artifact_dir, fs::path("/data/sims"));
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.fetch_endpoint, "/files");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file.filename(), "simpaths.log");
}

TEST_F(ConfigTest, EnvironmentOverridesFile)
{
    const auto file = write_config({{"registry", {{"paths_dir", "/a"}, {"sims_dir", "/b"}, {"lock_timeout_ms", 10}}}});
    ScopedEnv cfg_env("SIMPATHS_CONFIG_FILE", file.c_str());
    ScopedEnv sims_env("SIMPATHS_SIMS_DIR", "/override/sims");
    ScopedEnv timeout_env("SIMPATHS_LOCK_TIMEOUT_MS", "1234");
    ScopedEnv level_env("SIMPATHS_LOG_LEVEL", "warn");

    auto r = RegistryConfig::load();
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.content().registry_dir, fs::path("/a"));
    EXPECT_EQ(r.content().artifact_dir, fs::path("/override/sims"));
    EXPECT_EQ(r.content().lock_timeout, std::chrono::milliseconds(1234));
    EXPECT_EQ(r.content().log_level, "warn");
}

TEST_F(ConfigTest, RejectsBadValues)
{
    {
        ScopedEnv paths("SIMPATHS_PATHS_DIR", "/a");
        ScopedEnv sims("SIMPATHS_SIMS_DIR", "/b");
        ScopedEnv timeout("SIMPATHS_LOCK_TIMEOUT_MS", "soon");
        auto r = RegistryConfig::load();
        EXPECT_FALSE(r.ok);
        EXPECT_NE(r.message.find("SIMPATHS_LOCK_TIMEOUT_MS"), std::string::npos);
    }
    {
        const auto file =
            write_config({{"registry", {{"paths_dir", "/a"}, {"sims_dir", "/b"}}}, {"logging", {{"level", "chatty"}}}});
        auto r = RegistryConfig::load(file);
        EXPECT_FALSE(r.ok);
        EXPECT_NE(r.message.find("chatty"), std::string::npos);
    }
    {
        const auto file = write_config({{"registry", {{"paths_dir", 5}}}});
        auto r = RegistryConfig::load(file);
        EXPECT_FALSE(r.ok);
        EXPECT_NE(r.message.find("invalid config value"), std::string::npos);
    }
}

TEST_F(ConfigTest, UnreadableConfigFile)
{
    auto missing = RegistryConfig::load(dir_ / "absent.json");
    EXPECT_FALSE(missing.ok);
    EXPECT_NE(missing.message.find("could not be read"), std::string::npos);

    const auto broken = dir_ / "broken.json";
    {
        std::ofstream os(broken);
        os << "{ registry";
    }
    auto parsed = RegistryConfig::load(broken);
    EXPECT_FALSE(parsed.ok);
    EXPECT_NE(parsed.message.find("could not be parsed"), std::string::npos);
}
