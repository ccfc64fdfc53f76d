// tests/test_jsonfile.cpp
//
// atomic_write_json / read_json_file: replacement semantics and error reporting.

#include "test_preamble.h"

#include "simpaths/utils/JsonFile.hpp"

using simpaths::utils::atomic_write_json;
using simpaths::utils::read_json_file;

class JsonFileTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / ("simpaths_jsonfile_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    size_t count_temporaries() const
    {
        size_t n = 0;
        for (const auto &de : fs::directory_iterator(dir_))
        {
            if (de.path().filename().string().find(".tmp.") != std::string::npos)
                ++n;
        }
        return n;
    }

    fs::path dir_;
};

TEST_F(JsonFileTest, WriteThenReadBack)
{
    const auto target = dir_ / "alice.json";
    const json doc = {{"/as", {{"path", "/as"}, {"holding", "inf"}}}};

    std::error_code ec;
    ASSERT_TRUE(atomic_write_json(target, doc, &ec, 1)) << ec.message();
    EXPECT_FALSE(ec);

    auto back = read_json_file(target, &ec);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, doc);
    EXPECT_EQ(count_temporaries(), 0u);
}

TEST_F(JsonFileTest, ReplaceKeepsExistingMode)
{
    const auto target = dir_ / "mode.json";
    ASSERT_TRUE(atomic_write_json(target, json{{"v", 1}}));
    ASSERT_EQ(::chmod(target.c_str(), 0640), 0);

    ASSERT_TRUE(atomic_write_json(target, json{{"v", 2}}));
    struct stat st
    {
    };
    ASSERT_EQ(::stat(target.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0640u);
    EXPECT_EQ((*read_json_file(target))["v"], 2);
}

TEST_F(JsonFileTest, CreatesParentDirectory)
{
    const auto target = dir_ / "a" / "b" / "c.json";
    ASSERT_TRUE(atomic_write_json(target, json::array({1, 2, 3})));
    EXPECT_TRUE(fs::is_regular_file(target));
}

TEST_F(JsonFileTest, RefusesSymlinkTarget)
{
    const auto real = dir_ / "real.json";
    const auto link = dir_ / "link.json";
    ASSERT_TRUE(atomic_write_json(real, json{{"v", "original"}}));
    fs::create_symlink(real, link);

    std::error_code ec;
    EXPECT_FALSE(atomic_write_json(link, json{{"v", "replaced"}}, &ec));
    EXPECT_TRUE(ec);
    EXPECT_EQ((*read_json_file(real))["v"], "original");
    EXPECT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(count_temporaries(), 0u);
}

TEST_F(JsonFileTest, FailedWriteLeavesTargetUntouched)
{
    const auto target = dir_ / "keep.json";
    ASSERT_TRUE(atomic_write_json(target, json{{"v", 1}}));

    // Invalid UTF-8 makes serialization fail before anything touches the disk.
    std::error_code ec;
    EXPECT_FALSE(atomic_write_json(target, json{{"v", std::string("\xff\xfe")}}, &ec));
    EXPECT_TRUE(ec);
    EXPECT_EQ((*read_json_file(target))["v"], 1);
    EXPECT_EQ(count_temporaries(), 0u);
}

TEST_F(JsonFileTest, ReadMissingFile)
{
    std::error_code ec;
    auto r = read_json_file(dir_ / "absent.json", &ec);
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST_F(JsonFileTest, ReadCorruptFile)
{
    const auto target = dir_ / "corrupt.json";
    {
        std::ofstream os(target);
        os << "{ \"/as\": ";
    }
    std::error_code ec;
    std::string detail;
    auto r = read_json_file(target, &ec, &detail);
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(ec, std::errc::illegal_byte_sequence);
    EXPECT_FALSE(detail.empty());
}
