#include "formsave/core/SaveDirectory.hpp"
#include "formsave/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace formsave {
namespace core {

namespace fs = std::filesystem;

class SaveDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        formsave::Logger::getInstance().initialize("logs/SaveDirectory_test.log",
                                                   formsave::Logger::Level::DEBUG,
                                                   false);
        test_dir_ = fs::path("test_save_directory");
        fs::remove_all(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
        formsave::Logger::getInstance().shutdown();
    }

    // 辅助函数：在目录中写一个文件
    static void touch(const fs::path& path) {
        std::ofstream(path) << "data";
    }

    fs::path test_dir_;
};

TEST_F(SaveDirectoryTest, TemporaryIsRemovedOnDestruction) {
    fs::path path;
    {
        auto dir = SaveDirectory::createTemp("formsave_test");
        ASSERT_TRUE(dir.hasValue());
        EXPECT_TRUE(dir->isTemporary());
        path = dir->path();
        EXPECT_TRUE(fs::is_directory(path));
        EXPECT_EQ(path.filename().string().rfind("formsave_test.", 0), 0u);
        touch(path / "file");
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(SaveDirectoryTest, KeepMakesItPermanent) {
    fs::path path;
    {
        auto dir = SaveDirectory::createTemp();
        ASSERT_TRUE(dir.hasValue());
        path = dir->path();
        touch(path / "file");
        dir->keep();
        dir->keep();
        EXPECT_FALSE(dir->isTemporary());
    }
    EXPECT_TRUE(fs::exists(path / "file"));
    fs::remove_all(path);
}

TEST_F(SaveDirectoryTest, PermanentIsNeverAutoRemoved) {
    fs::create_directories(test_dir_);
    {
        SaveDirectory dir = SaveDirectory::permanent(test_dir_);
        EXPECT_FALSE(dir.isTemporary());
    }
    EXPECT_TRUE(fs::is_directory(test_dir_));
}

TEST_F(SaveDirectoryTest, MoveTransfersOwnership) {
    fs::create_directories(test_dir_);
    SaveDirectory outer = SaveDirectory::permanent("unused");
    {
        SaveDirectory inner = SaveDirectory::temporary(test_dir_);
        outer = std::move(inner);
    }
    EXPECT_TRUE(fs::is_directory(test_dir_));
    EXPECT_TRUE(outer.isTemporary());

    fs::path released = std::move(outer).intoPath();
    EXPECT_EQ(released, test_dir_);
    EXPECT_TRUE(fs::is_directory(test_dir_));
}

TEST_F(SaveDirectoryTest, IntoPathReleasesTemporary) {
    fs::create_directories(test_dir_);
    touch(test_dir_ / "kept");

    fs::path released;
    {
        SaveDirectory dir = SaveDirectory::temporary(test_dir_);
        released = std::move(dir).intoPath();
    }
    EXPECT_EQ(released, test_dir_);
    EXPECT_TRUE(fs::exists(released / "kept"));
}

TEST_F(SaveDirectoryTest, RemoveDeletesRegardlessOfVariant) {
    fs::create_directories(test_dir_ / "nested");
    touch(test_dir_ / "nested" / "file");

    SaveDirectory dir = SaveDirectory::permanent(test_dir_);
    auto removed = dir.remove();
    ASSERT_TRUE(removed.hasValue());
    EXPECT_FALSE(fs::exists(test_dir_));
}

TEST_F(SaveDirectoryTest, RemoveMissingDirectoryPolicy) {
    SaveDirectory dir = SaveDirectory::permanent(test_dir_);

    auto strict = dir.remove();
    ASSERT_TRUE(strict.hasError());
    EXPECT_EQ(strict.error().code, ErrorCode::FileNotFound);

    auto lenient = dir.remove(MissingDirPolicy::Ignore);
    EXPECT_TRUE(lenient.hasValue());
}

TEST_F(SaveDirectoryTest, RemoveThenDestroyTemporaryIsQuiet) {
    auto dir = SaveDirectory::createTemp();
    ASSERT_TRUE(dir.hasValue());
    const fs::path path = dir->path();
    ASSERT_TRUE(dir->remove().hasValue());
    EXPECT_FALSE(dir->isTemporary());
    EXPECT_FALSE(fs::exists(path));
}

} // namespace core
} // namespace formsave
