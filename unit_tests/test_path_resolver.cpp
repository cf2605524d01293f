#include "gtest/gtest.h"
#include "core/path_resolver.h"
#include "core/name_validator.h"
#include "utils/logger.h"
#include "test_utils.h"
#include <filesystem>
#include <memory>
#include <string>

class PathResolverTest : public ::testing::Test {
protected:
    std::filesystem::path test_base_dir;
    std::unique_ptr<StorageRoot> root;

    void SetUp() override {
        Logger::init(LogLevel::NONE, "");
        test_base_dir = make_unique_temp_dir("path_resolver_test");
        root = std::make_unique<StorageRoot>(test_base_dir / "root", "тестовая");
    }

    void TearDown() override {
        root.reset();
        remove_temp_dir(test_base_dir);
    }

    static Filename name(const std::string& raw) {
        ValidationResult validation = NameValidator::validate(raw);
        if (!validation.accepted) {
            throw std::runtime_error("Тестовое имя не прошло проверку: " + raw);
        }
        return *validation.filename;
    }

    bool makeSymlink(const std::filesystem::path& target, const std::filesystem::path& link) {
        std::error_code ec;
        std::filesystem::create_symlink(target, link, ec);
        return !ec;
    }
};

TEST_F(PathResolverTest, StorageRootCreatesAndCanonicalizesDirectory) {
    EXPECT_TRUE(std::filesystem::is_directory(test_base_dir / "root"));
    EXPECT_EQ(root->path(), std::filesystem::canonical(test_base_dir / "root"));
    EXPECT_EQ(root->label(), "тестовая");
}

TEST_F(PathResolverTest, StorageRootThrowsWhenPathIsAFile) {
    write_text_file(test_base_dir / "file_root", "x");
    EXPECT_THROW(StorageRoot(test_base_dir / "file_root", "файл"), std::runtime_error);
}

TEST_F(PathResolverTest, ResolvesExistingFileInsideRoot) {
    write_text_file(root->path() / "report.txt", "hello");

    ResolutionResult result = PathResolver::resolve(name("report.txt"), *root);

    ASSERT_TRUE(result.accepted) << result.message;
    EXPECT_EQ(result.error, ErrorKind::NONE);
    EXPECT_EQ(result.path->path(), root->path() / "report.txt");
    EXPECT_EQ(result.path->name().str(), "report.txt");
}

TEST_F(PathResolverTest, ResolvesNonexistentDestinationInsideRoot) {
    ResolutionResult result = PathResolver::resolve(name("new_file.txt"), *root);

    ASSERT_TRUE(result.accepted) << result.message;
    EXPECT_EQ(result.path->path(), root->path() / "new_file.txt");
    EXPECT_FALSE(std::filesystem::exists(result.path->path())) << "Разрешение пути не должно создавать файлы";
}

TEST_F(PathResolverTest, RejectsSymlinkPointingOutsideRoot) {
    write_text_file(test_base_dir / "outside_secret.txt", "secret");
    if (!makeSymlink(test_base_dir / "outside_secret.txt", root->path() / "escape.txt")) {
        GTEST_SKIP() << "Символические ссылки не поддерживаются.";
    }

    ResolutionResult result = PathResolver::resolve(name("escape.txt"), *root);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.error, ErrorKind::PATH_TRAVERSAL);
    EXPECT_FALSE(result.path.has_value());
}

TEST_F(PathResolverTest, RejectsSymlinkToSiblingDirectoryWithSharedPrefix) {
    std::filesystem::create_directories(test_base_dir / "root_evil");
    write_text_file(test_base_dir / "root_evil" / "data.txt", "evil");
    if (!makeSymlink(test_base_dir / "root_evil" / "data.txt", root->path() / "data.txt")) {
        GTEST_SKIP() << "Символические ссылки не поддерживаются.";
    }

    ResolutionResult result = PathResolver::resolve(name("data.txt"), *root);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.error, ErrorKind::PATH_TRAVERSAL);
}

TEST_F(PathResolverTest, RejectsSymlinkToRootItself) {
    if (!makeSymlink(root->path(), root->path() / "self")) {
        GTEST_SKIP() << "Символические ссылки не поддерживаются.";
    }

    ResolutionResult result = PathResolver::resolve(name("self"), *root);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.error, ErrorKind::PATH_TRAVERSAL);
}

TEST_F(PathResolverTest, RejectsDanglingSymlink) {
    if (!makeSymlink(test_base_dir / "does_not_exist.txt", root->path() / "dangling.txt")) {
        GTEST_SKIP() << "Символические ссылки не поддерживаются.";
    }

    ResolutionResult result = PathResolver::resolve(name("dangling.txt"), *root);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.error, ErrorKind::PATH_TRAVERSAL);
}

TEST_F(PathResolverTest, RejectsSymlinkLoop) {
    if (!makeSymlink(root->path() / "loop_b", root->path() / "loop_a") ||
        !makeSymlink(root->path() / "loop_a", root->path() / "loop_b")) {
        GTEST_SKIP() << "Символические ссылки не поддерживаются.";
    }

    ResolutionResult result = PathResolver::resolve(name("loop_a"), *root);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.error, ErrorKind::PATH_TRAVERSAL);
}

TEST_F(PathResolverTest, FollowsSymlinkThatStaysInsideRoot) {
    write_text_file(root->path() / "target.txt", "inside");
    if (!makeSymlink(root->path() / "target.txt", root->path() / "alias.txt")) {
        GTEST_SKIP() << "Символические ссылки не поддерживаются.";
    }

    ResolutionResult result = PathResolver::resolve(name("alias.txt"), *root);

    ASSERT_TRUE(result.accepted) << result.message;
    EXPECT_EQ(result.path->path(), root->path() / "target.txt");
}

TEST_F(PathResolverTest, ReportsIoFailureWhenRootDisappears) {
    std::filesystem::remove_all(root->path());

    ResolutionResult result = PathResolver::resolve(name("report.txt"), *root);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.error, ErrorKind::IO_FAILURE);
}
