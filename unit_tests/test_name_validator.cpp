#include "gtest/gtest.h"
#include "core/name_validator.h"
#include "utils/logger.h"
#include <string>
#include <vector>
#include <utility>

class NameValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init(LogLevel::NONE, "");
    }

    void expectRejected(const std::string& raw, ErrorKind expected) {
        ValidationResult result = NameValidator::validate(raw);
        EXPECT_FALSE(result.accepted) << "Имя должно быть отклонено: '" << raw << "'";
        EXPECT_EQ(result.error, expected) << "Имя: '" << raw << "', получено: " << errorKindToString(result.error);
        EXPECT_FALSE(result.filename.has_value());
        EXPECT_FALSE(result.message.empty());
    }
};

TEST_F(NameValidatorTest, AcceptsOrdinaryNames) {
    for (const std::string name : {"report.txt", "a", "data_2024-01.csv", ".bashrc", "archive.tar.gz", "README"}) {
        ValidationResult result = NameValidator::validate(name);
        ASSERT_TRUE(result.accepted) << "Имя должно быть принято: '" << name << "'. " << result.message;
        EXPECT_EQ(result.error, ErrorKind::NONE);
        ASSERT_TRUE(result.filename.has_value());
        EXPECT_EQ(result.filename->str(), name);
    }
}

TEST_F(NameValidatorTest, AcceptsNameOfMaximumLength) {
    std::string name(MAX_FILENAME_LENGTH, 'a');
    ValidationResult result = NameValidator::validate(name);
    ASSERT_TRUE(result.accepted);
    EXPECT_EQ(result.filename->str().size(), MAX_FILENAME_LENGTH);
}

TEST_F(NameValidatorTest, RejectsEmptyAndWhitespaceOnly) {
    expectRejected("", ErrorKind::EMPTY_NAME);
    expectRejected("   ", ErrorKind::EMPTY_NAME);
    expectRejected("\t\n", ErrorKind::EMPTY_NAME);
}

TEST_F(NameValidatorTest, RejectsTooLongNameBeforeCharacterChecks) {
    expectRejected(std::string(MAX_FILENAME_LENGTH + 1, 'a'), ErrorKind::NAME_TOO_LONG);
    // Длина проверяется раньше разделителей и недопустимых символов
    expectRejected(std::string(MAX_FILENAME_LENGTH + 1, '/'), ErrorKind::NAME_TOO_LONG);
    expectRejected(std::string(1000, '$'), ErrorKind::NAME_TOO_LONG);
}

TEST_F(NameValidatorTest, RejectsAbsolutePaths) {
    expectRejected("/etc/passwd", ErrorKind::ABSOLUTE_PATH);
    expectRejected("/", ErrorKind::ABSOLUTE_PATH);
    expectRejected("\\\\server\\share", ErrorKind::ABSOLUTE_PATH);
    expectRejected("~", ErrorKind::ABSOLUTE_PATH);
    expectRejected("~root", ErrorKind::ABSOLUTE_PATH);
    expectRejected("C:\\Windows", ErrorKind::ABSOLUTE_PATH);
    expectRejected("c:file.txt", ErrorKind::ABSOLUTE_PATH);
}

TEST_F(NameValidatorTest, RootMarkerIsCheckedBeforeSeparators) {
    expectRejected("/a/b", ErrorKind::ABSOLUTE_PATH);
    expectRejected("\\..\\x", ErrorKind::ABSOLUTE_PATH);
    expectRejected("~/../x", ErrorKind::ABSOLUTE_PATH);
    expectRejected("a/../b", ErrorKind::PATH_TRAVERSAL);
}

TEST_F(NameValidatorTest, RejectsTraversalAndSeparators) {
    expectRejected("../../etc/passwd", ErrorKind::PATH_TRAVERSAL);
    expectRejected("..", ErrorKind::PATH_TRAVERSAL);
    expectRejected(".", ErrorKind::PATH_TRAVERSAL);
    expectRejected("a/b", ErrorKind::PATH_TRAVERSAL);
    expectRejected("sub\\file.txt", ErrorKind::PATH_TRAVERSAL);
    expectRejected("file/", ErrorKind::PATH_TRAVERSAL);
    expectRejected("foo..bar", ErrorKind::PATH_TRAVERSAL);
    expectRejected("...", ErrorKind::PATH_TRAVERSAL);
}

TEST_F(NameValidatorTest, RejectsCharactersOutsideAllowList) {
    expectRejected("my file.txt", ErrorKind::INVALID_CHARACTER);
    expectRejected("name$", ErrorKind::INVALID_CHARACTER);
    expectRejected("ab:c", ErrorKind::INVALID_CHARACTER);
    expectRejected("rm;ls", ErrorKind::INVALID_CHARACTER);
    expectRejected("a*b?", ErrorKind::INVALID_CHARACTER);
    expectRejected("файл.txt", ErrorKind::INVALID_CHARACTER);
    expectRejected("a~b", ErrorKind::INVALID_CHARACTER);
    expectRejected("line\nbreak", ErrorKind::INVALID_CHARACTER);
}

TEST_F(NameValidatorTest, RejectsEmbeddedNul) {
    expectRejected(std::string("safe.txt\0/etc/passwd", 20), ErrorKind::PATH_TRAVERSAL);
    expectRejected(std::string("safe\0.txt", 9), ErrorKind::INVALID_CHARACTER);
    expectRejected(std::string(1, '\0'), ErrorKind::INVALID_CHARACTER);
}

TEST_F(NameValidatorTest, IsDeterministic) {
    ValidationResult first = NameValidator::validate("../secret");
    ValidationResult second = NameValidator::validate("../secret");
    EXPECT_EQ(first.accepted, second.accepted);
    EXPECT_EQ(first.error, second.error);
    EXPECT_EQ(first.message, second.message);
}

TEST_F(NameValidatorTest, IsAllowedCharacterMatchesAllowList) {
    EXPECT_TRUE(NameValidator::isAllowedCharacter('a'));
    EXPECT_TRUE(NameValidator::isAllowedCharacter('Z'));
    EXPECT_TRUE(NameValidator::isAllowedCharacter('7'));
    EXPECT_TRUE(NameValidator::isAllowedCharacter('.'));
    EXPECT_TRUE(NameValidator::isAllowedCharacter('_'));
    EXPECT_TRUE(NameValidator::isAllowedCharacter('-'));
    EXPECT_FALSE(NameValidator::isAllowedCharacter(' '));
    EXPECT_FALSE(NameValidator::isAllowedCharacter('/'));
    EXPECT_FALSE(NameValidator::isAllowedCharacter('\0'));
    EXPECT_FALSE(NameValidator::isAllowedCharacter('~'));
    EXPECT_FALSE(NameValidator::isAllowedCharacter(static_cast<char>(0xD0)));
}

TEST_F(NameValidatorTest, MessageNamesTheRejectionKind) {
    ValidationResult result = NameValidator::validate("../x");
    EXPECT_EQ(result.message.rfind(errorKindDescription(ErrorKind::PATH_TRAVERSAL), 0), 0U);
}
