#include "gtest/gtest.h"
#include "logger.h"
#include "test_utils.h"
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include <sstream>      // Для std::ostringstream
#include <regex>        // Для проверки формата логов

// Проверка формата строки лога: [метка времени] [УРОВЕНЬ] [поток] [модуль] сообщение
bool check_log_format(const std::string& log_line, const std::string& level_tag,
                      const std::string& expected_message_part, const std::string& expected_module = "") {
    std::regex prefix_regex(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[([A-Z]+)\] \[[^\]]+\] )");
    std::smatch match;
    if (!std::regex_search(log_line, match, prefix_regex)) {
        return false;
    }
    if (match[1].str() != level_tag) {
        return false;
    }
    std::string rest = match.suffix().str();
    if (!expected_module.empty() && rest.rfind("[" + expected_module + "] ", 0) != 0) {
        return false;
    }
    return rest.find(expected_message_part) != std::string::npos;
}

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;
    std::string test_log_filename;
    std::streambuf* original_cout_buf = nullptr;
    std::streambuf* original_cerr_buf = nullptr;
    std::ostringstream cout_capture;
    std::ostringstream cerr_capture;

    void SetUp() override {
        temp_dir = make_unique_temp_dir("logger_test");
        test_log_filename = (temp_dir / "test_logger_output.log").string();

        original_cout_buf = std::cout.rdbuf();
        std::cout.rdbuf(cout_capture.rdbuf());
        original_cerr_buf = std::cerr.rdbuf();
        std::cerr.rdbuf(cerr_capture.rdbuf());

        // Тихий режим, чтобы SetUp/TearDown не засоряли захваченный вывод
        Logger::init(LogLevel::NONE, "");
        cout_capture.str(""); cout_capture.clear();
        cerr_capture.str(""); cerr_capture.clear();
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout_buf);
        std::cerr.rdbuf(original_cerr_buf);
        Logger::init(LogLevel::NONE, ""); // Закрывает файл лога перед удалением директории
        remove_temp_dir(temp_dir);
    }

    std::vector<std::string> takeLines(std::ostringstream& capture) {
        std::istringstream iss(capture.str());
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(iss, line)) if (!line.empty()) lines.push_back(line);
        capture.str(""); capture.clear();
        return lines;
    }
};

TEST_F(LoggerTest, LevelFromStringIsCaseInsensitive) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("Info"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelFromString("WARN"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::levelFromString("none"), LogLevel::NONE);
    EXPECT_FALSE(Logger::levelFromString("verbose").has_value());
    EXPECT_FALSE(Logger::levelFromString("").has_value());
}

TEST_F(LoggerTest, LevelToStringRoundTripsThroughLevelFromString) {
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::NONE}) {
        std::optional<LogLevel> parsed = Logger::levelFromString(Logger::levelToString(level));
        ASSERT_TRUE(parsed.has_value()) << "Не распознано: " << Logger::levelToString(level);
        EXPECT_EQ(*parsed, level);
    }
}

TEST_F(LoggerTest, SetLevelChangesLevelAndAnnouncesIt) {
    EXPECT_EQ(Logger::getLevel(), LogLevel::NONE);

    Logger::init(LogLevel::INFO);
    takeLines(cout_capture);

    Logger::setLevel(LogLevel::DEBUG);
    EXPECT_EQ(Logger::getLevel(), LogLevel::DEBUG);

    auto cout_lines = takeLines(cout_capture);
    ASSERT_FALSE(cout_lines.empty());
    EXPECT_TRUE(check_log_format(cout_lines.back(), "INFO", "Уровень логирования изменен с INFO на DEBUG", "Logger"))
        << "Строка: " << cout_lines.back();
}

TEST_F(LoggerTest, WarningsAndErrorsGoToStderrAndFile) {
    Logger::init(LogLevel::DEBUG, test_log_filename);
    auto init_lines = takeLines(cout_capture);
    ASSERT_FALSE(init_lines.empty());
    EXPECT_NE(init_lines[0].find("Логирование в файл: " + test_log_filename), std::string::npos);

    Logger::debug("Отладочное сообщение", "PathResolver");
    Logger::info("Информационное сообщение");
    Logger::warn("Имя файла отклонено", "NameValidator");
    Logger::error("Ошибка копирования");

    auto cout_lines = takeLines(cout_capture);
    auto cerr_lines = takeLines(cerr_capture);
    ASSERT_EQ(cout_lines.size(), 2U);
    ASSERT_EQ(cerr_lines.size(), 2U);
    EXPECT_TRUE(check_log_format(cout_lines[0], "DEBUG", "Отладочное сообщение", "PathResolver"));
    EXPECT_TRUE(check_log_format(cout_lines[1], "INFO", "Информационное сообщение"));
    EXPECT_TRUE(check_log_format(cerr_lines[0], "WARNING", "Имя файла отклонено", "NameValidator"));
    EXPECT_TRUE(check_log_format(cerr_lines[1], "ERROR", "Ошибка копирования"));

    auto file_lines = read_lines_from_file(test_log_filename);
    ASSERT_GE(file_lines.size(), 5U); // INITIALIZATION + 4 сообщения
    EXPECT_NE(file_lines[0].find("[INITIALIZATION]"), std::string::npos);
    EXPECT_TRUE(check_log_format(file_lines[3], "WARNING", "Имя файла отклонено", "NameValidator"));
    EXPECT_TRUE(check_log_format(file_lines[4], "ERROR", "Ошибка копирования"));
}

TEST_F(LoggerTest, MessagesBelowLevelAreFiltered) {
    Logger::init(LogLevel::WARN, test_log_filename);
    takeLines(cout_capture);

    Logger::debug("DEBUG не должно появиться");
    Logger::info("INFO не должно появиться");
    Logger::warn("WARN должно появиться");

    EXPECT_TRUE(takeLines(cout_capture).empty());
    auto cerr_lines = takeLines(cerr_capture);
    ASSERT_EQ(cerr_lines.size(), 1U);
    EXPECT_TRUE(check_log_format(cerr_lines[0], "WARNING", "WARN должно появиться"));

    std::string file_content = read_text_file(test_log_filename);
    EXPECT_EQ(file_content.find("не должно появиться"), std::string::npos);
}

TEST_F(LoggerTest, LevelNoneSuppressesEverything) {
    Logger::init(LogLevel::NONE, test_log_filename);
    Logger::error("Сообщение ERROR при уровне NONE");

    EXPECT_TRUE(takeLines(cout_capture).empty());
    EXPECT_TRUE(takeLines(cerr_capture).empty());
    EXPECT_EQ(read_text_file(test_log_filename).find("Сообщение ERROR при уровне NONE"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializationClosesPreviousFile) {
    Logger::init(LogLevel::INFO, test_log_filename);
    Logger::info("Первое сообщение в первый файл.");

    std::string second_log_filename = (temp_dir / "second.log").string();
    Logger::init(LogLevel::DEBUG, second_log_filename);
    Logger::debug("Сообщение во второй файл.");

    std::string first_content = read_text_file(test_log_filename);
    EXPECT_NE(first_content.find("Первое сообщение в первый файл."), std::string::npos);
    EXPECT_NE(first_content.find("Логгер переинициализируется"), std::string::npos);
    EXPECT_EQ(first_content.find("Сообщение во второй файл."), std::string::npos);

    std::string second_content = read_text_file(second_log_filename);
    EXPECT_NE(second_content.find("Сообщение во второй файл."), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileFallsBackToConsole) {
    std::string unwritable_path = (temp_dir / "no_such_dir" / "app.log").string();

    Logger::init(LogLevel::INFO, unwritable_path);
    auto cerr_lines = takeLines(cerr_capture);
    ASSERT_FALSE(cerr_lines.empty());
    EXPECT_NE(cerr_lines[0].find("Не удалось открыть файл лога: " + unwritable_path), std::string::npos);

    Logger::info("Тест после ошибки файла");
    auto cout_lines = takeLines(cout_capture);
    ASSERT_FALSE(cout_lines.empty());
    EXPECT_TRUE(check_log_format(cout_lines.back(), "INFO", "Тест после ошибки файла"));
    EXPECT_FALSE(std::filesystem::exists(unwritable_path));
}

TEST_F(LoggerTest, GetThreadIdStrIsNotEmpty) {
    EXPECT_FALSE(Logger::get_thread_id_str().empty());
}
