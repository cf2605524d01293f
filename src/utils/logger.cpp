/*!
 * \file logger.cpp
 * \brief Реализация статического класса Logger.
 */
#include "logger.h"

#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <thread>
#include <algorithm>
#include <cctype>

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::log_mutex_;
std::ofstream Logger::log_file_stream_;
bool Logger::use_file_ = false;
bool Logger::initialized_ = false;


void Logger::init(LogLevel initial_level, const std::string& log_file_path) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    // Переинициализация: закрываем предыдущий файл, чтобы не держать два дескриптора
    if (log_file_stream_.is_open()) {
        log_file_stream_ << "[" << get_timestamp() << "] [REINITIALIZATION] ["
                         << get_thread_id_str() << "] "
                         << "Логгер переинициализируется. Закрытие этого файла лога." << std::endl;
        log_file_stream_.close();
    }
    use_file_ = false;
    current_level_ = initial_level;

    std::string init_msg;
    if (!log_file_path.empty()) {
        log_file_stream_.clear();
        log_file_stream_.open(log_file_path, std::ios::app);
        if (log_file_stream_.is_open()) {
            use_file_ = true;
            init_msg = "Логирование в файл: " + log_file_path + ". Уровень: " + levelToString(current_level_);
            log_file_stream_ << "[" << get_timestamp() << "] [INITIALIZATION] [" << get_thread_id_str() << "] " << init_msg << std::endl;
        } else {
            std::cerr << "[" << get_timestamp() << "] [INITIALIZATION] [ОШИБКА] ["
                      << get_thread_id_str() << "] "
                      << "Не удалось открыть файл лога: " << log_file_path
                      << ". Логирование только в консоль. Уровень: " << levelToString(current_level_) << std::endl;
        }
    } else {
        init_msg = "Логирование только в консоль. Уровень: " + levelToString(current_level_);
    }
    // Сообщение об инициализации не печатается в консоль при уровне NONE (тихий режим для тестов)
    if (!init_msg.empty() && current_level_ != LogLevel::NONE) {
        std::cout << "[" << get_timestamp() << "] [INITIALIZATION] [" << get_thread_id_str() << "] " << init_msg << std::endl;
    }
    initialized_ = true;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    LogLevel old_level = current_level_;
    current_level_ = level;
    if (initialized_ && level != LogLevel::NONE) {
        log_internal(LogLevel::INFO, "INFO", "Logger",
                     "Уровень логирования изменен с " + levelToString(old_level) + " на " + levelToString(level));
    }
}

LogLevel Logger::getLevel() noexcept {
    return current_level_;
}

std::optional<LogLevel> Logger::levelFromString(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "NONE") return LogLevel::NONE;
    return std::nullopt;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE:  return "NONE";
    }
    return "UNKNOWN";
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t_now = std::chrono::system_clock::to_time_t(now);

    std::tm timeinfo_tm{};
#ifdef _WIN32
    localtime_s(&timeinfo_tm, &t_now);
#else
    localtime_r(&t_now, &timeinfo_tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&timeinfo_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

std::string Logger::get_thread_id_str() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

void Logger::log_internal(LogLevel level, const std::string& level_str, const std::string& module, const std::string& message) {
    if (!initialized_) {
        // До init() выводятся только ошибки, и только в stderr
        if (level >= LogLevel::ERROR) {
            std::cerr << "[INITIALIZATION-WARNING] [" << get_timestamp() << "] [" << level_str << "] "
                      << (!module.empty() ? "[" + module + "] " : "")
                      << message << std::endl;
        }
        return;
    }
    if (current_level_ == LogLevel::NONE || level < current_level_) {
        return;
    }

    std::string formatted_message = "[" + get_timestamp() + "] [" + level_str + "] " +
                                    "[" + get_thread_id_str() + "] " +
                                    (!module.empty() ? "[" + module + "] " : "") +
                                    message;

    if (use_file_ && log_file_stream_.is_open()) {
        log_file_stream_ << formatted_message << std::endl;
    }

    if (level == LogLevel::ERROR || level == LogLevel::WARN) {
        std::cerr << formatted_message << std::endl;
    } else {
        std::cout << formatted_message << std::endl;
    }
}

void Logger::debug(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::DEBUG, "DEBUG", module, message);
}

void Logger::info(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::INFO, "INFO", module, message);
}

void Logger::warn(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::WARN, "WARNING", module, message);
}

void Logger::error(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::ERROR, "ERROR", module, message);
}
