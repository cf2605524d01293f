/*!
 * \file audit_log.cpp
 * \brief Реализация журнала аудита.
 */
#include "audit_log.h"
#include "common_defs.h"
#include "file_utils.h"
#include "logger.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

AuditLog::AuditLog(const std::string& log_file_path) : path_(log_file_path) {
    if (path_.empty()) {
        Logger::info("[AuditLog] Путь к журналу аудита не задан. Журнал аудита отключен.");
        return;
    }
    stream_.open(path_, std::ios::app);
    if (!stream_.is_open()) {
        Logger::error("[AuditLog] Не удалось открыть журнал аудита '" + path_ + "' для дозаписи.");
        throw std::runtime_error("Не удалось открыть журнал аудита: " + path_);
    }
    enabled_ = true;
    Logger::info("[AuditLog] Журнал аудита: '" + path_ + "'");
}

std::string AuditLog::formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm timeinfo_tm{};
#ifdef _WIN32
    gmtime_s(&timeinfo_tm, &t);
#else
    gmtime_r(&t, &timeinfo_tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&timeinfo_tm, "%Y-%m-%d %H:%M:%S") << " UTC";
    return oss.str();
}

std::string AuditLog::formatRecord(const OperationRecord& record) {
    std::string line = operationKindToString(record.kind) + " '" +
                       FileUtils::escapeForDisplay(record.filename, AUDIT_FILENAME_DISPLAY_LIMIT) + "' " +
                       operationOutcomeToString(record.outcome);
    if (record.outcome == OperationOutcome::FAILURE) {
        line += " " + errorKindToString(record.error);
        if (!record.reason.empty()) {
            // Причина может содержать фрагменты пользовательского ввода
            line += ": " + FileUtils::escapeForDisplay(record.reason, 4 * AUDIT_FILENAME_DISPLAY_LIMIT);
        }
    }
    return line;
}

bool AuditLog::record(const OperationRecord& record) {
    if (!enabled_) {
        return true;
    }
    return appendLine("[" + formatTimestamp(record.timestamp) + "] " + formatRecord(record));
}

bool AuditLog::note(const std::string& text) {
    if (!enabled_) {
        return true;
    }
    return appendLine("[" + formatTimestamp(std::chrono::system_clock::now()) + "] " +
                      FileUtils::escapeForDisplay(text, 4 * AUDIT_FILENAME_DISPLAY_LIMIT));
}

bool AuditLog::appendLine(const std::string& line) {
    stream_ << line << '\n';
    stream_.flush();
    if (!stream_) {
        Logger::error("[AuditLog] Ошибка записи в журнал аудита '" + path_ + "'. Строка не сохранена: " + line);
        stream_.clear();
        return false;
    }
    return true;
}
