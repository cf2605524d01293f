// Предполагаемый путь: src/app/safe_backup_main.cpp
#include "common_defs.h"     // Общие заголовки и определения
#include "logger.h"          // Наш логгер
#include "app_config.h"      // Конфигурация приложения
#include "audit_log.h"       // Журнал аудита операций
#include "file_operation_engine.h"
#include "backup_shell.h"    // Интерактивная оболочка

#include <iostream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <memory>

int main(int argc, char* argv[]) {
    Logger::init(LogLevel::INFO, DEFAULT_APP_LOG_FILE);
    const std::string main_log_prefix = "[SafeBackupMain] ";

    Logger::info(main_log_prefix + "========== ЗАПУСК УТИЛИТЫ РЕЗЕРВНОГО КОПИРОВАНИЯ ==========");

    AppConfig app_config;

    // Файл конфигурации по умолчанию ищется только в текущей директории
    std::error_code ec;
    if (std::filesystem::is_regular_file(DEFAULT_CONFIG_FILE, ec)) {
        Logger::info(main_log_prefix + "Найден файл конфигурации по умолчанию: '" + DEFAULT_CONFIG_FILE + "'");
        if (!app_config.loadFromFile(DEFAULT_CONFIG_FILE)) {
            Logger::error(main_log_prefix + "Ошибки в файле конфигурации '" + DEFAULT_CONFIG_FILE + "'. Завершение приложения.");
            return 1;
        }
    } else {
        Logger::info(main_log_prefix + "Файл конфигурации '" + DEFAULT_CONFIG_FILE + "' в текущей директории не найден. Используются значения по умолчанию и аргументы командной строки.");
    }

    if (!app_config.parseCommandLineArgs(argc, argv)) {
        bool help_was_requested = false;
        for (int i = 1; i < argc; ++i) {
            if (std::string(argv[i]) == "-h" || std::string(argv[i]) == "--help") {
                help_was_requested = true;
                break;
            }
        }
        if (help_was_requested) {
            Logger::info(main_log_prefix + "Запрошена справка через командную строку. Завершение приложения.");
            return 0;
        }
        Logger::error(main_log_prefix + "Ошибка разбора аргументов командной строки. Завершение приложения.");
        return 1;
    }

    // Переинициализация логгера с финальными настройками
    Logger::init(app_config.log_level, app_config.log_file_path);
    Logger::info(main_log_prefix + "Логгер переинициализирован. Уровень: " + Logger::levelToString(Logger::getLevel()) +
                 ", Файл: '" + (app_config.log_file_path.empty() ? "Только консоль" : app_config.log_file_path) + "'");

    Logger::info(main_log_prefix + "Итоговая конфигурация:");
    Logger::info(main_log_prefix + "  Рабочая директория: '" + app_config.working_dir + "'");
    Logger::info(main_log_prefix + "  Директория резервных копий: '" + app_config.backup_dir + "'");
    Logger::info(main_log_prefix + "  Перезапись резервных копий: " + (app_config.allow_backup_overwrite ? "да" : "нет"));
    Logger::info(main_log_prefix + "  Подтверждение удаления: " + (app_config.confirm_delete ? "да" : "нет"));
    Logger::info(main_log_prefix + "  Журнал аудита: '" + (app_config.audit_log_path.empty() ? "отключен" : app_config.audit_log_path) + "'");

    std::unique_ptr<AuditLog> audit_log;
    std::unique_ptr<FileOperationEngine> engine;
    try {
        EngineSettings settings = app_config.makeEngineSettings();
        audit_log = std::make_unique<AuditLog>(app_config.audit_log_path);
        engine = std::make_unique<FileOperationEngine>(std::move(settings), audit_log.get());
    } catch (const std::exception& e) {
        Logger::error(main_log_prefix + "КРИТИЧЕСКАЯ ОШИБКА при запуске: " + e.what());
        std::cerr << "ОШИБКА: " << e.what() << std::endl;
        Logger::info(main_log_prefix + "========== ЗАВЕРШЕНИЕ РАБОТЫ (Ошибка Запуска) ==========");
        return 1;
    }

    BackupShell shell(*engine, audit_log.get(), std::cin, std::cout, app_config.confirm_delete);
    size_t failed_operations = shell.run();

    Logger::info(main_log_prefix + "Неудачных операций за сеанс: " + std::to_string(failed_operations) + ".");
    Logger::info(main_log_prefix + "========== УТИЛИТА РЕЗЕРВНОГО КОПИРОВАНИЯ ЗАВЕРШИЛА РАБОТУ ==========");
    return 0;
}
