/*!
 * \file app_config.cpp
 * \brief Реализация AppConfig: загрузка файла конфигурации и разбор аргументов командной строки.
 */
#include "app_config.h"
#include "file_utils.h"
#include "logger.h"

#include <fstream>
#include <algorithm>
#include <iostream>
#include <filesystem>
#include <optional>

// Вспомогательная функция для удаления начальных и конечных пробельных символов
static std::string trimStringAC(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, (end - start + 1));
}

// Вспомогательная функция для преобразования строки в верхний регистр
static std::string toUpperAC(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

// TRUE/YES/ON/1 и FALSE/NO/OFF/0
static std::optional<bool> parseBoolAC(const std::string& value) {
    std::string upper = toUpperAC(value);
    if (upper == "TRUE" || upper == "YES" || upper == "ON" || upper == "1") return true;
    if (upper == "FALSE" || upper == "NO" || upper == "OFF" || upper == "0") return false;
    return std::nullopt;
}

bool AppConfig::loadFromFile(const std::string& config_filename) {
    const std::string cfg_log_prefix = "[Конфигурация Загрузка Файла] ";
    Logger::info(cfg_log_prefix + "Попытка загрузки конфигурации из файла: '" + config_filename + "'");
    std::ifstream configFile(config_filename);
    if (!configFile.is_open()) {
        Logger::info(cfg_log_prefix + "Файл конфигурации '" + config_filename + "' не найден или не удалось открыть. Будут использованы текущие значения.");
        return true;
    }

    std::string line_content;
    int line_num = 0;
    while (std::getline(configFile, line_content)) {
        line_num++;

        size_t comment_pos_inline = line_content.find('#');
        if (comment_pos_inline != std::string::npos) {
            line_content = line_content.substr(0, comment_pos_inline);
        }
        std::string trimmed_line = trimStringAC(line_content);
        if (trimmed_line.empty()) {
            continue;
        }

        size_t equal_pos = trimmed_line.find('=');
        if (equal_pos == std::string::npos) {
            Logger::warn(cfg_log_prefix + "Пропущена некорректная строка " + std::to_string(line_num) + " в файле '" + config_filename + "' (не в формате ключ=значение): \"" + trimmed_line + "\"");
            continue;
        }

        std::string key = trimStringAC(trimmed_line.substr(0, equal_pos));
        std::string value = trimStringAC(trimmed_line.substr(equal_pos + 1));
        if (key.empty()) {
            Logger::warn(cfg_log_prefix + "Пропущена строка " + std::to_string(line_num) + " в файле '" + config_filename + "' (пустой ключ).");
            continue;
        }
        std::string key_upper = toUpperAC(key);
        const std::string where = " в файле '" + config_filename + "' (строка " + std::to_string(line_num) + ").";

        if (key_upper == "WORKING_DIR" || key_upper == "BACKUP_DIR") {
            if (value.empty()) {
                Logger::error(cfg_log_prefix + "Ошибка парсинга: пустое значение для обязательного ключа '" + key_upper + "'" + where);
                return false;
            }
            (key_upper == "WORKING_DIR" ? working_dir : backup_dir) = value;
        } else if (key_upper == "ALLOW_OVERWRITE" || key_upper == "CONFIRM_DELETE") {
            std::optional<bool> flag = parseBoolAC(value);
            if (!flag) {
                Logger::error(cfg_log_prefix + "Некорректное логическое значение '" + value + "' для ключа '" + key_upper + "'" + where);
                return false;
            }
            (key_upper == "ALLOW_OVERWRITE" ? allow_backup_overwrite : confirm_delete) = *flag;
        } else if (key_upper == "AUDIT_LOG_FILE") {
            // Пустое значение отключает журнал аудита
            audit_log_path = value;
        } else if (key_upper == "LOG_LEVEL") {
            std::optional<LogLevel> level = Logger::levelFromString(value);
            if (!level) {
                Logger::error(cfg_log_prefix + "Неизвестное значение '" + value + "' для LOG_LEVEL" + where);
                return false;
            }
            log_level = *level;
        } else if (key_upper == "LOG_FILE_PATH") {
            log_file_path = value;
        } else {
            Logger::warn(cfg_log_prefix + "Неизвестный ключ '" + key + "'" + where + " Ключ проигнорирован.");
        }
    }
    Logger::info(cfg_log_prefix + "Конфигурация из файла '" + config_filename + "' успешно обработана.");
    return true;
}

void AppConfig::printHelp(const char* app_name_char) {
    std::string app_name = (app_name_char && app_name_char[0] != '\0') ? app_name_char : "safe_backup";
    const AppConfig defaults;
    std::cout << "\nИспользование: " << app_name << " [опции]\n";
    std::cout << "Опции:\n";
    std::cout << "  -c, --config <файл>         Файл конфигурации (формат КЛЮЧ = значение).\n"
              << "                                Опции командной строки имеют приоритет над файлом.\n";
    std::cout << "  -w, --working-dir <дир>     Директория рабочих файлов. По умолчанию: '" << defaults.working_dir << "'.\n";
    std::cout << "  -b, --backup-dir <дир>      Директория резервных копий. По умолчанию: '" << defaults.backup_dir << "'.\n";
    std::cout << "  --allow-overwrite           Разрешить перезапись существующих резервных копий.\n"
              << "                                По умолчанию повторное резервное копирование отклоняется.\n";
    std::cout << "  --no-confirm                Не запрашивать подтверждение перед удалением.\n";
    std::cout << "  -a, --audit-log <файл>      Журнал аудита операций. По умолчанию: '" << defaults.audit_log_path << "'.\n"
              << "                                Пустое значение отключает журнал.\n";
    std::cout << "  -l, --log-level <УРОВЕНЬ>   Уровень логирования (DEBUG, INFO, WARN, ERROR, NONE). По умолчанию: INFO.\n";
    std::cout << "  --log-file <файл>           Диагностический лог. По умолчанию: '" << defaults.log_file_path << "'.\n"
              << "                                Пустое значение - только консоль.\n";
    std::cout << "  -h, --help                  Показать это справочное сообщение и выйти.\n\n";
}

bool AppConfig::parseCommandLineArgs(int argc, char* argv[]) {
    const std::string cla_log_prefix = "[Конфигурация Аргументы] ";
    const char* app_name = (argc > 0) ? argv[0] : nullptr;

    // Первый проход: файл конфигурации, чтобы остальные опции его переопределяли
    for (int i = 1; i < argc; ++i) {
        std::string arg_str = argv[i];
        if (arg_str == "-c" || arg_str == "--config") {
            if (i + 1 >= argc) {
                Logger::error(cla_log_prefix + "Опция '" + arg_str + "' требует аргумент (путь к файлу).");
                printHelp(app_name);
                return false;
            }
            std::string config_file_from_args = argv[i + 1];
            if (!std::filesystem::exists(config_file_from_args)) {
                Logger::warn(cla_log_prefix + "Указанный файл конфигурации '" + config_file_from_args + "' не найден. Загрузка не будет выполнена.");
            } else if (!loadFromFile(config_file_from_args)) {
                Logger::error(cla_log_prefix + "Ошибка загрузки файла конфигурации '" + config_file_from_args + "', указанного в командной строке.");
                printHelp(app_name);
                return false;
            }
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](const std::string& what) -> bool {
            if (i + 1 < argc) {
                return true;
            }
            Logger::error(cla_log_prefix + "Опция '" + arg + "' требует аргумент (" + what + ").");
            printHelp(app_name);
            return false;
        };

        if (arg == "-c" || arg == "--config") {
            if (!requireValue("путь к файлу")) return false;
            ++i;
        } else if (arg == "-w" || arg == "--working-dir") {
            if (!requireValue("путь к директории")) return false;
            working_dir = argv[++i];
        } else if (arg == "-b" || arg == "--backup-dir") {
            if (!requireValue("путь к директории")) return false;
            backup_dir = argv[++i];
        } else if (arg == "--allow-overwrite") {
            allow_backup_overwrite = true;
        } else if (arg == "--no-confirm") {
            confirm_delete = false;
        } else if (arg == "-a" || arg == "--audit-log") {
            if (!requireValue("путь к файлу")) return false;
            audit_log_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (!requireValue("уровень логирования")) return false;
            std::string level_str_arg = argv[++i];
            std::optional<LogLevel> level = Logger::levelFromString(level_str_arg);
            if (!level) {
                Logger::error(cla_log_prefix + "Неизвестный уровень логирования '" + level_str_arg + "'.");
                printHelp(app_name);
                return false;
            }
            log_level = *level;
        } else if (arg == "--log-file") {
            if (!requireValue("путь к файлу")) return false;
            log_file_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printHelp(app_name);
            return false;
        } else {
            Logger::error(cla_log_prefix + "Неизвестный аргумент командной строки: " + arg);
            printHelp(app_name);
            return false;
        }
    }

    if (working_dir.empty() || backup_dir.empty()) {
        Logger::error(cla_log_prefix + "Пути к рабочей директории и директории резервных копий не могут быть пустыми.");
        return false;
    }
    return true;
}

EngineSettings AppConfig::makeEngineSettings() const {
    StorageRoot working_root(working_dir, "рабочая");
    StorageRoot backup_root(backup_dir, "резервная");

    if (working_root.path() == backup_root.path() ||
        FileUtils::isStrictlyWithinRoot(working_root.path(), backup_root.path()) ||
        FileUtils::isStrictlyWithinRoot(backup_root.path(), working_root.path())) {
        Logger::error("[Конфигурация] Рабочая директория '" + working_root.path().string() +
                      "' и директория резервных копий '" + backup_root.path().string() + "' совпадают или вложены друг в друга.");
        throw std::runtime_error("Рабочая директория и директория резервных копий должны быть независимыми.");
    }

    return EngineSettings{std::move(working_root), std::move(backup_root), allow_backup_overwrite};
}
