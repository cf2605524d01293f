/*!
 * \file app_config.h
 * \brief Определяет структуру AppConfig - параметры запуска утилиты резервного копирования
 * (корневые директории, политика перезаписи, журналы, уровень логирования).
 *
 * Значения загружаются из файла конфигурации формата `КЛЮЧ = значение` и переопределяются
 * аргументами командной строки. После разбора из AppConfig один раз строится неизменяемый
 * EngineSettings, который передается ядру.
 */
#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include "common_defs.h"
#include "logger.h"
#include "file_operation_engine.h"

#include <string>

/*!
 * \struct AppConfig
 * \brief Конфигурация приложения.
 */
struct AppConfig {
    std::string working_dir = DEFAULT_WORKING_DIR;      /*!< Директория рабочих файлов. */
    std::string backup_dir = DEFAULT_BACKUP_DIR;        /*!< Директория резервных копий. */
    bool allow_backup_overwrite = false;                /*!< Разрешить перезапись существующих резервных копий. */
    bool confirm_delete = true;                         /*!< Запрашивать подтверждение "yes/no" перед удалением. */
    std::string audit_log_path = DEFAULT_AUDIT_LOG_FILE; /*!< Файл журнала аудита (пусто - отключен). */
    LogLevel log_level = LogLevel::INFO;                /*!< Уровень диагностического лога. */
    std::string log_file_path = DEFAULT_APP_LOG_FILE;   /*!< Файл диагностического лога (пусто - только консоль). */

    /*!
     * \brief Загружает параметры из файла конфигурации.
     * Формат: `КЛЮЧ = значение`, комментарии начинаются с '#', регистр ключей не важен.
     * Ключи: WORKING_DIR, BACKUP_DIR, ALLOW_OVERWRITE, CONFIRM_DELETE, AUDIT_LOG_FILE, LOG_LEVEL, LOG_FILE_PATH.
     * \param config_filename Путь к файлу.
     * \return `true`, если файл обработан или отсутствует; `false` при ошибке значения
     * (пустое значение обязательного ключа, некорректное логическое значение или уровень лога).
     */
    bool loadFromFile(const std::string& config_filename);

    /*!
     * \brief Разбирает аргументы командной строки. Файл из `-c/--config` загружается первым,
     * остальные опции переопределяют его значения.
     * \return `true` при успехе; `false` при ошибке или запросе справки (`-h/--help`).
     */
    bool parseCommandLineArgs(int argc, char* argv[]);

    /*! \brief Выводит справку по аргументам командной строки в `std::cout`. */
    static void printHelp(const char* app_name);

    /*!
     * \brief Строит неизменяемые настройки ядра: создает и канонизирует обе корневые директории.
     * \throw std::runtime_error если директории совпадают, вложены друг в друга или не могут быть созданы.
     */
    EngineSettings makeEngineSettings() const;
};

#endif // APP_CONFIG_H
