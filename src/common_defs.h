/*!
 * \file common_defs.h
 * \brief Содержит общие определения, константы и стандартные заголовочные файлы, используемые в проекте "Безопасное Резервное Копирование".
 *
 * Этот файл централизует подключение часто используемых стандартных библиотек C++
 * и определяет глобальные константы проекта: ограничения на имена файлов,
 * имена директорий и файлов логов по умолчанию, размер буфера копирования.
 */
#ifndef COMMON_DEFS_H
#define COMMON_DEFS_H

// Стандартные библиотеки C++
#include <string>       // Для использования std::string
#include <vector>       // Для использования std::vector
#include <iostream>     // Для стандартных потоков ввода/вывода
#include <fstream>      // Для файловых потоков
#include <sstream>      // Для строковых потоков
#include <algorithm>    // Для стандартных алгоритмов
#include <stdexcept>    // Для стандартных исключений
#include <iomanip>      // Для манипуляторов потока
#include <chrono>       // Для работы со временем (временные метки записей аудита)
#include <cctype>       // Для функций классификации символов (std::isalnum, std::isspace)
#include <cstring>      // Для функций работы с C-строками
#include <mutex>        // Для std::mutex, std::lock_guard (логгер)
#include <filesystem>   // Для std::filesystem (C++17) (file_utils, path_resolver, file_operation_engine)
#include <cstdint>      // Для std::uintmax_t и других целочисленных типов
#include <optional>     // Для std::optional (результаты валидации и разрешения путей)

// Максимальная длина имени файла в байтах (ограниченный буфер, как NAME_MAX в большинстве ФС)
constexpr size_t MAX_FILENAME_LENGTH = 255; /*!< Максимальная длина имени файла, принимаемого NameValidator. */

// Максимальная длина строки, которую интерактивная оболочка вообще согласна обрабатывать
constexpr size_t MAX_INPUT_LINE_LENGTH = 4096; /*!< Строки длиннее отбрасываются оболочкой целиком. */

// Символы пунктуации, разрешенные в имени файла помимо латинских букв и цифр ASCII
const std::string ALLOWED_FILENAME_PUNCTUATION = "._-"; /*!< Явный белый список пунктуации для имен файлов. */

// Префикс временного файла, в который выполняется копирование перед атомарным переименованием.
// Содержит '~', который не входит в белый список, поэтому не может совпасть с именем пользователя.
// Имя временного файла имеет фиксированную короткую длину и не зависит от длины имени назначения.
const std::string TEMP_COPY_PREFIX = ".~sb"; /*!< Префикс имени временного файла копирования. */

// Размер буфера при побайтовом копировании файлов
constexpr size_t COPY_BUFFER_SIZE = 64 * 1024; /*!< Размер блока чтения/записи при копировании (64KB). */

// Имена директорий по умолчанию (относительно текущей рабочей директории)
const std::string DEFAULT_WORKING_DIR = "working_files"; /*!< Директория рабочих файлов по умолчанию. */
const std::string DEFAULT_BACKUP_DIR = "backup_files";   /*!< Директория резервных копий по умолчанию. */

// Имена файлов по умолчанию
const std::string DEFAULT_AUDIT_LOG_FILE = "logfile.txt";     /*!< Журнал аудита операций по умолчанию. */
const std::string DEFAULT_APP_LOG_FILE = "safe_backup.log";   /*!< Диагностический лог приложения по умолчанию. */
const std::string DEFAULT_CONFIG_FILE = "safe_backup.conf";   /*!< Имя файла конфигурации, который ищется в CWD при запуске. */

// Максимальная длина имени файла в строке журнала аудита (после экранирования)
constexpr size_t AUDIT_FILENAME_DISPLAY_LIMIT = 64; /*!< Длинные имена обрезаются в журнале аудита. */

#endif // COMMON_DEFS_H
