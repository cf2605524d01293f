/*!
 * \file logger.h
 * \brief Определяет статический класс Logger для диагностического логирования в утилите резервного копирования.
 *
 * Logger предоставляет простой интерфейс для вывода отладочной информации, сообщений о ходе выполнения,
 * предупреждений и ошибок. Поддерживает несколько уровней логирования, вывод в консоль (stdout/stderr)
 * и, опционально, в файл. Формат лога включает временную метку, уровень, ID потока и модуль.
 * Диагностический лог не является журналом аудита операций (см. AuditLog).
 */
#ifndef LOGGER_H
#define LOGGER_H

#include "common_defs.h"

#include <string>
#include <fstream>
#include <sstream>
#include <mutex>
#include <optional>

/*!
 * \enum LogLevel
 * \brief Определяет уровни важности для логируемых сообщений.
 */
enum class LogLevel {
    DEBUG = 0, /*!< Детальная отладочная информация (пути до и после канонизации и т.п.). */
    INFO  = 1, /*!< Информационные сообщения о выполненных операциях. */
    WARN  = 2, /*!< Отклоненные имена файлов, отмененные операции. */
    ERROR = 3, /*!< Ошибки ввода-вывода и нарушения песочницы. */
    NONE  = 4  /*!< Полное отключение логирования. */
};

/*!
 * \class Logger
 * \brief Статический класс для логирования сообщений.
 *
 * Предоставляет методы `init`, `setLevel`, `debug`, `info`, `warn`, `error`.
 * Не предназначен для создания экземпляров.
 */
class Logger {
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /*!
     * \brief Инициализирует логгер с указанным уровнем и, опционально, файлом для вывода.
     * Повторный вызов закрывает предыдущий файл лога и открывает новый.
     * \param initial_level Начальный уровень логирования.
     * \param log_file_path Путь к файлу лога. Если пустой, вывод только в консоль.
     */
    static void init(LogLevel initial_level = LogLevel::INFO, const std::string& log_file_path = "");

    /*!
     * \brief Устанавливает текущий уровень логирования.
     * \param level Новый уровень логирования.
     */
    static void setLevel(LogLevel level);

    /*! \brief Возвращает текущий уровень логирования. */
    static LogLevel getLevel() noexcept;

    static void debug(const std::string& message, const std::string& module = "");
    static void info(const std::string& message, const std::string& module = "");
    static void warn(const std::string& message, const std::string& module = "");
    static void error(const std::string& message, const std::string& module = "");

    /*!
     * \brief Преобразует строку конфигурации ("debug", "INFO", "Warn", ...) в уровень логирования.
     * Регистр не учитывается. "WARNING" принимается как синоним "WARN".
     * \param level_str Строка из файла конфигурации или аргумента командной строки.
     * \return Уровень или `std::nullopt`, если строка не распознана.
     */
    static std::optional<LogLevel> levelFromString(const std::string& level_str);

    /*! \brief Возвращает каноническое имя уровня ("DEBUG", "INFO", "WARN", "ERROR", "NONE"). */
    static std::string levelToString(LogLevel level);

    /*! \brief Строковое представление идентификатора текущего потока. */
    static std::string get_thread_id_str();

private:
    Logger() = default;

    static LogLevel current_level_;             /*!< Текущий уровень логирования. */
    static std::mutex log_mutex_;               /*!< Мьютекс для синхронизации доступа к потокам вывода. */
    static std::ofstream log_file_stream_;      /*!< Поток для вывода логов в файл. */
    static bool use_file_;                      /*!< Используется ли вывод в файл. */
    static bool initialized_;                   /*!< Был ли логгер инициализирован. */

    /*!
     * \brief Формирует и выводит строку лога. Вызывается под мьютексом.
     */
    static void log_internal(LogLevel level, const std::string& level_str, const std::string& module, const std::string& message);

    /*!
     * \brief Временная метка в формате "ГГГГ-ММ-ДД ЧЧ:ММ:СС.мс" (локальное время).
     */
    static std::string get_timestamp();
};

#endif // LOGGER_H
