/*!
 * \file audit_log.h
 * \brief Определяет класс AuditLog, дописывающий по одной строке на каждую операцию
 * резервного копирования, удаления или восстановления в файл журнала аудита.
 *
 * Формат строки:
 * `[ГГГГ-ММ-ДД ЧЧ:ММ:СС UTC] <ОПЕРАЦИЯ> '<имя>' <ИТОГ>[ <ОШИБКА>: <причина>]`
 * Имя файла экранируется (FileUtils::escapeForDisplay), поэтому пользовательский ввод
 * не может подделать дополнительные строки журнала.
 */
#ifndef AUDIT_LOG_H
#define AUDIT_LOG_H

#include "operation_record.h"

#include <string>
#include <fstream>
#include <chrono>

/*!
 * \class AuditLog
 * \brief Журнал аудита операций. Пустой путь отключает журнал.
 */
class AuditLog final {
public:
    /*!
     * \brief Открывает (или создает) файл журнала в режиме дозаписи.
     * \param log_file_path Путь к файлу. Если пуст, журнал отключен и record/note ничего не пишут.
     * \throw std::runtime_error если непустой путь не удалось открыть.
     */
    explicit AuditLog(const std::string& log_file_path);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    bool isEnabled() const noexcept { return enabled_; }
    const std::string& path() const noexcept { return path_; }

    /*!
     * \brief Дописывает строку для записи об операции.
     * \return `true`, если строка записана (или журнал отключен); `false` при ошибке записи.
     */
    bool record(const OperationRecord& record);

    /*!
     * \brief Дописывает произвольное событие (например, неизвестную команду).
     * Текст экранируется так же, как имена файлов.
     */
    bool note(const std::string& text);

    /*! \brief Форматирует запись без временной метки-префикса в квадратных скобках. */
    static std::string formatRecord(const OperationRecord& record);

    /*! \brief Временная метка в формате "ГГГГ-ММ-ДД ЧЧ:ММ:СС UTC". */
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

private:
    bool appendLine(const std::string& line);

    std::string path_;
    bool enabled_ = false;
    std::ofstream stream_;
};

#endif // AUDIT_LOG_H
