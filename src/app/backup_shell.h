/*!
 * \file backup_shell.h
 * \brief Определяет BackupShell - интерактивный цикл "команда -> имя файла -> результат"
 * поверх FileOperationEngine.
 *
 * Оболочка не принимает решений, связанных с безопасностью: она только читает строки,
 * выбирает операцию и передает "сырое" имя ядру. Потоки ввода/вывода внедряются
 * через конструктор, что позволяет тестировать цикл без консоли.
 */
#ifndef BACKUP_SHELL_H
#define BACKUP_SHELL_H

#include "common_defs.h"
#include "file_operation_engine.h"
#include "operation_record.h"

#include <iostream>
#include <string>
#include <optional>

class AuditLog;

/*!
 * \class BackupShell
 * \brief Интерактивная оболочка утилиты резервного копирования.
 *
 * Команды (без учета регистра):
 * - `backup [имя]`, `delete [имя]`, `restore [имя]` (или `1`, `2`, `3`); если имя не указано, оно запрашивается;
 * - `help` - список команд;
 * - `exit` / `quit` - завершение.
 * Ошибка отдельной операции не завершает цикл.
 */
class BackupShell final {
public:
    /*!
     * \param engine Ядро файловых операций.
     * \param audit_log Журнал аудита для отмененных операций и неизвестных команд (может быть `nullptr`).
     * \param in Поток ввода команд.
     * \param out Поток вывода приглашений и результатов.
     * \param confirm_delete Запрашивать ли подтверждение "yes/no" перед удалением.
     */
    BackupShell(FileOperationEngine& engine, AuditLog* audit_log,
                std::istream& in, std::ostream& out, bool confirm_delete);

    BackupShell(const BackupShell&) = delete;
    BackupShell& operator=(const BackupShell&) = delete;

    /*!
     * \brief Запускает цикл до команды exit/quit или конца ввода.
     * \return Количество операций, завершившихся неудачей (для итогового сообщения в main).
     */
    size_t run();

    /*!
     * \brief Обрабатывает одну строку команды.
     * \return `false`, если оболочка должна завершиться (exit/quit или конец ввода во время запроса).
     */
    bool processLine(const std::string& line);

    size_t operationsSucceeded() const noexcept { return succeeded_; }
    size_t operationsFailed() const noexcept { return failed_; }

private:
    FileOperationEngine& engine_;
    AuditLog* audit_log_;
    std::istream& in_;
    std::ostream& out_;
    bool confirm_delete_;
    size_t succeeded_ = 0;
    size_t failed_ = 0;

    /*! \brief Печатает приглашение и читает строку. `false` при конце ввода. Слишком длинные строки заменяются пустыми с предупреждением. */
    bool readLine(const std::string& prompt, std::string& line);

    /*! \brief Выполняет операцию и печатает результат. `false`, если ввод закончился во время подтверждения. */
    bool runOperation(OperationKind kind, const std::string& raw_name);

    /*! \brief Запрашивает подтверждение удаления. `std::nullopt` при конце ввода. */
    std::optional<bool> confirmDeletion(const std::string& raw_name);

    void recordCancellation(OperationKind kind, const std::string& raw_name);
    void printResult(const OperationResult& result);
    void printHelp();
};

#endif // BACKUP_SHELL_H
