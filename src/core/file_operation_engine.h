/*!
 * \file file_operation_engine.h
 * \brief Определяет FileOperationEngine - конечный автомат операций Backup, Delete и Restore.
 *
 * Каждая операция проходит линейную последовательность этапов
 * Validating -> Resolving -> Checking -> Transferring -> Reporting
 * и завершается успехом или отказом. Промежуточное состояние между вызовами не сохраняется,
 * повторных попыток нет. Ядро никогда не завершает процесс: любая ошибка возвращается
 * вызывающей стороне в OperationResult и записывается в журнал аудита.
 */
#ifndef FILE_OPERATION_ENGINE_H
#define FILE_OPERATION_ENGINE_H

#include "common_defs.h"
#include "error_kind.h"
#include "name_validator.h"
#include "path_resolver.h"
#include "operation_record.h"

#include <string>
#include <cstdint>

class AuditLog;

/*!
 * \struct EngineSettings
 * \brief Неизменяемая конфигурация ядра, создаваемая один раз при запуске.
 */
struct EngineSettings {
    StorageRoot working_root;            /*!< Директория рабочих файлов. */
    StorageRoot backup_root;             /*!< Директория резервных копий. */
    bool allow_backup_overwrite = false; /*!< Разрешить Backup перезаписывать существующую копию (по умолчанию - ALREADY_EXISTS). */
};

/*!
 * \enum OperationStage
 * \brief Этапы конечного автомата операции. В OperationResult хранится последний достигнутый этап.
 */
enum class OperationStage {
    VALIDATING,   /*!< Проверка имени (NameValidator). Файловая система не затрагивается. */
    RESOLVING,    /*!< Разрешение путей в корнях (PathResolver). */
    CHECKING,     /*!< Проверка существования и типа файлов. */
    TRANSFERRING, /*!< Копирование или удаление. */
    REPORTING     /*!< Формирование записи аудита (достигается только при успехе). */
};

/*! \brief Имя этапа для логов ("VALIDATING", ...). */
std::string operationStageToString(OperationStage stage);

/*!
 * \struct OperationResult
 * \brief Результат одной операции. Аналог ответа ядра для интерактивной оболочки.
 */
struct OperationResult {
    bool success = false;                              /*!< `true`, если операция выполнена. */
    ErrorKind error = ErrorKind::NONE;                 /*!< Причина отказа. */
    OperationStage stage = OperationStage::VALIDATING; /*!< Последний достигнутый этап. */
    std::string user_message{};                        /*!< Сообщение для пользователя. */
    std::string error_details{};                       /*!< Подробности ошибки для диагностического лога. */
    std::uintmax_t bytes_copied = 0;                   /*!< Количество скопированных байт (Backup/Restore). */
    OperationRecord record{};                          /*!< Запись, переданная в журнал аудита. */
};

/*!
 * \class FileOperationEngine
 * \brief Выполняет Backup, Delete и Restore над файлами внутри двух корневых директорий.
 *
 * Все операции принимают "сырое" имя от пользователя и сами прогоняют его через
 * NameValidator и PathResolver; обойти проверку невозможно, так как файловые функции
 * ядра работают только с ResolvedPath.
 */
class FileOperationEngine final {
public:
    /*!
     * \param settings Конфигурация корней и политики перезаписи. Копируется и далее не меняется.
     * \param audit_log Журнал аудита. Может быть `nullptr` (записи тогда только в OperationResult).
     */
    FileOperationEngine(EngineSettings settings, AuditLog* audit_log);

    FileOperationEngine(const FileOperationEngine&) = delete;
    FileOperationEngine& operator=(const FileOperationEngine&) = delete;

    /*!
     * \brief Копирует файл из рабочей директории в директорию резервных копий.
     * Ошибки: FILE_NOT_FOUND, NOT_REGULAR_FILE, ALREADY_EXISTS (если перезапись запрещена), IO_FAILURE,
     * а также все ошибки валидации и разрешения путей.
     */
    OperationResult backupFile(const std::string& raw_name);

    /*!
     * \brief Удаляет файл из рабочей директории. Необратимо.
     * Ошибки: FILE_NOT_FOUND, NOT_REGULAR_FILE, IO_FAILURE и ошибки валидации/разрешения.
     */
    OperationResult deleteFile(const std::string& raw_name);

    /*!
     * \brief Проверяет без изменений на диске и без записи в аудит, можно ли удалить файл:
     * имя допустимо, путь разрешен внутри рабочей директории, файл существует и является обычным.
     * \return ErrorKind::NONE, если deleteFile дойдет до удаления; иначе ошибка, которую она вернет.
     */
    ErrorKind checkDeletable(const std::string& raw_name) const;

    /*!
     * \brief Восстанавливает файл из резервной копии, перезаписывая рабочий файл.
     * Ошибки: FILE_NOT_FOUND (нет резервной копии), NOT_REGULAR_FILE, IO_FAILURE и ошибки валидации/разрешения.
     */
    OperationResult restoreFile(const std::string& raw_name);

    /*! \brief Выполняет операцию указанного типа. */
    OperationResult execute(OperationKind kind, const std::string& raw_name);

    const EngineSettings& settings() const noexcept { return settings_; }

private:
    const EngineSettings settings_;
    AuditLog* audit_log_;

    /*!
     * \brief Общая часть Backup и Restore: копирование `name` из `source_root` в `destination_root`.
     * \param overwrite_existing Разрешено ли заменять существующий файл назначения.
     */
    OperationResult copyBetweenRoots(OperationKind kind, const std::string& raw_name,
                                     const StorageRoot& source_root, const StorageRoot& destination_root,
                                     bool overwrite_existing);

    /*! \brief Заполняет запись аудита, пишет диагностику и передает запись в AuditLog. */
    OperationResult finish(OperationKind kind, const std::string& raw_name, OperationResult result);
};

#endif // FILE_OPERATION_ENGINE_H
