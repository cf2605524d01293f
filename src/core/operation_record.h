/*!
 * \file operation_record.h
 * \brief Определяет OperationRecord - запись об одной выполненной (или отклоненной) операции,
 * которую FileOperationEngine формирует, а AuditLog сохраняет.
 */
#ifndef OPERATION_RECORD_H
#define OPERATION_RECORD_H

#include "error_kind.h"

#include <string>
#include <chrono>
#include <optional>

/*!
 * \enum OperationKind
 * \brief Тип файловой операции.
 */
enum class OperationKind {
    BACKUP,  /*!< Копирование из рабочей директории в директорию резервных копий. */
    DELETE,  /*!< Удаление файла из рабочей директории. */
    RESTORE  /*!< Копирование резервной копии обратно в рабочую директорию. */
};

/*!
 * \enum OperationOutcome
 * \brief Итог операции.
 */
enum class OperationOutcome {
    SUCCESS,   /*!< Операция выполнена. */
    FAILURE,   /*!< Операция отклонена или завершилась ошибкой; см. error и reason. */
    CANCELLED  /*!< Пользователь отказался подтверждать операцию (удаление). */
};

/*! \brief "BACKUP", "DELETE" или "RESTORE". */
std::string operationKindToString(OperationKind kind);

/*!
 * \brief Разбирает имя операции без учета регистра ("backup", "Delete", ...).
 * \return Тип операции или `std::nullopt` для неизвестной команды.
 */
std::optional<OperationKind> operationKindFromString(const std::string& str);

/*! \brief "SUCCESS", "FAILURE" или "CANCELLED". */
std::string operationOutcomeToString(OperationOutcome outcome);

/*!
 * \struct OperationRecord
 * \brief Неизменяемые сведения об одной операции для журнала аудита.
 */
struct OperationRecord {
    OperationKind kind = OperationKind::BACKUP;                   /*!< Тип операции. */
    std::string filename{};                                       /*!< Имя в том виде, в каком его ввел пользователь (может быть некорректным). */
    OperationOutcome outcome = OperationOutcome::FAILURE;         /*!< Итог. */
    ErrorKind error = ErrorKind::NONE;                            /*!< Причина неудачи (NONE при SUCCESS/CANCELLED). */
    std::string reason{};                                         /*!< Пояснение причины неудачи. */
    std::chrono::system_clock::time_point timestamp{};            /*!< Время завершения операции. */
};

#endif // OPERATION_RECORD_H
