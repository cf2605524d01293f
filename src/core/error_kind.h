/*!
 * \file error_kind.h
 * \brief Определяет таксономию ошибок (ErrorKind) для валидации имен, разрешения путей и файловых операций.
 */
#ifndef ERROR_KIND_H
#define ERROR_KIND_H

#include <string>

/*!
 * \enum ErrorKind
 * \brief Причина отказа в операции. Каждая ошибка терминальна для текущей операции.
 */
enum class ErrorKind {
    NONE = 0,          /*!< Ошибки нет (операция успешна). */
    EMPTY_NAME,        /*!< Имя пустое или состоит только из пробельных символов. */
    NAME_TOO_LONG,     /*!< Имя длиннее MAX_FILENAME_LENGTH. */
    INVALID_CHARACTER, /*!< Символ вне белого списка (управляющие символы, NUL, метасимволы оболочки). */
    PATH_TRAVERSAL,    /*!< Разделитель пути, "..", или разрешенный путь вне корневой директории. */
    ABSOLUTE_PATH,     /*!< Имя начинается с маркера корня ('/', '\\', '~', "C:"). */
    FILE_NOT_FOUND,    /*!< Исходный файл отсутствует. */
    ALREADY_EXISTS,    /*!< Резервная копия уже существует, а перезапись запрещена. */
    NOT_REGULAR_FILE,  /*!< Путь существует, но это не обычный файл (директория, устройство и т.п.). */
    IO_FAILURE         /*!< Ошибка ввода-вывода; подробности в сообщении. */
};

/*!
 * \brief Возвращает стабильный идентификатор ошибки ("PATH_TRAVERSAL", "IO_FAILURE", ...).
 * Используется в журнале аудита и в тестах.
 */
std::string errorKindToString(ErrorKind kind);

/*!
 * \brief Возвращает краткое человекочитаемое описание ошибки для пользователя.
 */
std::string errorKindDescription(ErrorKind kind);

#endif // ERROR_KIND_H
