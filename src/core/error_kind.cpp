/*!
 * \file error_kind.cpp
 * \brief Реализация строковых представлений ErrorKind.
 */
#include "error_kind.h"

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "NONE";
        case ErrorKind::EMPTY_NAME:        return "EMPTY_NAME";
        case ErrorKind::NAME_TOO_LONG:     return "NAME_TOO_LONG";
        case ErrorKind::INVALID_CHARACTER: return "INVALID_CHARACTER";
        case ErrorKind::PATH_TRAVERSAL:    return "PATH_TRAVERSAL";
        case ErrorKind::ABSOLUTE_PATH:     return "ABSOLUTE_PATH";
        case ErrorKind::FILE_NOT_FOUND:    return "FILE_NOT_FOUND";
        case ErrorKind::ALREADY_EXISTS:    return "ALREADY_EXISTS";
        case ErrorKind::NOT_REGULAR_FILE:  return "NOT_REGULAR_FILE";
        case ErrorKind::IO_FAILURE:        return "IO_FAILURE";
    }
    return "UNKNOWN";
}

std::string errorKindDescription(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "Нет ошибки";
        case ErrorKind::EMPTY_NAME:        return "Имя файла не может быть пустым";
        case ErrorKind::NAME_TOO_LONG:     return "Имя файла слишком длинное";
        case ErrorKind::INVALID_CHARACTER: return "Имя файла содержит недопустимые символы";
        case ErrorKind::PATH_TRAVERSAL:    return "Обход директорий запрещен";
        case ErrorKind::ABSOLUTE_PATH:     return "Абсолютные пути запрещены";
        case ErrorKind::FILE_NOT_FOUND:    return "Файл не найден";
        case ErrorKind::ALREADY_EXISTS:    return "Резервная копия уже существует";
        case ErrorKind::NOT_REGULAR_FILE:  return "Путь не является обычным файлом";
        case ErrorKind::IO_FAILURE:        return "Ошибка ввода-вывода";
    }
    return "Неизвестная ошибка";
}
